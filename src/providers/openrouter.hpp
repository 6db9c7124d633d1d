#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace chatrelay {

// OpenAI-compatible chat completions over OpenRouter, streamed as SSE.
class OpenRouterProvider : public Provider {
public:
    OpenRouterProvider(const std::string& api_key, HttpClient& http,
                       const std::string& base_url = "",
                       long timeout_seconds = 120);

    OpenedStream open(const CompletionRequest& request) override;

    bool ready() const override { return !api_key_.empty(); }
    std::string provider_name() const override { return "openrouter"; }

    nlohmann::json build_request(const CompletionRequest& request) const;
    std::vector<Header> build_headers() const;
    std::string completions_url() const { return base_url_ + "/chat/completions"; }

private:
    std::string api_key_;
    HttpClient& http_;
    std::string base_url_;
    long timeout_seconds_;
};

} // namespace chatrelay
