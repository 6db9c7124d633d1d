#include "provider.hpp"
#include "providers/openrouter.hpp"
#include "config.hpp"
#include "util.hpp"

namespace chatrelay {

std::optional<Role> role_from_string(const std::string& s) {
    if (s == "system") return Role::System;
    if (s == "user") return Role::User;
    if (s == "assistant") return Role::Assistant;
    return std::nullopt;
}

CancelHandle::CancelHandle() : state_(std::make_shared<State>()) {}

void CancelHandle::cancel() const {
    if (state_->flag.exchange(true)) return;

    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        callbacks.swap(state_->callbacks);
    }
    for (auto& fn : callbacks) fn();
}

bool CancelHandle::cancelled() const {
    return state_->flag.load();
}

const std::atomic<bool>* CancelHandle::flag() const {
    return &state_->flag;
}

void CancelHandle::on_cancel(std::function<void()> fn) const {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->flag.load()) {
            state_->callbacks.push_back(std::move(fn));
            return;
        }
    }
    fn();
}

std::vector<ChatMessage> normalize_messages(const std::vector<ChatMessage>& messages) {
    std::vector<ChatMessage> result;
    result.reserve(messages.size());
    for (size_t i = 0; i < messages.size(); ++i) {
        std::string content = trim(messages[i].content);
        if (content.empty()) {
            throw ProviderError("Message " + std::to_string(i) + " (" +
                                role_to_string(messages[i].role) +
                                ") has empty content");
        }
        result.push_back(ChatMessage{messages[i].role, std::move(content)});
    }
    return result;
}

std::unique_ptr<Provider> create_provider(const ProviderConfig& config,
                                           HttpClient& http) {
    return std::make_unique<OpenRouterProvider>(config.api_key, http,
                                                config.base_url, config.timeout);
}

} // namespace chatrelay
