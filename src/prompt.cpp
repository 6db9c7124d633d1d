#include "prompt.hpp"
#include "util.hpp"

namespace chatrelay {

static std::string section_or(const std::optional<std::string>& text,
                              const char* placeholder) {
    std::string trimmed = text ? trim(*text) : std::string();
    return trimmed.empty() ? std::string(placeholder) : trimmed;
}

std::string build_system_prompt(const ChatSessionConfig& config) {
    std::vector<std::string> sections;

    if (config.pre_prompt_enabled && config.pre_prompt) {
        std::string pre = trim(*config.pre_prompt);
        if (!pre.empty()) sections.push_back(pre);
    }
    sections.push_back(trim(config.system_prompt));
    sections.push_back(section_or(config.character_description, kNoCharacterDescription));
    sections.push_back(section_or(config.user_description, kNoUserDescription));

    std::string result;
    for (size_t i = 0; i < sections.size(); ++i) {
        if (i > 0) result += kSectionSeparator;
        result += sections[i];
    }
    return result;
}

std::vector<ChatMessage> assemble_messages(const ChatSessionConfig& config,
                                           const std::vector<ConversationTurn>& history,
                                           const std::string& new_message) {
    std::vector<ChatMessage> messages;
    messages.reserve(history.size() + 3);

    messages.push_back({Role::System, build_system_prompt(config)});
    for (const auto& turn : history) {
        messages.push_back({turn.role, turn.content});
    }
    if (config.post_prompt_enabled && config.post_prompt) {
        std::string post = trim(*config.post_prompt);
        if (!post.empty()) messages.push_back({Role::System, post});
    }
    messages.push_back({Role::User, new_message});
    return messages;
}

CompletionRequest build_completion_request(const ChatSessionConfig& config,
                                           const std::vector<ConversationTurn>& history,
                                           const std::string& new_message,
                                           std::optional<double> temperature) {
    CompletionRequest request;
    request.model = config.model;
    request.messages = assemble_messages(config, history, new_message);
    request.temperature = temperature;
    return request;
}

} // namespace chatrelay
