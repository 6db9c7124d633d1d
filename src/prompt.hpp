#pragma once
#include "chat_store.hpp"
#include "provider.hpp"
#include <string>
#include <vector>

namespace chatrelay {

// Placed between system-prompt sections.
constexpr const char* kSectionSeparator = "\n---\n";
constexpr const char* kNoCharacterDescription = "No character description provided";
constexpr const char* kNoUserDescription = "No user description provided";

// Pre-prompt (when enabled), system prompt, character description and user
// description, each trimmed and joined by kSectionSeparator. Missing or blank
// descriptions render as placeholders so the section count stays fixed.
std::string build_system_prompt(const ChatSessionConfig& config);

// [system] + history + [system(post-prompt) when enabled] + [user(new_message)]
std::vector<ChatMessage> assemble_messages(const ChatSessionConfig& config,
                                           const std::vector<ConversationTurn>& history,
                                           const std::string& new_message);

CompletionRequest build_completion_request(const ChatSessionConfig& config,
                                           const std::vector<ConversationTurn>& history,
                                           const std::string& new_message,
                                           std::optional<double> temperature = std::nullopt);

} // namespace chatrelay
