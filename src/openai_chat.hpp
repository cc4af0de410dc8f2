#pragma once

#include "providers/provider.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace router {

nlohmann::json BuildChatPayload(const std::string& model, const std::vector<ChatMessage>& messages, const ChatRequest& req);

// Usage fields missing from the body fall back to estimated_prompt_tokens
// and zero completion tokens.
std::optional<UpstreamResponse> ParseChatCompletion(const std::string& body,
                                                    const std::string& provider,
                                                    const std::string& requested_model,
                                                    int estimated_prompt_tokens,
                                                    std::string* err);

std::string TruncateForLog(std::string s, size_t max_chars);

}  // namespace router
