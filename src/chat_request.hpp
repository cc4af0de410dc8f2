#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace router {

enum class Intent { kChat, kCode, kReasoning, kVision, kVerify };
enum class Priority { kLow, kNormal, kHigh };

std::optional<Intent> ParseIntent(const std::string& s);
const char* IntentName(Intent intent);
std::optional<Priority> ParsePriority(const std::string& s);
const char* PriorityName(Priority priority);

struct ChatMessage {
  std::string role;
  std::string content;
  bool has_image = false;
};

struct RequestMetadata {
  std::optional<Intent> intent;
  std::optional<Priority> priority;
  std::optional<std::string> route;
  std::optional<std::string> model;
};

struct ChatRequest {
  std::string model;
  std::vector<ChatMessage> messages;
  std::optional<int> max_tokens;
  std::optional<double> temperature;
  std::optional<RequestMetadata> metadata;
};

// Parses an OpenAI-style chat completion body. Unknown intent or priority
// strings are treated as absent.
std::optional<ChatRequest> ParseChatRequest(const nlohmann::json& body, std::string* err);

std::string ExtractMessageContent(const nlohmann::json& content);

std::string NewId(const std::string& prefix);
int64_t NowSeconds();

}  // namespace router
