#include "chat_request.hpp"

#include <chrono>
#include <limits>
#include <random>
#include <sstream>
#include <string>
#include <utility>

namespace router {
namespace {

static std::string ToLowerAscii(std::string s) {
  for (char& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static std::string Hex(uint64_t v) {
  std::ostringstream oss;
  oss << std::hex << v;
  return oss.str();
}

static uint64_t Rand64() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  return rng();
}

static bool IsImagePart(const nlohmann::json& part) {
  if (!part.is_object() || !part.contains("type") || !part["type"].is_string()) return false;
  const auto type = part["type"].get<std::string>();
  return type == "image_url" || type == "input_image" || type == "image";
}

static bool ContentHasImage(const nlohmann::json& content) {
  if (!content.is_array()) return IsImagePart(content);
  for (const auto& part : content) {
    if (IsImagePart(part)) return true;
  }
  return false;
}

static std::optional<RequestMetadata> ParseMetadata(const nlohmann::json& j) {
  if (!j.is_object()) return std::nullopt;
  RequestMetadata md;
  if (j.contains("intent") && j["intent"].is_string()) md.intent = ParseIntent(j["intent"].get<std::string>());
  if (j.contains("priority") && j["priority"].is_string()) md.priority = ParsePriority(j["priority"].get<std::string>());
  if (j.contains("route") && j["route"].is_string()) {
    auto route = j["route"].get<std::string>();
    if (!route.empty()) md.route = std::move(route);
  }
  if (j.contains("model") && j["model"].is_string()) {
    auto model = j["model"].get<std::string>();
    if (!model.empty()) md.model = std::move(model);
  }
  return md;
}

}  // namespace

std::optional<Intent> ParseIntent(const std::string& s) {
  const auto v = ToLowerAscii(s);
  if (v == "chat") return Intent::kChat;
  if (v == "code") return Intent::kCode;
  if (v == "reasoning") return Intent::kReasoning;
  if (v == "vision") return Intent::kVision;
  if (v == "verify") return Intent::kVerify;
  return std::nullopt;
}

const char* IntentName(Intent intent) {
  switch (intent) {
    case Intent::kChat:
      return "chat";
    case Intent::kCode:
      return "code";
    case Intent::kReasoning:
      return "reasoning";
    case Intent::kVision:
      return "vision";
    case Intent::kVerify:
      return "verify";
  }
  return "chat";
}

std::optional<Priority> ParsePriority(const std::string& s) {
  const auto v = ToLowerAscii(s);
  if (v == "low") return Priority::kLow;
  if (v == "normal") return Priority::kNormal;
  if (v == "high") return Priority::kHigh;
  return std::nullopt;
}

const char* PriorityName(Priority priority) {
  switch (priority) {
    case Priority::kLow:
      return "low";
    case Priority::kNormal:
      return "normal";
    case Priority::kHigh:
      return "high";
  }
  return "normal";
}

std::string ExtractMessageContent(const nlohmann::json& content) {
  if (content.is_string()) return content.get<std::string>();
  if (content.is_object()) {
    if (content.contains("text") && content["text"].is_string()) return content["text"].get<std::string>();
    if (content.contains("content") && content["content"].is_string()) return content["content"].get<std::string>();
    return {};
  }
  if (!content.is_array()) return {};
  std::string out;
  for (const auto& part : content) {
    if (part.is_string()) {
      out += part.get<std::string>();
      continue;
    }
    if (!part.is_object()) continue;
    if (part.contains("type") && part["type"].is_string()) {
      const auto type = part["type"].get<std::string>();
      if (type != "text" && type != "input_text") continue;
    }
    if (part.contains("text") && part["text"].is_string()) out += part["text"].get<std::string>();
  }
  return out;
}

std::optional<ChatRequest> ParseChatRequest(const nlohmann::json& body, std::string* err) {
  if (!body.is_object()) {
    if (err) *err = "invalid json body";
    return std::nullopt;
  }
  if (!body.contains("model") || !body["model"].is_string()) {
    if (err) *err = "missing field: model";
    return std::nullopt;
  }
  if (!body.contains("messages") || !body["messages"].is_array()) {
    if (err) *err = "missing field: messages";
    return std::nullopt;
  }

  ChatRequest req;
  req.model = body["model"].get<std::string>();
  for (const auto& m : body["messages"]) {
    if (!m.is_object()) continue;
    ChatMessage cm;
    if (m.contains("role") && m["role"].is_string()) cm.role = m["role"].get<std::string>();
    if (m.contains("content")) {
      cm.content = ExtractMessageContent(m["content"]);
      cm.has_image = ContentHasImage(m["content"]);
    }
    if (!cm.role.empty()) req.messages.push_back(std::move(cm));
  }
  for (const char* key : {"max_tokens", "max_completion_tokens"}) {
    if (!body.contains(key) || !body[key].is_number_integer()) continue;
    // Unsigned values past INT64_MAX wrap negative and are rejected with the rest.
    const auto v = body[key].get<int64_t>();
    if (v < 1 || v > std::numeric_limits<int>::max()) {
      if (err) *err = std::string("invalid field: ") + key;
      return std::nullopt;
    }
    req.max_tokens = static_cast<int>(v);
    break;
  }
  if (body.contains("temperature") && body["temperature"].is_number()) {
    req.temperature = body["temperature"].get<double>();
  }
  if (body.contains("metadata")) req.metadata = ParseMetadata(body["metadata"]);
  return req;
}

std::string NewId(const std::string& prefix) {
  auto now = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
          .count());
  return prefix + "-" + Hex(now) + "-" + Hex(Rand64());
}

int64_t NowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace router
