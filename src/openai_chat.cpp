#include "openai_chat.hpp"

#include <cstring>
#include <string>

namespace router {
namespace {

static int ReadTokenCount(const nlohmann::json& usage, const char* key, int fallback, bool* found) {
  if (!usage.is_object() || !usage.contains(key) || !usage[key].is_number()) return fallback;
  *found = true;
  return usage[key].get<int>();
}

}  // namespace

nlohmann::json BuildChatPayload(const std::string& model, const std::vector<ChatMessage>& messages, const ChatRequest& req) {
  nlohmann::json j;
  j["model"] = model;
  j["stream"] = false;
  j["messages"] = nlohmann::json::array();
  for (const auto& m : messages) {
    j["messages"].push_back({{"role", m.role}, {"content", m.content}});
  }
  if (req.max_tokens.has_value() && req.max_tokens.value() > 0) j["max_tokens"] = req.max_tokens.value();
  if (req.temperature.has_value()) j["temperature"] = req.temperature.value();
  return j;
}

std::optional<UpstreamResponse> ParseChatCompletion(const std::string& body,
                                                    const std::string& provider,
                                                    const std::string& requested_model,
                                                    int estimated_prompt_tokens,
                                                    std::string* err) {
  auto jr = nlohmann::json::parse(body, nullptr, false);
  if (jr.is_discarded() || !jr.is_object() || !jr.contains("choices") || !jr["choices"].is_array() ||
      jr["choices"].empty() || !jr["choices"][0].is_object() || !jr["choices"][0].contains("message") ||
      !jr["choices"][0]["message"].is_object()) {
    if (err) *err = provider + ": invalid json from /v1/chat/completions";
    return std::nullopt;
  }

  UpstreamResponse out;
  out.provider = provider;
  out.model = requested_model;
  if (jr.contains("model") && jr["model"].is_string() && !jr["model"].get<std::string>().empty()) {
    out.model = jr["model"].get<std::string>();
  }
  if (jr.contains("id") && jr["id"].is_string()) out.id = jr["id"].get<std::string>();

  const auto& choice = jr["choices"][0];
  const auto& message = choice["message"];
  if (message.contains("content")) out.content = ExtractMessageContent(message["content"]);
  if (choice.contains("finish_reason") && choice["finish_reason"].is_string()) {
    out.finish_reason = choice["finish_reason"].get<std::string>();
  }

  const nlohmann::json usage = jr.contains("usage") ? jr["usage"] : nlohmann::json();
  bool found = false;
  out.prompt_tokens = ReadTokenCount(usage, "prompt_tokens", estimated_prompt_tokens, &found);
  out.completion_tokens = ReadTokenCount(usage, "completion_tokens", 0, &found);
  out.usage_reported = found;
  if (usage.is_object() && usage.contains("cost") && usage["cost"].is_number()) {
    out.cost_usd = usage["cost"].get<double>();
  }
  return out;
}

std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

}  // namespace router
