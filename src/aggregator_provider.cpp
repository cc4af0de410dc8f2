#include "aggregator_provider.hpp"

#include "openai_chat.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

namespace router {
namespace {

static std::string GetEnvStr(const char* name, const std::string& fallback = {}) {
  const char* v = std::getenv(name);
  if (!v || !*v) return fallback;
  return std::string(v);
}

static bool IsRetryableStatus(int status) {
  return status == 429 || status >= 500;
}

}  // namespace

AggregatorProvider::AggregatorProvider(const ProviderConfig& cfg, HttpTransport* transport, Sleeper sleeper)
    : cfg_(cfg),
      endpoint_(cfg.has_endpoint ? cfg.endpoint : ParseHttpEndpoint("https://openrouter.ai/api", 443)),
      transport_(transport),
      sleeper_(std::move(sleeper)) {}

RequestHeaderList AggregatorProvider::Headers(const std::string& api_key) const {
  RequestHeaderList headers;
  headers.emplace_back("Authorization", "Bearer " + api_key);
  headers.emplace_back("HTTP-Referer", GetEnvStr("OPENROUTER_HTTP_REFERER", "http://localhost"));
  headers.emplace_back("X-Title", GetEnvStr("OPENROUTER_X_TITLE", "local-llm-router"));
  return headers;
}

UpstreamResponse AggregatorProvider::Complete(const CompletionInput& in) {
  const auto api_key = GetEnvStr(cfg_.api_key_env.c_str());
  if (api_key.empty()) {
    throw ProviderError(cfg_.name + ": " + cfg_.api_key_env + " is not set", 0, false);
  }

  const auto payload = BuildChatPayload(in.route->model, *in.messages, *in.request).dump();
  const auto headers = Headers(api_key);
  HttpTimeouts timeouts;
  timeouts.connect_seconds = 10;
  timeouts.read_seconds = cfg_.timeout_seconds;

  std::string last_error;
  int last_status = 0;
  for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
    std::string err;
    auto reply = transport_->Post(endpoint_, "/v1/chat/completions", payload, headers, timeouts, &err);
    bool retryable = true;
    std::string detail;
    if (!reply) {
      last_status = 0;
      last_error = cfg_.name + ": " + err;
    } else if (reply->status >= 200 && reply->status < 300) {
      auto parsed = ParseChatCompletion(reply->body, cfg_.name, in.route->model, in.context->tokens_after, &err);
      if (parsed) return std::move(*parsed);
      last_status = reply->status;
      last_error = err;
      detail = TruncateForLog(reply->body, 512);
    } else {
      last_status = reply->status;
      last_error = cfg_.name + ": /v1/chat/completions http " + std::to_string(reply->status);
      detail = TruncateForLog(reply->body, 512);
      retryable = IsRetryableStatus(reply->status);
    }

    if (!retryable) throw ProviderError(last_error, last_status, false, detail);
    if (attempt + 1 == kMaxAttempts) throw ProviderError(last_error, last_status, true, detail);

    const int backoff = std::min(1 << attempt, kMaxBackoffSeconds);
    std::cout << "[provider-retry] provider=" << cfg_.name << " attempt=" << (attempt + 1) << " status=" << last_status
              << " backoff_s=" << backoff << " error=" << last_error << "\n";
    if (sleeper_) sleeper_(std::chrono::seconds(backoff));
  }
  throw ProviderError(last_error, last_status, true);
}

}  // namespace router
