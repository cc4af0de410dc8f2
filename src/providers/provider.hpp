#pragma once

#include "chat_request.hpp"
#include "context_builder.hpp"
#include "routing.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace router {

struct UpstreamResponse {
  std::string id;
  std::string provider;
  std::string model;
  std::string content;
  std::string finish_reason = "stop";
  int prompt_tokens = 0;
  int completion_tokens = 0;
  bool usage_reported = false;
  std::optional<double> cost_usd;
};

// status is 0 when no HTTP response was received. detail carries the upstream
// body for the error log; it is never returned to callers.
class ProviderError : public std::runtime_error {
 public:
  ProviderError(const std::string& what, int status, bool retryable, std::string detail = {})
      : std::runtime_error(what), status_(status), retryable_(retryable), detail_(std::move(detail)) {}

  int status() const { return status_; }
  bool retryable() const { return retryable_; }
  const std::string& detail() const { return detail_; }

 private:
  int status_;
  bool retryable_;
  std::string detail_;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

Sleeper RealSleeper();

struct CompletionInput {
  const ChatRequest* request = nullptr;
  const std::vector<ChatMessage>* messages = nullptr;
  const RouteDecision* route = nullptr;
  const ContextInfo* context = nullptr;
};

}  // namespace router
