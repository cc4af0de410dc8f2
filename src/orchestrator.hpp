#pragma once

#include "budget_manager.hpp"
#include "chat_request.hpp"
#include "config.hpp"
#include "context_builder.hpp"
#include "provider_dispatcher.hpp"
#include "router_logs.hpp"
#include "routing.hpp"
#include "telemetry.hpp"

#include <nlohmann/json.hpp>

namespace router {

struct ChatOutcome {
  int http_status = 200;
  nlohmann::json body;
};

nlohmann::json MakeErrorBody(const std::string& message, const std::string& type, const std::string& code = {});

// One chat completion, end to end. Never throws; every failure becomes an
// error outcome and an error-log entry.
class ChatOrchestrator {
 public:
  ChatOrchestrator(const RouterConfig& cfg,
                   BudgetManager* budget,
                   const ContextBuilder* context,
                   ProviderDispatcher* dispatcher,
                   RouterLogs* logs,
                   FallbackTelemetrySink* telemetry);

  ChatOutcome Handle(const ChatRequest& req);

 private:
  ChatOutcome HandleOrThrow(const ChatRequest& req);
  void EmitTelemetry(const ChatRequest& req, const RouteDecision& route, const UpstreamResponse& resp, int64_t latency_ms);

  const RouterConfig& cfg_;
  BudgetManager* budget_;
  const ContextBuilder* context_;
  ProviderDispatcher* dispatcher_;
  RouterLogs* logs_;
  FallbackTelemetrySink* telemetry_;
};

}  // namespace router
