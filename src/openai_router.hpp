#pragma once

#include "budget_manager.hpp"
#include "observability.hpp"
#include "orchestrator.hpp"
#include "providers/registry.hpp"
#include "router_logs.hpp"

#include <httplib.h>

#include <chrono>
#include <string>

namespace router {

// OpenAI-compatible surface plus the dashboard's health and log endpoints.
// The Handle* methods are server-independent so they can be driven directly.
class OpenAiRouter {
 public:
  static constexpr int kDefaultLogLimit = 50;
  static constexpr int kMaxLogLimit = 200;

  OpenAiRouter(ChatOrchestrator* orchestrator,
               BudgetManager* budget,
               ProviderRegistry* registry,
               ExecutionTracker* tracker,
               RouterLogs* logs);

  void Register(httplib::Server* server);

  ChatOutcome HandleChatCompletions(const std::string& body);
  ChatOutcome HandleHealth();
  ChatOutcome HandleLogs(const std::string& type, const std::string& limit);

 private:
  ChatOrchestrator* orchestrator_;
  BudgetManager* budget_;
  ProviderRegistry* registry_;
  ExecutionTracker* tracker_;
  RouterLogs* logs_;
  std::chrono::steady_clock::time_point started_;
};

}  // namespace router
