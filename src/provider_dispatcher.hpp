#pragma once

#include "budget_manager.hpp"
#include "observability.hpp"
#include "providers/provider.hpp"
#include "providers/registry.hpp"

#include <vector>

namespace router {

struct DispatchResult {
  UpstreamResponse response;
  ExecutionRecord execution;
};

class ProviderDispatcher {
 public:
  ProviderDispatcher(ProviderRegistry* registry, ExecutionTracker* tracker) : registry_(registry), tracker_(tracker) {}

  // Throws ProviderError when the provider is unknown or its retries are
  // exhausted. The hold is committed only after a successful response.
  DispatchResult Call(const ChatRequest& req,
                      const std::vector<ChatMessage>& messages,
                      const RouteDecision& route,
                      const ContextInfo& context,
                      BudgetHold* hold);

 private:
  ProviderRegistry* registry_;
  ExecutionTracker* tracker_;
};

}  // namespace router
