#include "provider_dispatcher.hpp"

#include <chrono>
#include <iostream>
#include <thread>
#include <type_traits>

namespace router {

Sleeper RealSleeper() {
  return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

DispatchResult ProviderDispatcher::Call(const ChatRequest& req,
                                        const std::vector<ChatMessage>& messages,
                                        const RouteDecision& route,
                                        const ContextInfo& context,
                                        BudgetHold* hold) {
  auto* backend = registry_->Get(route.provider);
  if (!backend) throw ProviderError("unknown provider: " + route.provider, 0, false);

  CompletionInput in;
  in.request = &req;
  in.messages = &messages;
  in.route = &route;
  in.context = &context;

  std::string host;
  std::string mode;
  UpstreamResponse resp = std::visit(
      [&](auto& p) -> UpstreamResponse {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, PlaceholderProvider>) {
          host = "placeholder";
          mode = "placeholder";
        } else {
          host = p.Endpoint().host;
          mode = std::is_same_v<T, LocalBackendProvider> ? "local" : "remote";
        }
        return p.Complete(in);
      },
      *backend);

  if (resp.provider.empty()) resp.provider = route.provider;
  if (resp.model.empty()) resp.model = route.model;
  if (hold) hold->Commit();

  DispatchResult out;
  out.response = std::move(resp);
  out.execution = tracker_->Record(route.provider, host, mode);
  std::cout << "[dispatch] provider=" << route.provider << " model=" << out.response.model << " mode=" << mode
            << " prompt_tokens=" << out.response.prompt_tokens
            << " completion_tokens=" << out.response.completion_tokens << "\n";
  return out;
}

}  // namespace router
