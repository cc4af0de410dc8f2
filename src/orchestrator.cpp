#include "orchestrator.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

namespace router {
namespace {

static nlohmann::json RouteJson(const RouteDecision& route) {
  nlohmann::json j;
  j["provider"] = route.provider;
  j["model"] = route.model;
  j["tier"] = route.tier;
  j["intent"] = IntentName(route.intent);
  j["priority"] = PriorityName(route.priority);
  j["forced_route"] = route.forced;
  j["forced_provider"] = route.forced_provider ? nlohmann::json(*route.forced_provider) : nlohmann::json(nullptr);
  j["forced_model"] = route.forced_model ? nlohmann::json(*route.forced_model) : nlohmann::json(nullptr);
  j["reason"] = route.reason;
  return j;
}

static nlohmann::json CompletionBody(const UpstreamResponse& resp) {
  nlohmann::json out;
  out["id"] = resp.id.empty() ? NewId("chatcmpl") : resp.id;
  out["object"] = "chat.completion";
  out["created"] = NowSeconds();
  out["model"] = resp.model;
  out["choices"] = nlohmann::json::array();
  out["choices"].push_back({{"index", 0},
                            {"message", {{"role", "assistant"}, {"content", resp.content}}},
                            {"finish_reason", resp.finish_reason}});
  out["usage"] = {{"prompt_tokens", resp.prompt_tokens},
                  {"completion_tokens", resp.completion_tokens},
                  {"total_tokens", resp.prompt_tokens + resp.completion_tokens}};
  return out;
}

static ChatOutcome InternalError() {
  ChatOutcome out;
  out.http_status = 500;
  out.body = MakeErrorBody("Internal router error", "server_error", "internal_error");
  return out;
}

}  // namespace

nlohmann::json MakeErrorBody(const std::string& message, const std::string& type, const std::string& code) {
  nlohmann::json j;
  j["error"] = {{"message", message},
                {"type", type},
                {"param", nullptr},
                {"code", code.empty() ? nlohmann::json(nullptr) : nlohmann::json(code)}};
  return j;
}

ChatOrchestrator::ChatOrchestrator(const RouterConfig& cfg,
                                   BudgetManager* budget,
                                   const ContextBuilder* context,
                                   ProviderDispatcher* dispatcher,
                                   RouterLogs* logs,
                                   FallbackTelemetrySink* telemetry)
    : cfg_(cfg), budget_(budget), context_(context), dispatcher_(dispatcher), logs_(logs), telemetry_(telemetry) {}

ChatOutcome ChatOrchestrator::Handle(const ChatRequest& req) {
  try {
    return HandleOrThrow(req);
  } catch (const NoViableRoute& e) {
    logs_->AppendError(std::string("no viable route: ") + e.what(), {{"model", req.model}});
  } catch (const ProviderError& e) {
    logs_->AppendError(e.what(), {{"model", req.model},
                                  {"status", e.status()},
                                  {"retryable", e.retryable()},
                                  {"detail", e.detail()}});
  } catch (const std::exception& e) {
    logs_->AppendError(e.what(), {{"model", req.model}});
  }
  return InternalError();
}

ChatOutcome ChatOrchestrator::HandleOrThrow(const ChatRequest& req) {
  RouteDecision route = DecideRoute(req, cfg_, *budget_);
  ContextResult context = context_->Build(req, route.priority);

  int completion_tokens = cfg_.budget.default_completion_tokens;
  if (req.max_tokens.has_value() && req.max_tokens.value() > 0) completion_tokens = req.max_tokens.value();
  const int prompt_tokens = context.info.tokens_after;

  std::optional<BudgetHold> hold = budget_->TryAdmit(route.provider, route.model, prompt_tokens, completion_tokens);
  if (!hold) {
    const std::string rejected = route.provider;
    std::cout << "[orchestrator] budget rejected provider=" << rejected << " model=" << route.model
              << ", re-routing\n";
    std::optional<RouteDecision> alternate;
    try {
      alternate = DecideRoute(req, cfg_, *budget_, true, rejected);
    } catch (const NoViableRoute& e) {
      std::cout << "[orchestrator] no alternate route: " << e.what() << "\n";
    }
    if (alternate) hold = budget_->TryAdmit(alternate->provider, alternate->model, prompt_tokens, completion_tokens);
    if (!hold) {
      logs_->AppendError("budget exceeded for all providers",
                         {{"provider", rejected}, {"alternate", alternate ? alternate->provider : std::string()}});
      ChatOutcome out;
      out.http_status = 429;
      out.body = MakeErrorBody("Budget exceeded for all providers", "budget_exceeded", "budget_exceeded");
      return out;
    }
    route = std::move(*alternate);
  }

  const auto t0 = std::chrono::steady_clock::now();
  DispatchResult result = dispatcher_->Call(req, context.messages, route, context.info, &*hold);
  const auto latency_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();

  auto record = RouteJson(route);
  record["estimated_tokens_in"] = context.info.tokens_after;
  record["execution_target"] = result.execution.target;
  record["execution_host"] = result.execution.host;
  record["execution_mode"] = result.execution.mode;
  record["ts"] = result.execution.timestamp;
  logs_->AppendRequest(std::move(record));

  EmitTelemetry(req, route, result.response, latency_ms);

  ChatOutcome out;
  out.body = CompletionBody(result.response);
  return out;
}

void ChatOrchestrator::EmitTelemetry(const ChatRequest& req,
                                     const RouteDecision& route,
                                     const UpstreamResponse& resp,
                                     int64_t latency_ms) {
  if (!telemetry_) return;
  TelemetryRecord rec;
  rec.provider = NormalizeTelemetryProvider(route.provider);
  rec.model_name = route.model;
  rec.actual_model = resp.model.empty() ? route.model : resp.model;
  rec.agent_name = cfg_.telemetry.agent_name;
  if (req.metadata && req.metadata->route && !req.metadata->route->empty()) rec.agent_name = *req.metadata->route;
  rec.tokens_in = resp.prompt_tokens;
  rec.tokens_out = resp.completion_tokens;
  rec.cost_usd = resp.cost_usd ? *resp.cost_usd
                               : budget_->EstimateCost(route.provider, rec.actual_model, rec.tokens_in, rec.tokens_out);
  rec.latency_ms = latency_ms;
  telemetry_->Emit(rec);
}

}  // namespace router
