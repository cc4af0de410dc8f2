#include "routing.hpp"

#include "budget_manager.hpp"

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

static bool ContainsAny(const std::string& haystack, const std::vector<std::string>& needles) {
  for (const auto& n : needles) {
    if (!n.empty() && haystack.find(n) != std::string::npos) return true;
  }
  return false;
}

static std::string ResolveTierModel(const RouterConfig& cfg, const std::string& provider, const std::string& tier) {
  const auto* pc = cfg.FindProvider(provider);
  if (!pc) return {};
  auto it = pc->tiers.find(tier);
  if (it == pc->tiers.end()) return {};
  return it->second.default_model;
}

}  // namespace

Intent DetectIntent(const std::vector<ChatMessage>& messages, const RoutingConfig& cfg) {
  const ChatMessage* last_user = nullptr;
  for (auto it = messages.rbegin(); it != messages.rend(); ++it) {
    if (it->role == "user") {
      last_user = &*it;
      break;
    }
  }
  if (!last_user) return Intent::kChat;

  const auto content = ToLowerAscii(last_user->content);
  for (const auto& [intent, keywords] : cfg.intent_keywords) {
    if (ContainsAny(content, keywords)) return intent;
  }
  if (last_user->has_image || ContainsAny(content, cfg.vision_keywords)) return Intent::kVision;
  return Intent::kChat;
}

Priority ResolvePriority(const ChatRequest& req, const RoutingConfig& cfg) {
  if (req.metadata && req.metadata->priority) return *req.metadata->priority;
  return cfg.default_priority;
}

RouteDecision DecideRoute(const ChatRequest& req,
                          const RouterConfig& cfg,
                          const BudgetManager& budget,
                          bool force_different_provider,
                          const std::string& excluded_provider) {
  const auto& md = req.metadata;
  const Intent intent = (md && md->intent) ? *md->intent : DetectIntent(req.messages, cfg.routing);
  const Priority priority = ResolvePriority(req, cfg.routing);

  std::optional<std::string> forced_provider;
  std::optional<std::string> forced_model;
  if (md) {
    if (md->route && cfg.routing.overrides.allow_route_override) forced_provider = md->route;
    if (md->model && cfg.routing.overrides.allow_model_override) forced_model = md->model;
  }
  const bool forced = forced_provider.has_value() || forced_model.has_value();

  std::vector<FallbackCandidate> chain;
  if (auto it = cfg.routing.fallback_chain.find(intent); it != cfg.routing.fallback_chain.end()) chain = it->second;
  if (forced_provider) {
    for (auto& c : chain) c.provider = *forced_provider;
  }

  if (force_different_provider && !chain.empty()) {
    const std::string skip = excluded_provider.empty() ? chain.front().provider : excluded_provider;
    std::vector<FallbackCandidate> kept;
    for (auto& c : chain) {
      if (c.provider != skip) kept.push_back(std::move(c));
    }
    chain = std::move(kept);
  }

  if (chain.empty()) {
    throw NoViableRoute(std::string("no routing chain configured for intent: ") + IntentName(intent));
  }

  for (const auto& c : chain) {
    std::string model = forced_model ? *forced_model : ResolveTierModel(cfg, c.provider, c.tier);
    if (model.empty()) continue;
    if (!budget.ProviderEnabled(c.provider)) continue;

    RouteDecision d;
    d.provider = c.provider;
    d.model = std::move(model);
    d.tier = c.tier;
    d.intent = intent;
    d.priority = priority;
    d.forced = forced;
    d.forced_provider = forced_provider;
    d.forced_model = forced_model;
    d.reason = std::string("intent=") + IntentName(intent) + ", priority=" + PriorityName(priority) + ", tier=" + c.tier;
    if (forced) d.reason += ", forced override";
    return d;
  }

  throw NoViableRoute(std::string("no viable provider/model in fallback chain for intent: ") + IntentName(intent));
}

}  // namespace router
