#pragma once

#include "chat_request.hpp"
#include "config.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace router {

class BudgetManager;

struct RouteDecision {
  std::string provider;
  std::string model;
  std::string tier;
  Intent intent = Intent::kChat;
  Priority priority = Priority::kNormal;
  bool forced = false;
  std::optional<std::string> forced_provider;
  std::optional<std::string> forced_model;
  std::string reason;
};

class NoViableRoute : public std::runtime_error {
 public:
  explicit NoViableRoute(const std::string& what) : std::runtime_error(what) {}
};

Intent DetectIntent(const std::vector<ChatMessage>& messages, const RoutingConfig& cfg);
Priority ResolvePriority(const ChatRequest& req, const RoutingConfig& cfg);

// When force_different_provider is set, every candidate served by
// excluded_provider is dropped; an empty excluded_provider means the first
// provider of the resolved chain.
RouteDecision DecideRoute(const ChatRequest& req,
                          const RouterConfig& cfg,
                          const BudgetManager& budget,
                          bool force_different_provider = false,
                          const std::string& excluded_provider = {});

}  // namespace router
