#pragma once

#include "chat_request.hpp"

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace router {

struct HttpListenConfig {
  std::string host = "0.0.0.0";
  int port = 8080;
};

struct HttpEndpoint {
  std::string scheme = "http";
  std::string host = "127.0.0.1";
  int port = 80;
  std::string base_path;
};

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port);
std::string EndpointUrl(const HttpEndpoint& ep);

using RequestHeaderList = std::vector<std::pair<std::string, std::string>>;

enum class ProviderKind { kAggregator, kLocal, kPlaceholder };

std::optional<ProviderKind> ParseProviderKind(const std::string& s);
const char* ProviderKindName(ProviderKind kind);

struct TierConfig {
  std::string default_model;
};

struct ProviderConfig {
  std::string name;
  ProviderKind kind = ProviderKind::kPlaceholder;
  bool enabled = true;
  HttpEndpoint endpoint;
  bool has_endpoint = false;
  std::map<std::string, TierConfig> tiers;
  std::optional<double> daily_cap_usd;
  std::optional<double> monthly_cap_usd;
  std::string api_key_env = "OPENROUTER_API_KEY";
  std::string discovery = "lmstudio";
  int timeout_seconds = 0;
};

struct FallbackCandidate {
  std::string provider;
  std::string tier;
};

struct OverridePolicy {
  bool allow_route_override = true;
  bool allow_model_override = true;
};

struct RoutingConfig {
  Priority default_priority = Priority::kNormal;
  std::vector<std::pair<Intent, std::vector<std::string>>> intent_keywords;
  std::vector<std::string> vision_keywords = {"image", "screenshot", "vision"};
  std::map<Intent, std::vector<FallbackCandidate>> fallback_chain;
  OverridePolicy overrides;
};

struct BudgetConfig {
  double daily_cap_per_provider_usd = 2.0;
  double monthly_cap_per_provider_usd = 60.0;
  double fallback_cost_per_1k_usd = 0.5;
  int default_completion_tokens = 512;
  std::map<std::string, std::map<std::string, double>> cost_per_1k_tokens_usd;
  bool internal_period_rollover = true;
};

struct TokenLimits {
  int target_input_tokens = 6000;
  int hard_max_input_tokens = 10000;
};

struct MemoryConfig {
  std::string pins_file = "memory/pins.md";
  std::string summaries_dir = "memory/router-summaries";
};

struct LoggingConfig {
  std::string request_log = "logs/router-requests.log";
  std::string error_log = "logs/router-errors.log";
  std::string context_log = "logs/router-context.log";
};

struct TelemetryConfig {
  bool enabled = true;
  std::string url = "http://127.0.0.1:3000/api/routing";
  std::string store_path = "data/command_center.db";
  std::string agent_name = "claw";
  int timeout_seconds = 2;
};

struct RouterConfig {
  HttpListenConfig listen;
  RoutingConfig routing;
  std::map<std::string, ProviderConfig> providers;
  BudgetConfig budget;
  std::map<Priority, TokenLimits> token_priorities;
  MemoryConfig memory;
  LoggingConfig logging;
  TelemetryConfig telemetry;

  const ProviderConfig* FindProvider(const std::string& name) const;
  TokenLimits LimitsFor(Priority priority) const;
};

std::optional<RouterConfig> ParseRouterConfig(const std::string& yaml_text, std::string* err);
std::optional<RouterConfig> LoadRouterConfigFile(const std::string& path, std::string* err);

// Reads ROUTER_CONFIG (default configs/router.yaml) and applies the
// ROUTER_* and <PROVIDER>_HOST environment overrides on top.
std::optional<RouterConfig> LoadConfigFromEnv(std::string* err);
void ApplyEnvOverrides(RouterConfig* cfg);

}  // namespace router
