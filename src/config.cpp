#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace router {
namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static std::string ToUpperEnvName(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c >= 'a' && c <= 'z') {
      out.push_back(static_cast<char>(c - 'a' + 'A'));
    } else if ((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
      out.push_back(c);
    } else {
      out.push_back('_');
    }
  }
  return out;
}

static bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLower(s);
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

static ProviderKind InferProviderKind(const std::string& name) {
  if (name == "openrouter") return ProviderKind::kAggregator;
  if (name == "lmstudio" || name == "ollama" || name == "local") return ProviderKind::kLocal;
  return ProviderKind::kPlaceholder;
}

static int DefaultPortFor(const std::string& url) {
  return StartsWith(ToLower(url), "https://") ? 443 : 80;
}

static std::vector<std::string> ReadStringList(const YAML::Node& node) {
  std::vector<std::string> out;
  if (!node || !node.IsSequence()) return out;
  for (const auto& item : node) {
    auto v = ToLower(item.as<std::string>());
    if (!v.empty()) out.push_back(std::move(v));
  }
  return out;
}

static bool ParseRouting(const YAML::Node& node, RoutingConfig* out, std::string* err) {
  if (!node) return true;
  if (node["default_priority"]) {
    auto raw = node["default_priority"].as<std::string>();
    auto p = ParsePriority(raw);
    if (!p) {
      if (err) *err = "routing.default_priority: unknown priority '" + raw + "'";
      return false;
    }
    out->default_priority = *p;
  }

  if (const auto kw = node["intent_keywords"]; kw && kw.IsMap()) {
    for (auto it = kw.begin(); it != kw.end(); ++it) {
      const auto raw = it->first.as<std::string>();
      auto intent = ParseIntent(raw);
      if (!intent) {
        std::cout << "[config] ignoring keywords for unknown intent=" << raw << "\n";
        continue;
      }
      out->intent_keywords.emplace_back(*intent, ReadStringList(it->second));
    }
  }
  if (node["vision_keywords"]) out->vision_keywords = ReadStringList(node["vision_keywords"]);

  if (const auto chains = node["fallback_chain"]; chains && chains.IsMap()) {
    for (auto it = chains.begin(); it != chains.end(); ++it) {
      const auto raw = it->first.as<std::string>();
      auto intent = ParseIntent(raw);
      if (!intent) {
        if (err) *err = "routing.fallback_chain: unknown intent '" + raw + "'";
        return false;
      }
      std::vector<FallbackCandidate> chain;
      if (it->second.IsSequence()) {
        for (const auto& entry : it->second) {
          FallbackCandidate c;
          if (entry.IsSequence() && entry.size() == 2) {
            c.provider = entry[0].as<std::string>();
            c.tier = entry[1].as<std::string>();
          } else if (entry.IsMap() && entry["provider"] && entry["tier"]) {
            c.provider = entry["provider"].as<std::string>();
            c.tier = entry["tier"].as<std::string>();
          } else {
            if (err) *err = "routing.fallback_chain." + raw + ": entries must be [provider, tier]";
            return false;
          }
          chain.push_back(std::move(c));
        }
      }
      out->fallback_chain[*intent] = std::move(chain);
    }
  }

  if (const auto ov = node["overrides"]; ov && ov.IsMap()) {
    if (ov["allow_route_override"]) out->overrides.allow_route_override = ov["allow_route_override"].as<bool>();
    if (ov["allow_model_override"]) out->overrides.allow_model_override = ov["allow_model_override"].as<bool>();
  }
  return true;
}

static bool ParseProviders(const YAML::Node& node, std::map<std::string, ProviderConfig>* out, std::string* err) {
  if (!node) return true;
  if (!node.IsMap()) {
    if (err) *err = "providers: expected a mapping";
    return false;
  }
  for (auto it = node.begin(); it != node.end(); ++it) {
    ProviderConfig pc;
    pc.name = it->first.as<std::string>();
    const auto& p = it->second;
    pc.kind = InferProviderKind(pc.name);
    if (p["kind"]) {
      auto raw = p["kind"].as<std::string>();
      auto kind = ParseProviderKind(raw);
      if (!kind) {
        if (err) *err = "providers." + pc.name + ".kind: unknown kind '" + raw + "'";
        return false;
      }
      pc.kind = *kind;
    }
    if (p["enabled"]) pc.enabled = p["enabled"].as<bool>();
    if (p["endpoint"]) {
      const auto url = p["endpoint"].as<std::string>();
      pc.endpoint = ParseHttpEndpoint(url, DefaultPortFor(url));
      pc.has_endpoint = true;
    }
    if (const auto tiers = p["tiers"]; tiers && tiers.IsMap()) {
      for (auto t = tiers.begin(); t != tiers.end(); ++t) {
        TierConfig tc;
        if (t->second["default_model"]) tc.default_model = t->second["default_model"].as<std::string>();
        pc.tiers[t->first.as<std::string>()] = std::move(tc);
      }
    }
    if (p["daily_cap_usd"]) pc.daily_cap_usd = p["daily_cap_usd"].as<double>();
    if (p["monthly_cap_usd"]) pc.monthly_cap_usd = p["monthly_cap_usd"].as<double>();
    if (p["api_key_env"]) pc.api_key_env = p["api_key_env"].as<std::string>();
    if (p["discovery"]) pc.discovery = ToLower(p["discovery"].as<std::string>());
    if (p["timeout_seconds"]) pc.timeout_seconds = p["timeout_seconds"].as<int>();
    if (pc.timeout_seconds <= 0) pc.timeout_seconds = pc.kind == ProviderKind::kLocal ? 120 : 60;
    (*out)[pc.name] = std::move(pc);
  }
  return true;
}

static void ParseBudget(const YAML::Node& node, BudgetConfig* out) {
  if (!node) return;
  if (node["daily_cap_per_provider_usd"]) out->daily_cap_per_provider_usd = node["daily_cap_per_provider_usd"].as<double>();
  if (node["monthly_cap_per_provider_usd"]) {
    out->monthly_cap_per_provider_usd = node["monthly_cap_per_provider_usd"].as<double>();
  }
  if (node["fallback_cost_per_1k_usd"]) out->fallback_cost_per_1k_usd = node["fallback_cost_per_1k_usd"].as<double>();
  if (node["default_completion_tokens"]) out->default_completion_tokens = node["default_completion_tokens"].as<int>();
  if (const auto costs = node["cost_per_1k_tokens_usd"]; costs && costs.IsMap()) {
    for (auto it = costs.begin(); it != costs.end(); ++it) {
      auto& table = out->cost_per_1k_tokens_usd[it->first.as<std::string>()];
      if (!it->second.IsMap()) continue;
      for (auto m = it->second.begin(); m != it->second.end(); ++m) {
        table[m->first.as<std::string>()] = m->second.as<double>();
      }
    }
  }
  if (node["period_rollover"]) out->internal_period_rollover = ToLower(node["period_rollover"].as<std::string>()) != "external";
}

static bool ParseTokens(const YAML::Node& node, std::map<Priority, TokenLimits>* out, std::string* err) {
  if (!node || !node["priorities"] || !node["priorities"].IsMap()) return true;
  const auto priorities = node["priorities"];
  for (auto it = priorities.begin(); it != priorities.end(); ++it) {
    const auto raw = it->first.as<std::string>();
    auto priority = ParsePriority(raw);
    if (!priority) {
      if (err) *err = "tokens.priorities: unknown priority '" + raw + "'";
      return false;
    }
    TokenLimits limits;
    if (it->second["target_input_tokens"]) limits.target_input_tokens = it->second["target_input_tokens"].as<int>();
    if (it->second["hard_max_input_tokens"]) limits.hard_max_input_tokens = it->second["hard_max_input_tokens"].as<int>();
    (*out)[*priority] = limits;
  }
  return true;
}

static std::string RebaseUnder(const std::string& dir, const std::string& path) {
  return (std::filesystem::path(dir) / std::filesystem::path(path).filename()).string();
}

static std::optional<RouterConfig> ConfigFromYaml(const YAML::Node& root, std::string* err) {
  RouterConfig cfg;
  if (root && !root.IsNull() && !root.IsMap()) {
    if (err) *err = "config: top level must be a mapping";
    return std::nullopt;
  }
  if (const auto server = root["server"]) {
    if (server["host"]) cfg.listen.host = server["host"].as<std::string>();
    if (server["port"]) cfg.listen.port = server["port"].as<int>();
  }
  if (!ParseRouting(root["routing"], &cfg.routing, err)) return std::nullopt;
  if (!ParseProviders(root["providers"], &cfg.providers, err)) return std::nullopt;
  ParseBudget(root["budget"], &cfg.budget);
  if (!ParseTokens(root["tokens"], &cfg.token_priorities, err)) return std::nullopt;
  if (const auto memory = root["memory"]) {
    if (memory["pins_file"]) cfg.memory.pins_file = memory["pins_file"].as<std::string>();
    if (memory["summaries_dir"]) cfg.memory.summaries_dir = memory["summaries_dir"].as<std::string>();
  }
  if (const auto logging = root["logging"]) {
    if (logging["request_log"]) cfg.logging.request_log = logging["request_log"].as<std::string>();
    if (logging["error_log"]) cfg.logging.error_log = logging["error_log"].as<std::string>();
    if (logging["context_log"]) cfg.logging.context_log = logging["context_log"].as<std::string>();
  }
  if (const auto telemetry = root["telemetry"]) {
    if (telemetry["enabled"]) cfg.telemetry.enabled = telemetry["enabled"].as<bool>();
    if (telemetry["url"]) cfg.telemetry.url = telemetry["url"].as<std::string>();
    if (telemetry["store_path"]) cfg.telemetry.store_path = telemetry["store_path"].as<std::string>();
    if (telemetry["agent_name"]) cfg.telemetry.agent_name = telemetry["agent_name"].as<std::string>();
    if (telemetry["timeout_seconds"]) cfg.telemetry.timeout_seconds = telemetry["timeout_seconds"].as<int>();
  }
  return cfg;
}

}  // namespace

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port) {
  HttpEndpoint ep;
  ep.port = 0;
  std::string s = url;
  if (StartsWith(s, "http://")) {
    ep.scheme = "http";
    s = s.substr(7);
  } else if (StartsWith(s, "https://")) {
    ep.scheme = "https";
    s = s.substr(8);
  }

  auto slash_pos = s.find('/');
  if (slash_pos != std::string::npos) {
    ep.base_path = s.substr(slash_pos);
    s = s.substr(0, slash_pos);
  }
  if (!ep.base_path.empty() && ep.base_path.back() == '/') ep.base_path.pop_back();

  auto colon_pos = s.rfind(':');
  if (colon_pos != std::string::npos) {
    ep.host = s.substr(0, colon_pos);
    ep.port = std::atoi(s.substr(colon_pos + 1).c_str());
  } else if (!s.empty()) {
    ep.host = s;
  }
  if (ep.port == 0) ep.port = default_port;
  if (ep.host.empty()) ep.host = "127.0.0.1";
  return ep;
}

std::string EndpointUrl(const HttpEndpoint& ep) {
  return ep.scheme + "://" + ep.host + ":" + std::to_string(ep.port) + ep.base_path;
}

std::optional<ProviderKind> ParseProviderKind(const std::string& s) {
  const auto v = ToLower(s);
  if (v == "aggregator" || v == "openrouter") return ProviderKind::kAggregator;
  if (v == "local" || v == "lmstudio" || v == "ollama") return ProviderKind::kLocal;
  if (v == "placeholder" || v == "stub") return ProviderKind::kPlaceholder;
  return std::nullopt;
}

const char* ProviderKindName(ProviderKind kind) {
  switch (kind) {
    case ProviderKind::kAggregator:
      return "aggregator";
    case ProviderKind::kLocal:
      return "local";
    case ProviderKind::kPlaceholder:
      return "placeholder";
  }
  return "placeholder";
}

const ProviderConfig* RouterConfig::FindProvider(const std::string& name) const {
  auto it = providers.find(name);
  if (it == providers.end()) return nullptr;
  return &it->second;
}

TokenLimits RouterConfig::LimitsFor(Priority priority) const {
  auto it = token_priorities.find(priority);
  if (it != token_priorities.end()) return it->second;
  it = token_priorities.find(Priority::kNormal);
  if (it != token_priorities.end()) return it->second;
  return TokenLimits{};
}

std::optional<RouterConfig> ParseRouterConfig(const std::string& yaml_text, std::string* err) {
  try {
    return ConfigFromYaml(YAML::Load(yaml_text), err);
  } catch (const YAML::Exception& e) {
    if (err) *err = std::string("config: ") + e.what();
    return std::nullopt;
  }
}

std::optional<RouterConfig> LoadRouterConfigFile(const std::string& path, std::string* err) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (err) *err = "config: file not found: " + path;
    return std::nullopt;
  }
  try {
    return ConfigFromYaml(YAML::LoadFile(path), err);
  } catch (const YAML::Exception& e) {
    if (err) *err = "config: " + path + ": " + e.what();
    return std::nullopt;
  }
}

void ApplyEnvOverrides(RouterConfig* cfg) {
  if (auto host = GetEnvStr("ROUTER_LISTEN_HOST"); !host.empty()) cfg->listen.host = host;
  if (auto port = GetEnvStr("ROUTER_LISTEN_PORT"); !port.empty()) cfg->listen.port = std::atoi(port.c_str());
  if (auto dir = GetEnvStr("ROUTER_LOG_DIR"); !dir.empty()) {
    cfg->logging.request_log = RebaseUnder(dir, cfg->logging.request_log);
    cfg->logging.error_log = RebaseUnder(dir, cfg->logging.error_log);
    cfg->logging.context_log = RebaseUnder(dir, cfg->logging.context_log);
  }
  if (auto url = GetEnvStr("ROUTER_TELEMETRY_URL"); !url.empty()) cfg->telemetry.url = url;
  if (auto enabled = GetEnvStr("ROUTER_TELEMETRY_ENABLED"); !enabled.empty()) {
    bool b = true;
    if (TryParseBool(enabled, &b)) cfg->telemetry.enabled = b;
  }
  if (auto pins = GetEnvStr("ROUTER_PINS_FILE"); !pins.empty()) cfg->memory.pins_file = pins;

  for (auto& [name, pc] : cfg->providers) {
    const auto env_name = ToUpperEnvName(name) + "_HOST";
    if (auto url = GetEnvStr(env_name.c_str()); !url.empty()) {
      pc.endpoint = ParseHttpEndpoint(url, DefaultPortFor(url));
      pc.has_endpoint = true;
    }
    const auto enabled_name = ToUpperEnvName(name) + "_ENABLED";
    if (auto enabled = GetEnvStr(enabled_name.c_str()); !enabled.empty()) {
      bool b = pc.enabled;
      if (TryParseBool(enabled, &b)) pc.enabled = b;
    }
  }
}

std::optional<RouterConfig> LoadConfigFromEnv(std::string* err) {
  auto path = GetEnvStr("ROUTER_CONFIG");
  if (path.empty()) path = "configs/router.yaml";
  auto cfg = LoadRouterConfigFile(path, err);
  if (!cfg) return std::nullopt;
  ApplyEnvOverrides(&*cfg);
  return cfg;
}

}  // namespace router
