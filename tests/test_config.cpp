#include "config.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>


namespace {

constexpr const char* kRouterYaml = R"(
server:
  host: 127.0.0.1
  port: 9090
routing:
  default_priority: low
  intent_keywords:
    code: [Code, refactor]
    reasoning: [prove]
  fallback_chain:
    code:
      - [openrouter, strong]
      - [lmstudio, local]
    chat:
      - provider: lmstudio
        tier: local
providers:
  openrouter:
    endpoint: https://openrouter.ai/api
    tiers:
      strong: {default_model: anthropic/claude-sonnet}
    daily_cap_usd: 5
  lmstudio:
    endpoint: http://10.0.0.5:1234
    tiers:
      local: {default_model: auto}
  gemini:
    enabled: false
budget:
  fallback_cost_per_1k_usd: 0.25
  cost_per_1k_tokens_usd:
    openrouter:
      anthropic/claude-sonnet: 3.0
  period_rollover: external
tokens:
  priorities:
    high: {target_input_tokens: 12000, hard_max_input_tokens: 20000}
telemetry:
  enabled: false
  agent_name: arden
)";

TEST(ConfigTest, ParsesFullDocument) {
  std::string err;
  auto cfg = router::ParseRouterConfig(kRouterYaml, &err);
  ASSERT_TRUE(cfg.has_value()) << err;

  EXPECT_EQ(cfg->listen.host, "127.0.0.1");
  EXPECT_EQ(cfg->listen.port, 9090);
  EXPECT_EQ(cfg->routing.default_priority, router::Priority::kLow);

  ASSERT_EQ(cfg->routing.intent_keywords.size(), 2u);
  EXPECT_EQ(cfg->routing.intent_keywords[0].first, router::Intent::kCode);
  EXPECT_EQ(cfg->routing.intent_keywords[0].second[0], "code");

  const auto& code_chain = cfg->routing.fallback_chain.at(router::Intent::kCode);
  ASSERT_EQ(code_chain.size(), 2u);
  EXPECT_EQ(code_chain[0].provider, "openrouter");
  EXPECT_EQ(code_chain[1].tier, "local");
  EXPECT_EQ(cfg->routing.fallback_chain.at(router::Intent::kChat)[0].provider, "lmstudio");

  const auto* openrouter = cfg->FindProvider("openrouter");
  ASSERT_NE(openrouter, nullptr);
  EXPECT_EQ(openrouter->kind, router::ProviderKind::kAggregator);
  EXPECT_EQ(openrouter->endpoint.scheme, "https");
  EXPECT_EQ(openrouter->endpoint.port, 443);
  EXPECT_EQ(openrouter->endpoint.base_path, "/api");
  EXPECT_DOUBLE_EQ(openrouter->daily_cap_usd.value_or(0), 5.0);
  EXPECT_EQ(openrouter->timeout_seconds, 60);

  const auto* lmstudio = cfg->FindProvider("lmstudio");
  ASSERT_NE(lmstudio, nullptr);
  EXPECT_EQ(lmstudio->kind, router::ProviderKind::kLocal);
  EXPECT_EQ(lmstudio->endpoint.host, "10.0.0.5");
  EXPECT_EQ(lmstudio->timeout_seconds, 120);

  const auto* gemini = cfg->FindProvider("gemini");
  ASSERT_NE(gemini, nullptr);
  EXPECT_EQ(gemini->kind, router::ProviderKind::kPlaceholder);
  EXPECT_FALSE(gemini->enabled);

  EXPECT_DOUBLE_EQ(cfg->budget.fallback_cost_per_1k_usd, 0.25);
  EXPECT_DOUBLE_EQ(cfg->budget.cost_per_1k_tokens_usd.at("openrouter").at("anthropic/claude-sonnet"), 3.0);
  EXPECT_FALSE(cfg->budget.internal_period_rollover);

  EXPECT_FALSE(cfg->telemetry.enabled);
  EXPECT_EQ(cfg->telemetry.agent_name, "arden");
}

TEST(ConfigTest, LimitsFallBackToNormalThenDefaults) {
  std::string err;
  auto cfg = router::ParseRouterConfig(kRouterYaml, &err);
  ASSERT_TRUE(cfg.has_value()) << err;
  EXPECT_EQ(cfg->LimitsFor(router::Priority::kHigh).hard_max_input_tokens, 20000);
  EXPECT_EQ(cfg->LimitsFor(router::Priority::kLow).target_input_tokens, 6000);
  EXPECT_EQ(cfg->LimitsFor(router::Priority::kLow).hard_max_input_tokens, 10000);
}

TEST(ConfigTest, RejectsUnknownIntentInChain) {
  std::string err;
  auto cfg = router::ParseRouterConfig("routing:\n  fallback_chain:\n    poetry:\n      - [openrouter, cheap]\n", &err);
  EXPECT_FALSE(cfg.has_value());
  EXPECT_NE(err.find("poetry"), std::string::npos);
}

TEST(ConfigTest, RejectsUnknownDefaultPriority) {
  std::string err;
  EXPECT_FALSE(router::ParseRouterConfig("routing:\n  default_priority: urgent\n", &err).has_value());
  EXPECT_NE(err.find("urgent"), std::string::npos);
}

TEST(ConfigTest, RejectsMalformedYaml) {
  std::string err;
  EXPECT_FALSE(router::ParseRouterConfig("routing: [unclosed", &err).has_value());
  EXPECT_FALSE(err.empty());
}

TEST(ConfigTest, MissingFileIsAnError) {
  router_test::TempDir dir;
  std::string err;
  EXPECT_FALSE(router::LoadRouterConfigFile(dir.File("absent.yaml"), &err).has_value());
  EXPECT_NE(err.find("not found"), std::string::npos);
}

TEST(ConfigTest, EnvironmentOverridesApply) {
  std::string err;
  auto cfg = router::ParseRouterConfig(kRouterYaml, &err);
  ASSERT_TRUE(cfg.has_value()) << err;

  router_test::SetEnv("ROUTER_LISTEN_PORT", "7070");
  router_test::SetEnv("LMSTUDIO_HOST", "http://192.168.1.20:4321");
  router_test::SetEnv("GEMINI_ENABLED", "true");
  router_test::SetEnv("ROUTER_LOG_DIR", "/tmp/router-logs");
  router::ApplyEnvOverrides(&*cfg);
  router_test::UnsetEnv("ROUTER_LISTEN_PORT");
  router_test::UnsetEnv("LMSTUDIO_HOST");
  router_test::UnsetEnv("GEMINI_ENABLED");
  router_test::UnsetEnv("ROUTER_LOG_DIR");

  EXPECT_EQ(cfg->listen.port, 7070);
  EXPECT_EQ(cfg->FindProvider("lmstudio")->endpoint.host, "192.168.1.20");
  EXPECT_EQ(cfg->FindProvider("lmstudio")->endpoint.port, 4321);
  EXPECT_TRUE(cfg->FindProvider("gemini")->enabled);
  EXPECT_EQ(cfg->logging.error_log, "/tmp/router-logs/router-errors.log");
}

}  // namespace
