#pragma once

#include "config.hpp"
#include "http_transport.hpp"

#include <chrono>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace router_test {

inline void SetEnv(const char* name, const char* value) {
#ifdef _WIN32
  _putenv_s(name, value);
#else
  setenv(name, value, 1);
#endif
}

inline void UnsetEnv(const char* name) {
#ifdef _WIN32
  _putenv_s(name, "");
#else
  unsetenv(name);
#endif
}

// Scripted transport: replies are consumed in order; an entry without a
// reply simulates a connection failure.
class FakeTransport : public router::HttpTransport {
 public:
  struct Call {
    std::string method;
    std::string host;
    int port = 0;
    std::string path;
    std::string body;
    router::RequestHeaderList headers;
    router::HttpTimeouts timeouts;
  };

  void PushReply(int status, std::string body) {
    std::lock_guard<std::mutex> lock(mu_);
    router::HttpReply r;
    r.status = status;
    r.body = std::move(body);
    script_.push_back(r);
  }

  void PushFailure() {
    std::lock_guard<std::mutex> lock(mu_);
    script_.push_back(std::nullopt);
  }

  std::optional<router::HttpReply> Get(const router::HttpEndpoint& ep,
                                       const std::string& path,
                                       const router::RequestHeaderList& headers,
                                       const router::HttpTimeouts& timeouts,
                                       std::string* err) override {
    return Next("GET", ep, path, {}, headers, timeouts, err);
  }

  std::optional<router::HttpReply> Post(const router::HttpEndpoint& ep,
                                        const std::string& path,
                                        const std::string& body,
                                        const router::RequestHeaderList& headers,
                                        const router::HttpTimeouts& timeouts,
                                        std::string* err) override {
    return Next("POST", ep, path, body, headers, timeouts, err);
  }

  std::vector<Call> Calls() const {
    std::lock_guard<std::mutex> lock(mu_);
    return calls_;
  }

 private:
  std::optional<router::HttpReply> Next(const std::string& method,
                                        const router::HttpEndpoint& ep,
                                        const std::string& path,
                                        const std::string& body,
                                        const router::RequestHeaderList& headers,
                                        const router::HttpTimeouts& timeouts,
                                        std::string* err) {
    std::lock_guard<std::mutex> lock(mu_);
    calls_.push_back(Call{method, ep.host, ep.port, path, body, headers, timeouts});
    if (script_.empty()) {
      if (err) *err = "connection refused";
      return std::nullopt;
    }
    auto next = script_.front();
    script_.pop_front();
    if (!next && err) *err = "connection refused";
    return next;
  }

  mutable std::mutex mu_;
  std::deque<std::optional<router::HttpReply>> script_;
  std::vector<Call> calls_;
};

class TempDir {
 public:
  TempDir() {
    std::random_device rd;
    std::ostringstream name;
    name << "llm_router_test_" << std::hex << rd() << rd();
    path_ = std::filesystem::temp_directory_path() / name.str();
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  std::string File(const std::string& name) const { return (path_ / name).string(); }
  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

inline void WriteFile(const std::string& path, const std::string& content) {
  std::ofstream out(path, std::ios::trunc);
  out << content;
}

inline std::vector<std::string> ReadLines(const std::string& path) {
  std::vector<std::string> out;
  std::ifstream in(path);
  std::string line;
  while (std::getline(in, line)) out.push_back(line);
  return out;
}

inline std::string CompletionJson(const std::string& content, int prompt_tokens = 10, int completion_tokens = 5,
                                  const std::string& model = "upstream-model") {
  std::ostringstream os;
  os << R"({"id":"chatcmpl-up","model":")" << model << R"(","choices":[{"index":0,"message":{"role":"assistant","content":")"
     << content << R"("},"finish_reason":"stop"}],"usage":{"prompt_tokens":)" << prompt_tokens
     << R"(,"completion_tokens":)" << completion_tokens << "}}";
  return os.str();
}

// Three providers and a code/chat chain: openrouter (paid), lmstudio (local),
// anthropic (placeholder). Logs and memory live under dir.
inline router::RouterConfig MakeTestConfig(const TempDir& dir) {
  router::RouterConfig cfg;

  router::ProviderConfig openrouter;
  openrouter.name = "openrouter";
  openrouter.kind = router::ProviderKind::kAggregator;
  openrouter.endpoint = router::ParseHttpEndpoint("https://openrouter.example/api", 443);
  openrouter.has_endpoint = true;
  openrouter.tiers["cheap"].default_model = "or-cheap";
  openrouter.tiers["strong"].default_model = "or-strong";
  openrouter.api_key_env = "ROUTER_TEST_OPENROUTER_KEY";
  openrouter.timeout_seconds = 60;
  cfg.providers["openrouter"] = openrouter;

  router::ProviderConfig lmstudio;
  lmstudio.name = "lmstudio";
  lmstudio.kind = router::ProviderKind::kLocal;
  lmstudio.endpoint = router::ParseHttpEndpoint("http://127.0.0.1:1234", 80);
  lmstudio.has_endpoint = true;
  lmstudio.tiers["local"].default_model = "auto";
  lmstudio.discovery = "lmstudio";
  lmstudio.timeout_seconds = 120;
  cfg.providers["lmstudio"] = lmstudio;

  router::ProviderConfig anthropic;
  anthropic.name = "anthropic";
  anthropic.kind = router::ProviderKind::kPlaceholder;
  anthropic.tiers["strong"].default_model = "claude-placeholder";
  anthropic.timeout_seconds = 60;
  cfg.providers["anthropic"] = anthropic;

  cfg.routing.intent_keywords = {{router::Intent::kCode, {"code", "function", "bug"}},
                                 {router::Intent::kReasoning, {"prove", "why"}}};
  cfg.routing.fallback_chain[router::Intent::kCode] = {{"openrouter", "strong"}, {"anthropic", "strong"}};
  cfg.routing.fallback_chain[router::Intent::kChat] = {{"openrouter", "cheap"}, {"lmstudio", "local"}};
  cfg.routing.fallback_chain[router::Intent::kReasoning] = {{"anthropic", "strong"}};

  cfg.budget.daily_cap_per_provider_usd = 2.0;
  cfg.budget.monthly_cap_per_provider_usd = 60.0;
  cfg.budget.fallback_cost_per_1k_usd = 0.5;
  cfg.budget.default_completion_tokens = 512;

  cfg.token_priorities[router::Priority::kNormal] = router::TokenLimits{6000, 10000};

  cfg.memory.pins_file = dir.File("pins.md");
  cfg.memory.summaries_dir = dir.File("summaries");
  cfg.logging.request_log = dir.File("logs/router-requests.log");
  cfg.logging.error_log = dir.File("logs/router-errors.log");
  cfg.logging.context_log = dir.File("logs/router-context.log");
  cfg.telemetry.store_path = dir.File("data/command_center.db");
  cfg.telemetry.url = "http://127.0.0.1:3000/api/routing";
  return cfg;
}

inline router::ChatRequest UserRequest(const std::string& text) {
  router::ChatRequest req;
  req.model = "router";
  req.messages.push_back(router::ChatMessage{"user", text});
  return req;
}

}  // namespace router_test
