#include "openai_router.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <iostream>
#include <string>

namespace router {
namespace {

static void SendJson(httplib::Response* res, int status, const nlohmann::json& body) {
  res->status = status;
  res->set_content(body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
}

static void SendOutcome(httplib::Response* res, const ChatOutcome& outcome) {
  SendJson(res, outcome.http_status, outcome.body);
}

static ChatOutcome BadRequest(const std::string& message) {
  ChatOutcome out;
  out.http_status = 400;
  out.body = MakeErrorBody(message, "invalid_request_error");
  return out;
}

static bool ParseLimit(const std::string& s, int* out) {
  if (s.empty() || s.size() > 6) return false;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  *out = std::stoi(s);
  return true;
}

static void LogRequestLine(const httplib::Request& req) {
  std::cout << "[http] " << req.method << " " << req.path << " from=" << req.remote_addr << "\n";
}

}  // namespace

OpenAiRouter::OpenAiRouter(ChatOrchestrator* orchestrator,
                           BudgetManager* budget,
                           ProviderRegistry* registry,
                           ExecutionTracker* tracker,
                           RouterLogs* logs)
    : orchestrator_(orchestrator),
      budget_(budget),
      registry_(registry),
      tracker_(tracker),
      logs_(logs),
      started_(std::chrono::steady_clock::now()) {}

ChatOutcome OpenAiRouter::HandleChatCompletions(const std::string& body) {
  auto j = nlohmann::json::parse(body, nullptr, false);
  std::string err;
  auto req = ParseChatRequest(j, &err);
  if (!req) return BadRequest(err);
  return orchestrator_->Handle(*req);
}

ChatOutcome OpenAiRouter::HandleHealth() {
  nlohmann::json j;
  j["status"] = "ok";
  j["uptime_seconds"] =
      std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started_).count();

  nlohmann::json providers = nlohmann::json::object();
  for (const auto& [name, s] : budget_->Snapshot()) {
    providers[name] = {{"enabled", s.enabled},
                       {"daily_cost_estimate", s.daily_cost_estimate},
                       {"monthly_cost_estimate", s.monthly_cost_estimate},
                       {"pending_estimate", s.pending_estimate},
                       {"daily_calls", s.daily_calls},
                       {"daily_cap", s.daily_cap},
                       {"monthly_cap", s.monthly_cap}};
  }
  j["providers"] = std::move(providers);

  for (auto* local : registry_->LocalBackends()) {
    j[local->Name() + "_status"] = local->Probe();
  }

  auto last = tracker_->Last();
  j["last_execution"] = last ? last->ToJson() : nlohmann::json(nullptr);

  ChatOutcome out;
  out.body = std::move(j);
  return out;
}

ChatOutcome OpenAiRouter::HandleLogs(const std::string& type, const std::string& limit) {
  const std::string kind_name = type.empty() ? "requests" : type;
  auto kind = ParseLogKind(kind_name);
  if (!kind) return BadRequest("type must be one of: requests, errors, context");

  int n = kDefaultLogLimit;
  if (!limit.empty() && (!ParseLimit(limit, &n) || n < 1 || n > kMaxLogLimit)) {
    return BadRequest("limit must be an integer between 1 and " + std::to_string(kMaxLogLimit));
  }

  ChatOutcome out;
  out.body["type"] = kind_name;
  out.body["lines"] = logs_->Tail(*kind, n);
  return out;
}

void OpenAiRouter::Register(httplib::Server* server) {
  server->Post("/v1/chat/completions", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequestLine(req);
    SendOutcome(&res, HandleChatCompletions(req.body));
  });

  auto health = [this](const httplib::Request& req, httplib::Response& res) {
    LogRequestLine(req);
    SendOutcome(&res, HandleHealth());
  };
  server->Get("/health", health);
  server->Get("/ui/health", health);

  server->Get("/ui/logs", [this](const httplib::Request& req, httplib::Response& res) {
    const auto type = req.has_param("type") ? req.get_param_value("type") : std::string();
    const auto limit = req.has_param("limit") ? req.get_param_value("limit") : std::string();
    SendOutcome(&res, HandleLogs(type, limit));
  });
}

}  // namespace router
