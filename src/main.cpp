#include "budget_manager.hpp"
#include "config.hpp"
#include "context_builder.hpp"
#include "http_transport.hpp"
#include "observability.hpp"
#include "openai_router.hpp"
#include "orchestrator.hpp"
#include "provider_dispatcher.hpp"
#include "providers/registry.hpp"
#include "router_logs.hpp"
#include "telemetry.hpp"
#include "token_estimator.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace {

static void LogStartup(const router::RouterConfig& cfg) {
  std::cout << "[config] listen=" << cfg.listen.host << ":" << cfg.listen.port
            << " default_priority=" << router::PriorityName(cfg.routing.default_priority)
            << " telemetry=" << (cfg.telemetry.enabled ? cfg.telemetry.url : std::string("disabled")) << "\n";
  for (const auto& [name, pc] : cfg.providers) {
    std::cout << "[config] provider=" << name << " kind=" << router::ProviderKindName(pc.kind)
              << " enabled=" << (pc.enabled ? 1 : 0);
    if (pc.has_endpoint) std::cout << " endpoint=" << router::EndpointUrl(pc.endpoint);
    std::cout << " tiers=" << pc.tiers.size() << "\n";
  }
}

}  // namespace

int main() {
  std::cout.setf(std::ios::unitbuf);

  std::string err;
  auto loaded = router::LoadConfigFromEnv(&err);
  if (!loaded) {
    std::cerr << "[config] " << err << "\n";
    return 1;
  }
  const router::RouterConfig cfg = std::move(*loaded);
  LogStartup(cfg);

  router::HttplibTransport transport;
  router::RouterLogs logs(cfg.logging);
  router::BudgetManager budget(cfg);
  router::ContextBuilder context(cfg, &logs, std::make_shared<router::CharRatioTokenEstimator>());
  router::ProviderRegistry registry(cfg, &transport, router::RealSleeper());
  router::ExecutionTracker tracker;
  router::ProviderDispatcher dispatcher(&registry, &tracker);
  router::FallbackTelemetrySink telemetry(std::make_unique<router::HttpTelemetrySink>(cfg.telemetry, &transport),
                                          std::make_unique<router::SqliteTelemetryStore>(cfg.telemetry.store_path),
                                          cfg.telemetry.enabled);
  router::ChatOrchestrator orchestrator(cfg, &budget, &context, &dispatcher, &logs, &telemetry);
  router::OpenAiRouter api(&orchestrator, &budget, &registry, &tracker, &logs);

  httplib::Server server;
  api.Register(&server);

  server.set_exception_handler([&logs](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "unknown exception";
    if (ep) {
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception& e) {
        message = e.what();
      } catch (...) {
        message = "non-standard exception";
      }
    }
    logs.AppendError(message, {{"path", req.path}, {"method", req.method}});
    nlohmann::json j;
    j["error"] = {{"message", "Internal router error"}, {"type", "server_error"}, {"param", nullptr}, {"code", nullptr}};
    res.status = 500;
    res.set_content(j.dump(), "application/json");
  });

  server.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (!res.body.empty()) return;
    std::string message;
    std::string type = "invalid_request_error";
    if (res.status == 404) {
      message = "not found";
    } else if (res.status >= 500) {
      message = "Internal router error";
      type = "server_error";
    } else {
      message = "bad request";
    }
    nlohmann::json j;
    j["error"] = {{"message", message}, {"type", type}, {"param", nullptr}, {"code", nullptr}};
    res.set_content(j.dump(), "application/json");
  });

  server.set_keep_alive_timeout(5);
  server.set_read_timeout(60);
  server.set_write_timeout(60);

  std::cout << "[http] listen host=" << cfg.listen.host << " port=" << cfg.listen.port << "\n";
  const bool ok = server.listen(cfg.listen.host, cfg.listen.port);
  std::cout << "[http] listen returned ok=" << (ok ? 1 : 0) << "\n";
  return ok ? 0 : 1;
}
