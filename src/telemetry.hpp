#pragma once

#include "config.hpp"
#include "http_transport.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace router {

struct TelemetryRecord {
  std::string provider;
  std::string model_name;
  std::string actual_model;
  std::string agent_name;
  int tokens_in = 0;
  int tokens_out = 0;
  double cost_usd = 0.0;
  int64_t latency_ms = 0;

  nlohmann::json ToJson() const;
};

// lmstudio and ollama report as "local" so the dashboard groups them.
std::string NormalizeTelemetryProvider(const std::string& provider);

class TelemetrySink {
 public:
  virtual ~TelemetrySink() = default;
  // Returns false (with *err set) when the record was not accepted.
  virtual bool Send(const TelemetryRecord& rec, std::string* err) = 0;
};

class HttpTelemetrySink : public TelemetrySink {
 public:
  HttpTelemetrySink(const TelemetryConfig& cfg, HttpTransport* transport);
  bool Send(const TelemetryRecord& rec, std::string* err) override;

 private:
  HttpEndpoint endpoint_;
  std::string path_;
  int timeout_seconds_;
  HttpTransport* transport_;
};

// Writes straight into the dashboard's SQLite database: one routing_calls row
// per record, plus the monthly budget total for the provider. The tables are
// created when missing so a fresh file is usable before the dashboard starts.
class SqliteTelemetryStore : public TelemetrySink {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;

  explicit SqliteTelemetryStore(std::string path, Clock clock = {});
  bool Send(const TelemetryRecord& rec, std::string* err) override;
  const std::string& Path() const { return path_; }

  static constexpr int kBusyTimeoutMs = 3000;

 private:
  std::string path_;
  Clock clock_;
  std::mutex mu_;
};

class FallbackTelemetrySink {
 public:
  FallbackTelemetrySink(std::unique_ptr<TelemetrySink> primary, std::unique_ptr<TelemetrySink> fallback, bool enabled = true);

  // Never throws. Failures of both tiers end in a console line.
  void Emit(const TelemetryRecord& rec) noexcept;

 private:
  std::unique_ptr<TelemetrySink> primary_;
  std::unique_ptr<TelemetrySink> fallback_;
  bool enabled_;
};

}  // namespace router
