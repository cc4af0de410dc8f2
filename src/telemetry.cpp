#include "telemetry.hpp"

#include "router_logs.hpp"

#include <sqlite3.h>

#include <exception>
#include <filesystem>
#include <iostream>
#include <utility>

namespace router {
namespace {

// Same DDL as the dashboard's own schema, so either side may create it.
constexpr const char* kSchemaSql =
    "CREATE TABLE IF NOT EXISTS routing_calls ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " timestamp TIMESTAMP DEFAULT CURRENT_TIMESTAMP,"
    " provider TEXT NOT NULL,"
    " model_name TEXT,"
    " actual_model TEXT,"
    " agent_name TEXT DEFAULT 'unknown',"
    " tokens_in INTEGER DEFAULT 0,"
    " tokens_out INTEGER DEFAULT 0,"
    " cost_usd REAL DEFAULT 0.0,"
    " latency_ms INTEGER DEFAULT 0);"
    "CREATE TABLE IF NOT EXISTS budget ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " period_start DATE NOT NULL,"
    " provider TEXT NOT NULL,"
    " total_spent REAL DEFAULT 0.0,"
    " UNIQUE(period_start, provider));";

constexpr const char* kInsertCallSql =
    "INSERT INTO routing_calls (timestamp, provider, model_name, actual_model, agent_name,"
    " tokens_in, tokens_out, cost_usd, latency_ms) VALUES (?,?,?,?,?,?,?,?,?)";

constexpr const char* kUpsertBudgetSql =
    "INSERT INTO budget (period_start, provider, total_spent) VALUES (?,?,?)"
    " ON CONFLICT(period_start, provider) DO UPDATE SET"
    " total_spent = total_spent + excluded.total_spent";

struct DbCloser {
  void operator()(sqlite3* db) const { sqlite3_close(db); }
};
struct StmtFinalizer {
  void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using DbPtr = std::unique_ptr<sqlite3, DbCloser>;
using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtFinalizer>;

static bool Fail(sqlite3* db, const std::string& what, std::string* err) {
  if (err) *err = "telemetry store: " + what + ": " + (db ? sqlite3_errmsg(db) : "out of memory");
  return false;
}

static bool Exec(sqlite3* db, const char* sql, std::string* err) {
  char* msg = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &msg) == SQLITE_OK) return true;
  if (err) *err = std::string("telemetry store: ") + (msg ? msg : "exec failed");
  sqlite3_free(msg);
  return false;
}

static StmtPtr Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
    sqlite3_finalize(raw);
    return nullptr;
  }
  return StmtPtr(raw);
}

static void BindText(sqlite3_stmt* stmt, int idx, const std::string& v) {
  sqlite3_bind_text(stmt, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
}

}  // namespace

nlohmann::json TelemetryRecord::ToJson() const {
  return {{"provider", provider},     {"model_name", model_name}, {"actual_model", actual_model},
          {"agent_name", agent_name}, {"tokens_in", tokens_in},   {"tokens_out", tokens_out},
          {"cost_usd", cost_usd},     {"latency_ms", latency_ms}};
}

std::string NormalizeTelemetryProvider(const std::string& provider) {
  if (provider == "lmstudio" || provider == "ollama") return "local";
  return provider;
}

HttpTelemetrySink::HttpTelemetrySink(const TelemetryConfig& cfg, HttpTransport* transport)
    : timeout_seconds_(cfg.timeout_seconds), transport_(transport) {
  endpoint_ = ParseHttpEndpoint(cfg.url, cfg.url.rfind("https://", 0) == 0 ? 443 : 80);
  // The whole URL path is the POST target.
  path_ = endpoint_.base_path.empty() ? "/" : endpoint_.base_path;
  endpoint_.base_path.clear();
}

bool HttpTelemetrySink::Send(const TelemetryRecord& rec, std::string* err) {
  HttpTimeouts timeouts;
  timeouts.connect_seconds = timeout_seconds_;
  timeouts.read_seconds = timeout_seconds_;
  timeouts.write_seconds = timeout_seconds_;
  auto reply = transport_->Post(endpoint_, path_, rec.ToJson().dump(), {}, timeouts, err);
  if (!reply) return false;
  if (reply->status < 200 || reply->status >= 300) {
    if (err) *err = "telemetry: http " + std::to_string(reply->status);
    return false;
  }
  return true;
}

SqliteTelemetryStore::SqliteTelemetryStore(std::string path, Clock clock)
    : path_(std::move(path)), clock_(std::move(clock)) {
  if (!clock_) clock_ = [] { return std::chrono::system_clock::now(); };
}

bool SqliteTelemetryStore::Send(const TelemetryRecord& rec, std::string* err) {
  const auto now = clock_();
  const auto ts = IsoTimestampUtc(now);
  const auto period_start = FormatUtc(now, "%Y-%m-01");

  std::lock_guard<std::mutex> lock(mu_);
  std::error_code ec;
  auto dir = std::filesystem::path(path_).parent_path();
  if (!dir.empty()) std::filesystem::create_directories(dir, ec);

  sqlite3* raw = nullptr;
  const int rc = sqlite3_open_v2(path_.c_str(), &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
  DbPtr db(raw);
  if (rc != SQLITE_OK) return Fail(db.get(), "cannot open " + path_, err);
  sqlite3_busy_timeout(db.get(), kBusyTimeoutMs);

  if (!Exec(db.get(), kSchemaSql, err)) return false;
  // An early return closes the connection, which rolls the transaction back.
  if (!Exec(db.get(), "BEGIN IMMEDIATE", err)) return false;

  auto call = Prepare(db.get(), kInsertCallSql);
  if (!call) return Fail(db.get(), "prepare routing_calls", err);
  BindText(call.get(), 1, ts);
  BindText(call.get(), 2, rec.provider);
  BindText(call.get(), 3, rec.model_name);
  BindText(call.get(), 4, rec.actual_model);
  BindText(call.get(), 5, rec.agent_name);
  sqlite3_bind_int(call.get(), 6, rec.tokens_in);
  sqlite3_bind_int(call.get(), 7, rec.tokens_out);
  sqlite3_bind_double(call.get(), 8, rec.cost_usd);
  sqlite3_bind_int64(call.get(), 9, rec.latency_ms);
  if (sqlite3_step(call.get()) != SQLITE_DONE) return Fail(db.get(), "insert routing_calls", err);

  auto budget = Prepare(db.get(), kUpsertBudgetSql);
  if (!budget) return Fail(db.get(), "prepare budget", err);
  BindText(budget.get(), 1, period_start);
  BindText(budget.get(), 2, rec.provider);
  sqlite3_bind_double(budget.get(), 3, rec.cost_usd);
  if (sqlite3_step(budget.get()) != SQLITE_DONE) return Fail(db.get(), "upsert budget", err);

  return Exec(db.get(), "COMMIT", err);
}

FallbackTelemetrySink::FallbackTelemetrySink(std::unique_ptr<TelemetrySink> primary,
                                             std::unique_ptr<TelemetrySink> fallback,
                                             bool enabled)
    : primary_(std::move(primary)), fallback_(std::move(fallback)), enabled_(enabled) {}

void FallbackTelemetrySink::Emit(const TelemetryRecord& rec) noexcept {
  if (!enabled_) return;
  try {
    std::string err;
    if (primary_ && primary_->Send(rec, &err)) return;
    std::cout << "[telemetry] primary failed: " << err << "\n";
    std::string store_err;
    if (fallback_ && fallback_->Send(rec, &store_err)) return;
    std::cout << "[telemetry] fallback failed: " << store_err << "\n";
  } catch (const std::exception& e) {
    std::cout << "[telemetry] dropped record: " << e.what() << "\n";
  }
}

}  // namespace router
