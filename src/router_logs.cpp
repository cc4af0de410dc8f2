#include "router_logs.hpp"

#include <ctime>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <utility>

namespace router {

std::optional<LogKind> ParseLogKind(const std::string& s) {
  if (s == "requests") return LogKind::kRequests;
  if (s == "errors") return LogKind::kErrors;
  if (s == "context") return LogKind::kContext;
  return std::nullopt;
}

std::string FormatUtc(std::chrono::system_clock::time_point tp, const char* fmt) {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  char buf[64];
  const size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
  return std::string(buf, n);
}

std::string IsoTimestampUtc(std::chrono::system_clock::time_point tp) {
  return FormatUtc(tp, "%Y-%m-%dT%H:%M:%SZ");
}

RouterLogs::RouterLogs(LoggingConfig cfg) : cfg_(std::move(cfg)) {}

const std::string& RouterLogs::PathFor(LogKind kind) const {
  switch (kind) {
    case LogKind::kRequests:
      return cfg_.request_log;
    case LogKind::kErrors:
      return cfg_.error_log;
    case LogKind::kContext:
      return cfg_.context_log;
  }
  return cfg_.request_log;
}

void RouterLogs::Append(const std::string& path, const nlohmann::json& record) {
  std::lock_guard<std::mutex> lock(mu_);
  std::error_code ec;
  auto dir = std::filesystem::path(path).parent_path();
  if (!dir.empty()) std::filesystem::create_directories(dir, ec);
  std::ofstream out(path, std::ios::app);
  if (!out) {
    std::cout << "[logs] append failed path=" << path << "\n";
    return;
  }
  out << record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

void RouterLogs::AppendRequest(nlohmann::json record) {
  if (!record.contains("ts")) record["ts"] = IsoTimestampUtc(std::chrono::system_clock::now());
  Append(cfg_.request_log, record);
}

void RouterLogs::AppendError(const std::string& message, const nlohmann::json& context) {
  std::cout << "[error] " << message;
  if (context.is_object() && !context.empty()) {
    std::cout << " " << context.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  }
  std::cout << "\n";
  nlohmann::json record;
  record["ts"] = IsoTimestampUtc(std::chrono::system_clock::now());
  record["error"] = message;
  if (context.is_object() && !context.empty()) record["extra"] = context;
  Append(cfg_.error_log, record);
}

void RouterLogs::AppendContext(nlohmann::json info) {
  if (!info.contains("ts")) info["ts"] = IsoTimestampUtc(std::chrono::system_clock::now());
  Append(cfg_.context_log, info);
}

std::vector<std::string> RouterLogs::Tail(LogKind kind, int limit) const {
  std::vector<std::string> out;
  if (limit <= 0) return out;
  std::lock_guard<std::mutex> lock(mu_);
  std::ifstream in(PathFor(kind));
  if (!in) return out;
  std::deque<std::string> window;
  std::string line;
  while (std::getline(in, line)) {
    window.push_back(std::move(line));
    if (static_cast<int>(window.size()) > limit) window.pop_front();
  }
  out.assign(window.begin(), window.end());
  return out;
}

}  // namespace router
