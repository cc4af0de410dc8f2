#pragma once

#include "config.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace router {

enum class LogKind { kRequests, kErrors, kContext };

std::optional<LogKind> ParseLogKind(const std::string& s);
// strftime over the UTC calendar time of tp.
std::string FormatUtc(std::chrono::system_clock::time_point tp, const char* fmt);
std::string IsoTimestampUtc(std::chrono::system_clock::time_point tp);

// Three append-only JSON-lines files tailed by the dashboard. Write failures
// are reported on stdout and otherwise ignored.
class RouterLogs {
 public:
  explicit RouterLogs(LoggingConfig cfg);

  void AppendRequest(nlohmann::json record);
  void AppendError(const std::string& message, const nlohmann::json& context = nlohmann::json::object());
  void AppendContext(nlohmann::json info);

  std::vector<std::string> Tail(LogKind kind, int limit) const;
  const std::string& PathFor(LogKind kind) const;

 private:
  void Append(const std::string& path, const nlohmann::json& record);

  LoggingConfig cfg_;
  mutable std::mutex mu_;
};

}  // namespace router
