#include "observability.hpp"

#include "router_logs.hpp"

#include <chrono>

namespace router {

nlohmann::json ExecutionRecord::ToJson() const {
  return {{"target", target}, {"host", host}, {"mode", mode}, {"timestamp", timestamp}, {"timestamp_unix", timestamp_unix}};
}

ExecutionRecord ExecutionTracker::Record(const std::string& target, const std::string& host, const std::string& mode) {
  const auto now = std::chrono::system_clock::now();
  ExecutionRecord rec;
  rec.target = target;
  rec.host = host;
  rec.mode = mode;
  rec.timestamp = IsoTimestampUtc(now);
  rec.timestamp_unix = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
  std::lock_guard<std::mutex> lock(mu_);
  last_ = rec;
  return rec;
}

std::optional<ExecutionRecord> ExecutionTracker::Last() const {
  std::lock_guard<std::mutex> lock(mu_);
  return last_;
}

}  // namespace router
