#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace router {

struct ExecutionRecord {
  std::string target;
  std::string host;
  std::string mode;
  std::string timestamp;
  int64_t timestamp_unix = 0;

  nlohmann::json ToJson() const;
};

// Where the most recent completion actually ran. Read by /health.
class ExecutionTracker {
 public:
  ExecutionRecord Record(const std::string& target, const std::string& host, const std::string& mode);
  std::optional<ExecutionRecord> Last() const;

 private:
  mutable std::mutex mu_;
  std::optional<ExecutionRecord> last_;
};

}  // namespace router
