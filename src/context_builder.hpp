#pragma once

#include "chat_request.hpp"
#include "config.hpp"
#include "token_estimator.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace router {

class RouterLogs;

struct ContextInfo {
  int tokens_before = 0;
  int tokens_after = 0;
  int target_input_tokens = 0;
  int hard_max_input_tokens = 0;
  Priority priority = Priority::kNormal;
  bool pinned_included = false;
  bool summarized = false;
  std::string method = "keep";
  int dropped_messages = 0;
  std::string estimator;

  nlohmann::json ToJson() const;
};

struct ContextResult {
  std::vector<ChatMessage> messages;
  ContextInfo info;
};

struct SummaryOutcome {
  std::vector<ChatMessage> messages;
  std::string method = "keep";
  bool summarized = false;
};

// Invoked when trimmed context still exceeds the target budget. An
// implementation may fold older non-system turns into one system message and
// write the summary to note_path.
class ContextSummarizer {
 public:
  virtual ~ContextSummarizer() = default;
  virtual SummaryOutcome Summarize(std::vector<ChatMessage> messages,
                                   const TokenLimits& limits,
                                   const std::string& note_path) = 0;
};

class KeepSummarizer : public ContextSummarizer {
 public:
  SummaryOutcome Summarize(std::vector<ChatMessage> messages,
                           const TokenLimits& limits,
                           const std::string& note_path) override;
};

std::vector<std::string> LoadPins(const std::string& pins_file);
bool IsProtectedMessage(const ChatMessage& m);

class ContextBuilder {
 public:
  ContextBuilder(const RouterConfig& cfg,
                 RouterLogs* logs,
                 std::shared_ptr<const TokenEstimator> estimator = nullptr,
                 std::shared_ptr<ContextSummarizer> summarizer = nullptr);

  ContextResult Build(const ChatRequest& req, Priority priority) const;
  const TokenEstimator& Estimator() const { return *estimator_; }

 private:
  ContextResult BuildOrThrow(const ChatRequest& req, Priority priority) const;
  std::string SummaryNotePath() const;

  const RouterConfig& cfg_;
  RouterLogs* logs_;
  std::shared_ptr<const TokenEstimator> estimator_;
  std::shared_ptr<ContextSummarizer> summarizer_;
};

}  // namespace router
