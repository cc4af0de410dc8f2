#include "context_builder.hpp"

#include "router_logs.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <utility>

namespace router {
namespace {

constexpr const char* kPinnedPrefix = "Pinned context:\n";

static std::string TrimAscii(std::string s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r' || s.front() == '\n')) {
    s.erase(s.begin());
  }
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) {
    s.pop_back();
  }
  return s;
}

static std::string JoinLines(const std::vector<std::string>& lines) {
  std::string out;
  for (size_t i = 0; i < lines.size(); i++) {
    if (i) out.push_back('\n');
    out += lines[i];
  }
  return out;
}

}  // namespace

nlohmann::json ContextInfo::ToJson() const {
  nlohmann::json j;
  j["method"] = method;
  j["priority"] = PriorityName(priority);
  j["estimated_prompt_tokens_before"] = tokens_before;
  j["estimated_prompt_tokens"] = tokens_after;
  j["target_input_tokens"] = target_input_tokens;
  j["hard_max_input_tokens"] = hard_max_input_tokens;
  j["pinned_included"] = pinned_included;
  j["summarized"] = summarized;
  j["dropped_messages"] = dropped_messages;
  j["estimator"] = estimator;
  return j;
}

SummaryOutcome KeepSummarizer::Summarize(std::vector<ChatMessage> messages,
                                         const TokenLimits&,
                                         const std::string&) {
  SummaryOutcome out;
  out.messages = std::move(messages);
  out.method = "keep";
  out.summarized = false;
  return out;
}

std::vector<std::string> LoadPins(const std::string& pins_file) {
  std::vector<std::string> out;
  if (pins_file.empty()) return out;
  std::error_code ec;
  if (!std::filesystem::exists(pins_file, ec)) return out;
  std::ifstream in(pins_file);
  if (!in) return out;
  std::string line;
  while (std::getline(in, line)) {
    auto t = TrimAscii(line);
    if (!t.empty()) out.push_back(std::move(t));
  }
  return out;
}

bool IsProtectedMessage(const ChatMessage& m) {
  return m.role == "system";
}

ContextBuilder::ContextBuilder(const RouterConfig& cfg,
                               RouterLogs* logs,
                               std::shared_ptr<const TokenEstimator> estimator,
                               std::shared_ptr<ContextSummarizer> summarizer)
    : cfg_(cfg), logs_(logs), estimator_(std::move(estimator)), summarizer_(std::move(summarizer)) {
  if (!estimator_) estimator_ = std::make_shared<CharRatioTokenEstimator>();
  if (!summarizer_) summarizer_ = std::make_shared<KeepSummarizer>();
}

std::string ContextBuilder::SummaryNotePath() const {
  const auto day = IsoTimestampUtc(std::chrono::system_clock::now()).substr(0, 10);
  return (std::filesystem::path(cfg_.memory.summaries_dir) / (day + ".md")).string();
}

ContextResult ContextBuilder::BuildOrThrow(const ChatRequest& req, Priority priority) const {
  const auto limits = cfg_.LimitsFor(priority);

  ContextResult out;
  out.info.priority = priority;
  out.info.target_input_tokens = limits.target_input_tokens;
  out.info.hard_max_input_tokens = limits.hard_max_input_tokens;
  out.info.estimator = estimator_->Name();

  std::vector<ChatMessage> messages = req.messages;
  const auto pins = LoadPins(cfg_.memory.pins_file);
  if (!pins.empty()) {
    const std::string pinned = kPinnedPrefix + JoinLines(pins);
    const bool already_pinned = std::any_of(messages.begin(), messages.end(), [&](const ChatMessage& m) {
      return m.role == "system" && m.content == pinned;
    });
    if (!already_pinned) messages.insert(messages.begin(), ChatMessage{"system", pinned});
    out.info.pinned_included = true;
  }

  out.info.tokens_before = estimator_->Estimate(messages);

  int tokens = out.info.tokens_before;
  while (tokens > limits.hard_max_input_tokens) {
    auto it = std::find_if(messages.begin(), messages.end(), [](const ChatMessage& m) { return !IsProtectedMessage(m); });
    if (it == messages.end()) break;
    messages.erase(it);
    out.info.dropped_messages++;
    tokens = estimator_->Estimate(messages);
  }

  if (tokens > limits.target_input_tokens) {
    std::error_code ec;
    std::filesystem::create_directories(cfg_.memory.summaries_dir, ec);
    auto summary = summarizer_->Summarize(std::move(messages), limits, SummaryNotePath());
    messages = std::move(summary.messages);
    out.info.method = summary.method;
    out.info.summarized = summary.summarized;
  }

  out.info.tokens_after = estimator_->Estimate(messages);
  out.messages = std::move(messages);
  return out;
}

ContextResult ContextBuilder::Build(const ChatRequest& req, Priority priority) const {
  ContextResult out;
  try {
    out = BuildOrThrow(req, priority);
  } catch (const std::exception& e) {
    std::cout << "[context] build failed, keeping original messages: " << e.what() << "\n";
    if (logs_) logs_->AppendError(std::string("context build failed: ") + e.what(), {{"stage", "build_context"}});
    const auto limits = cfg_.LimitsFor(priority);
    out = ContextResult{};
    out.messages = req.messages;
    out.info.priority = priority;
    out.info.target_input_tokens = limits.target_input_tokens;
    out.info.hard_max_input_tokens = limits.hard_max_input_tokens;
    // The configured estimator may be what failed.
    const CharRatioTokenEstimator fallback;
    out.info.estimator = fallback.Name();
    out.info.tokens_before = fallback.Estimate(out.messages);
    out.info.tokens_after = out.info.tokens_before;
    out.info.method = "error";
  }
  if (logs_) logs_->AppendContext(out.info.ToJson());
  return out;
}

}  // namespace router
