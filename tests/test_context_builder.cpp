#include "context_builder.hpp"
#include "router_logs.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace {

using router::ChatMessage;
using router::Priority;

// One token per message, so trimming arithmetic is easy to follow.
class CountingEstimator : public router::TokenEstimator {
 public:
  std::string Name() const override { return "per-message"; }
  int Estimate(const std::vector<ChatMessage>& messages) const override {
    return static_cast<int>(messages.size());
  }
};

class ThrowingEstimator : public router::TokenEstimator {
 public:
  std::string Name() const override { return "throwing"; }
  int Estimate(const std::vector<ChatMessage>& messages) const override {
    if (messages.size() > 1) throw std::runtime_error("tokenizer unavailable");
    return 1;
  }
};

class RecordingSummarizer : public router::ContextSummarizer {
 public:
  router::SummaryOutcome Summarize(std::vector<ChatMessage> messages,
                                   const router::TokenLimits&,
                                   const std::string& note_path) override {
    calls++;
    last_note_path = note_path;
    router::SummaryOutcome out;
    out.messages = std::move(messages);
    out.method = "recorded";
    out.summarized = true;
    return out;
  }

  int calls = 0;
  std::string last_note_path;
};

class ContextBuilderTest : public ::testing::Test {
 protected:
  ContextBuilderTest() : cfg_(router_test::MakeTestConfig(dir_)), logs_(cfg_.logging) {}

  router_test::TempDir dir_;
  router::RouterConfig cfg_;
  router::RouterLogs logs_;
};

TEST_F(ContextBuilderTest, EstimatorDividesJoinedLengthByFour) {
  router::CharRatioTokenEstimator est;
  EXPECT_EQ(est.Estimate({}), 1);
  EXPECT_EQ(est.Estimate({{"user", std::string(40, 'a')}}), 10);
  // 20 + 19 chars plus one joining newline.
  EXPECT_EQ(est.Estimate({{"user", std::string(20, 'a')}, {"assistant", std::string(19, 'b')}}), 10);
}

TEST_F(ContextBuilderTest, SmallHistoryIsUnchanged) {
  router::ContextBuilder builder(cfg_, &logs_);
  auto req = router_test::UserRequest("hello");
  auto result = builder.Build(req, Priority::kNormal);
  ASSERT_EQ(result.messages.size(), 1u);
  EXPECT_EQ(result.messages[0].content, "hello");
  EXPECT_EQ(result.info.dropped_messages, 0);
  EXPECT_FALSE(result.info.pinned_included);
  EXPECT_EQ(result.info.method, "keep");
  EXPECT_EQ(result.info.tokens_before, result.info.tokens_after);
  EXPECT_EQ(result.info.hard_max_input_tokens, 10000);
}

TEST_F(ContextBuilderTest, TrimsOldestUnprotectedUntilUnderHardMax) {
  // 12,000 estimated tokens against a hard max of 10,000.
  router::ContextBuilder builder(cfg_, &logs_);
  router::ChatRequest req;
  req.model = "router";
  req.messages.push_back({"system", "you are helpful"});
  for (int i = 0; i < 12; i++) {
    req.messages.push_back({i % 2 == 0 ? "user" : "assistant", std::string(3999, static_cast<char>('a' + i))});
  }
  auto result = builder.Build(req, Priority::kNormal);

  EXPECT_GE(result.info.tokens_before, 12000);
  EXPECT_LE(result.info.tokens_after, 10000);
  EXPECT_GT(result.info.dropped_messages, 0);
  ASSERT_FALSE(result.messages.empty());
  EXPECT_EQ(result.messages.front().role, "system");
  EXPECT_EQ(result.messages.front().content, "you are helpful");
  // The newest turn survives; the oldest does not.
  EXPECT_EQ(result.messages.back().content[0], static_cast<char>('a' + 11));
  EXPECT_NE(result.messages[1].content[0], 'a');
}

TEST_F(ContextBuilderTest, PinnedMessageIsPrependedAndKept) {
  router_test::WriteFile(cfg_.memory.pins_file, "\nAlways answer in English.\n  Prefer short replies.  \n");
  cfg_.token_priorities[Priority::kNormal] = router::TokenLimits{2, 3};
  router::ContextBuilder builder(cfg_, &logs_, std::make_shared<CountingEstimator>());

  router::ChatRequest req;
  for (int i = 0; i < 5; i++) req.messages.push_back({"user", "turn " + std::to_string(i)});
  auto result = builder.Build(req, Priority::kNormal);

  EXPECT_TRUE(result.info.pinned_included);
  ASSERT_EQ(result.messages.size(), 3u);
  EXPECT_EQ(result.messages[0].role, "system");
  EXPECT_EQ(result.messages[0].content, "Pinned context:\nAlways answer in English.\nPrefer short replies.");
  EXPECT_EQ(result.messages[2].content, "turn 4");
  EXPECT_EQ(result.info.dropped_messages, 3);
}

TEST_F(ContextBuilderTest, BuildingTwiceIsIdempotent) {
  router_test::WriteFile(cfg_.memory.pins_file, "pin one\n");
  router::ContextBuilder builder(cfg_, &logs_);
  auto req = router_test::UserRequest("hello");
  auto first = builder.Build(req, Priority::kNormal);

  router::ChatRequest again = req;
  again.messages = first.messages;
  auto second = builder.Build(again, Priority::kNormal);
  EXPECT_EQ(second.messages.size(), first.messages.size());
  EXPECT_EQ(second.info.tokens_after, first.info.tokens_after);
}

TEST_F(ContextBuilderTest, ProtectedMessagesSurviveWhenThemselvesOverHardMax) {
  router_test::WriteFile(cfg_.memory.pins_file, "pin one\n");
  cfg_.token_priorities[Priority::kNormal] = router::TokenLimits{2, 3};
  router::ContextBuilder builder(cfg_, &logs_, std::make_shared<CountingEstimator>());

  router::ChatRequest req;
  req.messages.push_back({"system", "rules"});
  req.messages.push_back({"user", "old question"});
  req.messages.push_back({"system", "style guide"});
  req.messages.push_back({"assistant", "old answer"});
  req.messages.push_back({"system", "persona"});
  req.messages.push_back({"user", "new question"});
  auto first = builder.Build(req, Priority::kNormal);

  // Pin plus three system messages is four tokens against a hard max of three.
  ASSERT_EQ(first.messages.size(), 4u);
  for (const auto& m : first.messages) EXPECT_EQ(m.role, "system");
  EXPECT_EQ(first.messages[1].content, "rules");
  EXPECT_EQ(first.messages[2].content, "style guide");
  EXPECT_EQ(first.messages[3].content, "persona");
  EXPECT_EQ(first.info.dropped_messages, 3);
  EXPECT_GT(first.info.tokens_after, first.info.hard_max_input_tokens);

  router::ChatRequest again = req;
  again.messages = first.messages;
  auto second = builder.Build(again, Priority::kNormal);
  ASSERT_EQ(second.messages.size(), first.messages.size());
  for (size_t i = 0; i < first.messages.size(); i++) {
    EXPECT_EQ(second.messages[i].role, first.messages[i].role);
    EXPECT_EQ(second.messages[i].content, first.messages[i].content);
  }
  EXPECT_EQ(second.info.dropped_messages, 0);
  EXPECT_EQ(second.info.tokens_after, first.info.tokens_after);
}

TEST_F(ContextBuilderTest, SummarizerRunsOnlyAboveTarget) {
  cfg_.token_priorities[Priority::kNormal] = router::TokenLimits{2, 10};
  auto summarizer = std::make_shared<RecordingSummarizer>();
  router::ContextBuilder builder(cfg_, &logs_, std::make_shared<CountingEstimator>(), summarizer);

  builder.Build(router_test::UserRequest("short"), Priority::kNormal);
  EXPECT_EQ(summarizer->calls, 0);

  router::ChatRequest req;
  for (int i = 0; i < 4; i++) req.messages.push_back({"user", "m"});
  auto result = builder.Build(req, Priority::kNormal);
  EXPECT_EQ(summarizer->calls, 1);
  EXPECT_TRUE(result.info.summarized);
  EXPECT_EQ(result.info.method, "recorded");
  EXPECT_NE(summarizer->last_note_path.find(cfg_.memory.summaries_dir), std::string::npos);
  EXPECT_TRUE(std::filesystem::exists(cfg_.memory.summaries_dir));
}

TEST_F(ContextBuilderTest, SwappedEstimatorIsReported) {
  router::ContextBuilder builder(cfg_, &logs_, std::make_shared<CountingEstimator>());
  auto result = builder.Build(router_test::UserRequest("a much longer message than one token"), Priority::kNormal);
  EXPECT_EQ(result.info.tokens_after, 1);
  EXPECT_EQ(result.info.estimator, "per-message");
}

TEST_F(ContextBuilderTest, FailureFallsBackToOriginalMessages) {
  router::ContextBuilder builder(cfg_, &logs_, std::make_shared<ThrowingEstimator>());
  router::ChatRequest req;
  req.messages = {{"user", "a"}, {"user", "b"}};
  auto result = builder.Build(req, Priority::kNormal);
  EXPECT_EQ(result.info.method, "error");
  EXPECT_EQ(result.messages.size(), 2u);
  EXPECT_FALSE(logs_.Tail(router::LogKind::kErrors, 5).empty());
}

TEST_F(ContextBuilderTest, WritesContextLog) {
  router::ContextBuilder builder(cfg_, &logs_);
  builder.Build(router_test::UserRequest("hello"), Priority::kNormal);
  auto lines = logs_.Tail(router::LogKind::kContext, 10);
  ASSERT_EQ(lines.size(), 1u);
  auto j = nlohmann::json::parse(lines[0]);
  EXPECT_EQ(j["method"], "keep");
  EXPECT_EQ(j["priority"], "normal");
  EXPECT_TRUE(j.contains("estimated_prompt_tokens"));
}

}  // namespace
