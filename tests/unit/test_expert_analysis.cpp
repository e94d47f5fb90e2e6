#include <gtest/gtest.h>
#include "warden/engine/expert_analysis.hpp"
#include "mocks/mock_provider.hpp"
#include "fixtures/log_capture.hpp"
#include <atomic>

using namespace warden;
using namespace warden::engine;
using namespace warden::testing;
using std::chrono::milliseconds;

class ExpertAnalysisTest : public ::testing::Test {
protected:
    void SetUp() override {
        provider_ = std::make_shared<MockProvider>("expert");
        guard_ = std::make_shared<ProviderCallGuard>();
        budget_ = TimeoutBudget{milliseconds(2000), milliseconds(1500), milliseconds(1000), milliseconds(750)};
        context_.tool_name = "analyze";
        context_.call_id = "c1";
        context_.prompt = "Review this";
    }

    Expected<AnalysisResult> run(ExpertAnalysisExecutor& executor, Effort effort,
                                 std::function<void(milliseconds)> on_wait = nullptr) {
        return executor.run(effort, context_, Deadline::after(budget_.dispatch, TimeoutLayer::Dispatch),
                            budget_, cancel_, std::move(on_wait));
    }

    std::shared_ptr<MockProvider> provider_;
    std::shared_ptr<ProviderCallGuard> guard_;
    TimeoutBudget budget_;
    AnalysisContext context_;
    CancellationToken cancel_;
};

// ============================================================================
// Effort resolution
// ============================================================================

TEST_F(ExpertAnalysisTest, PerCallEffortWins) {
    EXPECT_EQ(ExpertAnalysisExecutor::resolve_effort(std::string("high"), std::string("low")), Effort::High);
}

TEST_F(ExpertAnalysisTest, ProcessDefaultUsedWhenNoPerCall) {
    EXPECT_EQ(ExpertAnalysisExecutor::resolve_effort(std::nullopt, std::string("medium")), Effort::Medium);
}

TEST_F(ExpertAnalysisTest, MinimalWhenNothingConfigured) {
    EXPECT_EQ(ExpertAnalysisExecutor::resolve_effort(std::nullopt, std::nullopt), Effort::Minimal);
}

TEST_F(ExpertAnalysisTest, UnknownEffortWarnsAndFallsBack) {
    LogCapture logs(LogLevel::Warn);
    EXPECT_EQ(ExpertAnalysisExecutor::resolve_effort(std::string("extreme"), std::string("high")),
              Effort::Minimal);
    EXPECT_TRUE(logs.contains(LogLevel::Warn, "extreme"));
}

TEST_F(ExpertAnalysisTest, ReasoningBudgetIncreasesWithEffort) {
    EXPECT_LT(ExpertAnalysisExecutor::reasoning_budget(Effort::Minimal),
              ExpertAnalysisExecutor::reasoning_budget(Effort::Low));
    EXPECT_LT(ExpertAnalysisExecutor::reasoning_budget(Effort::Low),
              ExpertAnalysisExecutor::reasoning_budget(Effort::Medium));
    EXPECT_LT(ExpertAnalysisExecutor::reasoning_budget(Effort::High),
              ExpertAnalysisExecutor::reasoning_budget(Effort::Max));
    EXPECT_DOUBLE_EQ(ExpertAnalysisExecutor::reasoning_budget(Effort::Max), 1.0);
}

// ============================================================================
// Execution
// ============================================================================

TEST_F(ExpertAnalysisTest, ParsesJsonResponse) {
    provider_->default_response = "```json\n{\"summary\": \"race in cache\"}\n```";
    ExpertAnalysisExecutor executor(provider_, guard_);

    auto result = run(executor, Effort::High);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, "analysis_complete");
    EXPECT_EQ(result->analysis["summary"], "race in cache");
    EXPECT_EQ(result->provider, "expert");
    EXPECT_FALSE(result->parse_error.has_value());

    auto params = provider_->last_parameters();
    EXPECT_EQ(params["thinking_mode"], "high");
    EXPECT_DOUBLE_EQ(params["reasoning_budget"].get<double>(), 0.67);
    EXPECT_EQ(params["call_id"], "c1");
}

TEST_F(ExpertAnalysisTest, NonJsonResponseKeptRaw) {
    LogCapture logs(LogLevel::Warn);
    provider_->default_response = "Looks fine to me.";
    ExpertAnalysisExecutor executor(provider_, guard_);

    auto result = run(executor, Effort::Minimal);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->parse_error.has_value());
    EXPECT_EQ(result->raw_response, "Looks fine to me.");

    auto j = result->to_json();
    EXPECT_EQ(j["raw_analysis"], "Looks fine to me.");
    EXPECT_TRUE(j.contains("parse_error"));
    EXPECT_FALSE(j.contains("analysis"));
}

TEST_F(ExpertAnalysisTest, TimeoutAttributedToWorkflowStep) {
    provider_->mode = MockProvider::ResponseMode::Hang;
    budget_ = TimeoutBudget{milliseconds(400), milliseconds(300), milliseconds(100), milliseconds(75)};
    ExpertAnalysisExecutor executor(provider_, guard_);

    auto result = run(executor, Effort::Max);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ProviderTimeout);
    EXPECT_EQ(result.error().timeout_layer, TimeoutLayer::WorkflowStep);
}

TEST_F(ExpertAnalysisTest, EffortDoesNotExtendDeadline) {
    provider_->mode = MockProvider::ResponseMode::Hang;
    budget_ = TimeoutBudget{milliseconds(400), milliseconds(300), milliseconds(100), milliseconds(75)};
    ExpertAnalysisExecutor executor(provider_, guard_);

    auto start = Clock::now();
    auto result = run(executor, Effort::Max);
    EXPECT_FALSE(result.has_value());
    EXPECT_LT(Clock::now() - start, milliseconds(290));
}

TEST_F(ExpertAnalysisTest, HeartbeatReportsWhileWaiting) {
    provider_->mode = MockProvider::ResponseMode::Delay;
    provider_->delay_ms = 150;
    ExpertAnalysisExecutor executor(provider_, guard_, std::nullopt, milliseconds(30));

    std::atomic<int> beats{0};
    auto result = run(executor, Effort::Low, [&beats](milliseconds) { beats.fetch_add(1); });
    ASSERT_TRUE(result.has_value());
    EXPECT_GE(beats.load(), 2);
}

TEST_F(ExpertAnalysisTest, ProviderFailurePropagates) {
    provider_->mode = MockProvider::ResponseMode::Fail;
    ExpertAnalysisExecutor executor(provider_, guard_);
    auto result = run(executor, Effort::Low);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ProviderError);
}

TEST_F(ExpertAnalysisTest, NoProviderIsProviderError) {
    ExpertAnalysisExecutor executor(nullptr, guard_);
    auto result = run(executor, Effort::Low);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ProviderError);
}

TEST_F(ExpertAnalysisTest, ResolveUsesConfiguredDefault) {
    ExpertAnalysisExecutor executor(provider_, guard_, std::string("medium"));
    EXPECT_EQ(executor.resolve(std::nullopt), Effort::Medium);
    EXPECT_EQ(executor.resolve(std::string("low")), Effort::Low);
}
