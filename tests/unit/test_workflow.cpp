#include <gtest/gtest.h>
#include "warden/engine/workflow.hpp"
#include "warden/engine/workflow_tool.hpp"
#include "mocks/mock_provider.hpp"
#include "fixtures/wire_messages.hpp"

using namespace warden;
using namespace warden::engine;
using namespace warden::testing;
using std::chrono::milliseconds;

namespace {

StepSubmission make_step(const std::string& call_id, int number, bool next = true,
                         const std::string& findings = "found something") {
    StepSubmission step;
    step.call_id = call_id;
    step.step_number = number;
    step.next_step_required = next;
    step.findings = findings;
    return step;
}

} // namespace

// ============================================================================
// State machine
// ============================================================================

class WorkflowStateMachineTest : public ::testing::Test {};

TEST_F(WorkflowStateMachineTest, StepsInOrderWithoutExpert) {
    WorkflowStateMachine machine("c1", 3, false);
    EXPECT_EQ(machine.phase(), WorkflowPhase::Pending);

    auto p1 = machine.submit_step(make_step("c1", 1));
    ASSERT_TRUE(p1.has_value());
    EXPECT_EQ(*p1, WorkflowPhase::Stepping);

    ASSERT_TRUE(machine.submit_step(make_step("c1", 2)).has_value());
    auto p3 = machine.submit_step(make_step("c1", 3, false));
    ASSERT_TRUE(p3.has_value());
    EXPECT_EQ(*p3, WorkflowPhase::Complete);
    EXPECT_EQ(machine.state().step_index, 3);
    EXPECT_EQ(machine.state().completed_steps.size(), 3u);
}

TEST_F(WorkflowStateMachineTest, OutOfOrderStepRejected) {
    WorkflowStateMachine machine("c1", 3, false);
    auto result = machine.submit_step(make_step("c1", 2));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidStateTransition);
    EXPECT_EQ(machine.state().step_index, 0);
}

TEST_F(WorkflowStateMachineTest, RepeatedStepRejected) {
    WorkflowStateMachine machine("c1", 3, false);
    ASSERT_TRUE(machine.submit_step(make_step("c1", 1)).has_value());
    auto result = machine.submit_step(make_step("c1", 1));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidStateTransition);
}

TEST_F(WorkflowStateMachineTest, ForeignCallIdRejected) {
    WorkflowStateMachine machine("c1", 2, false);
    auto result = machine.submit_step(make_step("c2", 1));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::CallIdentityMismatch);
}

TEST_F(WorkflowStateMachineTest, StepBeyondTotalRaisesTotal) {
    WorkflowStateMachine machine("c1", 1, false);
    auto step = make_step("c1", 1);
    step.total_steps = 3;
    auto phase = machine.submit_step(step);
    ASSERT_TRUE(phase.has_value());
    EXPECT_EQ(*phase, WorkflowPhase::Stepping);
    EXPECT_EQ(machine.state().total_steps, 3);
}

TEST_F(WorkflowStateMachineTest, EarlyStopEndsStepping) {
    WorkflowStateMachine machine("c1", 5, false);
    ASSERT_TRUE(machine.submit_step(make_step("c1", 1)).has_value());
    auto phase = machine.submit_step(make_step("c1", 2, false));
    ASSERT_TRUE(phase.has_value());
    EXPECT_EQ(*phase, WorkflowPhase::Complete);
    EXPECT_EQ(machine.state().total_steps, 2);
}

TEST_F(WorkflowStateMachineTest, ExpertAwaitedAfterLastStep) {
    WorkflowStateMachine machine("c1", 2, true);
    ASSERT_TRUE(machine.submit_step(make_step("c1", 1)).has_value());
    auto phase = machine.submit_step(make_step("c1", 2, false));
    ASSERT_TRUE(phase.has_value());
    EXPECT_EQ(*phase, WorkflowPhase::AwaitingExpertAnalysis);

    auto blocked = machine.submit_step(make_step("c1", 3));
    ASSERT_FALSE(blocked.has_value());
    EXPECT_EQ(blocked.error().code, ErrorCode::InvalidStateTransition);

    AnalysisResult analysis;
    analysis.analysis = {{"summary", "ok"}};
    ASSERT_TRUE(machine.complete_expert_analysis(analysis).has_value());
    EXPECT_EQ(machine.phase(), WorkflowPhase::Complete);
    EXPECT_TRUE(machine.state().expert_ran);

    auto result = machine.result();
    EXPECT_EQ(result["expert_analysis"]["analysis"]["summary"], "ok");
}

TEST_F(WorkflowStateMachineTest, CertainConfidenceSkipsExpert) {
    WorkflowStateMachine machine("c1", 1, true);
    auto step = make_step("c1", 1, false);
    step.confidence = "certain";
    auto phase = machine.submit_step(step);
    ASSERT_TRUE(phase.has_value());
    EXPECT_EQ(*phase, WorkflowPhase::Complete);
    EXPECT_EQ(machine.result()["expert_analysis"]["status"], "skipped");
}

TEST_F(WorkflowStateMachineTest, ExpertNotAwaitedRejected) {
    WorkflowStateMachine machine("c1", 2, true);
    auto result = machine.complete_expert_analysis(AnalysisResult{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidStateTransition);
}

TEST_F(WorkflowStateMachineTest, TimeoutFailureIsTimedOut) {
    WorkflowStateMachine machine("c1", 2, true);
    ASSERT_TRUE(machine.submit_step(make_step("c1", 1)).has_value());
    ASSERT_TRUE(machine.fail(Error::timeout(ErrorCode::ProviderTimeout, TimeoutLayer::WorkflowStep, "slow"))
                    .has_value());
    EXPECT_EQ(machine.phase(), WorkflowPhase::TimedOut);

    auto diagnostics = machine.diagnostics();
    EXPECT_EQ(diagnostics["phase"], "timed_out");
    EXPECT_EQ(diagnostics["steps_completed"], 1);
    EXPECT_TRUE(diagnostics.contains("failure"));
}

TEST_F(WorkflowStateMachineTest, TerminalPhaseRejectsEverything) {
    WorkflowStateMachine machine("c1", 1, false);
    ASSERT_TRUE(machine.fail(Error{ErrorCode::ProviderError, "down"}).has_value());
    EXPECT_EQ(machine.phase(), WorkflowPhase::Failed);

    EXPECT_FALSE(machine.submit_step(make_step("c1", 1)).has_value());
    EXPECT_FALSE(machine.complete_expert_analysis(AnalysisResult{}).has_value());
    EXPECT_FALSE(machine.fail(Error{ErrorCode::ProviderError, "again"}).has_value());
}

TEST_F(WorkflowStateMachineTest, FindingsConsolidateWithoutDuplicates) {
    WorkflowStateMachine machine("c1", 2, false);
    auto s1 = make_step("c1", 1, true, "first");
    s1.relevant_files = {"a.cpp", "b.cpp"};
    s1.hypothesis = "lock ordering";
    auto s2 = make_step("c1", 2, false, "second");
    s2.relevant_files = {"b.cpp", "c.cpp"};
    s2.confidence = "high";

    ASSERT_TRUE(machine.submit_step(s1).has_value());
    ASSERT_TRUE(machine.submit_step(s2).has_value());

    const auto& consolidated = machine.state().consolidated;
    EXPECT_EQ(consolidated.findings.size(), 2u);
    EXPECT_EQ(consolidated.findings[0], "Step 1: first");
    EXPECT_EQ(consolidated.relevant_files, (std::vector<std::string>{"a.cpp", "b.cpp", "c.cpp"}));
    EXPECT_EQ(consolidated.confidence, "high");
    ASSERT_EQ(consolidated.hypotheses.size(), 1u);
    EXPECT_EQ(consolidated.hypotheses[0]["hypothesis"], "lock ordering");
}

// ============================================================================
// Step parsing
// ============================================================================

TEST(StepSubmissionTest, ParsesFields) {
    nlohmann::json j{
        {"findings", "x"},
        {"next_step_required", false},
        {"files_checked", {"a", "b"}},
        {"confidence", "medium"}
    };
    auto step = StepSubmission::from_json("c1", 2, j);
    ASSERT_TRUE(step.has_value());
    EXPECT_EQ(step->step_number, 2);
    EXPECT_FALSE(step->next_step_required);
    EXPECT_EQ(step->files_checked.size(), 2u);
    EXPECT_EQ(step->confidence, std::optional<std::string>("medium"));
}

TEST(StepSubmissionTest, FindingsRequired) {
    auto step = StepSubmission::from_json("c1", 1, nlohmann::json{{"next_step_required", true}});
    ASSERT_FALSE(step.has_value());
    EXPECT_EQ(step.error().code, ErrorCode::InvalidParameters);
}

TEST(StepSubmissionTest, WrongListTypeRejected) {
    auto step = StepSubmission::from_json("c1", 1, nlohmann::json{{"findings", "x"}, {"relevant_files", 3}});
    ASSERT_FALSE(step.has_value());
    EXPECT_EQ(step.error().code, ErrorCode::InvalidParameters);
}

// ============================================================================
// Workflow tool
// ============================================================================

class WorkflowToolTest : public ::testing::Test {
protected:
    void SetUp() override {
        provider_ = std::make_shared<MockProvider>("expert");
        guard_ = std::make_shared<ProviderCallGuard>();
        expert_ = std::make_shared<ExpertAnalysisExecutor>(provider_, guard_);

        definition_.name = "analyze";
        definition_.description = "test workflow";
    }

    CallContext context(nlohmann::json params, milliseconds base = milliseconds(1000)) {
        CallContext ctx;
        ctx.call = ToolCall::make("c1", "analyze", std::move(params));
        ctx.budget = TimeoutBudget{base * 2, base * 3 / 2, base, base * 3 / 4};
        ctx.deadline = Deadline::after(ctx.budget.dispatch, TimeoutLayer::Dispatch);
        ctx.progress = [this](const ProgressUpdate& update) { updates_.push_back(update); };
        ctx.provider = provider_;
        ctx.guard = guard_;
        ctx.expert = expert_;
        return ctx;
    }

    std::shared_ptr<MockProvider> provider_;
    std::shared_ptr<ProviderCallGuard> guard_;
    std::shared_ptr<ExpertAnalysisExecutor> expert_;
    WorkflowDefinition definition_;
    std::vector<ProgressUpdate> updates_;
};

TEST_F(WorkflowToolTest, RunsStepsThenExpert) {
    WorkflowTool tool(definition_);
    auto ctx = context(wire::analyze_parameters(3));

    auto result = tool.invoke(ctx);
    ASSERT_TRUE(result.has_value()) << result.error().to_string();
    EXPECT_EQ((*result)["status"], "complete");
    EXPECT_EQ((*result)["steps_completed"], 3);
    EXPECT_EQ((*result)["expert_analysis"]["analysis"]["summary"], "looks fine");
    EXPECT_EQ(provider_->calls(), 1);
    EXPECT_NE(provider_->last_prompt().find("Step 3: finding 3"), std::string::npos);

    ASSERT_GE(updates_.size(), 4u);
    EXPECT_EQ(updates_[0].step_index, 1);
    EXPECT_EQ(updates_[2].step_index, 3);
    EXPECT_EQ(updates_[3].note, "Awaiting expert analysis");
}

TEST_F(WorkflowToolTest, AssistantDisabledSkipsExpert) {
    WorkflowTool tool(definition_);
    auto params = wire::analyze_parameters(2);
    params["use_assistant_model"] = false;
    auto ctx = context(params);

    auto result = tool.invoke(ctx);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(provider_->calls(), 0);
    EXPECT_FALSE(result->contains("expert_analysis"));
}

TEST_F(WorkflowToolTest, ExpertTimeoutCarriesPartialResults) {
    provider_->mode = MockProvider::ResponseMode::Hang;
    WorkflowTool tool(definition_);
    auto ctx = context(wire::analyze_parameters(3), milliseconds(100));

    auto result = tool.invoke(ctx);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ProviderTimeout);
    EXPECT_EQ(result.error().timeout_layer, TimeoutLayer::WorkflowStep);
    EXPECT_EQ(result.error().diagnostics["steps_completed"], 3);
    EXPECT_EQ(result.error().diagnostics["phase"], "timed_out");
}

TEST_F(WorkflowToolTest, MissingStepsFailWithDiagnostics) {
    WorkflowTool tool(definition_);
    auto params = wire::analyze_parameters(1);
    params["total_steps"] = 3;
    params["steps"][0]["next_step_required"] = true;
    auto ctx = context(params);

    auto result = tool.invoke(ctx);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidParameters);
    EXPECT_EQ(result.error().diagnostics["steps_completed"], 1);
    EXPECT_EQ(result.error().diagnostics["phase"], "failed");
}

TEST_F(WorkflowToolTest, CustomStepProducer) {
    definition_.requires_expert_analysis = false;
    definition_.default_total_steps = 2;
    definition_.next_step = [](const WorkflowState& state, CallContext&) -> Expected<StepSubmission> {
        StepSubmission step;
        step.call_id = state.call_id;
        step.step_number = state.step_index + 1;
        step.findings = "generated " + std::to_string(step.step_number);
        return step;
    };
    WorkflowTool tool(definition_);
    auto ctx = context(nlohmann::json::object());

    auto result = tool.invoke(ctx);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ((*result)["steps_completed"], 2);
    EXPECT_EQ((*result)["consolidated"]["findings"][1], "Step 2: generated 2");
}

TEST_F(WorkflowToolTest, CancelledBeforeStart) {
    WorkflowTool tool(definition_);
    auto ctx = context(wire::analyze_parameters(2));
    ctx.cancel.cancel("client cancelled");

    auto result = tool.invoke(ctx);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
    EXPECT_EQ(result.error().diagnostics["steps_completed"], 0);
}
