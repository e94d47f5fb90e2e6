#pragma once

#include "../types.hpp"
#include "expert_analysis.hpp"
#include <algorithm>
#include <optional>
#include <string>
#include <vector>

namespace warden {
namespace engine {

// ============================================================================
// Workflow Phase
// ============================================================================

/**
 * @brief Lifecycle of one workflow execution.
 *
 * Pending -> Stepping -> (AwaitingExpertAnalysis) -> Complete,
 * with Failed and TimedOut as the other terminal phases.
 */
enum class WorkflowPhase {
    Pending,
    Stepping,
    AwaitingExpertAnalysis,
    Complete,
    Failed,
    TimedOut
};

[[nodiscard]] inline const char* workflow_phase_to_string(WorkflowPhase phase) {
    switch (phase) {
        case WorkflowPhase::Pending: return "pending";
        case WorkflowPhase::Stepping: return "stepping";
        case WorkflowPhase::AwaitingExpertAnalysis: return "awaiting_expert_analysis";
        case WorkflowPhase::Complete: return "complete";
        case WorkflowPhase::Failed: return "failed";
        case WorkflowPhase::TimedOut: return "timed_out";
    }
    return "unknown";
}

[[nodiscard]] inline bool is_terminal(WorkflowPhase phase) {
    return phase == WorkflowPhase::Complete ||
           phase == WorkflowPhase::Failed ||
           phase == WorkflowPhase::TimedOut;
}

// ============================================================================
// Step Submission
// ============================================================================

/**
 * @brief One step's contribution to a workflow.
 */
struct StepSubmission {
    std::string call_id;                          ///< Must match the workflow's call identity
    int step_number = 1;                          ///< 1-based
    int total_steps = 0;                          ///< Declared total, 0 = keep current
    bool next_step_required = true;               ///< false ends stepping after this step
    std::string findings;
    std::vector<std::string> files_checked;
    std::vector<std::string> relevant_files;
    std::vector<std::string> relevant_context;
    std::vector<std::string> issues_found;
    std::optional<std::string> hypothesis;
    std::optional<std::string> confidence;        ///< exploring, low, medium, high, very_high, almost_certain, certain

    /**
     * @brief Parse a step from its JSON representation.
     *
     * Only `findings` is required; list fields accept arrays of strings.
     */
    static Expected<StepSubmission> from_json(const std::string& call_id, int step_number,
                                              const nlohmann::json& j) {
        if (!j.is_object()) {
            return tl::unexpected(Error{ErrorCode::InvalidParameters,
                                        "Step " + std::to_string(step_number) + " must be an object"});
        }
        StepSubmission step;
        step.call_id = call_id;
        step.step_number = step_number;
        try {
            step.findings = j.value("findings", std::string{});
            step.total_steps = j.value("total_steps", 0);
            step.next_step_required = j.value("next_step_required", true);
            step.files_checked = j.value("files_checked", std::vector<std::string>{});
            step.relevant_files = j.value("relevant_files", std::vector<std::string>{});
            step.relevant_context = j.value("relevant_context", std::vector<std::string>{});
            step.issues_found = j.value("issues_found", std::vector<std::string>{});
            if (j.contains("hypothesis") && j["hypothesis"].is_string()) {
                step.hypothesis = j["hypothesis"].get<std::string>();
            }
            if (j.contains("confidence") && j["confidence"].is_string()) {
                step.confidence = j["confidence"].get<std::string>();
            }
        } catch (const nlohmann::json::exception& e) {
            return tl::unexpected(Error{ErrorCode::InvalidParameters,
                                        "Malformed step " + std::to_string(step_number), e.what()});
        }
        if (step.findings.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidParameters,
                                        "Step " + std::to_string(step_number) + " has no findings"});
        }
        return step;
    }
};

// ============================================================================
// Consolidated Findings
// ============================================================================

/**
 * @brief Findings merged across all completed steps.
 *
 * File and context lists keep first-seen order without duplicates.
 */
struct ConsolidatedFindings {
    std::vector<std::string> findings;            ///< "Step N: ..." per step
    std::vector<std::string> files_checked;
    std::vector<std::string> relevant_files;
    std::vector<std::string> relevant_context;
    std::vector<std::string> issues_found;
    std::vector<nlohmann::json> hypotheses;       ///< {step, hypothesis, confidence}
    std::string confidence = "exploring";

    void merge(const StepSubmission& step) {
        findings.push_back("Step " + std::to_string(step.step_number) + ": " + step.findings);
        append_unique(files_checked, step.files_checked);
        append_unique(relevant_files, step.relevant_files);
        append_unique(relevant_context, step.relevant_context);
        append_unique(issues_found, step.issues_found);
        if (step.confidence.has_value()) {
            confidence = *step.confidence;
        }
        if (step.hypothesis.has_value()) {
            hypotheses.push_back(nlohmann::json{
                {"step", step.step_number},
                {"hypothesis", *step.hypothesis},
                {"confidence", confidence}
            });
        }
    }

    bool has_evidence() const {
        return !findings.empty() || !relevant_files.empty() || !issues_found.empty();
    }

    nlohmann::json to_json() const {
        return nlohmann::json{
            {"findings", findings},
            {"files_checked", files_checked},
            {"relevant_files", relevant_files},
            {"relevant_context", relevant_context},
            {"issues_found", issues_found},
            {"hypotheses", hypotheses},
            {"confidence", confidence}
        };
    }

private:
    static void append_unique(std::vector<std::string>& into, const std::vector<std::string>& items) {
        for (const auto& item : items) {
            if (std::find(into.begin(), into.end(), item) == into.end()) {
                into.push_back(item);
            }
        }
    }
};

// ============================================================================
// Workflow State
// ============================================================================

/**
 * @brief State of one workflow execution.
 *
 * Owned by the single task executing the call; never shared.
 */
struct WorkflowState {
    std::string call_id;
    std::vector<StepSubmission> completed_steps;  ///< Append-only, ordered
    int step_index = 0;                           ///< Number of completed steps
    int total_steps = 1;
    ConsolidatedFindings consolidated;
    bool expert_required = false;
    bool expert_ran = false;
    std::optional<AnalysisResult> expert_result;
    std::optional<std::string> failure;
    WorkflowPhase phase = WorkflowPhase::Pending;
};

// ============================================================================
// WorkflowStateMachine
// ============================================================================

/**
 * @brief Drives a workflow through its declared steps.
 *
 * Rules:
 * - Steps arrive strictly in order (step_number == step_index + 1)
 * - A step number beyond total_steps raises total_steps
 * - next_step_required == false ends stepping at that step
 * - When stepping ends, expert analysis is awaited if required, not yet
 *   run, there is evidence and the latest confidence is not "certain"
 * - Every transition out of a terminal phase fails with InvalidStateTransition
 *
 * @threadsafety Not thread-safe. Owned by a single call's task.
 */
class WorkflowStateMachine {
public:
    WorkflowStateMachine(std::string call_id, int total_steps, bool expert_required) {
        state_.call_id = std::move(call_id);
        state_.total_steps = std::max(1, total_steps);
        state_.expert_required = expert_required;
    }

    Expected<WorkflowPhase> submit_step(const StepSubmission& step) {
        if (auto rejected = reject_if_terminal("submit a step")) {
            return tl::unexpected(*rejected);
        }
        if (step.call_id != state_.call_id) {
            return tl::unexpected(Error{
                ErrorCode::CallIdentityMismatch,
                "Step submitted for call '" + step.call_id + "' to workflow of call '" + state_.call_id + "'"
            });
        }
        if (state_.phase == WorkflowPhase::AwaitingExpertAnalysis) {
            return tl::unexpected(Error{
                ErrorCode::InvalidStateTransition,
                "Cannot submit a step while awaiting expert analysis"
            });
        }
        if (step.step_number != state_.step_index + 1) {
            return tl::unexpected(Error{
                ErrorCode::InvalidStateTransition,
                "Expected step " + std::to_string(state_.step_index + 1) +
                    ", got step " + std::to_string(step.step_number)
            });
        }

        if (step.total_steps > 0 && step.total_steps >= step.step_number) {
            state_.total_steps = step.total_steps;
        }
        if (step.step_number > state_.total_steps) {
            state_.total_steps = step.step_number;
        }
        if (!step.next_step_required) {
            state_.total_steps = step.step_number;
        }

        state_.phase = WorkflowPhase::Stepping;
        state_.completed_steps.push_back(step);
        state_.consolidated.merge(step);
        state_.step_index = step.step_number;

        if (state_.step_index >= state_.total_steps) {
            state_.phase = needs_expert_analysis()
                ? WorkflowPhase::AwaitingExpertAnalysis
                : WorkflowPhase::Complete;
        }
        return state_.phase;
    }

    Expected<void> complete_expert_analysis(AnalysisResult result) {
        if (auto rejected = reject_if_terminal("complete expert analysis")) {
            return tl::unexpected(*rejected);
        }
        if (state_.phase != WorkflowPhase::AwaitingExpertAnalysis) {
            return tl::unexpected(Error{
                ErrorCode::InvalidStateTransition,
                std::string("Expert analysis not awaited in phase '") +
                    workflow_phase_to_string(state_.phase) + "'"
            });
        }
        state_.expert_result = std::move(result);
        state_.expert_ran = true;
        state_.phase = WorkflowPhase::Complete;
        return {};
    }

    /**
     * @brief Terminate the workflow: TimedOut for timeout-class errors, Failed otherwise.
     */
    Expected<void> fail(const Error& error) {
        if (auto rejected = reject_if_terminal("fail")) {
            return tl::unexpected(*rejected);
        }
        state_.failure = error.to_string();
        state_.phase = error.is_timeout() ? WorkflowPhase::TimedOut : WorkflowPhase::Failed;
        return {};
    }

    bool needs_expert_analysis() const {
        if (!state_.expert_required || state_.expert_ran) {
            return false;
        }
        if (state_.consolidated.confidence == "certain") {
            return false;
        }
        return state_.consolidated.has_evidence();
    }

    const WorkflowState& state() const { return state_; }
    WorkflowPhase phase() const { return state_.phase; }
    bool terminal() const { return is_terminal(state_.phase); }

    /**
     * @brief Work completed so far, attached to Failure/Timeout outcomes.
     */
    nlohmann::json diagnostics() const {
        nlohmann::json j{
            {"call_id", state_.call_id},
            {"phase", workflow_phase_to_string(state_.phase)},
            {"steps_completed", state_.step_index},
            {"total_steps", state_.total_steps},
            {"consolidated", state_.consolidated.to_json()}
        };
        if (state_.failure.has_value()) {
            j["failure"] = *state_.failure;
        }
        return j;
    }

    /**
     * @brief Final payload of a completed workflow.
     */
    nlohmann::json result() const {
        nlohmann::json j{
            {"status", workflow_phase_to_string(state_.phase)},
            {"steps_completed", state_.step_index},
            {"total_steps", state_.total_steps},
            {"consolidated", state_.consolidated.to_json()}
        };
        if (state_.expert_result.has_value()) {
            j["expert_analysis"] = state_.expert_result->to_json();
        } else if (state_.expert_required) {
            j["expert_analysis"] = nlohmann::json{
                {"status", "skipped"},
                {"reason", skip_reason()}
            };
        }
        return j;
    }

private:
    std::optional<Error> reject_if_terminal(const char* action) const {
        if (!terminal()) {
            return std::nullopt;
        }
        return Error{
            ErrorCode::InvalidStateTransition,
            std::string("Cannot ") + action + " in terminal phase '" +
                workflow_phase_to_string(state_.phase) + "'"
        };
    }

    std::string skip_reason() const {
        if (state_.consolidated.confidence == "certain") {
            return "confidence is certain";
        }
        if (!state_.consolidated.has_evidence()) {
            return "no findings to analyze";
        }
        return "not run";
    }

    WorkflowState state_;
};

} // namespace engine
} // namespace warden
