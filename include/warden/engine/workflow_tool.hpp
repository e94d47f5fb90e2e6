#pragma once

#include "../log.hpp"
#include "../types.hpp"
#include "call_context.hpp"
#include "expert_analysis.hpp"
#include "tool_handler.hpp"
#include "workflow.hpp"
#include <functional>
#include <string>

namespace warden {
namespace engine {

using WorkflowStepProducer = std::function<Expected<StepSubmission>(const WorkflowState&, CallContext&)>;
using WorkflowPromptBuilder = std::function<std::string(const WorkflowState&, const ToolCall&)>;

/**
 * @brief Default step producer reading `parameters.steps[step_index]`.
 */
inline WorkflowStepProducer workflow_steps_from_parameters() {
    return [](const WorkflowState& state, CallContext& ctx) -> Expected<StepSubmission> {
        const auto& params = ctx.call.parameters;
        auto steps_it = params.find("steps");
        if (steps_it == params.end() || !steps_it->is_array()) {
            return tl::unexpected(Error{ErrorCode::InvalidParameters, "Workflow requires a 'steps' array"});
        }
        const auto index = static_cast<size_t>(state.step_index);
        if (index >= steps_it->size()) {
            return tl::unexpected(Error{
                ErrorCode::InvalidParameters,
                "Workflow declares " + std::to_string(state.total_steps) + " steps but only " +
                    std::to_string(steps_it->size()) + " were provided"
            });
        }
        return StepSubmission::from_json(state.call_id, state.step_index + 1, (*steps_it)[index]);
    };
}

inline std::string default_workflow_prompt(const WorkflowState& state, const ToolCall& call) {
    std::string prompt = "Review the investigation below for tool '" + call.tool_name +
                         "' and respond with a JSON object containing your analysis.\n\n";
    if (call.parameters.contains("instruction") && call.parameters["instruction"].is_string()) {
        prompt += "Instruction: " + call.parameters["instruction"].get<std::string>() + "\n\n";
    }
    prompt += "Consolidated findings:\n" + state.consolidated.to_json().dump(2);
    return prompt;
}

inline nlohmann::json default_workflow_schema() {
    return nlohmann::json{
        {"type", "object"},
        {"properties", {
            {"steps", {{"type", "array"}}},
            {"total_steps", {{"type", "integer"}}},
            {"use_assistant_model", {{"type", "boolean"}}},
            {"instruction", {{"type", "string"}}},
            {"model", {{"type", "string"}}}
        }},
        {"required", nlohmann::json::array()}
    };
}

/**
 * @brief Domain logic of one workflow tool.
 */
struct WorkflowDefinition {
    std::string name;
    std::string description;
    nlohmann::json parameters_schema = default_workflow_schema();
    int default_total_steps = 1;
    bool requires_expert_analysis = true;
    WorkflowStepProducer next_step = workflow_steps_from_parameters();
    WorkflowPromptBuilder expert_prompt = default_workflow_prompt;
};

/**
 * @brief Multi-step tool driven by a WorkflowStateMachine.
 *
 * The tool's domain logic is supplied as two callbacks: one producing the
 * next step from the current state, one rendering the expert-analysis
 * prompt. Steps run sequentially on the call's worker thread; progress is
 * reported after each step and while expert analysis is pending.
 */
class WorkflowTool : public ToolHandler {
public:
    using Definition = WorkflowDefinition;

    explicit WorkflowTool(Definition definition)
        : definition_(std::move(definition))
    {}

    ToolKind kind() const override { return ToolKind::Workflow; }
    const std::string& name() const override { return definition_.name; }
    const std::string& description() const override { return definition_.description; }
    const nlohmann::json& parameters_schema() const override { return definition_.parameters_schema; }

    Expected<nlohmann::json> invoke(CallContext& ctx) override {
        const auto& params = ctx.call.parameters;

        int total_steps = definition_.default_total_steps;
        if (params.contains("total_steps") && params["total_steps"].is_number_integer()) {
            total_steps = params["total_steps"].get<int>();
        } else if (params.contains("steps") && params["steps"].is_array() && !params["steps"].empty()) {
            total_steps = static_cast<int>(params["steps"].size());
        }

        bool use_assistant = true;
        if (params.contains("use_assistant_model") && params["use_assistant_model"].is_boolean()) {
            use_assistant = params["use_assistant_model"].get<bool>();
        }
        const bool expert_required = definition_.requires_expert_analysis && use_assistant && ctx.expert;

        WorkflowStateMachine machine(ctx.call.call_id, total_steps, expert_required);

        while (!machine.terminal() && machine.phase() != WorkflowPhase::AwaitingExpertAnalysis) {
            if (ctx.cancel.is_cancelled()) {
                return fail(machine, Error{ErrorCode::Cancelled, "Workflow cancelled", ctx.cancel.reason()});
            }

            auto step = definition_.next_step(machine.state(), ctx);
            if (!step) {
                return fail(machine, step.error());
            }

            auto phase = machine.submit_step(*step);
            if (!phase) {
                return fail(machine, phase.error());
            }

            const auto& state = machine.state();
            ctx.report(state.step_index, state.total_steps,
                       "Step " + std::to_string(state.step_index) + "/" +
                           std::to_string(state.total_steps) + " complete");
        }

        if (machine.phase() == WorkflowPhase::AwaitingExpertAnalysis) {
            const auto& state = machine.state();
            const int index = state.step_index;
            const int total = state.total_steps;
            ctx.report(index, total, "Awaiting expert analysis");

            Effort effort = ctx.expert->resolve(ctx.call.effort);

            AnalysisContext analysis;
            analysis.tool_name = definition_.name;
            analysis.call_id = ctx.call.call_id;
            analysis.prompt = definition_.expert_prompt(state, ctx.call);
            if (params.contains("model") && params["model"].is_string()) {
                analysis.parameters["model"] = params["model"];
            }

            auto report = [&ctx, index, total](std::chrono::milliseconds waited) {
                ctx.report(index, total, "Expert analysis in progress (" +
                                             std::to_string(waited.count() / 1000) + "s)");
            };

            auto result = ctx.expert->run(effort, analysis, ctx.deadline, ctx.budget, ctx.cancel, report);
            if (!result) {
                return fail(machine, result.error());
            }
            auto completed = machine.complete_expert_analysis(std::move(*result));
            if (!completed) {
                return fail(machine, completed.error());
            }
        }

        return machine.result();
    }

private:
    static tl::unexpected<Error> fail(WorkflowStateMachine& machine, Error error) {
        if (!machine.terminal()) {
            auto failed = machine.fail(error);
            if (!failed) {
                log_warn("Workflow failure not recorded: " + failed.error().to_string());
            }
        }
        error.diagnostics = machine.diagnostics();
        return tl::unexpected(std::move(error));
    }

    Definition definition_;
};

} // namespace engine
} // namespace warden
