#pragma once

#include "../log.hpp"
#include "../provider/interface.hpp"
#include "../types.hpp"
#include "cancellation.hpp"
#include "json_extract.hpp"
#include "provider_guard.hpp"
#include "timeout_budget.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace warden {
namespace engine {

/**
 * @brief Input for one expert-analysis sub-step.
 *
 * The prompt is built by the tool; the executor only adds effort parameters.
 */
struct AnalysisContext {
    std::string tool_name;
    std::string call_id;
    std::string prompt;
    nlohmann::json parameters = nlohmann::json::object(); ///< Extra provider parameters (model, temperature, ...)
};

/**
 * @brief Result of an expert-analysis call.
 *
 * When the response is not valid JSON the raw text is kept and parse_error
 * is set; the step still counts as run.
 */
struct AnalysisResult {
    std::string status = "analysis_complete";
    nlohmann::json analysis;                  ///< Parsed JSON object, null if unparseable
    std::string raw_response;
    Effort effort = Effort::Minimal;
    std::string provider;
    std::chrono::milliseconds elapsed{0};
    std::optional<std::string> parse_error;

    nlohmann::json to_json() const {
        nlohmann::json j{
            {"status", status},
            {"effort", effort_to_string(effort)},
            {"provider", provider},
            {"elapsed_ms", elapsed.count()}
        };
        if (parse_error.has_value()) {
            j["raw_analysis"] = raw_response;
            j["parse_error"] = *parse_error;
        } else {
            j["analysis"] = analysis;
        }
        return j;
    }
};

/**
 * @brief Runs the deep-analysis sub-step of a workflow.
 *
 * Effort selects the share of the provider's reasoning budget requested.
 * Effort and the timeout budget are independent: a higher effort never
 * extends the workflow-step deadline.
 *
 * @threadsafety run() is thread-safe; the executor holds no per-call state
 */
class ExpertAnalysisExecutor {
public:
    ExpertAnalysisExecutor(std::shared_ptr<provider::IProvider> provider,
                           std::shared_ptr<ProviderCallGuard> guard,
                           std::optional<std::string> default_effort = std::nullopt,
                           std::chrono::milliseconds heartbeat_interval = std::chrono::seconds(2))
        : provider_(std::move(provider))
        , guard_(std::move(guard))
        , default_effort_(std::move(default_effort))
        , heartbeat_interval_(heartbeat_interval)
    {}

    /**
     * @brief Resolve the effort for one call.
     *
     * Precedence: per-call value, then the process default, then minimal.
     * An unrecognized value logs a warning and resolves to minimal.
     */
    static Effort resolve_effort(const std::optional<std::string>& requested,
                                 const std::optional<std::string>& process_default) {
        const std::optional<std::string>& chosen = requested.has_value() ? requested : process_default;
        if (!chosen.has_value()) {
            return Effort::Minimal;
        }
        if (auto effort = effort_from_string(*chosen)) {
            return *effort;
        }
        log_warn("Unrecognized effort level '" + *chosen + "' (" +
                 (requested.has_value() ? "per-call" : "configured default") +
                 "), falling back to 'minimal'");
        return Effort::Minimal;
    }

    /** @brief Fraction of the provider's reasoning budget requested per effort. */
    static double reasoning_budget(Effort effort) {
        switch (effort) {
            case Effort::Minimal: return 0.005;
            case Effort::Low: return 0.08;
            case Effort::Medium: return 0.33;
            case Effort::High: return 0.67;
            case Effort::Max: return 1.0;
        }
        return 0.005;
    }

    Effort resolve(const std::optional<std::string>& requested) const {
        return resolve_effort(requested, default_effort_);
    }

    const std::optional<std::string>& default_effort() const { return default_effort_; }

    /**
     * @brief Run the analysis through the Provider Call Guard.
     *
     * The provider call is bounded by the workflow-step slot nested inside
     * the parent deadline. A timeout is reported as ProviderTimeout with the
     * layer of whichever deadline fired.
     *
     * @param on_wait Optional callback invoked every heartbeat interval while waiting
     */
    Expected<AnalysisResult> run(Effort effort,
                                 const AnalysisContext& context,
                                 const Deadline& parent,
                                 const TimeoutBudget& budget,
                                 const CancellationToken& cancel,
                                 std::function<void(std::chrono::milliseconds)> on_wait = nullptr) {
        if (!provider_) {
            return tl::unexpected(Error{ErrorCode::ProviderError, "No provider configured for expert analysis"});
        }

        auto deadline = parent.nested(budget.workflow_step, TimeoutLayer::WorkflowStep);

        nlohmann::json parameters = context.parameters.is_object() ? context.parameters : nlohmann::json::object();
        parameters["thinking_mode"] = effort_to_string(effort);
        parameters["reasoning_budget"] = reasoning_budget(effort);
        parameters["tool_name"] = context.tool_name;
        parameters["call_id"] = context.call_id;

        Heartbeat heartbeat;
        if (on_wait) {
            heartbeat.interval = heartbeat_interval_;
            heartbeat.callback = std::move(on_wait);
        }

        const auto started = Clock::now();
        log_debug("Expert analysis for '" + context.tool_name + "' (" + context.call_id +
                  ") with effort " + effort_to_string(effort));

        auto response = guard_->generate(provider_, context.prompt, parameters, deadline, cancel, heartbeat);
        if (!response) {
            return tl::unexpected(response.error());
        }

        AnalysisResult result;
        result.effort = effort;
        result.provider = provider_->name();
        result.raw_response = *response;
        result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);

        auto parsed = JsonExtractor::extract_object(*response);
        if (parsed) {
            result.analysis = std::move(*parsed);
        } else {
            result.parse_error = parsed.error().message;
            log_warn("Expert analysis for '" + context.tool_name + "' returned non-JSON output");
        }
        return result;
    }

private:
    std::shared_ptr<provider::IProvider> provider_;
    std::shared_ptr<ProviderCallGuard> guard_;
    std::optional<std::string> default_effort_;
    std::chrono::milliseconds heartbeat_interval_;
};

} // namespace engine
} // namespace warden
