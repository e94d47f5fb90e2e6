#pragma once

#include "../types.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <optional>
#include <string>

namespace warden {
namespace engine {

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Base duration and ratios from which every per-call budget is derived.
 *
 * The base is the workflow tool timeout B. Each slot is B multiplied by its
 * ratio unless an absolute override is set.
 */
struct TimeoutConfig {
    std::chrono::milliseconds base{45000};               ///< Base workflow tool timeout B (> 0)
    double session_ratio = 2.0;                           ///< Transport/session ceiling
    double dispatch_ratio = 1.5;                          ///< Dispatch backstop
    double workflow_step_ratio = 1.0;                     ///< Single workflow step
    double provider_call_ratio = 0.75;                    ///< One provider request

    std::optional<std::chrono::milliseconds> session_override;
    std::optional<std::chrono::milliseconds> dispatch_override;
    std::optional<std::chrono::milliseconds> workflow_step_override;
    std::optional<std::chrono::milliseconds> provider_call_override;

    bool operator==(const TimeoutConfig& other) const {
        return base == other.base &&
               session_ratio == other.session_ratio &&
               dispatch_ratio == other.dispatch_ratio &&
               workflow_step_ratio == other.workflow_step_ratio &&
               provider_call_ratio == other.provider_call_ratio &&
               session_override == other.session_override &&
               dispatch_override == other.dispatch_override &&
               workflow_step_override == other.workflow_step_override &&
               provider_call_override == other.provider_call_override;
    }

    bool operator!=(const TimeoutConfig& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Budget
// ============================================================================

/**
 * @brief Nested per-call timeout slots, outermost first.
 *
 * Invariant: provider_call <= workflow_step <= dispatch <= session.
 */
struct TimeoutBudget {
    std::chrono::milliseconds session{0};
    std::chrono::milliseconds dispatch{0};
    std::chrono::milliseconds workflow_step{0};
    std::chrono::milliseconds provider_call{0};

    std::chrono::milliseconds slot(TimeoutLayer layer) const {
        switch (layer) {
            case TimeoutLayer::Session: return session;
            case TimeoutLayer::Dispatch: return dispatch;
            case TimeoutLayer::WorkflowStep: return workflow_step;
            case TimeoutLayer::ProviderCall: return provider_call;
        }
        return provider_call;
    }

    nlohmann::json to_json() const {
        return nlohmann::json{
            {"session_ms", session.count()},
            {"dispatch_ms", dispatch.count()},
            {"workflow_step_ms", workflow_step.count()},
            {"provider_call_ms", provider_call.count()}
        };
    }

    bool operator==(const TimeoutBudget& other) const {
        return session == other.session &&
               dispatch == other.dispatch &&
               workflow_step == other.workflow_step &&
               provider_call == other.provider_call;
    }

    bool operator!=(const TimeoutBudget& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Deadline
// ============================================================================

/**
 * @brief Absolute point in time tagged with the layer that imposed it.
 *
 * Nesting keeps whichever bound is earlier together with its layer, so a
 * child can never outlive its parent and an expiry is always attributed to
 * the layer whose deadline actually fired.
 */
struct Deadline {
    Clock::time_point at;
    TimeoutLayer layer = TimeoutLayer::Dispatch;

    static Deadline after(std::chrono::milliseconds duration, TimeoutLayer layer) {
        return Deadline{Clock::now() + duration, layer};
    }

    Deadline nested(std::chrono::milliseconds slot, TimeoutLayer child_layer) const {
        Deadline child{Clock::now() + slot, child_layer};
        if (child.at <= at) {
            return child;
        }
        return *this;
    }

    std::chrono::milliseconds remaining() const {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(at - Clock::now());
        return std::max(left, std::chrono::milliseconds{0});
    }

    bool expired() const {
        return Clock::now() >= at;
    }
};

// ============================================================================
// Calculator
// ============================================================================

/**
 * @brief Derives and validates the nested timeout hierarchy.
 *
 * Pure and stateless. The Server validates its configuration through this
 * class at construction, so an inverted hierarchy never reaches execution.
 */
class TimeoutBudgetCalculator {
public:
    static constexpr std::chrono::milliseconds kMaxSlot{3600 * 1000};

    static Expected<TimeoutBudget> compute(const TimeoutConfig& config) {
        if (config.base.count() <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Base timeout must be positive"});
        }
        for (double ratio : {config.session_ratio, config.dispatch_ratio,
                             config.workflow_step_ratio, config.provider_call_ratio}) {
            if (!(ratio > 0.0) || !std::isfinite(ratio)) {
                return tl::unexpected(Error{ErrorCode::InvalidConfig, "Timeout ratios must be positive"});
            }
        }

        TimeoutBudget budget;
        budget.session = config.session_override.value_or(scale(config.base, config.session_ratio));
        budget.dispatch = config.dispatch_override.value_or(scale(config.base, config.dispatch_ratio));
        budget.workflow_step = config.workflow_step_override.value_or(
            scale(config.base, config.workflow_step_ratio));
        budget.provider_call = config.provider_call_override.value_or(
            scale(config.base, config.provider_call_ratio));

        auto valid = validate(budget);
        if (!valid) {
            return tl::unexpected(valid.error());
        }
        return budget;
    }

    static Expected<void> validate(const TimeoutBudget& budget) {
        for (auto layer : {TimeoutLayer::Session, TimeoutLayer::Dispatch,
                           TimeoutLayer::WorkflowStep, TimeoutLayer::ProviderCall}) {
            auto value = budget.slot(layer);
            if (value.count() <= 0) {
                return tl::unexpected(Error{
                    ErrorCode::InvalidConfig,
                    std::string("Timeout for layer '") + timeout_layer_to_string(layer) + "' must be positive"
                });
            }
            if (value > kMaxSlot) {
                return tl::unexpected(Error{
                    ErrorCode::InvalidConfig,
                    std::string("Timeout for layer '") + timeout_layer_to_string(layer) +
                        "' exceeds the maximum of 3600s",
                    std::to_string(value.count()) + "ms"
                });
            }
        }

        if (budget.provider_call > budget.workflow_step) {
            return inverted("provider-call", budget.provider_call, "workflow-step", budget.workflow_step);
        }
        if (budget.workflow_step > budget.dispatch) {
            return inverted("workflow-step", budget.workflow_step, "dispatch", budget.dispatch);
        }
        if (budget.dispatch > budget.session) {
            return inverted("dispatch", budget.dispatch, "session", budget.session);
        }
        return {};
    }

private:
    static std::chrono::milliseconds scale(std::chrono::milliseconds base, double ratio) {
        return std::chrono::milliseconds{
            static_cast<std::chrono::milliseconds::rep>(std::llround(static_cast<double>(base.count()) * ratio))
        };
    }

    static tl::unexpected<Error> inverted(const char* inner, std::chrono::milliseconds inner_value,
                                          const char* outer, std::chrono::milliseconds outer_value) {
        return tl::unexpected(Error{
            ErrorCode::InvalidTimeoutHierarchy,
            std::string("Timeout for '") + inner + "' exceeds its parent '" + outer + "'",
            std::to_string(inner_value.count()) + "ms > " + std::to_string(outer_value.count()) + "ms"
        });
    }
};

} // namespace engine
} // namespace warden
