#pragma once

#include "../log.hpp"
#include "../provider/interface.hpp"
#include "../types.hpp"
#include "argument_validator.hpp"
#include "call_context.hpp"
#include "cancellation.hpp"
#include "deadline_runner.hpp"
#include "expert_analysis.hpp"
#include "provider_guard.hpp"
#include "timeout_budget.hpp"
#include "tool_registry.hpp"
#include <chrono>
#include <exception>
#include <memory>
#include <mutex>
#include <string>

namespace warden {
namespace engine {

/**
 * @brief Routes one ToolCall to its handler and converts the result to an Outcome.
 *
 * The dispatch slot bounds the whole handler invocation, nested inside the
 * caller's deadline. Whatever the handler does (return, fail, throw, hang),
 * dispatch() returns exactly one Outcome no later than kHandlerGrace past the
 * effective deadline. Handlers see the deadline itself, so a timeout raised
 * inside the handler (which carries its diagnostics) is reported ahead of
 * the dispatcher's own. Progress updates are forwarded only until dispatch()
 * returns.
 *
 * @threadsafety dispatch() may be called concurrently
 */
class RequestDispatcher {
public:
    /** @brief How long the runner outlasts the handler's deadline. */
    static constexpr std::chrono::milliseconds kHandlerGrace{50};

    struct Dependencies {
        std::shared_ptr<ToolRegistry> registry;
        std::shared_ptr<provider::IProvider> provider;        ///< May be null
        std::shared_ptr<ProviderCallGuard> guard;             ///< Created when null
        std::shared_ptr<ExpertAnalysisExecutor> expert;       ///< May be null
    };

    /**
     * @brief Create a dispatcher with a validated timeout budget.
     *
     * @return Expected<std::unique_ptr<RequestDispatcher>> The dispatcher, or
     *         InvalidConfig/InvalidTimeoutHierarchy
     */
    static Expected<std::unique_ptr<RequestDispatcher>> create(const TimeoutConfig& timeouts,
                                                                Dependencies deps) {
        if (!deps.registry) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Dispatcher requires a tool registry"});
        }
        auto budget = TimeoutBudgetCalculator::compute(timeouts);
        if (!budget) {
            return tl::unexpected(budget.error());
        }
        if (!deps.guard) {
            deps.guard = std::make_shared<ProviderCallGuard>();
        }
        return std::unique_ptr<RequestDispatcher>(new RequestDispatcher(timeouts, *budget, std::move(deps)));
    }

    RequestDispatcher(const RequestDispatcher&) = delete;
    RequestDispatcher& operator=(const RequestDispatcher&) = delete;

    /**
     * @brief Execute a call under the caller's deadline.
     *
     * @param parent Enclosing deadline (normally the session ceiling)
     * @param cancel Caller's token; firing it yields a Cancelled outcome
     * @param progress Receives intermediate updates, never after return
     */
    Outcome dispatch(const ToolCall& call, const Deadline& parent, const CancellationToken& cancel,
                     ProgressSink progress = nullptr) {
        auto handler = deps_.registry->resolve(call.tool_name);
        if (!handler) {
            log_info("Unknown tool '" + call.tool_name + "' (call " + call.call_id + ")");
            return Outcome::failure(ErrorCode::UnknownTool, "Unknown tool: " + call.tool_name, call.elapsed());
        }

        auto invalid = ArgumentValidator::validate(call.parameters, handler->parameters_schema());
        if (!invalid.empty()) {
            return Outcome::failure(ErrorCode::InvalidParameters, invalid, call.elapsed());
        }

        const auto budget = fresh_budget();
        auto gate = std::make_shared<ProgressGate>();
        gate->sink = std::move(progress);

        const auto deadline = parent.nested(budget.dispatch, TimeoutLayer::Dispatch);
        log_debug("Dispatching '" + handler->name() + "' (call " + call.call_id + "), " +
                  std::to_string(deadline.remaining().count()) + "ms remaining");

        auto work = [handler, call, deadline, gate, budget, deps = deps_](
                        const CancellationToken& token) -> Expected<nlohmann::json> {
            CallContext ctx;
            ctx.call = call;
            ctx.budget = budget;
            ctx.deadline = deadline;
            ctx.cancel = token;
            ctx.progress = [gate](const ProgressUpdate& update) { gate->forward(update); };
            ctx.provider = deps.provider;
            ctx.guard = deps.guard;
            ctx.expert = deps.expert;
            try {
                return handler->invoke(ctx);
            } catch (const std::exception& e) {
                return tl::unexpected(Error{
                    ErrorCode::ToolExecutionFailed,
                    "Tool '" + handler->name() + "' threw an exception",
                    e.what()
                });
            } catch (...) {
                return tl::unexpected(Error{
                    ErrorCode::ToolExecutionFailed,
                    "Tool '" + handler->name() + "' threw a non-standard exception"
                });
            }
        };

        const Deadline outer{deadline.at + kHandlerGrace, deadline.layer};
        auto run = runner_.run<Expected<nlohmann::json>>(std::move(work), outer, cancel);
        gate->close();

        const auto elapsed = call.elapsed();
        switch (run.status) {
            case RunStatus::Completed: {
                auto& result = *run.value;
                if (result) {
                    return Outcome::success(std::move(*result), elapsed);
                }
                return Outcome::from_error(result.error(), elapsed);
            }
            case RunStatus::DeadlineExceeded:
                log_warn("Call " + call.call_id + " to '" + handler->name() + "' exceeded the " +
                         timeout_layer_to_string(deadline.layer) + " deadline after " +
                         std::to_string(elapsed.count()) + "ms");
                return Outcome::timeout(deadline.layer, elapsed,
                                        std::string("Tool '") + handler->name() + "' exceeded the " +
                                            timeout_layer_to_string(deadline.layer) + " deadline");
            case RunStatus::Cancelled:
                return Outcome::cancelled(run.detail.empty() ? "Call cancelled" : run.detail, elapsed);
            case RunStatus::WorkerUnavailable:
                break;
        }
        return Outcome::failure(ErrorCode::ToolExecutionFailed,
                                "Could not start worker for '" + handler->name() + "': " + run.detail,
                                elapsed);
    }

    /**
     * @brief Execute a call bounded only by its own session ceiling.
     */
    Outcome dispatch(const ToolCall& call) {
        return dispatch(call, session_deadline(call), CancellationToken{});
    }

    /** @brief Session ceiling measured from the call's arrival. */
    Deadline session_deadline(const ToolCall& call) const {
        return Deadline{call.received_at + fresh_budget().session, TimeoutLayer::Session};
    }

    TimeoutBudget budget() const { return fresh_budget(); }
    const TimeoutConfig& timeouts() const { return timeouts_; }
    const ToolRegistry& registry() const { return *deps_.registry; }

    /** @brief Handler workers abandoned after a timeout that are still running. */
    size_t outstanding() {
        return runner_.outstanding();
    }

private:
    struct ProgressGate {
        std::mutex mutex;
        bool open = true;
        ProgressSink sink;

        void forward(const ProgressUpdate& update) {
            std::lock_guard<std::mutex> lock(mutex);
            if (open && sink) {
                sink(update);
            }
        }

        void close() {
            std::lock_guard<std::mutex> lock(mutex);
            open = false;
        }
    };

    RequestDispatcher(TimeoutConfig timeouts, TimeoutBudget validated, Dependencies deps)
        : timeouts_(std::move(timeouts))
        , validated_(validated)
        , deps_(std::move(deps))
    {}

    // Budgets are derived per call; the configuration was validated in create()
    TimeoutBudget fresh_budget() const {
        auto budget = TimeoutBudgetCalculator::compute(timeouts_);
        return budget ? *budget : validated_;
    }

    TimeoutConfig timeouts_;
    TimeoutBudget validated_;
    Dependencies deps_;
    DeadlineRunner runner_;
};

} // namespace engine
} // namespace warden
