#pragma once

#include "../provider/interface.hpp"
#include "../types.hpp"
#include "cancellation.hpp"
#include "expert_analysis.hpp"
#include "provider_guard.hpp"
#include "timeout_budget.hpp"
#include <memory>
#include <string>

namespace warden {
namespace engine {

/**
 * @brief Everything a handler may use while executing one call.
 *
 * Built by the dispatcher on the handler's worker thread. Provider access
 * goes through the guard with the provider-call slot nested inside the
 * dispatch deadline.
 */
struct CallContext {
    ToolCall call;
    TimeoutBudget budget;
    Deadline deadline;                                   ///< Effective dispatch deadline
    CancellationToken cancel;                            ///< Cancelled on deadline expiry or teardown
    ProgressSink progress;
    std::shared_ptr<provider::IProvider> provider;       ///< May be null
    std::shared_ptr<ProviderCallGuard> guard;
    std::shared_ptr<ExpertAnalysisExecutor> expert;      ///< May be null

    void report(int step_index, int step_total, std::string note) const {
        if (progress) {
            progress(ProgressUpdate{call.call_id, step_index, step_total, std::move(note)});
        }
    }

    /**
     * @brief Call the configured provider under the provider-call slot.
     */
    Expected<std::string> generate(const std::string& prompt,
                                   const nlohmann::json& parameters = nlohmann::json::object()) const {
        if (!provider || !guard) {
            return tl::unexpected(Error{ErrorCode::ProviderError, "No provider configured"});
        }
        return guard->generate(provider, prompt, parameters,
                               deadline.nested(budget.provider_call, TimeoutLayer::ProviderCall),
                               cancel);
    }
};

} // namespace engine
} // namespace warden
