#pragma once

#include "../log.hpp"
#include "../provider/interface.hpp"
#include "../types.hpp"
#include "cancellation.hpp"
#include "deadline_runner.hpp"
#include "timeout_budget.hpp"
#include <exception>
#include <functional>
#include <memory>
#include <string>

namespace warden {
namespace engine {

/**
 * @brief Single chokepoint for every outbound dependency call.
 *
 * Runs the call on a worker thread and returns at or before the deadline.
 * On expiry the call's cancellation token is signalled so the dependency can
 * release its resources; the worker is joined once it exits (at the latest
 * when the guard is destroyed).
 *
 * Error contract:
 * - ProviderTimeout tagged with the deadline's layer on expiry
 * - ProviderError wrapping any other dependency error or exception
 * - Cancelled when the caller's token fires first
 *
 * @threadsafety call() and generate() are thread-safe
 */
class ProviderCallGuard {
public:
    using Call = std::function<Expected<std::string>(const CancellationToken&)>;

    Expected<std::string> call(Call fn, const Deadline& deadline, const CancellationToken& cancel,
                               const std::string& label = "provider", const Heartbeat& heartbeat = {}) {
        auto work = [fn = std::move(fn), label, deadline](const CancellationToken& token) -> Expected<std::string> {
            try {
                auto result = fn(token);
                if (result) {
                    return result;
                }
                return tl::unexpected(reclassify(result.error(), label, deadline, token));
            } catch (const std::exception& e) {
                return tl::unexpected(Error{
                    ErrorCode::ProviderError,
                    "Provider '" + label + "' threw an exception",
                    e.what()
                });
            } catch (...) {
                return tl::unexpected(Error{
                    ErrorCode::ProviderError,
                    "Provider '" + label + "' threw a non-standard exception"
                });
            }
        };

        auto run = runner_.run<Expected<std::string>>(std::move(work), deadline, cancel, heartbeat);
        switch (run.status) {
            case RunStatus::Completed:
                return std::move(*run.value);
            case RunStatus::DeadlineExceeded: {
                log_warn("Provider '" + label + "' exceeded the " +
                         timeout_layer_to_string(deadline.layer) + " deadline after " +
                         std::to_string(run.elapsed.count()) + "ms; call cancelled");
                return tl::unexpected(Error::timeout(
                    ErrorCode::ProviderTimeout, deadline.layer,
                    "Provider '" + label + "' did not respond within the " +
                        timeout_layer_to_string(deadline.layer) + " deadline"));
            }
            case RunStatus::Cancelled:
                return tl::unexpected(Error{
                    ErrorCode::Cancelled,
                    "Provider '" + label + "' call cancelled",
                    run.detail
                });
            case RunStatus::WorkerUnavailable:
                break;
        }
        return tl::unexpected(Error{
            ErrorCode::ProviderError,
            "Provider '" + label + "' could not be started",
            run.detail
        });
    }

    Expected<std::string> generate(std::shared_ptr<provider::IProvider> provider, const std::string& prompt,
                                   const nlohmann::json& parameters, const Deadline& deadline,
                                   const CancellationToken& cancel, const Heartbeat& heartbeat = {}) {
        return call(
            [provider, prompt, parameters, deadline](const CancellationToken& token) {
                return provider->generate(prompt, parameters, deadline, token);
            },
            deadline, cancel, provider->name(), heartbeat);
    }

    /** @brief Abandoned calls whose worker has not exited yet. */
    size_t outstanding() {
        return runner_.outstanding();
    }

private:
    static Error reclassify(const Error& raw, const std::string& label, const Deadline& deadline,
                            const CancellationToken& token) {
        if (raw.code == ErrorCode::ProviderTimeout) {
            Error error = Error::timeout(ErrorCode::ProviderTimeout,
                                         raw.timeout_layer.value_or(deadline.layer), raw.message);
            error.context = raw.context;
            return error;
        }
        if (raw.code == ErrorCode::Cancelled && token.is_cancelled()) {
            return raw;
        }
        if (raw.code == ErrorCode::ProviderError) {
            return raw;
        }
        return Error{ErrorCode::ProviderError, "Provider '" + label + "' failed: " + raw.message,
                     raw.to_string()};
    }

    DeadlineRunner runner_;
};

} // namespace engine
} // namespace warden
