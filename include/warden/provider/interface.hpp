#pragma once

#include "../types.hpp"
#include "../engine/cancellation.hpp"
#include "../engine/timeout_budget.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace warden {
namespace provider {

/**
 * @brief Abstract interface for external model providers
 *
 * Concrete clients (HTTP APIs, local runtimes) live outside this library and
 * are injected into the Server. Every call reaches a provider through
 * engine::ProviderCallGuard, which enforces the deadline independently of
 * the implementation.
 *
 * Design principles:
 * - Reentrant: generate() may be called concurrently from several calls
 * - Cooperative: implementations should return promptly once `cancel` fires
 * - Opaque: prompts and response formats are tool-level concerns
 */
class IProvider {
public:
    virtual ~IProvider() = default;

    /**
     * @brief Provider name used in logs, errors and audit records
     */
    virtual std::string name() const = 0;

    /**
     * @brief Generate a completion for a prompt
     *
     * @param prompt Fully rendered prompt text
     * @param parameters Request parameters (thinking_mode, reasoning_budget, model, ...)
     * @param deadline Absolute deadline the guard will enforce
     * @param cancel Signalled when the caller abandons the request
     * @return Expected<std::string> Generated text, or ProviderError/ProviderTimeout
     */
    virtual Expected<std::string> generate(
        const std::string& prompt,
        const nlohmann::json& parameters,
        const engine::Deadline& deadline,
        const engine::CancellationToken& cancel
    ) = 0;
};

} // namespace provider
} // namespace warden
