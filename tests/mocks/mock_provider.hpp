#pragma once

#include "warden/provider/interface.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace warden {
namespace testing {

/**
 * @brief Mock model provider for unit testing
 *
 * No network access. Supports:
 * - Pre-programmed responses (queued, then a default)
 * - Delayed responses that honour cancellation
 * - Hanging until cancelled, or stalling while ignoring cancellation
 * - Error and exception injection
 *
 * Every generate() call is recorded. Configure before use; recorded state is
 * guarded so it can be read while calls are running.
 */
class MockProvider : public provider::IProvider {
public:
    enum class ResponseMode {
        Respond,    // Return the next queued response (or default_response)
        Delay,      // Wait delay_ms (cancellable), then respond
        Hang,       // Block until cancelled
        Stall,      // Sleep stall_ms ignoring cancellation, then respond
        Fail,       // Return ProviderError
        Throw       // Throw std::runtime_error
    };

    explicit MockProvider(std::string name = "mock")
        : name_(std::move(name))
    {}

    // Configuration
    ResponseMode mode = ResponseMode::Respond;
    std::string default_response = R"({"summary": "looks fine"})";
    int delay_ms = 0;
    int stall_ms = 0;
    std::string error_message = "Mock provider error";

    void enqueue_response(std::string response) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_.push(std::move(response));
    }

    std::string name() const override { return name_; }

    Expected<std::string> generate(const std::string& prompt,
                                   const nlohmann::json& parameters,
                                   const engine::Deadline&,
                                   const engine::CancellationToken& cancel) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            prompts_.push_back(prompt);
            parameters_.push_back(parameters);
        }
        calls_.fetch_add(1);

        switch (mode) {
            case ResponseMode::Respond:
                break;
            case ResponseMode::Delay:
                if (cancel.wait_for(std::chrono::milliseconds(delay_ms))) {
                    return cancelled(cancel);
                }
                break;
            case ResponseMode::Hang:
                while (!cancel.wait_for(std::chrono::milliseconds(50))) {
                }
                return cancelled(cancel);
            case ResponseMode::Stall:
                std::this_thread::sleep_for(std::chrono::milliseconds(stall_ms));
                if (cancel.is_cancelled()) {
                    saw_cancel_.store(true);
                }
                break;
            case ResponseMode::Fail:
                return tl::unexpected(Error{ErrorCode::ProviderError, error_message});
            case ResponseMode::Throw:
                throw std::runtime_error(error_message);
        }

        completed_.fetch_add(1);
        std::lock_guard<std::mutex> lock(mutex_);
        if (!responses_.empty()) {
            std::string response = std::move(responses_.front());
            responses_.pop();
            return response;
        }
        return default_response;
    }

    // ========================================================================
    // Test helpers
    // ========================================================================

    int calls() const { return calls_.load(); }
    int completed() const { return completed_.load(); }

    /** @brief True once any call observed its cancellation token fire. */
    bool saw_cancel() const { return saw_cancel_.load(); }

    std::string last_prompt() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return prompts_.empty() ? "" : prompts_.back();
    }

    nlohmann::json last_parameters() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return parameters_.empty() ? nlohmann::json() : parameters_.back();
    }

private:
    tl::unexpected<Error> cancelled(const engine::CancellationToken& cancel) {
        saw_cancel_.store(true);
        return tl::unexpected(Error{ErrorCode::Cancelled, "Mock provider cancelled", cancel.reason()});
    }

    std::string name_;
    mutable std::mutex mutex_;
    std::queue<std::string> responses_;
    std::vector<std::string> prompts_;
    std::vector<nlohmann::json> parameters_;
    std::atomic<int> calls_{0};
    std::atomic<int> completed_{0};
    std::atomic<bool> saw_cancel_{false};
};

} // namespace testing
} // namespace warden
