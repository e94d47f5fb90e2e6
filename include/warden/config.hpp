#pragma once

#include "engine/timeout_budget.hpp"
#include "log.hpp"
#include "types.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#define WARDEN_VERSION "0.3.0"

namespace warden {

/**
 * @brief Process-wide configuration, read once at startup.
 *
 * Passed by value into the calculator, executor, dispatcher and session
 * manager; never mutated afterwards.
 */
struct Config {
    // Identity
    std::string server_name = "warden";                      ///< Reported in hello_ack
    std::string version = WARDEN_VERSION;

    // Timeouts
    engine::TimeoutConfig timeouts;                          ///< Base duration, ratios and overrides

    // Expert analysis
    std::optional<std::string> default_effort;               ///< Process default effort (minimal if unset)
    std::chrono::milliseconds heartbeat_interval{2000};      ///< Progress cadence while awaiting a provider

    // Concurrency
    size_t max_in_flight_per_channel = 4;                    ///< Call workers per channel
    size_t max_queued_per_channel = 64;                      ///< Calls waiting for a worker before Overloaded
    size_t max_in_flight_total = 16;                         ///< 0 = unlimited
    std::chrono::milliseconds queue_timeout{10000};          ///< Max wait for a worker and permit before Overloaded

    // Tool names
    std::vector<std::string> tool_name_suffixes;             ///< Alias suffixes stripped on lookup

    // Observation
    std::optional<std::string> audit_db_path;                ///< SQLite audit file; in-memory when unset
    bool model_scoring = false;                              ///< Score outcomes with the provider instead of heuristics
    std::chrono::milliseconds scoring_timeout{15000};        ///< Deadline for one model-scoring call

    /// Base timeouts below this are accepted with a warning.
    static constexpr std::chrono::milliseconds kLowBaseWarning{5000};

    // Validation
    Expected<void> validate() const {
        if (server_name.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "server_name cannot be empty"});
        }
        auto budget = engine::TimeoutBudgetCalculator::compute(timeouts);
        if (!budget) {
            return tl::unexpected(budget.error());
        }
        if (heartbeat_interval.count() < 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "heartbeat_interval must be >= 0"});
        }
        if (queue_timeout.count() < 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "queue_timeout must be >= 0"});
        }
        if (max_in_flight_per_channel == 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "max_in_flight_per_channel must be at least 1"});
        }
        if (max_queued_per_channel == 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "max_queued_per_channel must be at least 1"});
        }
        if (max_in_flight_total > 0 && max_in_flight_per_channel > max_in_flight_total) {
            return tl::unexpected(Error{
                ErrorCode::InvalidConfig,
                "max_in_flight_per_channel cannot exceed max_in_flight_total"
            });
        }
        if (model_scoring && scoring_timeout.count() <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "scoring_timeout must be positive"});
        }
        if (audit_db_path.has_value() && audit_db_path->empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "audit_db_path cannot be empty"});
        }

        if (timeouts.base < kLowBaseWarning) {
            log_warn("Base timeout of " + std::to_string(timeouts.base.count()) +
                     "ms is below 5s; workflow steps are likely to time out");
        }
        if (default_effort.has_value() && !effort_from_string(*default_effort)) {
            log_warn("Configured default effort '" + *default_effort +
                     "' is not recognized; 'minimal' will be used");
        }
        return {};
    }

    /**
     * @brief Read a configuration object; absent keys keep their defaults.
     *
     * Durations are given in milliseconds (`*_ms`) except `timeout_seconds`,
     * which sets the base B.
     */
    static Expected<Config> from_json(const nlohmann::json& j) {
        if (!j.is_object()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Configuration must be a JSON object"});
        }

        Config config;
        try {
            config.server_name = j.value("server_name", config.server_name);
            if (j.contains("timeout_seconds")) {
                config.timeouts.base = std::chrono::milliseconds{
                    static_cast<int64_t>(j["timeout_seconds"].get<double>() * 1000.0)
                };
            }
            if (j.contains("timeout_ms")) {
                config.timeouts.base = std::chrono::milliseconds{j["timeout_ms"].get<int64_t>()};
            }
            if (j.contains("ratios")) {
                const auto& ratios = j["ratios"];
                config.timeouts.session_ratio = ratios.value("session", config.timeouts.session_ratio);
                config.timeouts.dispatch_ratio = ratios.value("dispatch", config.timeouts.dispatch_ratio);
                config.timeouts.workflow_step_ratio =
                    ratios.value("workflow_step", config.timeouts.workflow_step_ratio);
                config.timeouts.provider_call_ratio =
                    ratios.value("provider_call", config.timeouts.provider_call_ratio);
            }
            if (j.contains("overrides_ms")) {
                const auto& overrides = j["overrides_ms"];
                read_override(overrides, "session", config.timeouts.session_override);
                read_override(overrides, "dispatch", config.timeouts.dispatch_override);
                read_override(overrides, "workflow_step", config.timeouts.workflow_step_override);
                read_override(overrides, "provider_call", config.timeouts.provider_call_override);
            }
            if (j.contains("default_effort") && !j["default_effort"].is_null()) {
                config.default_effort = j["default_effort"].get<std::string>();
            }
            if (j.contains("heartbeat_interval_ms")) {
                config.heartbeat_interval = std::chrono::milliseconds{j["heartbeat_interval_ms"].get<int64_t>()};
            }
            config.max_in_flight_per_channel =
                j.value("max_in_flight_per_channel", config.max_in_flight_per_channel);
            config.max_queued_per_channel = j.value("max_queued_per_channel", config.max_queued_per_channel);
            config.max_in_flight_total = j.value("max_in_flight_total", config.max_in_flight_total);
            if (j.contains("queue_timeout_ms")) {
                config.queue_timeout = std::chrono::milliseconds{j["queue_timeout_ms"].get<int64_t>()};
            }
            if (j.contains("tool_name_suffixes")) {
                config.tool_name_suffixes = j["tool_name_suffixes"].get<std::vector<std::string>>();
            }
            if (j.contains("audit_db_path") && !j["audit_db_path"].is_null()) {
                config.audit_db_path = j["audit_db_path"].get<std::string>();
            }
            config.model_scoring = j.value("model_scoring", config.model_scoring);
            if (j.contains("scoring_timeout_ms")) {
                config.scoring_timeout = std::chrono::milliseconds{j["scoring_timeout_ms"].get<int64_t>()};
            }
        } catch (const nlohmann::json::exception& e) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Invalid configuration value", e.what()});
        }
        return config;
    }

    /** @brief Limits reported to clients in hello_ack. */
    nlohmann::json limits_json() const {
        nlohmann::json limits{
            {"max_in_flight_per_channel", max_in_flight_per_channel},
            {"max_queued_per_channel", max_queued_per_channel},
            {"max_in_flight_total", max_in_flight_total},
            {"queue_timeout_ms", queue_timeout.count()}
        };
        if (auto budget = engine::TimeoutBudgetCalculator::compute(timeouts)) {
            limits["timeouts"] = budget->to_json();
        }
        return limits;
    }

    // Equality for testing
    bool operator==(const Config& other) const {
        return server_name == other.server_name &&
               version == other.version &&
               timeouts == other.timeouts &&
               default_effort == other.default_effort &&
               heartbeat_interval == other.heartbeat_interval &&
               max_in_flight_per_channel == other.max_in_flight_per_channel &&
               max_queued_per_channel == other.max_queued_per_channel &&
               max_in_flight_total == other.max_in_flight_total &&
               queue_timeout == other.queue_timeout &&
               tool_name_suffixes == other.tool_name_suffixes &&
               audit_db_path == other.audit_db_path &&
               model_scoring == other.model_scoring &&
               scoring_timeout == other.scoring_timeout;
    }

    bool operator!=(const Config& other) const {
        return !(*this == other);
    }

private:
    static void read_override(const nlohmann::json& overrides, const char* key,
                              std::optional<std::chrono::milliseconds>& slot) {
        if (overrides.contains(key) && !overrides[key].is_null()) {
            slot = std::chrono::milliseconds{overrides[key].get<int64_t>()};
        }
    }
};

} // namespace warden
