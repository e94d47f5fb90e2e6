#pragma once

#include <cctype>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

namespace warden {

using Clock = std::chrono::steady_clock;

// ============================================================================
// Timeout Layers
// ============================================================================

/**
 * @brief Layer of the nested timeout hierarchy, outermost first.
 */
enum class TimeoutLayer {
    Session,       ///< Whole call lifetime as seen by the connection
    Dispatch,      ///< Backstop around the handler invocation
    WorkflowStep,  ///< A single workflow step (expert analysis)
    ProviderCall   ///< One outbound provider request
};

[[nodiscard]] inline const char* timeout_layer_to_string(TimeoutLayer layer) {
    switch (layer) {
        case TimeoutLayer::Session: return "session";
        case TimeoutLayer::Dispatch: return "dispatch";
        case TimeoutLayer::WorkflowStep: return "workflow-step";
        case TimeoutLayer::ProviderCall: return "provider-call";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<TimeoutLayer> timeout_layer_from_string(std::string_view name) {
    if (name == "session") return TimeoutLayer::Session;
    if (name == "dispatch") return TimeoutLayer::Dispatch;
    if (name == "workflow-step") return TimeoutLayer::WorkflowStep;
    if (name == "provider-call") return TimeoutLayer::ProviderCall;
    return std::nullopt;
}

// ============================================================================
// Error Types
// ============================================================================

/**
 * @brief Error codes organized by category range
 *
 * - 100-199: Configuration errors
 * - 200-299: Provider errors
 * - 300-399: Workflow/engine errors
 * - 400-499: Runtime/request errors
 * - 500-599: Tool errors
 * - 600-699: Session/protocol errors
 * - 700-799: Observer/audit errors
 */
enum class ErrorCode {
    // Configuration errors (100-199)
    InvalidConfig = 100,
    InvalidTimeoutHierarchy = 101,

    // Provider errors (200-299)
    ProviderError = 200,
    ProviderTimeout = 201,

    // Workflow errors (300-399)
    InvalidStateTransition = 300,
    CallIdentityMismatch = 301,

    // Runtime errors (400-499)
    Timeout = 400,
    Cancelled = 401,
    Overloaded = 402,
    ServerNotRunning = 403,

    // Tool errors (500-599)
    UnknownTool = 500,
    ToolExecutionFailed = 501,
    InvalidParameters = 502,

    // Session errors (600-699)
    ChannelFailed = 600,
    ProtocolError = 601,
    DuplicateCallId = 602,
    ChannelClosed = 603,

    // Observer errors (700-799)
    ScoringFailed = 700,
    AuditWriteFailed = 701,

    // Unknown
    Unknown = 999
};

[[nodiscard]] inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidConfig: return "InvalidConfig";
        case ErrorCode::InvalidTimeoutHierarchy: return "InvalidTimeoutHierarchy";
        case ErrorCode::ProviderError: return "ProviderError";
        case ErrorCode::ProviderTimeout: return "ProviderTimeout";
        case ErrorCode::InvalidStateTransition: return "InvalidStateTransition";
        case ErrorCode::CallIdentityMismatch: return "CallIdentityMismatch";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::Overloaded: return "Overloaded";
        case ErrorCode::ServerNotRunning: return "ServerNotRunning";
        case ErrorCode::UnknownTool: return "UnknownTool";
        case ErrorCode::ToolExecutionFailed: return "ToolExecutionFailed";
        case ErrorCode::InvalidParameters: return "InvalidParameters";
        case ErrorCode::ChannelFailed: return "ChannelFailed";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::DuplicateCallId: return "DuplicateCallId";
        case ErrorCode::ChannelClosed: return "ChannelClosed";
        case ErrorCode::ScoringFailed: return "ScoringFailed";
        case ErrorCode::AuditWriteFailed: return "AuditWriteFailed";
        case ErrorCode::Unknown: return "Unknown";
    }
    return "Unknown";
}

/**
 * @brief Error information with code, message, and optional context
 *
 * Value type used with tl::expected. Timeout-class errors carry the layer
 * whose deadline fired; workflow errors may carry partial results in
 * `diagnostics` so callers see the work completed before the failure.
 */
struct Error {
    ErrorCode code;                             ///< Categorized error code
    std::string message;                        ///< Human-readable error description
    std::optional<std::string> context;         ///< Additional context (e.g., raw dependency error)
    std::optional<TimeoutLayer> timeout_layer;  ///< Layer that timed out (timeout-class errors only)
    nlohmann::json diagnostics;                 ///< Partial results, null when absent

    Error(ErrorCode code, std::string message, std::optional<std::string> context = std::nullopt)
        : code(code), message(std::move(message)), context(std::move(context)) {}

    static Error timeout(ErrorCode code, TimeoutLayer layer, std::string message) {
        Error error(code, std::move(message));
        error.timeout_layer = layer;
        return error;
    }

    bool is_timeout() const {
        return code == ErrorCode::ProviderTimeout || code == ErrorCode::Timeout;
    }

    std::string to_string() const {
        std::string result = "[" + std::to_string(static_cast<int>(code)) + "] " + message;
        if (timeout_layer.has_value()) {
            result += " (layer: " + std::string(timeout_layer_to_string(*timeout_layer)) + ")";
        }
        if (context.has_value()) {
            result += " | Context: " + *context;
        }
        return result;
    }
};

// Expected type alias
template<typename T>
using Expected = tl::expected<T, Error>;

// ============================================================================
// Effort Levels
// ============================================================================

/**
 * @brief Depth of reasoning requested from the expert-analysis provider call.
 */
enum class Effort {
    Minimal,
    Low,
    Medium,
    High,
    Max
};

[[nodiscard]] inline const char* effort_to_string(Effort effort) {
    switch (effort) {
        case Effort::Minimal: return "minimal";
        case Effort::Low: return "low";
        case Effort::Medium: return "medium";
        case Effort::High: return "high";
        case Effort::Max: return "max";
    }
    return "minimal";
}

/// Case-insensitive; surrounding whitespace is ignored.
[[nodiscard]] inline std::optional<Effort> effort_from_string(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    std::string lowered(text);
    for (auto& c : lowered) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lowered == "minimal") return Effort::Minimal;
    if (lowered == "low") return Effort::Low;
    if (lowered == "medium") return Effort::Medium;
    if (lowered == "high") return Effort::High;
    if (lowered == "max") return Effort::Max;
    return std::nullopt;
}

// ============================================================================
// Tool Calls
// ============================================================================

/**
 * @brief One client-initiated request to execute a named tool.
 *
 * Immutable after creation. The effort level is kept as the raw string the
 * client sent; resolution (and the warning for unrecognized values) happens
 * in the expert-analysis executor.
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct ToolCall {
    std::string call_id;                        ///< Unique per invocation on a channel
    std::string session_id;                     ///< Owning session (empty for in-process calls)
    std::string tool_name;                      ///< Requested tool name, possibly with an alias suffix
    nlohmann::json parameters = nlohmann::json::object(); ///< Opaque input parameters
    std::optional<std::string> effort;          ///< Requested effort level as sent
    Clock::time_point received_at = Clock::now(); ///< Arrival timestamp

    static ToolCall make(std::string call_id, std::string tool_name,
                         nlohmann::json parameters = nlohmann::json::object(),
                         std::optional<std::string> effort = std::nullopt) {
        ToolCall call;
        call.call_id = std::move(call_id);
        call.tool_name = std::move(tool_name);
        call.parameters = std::move(parameters);
        call.effort = std::move(effort);
        return call;
    }

    std::chrono::milliseconds elapsed() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - received_at);
    }
};

// ============================================================================
// Outcomes
// ============================================================================

enum class OutcomeStatus {
    Success,
    Failure,
    Timeout,
    Cancelled
};

[[nodiscard]] inline const char* outcome_status_to_string(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::Success: return "success";
        case OutcomeStatus::Failure: return "failure";
        case OutcomeStatus::Timeout: return "timeout";
        case OutcomeStatus::Cancelled: return "cancelled";
    }
    return "failure";
}

/**
 * @brief The single terminal result produced for a ToolCall.
 *
 * @threadsafety Immutable value; delivery and observation read separate copies
 */
struct Outcome {
    OutcomeStatus status = OutcomeStatus::Failure;
    nlohmann::json payload;                     ///< Success payload
    std::optional<ErrorCode> error_kind;        ///< Failure classification
    std::string message;                        ///< Failure/cancellation message
    std::optional<TimeoutLayer> timeout_layer;  ///< Layer whose deadline fired
    std::chrono::milliseconds elapsed{0};       ///< Total elapsed since arrival
    nlohmann::json diagnostics;                 ///< Partial results, null when absent

    static Outcome success(nlohmann::json payload, std::chrono::milliseconds elapsed) {
        Outcome outcome;
        outcome.status = OutcomeStatus::Success;
        outcome.payload = std::move(payload);
        outcome.elapsed = elapsed;
        return outcome;
    }

    static Outcome failure(ErrorCode kind, std::string message, std::chrono::milliseconds elapsed,
                           nlohmann::json diagnostics = nullptr) {
        Outcome outcome;
        outcome.status = OutcomeStatus::Failure;
        outcome.error_kind = kind;
        outcome.message = std::move(message);
        outcome.elapsed = elapsed;
        outcome.diagnostics = std::move(diagnostics);
        return outcome;
    }

    static Outcome timeout(TimeoutLayer layer, std::chrono::milliseconds elapsed,
                           std::string message = {}, nlohmann::json diagnostics = nullptr) {
        Outcome outcome;
        outcome.status = OutcomeStatus::Timeout;
        outcome.timeout_layer = layer;
        outcome.message = std::move(message);
        outcome.elapsed = elapsed;
        outcome.diagnostics = std::move(diagnostics);
        return outcome;
    }

    static Outcome cancelled(std::string message, std::chrono::milliseconds elapsed,
                             nlohmann::json diagnostics = nullptr) {
        Outcome outcome;
        outcome.status = OutcomeStatus::Cancelled;
        outcome.error_kind = ErrorCode::Cancelled;
        outcome.message = std::move(message);
        outcome.elapsed = elapsed;
        outcome.diagnostics = std::move(diagnostics);
        return outcome;
    }

    /**
     * @brief Re-classify an error crossing the dispatch boundary.
     *
     * Timeout-class errors become Timeout outcomes keeping their layer,
     * Cancelled becomes a Cancelled outcome, known failure kinds are kept
     * and anything else is reported as ToolExecutionFailed.
     */
    static Outcome from_error(const Error& error, std::chrono::milliseconds elapsed) {
        if (error.is_timeout()) {
            return timeout(error.timeout_layer.value_or(TimeoutLayer::Dispatch), elapsed,
                           error.message, error.diagnostics);
        }
        switch (error.code) {
            case ErrorCode::Cancelled:
                return cancelled(error.message, elapsed, error.diagnostics);
            case ErrorCode::UnknownTool:
            case ErrorCode::InvalidStateTransition:
            case ErrorCode::CallIdentityMismatch:
            case ErrorCode::ProviderError:
            case ErrorCode::Overloaded:
            case ErrorCode::InvalidParameters:
            case ErrorCode::ToolExecutionFailed:
                return failure(error.code, error.message, elapsed, error.diagnostics);
            default:
                return failure(ErrorCode::ToolExecutionFailed, error.to_string(), elapsed,
                               error.diagnostics);
        }
    }

    bool is_success() const { return status == OutcomeStatus::Success; }
    bool is_timeout() const { return status == OutcomeStatus::Timeout; }

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["status"] = outcome_status_to_string(status);
        j["elapsed_ms"] = elapsed.count();
        switch (status) {
            case OutcomeStatus::Success:
                j["payload"] = payload;
                break;
            case OutcomeStatus::Failure:
                j["error_kind"] = error_code_to_string(error_kind.value_or(ErrorCode::Unknown));
                j["message"] = message;
                break;
            case OutcomeStatus::Timeout:
                j["timeout_layer"] = timeout_layer_to_string(timeout_layer.value_or(TimeoutLayer::Dispatch));
                if (!message.empty()) {
                    j["message"] = message;
                }
                break;
            case OutcomeStatus::Cancelled:
                j["message"] = message;
                break;
        }
        if (!diagnostics.is_null()) {
            j["diagnostics"] = diagnostics;
        }
        return j;
    }

    // Equality for testing
    bool operator==(const Outcome& other) const {
        return status == other.status &&
               payload == other.payload &&
               error_kind == other.error_kind &&
               message == other.message &&
               timeout_layer == other.timeout_layer &&
               elapsed == other.elapsed &&
               diagnostics == other.diagnostics;
    }

    bool operator!=(const Outcome& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Progress
// ============================================================================

/**
 * @brief Intermediate progress notification for an in-flight call.
 */
struct ProgressUpdate {
    std::string call_id;
    int step_index = 0;
    int step_total = 0;
    std::string note;

    bool operator==(const ProgressUpdate& other) const {
        return call_id == other.call_id &&
               step_index == other.step_index &&
               step_total == other.step_total &&
               note == other.note;
    }
};

using ProgressSink = std::function<void(const ProgressUpdate&)>;

// ============================================================================
// Observations
// ============================================================================

enum class Correctness {
    Correct,
    Incorrect,
    Uncertain
};

[[nodiscard]] inline const char* correctness_to_string(Correctness correctness) {
    switch (correctness) {
        case Correctness::Correct: return "correct";
        case Correctness::Incorrect: return "incorrect";
        case Correctness::Uncertain: return "uncertain";
    }
    return "uncertain";
}

[[nodiscard]] inline std::optional<Correctness> correctness_from_string(std::string_view text) {
    if (text == "correct") return Correctness::Correct;
    if (text == "incorrect") return Correctness::Incorrect;
    if (text == "uncertain") return Correctness::Uncertain;
    return std::nullopt;
}

/**
 * @brief Independent quality assessment of a completed Outcome.
 */
struct Observation {
    static constexpr double kMinScore = 0.0;
    static constexpr double kMaxScore = 100.0;

    std::string call_id;                       ///< Originating call
    double score = 0.0;                        ///< Quality score in [kMinScore, kMaxScore]
    Correctness correctness = Correctness::Uncertain;
    std::vector<std::string> anomalies;        ///< Short anomaly tags, possibly empty
    std::string rationale;                     ///< Free-text explanation
    std::string scorer;                        ///< Name of the scorer that produced it

    nlohmann::json to_json() const {
        return nlohmann::json{
            {"call_id", call_id},
            {"score", score},
            {"correctness", correctness_to_string(correctness)},
            {"anomalies", anomalies},
            {"rationale", rationale},
            {"scorer", scorer}
        };
    }

    bool operator==(const Observation& other) const {
        return call_id == other.call_id &&
               score == other.score &&
               correctness == other.correctness &&
               anomalies == other.anomalies &&
               rationale == other.rationale &&
               scorer == other.scorer;
    }
};

} // namespace warden
