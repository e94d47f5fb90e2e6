#pragma once

#include "../log.hpp"
#include "../provider/interface.hpp"
#include "../types.hpp"
#include "audit_log.hpp"
#include "cancellation.hpp"
#include "json_extract.hpp"
#include "provider_guard.hpp"
#include "timeout_budget.hpp"
#include "work_queue.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace warden {
namespace engine {

// ============================================================================
// Scorers
// ============================================================================

/**
 * @brief Produces an Observation for a completed call.
 *
 * Called on the observer's worker thread, never on the delivery path.
 */
class IScorer {
public:
    virtual ~IScorer() = default;

    virtual std::string name() const = 0;
    virtual Expected<Observation> score(const ToolCall& call, const Outcome& outcome) = 0;
};

/**
 * @brief Rule-based scorer; the default when no model scorer is configured.
 */
class HeuristicScorer : public IScorer {
public:
    /// Share of the dispatch slot above which a success is tagged near_deadline.
    static constexpr double kNearDeadlineFraction = 0.8;

    explicit HeuristicScorer(TimeoutBudget budget)
        : budget_(budget)
    {}

    std::string name() const override { return "heuristic"; }

    Expected<Observation> score(const ToolCall& call, const Outcome& outcome) override {
        Observation obs;
        obs.call_id = call.call_id;
        obs.scorer = name();

        switch (outcome.status) {
            case OutcomeStatus::Success:
                score_success(outcome, obs);
                break;
            case OutcomeStatus::Timeout:
                obs.score = 10.0;
                obs.correctness = Correctness::Incorrect;
                obs.anomalies.push_back(std::string("timeout:") +
                                        timeout_layer_to_string(outcome.timeout_layer.value_or(TimeoutLayer::Dispatch)));
                obs.rationale = "Call did not finish within its deadline";
                break;
            case OutcomeStatus::Cancelled:
                obs.score = 50.0;
                obs.correctness = Correctness::Uncertain;
                obs.anomalies.push_back("cancelled");
                obs.rationale = "Call was cancelled before completion";
                break;
            case OutcomeStatus::Failure:
                score_failure(outcome, obs);
                break;
        }

        if (!outcome.diagnostics.is_null()) {
            obs.anomalies.push_back("partial_results");
        }
        obs.score = std::clamp(obs.score, Observation::kMinScore, Observation::kMaxScore);
        return obs;
    }

private:
    void score_success(const Outcome& outcome, Observation& obs) const {
        obs.score = 90.0;
        obs.rationale = "Call succeeded";

        const auto& payload = outcome.payload;
        if (payload.is_null() || ((payload.is_object() || payload.is_array() || payload.is_string()) && payload.empty())) {
            obs.score = 40.0;
            obs.anomalies.push_back("empty_payload");
            obs.rationale = "Call succeeded with an empty payload";
        }
        if (payload.is_object() && payload.contains("expert_analysis") &&
            payload["expert_analysis"].is_object() && payload["expert_analysis"].contains("parse_error")) {
            obs.score -= 20.0;
            obs.anomalies.push_back("unparsed_analysis");
        }
        const auto threshold = std::chrono::milliseconds{
            static_cast<std::chrono::milliseconds::rep>(budget_.dispatch.count() * kNearDeadlineFraction)
        };
        if (outcome.elapsed > threshold) {
            obs.score -= 10.0;
            obs.anomalies.push_back("near_deadline");
        }
        obs.correctness = obs.score >= 70.0 ? Correctness::Correct : Correctness::Uncertain;
    }

    static void score_failure(const Outcome& outcome, Observation& obs) {
        obs.rationale = outcome.message;
        switch (outcome.error_kind.value_or(ErrorCode::Unknown)) {
            case ErrorCode::ProviderError:
                obs.score = 20.0;
                obs.correctness = Correctness::Incorrect;
                obs.anomalies.push_back("provider_error");
                break;
            case ErrorCode::Overloaded:
                obs.score = 30.0;
                obs.correctness = Correctness::Uncertain;
                obs.anomalies.push_back("overloaded");
                break;
            case ErrorCode::UnknownTool:
            case ErrorCode::InvalidParameters:
                obs.score = 30.0;
                obs.correctness = Correctness::Uncertain;
                obs.anomalies.push_back("caller_error");
                break;
            default:
                obs.score = 15.0;
                obs.correctness = Correctness::Incorrect;
                obs.anomalies.push_back("tool_failure");
                break;
        }
    }

    TimeoutBudget budget_;
};

/**
 * @brief Asks a provider for a JSON verdict on the outcome.
 *
 * Expected response shape:
 * {"score": 0-100, "correctness": "correct|incorrect|uncertain",
 *  "anomalies": [...], "rationale": "..."}. Fences and surrounding prose are
 * tolerated; the score is clamped to [0, 100].
 */
class ModelScorer : public IScorer {
public:
    ModelScorer(std::shared_ptr<provider::IProvider> provider,
                std::shared_ptr<ProviderCallGuard> guard,
                std::chrono::milliseconds timeout)
        : provider_(std::move(provider))
        , guard_(std::move(guard))
        , timeout_(timeout)
    {}

    std::string name() const override {
        return provider_ ? "model:" + provider_->name() : "model";
    }

    Expected<Observation> score(const ToolCall& call, const Outcome& outcome) override {
        if (!provider_ || !guard_) {
            return tl::unexpected(Error{ErrorCode::ScoringFailed, "Model scorer has no provider"});
        }

        std::string prompt =
            "You are auditing the result of a tool call. Reply with a JSON object "
            "{\"score\": 0-100, \"correctness\": \"correct\"|\"incorrect\"|\"uncertain\", "
            "\"anomalies\": [string], \"rationale\": string}.\n\n"
            "Tool: " + call.tool_name + "\n"
            "Parameters: " + call.parameters.dump() + "\n"
            "Outcome: " + outcome.to_json().dump();

        nlohmann::json params{{"purpose", "outcome_scoring"}, {"call_id", call.call_id}};
        auto response = guard_->generate(provider_, prompt, params,
                                         Deadline::after(timeout_, TimeoutLayer::ProviderCall),
                                         CancellationToken{});
        if (!response) {
            return tl::unexpected(Error{ErrorCode::ScoringFailed, "Model scorer call failed",
                                        response.error().to_string()});
        }

        auto verdict = JsonExtractor::extract_object(*response);
        if (!verdict) {
            return tl::unexpected(Error{ErrorCode::ScoringFailed, "Model scorer returned no JSON verdict",
                                        verdict.error().message});
        }
        auto score_it = verdict->find("score");
        if (score_it == verdict->end() || !score_it->is_number()) {
            return tl::unexpected(Error{ErrorCode::ScoringFailed, "Model verdict has no numeric score"});
        }

        Observation obs;
        obs.call_id = call.call_id;
        obs.scorer = name();
        obs.score = std::clamp(score_it->get<double>(), Observation::kMinScore, Observation::kMaxScore);
        if (verdict->contains("correctness") && (*verdict)["correctness"].is_string()) {
            obs.correctness = correctness_from_string((*verdict)["correctness"].get<std::string>())
                                  .value_or(Correctness::Uncertain);
        }
        if (verdict->contains("anomalies") && (*verdict)["anomalies"].is_array()) {
            for (const auto& tag : (*verdict)["anomalies"]) {
                if (tag.is_string()) {
                    obs.anomalies.push_back(tag.get<std::string>());
                }
            }
        }
        if (verdict->contains("rationale") && (*verdict)["rationale"].is_string()) {
            obs.rationale = (*verdict)["rationale"].get<std::string>();
        }
        return obs;
    }

private:
    std::shared_ptr<provider::IProvider> provider_;
    std::shared_ptr<ProviderCallGuard> guard_;
    std::chrono::milliseconds timeout_;
};

// ============================================================================
// Observer
// ============================================================================

struct ObserverStats {
    uint64_t observed = 0;          ///< Outcomes handed to observe()
    uint64_t scored = 0;            ///< Observations produced
    uint64_t scoring_failures = 0;  ///< Scorer errors and exceptions
    uint64_t recorded = 0;          ///< Audit records written
    uint64_t audit_failures = 0;    ///< Audit sink errors
};

/**
 * @brief Scores terminal outcomes and writes one audit record per outcome.
 *
 * observe() only enqueues; scoring and persistence run on a dedicated
 * worker thread so a slow or failing scorer never delays delivery. After
 * stop() the remaining queue is drained and later outcomes are processed
 * inline on the caller's thread.
 *
 * @threadsafety All public methods are thread-safe
 */
class OutcomeObserver {
public:
    OutcomeObserver(std::shared_ptr<IScorer> scorer, std::shared_ptr<IAuditSink> sink)
        : scorer_(std::move(scorer))
        , sink_(std::move(sink))
    {
        worker_ = std::thread([this]() { worker_loop(); });
    }

    ~OutcomeObserver() {
        stop();
    }

    OutcomeObserver(const OutcomeObserver&) = delete;
    OutcomeObserver& operator=(const OutcomeObserver&) = delete;

    void observe(ToolCall call, Outcome outcome) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++stats_.observed;
            ++pending_;
        }
        Job job{std::move(call), std::move(outcome)};
        if (!queue_.push(job)) {
            process(job);
        }
    }

    /**
     * @brief Score synchronously; nullopt when the scorer fails.
     */
    std::optional<Observation> evaluate(const ToolCall& call, const Outcome& outcome) {
        if (!scorer_) {
            return std::nullopt;
        }
        try {
            auto result = scorer_->score(call, outcome);
            if (!result) {
                log_warn("Scorer '" + scorer_->name() + "' failed for call " + call.call_id + ": " +
                         result.error().to_string());
                return std::nullopt;
            }
            Observation obs = std::move(*result);
            obs.call_id = call.call_id;
            if (obs.scorer.empty()) {
                obs.scorer = scorer_->name();
            }
            return obs;
        } catch (const std::exception& e) {
            log_warn("Scorer '" + scorer_->name() + "' threw for call " + call.call_id + ": " + e.what());
            return std::nullopt;
        } catch (...) {
            log_warn("Scorer '" + scorer_->name() + "' threw a non-standard exception for call " + call.call_id);
            return std::nullopt;
        }
    }

    /**
     * @brief Wait until every observed outcome has been recorded.
     *
     * @return false if the timeout expired first
     */
    bool wait_idle(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return idle_cv_.wait_for(lock, timeout, [this] { return pending_ == 0; });
    }

    /** @brief Drain the queue and stop the worker. Idempotent. */
    void stop() {
        queue_.shutdown();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    ObserverStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

private:
    struct Job {
        ToolCall call;
        Outcome outcome;
    };

    void worker_loop() {
        while (auto job = queue_.pop()) {
            process(*job);
        }
    }

    void process(const Job& job) {
        AuditRecord record;
        record.call_id = job.call.call_id;
        record.session_id = job.call.session_id;
        record.tool_name = job.call.tool_name;
        record.outcome = job.outcome;
        record.observation = evaluate(job.call, job.outcome);
        record.recorded_at_ms = AuditRecord::now_ms();

        bool written = true;
        if (sink_) {
            try {
                auto appended = sink_->append(record);
                if (!appended) {
                    written = false;
                    log_error("Audit record for call " + record.call_id + " not written: " +
                              appended.error().to_string());
                }
            } catch (const std::exception& e) {
                written = false;
                log_error("Audit sink threw for call " + record.call_id + ": " + e.what());
            } catch (...) {
                written = false;
                log_error("Audit sink threw a non-standard exception for call " + record.call_id);
            }
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (record.observation.has_value()) {
                ++stats_.scored;
            } else if (scorer_) {
                ++stats_.scoring_failures;
            }
            if (written) {
                ++stats_.recorded;
            } else {
                ++stats_.audit_failures;
            }
            --pending_;
        }
        idle_cv_.notify_all();
    }

    std::shared_ptr<IScorer> scorer_;
    std::shared_ptr<IAuditSink> sink_;
    WorkQueue<Job> queue_;
    std::thread worker_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    ObserverStats stats_;
    size_t pending_ = 0;
};

} // namespace engine
} // namespace warden
