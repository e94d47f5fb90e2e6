#pragma once

#include "config.hpp"
#include "engine/audit_log.hpp"
#include "engine/cancellation.hpp"
#include "engine/dispatcher.hpp"
#include "engine/expert_analysis.hpp"
#include "engine/outcome_observer.hpp"
#include "engine/provider_guard.hpp"
#include "engine/tool_registry.hpp"
#include "log.hpp"
#include "provider/interface.hpp"
#include "session/session_manager.hpp"
#include "session/transport/ichannel.hpp"
#include "tools/builtin.hpp"
#include "types.hpp"
#include <atomic>
#include <memory>
#include <string>

namespace warden {

/**
 * @brief Main entry point: wires every component from one immutable Config.
 *
 * Owns the dispatcher, the expert-analysis executor, the outcome observer
 * and the session manager. Channels are served with attach(); embedders can
 * also run a call in-process with call(). Either way each call produces
 * exactly one Outcome, and that Outcome is observed and audited once.
 *
 * Example Usage:
 * @code
 * Config config;
 * config.timeouts.base = std::chrono::seconds(45);
 *
 * auto server = Server::create(config, my_provider);
 * if (!server) {
 *     std::cerr << server.error().to_string() << std::endl;
 *     return 1;
 * }
 * (*server)->attach(std::make_shared<session::transport::StdioChannel>());
 * @endcode
 */
class Server {
public:
    /**
     * @brief Optional replacements for the default scorer and audit sink.
     */
    struct Components {
        std::shared_ptr<engine::IScorer> scorer;        ///< Default: heuristic, or model when config.model_scoring
        std::shared_ptr<engine::IAuditSink> audit;      ///< Default: SQLite when audit_db_path is set, else memory
    };

    /**
     * @brief Validate the configuration and build the server.
     *
     * @param provider Model provider used by expert analysis and provider-backed tools (may be null)
     * @param registry Tool registry; when null the built-in tools are registered
     * @return Expected<std::unique_ptr<Server>> The server or the first configuration error
     */
    static Expected<std::unique_ptr<Server>> create(const Config& config,
                                                    std::shared_ptr<provider::IProvider> provider,
                                                    std::shared_ptr<engine::ToolRegistry> registry = nullptr,
                                                    Components components = {}) {
        if (auto result = config.validate(); !result) {
            return tl::unexpected(result.error());
        }

        if (!registry) {
            registry = std::make_shared<engine::ToolRegistry>();
            tools::register_builtin_tools(*registry, config);
        }
        registry->set_alias_suffixes(config.tool_name_suffixes);

        auto guard = std::make_shared<engine::ProviderCallGuard>();

        std::shared_ptr<engine::ExpertAnalysisExecutor> expert;
        if (provider) {
            expert = std::make_shared<engine::ExpertAnalysisExecutor>(
                provider, guard, config.default_effort, config.heartbeat_interval);
        } else {
            log_info("No provider configured; expert analysis is disabled");
        }

        auto dispatcher = engine::RequestDispatcher::create(
            config.timeouts, engine::RequestDispatcher::Dependencies{registry, provider, guard, expert});
        if (!dispatcher) {
            return tl::unexpected(dispatcher.error());
        }
        std::shared_ptr<engine::RequestDispatcher> shared_dispatcher = std::move(*dispatcher);

        if (!components.audit) {
            if (config.audit_db_path.has_value()) {
                auto db = engine::SqliteAuditLog::open(*config.audit_db_path);
                if (!db) {
                    return tl::unexpected(db.error());
                }
                components.audit = std::move(*db);
            } else {
                components.audit = std::make_shared<engine::MemoryAuditLog>();
            }
        }
        if (!components.scorer) {
            if (config.model_scoring && provider) {
                components.scorer = std::make_shared<engine::ModelScorer>(provider, guard, config.scoring_timeout);
            } else {
                if (config.model_scoring) {
                    log_warn("model_scoring requested without a provider; using heuristic scoring");
                }
                components.scorer = std::make_shared<engine::HeuristicScorer>(shared_dispatcher->budget());
            }
        }

        return std::unique_ptr<Server>(new Server(config, std::move(registry), std::move(provider),
                                                  std::move(guard), std::move(expert),
                                                  std::move(shared_dispatcher), std::move(components)));
    }

    ~Server() {
        stop();
    }

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    /**
     * @brief Serve the wire protocol on a channel.
     *
     * @return Expected<std::string> Session id
     */
    Expected<std::string> attach(std::shared_ptr<session::transport::IChannel> channel) {
        if (!running_.load()) {
            return tl::unexpected(Error{ErrorCode::ServerNotRunning, "Server is stopped"});
        }
        return sessions_->attach(std::move(channel));
    }

    bool detach(const std::string& session_id) {
        return sessions_->detach(session_id);
    }

    /**
     * @brief Run one call in-process and return its Outcome.
     *
     * Bounded by the call's session ceiling; the Outcome is observed like a
     * wire call's.
     */
    Outcome call(ToolCall call, ProgressSink progress = nullptr,
                 const engine::CancellationToken& cancel = engine::CancellationToken{}) {
        if (!running_.load()) {
            return Outcome::failure(ErrorCode::ServerNotRunning, "Server is stopped", call.elapsed());
        }
        if (call.call_id.empty()) {
            call.call_id = "local-" + std::to_string(next_local_id_.fetch_add(1) + 1);
        }
        auto outcome = dispatcher_->dispatch(call, dispatcher_->session_deadline(call), cancel,
                                             std::move(progress));
        observer_->observe(call, outcome);
        return outcome;
    }

    /**
     * @brief Close every session, drain the observer and refuse new work. Idempotent.
     */
    void stop() {
        if (!running_.exchange(false)) {
            return;
        }
        sessions_->shutdown();
        observer_->stop();
    }

    bool is_running() const { return running_.load(); }

    const Config& config() const { return config_; }
    engine::ToolRegistry& registry() { return *registry_; }
    engine::RequestDispatcher& dispatcher() { return *dispatcher_; }
    engine::OutcomeObserver& observer() { return *observer_; }
    session::SessionManager& sessions() { return *sessions_; }
    std::shared_ptr<engine::IAuditSink> audit() const { return audit_; }

private:
    Server(Config config,
           std::shared_ptr<engine::ToolRegistry> registry,
           std::shared_ptr<provider::IProvider> provider,
           std::shared_ptr<engine::ProviderCallGuard> guard,
           std::shared_ptr<engine::ExpertAnalysisExecutor> expert,
           std::shared_ptr<engine::RequestDispatcher> dispatcher,
           Components components)
        : config_(std::move(config))
        , registry_(std::move(registry))
        , provider_(std::move(provider))
        , guard_(std::move(guard))
        , expert_(std::move(expert))
        , dispatcher_(std::move(dispatcher))
        , audit_(components.audit)
        , observer_(std::make_shared<engine::OutcomeObserver>(std::move(components.scorer),
                                                              std::move(components.audit)))
    {
        session::ConnectionSession::Options options;
        options.server_name = config_.server_name;
        options.version = config_.version;
        options.max_in_flight = config_.max_in_flight_per_channel;
        options.max_queued = config_.max_queued_per_channel;
        options.queue_timeout = config_.queue_timeout;
        options.limits = config_.limits_json();
        sessions_ = std::make_unique<session::SessionManager>(dispatcher_, observer_,
                                                              config_.max_in_flight_total, std::move(options));
        log_info("Server '" + config_.server_name + "' " + config_.version + " ready with " +
                 std::to_string(registry_->size()) + " tool(s)");
    }

    Config config_;
    std::shared_ptr<engine::ToolRegistry> registry_;
    std::shared_ptr<provider::IProvider> provider_;
    std::shared_ptr<engine::ProviderCallGuard> guard_;
    std::shared_ptr<engine::ExpertAnalysisExecutor> expert_;
    std::shared_ptr<engine::RequestDispatcher> dispatcher_;
    std::shared_ptr<engine::IAuditSink> audit_;
    std::shared_ptr<engine::OutcomeObserver> observer_;
    std::unique_ptr<session::SessionManager> sessions_;
    std::atomic<bool> running_{true};
    std::atomic<uint64_t> next_local_id_{0};
};

} // namespace warden
