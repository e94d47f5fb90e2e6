/**
 * Warden stdio server
 *
 * Serves the newline-delimited JSON tool protocol on stdin/stdout with the
 * built-in tools (echo, version, ask, analyze). Provider-backed tools use an
 * offline demo provider that answers after a configurable delay.
 *
 * Usage:
 *   ./warden_stdio_server [options]
 *
 * Options:
 *   --config <path>            JSON configuration file
 *   --timeout-seconds <float>  Base timeout B (default: 45)
 *   --effort <level>           Default effort: minimal, low, medium, high, max
 *   --audit-db <path>          SQLite audit database (default: in memory)
 *   --provider-delay-ms <int>  Demo provider latency (default: 200)
 *   --verbose                  Log at debug level
 *   --help                     Show this help message
 */

#include "warden/warden.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

std::atomic<bool> g_interrupted{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_interrupted = true;
    }
}

// ============================================================================
// Demo Provider
// ============================================================================

/**
 * Answers every prompt with a small JSON analysis after a fixed delay.
 * Returns early with Cancelled once the guard cancels the call.
 */
class DemoProvider : public warden::provider::IProvider {
public:
    explicit DemoProvider(std::chrono::milliseconds delay) : delay_(delay) {}

    std::string name() const override { return "demo"; }

    warden::Expected<std::string> generate(const std::string& prompt,
                                           const nlohmann::json& parameters,
                                           const warden::engine::Deadline&,
                                           const warden::engine::CancellationToken& cancel) override {
        if (cancel.wait_for(delay_)) {
            return tl::unexpected(warden::Error{warden::ErrorCode::Cancelled, "Demo provider cancelled",
                                                cancel.reason()});
        }
        nlohmann::json reply{
            {"summary", "Reviewed " + std::to_string(prompt.size()) + " characters of findings"},
            {"thinking_mode", parameters.value("thinking_mode", "minimal")},
            {"recommendations", nlohmann::json::array()}
        };
        return "```json\n" + reply.dump(2) + "\n```";
    }

private:
    std::chrono::milliseconds delay_;
};

// ============================================================================
// CLI
// ============================================================================

struct CLIArgs {
    std::string config_path;
    std::optional<double> timeout_seconds;
    std::optional<std::string> effort;
    std::optional<std::string> audit_db;
    int provider_delay_ms = 200;
    bool verbose = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "Warden stdio server\n\n";
    std::cerr << "Usage:\n";
    std::cerr << "  " << program_name << " [options]\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config <path>            JSON configuration file\n";
    std::cerr << "  --timeout-seconds <float>  Base timeout B (default: 45)\n";
    std::cerr << "  --effort <level>           Default effort: minimal, low, medium, high, max\n";
    std::cerr << "  --audit-db <path>          SQLite audit database (default: in memory)\n";
    std::cerr << "  --provider-delay-ms <int>  Demo provider latency (default: 200)\n";
    std::cerr << "  --verbose                  Log at debug level\n";
    std::cerr << "  --help                     Show this help message\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  (echo '{\"op\":\"call_tool\",\"call_id\":\"1\",\"tool_name\":\"echo\",\"parameters\":{\"x\":1}}'; "
                 "sleep 1) | " << program_name << "\n";
    std::cerr << "\nClosing stdin disconnects the session; calls still in flight are cancelled.\n";
}

CLIArgs parse_args(int argc, char** argv) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            args.help = true;
            return args;
        }
        else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        }
        else if (arg == "--timeout-seconds" && i + 1 < argc) {
            args.timeout_seconds = std::stod(argv[++i]);
        }
        else if (arg == "--effort" && i + 1 < argc) {
            args.effort = argv[++i];
        }
        else if (arg == "--audit-db" && i + 1 < argc) {
            args.audit_db = argv[++i];
        }
        else if (arg == "--provider-delay-ms" && i + 1 < argc) {
            args.provider_delay_ms = std::stoi(argv[++i]);
        }
        else if (arg == "--verbose") {
            args.verbose = true;
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            args.help = true;
            return args;
        }
    }
    return args;
}

warden::Expected<warden::Config> load_config(const CLIArgs& args) {
    warden::Config config;
    if (!args.config_path.empty()) {
        std::ifstream in(args.config_path);
        if (!in) {
            return tl::unexpected(warden::Error{warden::ErrorCode::InvalidConfig,
                                                "Cannot open configuration file", args.config_path});
        }
        auto j = nlohmann::json::parse(in, nullptr, false);
        if (j.is_discarded()) {
            return tl::unexpected(warden::Error{warden::ErrorCode::InvalidConfig,
                                                "Configuration file is not valid JSON", args.config_path});
        }
        auto parsed = warden::Config::from_json(j);
        if (!parsed) {
            return tl::unexpected(parsed.error());
        }
        config = std::move(*parsed);
    }

    if (args.timeout_seconds) {
        config.timeouts.base = std::chrono::milliseconds{static_cast<int64_t>(*args.timeout_seconds * 1000.0)};
    }
    if (args.effort) {
        config.default_effort = args.effort;
    }
    if (args.audit_db) {
        config.audit_db_path = args.audit_db;
    }
    return config;
}

int main(int argc, char** argv) {
    CLIArgs args;
    try {
        args = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << "\n";
        return 1;
    }
    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    if (args.verbose) {
        warden::set_log_level(warden::LogLevel::Debug);
    }

    auto config = load_config(args);
    if (!config) {
        std::cerr << "Error: " << config.error().to_string() << "\n";
        return 1;
    }

    auto provider = std::make_shared<DemoProvider>(std::chrono::milliseconds{args.provider_delay_ms});
    auto server_result = warden::Server::create(*config, provider);
    if (!server_result) {
        std::cerr << "Failed to start server: " << server_result.error().to_string() << "\n";
        return 1;
    }
    auto server = std::move(*server_result);

    auto channel = std::make_shared<warden::session::transport::StdioChannel>();
    auto session_id = server->attach(channel);
    if (!session_id) {
        std::cerr << "Failed to attach stdio: " << session_id.error().to_string() << "\n";
        return 1;
    }
    warden::log_info("Serving " + *session_id + " on stdio");

    // Runs until the peer closes stdin or a signal arrives
    while (!g_interrupted.load() && server->sessions().session_count() > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    server->stop();

    auto stats = server->observer().stats();
    warden::log_info("Observed " + std::to_string(stats.observed) + " outcome(s), recorded " +
                     std::to_string(stats.recorded));
    return 0;
}
