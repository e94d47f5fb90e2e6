#pragma once

#include "warden/engine/call_context.hpp"
#include "warden/engine/tool_registry.hpp"
#include <chrono>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <thread>

namespace warden {
namespace testing {
namespace tools {

// Typed tool functions

inline int add(int a, int b) {
    return a + b;
}

inline std::string greet(std::string name) {
    return "Hello, " + name + "!";
}

inline double circle_area(double radius) {
    return 3.14159265358979323846 * radius * radius;
}

inline nlohmann::json schema_with(const std::string& property, const std::string& type) {
    return nlohmann::json{
        {"type", "object"},
        {"properties", {{property, {{"type", type}}}}},
        {"required", nlohmann::json::array()}
    };
}

/**
 * @brief Tools with controllable behaviour for dispatch and session tests.
 *
 * - sleep:     waits `ms` (default 50) unless cancelled
 * - stubborn:  sleeps `ms` ignoring cancellation
 * - throws:    throws std::runtime_error
 * - fails:     returns ToolExecutionFailed
 * - progress:  reports `count` updates, then succeeds
 */
inline void register_test_tools(engine::ToolRegistry& registry) {
    registry.register_tool("add", "Add two integers", {"a", "b"}, add);
    registry.register_tool("greet", "Greet someone", {"name"}, greet);

    registry.register_tool(
        "sleep", "Wait, honouring cancellation", schema_with("ms", "integer"),
        [](const nlohmann::json& args, engine::CallContext& ctx) -> Expected<nlohmann::json> {
            const int ms = args.value("ms", 50);
            if (ctx.cancel.wait_for(std::chrono::milliseconds(ms))) {
                return tl::unexpected(Error{ErrorCode::Cancelled, "sleep cancelled", ctx.cancel.reason()});
            }
            return nlohmann::json{{"slept", ms}};
        });

    registry.register_tool(
        "stubborn", "Sleep ignoring cancellation", schema_with("ms", "integer"),
        [](const nlohmann::json& args, engine::CallContext&) -> Expected<nlohmann::json> {
            const int ms = args.value("ms", 50);
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
            return nlohmann::json{{"slept", ms}};
        });

    registry.register_tool(
        "throws", "Always throws", schema_with("message", "string"),
        [](const nlohmann::json& args, engine::CallContext&) -> Expected<nlohmann::json> {
            throw std::runtime_error(args.value("message", std::string("boom")));
        });

    registry.register_tool(
        "fails", "Always fails", schema_with("message", "string"),
        [](const nlohmann::json& args, engine::CallContext&) -> Expected<nlohmann::json> {
            return tl::unexpected(Error{ErrorCode::ToolExecutionFailed,
                                        args.value("message", std::string("tool failed"))});
        });

    registry.register_tool(
        "progress", "Report progress updates", schema_with("count", "integer"),
        [](const nlohmann::json& args, engine::CallContext& ctx) -> Expected<nlohmann::json> {
            const int count = args.value("count", 3);
            for (int i = 1; i <= count; ++i) {
                ctx.report(i, count, "tick " + std::to_string(i));
            }
            return nlohmann::json{{"ticks", count}};
        });
}

} // namespace tools
} // namespace testing
} // namespace warden
