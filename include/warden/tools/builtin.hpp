#pragma once

#include "../config.hpp"
#include "../engine/call_context.hpp"
#include "../engine/tool_registry.hpp"
#include "../engine/workflow_tool.hpp"
#include "../types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace warden {
namespace tools {

/**
 * @brief Returns its parameters unchanged under "echo".
 */
inline void register_echo(engine::ToolRegistry& registry) {
    registry.register_tool(
        "echo",
        "Return the given parameters unchanged",
        nlohmann::json{
            {"type", "object"},
            {"properties", nlohmann::json::object()},
            {"required", nlohmann::json::array()}
        },
        [](const nlohmann::json& args, engine::CallContext&) -> Expected<nlohmann::json> {
            return nlohmann::json{{"echo", args}};
        });
}

inline void register_version(engine::ToolRegistry& registry, const Config& config) {
    const std::string server = config.server_name;
    const std::string version = config.version;
    registry.register_tool("version", "Report server name and version", std::vector<std::string>{},
                           [server, version]() -> Expected<nlohmann::json> {
                               return nlohmann::json{{"server", server}, {"version", version}};
                           });
}

/**
 * @brief Single provider round trip under the provider-call slot.
 */
inline void register_ask(engine::ToolRegistry& registry) {
    registry.register_tool(
        "ask",
        "Send a prompt to the configured provider and return its reply",
        nlohmann::json{
            {"type", "object"},
            {"properties", {
                {"prompt", {{"type", "string"}}},
                {"model", {{"type", "string"}}}
            }},
            {"required", nlohmann::json::array({"prompt"})}
        },
        [](const nlohmann::json& args, engine::CallContext& ctx) -> Expected<nlohmann::json> {
            nlohmann::json params = nlohmann::json::object();
            if (args.contains("model")) {
                params["model"] = args["model"];
            }
            auto reply = ctx.generate(args.at("prompt").get<std::string>(), params);
            if (!reply) {
                return tl::unexpected(reply.error());
            }
            return nlohmann::json{{"response", *reply}};
        });
}

/**
 * @brief Generic investigation workflow: caller-supplied steps, then expert analysis.
 */
inline void register_analyze(engine::ToolRegistry& registry) {
    engine::WorkflowDefinition analyze;
    analyze.name = "analyze";
    analyze.description =
        "Multi-step investigation; each entry of 'steps' is one step submission, "
        "followed by expert analysis of the consolidated findings";
    analyze.parameters_schema = engine::default_workflow_schema();
    analyze.parameters_schema["required"] = nlohmann::json::array({"steps"});
    registry.register_workflow(std::move(analyze));
}

inline void register_builtin_tools(engine::ToolRegistry& registry, const Config& config) {
    register_echo(registry);
    register_version(registry, config);
    register_ask(registry);
    register_analyze(registry);
}

} // namespace tools
} // namespace warden
