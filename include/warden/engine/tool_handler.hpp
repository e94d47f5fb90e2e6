#pragma once

#include "../types.hpp"
#include "call_context.hpp"
#include <functional>
#include <nlohmann/json.hpp>
#include <string>

namespace warden {
namespace engine {

enum class ToolKind {
    Simple,
    Workflow
};

[[nodiscard]] inline const char* tool_kind_to_string(ToolKind kind) {
    switch (kind) {
        case ToolKind::Simple: return "simple";
        case ToolKind::Workflow: return "workflow";
    }
    return "unknown";
}

/**
 * @brief Capability interface shared by every tool.
 *
 * The set of implementations is closed: SimpleTool and WorkflowTool.
 * invoke() runs on the dispatcher's worker thread and must honour
 * ctx.cancel; the dispatcher wraps its result into an Outcome.
 */
class ToolHandler {
public:
    virtual ~ToolHandler() = default;

    virtual ToolKind kind() const = 0;
    virtual const std::string& name() const = 0;
    virtual const std::string& description() const = 0;
    virtual const nlohmann::json& parameters_schema() const = 0;

    virtual Expected<nlohmann::json> invoke(CallContext& ctx) = 0;

    /** @brief Entry used by list_tools. */
    nlohmann::json describe() const {
        return nlohmann::json{
            {"name", name()},
            {"description", description()},
            {"kind", tool_kind_to_string(kind())},
            {"inputSchema", parameters_schema()}
        };
    }
};

/**
 * @brief Single-shot tool backed by a callable.
 */
class SimpleTool : public ToolHandler {
public:
    using Function = std::function<Expected<nlohmann::json>(const nlohmann::json& arguments, CallContext& ctx)>;

    SimpleTool(std::string name, std::string description, nlohmann::json schema, Function function)
        : name_(std::move(name))
        , description_(std::move(description))
        , schema_(std::move(schema))
        , function_(std::move(function))
    {}

    ToolKind kind() const override { return ToolKind::Simple; }
    const std::string& name() const override { return name_; }
    const std::string& description() const override { return description_; }
    const nlohmann::json& parameters_schema() const override { return schema_; }

    Expected<nlohmann::json> invoke(CallContext& ctx) override {
        try {
            return function_(ctx.call.parameters, ctx);
        } catch (const nlohmann::json::exception& e) {
            return tl::unexpected(Error{
                ErrorCode::InvalidParameters,
                std::string("JSON argument error: ") + e.what()
            });
        } catch (const std::exception& e) {
            return tl::unexpected(Error{
                ErrorCode::ToolExecutionFailed,
                std::string("Tool execution failed: ") + e.what()
            });
        }
    }

private:
    std::string name_;
    std::string description_;
    nlohmann::json schema_;
    Function function_;
};

} // namespace engine
} // namespace warden
