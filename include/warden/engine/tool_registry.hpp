#pragma once

#include "../types.hpp"
#include "tool_handler.hpp"
#include "workflow_tool.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace warden {
namespace engine {

// ============================================================================
// Schema generation from callable signatures
// ============================================================================

namespace detail {

template<typename T>
struct json_type_name;

template<> struct json_type_name<int> { static constexpr const char* type = "integer"; };
template<> struct json_type_name<int64_t> { static constexpr const char* type = "integer"; };
template<> struct json_type_name<double> { static constexpr const char* type = "number"; };
template<> struct json_type_name<bool> { static constexpr const char* type = "boolean"; };
template<> struct json_type_name<std::string> { static constexpr const char* type = "string"; };
template<> struct json_type_name<nlohmann::json> { static constexpr const char* type = "object"; };

template<typename T>
struct function_traits;

template<typename R, typename... Args>
struct function_traits<R(*)(Args...)> {
    using return_type = R;
    using args_tuple = std::tuple<std::decay_t<Args>...>;
    static constexpr size_t arity = sizeof...(Args);
};

template<typename C, typename R, typename... Args>
struct function_traits<R(C::*)(Args...) const> {
    using return_type = R;
    using args_tuple = std::tuple<std::decay_t<Args>...>;
    static constexpr size_t arity = sizeof...(Args);
};

template<typename C, typename R, typename... Args>
struct function_traits<R(C::*)(Args...)> {
    using return_type = R;
    using args_tuple = std::tuple<std::decay_t<Args>...>;
    static constexpr size_t arity = sizeof...(Args);
};

// Lambdas and functors delegate to operator()
template<typename T>
struct function_traits : function_traits<decltype(&T::operator())> {};

template<typename Tuple, size_t... Is>
nlohmann::json build_properties_impl(const std::vector<std::string>& param_names, std::index_sequence<Is...>) {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();

    ((properties[param_names[Is]] = nlohmann::json{
        {"type", json_type_name<std::tuple_element_t<Is, Tuple>>::type}
    }, required.push_back(param_names[Is])), ...);

    return nlohmann::json{
        {"type", "object"},
        {"properties", properties},
        {"required", required}
    };
}

template<typename Tuple>
nlohmann::json build_properties(const std::vector<std::string>& param_names) {
    return build_properties_impl<Tuple>(param_names, std::make_index_sequence<std::tuple_size_v<Tuple>>{});
}

template<typename Func, typename Tuple, size_t... Is>
auto invoke_with_json_impl(const Func& func, const nlohmann::json& args,
                           const std::vector<std::string>& param_names,
                           std::index_sequence<Is...>) {
    return func(args.at(param_names[Is]).template get<std::tuple_element_t<Is, Tuple>>()...);
}

template<typename Func, typename Tuple>
auto invoke_with_json(const Func& func, const nlohmann::json& args,
                      const std::vector<std::string>& param_names) {
    return invoke_with_json_impl<Func, Tuple>(
        func, args, param_names, std::make_index_sequence<std::tuple_size_v<Tuple>>{});
}

template<typename T>
Expected<nlohmann::json> wrap_result(T&& value) {
    if constexpr (std::is_same_v<std::decay_t<T>, Expected<nlohmann::json>>) {
        return std::forward<T>(value);
    } else {
        return nlohmann::json{{"result", std::forward<T>(value)}};
    }
}

} // namespace detail

// ============================================================================
// ToolRegistry
// ============================================================================

/**
 * @brief Startup-built lookup table from tool name to handler.
 *
 * Holds SimpleTool and WorkflowTool instances behind ToolHandler. Names may
 * be requested with a configured alias suffix (e.g. "chat_remote" when
 * "_remote" is registered as a suffix); resolve() strips it when the exact
 * name is unknown.
 *
 * @threadsafety All public methods are thread-safe. Reads use shared locks;
 * registration uses an exclusive lock.
 */
class ToolRegistry {
public:
    /**
     * Template-based registration: parameter types become the JSON schema.
     *
     * @param name Tool name
     * @param description Tool description
     * @param param_names Parameter names (must match function arity)
     * @param func Callable taking typed arguments; returns a JSON-convertible
     *             value or Expected<nlohmann::json>
     */
    template<typename Func,
             typename = std::enable_if_t<!std::is_convertible_v<Func, SimpleTool::Function>>>
    void register_tool(const std::string& name, const std::string& description,
                       const std::vector<std::string>& param_names, Func func) {
        using traits = detail::function_traits<Func>;
        using args_tuple = typename traits::args_tuple;

        if (param_names.size() != traits::arity) {
            throw std::invalid_argument(
                "Parameter name count (" + std::to_string(param_names.size()) +
                ") does not match function arity (" + std::to_string(traits::arity) + ")");
        }

        nlohmann::json schema;
        if constexpr (traits::arity == 0) {
            schema = nlohmann::json{
                {"type", "object"},
                {"properties", nlohmann::json::object()},
                {"required", nlohmann::json::array()}
            };
        } else {
            schema = detail::build_properties<args_tuple>(param_names);
        }

        SimpleTool::Function function =
            [f = std::move(func), names = param_names](const nlohmann::json& args, CallContext&)
                -> Expected<nlohmann::json> {
            if constexpr (traits::arity == 0) {
                return detail::wrap_result(f());
            } else {
                return detail::wrap_result(detail::invoke_with_json<decltype(f), args_tuple>(f, args, names));
            }
        };

        add(std::make_shared<SimpleTool>(name, description, std::move(schema), std::move(function)));
    }

    /**
     * @brief Manual registration with an explicit schema and a context-aware handler.
     */
    void register_tool(const std::string& name, const std::string& description,
                       nlohmann::json schema, SimpleTool::Function function) {
        add(std::make_shared<SimpleTool>(name, description, std::move(schema), std::move(function)));
    }

    void register_workflow(WorkflowTool::Definition definition) {
        if (!definition.next_step) {
            throw std::invalid_argument("Workflow '" + definition.name + "' has no step producer");
        }
        if (!definition.expert_prompt) {
            throw std::invalid_argument("Workflow '" + definition.name + "' has no expert prompt builder");
        }
        add(std::make_shared<WorkflowTool>(std::move(definition)));
    }

    /** @brief Register any handler; replaces an existing tool of the same name. */
    void add(std::shared_ptr<ToolHandler> handler) {
        if (!handler || handler->name().empty()) {
            throw std::invalid_argument("Tool handler must have a name");
        }
        std::unique_lock lock(mutex_);
        tools_.insert_or_assign(handler->name(), std::move(handler));
    }

    /** @brief Suffixes stripped from requested names that are not registered verbatim. */
    void set_alias_suffixes(std::vector<std::string> suffixes) {
        std::unique_lock lock(mutex_);
        alias_suffixes_ = std::move(suffixes);
    }

    /** @brief Map a requested name to a registered one, or nullopt. */
    std::optional<std::string> normalize(const std::string& requested) const {
        std::shared_lock lock(mutex_);
        return normalize_locked(requested);
    }

    std::shared_ptr<ToolHandler> resolve(const std::string& requested) const {
        std::shared_lock lock(mutex_);
        auto name = normalize_locked(requested);
        if (!name) {
            return nullptr;
        }
        return tools_.at(*name);
    }

    bool has_tool(const std::string& name) const {
        return resolve(name) != nullptr;
    }

    std::optional<nlohmann::json> get_parameters_schema(const std::string& name) const {
        auto handler = resolve(name);
        if (!handler) {
            return std::nullopt;
        }
        return handler->parameters_schema();
    }

    /** @brief list_tools entries for every registered tool, sorted by name. */
    nlohmann::json describe_all() const {
        std::shared_lock lock(mutex_);
        std::vector<std::string> names;
        names.reserve(tools_.size());
        for (const auto& [name, _] : tools_) {
            names.push_back(name);
        }
        std::sort(names.begin(), names.end());

        nlohmann::json tools = nlohmann::json::array();
        for (const auto& name : names) {
            tools.push_back(tools_.at(name)->describe());
        }
        return tools;
    }

    std::vector<std::string> get_tool_names() const {
        std::shared_lock lock(mutex_);
        std::vector<std::string> names;
        names.reserve(tools_.size());
        for (const auto& [name, _] : tools_) {
            names.push_back(name);
        }
        return names;
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return tools_.size();
    }

private:
    std::optional<std::string> normalize_locked(const std::string& requested) const {
        if (tools_.count(requested) != 0) {
            return requested;
        }
        for (const auto& suffix : alias_suffixes_) {
            if (suffix.empty() || requested.size() <= suffix.size()) {
                continue;
            }
            if (requested.compare(requested.size() - suffix.size(), suffix.size(), suffix) == 0) {
                auto base = requested.substr(0, requested.size() - suffix.size());
                if (tools_.count(base) != 0) {
                    return base;
                }
            }
        }
        return std::nullopt;
    }

    std::unordered_map<std::string, std::shared_ptr<ToolHandler>> tools_;
    std::vector<std::string> alias_suffixes_;
    mutable std::shared_mutex mutex_;
};

} // namespace engine
} // namespace warden
