#pragma once

#include "../../types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace warden {
namespace session {
namespace protocol {

enum class InboundOp {
    Hello,
    ListTools,
    CallTool,
    CancelCall
};

/**
 * @brief One decoded client message.
 */
struct InboundMessage {
    InboundOp op = InboundOp::CallTool;
    std::string call_id;                          ///< call_tool / cancel_call; may be empty for call_tool
    std::string tool_name;
    nlohmann::json parameters = nlohmann::json::object();
    std::optional<std::string> effort;
    std::optional<std::string> client;            ///< hello only
};

/**
 * @brief Codec for the newline-delimited JSON wire protocol.
 *
 * Inbound ops: hello, list_tools, call_tool, cancel_call. `name` and
 * `arguments` are accepted in place of `tool_name` and `parameters`.
 * All methods are static and stateless.
 */
class WireCodec {
public:
    // ========================================================================
    // Decoding
    // ========================================================================

    struct DecodeResult {
        std::optional<InboundMessage> message;
        std::optional<std::string> error_message;
        std::optional<std::string> call_id;       ///< Echoed in error replies when known

        bool is_error() const { return error_message.has_value(); }
    };

    static DecodeResult decode(const std::string& input) {
        DecodeResult result;

        nlohmann::json j = nlohmann::json::parse(input, nullptr, false);
        if (j.is_discarded()) {
            result.error_message = "Malformed JSON";
            return result;
        }
        if (!j.is_object()) {
            result.error_message = "Message must be a JSON object";
            return result;
        }

        auto op_it = j.find("op");
        if (op_it == j.end() || !op_it->is_string()) {
            result.error_message = "Missing or invalid 'op'";
            return result;
        }
        const auto op = op_it->get<std::string>();

        std::optional<std::string> call_id;
        if (j.contains("call_id")) {
            call_id = decode_call_id(j["call_id"]);
            if (!call_id) {
                result.error_message = "'call_id' must be a string or integer";
                return result;
            }
            result.call_id = call_id;
        }

        InboundMessage msg;
        if (op == "hello") {
            msg.op = InboundOp::Hello;
            if (j.contains("client") && j["client"].is_string()) {
                msg.client = j["client"].get<std::string>();
            }
        } else if (op == "list_tools") {
            msg.op = InboundOp::ListTools;
        } else if (op == "call_tool") {
            msg.op = InboundOp::CallTool;
            msg.call_id = call_id.value_or("");

            const nlohmann::json* name = field(j, "tool_name", "name");
            if (name == nullptr || !name->is_string() || name->get_ref<const std::string&>().empty()) {
                result.error_message = "call_tool requires a non-empty 'tool_name'";
                return result;
            }
            msg.tool_name = name->get<std::string>();

            const nlohmann::json* params = field(j, "parameters", "arguments");
            if (params != nullptr && !params->is_null()) {
                if (!params->is_object()) {
                    result.error_message = "'parameters' must be an object";
                    return result;
                }
                msg.parameters = *params;
            }

            if (j.contains("effort") && !j["effort"].is_null()) {
                if (!j["effort"].is_string()) {
                    result.error_message = "'effort' must be a string";
                    return result;
                }
                msg.effort = j["effort"].get<std::string>();
            }
        } else if (op == "cancel_call") {
            msg.op = InboundOp::CancelCall;
            if (!call_id || call_id->empty()) {
                result.error_message = "cancel_call requires 'call_id'";
                return result;
            }
            msg.call_id = *call_id;
        } else {
            result.error_message = "Unknown op: " + op;
            return result;
        }

        result.message = std::move(msg);
        return result;
    }

    // ========================================================================
    // Encoding
    // ========================================================================

    static std::string encode_hello_ack(const std::string& session_id, const std::string& server,
                                        const std::string& version, const nlohmann::json& limits) {
        return nlohmann::json{
            {"op", "hello_ack"},
            {"session_id", session_id},
            {"server", server},
            {"version", version},
            {"limits", limits}
        }.dump();
    }

    static std::string encode_list_tools(const nlohmann::json& tools) {
        return nlohmann::json{
            {"op", "list_tools_res"},
            {"tools", tools}
        }.dump();
    }

    static std::string encode_progress(const ProgressUpdate& update) {
        return nlohmann::json{
            {"op", "progress"},
            {"call_id", update.call_id},
            {"step_index", update.step_index},
            {"step_total", update.step_total},
            {"note", update.note}
        }.dump();
    }

    static std::string encode_outcome(const std::string& call_id, const Outcome& outcome) {
        nlohmann::json j = outcome.to_json();
        j["op"] = "call_tool_res";
        j["call_id"] = call_id;
        return j.dump();
    }

    static std::string encode_error(const std::string& message,
                                    const std::optional<std::string>& call_id = std::nullopt) {
        nlohmann::json j{
            {"op", "error"},
            {"message", message}
        };
        if (call_id.has_value()) {
            j["call_id"] = *call_id;
        }
        return j.dump();
    }

private:
    static const nlohmann::json* field(const nlohmann::json& j, const char* key, const char* alias) {
        auto it = j.find(key);
        if (it != j.end()) {
            return &*it;
        }
        it = j.find(alias);
        if (it != j.end()) {
            return &*it;
        }
        return nullptr;
    }

    static std::optional<std::string> decode_call_id(const nlohmann::json& j) {
        if (j.is_string()) {
            return j.get<std::string>();
        }
        if (j.is_number_integer()) {
            return std::to_string(j.get<int64_t>());
        }
        return std::nullopt;
    }
};

} // namespace protocol
} // namespace session
} // namespace warden
