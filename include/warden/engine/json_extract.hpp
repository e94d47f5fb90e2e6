#pragma once

#include "../types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace warden {
namespace engine {

/**
 * @brief Tolerant extraction of a JSON object from model output.
 *
 * Tries, in order:
 * 1. The whole (trimmed) text as JSON
 * 2. The body of the first ```json fenced block (or bare ``` block)
 * 3. The span from the first '{' to the last '}'
 *
 * Only objects are accepted.
 */
class JsonExtractor {
public:
    static Expected<nlohmann::json> extract_object(std::string_view text) {
        auto trimmed = trim(text);
        if (trimmed.empty()) {
            return tl::unexpected(Error{ErrorCode::ProtocolError, "Response is empty"});
        }

        if (auto direct = parse_object(trimmed)) {
            return *direct;
        }

        if (auto fenced = fenced_block(trimmed); !fenced.empty()) {
            if (auto parsed = parse_object(trim(fenced))) {
                return *parsed;
            }
        }

        auto open = trimmed.find('{');
        auto close = trimmed.rfind('}');
        if (open != std::string_view::npos && close != std::string_view::npos && close > open) {
            if (auto parsed = parse_object(trimmed.substr(open, close - open + 1))) {
                return *parsed;
            }
        }

        return tl::unexpected(Error{
            ErrorCode::ProtocolError,
            "Response does not contain a JSON object",
            std::string(trimmed.substr(0, 200))
        });
    }

private:
    static std::optional<nlohmann::json> parse_object(std::string_view text) {
        auto parsed = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            return std::nullopt;
        }
        return parsed;
    }

    static std::string_view fenced_block(std::string_view text) {
        constexpr std::string_view fence = "```";
        auto start = text.find(fence);
        if (start == std::string_view::npos) {
            return {};
        }
        start += fence.size();
        // Skip an optional language tag on the fence line
        auto line_end = text.find('\n', start);
        if (line_end == std::string_view::npos) {
            return {};
        }
        start = line_end + 1;
        auto end = text.find(fence, start);
        if (end == std::string_view::npos) {
            return {};
        }
        return text.substr(start, end - start);
    }

    static std::string_view trim(std::string_view text) {
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
            text.remove_prefix(1);
        }
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
            text.remove_suffix(1);
        }
        return text;
    }
};

} // namespace engine
} // namespace warden
