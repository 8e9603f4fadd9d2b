// SPDX-License-Identifier: Apache-2.0
#include "ArgumentRepair.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>
#include <cctype>
#include <optional>
#include <string>

namespace webchat
{

namespace
{

    auto parseObject(std::string_view text) -> std::optional<nlohmann::json>
    {
        auto parsed = nlohmann::json::parse(text, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object())
            return std::nullopt;
        return parsed;
    }

    auto isSpace(char ch) -> bool
    {
        return std::isspace(static_cast<unsigned char>(ch)) != 0;
    }

    /// Position of the last non-space character before @p end, or npos.
    auto lastNonSpace(std::string_view text, size_t end) -> size_t
    {
        while (end > 0)
        {
            --end;
            if (!isSpace(text[end]))
                return end;
        }
        return std::string_view::npos;
    }

    /// Removes a trailing `, "key" }` whose key has no value, keeping the closing brace.
    auto dropDanglingKey(std::string_view text) -> std::optional<std::string>
    {
        auto const brace = lastNonSpace(text, text.size());
        if (brace == std::string_view::npos || text[brace] != '}')
            return std::nullopt;

        auto const keyEnd = lastNonSpace(text, brace);
        if (keyEnd == std::string_view::npos || text[keyEnd] != '"' || keyEnd == 0)
            return std::nullopt;

        auto const keyStart = text.rfind('"', keyEnd - 1);
        if (keyStart == std::string_view::npos)
            return std::nullopt;

        auto const comma = lastNonSpace(text, keyStart);
        if (comma == std::string_view::npos || text[comma] != ',')
            return std::nullopt;

        return std::string(text.substr(0, comma)) + "}";
    }

    /// Returns the value of the first `"command": "<value>"` pair with a non-empty value.
    auto extractCommand(std::string_view text) -> std::optional<std::string>
    {
        constexpr auto key = std::string_view { "\"command\":" };
        for (auto pos = text.find(key); pos != std::string_view::npos; pos = text.find(key, pos + 1))
        {
            auto valueStart = pos + key.size();
            while (valueStart < text.size() && isSpace(text[valueStart]))
                ++valueStart;
            if (valueStart >= text.size() || text[valueStart] != '"')
                continue;

            auto const valueEnd = text.find('"', valueStart + 1);
            if (valueEnd == std::string_view::npos || valueEnd == valueStart + 1)
                continue;

            return std::string(text.substr(valueStart + 1, valueEnd - valueStart - 1));
        }
        return std::nullopt;
    }

} // namespace

auto repairToolArguments(std::string_view text) -> Result<nlohmann::json>
{
    if (auto parsed = parseObject(text))
        return *parsed;

    // {"command": "ls -la", "workingDir"}
    if (auto trimmed = dropDanglingKey(text))
    {
        if (auto parsed = parseObject(*trimmed))
        {
            log::debug("Repaired tool arguments by dropping a dangling key: {}", json::preview(text));
            return *parsed;
        }
    }

    log::error("Failed to parse tool call arguments: {}", json::preview(text));

    if (auto command = extractCommand(text))
    {
        auto extracted = nlohmann::json { { "command", std::move(*command) } };
        log::info("Extracted arguments from malformed JSON: {}",
                  json::preview(extracted.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)));
        return extracted;
    }

    return makeError(ErrorCode::ExecutionError,
                     std::format("Invalid tool arguments format: {}", json::preview(text, 500)));
}

auto normalizeToolArguments(const nlohmann::json& arguments) -> Result<nlohmann::json>
{
    if (arguments.is_null())
        return nlohmann::json::object();
    if (arguments.is_object())
        return arguments;
    if (arguments.is_string())
        return repairToolArguments(arguments.get<std::string>());
    return makeError(ErrorCode::ExecutionError,
                     std::format("Tool arguments must be an object or JSON text, got {}", arguments.type_name()));
}

} // namespace webchat
