// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <string_view>

namespace webchat
{

/// @brief Parses tool-call arguments produced by a language model, repairing common damage.
///
/// Tried in order: the text as-is; the text with a dangling trailing key
/// (`, "key"}` without a value) removed; a bare `{"command": ...}` object
/// extracted from the text.
/// @param text The argument text.
/// @return The argument object, or an ExecutionError if nothing usable remains.
[[nodiscard]] auto repairToolArguments(std::string_view text) -> Result<nlohmann::json>;

/// @brief Normalizes tool-call arguments given as an object, JSON text or null.
[[nodiscard]] auto normalizeToolArguments(const nlohmann::json& arguments) -> Result<nlohmann::json>;

} // namespace webchat
