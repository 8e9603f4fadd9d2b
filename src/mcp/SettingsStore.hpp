// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <string>
#include <vector>

namespace webchat
{

/// @brief Persistent user settings consulted by the connection manager.
///
/// Only the list of providers the user activated for auto-start is needed here.
class SettingsStore
{
  public:
    virtual ~SettingsStore() = default;

    /// @brief Returns the activated provider entries (ids, or display names from older settings).
    [[nodiscard]] virtual auto activatedProviderIds() -> Result<std::vector<std::string>> = 0;

    /// @brief Replaces the activated provider entries.
    [[nodiscard]] virtual auto setActivatedProviderIds(std::vector<std::string> ids) -> VoidResult = 0;
};

} // namespace webchat
