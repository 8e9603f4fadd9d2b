// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/SettingsStore.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace webchat
{

/// @brief User settings shared with the chat front end.
struct ChatSettings
{
    std::vector<std::string> selectedMCPTools;
    std::vector<std::string> autoExecuteTools;
    bool requireConfirmationForAll = false;
    std::vector<std::string> activatedMCPServers;
};

[[nodiscard]] auto toJson(const ChatSettings& settings) -> nlohmann::json;

/// @brief Checks the field types of a settings document.
/// @return Success, or a ConfigError naming the first offending field.
[[nodiscard]] auto validateSettings(const nlohmann::json& settings) -> VoidResult;

/// @brief Reads a settings document, filling missing or mistyped fields with defaults.
[[nodiscard]] auto settingsFromJson(const nlohmann::json& settings) -> ChatSettings;

/// @brief Settings persisted as a JSON file.
///
/// A missing file is created with defaults on first load. Unknown fields in
/// the file are preserved across updates.
class JsonFileSettingsStore: public SettingsStore
{
  public:
    explicit JsonFileSettingsStore(std::filesystem::path path);

    [[nodiscard]] auto load() -> Result<ChatSettings>;
    [[nodiscard]] auto save(const ChatSettings& settings) -> VoidResult;

    /// @brief Merges @p partial into the stored settings, validates and saves the result.
    [[nodiscard]] auto update(const nlohmann::json& partial) -> Result<ChatSettings>;

    [[nodiscard]] auto activatedProviderIds() -> Result<std::vector<std::string>> override;
    [[nodiscard]] auto setActivatedProviderIds(std::vector<std::string> ids) -> VoidResult override;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return _path; }

  private:
    [[nodiscard]] auto loadDocument() -> Result<nlohmann::json>;
    [[nodiscard]] auto writeDocument(const nlohmann::json& document) -> VoidResult;

    std::filesystem::path _path;
    std::mutex _mutex;
};

} // namespace webchat
