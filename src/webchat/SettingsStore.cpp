// SPDX-License-Identifier: Apache-2.0
#include "SettingsStore.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <format>
#include <fstream>
#include <sstream>

namespace webchat
{

namespace
{

    auto checkStringArray(const nlohmann::json& settings, const char* key) -> VoidResult
    {
        if (!settings.contains(key) || !settings[key].is_array())
            return makeError(ErrorCode::ConfigError, std::format("{} must be an array", key));
        if (!std::ranges::all_of(settings[key], [](const nlohmann::json& item) { return item.is_string(); }))
            return makeError(ErrorCode::ConfigError, std::format("All {} must be strings", key));
        return {};
    }

} // namespace

auto toJson(const ChatSettings& settings) -> nlohmann::json
{
    return nlohmann::json {
        { "selectedMCPTools", settings.selectedMCPTools },
        { "autoExecuteTools", settings.autoExecuteTools },
        { "requireConfirmationForAll", settings.requireConfirmationForAll },
        { "activatedMCPServers", settings.activatedMCPServers },
    };
}

auto validateSettings(const nlohmann::json& settings) -> VoidResult
{
    if (!settings.is_object())
        return makeError(ErrorCode::ConfigError, "Settings must be an object");

    for (auto const* key: { "selectedMCPTools", "autoExecuteTools", "activatedMCPServers" })
    {
        if (auto checked = checkStringArray(settings, key); !checked)
            return checked;
    }

    if (!settings.contains("requireConfirmationForAll") || !settings["requireConfirmationForAll"].is_boolean())
        return makeError(ErrorCode::ConfigError, "requireConfirmationForAll must be a boolean");

    return {};
}

auto settingsFromJson(const nlohmann::json& settings) -> ChatSettings
{
    return ChatSettings {
        .selectedMCPTools = json::getStringArray(settings, "selectedMCPTools"),
        .autoExecuteTools = json::getStringArray(settings, "autoExecuteTools"),
        .requireConfirmationForAll = json::getBoolOr(settings, "requireConfirmationForAll", false),
        .activatedMCPServers = json::getStringArray(settings, "activatedMCPServers"),
    };
}

JsonFileSettingsStore::JsonFileSettingsStore(std::filesystem::path path): _path(std::move(path))
{
}

auto JsonFileSettingsStore::loadDocument() -> Result<nlohmann::json>
{
    auto ec = std::error_code {};
    if (!std::filesystem::exists(_path, ec))
    {
        log::info("Settings file not found, creating with defaults: {}", _path.string());
        auto defaults = toJson(ChatSettings {});
        if (auto written = writeDocument(defaults); !written)
            return std::unexpected(written.error());
        return defaults;
    }

    auto file = std::ifstream(_path);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot open settings file: {}", _path.string()));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto document = json::parse(ss.str());
    if (!document)
        return makeError(ErrorCode::ConfigError,
                         std::format("Invalid settings file {}: {}", _path.string(), document.error().message));
    if (!document->is_object())
        return makeError(ErrorCode::ConfigError, std::format("Settings file {} must hold an object", _path.string()));

    // Defaults first; stored values win.
    auto merged = toJson(ChatSettings {});
    merged.update(*document);
    return merged;
}

auto JsonFileSettingsStore::writeDocument(const nlohmann::json& document) -> VoidResult
{
    auto const dir = _path.parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(ErrorCode::IoError,
                             std::format("Failed to create settings directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(_path, std::ios::trunc);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot write settings file: {}", _path.string()));

    file << document.dump(2) << '\n';
    if (!file)
        return makeError(ErrorCode::IoError, std::format("Failed writing settings file: {}", _path.string()));
    return {};
}

auto JsonFileSettingsStore::load() -> Result<ChatSettings>
{
    auto const lock = std::lock_guard(_mutex);
    return loadDocument().transform([](const nlohmann::json& document) { return settingsFromJson(document); });
}

auto JsonFileSettingsStore::save(const ChatSettings& settings) -> VoidResult
{
    auto const lock = std::lock_guard(_mutex);
    return writeDocument(toJson(settings));
}

auto JsonFileSettingsStore::update(const nlohmann::json& partial) -> Result<ChatSettings>
{
    if (!partial.is_object())
        return makeError(ErrorCode::ConfigError, "Settings update must be an object");

    auto const lock = std::lock_guard(_mutex);

    auto document = loadDocument();
    if (!document)
        return std::unexpected(document.error());

    document->update(partial);
    if (auto valid = validateSettings(*document); !valid)
        return makeError(ErrorCode::ConfigError, std::format("Failed to save settings: {}", valid.error().message));

    if (auto written = writeDocument(*document); !written)
        return std::unexpected(written.error());

    log::debug("Settings saved to {}", _path.string());
    return settingsFromJson(*document);
}

auto JsonFileSettingsStore::activatedProviderIds() -> Result<std::vector<std::string>>
{
    return load().transform([](ChatSettings settings) { return std::move(settings.activatedMCPServers); });
}

auto JsonFileSettingsStore::setActivatedProviderIds(std::vector<std::string> ids) -> VoidResult
{
    return update(nlohmann::json { { "activatedMCPServers", std::move(ids) } }).transform([](const ChatSettings&) {});
}

} // namespace webchat
