// SPDX-License-Identifier: Apache-2.0
#include <webchat/SettingsStore.hpp>

#include <catch2/catch_test_macros.hpp>

#include "TempDirectory.hpp"

#include <fstream>
#include <sstream>

using namespace webchat;
using webchat::test::TempDirectory;

namespace
{

auto readJson(const std::filesystem::path& path) -> nlohmann::json
{
    auto file = std::ifstream(path);
    auto ss = std::stringstream {};
    ss << file.rdbuf();
    return nlohmann::json::parse(ss.str());
}

} // namespace

TEST_CASE("JsonFileSettingsStore creates a missing file with defaults", "[settings]")
{
    auto const dir = TempDirectory {};
    auto store = JsonFileSettingsStore(dir / "settings/webchat-settings.json");

    auto settings = store.load();
    REQUIRE(settings.has_value());
    CHECK(settings->activatedMCPServers.empty());
    CHECK(settings->autoExecuteTools.empty());
    CHECK(!settings->requireConfirmationForAll);

    REQUIRE(std::filesystem::exists(store.path()));
    CHECK(readJson(store.path()) == toJson(ChatSettings {}));
}

TEST_CASE("JsonFileSettingsStore fills missing fields with defaults", "[settings]")
{
    auto const dir = TempDirectory {};
    {
        auto file = std::ofstream(dir / "settings.json");
        file << R"({"autoExecuteTools": ["read_file"]})";
    }

    auto store = JsonFileSettingsStore(dir / "settings.json");
    auto settings = store.load();
    REQUIRE(settings.has_value());
    CHECK(settings->autoExecuteTools == std::vector<std::string> { "read_file" });
    CHECK(settings->selectedMCPTools.empty());
    CHECK(!settings->requireConfirmationForAll);
}

TEST_CASE("JsonFileSettingsStore update merges and preserves unknown fields", "[settings]")
{
    auto const dir = TempDirectory {};
    {
        auto file = std::ofstream(dir / "settings.json");
        file << R"({"theme": "dark", "activatedMCPServers": ["fs"]})";
    }

    auto store = JsonFileSettingsStore(dir / "settings.json");
    auto updated = store.update({ { "requireConfirmationForAll", true } });
    REQUIRE(updated.has_value());
    CHECK(updated->requireConfirmationForAll);
    CHECK(updated->activatedMCPServers == std::vector<std::string> { "fs" });

    auto const stored = readJson(store.path());
    CHECK(stored["theme"] == "dark");
    CHECK(stored["requireConfirmationForAll"] == true);
}

TEST_CASE("JsonFileSettingsStore update rejects mistyped fields", "[settings]")
{
    auto const dir = TempDirectory {};
    auto store = JsonFileSettingsStore(dir / "settings.json");
    REQUIRE(store.load().has_value());

    auto notArray = store.update({ { "autoExecuteTools", "read_file" } });
    REQUIRE(!notArray.has_value());
    CHECK(notArray.error().code == ErrorCode::ConfigError);
    CHECK(notArray.error().message.find("autoExecuteTools must be an array") != std::string::npos);

    auto notStrings = store.update({ { "activatedMCPServers", nlohmann::json::array({ 1, 2 }) } });
    REQUIRE(!notStrings.has_value());
    CHECK(notStrings.error().message.find("All activatedMCPServers must be strings") != std::string::npos);

    auto notBool = store.update({ { "requireConfirmationForAll", "yes" } });
    REQUIRE(!notBool.has_value());
    CHECK(notBool.error().message.find("requireConfirmationForAll must be a boolean") != std::string::npos);

    // Nothing invalid reached the file.
    CHECK(readJson(store.path()) == toJson(ChatSettings {}));
}

TEST_CASE("JsonFileSettingsStore reports an invalid file", "[settings]")
{
    auto const dir = TempDirectory {};
    {
        auto file = std::ofstream(dir / "settings.json");
        file << "{ broken";
    }

    auto store = JsonFileSettingsStore(dir / "settings.json");
    auto settings = store.load();
    REQUIRE(!settings.has_value());
    CHECK(settings.error().code == ErrorCode::ConfigError);

    auto activated = store.activatedProviderIds();
    REQUIRE(!activated.has_value());
}

TEST_CASE("JsonFileSettingsStore stores the activated providers", "[settings]")
{
    auto const dir = TempDirectory {};
    auto store = JsonFileSettingsStore(dir / "settings.json");

    REQUIRE(store.setActivatedProviderIds({ "fs", "web-search" }).has_value());

    auto activated = store.activatedProviderIds();
    REQUIRE(activated.has_value());
    CHECK(*activated == std::vector<std::string> { "fs", "web-search" });
}

TEST_CASE("validateSettings requires an object", "[settings]")
{
    auto const result = validateSettings(nlohmann::json::array());
    REQUIRE(!result.has_value());
    CHECK(result.error().message == "Settings must be an object");
    CHECK(validateSettings(toJson(ChatSettings {})).has_value());
}
