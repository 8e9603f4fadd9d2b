// SPDX-License-Identifier: Apache-2.0
#include <core/Log.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace webchat;

namespace
{

/// Captures log output for the lifetime of the object and restores the level afterwards.
class CapturedLog
{
  public:
    explicit CapturedLog(log::Level level): _previousLevel(log::getLevel())
    {
        log::setLevel(level);
        log::setCallback([this](log::Level messageLevel, std::string_view message) {
            lines.emplace_back(messageLevel, std::string(message));
        });
    }

    ~CapturedLog()
    {
        log::setCallback({});
        log::setLevel(_previousLevel);
    }

    std::vector<std::pair<log::Level, std::string>> lines;

  private:
    log::Level _previousLevel;
};

} // namespace

TEST_CASE("log routes messages at or above the level to the callback", "[log]")
{
    auto captured = CapturedLog(log::Level::Info);

    log::error("server {} crashed", "fs");
    log::info("{} tool(s)", 3);
    log::debug("hidden");
    log::trace("hidden");

    REQUIRE(captured.lines.size() == 2);
    CHECK(captured.lines[0].first == log::Level::Error);
    CHECK(captured.lines[0].second == "server fs crashed");
    CHECK(captured.lines[1].first == log::Level::Info);
    CHECK(captured.lines[1].second == "3 tool(s)");
}

TEST_CASE("log level names round-trip", "[log]")
{
    for (auto const level: { log::Level::Error, log::Level::Warning, log::Level::Info, log::Level::Debug,
                             log::Level::Trace })
        CHECK(log::levelFromString(log::levelName(level)) == level);

    CHECK(log::levelFromString("warn") == log::Level::Warning);
    CHECK(!log::levelFromString("INFO").has_value());
    CHECK(!log::levelFromString("").has_value());
}
