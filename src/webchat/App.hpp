// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <webchat/Config.hpp>

#include <memory>
#include <string_view>

namespace webchat
{

/// @brief Wires the settings store, the connection manager and the tool dispatcher
/// together and serves a line-oriented command shell on stdin.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Loads the provider document and starts auto-start in the background.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Runs the command loop until "quit" or end of input.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run() -> int;

    /// @brief Executes one command line.
    /// @return false if the command asks to quit.
    auto handleCommand(std::string_view line) -> bool;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace webchat
