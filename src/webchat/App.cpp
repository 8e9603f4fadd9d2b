// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <agent/ToolDispatcher.hpp>
#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <mcp/ArgumentRepair.hpp>
#include <mcp/ConnectionManager.hpp>
#include <webchat/SettingsStore.hpp>

#include <cstdio>
#include <format>
#include <fstream>
#include <iostream>
#include <mutex>
#include <print>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace webchat
{

namespace
{

    /// @brief Splits off the first whitespace-delimited word.
    auto nextWord(std::string_view& text) -> std::string_view
    {
        auto const begin = text.find_first_not_of(" \t");
        if (begin == std::string_view::npos)
        {
            text = {};
            return {};
        }
        text.remove_prefix(begin);

        auto const end = text.find_first_of(" \t");
        auto const word = text.substr(0, end);
        text = end == std::string_view::npos ? std::string_view {} : text.substr(end + 1);
        return word;
    }

    auto trim(std::string_view text) -> std::string_view
    {
        auto const begin = text.find_first_not_of(" \t\r\n");
        if (begin == std::string_view::npos)
            return {};
        auto const end = text.find_last_not_of(" \t\r\n");
        return text.substr(begin, end - begin + 1);
    }

    void printResults(const std::vector<ToolResult>& results)
    {
        for (const auto& result: results)
            std::println("{}", toJson(result).dump(2));
    }

} // namespace

struct App::Impl
{
    AppConfig config;
    std::shared_ptr<JsonFileSettingsStore> settings;
    std::unique_ptr<ConnectionManager> manager;
    std::unique_ptr<ToolDispatcher> dispatcher;

    std::mutex pendingMutex;
    std::vector<ToolCall> awaitingConfirmation;

    std::jthread autoStartThread;

    explicit Impl(AppConfig cfg): config(std::move(cfg)) {}

    [[nodiscard]] auto executionPolicy() -> ExecutionPolicy
    {
        auto loaded = settings->load();
        if (!loaded)
        {
            log::warning("Using default tool policy: {}", loaded.error().message);
            return ExecutionPolicy {};
        }
        return ExecutionPolicy {
            .autoExecuteTools = std::move(loaded->autoExecuteTools),
            .requireConfirmationForAll = loaded->requireConfirmationForAll,
        };
    }

    void printHelp()
    {
        auto helpText = std::string {};
        helpText += "Available commands:\n";
        helpText += "  servers                    List configured MCP servers\n";
        helpText += "  tools                      List tools of connected servers\n";
        helpText += "  status <id>                Show the status of a server\n";
        helpText += "  connect <id>               Connect a server\n";
        helpText += "  disconnect <id>            Disconnect a server\n";
        helpText += "  call <id> <tool> [json]    Execute a tool on a server\n";
        helpText += "  exec <json>                Dispatch tool calls using the auto-execute policy\n";
        helpText += "  confirm                    Execute the tool calls awaiting confirmation\n";
        helpText += "  config                     Show the MCP configuration file\n";
        helpText += "  reload <file>              Replace the MCP configuration with a file's content\n";
        helpText += "  settings                   Show the user settings\n";
        helpText += "  help                       Show this help message\n";
        helpText += "  quit                       Exit the application\n";
        std::print("{}", helpText);
    }

    void listServers()
    {
        auto const servers = manager->listServers();
        if (servers.empty())
        {
            std::println("No MCP servers configured.");
            return;
        }

        for (const auto& server: servers)
        {
            std::println("{:<20} {:<13} {:<10} {} tool(s){}",
                         server.config.id,
                         sessionStatusName(server.status),
                         transportKindName(server.config.transport),
                         server.tools.size(),
                         server.config.disabled ? " [disabled]" : "");
        }
    }

    void listTools()
    {
        auto const tools = manager->listTools();
        if (tools.empty())
        {
            std::println("No tools available. Connect a server first.");
            return;
        }

        for (const auto& [providerId, tool]: tools)
            std::println("{}/{}: {}", providerId, tool.name, tool.description);
    }

    void showStatus(std::string_view id)
    {
        auto session = manager->session(std::string(id));
        if (!session)
        {
            std::println("Server {} not found", id);
            return;
        }

        auto const snapshot = ServerSnapshot {
            .config = session->config(),
            .status = session->status(),
            .tools = session->tools(),
            .resources = session->resources(),
            .serverInfo = session->serverInfo(),
        };
        std::println("{}", toJson(snapshot).dump(2));
    }

    void connect(std::string_view id)
    {
        auto status = manager->connect(std::string(id));
        if (!status)
        {
            std::println("Failed to connect {}: {}", id, status.error());
            return;
        }
        std::println("{}: {}", id, sessionStatusName(*status));
    }

    void disconnect(std::string_view id)
    {
        if (auto done = manager->disconnect(std::string(id)); !done)
            std::println("{}", done.error());
        else
            std::println("{}: disconnected", id);
    }

    void callTool(std::string_view rest)
    {
        auto const id = nextWord(rest);
        auto const tool = nextWord(rest);
        if (id.empty() || tool.empty())
        {
            std::println("Usage: call <id> <tool> [json]");
            return;
        }

        auto const argumentText = trim(rest);
        auto arguments = argumentText.empty() ? Result<nlohmann::json>(nlohmann::json::object())
                                              : repairToolArguments(argumentText);
        if (!arguments)
        {
            std::println("{}", arguments.error());
            return;
        }

        auto const call = ToolCall { .id = "manual", .name = std::string(tool), .arguments = std::move(*arguments) };
        auto result = manager->executeTool(std::string(id), call);
        if (!result)
        {
            std::println("{}", result.error());
            if (!result.error().payload.is_null())
                std::println("{}", result.error().payload.dump(2));
            return;
        }
        std::println("{}", result->dump(2));
    }

    void dispatch(std::string_view text)
    {
        auto document = json::parse(trim(text));
        if (!document)
        {
            std::println("{}", document.error());
            return;
        }

        auto calls = toolCallsFromJson(*document);
        if (!calls)
        {
            std::println("{}", calls.error());
            return;
        }

        auto plan = ToolDispatcher::plan(*calls, executionPolicy());
        if (!plan.autoExecute.empty())
            printResults(dispatcher->execute(plan.autoExecute));

        if (!plan.needsConfirmation.empty())
        {
            for (const auto& call: plan.needsConfirmation)
                std::println("Awaiting confirmation: {} ({})", call.name, call.id);
            std::println("Type 'confirm' to execute them.");
        }

        auto const lock = std::lock_guard(pendingMutex);
        awaitingConfirmation = std::move(plan.needsConfirmation);
    }

    void confirm()
    {
        auto calls = std::vector<ToolCall> {};
        {
            auto const lock = std::lock_guard(pendingMutex);
            calls.swap(awaitingConfirmation);
        }

        if (calls.empty())
        {
            std::println("No tool calls awaiting confirmation.");
            return;
        }
        printResults(dispatcher->execute(calls));
    }

    void showConfig()
    {
        auto info = manager->configurationInfo();
        if (!info)
        {
            std::println("{}", info.error());
            return;
        }
        std::println("{}", toJson(*info).dump(2));
    }

    void reload(std::string_view path)
    {
        if (path.empty())
        {
            std::println("Usage: reload <file>");
            return;
        }

        auto file = std::ifstream(std::string(path));
        if (!file.is_open())
        {
            std::println("Cannot open {}", path);
            return;
        }
        auto ss = std::stringstream {};
        ss << file.rdbuf();

        if (auto updated = manager->updateConfiguration(ss.str()); !updated)
        {
            std::println("{}", updated.error());
            return;
        }
        std::println("Configuration updated: {} server(s) known.", manager->listServers().size());
    }

    void showSettings()
    {
        auto loaded = settings->load();
        if (!loaded)
        {
            std::println("{}", loaded.error());
            return;
        }
        std::println("{}", toJson(*loaded).dump(2));
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>(std::move(config)))
{
}

App::~App()
{
    if (_impl->autoStartThread.joinable())
    {
        _impl->autoStartThread.request_stop();
        _impl->autoStartThread.join();
    }
    if (_impl->manager)
        _impl->manager->disconnectAll();
}

auto App::initialize() -> VoidResult
{
    if (auto valid = validateAppConfig(_impl->config); !valid)
        return valid;

    log::setLevel(_impl->config.logLevel);

    _impl->settings = std::make_shared<JsonFileSettingsStore>(_impl->config.settingsPath);
    _impl->manager = std::make_unique<ConnectionManager>(connectionManagerOptions(_impl->config), _impl->settings);
    _impl->dispatcher = std::make_unique<ToolDispatcher>(*_impl->manager);

    _impl->manager->setStatusListener([](const std::string& providerId, SessionStatus status) {
        log::debug("Status of {} changed to {}", providerId, sessionStatusName(status));
    });

    auto const count = _impl->manager->loadConfiguration();
    log::info("{} MCP server(s) known", count);

    if (_impl->config.autoStart)
    {
        _impl->autoStartThread = std::jthread([manager = _impl->manager.get()](const std::stop_token& stopToken) {
            manager->autoStart(stopToken);
        });
    }

    return {};
}

auto App::run() -> int
{
    std::println("webchat-mcp ready. Type 'help' for commands, 'quit' to exit.");

    auto line = std::string {};
    while (true)
    {
        std::print("> ");
        std::fflush(stdout);
        if (!std::getline(std::cin, line))
            break;
        if (!handleCommand(line))
            break;
    }

    return 0;
}

auto App::handleCommand(std::string_view line) -> bool
{
    auto rest = trim(line);
    if (rest.starts_with('/'))
        rest.remove_prefix(1);

    auto const command = nextWord(rest);
    auto const argument = trim(rest);

    if (command.empty())
        return true;

    if (command == "quit" || command == "exit")
        return false;

    if (command == "help")
        _impl->printHelp();
    else if (command == "servers")
        _impl->listServers();
    else if (command == "tools")
        _impl->listTools();
    else if (command == "status")
        _impl->showStatus(argument);
    else if (command == "connect")
        _impl->connect(argument);
    else if (command == "disconnect")
        _impl->disconnect(argument);
    else if (command == "call")
        _impl->callTool(argument);
    else if (command == "exec")
        _impl->dispatch(argument);
    else if (command == "confirm")
        _impl->confirm();
    else if (command == "config")
        _impl->showConfig();
    else if (command == "reload")
        _impl->reload(argument);
    else if (command == "settings")
        _impl->showSettings();
    else
        std::println("Unknown command: {}", command);

    return true;
}

} // namespace webchat
