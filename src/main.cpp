#include <mcp_agents/backend/backend_registry.hpp>
#include <mcp_agents/config/config_loader.hpp>
#include <mcp_agents/core/log.hpp>
#include <mcp_agents/core/terminal.hpp>
#include <mcp_agents/core/version.hpp>
#include <mcp_agents/mcp/agent_tools.hpp>
#include <mcp_agents/mcp/lifecycle_guard.hpp>
#include <mcp_agents/mcp/mcp_server.hpp>
#include <mcp_agents/mcp/tool_registry.hpp>
#include <mcp_agents/process/process_runner.hpp>

#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;

// Last line of defence: a fault nobody caught means an invariant is broken
// somewhere. Report it on stderr and exit non-zero.
[[noreturn]] void OnTerminate() {
    std::string what = "unknown exception";
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            what = "non-standard exception";
        }
    }
    mcp_agents::LogError("main", "Unhandled fault: " + what);
    std::_Exit(kExitFailure);
}

std::unique_ptr<mcp_agents::ILogSink> MakeSink(
    const mcp_agents::AppConfig& config) {
    using namespace mcp_agents;
    if (config.log_format == LogFormat::Json) {
        return std::make_unique<JsonSink>(std::cerr);
    }
    return std::make_unique<ColorConsoleSink>(
        ResolveColor(config.force_color, config.force_no_color), std::cerr);
}

int RunServer(int argc, const char* argv[]) {
    using namespace mcp_agents;

    // Until the config is known, report on plain stderr.
    InitGlobalLogger(std::make_unique<ColorConsoleSink>(ResolveColor(false, false)),
                     LogLevel::Info);

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) {
        LogError("config", cli.Error().ToString());
        return kExitFailure;
    }
    if (cli.Value().show_version) {
        std::cout << "mcp-agents " << kVersion << "\n";
        return kExitSuccess;
    }

    ConfigLayer yaml_layer;
    if (const auto& path = cli.Value().config_file) {
        auto loaded = LoadFromYaml(*path);
        if (loaded.IsErr()) {
            LogError("config", loaded.Error().ToString());
            return kExitFailure;
        }
        yaml_layer = std::move(loaded).Value();
    }

    auto merged = MergeConfigs(yaml_layer, cli.Value());
    if (merged.IsErr()) {
        LogError("config", merged.Error().ToString());
        return kExitFailure;
    }
    const auto config = std::move(merged).Value();
    InitGlobalLogger(MakeSink(config), config.log_level);

    for (const auto& arg : cli.Value().unrecognized) {
        if (arg != argv[0]) {
            LogWarn("config", "Ignoring unrecognized argument: " + arg);
        }
    }

    const auto backends = BuiltinBackends();
    auto valid = ValidateConfig(config, backends);
    if (valid.IsErr()) {
        LogError("config", valid.Error().ToString());
        return kExitFailure;
    }
    const auto backend = SelectBackend(backends, config.provider).Value();

    ProcessRunner runner;
    ToolRegistry registry;
    RegisterAgentTools(registry, backend, runner,
                       DispatchOptions{config.timeout, config.max_output_bytes});

    McpServer server(std::move(registry));
    LifecycleGuard guard;
    guard.Install(server.Transport());

    LogInfo("main", "ready (provider: " + config.provider + ")");
    server.Run();
    LogInfo("main", "transport closed, exiting");
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    std::set_terminate(OnTerminate);
    // A client that hangs up mid-response must not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    try {
        return RunServer(argc, argv);
    } catch (const std::exception& e) {
        mcp_agents::LogError("main", std::string("Fatal: ") + e.what());
        return kExitFailure;
    }
}
