#pragma once

#include <mcp_agents/backend/backend_registry.hpp>
#include <mcp_agents/core/log.hpp>
#include <mcp_agents/process/process_runner.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mcp_agents {

enum class LogFormat {
    Text,
    Json,
};

// One source of settings (YAML file or command line). Unset fields defer
// to the layer below.
struct ConfigLayer {
    std::optional<std::string> provider;
    std::optional<long long> timeout_ms;
    std::optional<long long> max_output_bytes;
    std::optional<std::string> log_format;
    std::optional<std::string> log_level;
    std::optional<bool> verbose;
};

struct CliArgs {
    ConfigLayer layer;
    std::optional<std::string> config_file;
    bool color = false;
    bool no_color = false;
    bool show_version = false;
    std::vector<std::string> unrecognized;
};

// Effective settings after merging defaults <- YAML <- CLI.
struct AppConfig {
    std::string provider = kDefaultProvider;
    std::chrono::milliseconds timeout = kDefaultTimeout;
    std::size_t max_output_bytes = kMaxOutputBytes;
    LogFormat log_format = LogFormat::Text;
    LogLevel log_level = LogLevel::Info;
    bool force_color = false;
    bool force_no_color = false;
};

} // namespace mcp_agents
