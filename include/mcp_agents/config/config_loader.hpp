#pragma once

#include <mcp_agents/backend/backend_registry.hpp>
#include <mcp_agents/config/app_config.hpp>
#include <mcp_agents/core/result.hpp>

#include <string_view>

namespace mcp_agents {

// Parse a YAML config file. Recognised keys: provider, timeout_ms,
// max_output_bytes, log_format, log_level, verbose.
Result<ConfigLayer, Error> LoadFromYaml(std::string_view file_path);

// Parse process arguments. Unknown arguments are collected rather than
// rejected, so MCP clients that append their own flags still start.
Result<CliArgs, Error> LoadFromCli(int argc, const char* const* argv);

// Apply cli_overrides over yaml_base over built-in defaults and convert
// string settings to their enums. Fails on unparsable values.
Result<AppConfig, Error> MergeConfigs(const ConfigLayer& yaml_base,
                                      const CliArgs& cli);

// Provider must exist in the registry; limits must be positive.
Result<void, Error> ValidateConfig(const AppConfig& config,
                                   const BackendRegistry& registry);

} // namespace mcp_agents
