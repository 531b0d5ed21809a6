#pragma once

#include <mcp_agents/backend/backend_registry.hpp>
#include <mcp_agents/mcp/tool_registry.hpp>
#include <mcp_agents/process/process_runner.hpp>

#include <chrono>
#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_agents {

struct DispatchOptions {
    std::chrono::milliseconds default_timeout = kDefaultTimeout;
    std::size_t max_output_bytes = kMaxOutputBytes;
};

// "prompt" coerced to a string: absent or null -> "", strings as-is,
// anything else serialised.
std::string PromptArgument(const nlohmann::json& arguments);

// "timeout_ms" when it is a JSON integer >= 1, otherwise fallback.
// Strings, floats, zero and negatives are not rejected, just ignored.
std::chrono::milliseconds ResolveTimeout(const nlohmann::json& arguments,
                                         std::chrono::milliseconds fallback);

// The subset of arguments named in backend.extra_properties with a non-null
// value.
nlohmann::json CollectExtraOptions(const nlohmann::json& arguments,
                                   const BackendDefinition& backend);

// One backend tool call: validate the prompt, build argv, run the command
// and shape the outcome. Every failure is an error-flagged result.
ToolResult RunBackendTool(const BackendDefinition& backend,
                          IProcessRunner& runner,
                          const DispatchOptions& options,
                          const nlohmann::json& arguments);

// Register the ping tool and the backend tool. The backend is copied into
// the handler; runner must outlive the registry.
void RegisterAgentTools(ToolRegistry& registry,
                        const BackendDefinition& backend,
                        IProcessRunner& runner,
                        const DispatchOptions& options = {});

} // namespace mcp_agents
