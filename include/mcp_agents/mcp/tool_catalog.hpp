#pragma once

#include <mcp_agents/backend/backend_registry.hpp>
#include <mcp_agents/mcp/tool_registry.hpp>

#include <chrono>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_agents {

// Connectivity check: no arguments, no subprocess, always "pong".
constexpr const char* kPingToolName = "ping";
constexpr const char* kPongMarker = "pong";

// Schema for the ping tool: an empty object, nothing else allowed.
nlohmann::json PingInputSchema();

// Schema for the backend tool:
//   prompt      string, required
//   timeout_ms  integer >= 1, optional
//   ...every key of backend.extra_properties
// with additionalProperties: false. default_timeout only feeds the
// timeout_ms description.
nlohmann::json BackendInputSchema(
    const BackendDefinition& backend,
    std::chrono::milliseconds default_timeout);

// The advertised catalog: ping first, then the backend tool.
std::vector<ToolSchema> BuildToolCatalog(
    const BackendDefinition& backend,
    std::chrono::milliseconds default_timeout);

} // namespace mcp_agents
