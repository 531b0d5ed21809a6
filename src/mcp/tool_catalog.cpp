#include <mcp_agents/mcp/tool_catalog.hpp>

#include <string>

namespace mcp_agents {

nlohmann::json PingInputSchema() {
    return {{"type", "object"},
            {"additionalProperties", false},
            {"properties", nlohmann::json::object()}};
}

nlohmann::json BackendInputSchema(const BackendDefinition& backend,
                                  std::chrono::milliseconds default_timeout) {
    nlohmann::json properties = {
        {"prompt", {
            {"type", "string"},
            {"description", "Prompt for " + backend.command},
        }},
        {"timeout_ms", {
            {"type", "integer"},
            {"minimum", 1},
            {"description", "Optional timeout override (default " +
                                std::to_string(default_timeout.count()) + ")"},
        }},
    };
    for (const auto& item : backend.extra_properties.items()) {
        properties[item.key()] = item.value();
    }

    return {{"type", "object"},
            {"additionalProperties", false},
            {"properties", properties},
            {"required", nlohmann::json::array({"prompt"})}};
}

std::vector<ToolSchema> BuildToolCatalog(
    const BackendDefinition& backend,
    std::chrono::milliseconds default_timeout) {
    return {
        ToolSchema{
            kPingToolName,
            "Connectivity test. Returns 'pong' instantly without calling the CLI.",
            PingInputSchema(),
        },
        ToolSchema{
            backend.tool_name,
            backend.description,
            BackendInputSchema(backend, default_timeout),
        },
    };
}

} // namespace mcp_agents
