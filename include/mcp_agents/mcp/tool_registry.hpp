#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_agents {

// ---------------------------------------------------------------------------
// ToolSchema: one entry of the advertised tool catalog.
// ---------------------------------------------------------------------------
struct ToolSchema {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
};

// ---------------------------------------------------------------------------
// ToolResult: result of executing a tool.
// ---------------------------------------------------------------------------
struct ToolResult {
    bool is_error = false;
    nlohmann::json content;  // array of content blocks

    // Single text block.
    static ToolResult Text(const std::string& text);
    static ToolResult ErrorText(const std::string& text);

    // The "text" of the first content block, or "" if there is none.
    [[nodiscard]] std::string FirstText() const;

    // {content: [...], isError?: true}
    [[nodiscard]] nlohmann::json ToJson() const;
};

// A tool handler takes the call's "arguments" object and returns a ToolResult.
using ToolHandler = std::function<ToolResult(const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// ToolRegistry: name -> handler table behind tools/list and tools/call.
//
// Populated once before the server starts; read-only afterwards, so
// concurrent Execute calls need no locking.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    void Register(ToolSchema schema, ToolHandler handler);

    [[nodiscard]] const std::vector<ToolSchema>& Tools() const noexcept {
        return schemas_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    // Unknown names and handler exceptions become error-flagged results,
    // never protocol faults.
    [[nodiscard]] ToolResult Execute(const std::string& name,
                                     const nlohmann::json& arguments) const;

private:
    std::vector<ToolSchema> schemas_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace mcp_agents
