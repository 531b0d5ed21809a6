#include <mcp_agents/mcp/tool_registry.hpp>

namespace mcp_agents {

ToolResult ToolResult::Text(const std::string& text) {
    return ToolResult{
        false,
        nlohmann::json::array({{{"type", "text"}, {"text", text}}})};
}

ToolResult ToolResult::ErrorText(const std::string& text) {
    return ToolResult{
        true,
        nlohmann::json::array({{{"type", "text"}, {"text", text}}})};
}

std::string ToolResult::FirstText() const {
    if (!content.is_array() || content.empty()) {
        return "";
    }
    return content[0].value("text", "");
}

nlohmann::json ToolResult::ToJson() const {
    nlohmann::json j;
    j["content"] = content;
    if (is_error) {
        j["isError"] = true;
    }
    return j;
}

void ToolRegistry::Register(ToolSchema schema, ToolHandler handler) {
    auto name = schema.name;
    auto existing = handlers_.find(name);
    if (existing != handlers_.end()) {
        for (auto& s : schemas_) {
            if (s.name == name) {
                s = std::move(schema);
            }
        }
        existing->second = std::move(handler);
        return;
    }
    schemas_.push_back(std::move(schema));
    handlers_.emplace(std::move(name), std::move(handler));
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

ToolResult ToolRegistry::Execute(const std::string& name,
                                 const nlohmann::json& arguments) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return ToolResult::ErrorText("Unknown tool: " + name);
    }

    try {
        return it->second(arguments);
    } catch (const std::exception& e) {
        return ToolResult::ErrorText(std::string("Tool error: ") + e.what());
    }
}

} // namespace mcp_agents
