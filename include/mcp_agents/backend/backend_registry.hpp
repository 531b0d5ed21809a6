#pragma once

#include <mcp_agents/core/result.hpp>

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_agents {

// Builds the argv (command excluded) for one invocation from the prompt and
// the caller-supplied backend options. Options absent from the map are left
// for the builder to default. Must be pure.
using ArgsBuilder = std::function<std::vector<std::string>(
    const std::string& prompt, const nlohmann::json& extra_options)>;

// ---------------------------------------------------------------------------
// BackendDefinition: one supported CLI program.
// ---------------------------------------------------------------------------
struct BackendDefinition {
    std::string id;                  // provider identifier, e.g. "gemini"
    std::string command;             // executable name, resolved via PATH
    std::string tool_name;           // tool identifier advertised over MCP
    std::string description;
    ArgsBuilder build_args;
    nlohmann::json extra_properties = nlohmann::json::object();
};

// ---------------------------------------------------------------------------
// BackendRegistry: open table of backend definitions keyed by provider id.
//
// Adding a provider means adding an entry; dispatch never switches on ids.
// ---------------------------------------------------------------------------
class BackendRegistry {
public:
    void Add(BackendDefinition definition);

    // nullptr when no entry matches.
    [[nodiscard]] const BackendDefinition* Find(std::string_view id) const;

    // Provider ids in sorted order.
    [[nodiscard]] std::vector<std::string> Ids() const;

    [[nodiscard]] std::size_t Size() const noexcept { return backends_.size(); }

private:
    std::map<std::string, BackendDefinition, std::less<>> backends_;
};

constexpr const char* kDefaultProvider = "codex";

// The built-in table: claude, gemini, codex.
BackendRegistry BuiltinBackends();

// Resolve the provider selected at startup. An unknown id is a Config error
// whose message names the valid ids.
Result<BackendDefinition, Error> SelectBackend(const BackendRegistry& registry,
                                               std::string_view provider);

} // namespace mcp_agents
