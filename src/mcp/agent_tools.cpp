#include <mcp_agents/mcp/agent_tools.hpp>

#include <mcp_agents/core/log.hpp>
#include <mcp_agents/mcp/tool_catalog.hpp>

#include <cstdint>
#include <limits>

namespace mcp_agents {

namespace {

const nlohmann::json& ArgOrNull(const nlohmann::json& arguments,
                                const std::string& key) {
    static const nlohmann::json kNull;
    if (!arguments.is_object()) {
        return kNull;
    }
    auto it = arguments.find(key);
    return it == arguments.end() ? kNull : *it;
}

bool IsBlank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n\v\f") == std::string::npos;
}

} // anonymous namespace

std::string PromptArgument(const nlohmann::json& arguments) {
    const auto& prompt = ArgOrNull(arguments, "prompt");
    if (prompt.is_null()) {
        return "";
    }
    if (prompt.is_string()) {
        return prompt.get<std::string>();
    }
    return prompt.dump();
}

std::chrono::milliseconds ResolveTimeout(const nlohmann::json& arguments,
                                         std::chrono::milliseconds fallback) {
    const auto& raw = ArgOrNull(arguments, "timeout_ms");
    if (raw.is_number_unsigned()) {
        auto v = raw.get<std::uint64_t>();
        if (v >= 1 && v <= static_cast<std::uint64_t>(
                              std::numeric_limits<std::int64_t>::max())) {
            return std::chrono::milliseconds(static_cast<std::int64_t>(v));
        }
    } else if (raw.is_number_integer()) {
        auto v = raw.get<std::int64_t>();
        if (v >= 1) {
            return std::chrono::milliseconds(v);
        }
    }
    return fallback;
}

nlohmann::json CollectExtraOptions(const nlohmann::json& arguments,
                                   const BackendDefinition& backend) {
    nlohmann::json opts = nlohmann::json::object();
    for (const auto& item : backend.extra_properties.items()) {
        const auto& value = ArgOrNull(arguments, item.key());
        if (!value.is_null()) {
            opts[item.key()] = value;
        }
    }
    return opts;
}

ToolResult RunBackendTool(const BackendDefinition& backend,
                          IProcessRunner& runner,
                          const DispatchOptions& options,
                          const nlohmann::json& arguments) {
    auto prompt = PromptArgument(arguments);
    if (IsBlank(prompt)) {
        return ToolResult::ErrorText("Missing required argument: prompt");
    }

    RunOptions run_options;
    run_options.timeout = ResolveTimeout(arguments, options.default_timeout);
    run_options.max_output_bytes = options.max_output_bytes;

    auto args = backend.build_args(prompt, CollectExtraOptions(arguments, backend));

    LogInfo("dispatch", "tools/call: running " + backend.command + " ...");
    auto result = runner.Run(backend.command, args, run_options);
    if (result.IsErr()) {
        auto message = result.Error().ToString();
        LogError("dispatch", message);
        return ToolResult::ErrorText(message);
    }

    LogInfo("dispatch", "tools/call: done");
    return ToolResult::Text(result.Value());
}

void RegisterAgentTools(ToolRegistry& registry,
                        const BackendDefinition& backend,
                        IProcessRunner& runner,
                        const DispatchOptions& options) {
    auto catalog = BuildToolCatalog(backend, options.default_timeout);

    registry.Register(catalog[0], [](const nlohmann::json&) {
        return ToolResult::Text(kPongMarker);
    });

    registry.Register(catalog[1],
        [backend, &runner, options](const nlohmann::json& arguments) {
            return RunBackendTool(backend, runner, options, arguments);
        });
}

} // namespace mcp_agents
