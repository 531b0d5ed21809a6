#include <mcp_agents/backend/backend_registry.hpp>

namespace mcp_agents {

void BackendRegistry::Add(BackendDefinition definition) {
    auto id = definition.id;
    backends_.insert_or_assign(std::move(id), std::move(definition));
}

const BackendDefinition* BackendRegistry::Find(std::string_view id) const {
    auto it = backends_.find(id);
    if (it == backends_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> BackendRegistry::Ids() const {
    std::vector<std::string> ids;
    ids.reserve(backends_.size());
    for (const auto& [id, _] : backends_) {
        ids.push_back(id);
    }
    return ids;
}

// ---------------------------------------------------------------------------
// Built-in backends
// ---------------------------------------------------------------------------
BackendRegistry BuiltinBackends() {
    BackendRegistry registry;

    registry.Add(BackendDefinition{
        "claude",
        "claude",
        "claude_code",
        "Run Claude Code CLI (claude -p) with a prompt.",
        [](const std::string& prompt, const nlohmann::json&) {
            return std::vector<std::string>{"-p", prompt};
        },
        nlohmann::json::object(),
    });

    // gemini: -s unless the caller explicitly passes sandbox=false.
    registry.Add(BackendDefinition{
        "gemini",
        "gemini",
        "gemini",
        "Run Gemini CLI (gemini -p) with a prompt.",
        [](const std::string& prompt, const nlohmann::json& opts) {
            std::vector<std::string> args;
            auto it = opts.find("sandbox");
            bool sandbox_off = it != opts.end() && it->is_boolean() &&
                               !it->get<bool>();
            if (!sandbox_off) {
                args.emplace_back("-s");
            }
            args.emplace_back("-p");
            args.push_back(prompt);
            return args;
        },
        {
            {"sandbox", {
                {"type", "boolean"},
                {"default", true},
                {"description", "Run in sandbox mode (-s flag). Defaults to true."},
            }},
        },
    });

    registry.Add(BackendDefinition{
        "codex",
        "codex",
        "codex",
        "Run Codex CLI (codex exec) with a prompt.",
        [](const std::string& prompt, const nlohmann::json&) {
            return std::vector<std::string>{"exec", prompt};
        },
        nlohmann::json::object(),
    });

    return registry;
}

Result<BackendDefinition, Error> SelectBackend(const BackendRegistry& registry,
                                               std::string_view provider) {
    const auto* backend = registry.Find(provider);
    if (backend == nullptr) {
        std::string available;
        for (const auto& id : registry.Ids()) {
            if (!available.empty()) {
                available += ", ";
            }
            available += id;
        }
        return Result<BackendDefinition, Error>::Err(Error::Config(
            "Unknown provider: " + std::string(provider) +
            " (available: " + available + ")"));
    }
    return Result<BackendDefinition, Error>::Ok(*backend);
}

} // namespace mcp_agents
