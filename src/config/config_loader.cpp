#include <mcp_agents/config/config_loader.hpp>

#include <mcp_agents/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <stdexcept>
#include <string>

namespace mcp_agents {

namespace {

template <typename T>
void ReadScalar(const YAML::Node& root, const char* key,
                std::optional<T>& out) {
    if (root[key]) {
        out = root[key].as<T>();
    }
}

Result<LogFormat, Error> ParseLogFormat(const std::string& name) {
    if (name == "text") return Result<LogFormat, Error>::Ok(LogFormat::Text);
    if (name == "json") return Result<LogFormat, Error>::Ok(LogFormat::Json);
    return Result<LogFormat, Error>::Err(
        Error::Config("Invalid log format '" + name + "' (expected text or json)"));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<ConfigLayer, Error> LoadFromYaml(std::string_view file_path) {
    ConfigLayer layer;
    try {
        YAML::Node root = YAML::LoadFile(std::string(file_path));
        if (root.IsNull()) {
            return Result<ConfigLayer, Error>::Ok(layer);
        }
        if (!root.IsMap()) {
            return Result<ConfigLayer, Error>::Err(Error::Config(
                "Config file " + std::string(file_path) + " must be a mapping"));
        }
        ReadScalar(root, "provider", layer.provider);
        ReadScalar(root, "timeout_ms", layer.timeout_ms);
        ReadScalar(root, "max_output_bytes", layer.max_output_bytes);
        ReadScalar(root, "log_format", layer.log_format);
        ReadScalar(root, "log_level", layer.log_level);
        ReadScalar(root, "verbose", layer.verbose);
    } catch (const YAML::Exception& e) {
        return Result<ConfigLayer, Error>::Err(
            Error::Config("Failed to parse YAML file: " + std::string(e.what())));
    }
    return Result<ConfigLayer, Error>::Ok(std::move(layer));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliArgs, Error> LoadFromCli(int argc, const char* const* argv) {
    // -v is verbosity here, so only --help comes from argparse.
    argparse::ArgumentParser program("mcp-agents", kVersion,
                                     argparse::default_arguments::help);

    program.add_argument("--provider")
        .help("CLI backend to expose: claude, gemini or codex (default codex)");
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--timeout-ms")
        .help("Default per-call timeout in milliseconds")
        .scan<'i', long long>();
    program.add_argument("--max-output-bytes")
        .help("Maximum combined stdout+stderr captured per call")
        .scan<'i', long long>();
    program.add_argument("--log-format")
        .help("Diagnostic format on stderr: text or json");
    program.add_argument("--log-level")
        .help("Minimum diagnostic level: debug, info, warn or error");
    program.add_argument("-v", "--verbose")
        .help("Debug diagnostics")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored diagnostics")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored diagnostics")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    CliArgs args;
    try {
        args.unrecognized = program.parse_known_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliArgs, Error>::Err(
            Error::Config("CLI parse error: " + std::string(e.what())));
    }

    if (auto val = program.present("--provider")) {
        args.layer.provider = *val;
    }
    if (auto val = program.present("--config")) {
        args.config_file = *val;
    }
    if (auto val = program.present<long long>("--timeout-ms")) {
        args.layer.timeout_ms = *val;
    }
    if (auto val = program.present<long long>("--max-output-bytes")) {
        args.layer.max_output_bytes = *val;
    }
    if (auto val = program.present("--log-format")) {
        args.layer.log_format = *val;
    }
    if (auto val = program.present("--log-level")) {
        args.layer.log_level = *val;
    }
    if (program.get<bool>("--verbose")) {
        args.layer.verbose = true;
    }
    args.color = program.get<bool>("--color");
    args.no_color = program.get<bool>("--no-color");
    args.show_version = program.get<bool>("--version");

    return Result<CliArgs, Error>::Ok(std::move(args));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
Result<AppConfig, Error> MergeConfigs(const ConfigLayer& yaml_base,
                                      const CliArgs& cli) {
    const auto& top = cli.layer;
    auto pick = [](const auto& over, const auto& under) {
        return over.has_value() ? over : under;
    };

    AppConfig config;
    config.force_color = cli.color;
    config.force_no_color = cli.no_color;

    if (auto provider = pick(top.provider, yaml_base.provider)) {
        config.provider = *provider;
    }

    if (auto timeout = pick(top.timeout_ms, yaml_base.timeout_ms)) {
        if (*timeout <= 0) {
            return Result<AppConfig, Error>::Err(Error::Config(
                "Timeout must be positive, got " + std::to_string(*timeout)));
        }
        config.timeout = std::chrono::milliseconds(*timeout);
    }

    if (auto max_bytes = pick(top.max_output_bytes, yaml_base.max_output_bytes)) {
        if (*max_bytes <= 0) {
            return Result<AppConfig, Error>::Err(Error::Config(
                "Output limit must be positive, got " + std::to_string(*max_bytes)));
        }
        config.max_output_bytes = static_cast<std::size_t>(*max_bytes);
    }

    if (auto format = pick(top.log_format, yaml_base.log_format)) {
        auto parsed = ParseLogFormat(*format);
        if (parsed.IsErr()) {
            return Result<AppConfig, Error>::Err(parsed.Error());
        }
        config.log_format = parsed.Value();
    }

    // An explicit level wins over the verbose switch at the same layer.
    if (top.log_level || (!top.verbose && yaml_base.log_level)) {
        const auto& name = top.log_level ? *top.log_level : *yaml_base.log_level;
        auto level = ParseLogLevel(name);
        if (!level) {
            return Result<AppConfig, Error>::Err(Error::Config(
                "Invalid log level '" + name +
                "' (expected debug, info, warn or error)"));
        }
        config.log_level = *level;
    } else if (pick(top.verbose, yaml_base.verbose).value_or(false)) {
        config.log_level = LogLevel::Debug;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config,
                                   const BackendRegistry& registry) {
    auto backend = SelectBackend(registry, config.provider);
    if (backend.IsErr()) {
        return Result<void, Error>::Err(backend.Error());
    }
    if (config.timeout.count() <= 0) {
        return Result<void, Error>::Err(Error::Config("Timeout must be positive"));
    }
    if (config.max_output_bytes == 0) {
        return Result<void, Error>::Err(Error::Config("Output limit must be positive"));
    }
    return Result<void, Error>::Ok();
}

} // namespace mcp_agents
