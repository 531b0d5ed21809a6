#include <catch2/catch_test_macros.hpp>

#include <mcp_agents/config/config_loader.hpp>

#include <string>
#include <vector>

using namespace mcp_agents;

// ===========================================================================
// Helper: path to test data files
// ===========================================================================

// Tests run from the build directory; derive the source-tree testdata path
// from this file's location.
namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

Result<CliArgs, Error> ParseCli(std::vector<const char*> argv) {
    argv.insert(argv.begin(), "mcp-agents");
    return LoadFromCli(static_cast<int>(argv.size()), argv.data());
}

CliArgs Cli(std::vector<const char*> argv) {
    auto result = ParseCli(std::move(argv));
    REQUIRE(result.IsOk());
    return result.Value();
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& layer = result.Value();

    CHECK(layer.provider == std::optional<std::string>("gemini"));
    CHECK(layer.timeout_ms == std::optional<long long>(30000));
    CHECK(layer.max_output_bytes == std::optional<long long>(65536));
    CHECK(layer.log_format == std::optional<std::string>("json"));
    CHECK(layer.log_level == std::optional<std::string>("warn"));
    CHECK_FALSE(layer.verbose.has_value());
}

TEST_CASE("LoadFromYaml: empty file yields an empty layer", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("empty_config.yaml"));
    REQUIRE(result.IsOk());
    CHECK_FALSE(result.Value().provider.has_value());
    CHECK_FALSE(result.Value().timeout_ms.has_value());
}

TEST_CASE("LoadFromYaml: malformed YAML is a config error", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("invalid_config.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().message.find("Failed to parse YAML file") != std::string::npos);
}

TEST_CASE("LoadFromYaml: wrongly typed value is a config error", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("bad_types_config.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

TEST_CASE("LoadFromYaml: non-mapping root is rejected", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("list_config.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("must be a mapping") != std::string::npos);
}

TEST_CASE("LoadFromYaml: missing file is a config error", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("does_not_exist.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: no arguments", "[config][cli]") {
    auto args = Cli({});
    CHECK_FALSE(args.layer.provider.has_value());
    CHECK_FALSE(args.layer.timeout_ms.has_value());
    CHECK_FALSE(args.layer.verbose.has_value());
    CHECK_FALSE(args.config_file.has_value());
    CHECK_FALSE(args.show_version);
    CHECK_FALSE(args.color);
    CHECK_FALSE(args.no_color);
    CHECK(args.unrecognized.empty());
}

TEST_CASE("LoadFromCli: all options", "[config][cli]") {
    auto args = Cli({"--provider", "claude", "-c", "/etc/mcp.yaml",
                     "--timeout-ms", "5000", "--max-output-bytes", "2048",
                     "--log-format", "json", "--log-level", "error",
                     "-v", "--no-color"});
    CHECK(args.layer.provider == std::optional<std::string>("claude"));
    CHECK(args.config_file == std::optional<std::string>("/etc/mcp.yaml"));
    CHECK(args.layer.timeout_ms == std::optional<long long>(5000));
    CHECK(args.layer.max_output_bytes == std::optional<long long>(2048));
    CHECK(args.layer.log_format == std::optional<std::string>("json"));
    CHECK(args.layer.log_level == std::optional<std::string>("error"));
    CHECK(args.layer.verbose == std::optional<bool>(true));
    CHECK(args.no_color);
}

TEST_CASE("LoadFromCli: --version", "[config][cli]") {
    CHECK(Cli({"--version"}).show_version);
}

TEST_CASE("LoadFromCli: unknown arguments are collected", "[config][cli]") {
    auto args = Cli({"--stdio", "--provider", "gemini"});
    CHECK(args.layer.provider == std::optional<std::string>("gemini"));
    REQUIRE(args.unrecognized.size() == 1);
    CHECK(args.unrecognized[0] == "--stdio");
}

TEST_CASE("LoadFromCli: non-numeric timeout is an error", "[config][cli]") {
    auto result = ParseCli({"--timeout-ms", "soon"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: defaults", "[config][merge]") {
    auto result = MergeConfigs(ConfigLayer{}, CliArgs{});
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.provider == "codex");
    CHECK(config.timeout == kDefaultTimeout);
    CHECK(config.max_output_bytes == kMaxOutputBytes);
    CHECK(config.log_format == LogFormat::Text);
    CHECK(config.log_level == LogLevel::Info);
}

TEST_CASE("MergeConfigs: YAML values apply", "[config][merge]") {
    auto yaml = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(yaml.IsOk());
    auto result = MergeConfigs(yaml.Value(), CliArgs{});
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.provider == "gemini");
    CHECK(config.timeout == std::chrono::milliseconds(30000));
    CHECK(config.max_output_bytes == 65536);
    CHECK(config.log_format == LogFormat::Json);
    CHECK(config.log_level == LogLevel::Warn);
}

TEST_CASE("MergeConfigs: CLI wins over YAML", "[config][merge]") {
    auto yaml = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(yaml.IsOk());
    auto cli = Cli({"--provider", "claude", "--timeout-ms", "1000"});
    auto result = MergeConfigs(yaml.Value(), cli);
    REQUIRE(result.IsOk());
    CHECK(result.Value().provider == "claude");
    CHECK(result.Value().timeout == std::chrono::milliseconds(1000));
    CHECK(result.Value().max_output_bytes == 65536);
}

TEST_CASE("MergeConfigs: verbose means debug", "[config][merge]") {
    auto yaml = LoadFromYaml(TestDataPath("verbose_config.yaml"));
    REQUIRE(yaml.IsOk());
    auto from_yaml = MergeConfigs(yaml.Value(), CliArgs{});
    REQUIRE(from_yaml.IsOk());
    CHECK(from_yaml.Value().log_level == LogLevel::Debug);

    auto from_cli = MergeConfigs(ConfigLayer{}, Cli({"--verbose"}));
    REQUIRE(from_cli.IsOk());
    CHECK(from_cli.Value().log_level == LogLevel::Debug);
}

TEST_CASE("MergeConfigs: CLI verbose beats YAML log level", "[config][merge]") {
    ConfigLayer yaml;
    yaml.log_level = "error";
    auto result = MergeConfigs(yaml, Cli({"-v"}));
    REQUIRE(result.IsOk());
    CHECK(result.Value().log_level == LogLevel::Debug);
}

TEST_CASE("MergeConfigs: explicit level beats verbose in the same layer", "[config][merge]") {
    auto result = MergeConfigs(ConfigLayer{}, Cli({"-v", "--log-level", "warn"}));
    REQUIRE(result.IsOk());
    CHECK(result.Value().log_level == LogLevel::Warn);
}

TEST_CASE("MergeConfigs: color flags carry through", "[config][merge]") {
    auto result = MergeConfigs(ConfigLayer{}, Cli({"--color"}));
    REQUIRE(result.IsOk());
    CHECK(result.Value().force_color);
    CHECK_FALSE(result.Value().force_no_color);
}

TEST_CASE("MergeConfigs: invalid values are config errors", "[config][merge]") {
    SECTION("log format") {
        auto result = MergeConfigs(ConfigLayer{}, Cli({"--log-format", "xml"}));
        REQUIRE(result.IsErr());
        CHECK(result.Error().message == "Invalid log format 'xml' (expected text or json)");
    }
    SECTION("log level") {
        auto result = MergeConfigs(ConfigLayer{}, Cli({"--log-level", "loud"}));
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::Config);
    }
    SECTION("timeout") {
        auto result = MergeConfigs(ConfigLayer{}, Cli({"--timeout-ms", "0"}));
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::Config);
    }
    SECTION("output limit") {
        ConfigLayer yaml;
        yaml.max_output_bytes = -5;
        auto result = MergeConfigs(yaml, CliArgs{});
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::Config);
    }
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: default config is valid", "[config][validate]") {
    CHECK(ValidateConfig(AppConfig{}, BuiltinBackends()).IsOk());
}

TEST_CASE("ValidateConfig: unknown provider", "[config][validate]") {
    AppConfig config;
    config.provider = "gpt";
    auto result = ValidateConfig(config, BuiltinBackends());
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().message.find("Unknown provider: gpt") != std::string::npos);
}

TEST_CASE("ValidateConfig: zero output limit", "[config][validate]") {
    AppConfig config;
    config.max_output_bytes = 0;
    CHECK(ValidateConfig(config, BuiltinBackends()).IsErr());
}
