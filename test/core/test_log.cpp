#include <catch2/catch_test_macros.hpp>

#include <mcp_agents/core/log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <memory>
#include <regex>
#include <sstream>
#include <string>
#include <vector>

using namespace mcp_agents;

// ===========================================================================
// Helper: a sink that captures messages into a vector.
// ===========================================================================

struct CapturedMessage {
    LogLevel level;
    std::string component;
    std::string message;
};

class CaptureSink : public ILogSink {
public:
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override {
        messages.push_back(
            {level, std::string(component), std::string(message)});
    }

    std::vector<CapturedMessage> messages;
};

// ===========================================================================
// ParseLogLevel
// ===========================================================================

TEST_CASE("ParseLogLevel: known names", "[log]") {
    CHECK(ParseLogLevel("debug") == LogLevel::Debug);
    CHECK(ParseLogLevel("info") == LogLevel::Info);
    CHECK(ParseLogLevel("warn") == LogLevel::Warn);
    CHECK(ParseLogLevel("error") == LogLevel::Error);
}

TEST_CASE("ParseLogLevel: unknown names", "[log]") {
    CHECK_FALSE(ParseLogLevel("").has_value());
    CHECK_FALSE(ParseLogLevel("INFO").has_value());
    CHECK_FALSE(ParseLogLevel("verbose").has_value());
}

// ===========================================================================
// JsonSink
// ===========================================================================

TEST_CASE("JsonSink: writes valid JSON lines", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "runner", "started");

    auto line = oss.str();
    REQUIRE(!line.empty());
    CHECK(line.back() == '\n');

    auto j = nlohmann::json::parse(line);
    CHECK(j["level"] == "INFO");
    CHECK(j["component"] == "runner");
    CHECK(j["message"] == "started");
    CHECK(j["ts"].is_string());
}

TEST_CASE("JsonSink: escapes special characters in message", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "esc", "line1\nline2\ttab \"quoted\" back\\slash");

    auto output = oss.str();
    CHECK(std::count(output.begin(), output.end(), '\n') == 1);
    auto j = nlohmann::json::parse(output);
    CHECK(j["message"] == "line1\nline2\ttab \"quoted\" back\\slash");
}

TEST_CASE("JsonSink: invalid UTF-8 does not throw", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Error, "runner", std::string("bad \xff\xfe bytes"));

    auto j = nlohmann::json::parse(oss.str());
    CHECK(j["message"].get<std::string>().find("bytes") != std::string::npos);
}

// ===========================================================================
// Logger: level filtering
// ===========================================================================

TEST_CASE("Logger: respects min_level", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Warn);

    logger.Debug("c", "should be filtered");
    logger.Info("c", "should be filtered");
    logger.Warn("c", "should pass");
    logger.Error("c", "should pass");

    REQUIRE(sink_ptr->messages.size() == 2);
    CHECK(sink_ptr->messages[0].level == LogLevel::Warn);
    CHECK(sink_ptr->messages[1].level == LogLevel::Error);
}

TEST_CASE("Logger: default level is info", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink));

    logger.Debug("c", "d");
    logger.Info("c", "i");

    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].message == "i");
}

TEST_CASE("Logger: preserves component and message", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    logger.Info("dispatch", "tools/call: running codex");

    REQUIRE(sink_ptr->messages.size() == 1);
    CHECK(sink_ptr->messages[0].component == "dispatch");
    CHECK(sink_ptr->messages[0].message == "tools/call: running codex");
    CHECK(sink_ptr->messages[0].level == LogLevel::Info);
}

// ===========================================================================
// Global logger
// ===========================================================================

TEST_CASE("GlobalLogger: free functions route to the installed sink", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* sink_ptr = sink.get();
    InitGlobalLogger(std::move(sink), LogLevel::Info);

    LogDebug("g", "filtered");
    LogInfo("g", "i");
    LogWarn("g", "w");
    LogError("g", "e");

    REQUIRE(sink_ptr->messages.size() == 3);
    CHECK(sink_ptr->messages[0].message == "i");
    CHECK(sink_ptr->messages[2].level == LogLevel::Error);

    // Leave a quiet logger behind for the remaining tests.
    InitGlobalLogger(std::make_unique<CaptureSink>(), LogLevel::Error);
}

// ===========================================================================
// ColorConsoleSink
// ===========================================================================

TEST_CASE("ColorConsoleSink: plain mode has no escape codes", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(false, oss);

    sink.Write(LogLevel::Info, "mcp", "ready (provider: codex)");

    auto output = oss.str();
    CHECK(output.find("[INFO]") != std::string::npos);
    CHECK(output.find("[mcp]") != std::string::npos);
    CHECK(output.find("ready (provider: codex)") != std::string::npos);
    CHECK(output.find("\033[") == std::string::npos);
    CHECK(output.back() == '\n');
}

TEST_CASE("ColorConsoleSink: plain line layout", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(false, oss);

    sink.Write(LogLevel::Warn, "config", "Ignoring unrecognized argument: --stdio");

    static const std::regex kLine(
        R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z \[WARN\] \[config\] )"
        R"(Ignoring unrecognized argument: --stdio\n)");
    CHECK(std::regex_match(oss.str(), kLine));
}

TEST_CASE("ColorConsoleSink: color mode contains ANSI escape codes", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(true, oss);

    sink.Write(LogLevel::Info, "mcp", "ready");

    auto output = oss.str();
    CHECK(output.find("\033[") != std::string::npos);
    CHECK(output.find("ready") != std::string::npos);
    CHECK(output.back() == '\n');
}

TEST_CASE("ColorConsoleSink: ERROR messages get red text", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(true, oss);

    sink.Write(LogLevel::Error, "dispatch", "codex failed: exited with status 2");

    auto output = oss.str();
    auto first = output.find("\033[1;31m");
    REQUIRE(first != std::string::npos);
    CHECK(output.find("\033[1;31m", first + 1) != std::string::npos);
}
