#include <mcp_agents/core/log.hpp>
#include <mcp_agents/core/ansi.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mcp_agents {

namespace {

struct LevelStyle {
    const char* name;   // JSON and plain text
    const char* tag;    // fixed width for colored lines
    const char* color;
};

const LevelStyle& StyleOf(LogLevel level) {
    static const LevelStyle kStyles[] = {
        {"DEBUG", "DEBUG", ansi::kDim},
        {"INFO",  "INFO ", ansi::kCyan},
        {"WARN",  "WARN ", ansi::kYellow},
        {"ERROR", "ERROR", ansi::kRed},
    };
    return kStyles[static_cast<int>(level)];
}

// UTC with milliseconds for plain and JSON lines, local HH:MM:SS for
// colored lines.
std::string Timestamp(bool utc_iso8601) {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);

    std::tm parts{};
    std::ostringstream oss;
    if (!utc_iso8601) {
        localtime_r(&seconds, &parts);
        oss << std::put_time(&parts, "%H:%M:%S");
        return oss.str();
    }

    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    gmtime_r(&seconds, &parts);
    oss << std::put_time(&parts, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

} // anonymous namespace

std::optional<LogLevel> ParseLogLevel(std::string_view name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info")  return LogLevel::Info;
    if (name == "warn")  return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// ColorConsoleSink
// ---------------------------------------------------------------------------
ColorConsoleSink::ColorConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ColorConsoleSink::Write(LogLevel level, std::string_view component,
                             std::string_view message) {
    const auto& style = StyleOf(level);
    if (use_color_) {
        // HH:MM:SS LEVEL [component] message, errors in red throughout.
        const bool red = level == LogLevel::Error;
        out_ << ansi::kDim << Timestamp(false) << ansi::kReset << ' '
             << style.color << style.tag << ansi::kReset << ' '
             << ansi::kDim << '[' << component << ']' << ansi::kReset << ' '
             << (red ? style.color : "") << message << (red ? ansi::kReset : "");
    } else {
        out_ << Timestamp(true) << " [" << style.name << "] [" << component
             << "] " << message;
    }
    out_ << '\n';
    out_.flush();
}

// ---------------------------------------------------------------------------
// JsonSink
// ---------------------------------------------------------------------------
JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    nlohmann::json line = {
        {"ts", Timestamp(true)},
        {"level", StyleOf(level).name},
        {"component", std::string(component)},
        {"message", std::string(message)},
    };
    // Subprocess stderr may carry invalid UTF-8; replace rather than throw.
    out_ << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
         << '\n';
    out_.flush();
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

void Logger::Debug(std::string_view component, std::string_view message) {
    Log(LogLevel::Debug, component, message);
}
void Logger::Info(std::string_view component, std::string_view message) {
    Log(LogLevel::Info, component, message);
}
void Logger::Warn(std::string_view component, std::string_view message) {
    Log(LogLevel::Warn, component, message);
}
void Logger::Error(std::string_view component, std::string_view message) {
    Log(LogLevel::Error, component, message);
}

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) {
        return;
    }
    sink_->Write(level, component, message);
}

namespace {

// Drops everything until InitGlobalLogger installs a real sink.
class DiscardSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view) override {}
};

// Function-local so logging works from any static initialiser.
std::unique_ptr<Logger>& Slot() {
    static std::unique_ptr<Logger> logger = std::make_unique<Logger>(
        std::make_unique<DiscardSink>(), LogLevel::Error);
    return logger;
}

} // anonymous namespace

void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    Slot() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() {
    return *Slot();
}

void LogDebug(std::string_view component, std::string_view message) {
    GlobalLogger().Debug(component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    GlobalLogger().Info(component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    GlobalLogger().Warn(component, message);
}

void LogError(std::string_view component, std::string_view message) {
    GlobalLogger().Error(component, message);
}

} // namespace mcp_agents
