#include <mcp_agents/core/result.hpp>

namespace mcp_agents {

Error Error::Config(const std::string& message) {
    return Error{"ConfigLoader", message, std::nullopt, std::nullopt, {},
                 ErrorCategory::Config};
}

Error Error::SpawnFailed(const std::string& command,
                         const std::string& reason) {
    return Error{command, "Failed to start " + command + ": " + reason,
                 std::nullopt, std::nullopt, {}, ErrorCategory::SpawnFailed};
}

Error Error::Timeout(const std::string& command, long long timeout_ms,
                     std::string stderr_text) {
    return Error{command,
                 command + " failed: timed out after " +
                     std::to_string(timeout_ms) + " ms",
                 std::nullopt, std::nullopt, std::move(stderr_text),
                 ErrorCategory::Timeout};
}

Error Error::ExitStatus(const std::string& command, int status,
                        std::string stderr_text) {
    return Error{command,
                 command + " failed: exited with status " +
                     std::to_string(status),
                 status, std::nullopt, std::move(stderr_text),
                 ErrorCategory::NonZeroExit};
}

Error Error::Signaled(const std::string& command, int signal,
                      std::string stderr_text) {
    return Error{command,
                 command + " failed: terminated by signal " +
                     std::to_string(signal),
                 std::nullopt, signal, std::move(stderr_text),
                 ErrorCategory::NonZeroExit};
}

Error Error::OutputLimit(const std::string& command, std::size_t max_bytes,
                         std::string stderr_text) {
    return Error{command,
                 command + " failed: output exceeded " +
                     std::to_string(max_bytes) + " bytes",
                 std::nullopt, std::nullopt, std::move(stderr_text),
                 ErrorCategory::OutputLimit};
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::Config:      return "config";
        case ErrorCategory::SpawnFailed: return "spawn_failed";
        case ErrorCategory::Timeout:     return "timeout";
        case ErrorCategory::NonZeroExit: return "non_zero_exit";
        case ErrorCategory::OutputLimit: return "output_limit";
        case ErrorCategory::Internal:    return "internal";
    }
    return "internal";
}

std::string Error::ToString() const {
    if (stderr_text.empty()) {
        return message;
    }
    return message + "\nstderr:\n" + stderr_text;
}

} // namespace mcp_agents
