#pragma once

#include <mcp_agents/core/result.hpp>

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace mcp_agents {

constexpr std::chrono::milliseconds kDefaultTimeout{120'000};
constexpr std::size_t kMaxOutputBytes = 10 * 1024 * 1024;

struct RunOptions {
    std::chrono::milliseconds timeout = kDefaultTimeout;
    // Cap on the combined size of captured stdout and stderr.
    std::size_t max_output_bytes = kMaxOutputBytes;
};

// ---------------------------------------------------------------------------
// IProcessRunner: runs one non-interactive command to completion.
//
// The dispatcher depends on this interface rather than on process
// primitives, so tool-call logic is testable with MockProcessRunner.
//
// On success the value is the captured text: stdout when non-empty, else
// stderr, with trailing whitespace removed. Expected failures (spawn
// failure, timeout, non-zero exit, output cap) are returned as Error,
// never thrown. Implementations must be safe to call from several threads
// at once; each call owns its child.
// ---------------------------------------------------------------------------
class IProcessRunner {
public:
    IProcessRunner() = default;
    virtual ~IProcessRunner() = default;

    IProcessRunner(const IProcessRunner&) = delete;
    IProcessRunner& operator=(const IProcessRunner&) = delete;
    IProcessRunner(IProcessRunner&&) = delete;
    IProcessRunner& operator=(IProcessRunner&&) = delete;

    [[nodiscard]] virtual Result<std::string, Error> Run(
        const std::string& command,
        const std::vector<std::string>& args,
        const RunOptions& options) = 0;
};

// ---------------------------------------------------------------------------
// ProcessRunner: POSIX implementation.
//
// The command is resolved through PATH and started with posix_spawnp; no
// shell is involved. stdin is /dev/null. The child leads its own process
// group, and on timeout or output overflow the whole group is sent SIGTERM,
// then SIGKILL after kill_grace, and the child is reaped before returning.
// The environment is inherited with NO_COLOR=1 forced.
// ---------------------------------------------------------------------------
class ProcessRunner : public IProcessRunner {
public:
    explicit ProcessRunner(
        std::chrono::milliseconds kill_grace = std::chrono::milliseconds{2000})
        : kill_grace_(kill_grace) {}

    [[nodiscard]] Result<std::string, Error> Run(
        const std::string& command,
        const std::vector<std::string>& args,
        const RunOptions& options) override;

private:
    std::chrono::milliseconds kill_grace_;
};

// Strip trailing spaces, tabs, CR and LF.
std::string TrimTrailingWhitespace(std::string text);

} // namespace mcp_agents
