#include <mcp_agents/process/process_runner.hpp>

#include <mcp_agents/core/log.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <string_view>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace mcp_agents {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::string_view kNoColor = "NO_COLOR=1";

// Owning file descriptor.
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { Reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            Reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    [[nodiscard]] int Get() const noexcept { return fd_; }
    [[nodiscard]] bool Valid() const noexcept { return fd_ >= 0; }

    void Reset() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

// Both ends close-on-exec: a child spawned concurrently by another call
// must not inherit our write end, or our reader would never see EOF.
Result<Pipe, std::string> MakePipe() {
    std::array<int, 2> fds{};
    if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
        return Result<Pipe, std::string>::Err(std::strerror(errno));
    }
    return Result<Pipe, std::string>::Ok(Pipe{UniqueFd(fds[0]), UniqueFd(fds[1])});
}

class SpawnFileActions {
public:
    SpawnFileActions() { ::posix_spawn_file_actions_init(&actions_); }
    ~SpawnFileActions() { ::posix_spawn_file_actions_destroy(&actions_); }
    SpawnFileActions(const SpawnFileActions&) = delete;
    SpawnFileActions& operator=(const SpawnFileActions&) = delete;
    posix_spawn_file_actions_t* Get() { return &actions_; }
private:
    posix_spawn_file_actions_t actions_;
};

class SpawnAttr {
public:
    SpawnAttr() { ::posix_spawnattr_init(&attr_); }
    ~SpawnAttr() { ::posix_spawnattr_destroy(&attr_); }
    SpawnAttr(const SpawnAttr&) = delete;
    SpawnAttr& operator=(const SpawnAttr&) = delete;
    posix_spawnattr_t* Get() { return &attr_; }
private:
    posix_spawnattr_t attr_;
};

// Parent environment with NO_COLOR forced to 1.
std::vector<std::string> ChildEnvironment() {
    std::vector<std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string_view var(*entry);
        if (var.substr(0, 9) == "NO_COLOR=") {
            continue;
        }
        env.emplace_back(var);
    }
    env.emplace_back(kNoColor);
    return env;
}

std::vector<char*> CStringArray(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) {
        out.push_back(s.data());
    }
    out.push_back(nullptr);
    return out;
}

// waitpid with EINTR retry. Returns the pid, 0 (still running with
// WNOHANG) or -1.
pid_t WaitChild(pid_t pid, int* status, int flags) {
    pid_t rc;
    do {
        rc = ::waitpid(pid, status, flags);
    } while (rc < 0 && errno == EINTR);
    return rc;
}

// SIGTERM the child's process group, SIGKILL whatever is left after the
// grace period, and reap the child.
void TerminateGroup(pid_t pid, std::chrono::milliseconds grace) {
    ::killpg(pid, SIGTERM);

    int status = 0;
    const auto give_up = Clock::now() + grace;
    bool reaped = false;
    while (Clock::now() < give_up) {
        if (WaitChild(pid, &status, WNOHANG) != 0) {
            reaped = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    // Grandchildren may outlive the leader; the group id stays valid while
    // any member remains.
    ::killpg(pid, SIGKILL);
    if (!reaped) {
        WaitChild(pid, &status, 0);
    }
}

// now + timeout, saturating at the clock's maximum. Large timeouts would
// otherwise overflow the nanosecond representation.
Clock::time_point DeadlineAfter(std::chrono::milliseconds timeout) {
    const auto now = Clock::now();
    const auto room = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::time_point::max() - now);
    if (timeout >= room) {
        return Clock::time_point::max();
    }
    return now + timeout;
}

int RemainingMs(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Clock::now()).count();
    if (left <= 0) return 0;
    return static_cast<int>(std::min<long long>(left, 1000 * 60 * 60));
}

} // anonymous namespace

std::string TrimTrailingWhitespace(std::string text) {
    auto end = text.find_last_not_of(" \t\r\n\v\f");
    if (end == std::string::npos) {
        return {};
    }
    text.erase(end + 1);
    return text;
}

Result<std::string, Error> ProcessRunner::Run(
    const std::string& command,
    const std::vector<std::string>& args,
    const RunOptions& options) {
    using R = Result<std::string, Error>;

    if (command.empty()) {
        return R::Err(Error::SpawnFailed(command, "empty command name"));
    }
    const auto timeout = options.timeout.count() > 0 ? options.timeout
                                                     : kDefaultTimeout;

    auto out_pipe = MakePipe();
    if (out_pipe.IsErr()) {
        return R::Err(Error::SpawnFailed(command, "pipe: " + out_pipe.Error()));
    }
    auto err_pipe = MakePipe();
    if (err_pipe.IsErr()) {
        return R::Err(Error::SpawnFailed(command, "pipe: " + err_pipe.Error()));
    }
    Pipe out = std::move(out_pipe).Value();
    Pipe err = std::move(err_pipe).Value();

    SpawnFileActions actions;
    ::posix_spawn_file_actions_addopen(actions.Get(), STDIN_FILENO,
                                       "/dev/null", O_RDONLY, 0);
    ::posix_spawn_file_actions_adddup2(actions.Get(), out.write_end.Get(),
                                       STDOUT_FILENO);
    ::posix_spawn_file_actions_adddup2(actions.Get(), err.write_end.Get(),
                                       STDERR_FILENO);

    SpawnAttr attr;
    sigset_t no_signals;
    sigemptyset(&no_signals);
    sigset_t default_signals;
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGPIPE);
    ::posix_spawnattr_setpgroup(attr.Get(), 0);
    ::posix_spawnattr_setsigmask(attr.Get(), &no_signals);
    ::posix_spawnattr_setsigdefault(attr.Get(), &default_signals);
    ::posix_spawnattr_setflags(attr.Get(),
                               POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGMASK |
                                   POSIX_SPAWN_SETSIGDEF);

    std::vector<std::string> argv_strings;
    argv_strings.reserve(args.size() + 1);
    argv_strings.push_back(command);
    argv_strings.insert(argv_strings.end(), args.begin(), args.end());
    auto argv = CStringArray(argv_strings);

    auto env_strings = ChildEnvironment();
    auto envp = CStringArray(env_strings);

    pid_t pid = -1;
    int rc = ::posix_spawnp(&pid, command.c_str(), actions.Get(), attr.Get(),
                            argv.data(), envp.data());
    if (rc != 0) {
        return R::Err(Error::SpawnFailed(command, std::strerror(rc)));
    }
    LogDebug("process", command + " started as pid " + std::to_string(pid));

    out.write_end.Reset();
    err.write_end.Reset();

    const auto deadline = DeadlineAfter(timeout);
    std::string stdout_text;
    std::string stderr_text;
    std::array<char, 65536> buffer{};

    while (out.read_end.Valid() || err.read_end.Valid()) {
        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        if (out.read_end.Valid()) {
            fds[count++] = pollfd{out.read_end.Get(), POLLIN, 0};
        }
        if (err.read_end.Valid()) {
            fds[count++] = pollfd{err.read_end.Get(), POLLIN, 0};
        }

        int wait_ms = RemainingMs(deadline);
        if (wait_ms == 0) {
            TerminateGroup(pid, kill_grace_);
            return R::Err(Error::Timeout(command, timeout.count(), stderr_text));
        }

        int ready = ::poll(fds.data(), count, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            std::string reason = std::strerror(errno);
            TerminateGroup(pid, kill_grace_);
            return R::Err(Error{command, command + " failed: poll: " + reason,
                                std::nullopt, std::nullopt, stderr_text,
                                ErrorCategory::Internal});
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            bool is_out = fds[i].fd == out.read_end.Get();
            ssize_t n = ::read(fds[i].fd, buffer.data(), buffer.size());
            if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
                continue;
            }
            if (n <= 0) {
                (is_out ? out.read_end : err.read_end).Reset();
                continue;
            }
            (is_out ? stdout_text : stderr_text)
                .append(buffer.data(), static_cast<std::size_t>(n));
            if (stdout_text.size() + stderr_text.size() > options.max_output_bytes) {
                TerminateGroup(pid, kill_grace_);
                return R::Err(Error::OutputLimit(command, options.max_output_bytes));
            }
        }
    }

    // Both streams are closed; the child may still be running.
    int status = 0;
    for (;;) {
        pid_t w = WaitChild(pid, &status, WNOHANG);
        if (w == pid) break;
        if (w < 0) {
            return R::Err(Error{command,
                                command + " failed: waitpid: " + std::strerror(errno),
                                std::nullopt, std::nullopt, stderr_text,
                                ErrorCategory::Internal});
        }
        if (RemainingMs(deadline) == 0) {
            TerminateGroup(pid, kill_grace_);
            return R::Err(Error::Timeout(command, timeout.count(), stderr_text));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    if (WIFSIGNALED(status)) {
        return R::Err(Error::Signaled(command, WTERMSIG(status), stderr_text));
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        return R::Err(Error::ExitStatus(command, WEXITSTATUS(status), stderr_text));
    }

    // Some CLIs print their answer on stderr even on success.
    return R::Ok(TrimTrailingWhitespace(
        !stdout_text.empty() ? std::move(stdout_text) : std::move(stderr_text)));
}

} // namespace mcp_agents
