#pragma once

#include <cassert>
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

namespace mcp_agents {

// ---------------------------------------------------------------------------
// Result<T, E>: a discriminated union that holds either a value or an error.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

    [[nodiscard]] T ValueOr(T default_value) const& {
        if (IsOk()) {
            return std::get<0>(storage_);
        }
        return default_value;
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(OkTag, T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrTag, const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(ErrTag, E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> storage_;
};

// ---------------------------------------------------------------------------
// Result<void, E>: specialization for operations that succeed with no value.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(OkTag{}); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::move(*error_);
    }

private:
    struct OkTag {};
    struct ErrTag {};

    explicit Result(OkTag) : error_(std::nullopt) {}
    Result(ErrTag, const E& error) : error_(error) {}
    Result(ErrTag, E&& error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorCategory: classifies failures of startup and of a single invocation.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    Config,        // unknown provider, bad option value; fatal at startup
    SpawnFailed,   // executable not found / could not be started
    Timeout,       // child killed after the deadline
    NonZeroExit,   // exited with a non-zero status or died from a signal
    OutputLimit,   // combined stdout+stderr exceeded the cap
    Internal,
};

// ---------------------------------------------------------------------------
// Error: structured error for configuration and subprocess failures.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;              // command name or "ConfigLoader"
    std::string message;                // headline, already human-readable
    std::optional<int> exit_status;
    std::optional<int> term_signal;
    std::string stderr_text;            // captured error stream, if any
    ErrorCategory category = ErrorCategory::Internal;

    static Error Config(const std::string& message);
    static Error SpawnFailed(const std::string& command,
                             const std::string& reason);
    static Error Timeout(const std::string& command, long long timeout_ms,
                         std::string stderr_text = {});
    static Error ExitStatus(const std::string& command, int status,
                            std::string stderr_text);
    static Error Signaled(const std::string& command, int signal,
                          std::string stderr_text);
    static Error OutputLimit(const std::string& command,
                             std::size_t max_bytes,
                             std::string stderr_text = {});

    [[nodiscard]] std::string CategoryName() const;

    // Headline plus "\nstderr:\n<text>" when the error stream was non-empty.
    // This is the text surfaced to MCP callers.
    [[nodiscard]] std::string ToString() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               message == other.message &&
               exit_status == other.exit_status &&
               term_signal == other.term_signal &&
               stderr_text == other.stderr_text &&
               category == other.category;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace mcp_agents
