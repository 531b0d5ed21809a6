#pragma once

#include <functional>
#include <iosfwd>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_agents {

// ---------------------------------------------------------------------------
// StdioTransport: newline-delimited JSON-RPC over a pair of streams.
//
// ReadLine is called from the server loop only. Send may be called from any
// thread; each message is written and flushed as one line under a lock.
// Close signals closure to the registered handler. It may be signalled more
// than once; handlers must tolerate that.
// ---------------------------------------------------------------------------
class StdioTransport {
public:
    using CloseHandler = std::function<void()>;

    StdioTransport(std::istream& in, std::ostream& out);

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    // False on EOF or stream failure.
    bool ReadLine(std::string& line);

    void Send(const nlohmann::json& message);

    void SetOnClose(CloseHandler handler);
    [[nodiscard]] CloseHandler OnClose() const;

    void Close();

private:
    std::istream& in_;
    std::ostream& out_;
    std::mutex write_mutex_;
    mutable std::mutex handler_mutex_;
    CloseHandler on_close_;
};

} // namespace mcp_agents
