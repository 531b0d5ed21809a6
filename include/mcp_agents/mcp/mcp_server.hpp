#pragma once

#include <mcp_agents/mcp/stdio_transport.hpp>
#include <mcp_agents/mcp/tool_registry.hpp>

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_agents {

// ---------------------------------------------------------------------------
// McpServer: MCP 2024-11-05 server over stdin/stdout.
//
// Implements JSON-RPC 2.0 protocol with MCP methods:
//   - initialize
//   - ping
//   - tools/list
//   - tools/call
//   - notifications/* (no response)
//
// In Run(), tools/call is executed on a worker thread per request so a
// long-running CLI does not block the reader; other methods are answered
// inline. On EOF, Run() waits for outstanding calls to respond and then
// closes the transport.
// ---------------------------------------------------------------------------
class McpServer {
public:
    // Starts one tools/call job. Must run it exactly once, or throw
    // (std::system_error from std::thread, typically) without running it.
    using WorkerLauncher = std::function<void(std::function<void()>)>;

    explicit McpServer(ToolRegistry registry,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);
    ~McpServer();

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    // Run the server loop (blocks until EOF on stdin and all calls answered).
    void Run();

    // Process a single JSON-RPC message synchronously and return the
    // response (if any). Returns nullopt for notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    [[nodiscard]] StdioTransport& Transport() noexcept { return transport_; }

    [[nodiscard]] std::size_t PendingCalls() const;

    // Replace the default launcher (a detached std::thread per call). If
    // launching fails the call is answered with -32603 and Run() goes on.
    void SetWorkerLauncher(WorkerLauncher launcher);

private:
    void HandleLine(const std::string& line);
    void DispatchCallAsync(nlohmann::json message);
    void FinishCall();
    void WaitForPendingCalls();

    nlohmann::json HandleInitialize(const nlohmann::json& params,
                                    const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);

    static nlohmann::json MakeError(const nlohmann::json& id,
                                    int code, const std::string& message);
    static nlohmann::json MakeResult(const nlohmann::json& id,
                                     const nlohmann::json& result);

    ToolRegistry registry_;
    StdioTransport transport_;

    mutable std::mutex pending_mutex_;
    std::condition_variable pending_cv_;
    std::size_t pending_ = 0;
    WorkerLauncher launch_worker_;
};

} // namespace mcp_agents
