#include <mcp_agents/mcp/mcp_server.hpp>

#include <mcp_agents/core/log.hpp>
#include <mcp_agents/core/version.hpp>

#include <thread>
#include <utility>

namespace mcp_agents {

namespace {

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

// Member as a string, "" when absent or not a string.
std::string StringMember(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

bool IsToolsCall(const nlohmann::json& message) {
    return message.is_object() && message.contains("id") &&
           StringMember(message, "jsonrpc") == "2.0" &&
           StringMember(message, "method") == "tools/call";
}

} // anonymous namespace

McpServer::McpServer(ToolRegistry registry,
                     std::istream& in,
                     std::ostream& out)
    : registry_(std::move(registry)),
      transport_(in, out),
      launch_worker_([](std::function<void()> work) {
          std::thread(std::move(work)).detach();
      }) {}

McpServer::~McpServer() {
    WaitForPendingCalls();
}

void McpServer::Run() {
    std::string line;
    while (transport_.ReadLine(line)) {
        if (line.empty()) continue;
        HandleLine(line);
    }

    LogDebug("mcp", "stdin closed, waiting for " +
                        std::to_string(PendingCalls()) + " pending call(s)");
    WaitForPendingCalls();
    transport_.Close();
}

void McpServer::HandleLine(const std::string& line) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception&) {
        transport_.Send(MakeError(nullptr, kParseError, "Parse error"));
        return;
    }

    if (IsToolsCall(message)) {
        DispatchCallAsync(std::move(message));
        return;
    }

    auto response = HandleMessage(message);
    if (response) {
        transport_.Send(*response);
    }
}

void McpServer::DispatchCallAsync(nlohmann::json message) {
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        ++pending_;
    }

    const auto id = message["id"];
    auto work = [this, message = std::move(message)]() {
        nlohmann::json response;
        try {
            response = *HandleMessage(message);
        } catch (const std::exception& e) {
            LogError("mcp", std::string("tools/call failed: ") + e.what());
            response = MakeError(message["id"], kInternalError, e.what());
        }
        transport_.Send(response);
        FinishCall();
    };

    try {
        launch_worker_(std::move(work));
    } catch (const std::exception& e) {
        LogError("mcp", std::string("cannot start worker: ") + e.what());
        transport_.Send(MakeError(id, kInternalError,
                                  std::string("Cannot start worker: ") + e.what()));
        FinishCall();
    }
}

void McpServer::FinishCall() {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    --pending_;
    pending_cv_.notify_all();
}

void McpServer::SetWorkerLauncher(WorkerLauncher launcher) {
    launch_worker_ = std::move(launcher);
}

void McpServer::WaitForPendingCalls() {
    std::unique_lock<std::mutex> lock(pending_mutex_);
    pending_cv_.wait(lock, [this] { return pending_ == 0; });
}

std::size_t McpServer::PendingCalls() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_;
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    if (!message.is_object()) {
        return MakeError(nullptr, kInvalidRequest, "Invalid request");
    }

    if (StringMember(message, "jsonrpc") != "2.0") {
        if (message.contains("id")) {
            return MakeError(message["id"], kInvalidRequest,
                             "Invalid JSON-RPC version");
        }
        return std::nullopt;
    }

    // Notifications have no "id" and get no response.
    if (!message.contains("id")) {
        return std::nullopt;
    }

    const auto& id = message["id"];
    auto method = StringMember(message, "method");
    auto params = message.value("params", nlohmann::json::object());

    if (method == "initialize") {
        return HandleInitialize(params, id);
    } else if (method == "ping") {
        return MakeResult(id, nlohmann::json::object());
    } else if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        return HandleToolsCall(params, id);
    }
    return MakeError(id, kMethodNotFound, "Method not found: " + method);
}

nlohmann::json McpServer::HandleInitialize(
    const nlohmann::json& /*params*/, const nlohmann::json& id) {
    nlohmann::json result;
    result["protocolVersion"] = "2024-11-05";
    result["capabilities"] = {
        {"tools", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", "mcp-agents"},
        {"version", kVersion}
    };

    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) {
    nlohmann::json tools = nlohmann::json::array();

    for (const auto& schema : registry_.Tools()) {
        tools.push_back({
            {"name", schema.name},
            {"description", schema.description},
            {"inputSchema", schema.input_schema}
        });
    }

    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (!params.is_object() || !params.contains("name") ||
        !params["name"].is_string()) {
        return MakeError(id, kInvalidParams, "Missing 'name' parameter");
    }

    auto tool_name = params["name"].get<std::string>();
    auto arguments = params.value("arguments", nlohmann::json::object());
    if (arguments.is_null()) {
        arguments = nlohmann::json::object();
    }

    LogDebug("mcp", "tools/call " + tool_name);
    return MakeResult(id, registry_.Execute(tool_name, arguments).ToJson());
}

nlohmann::json McpServer::MakeError(
    const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

nlohmann::json McpServer::MakeResult(
    const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

} // namespace mcp_agents
