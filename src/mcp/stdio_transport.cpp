#include <mcp_agents/mcp/stdio_transport.hpp>

#include <istream>
#include <ostream>

namespace mcp_agents {

StdioTransport::StdioTransport(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {}

bool StdioTransport::ReadLine(std::string& line) {
    if (!std::getline(in_, line)) {
        return false;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

void StdioTransport::Send(const nlohmann::json& message) {
    // CLI output is not guaranteed to be valid UTF-8.
    auto text = message.dump(-1, ' ', false,
                             nlohmann::json::error_handler_t::replace);
    std::lock_guard<std::mutex> lock(write_mutex_);
    out_ << text << '\n';
    out_.flush();
}

void StdioTransport::SetOnClose(CloseHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    on_close_ = std::move(handler);
}

StdioTransport::CloseHandler StdioTransport::OnClose() const {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    return on_close_;
}

void StdioTransport::Close() {
    auto handler = OnClose();
    if (handler) {
        handler();
    }
}

} // namespace mcp_agents
