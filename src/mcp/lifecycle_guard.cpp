#include <mcp_agents/mcp/lifecycle_guard.hpp>

#include <mcp_agents/core/log.hpp>

namespace mcp_agents {

LifecycleGuard::LifecycleGuard(std::chrono::milliseconds period)
    : period_(period) {}

LifecycleGuard::~LifecycleGuard() {
    Release();
}

void LifecycleGuard::Install(StdioTransport& transport) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (installed_) {
            return;
        }
        installed_ = true;
        active_ = true;
    }
    timer_ = std::thread([this] { TimerLoop(); });

    auto previous = transport.OnClose();
    transport.SetOnClose([this, previous]() {
        Release();
        if (previous) {
            previous();
        }
    });
    LogDebug("lifecycle", "keepalive armed");
}

void LifecycleGuard::Release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_) {
            return;
        }
        active_ = false;
    }
    cv_.notify_all();
    if (timer_.joinable()) {
        timer_.join();
    }
    LogDebug("lifecycle", "keepalive released");
}

bool LifecycleGuard::Active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

void LifecycleGuard::TimerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (active_) {
        if (!cv_.wait_for(lock, period_, [this] { return !active_; })) {
            ++ticks_;
        }
    }
}

} // namespace mcp_agents
