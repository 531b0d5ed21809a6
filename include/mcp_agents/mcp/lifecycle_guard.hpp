#pragma once

#include <mcp_agents/mcp/stdio_transport.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>

namespace mcp_agents {

constexpr std::chrono::milliseconds kKeepAlivePeriod{60'000};

// ---------------------------------------------------------------------------
// LifecycleGuard: keepalive held for as long as the transport is open.
//
// Install() starts a recurring no-op timer and chains onto the transport's
// close handler: on closure the timer is cancelled, then the handler the
// transport had before is invoked. Cancellation happens once no matter how
// often closure is signalled.
//
// Owned by main and handed to the transport by reference; it must outlive
// the transport's last Close().
// ---------------------------------------------------------------------------
class LifecycleGuard {
public:
    explicit LifecycleGuard(std::chrono::milliseconds period = kKeepAlivePeriod);
    ~LifecycleGuard();

    LifecycleGuard(const LifecycleGuard&) = delete;
    LifecycleGuard& operator=(const LifecycleGuard&) = delete;

    // Start the timer and hook transport closure. A second call is a no-op.
    void Install(StdioTransport& transport);

    // Cancel the timer. Idempotent; must not be called from the timer itself.
    void Release();

    [[nodiscard]] bool Active() const;

    // Number of timer firings so far.
    [[nodiscard]] std::size_t Ticks() const noexcept { return ticks_.load(); }

private:
    void TimerLoop();

    std::chrono::milliseconds period_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool installed_ = false;
    bool active_ = false;
    std::thread timer_;
    std::atomic<std::size_t> ticks_{0};
};

} // namespace mcp_agents
