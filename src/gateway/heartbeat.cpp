/*
 * meshgate - Heartbeat Monitor Implementation
 */

#include <meshgate/gateway/heartbeat.hpp>
#include <meshgate/gateway/node_registry.hpp>
#include <meshgate/gateway/message.hpp>
#include <meshgate/core/logger.hpp>
#include <chrono>

namespace meshgate {

HeartbeatMonitor::HeartbeatMonitor(NodeRegistry& registry, const Config& config)
    : registry_(registry)
    , config_(config)
    , running_(false)
    , ticks_(0) {
}

HeartbeatMonitor::~HeartbeatMonitor() {
    stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

void HeartbeatMonitor::start() {
    if (running_.load()) {
        LOG_WARN("[HeartbeatMonitor] already running");
        return;
    }

    running_.store(true);
    monitor_thread_ = std::thread(&HeartbeatMonitor::monitor_loop, this);

    LOG_INFO("[HeartbeatMonitor] started (interval=%lldms, timeout=%lldms)",
             static_cast<long long>(config_.ping_interval_ms),
             static_cast<long long>(config_.ping_timeout_ms));
}

void HeartbeatMonitor::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        if (!running_.load()) {
            return;
        }
        running_.store(false);
    }
    wake_cv_.notify_all();

    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }

    LOG_INFO("[HeartbeatMonitor] stopped");
}

// ============================================================================
// Sweep
// ============================================================================

size_t HeartbeatMonitor::tick() {
    ticks_.fetch_add(1);

    // Failed pings are not retried and are not grounds for eviction
    size_t pinged = registry_.broadcast_to_all(make_ping().dump());

    size_t evicted = registry_.remove_stale_nodes(config_.ping_timeout_ms);

    LOG_DEBUG("[HeartbeatMonitor] tick: pinged %zu node(s), evicted %zu", pinged, evicted);
    if (evicted > 0) {
        LOG_INFO("[HeartbeatMonitor] evicted %zu stale node(s)", evicted);
    }
    return evicted;
}

void HeartbeatMonitor::monitor_loop() {
    LOG_DEBUG("[HeartbeatMonitor] monitor thread started");

    std::unique_lock<std::mutex> lock(wake_mutex_);
    while (running_.load()) {
        bool stopping = wake_cv_.wait_for(lock,
            std::chrono::milliseconds(config_.ping_interval_ms),
            [this]() { return !running_.load(); });
        if (stopping) break;

        lock.unlock();
        tick();
        lock.lock();
    }

    LOG_DEBUG("[HeartbeatMonitor] monitor thread exited");
}

} // namespace meshgate
