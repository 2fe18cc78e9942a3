/*
 * meshgate - Heartbeat Monitor
 *
 * Periodically pings every registered node and evicts nodes that have
 * not sent a ping or pong within the timeout. Eviction here is the only
 * automatic cleanup path for half-open connections.
 */
#ifndef MESHGATE_GATEWAY_HEARTBEAT_HPP
#define MESHGATE_GATEWAY_HEARTBEAT_HPP

#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <cstdint>

namespace meshgate {

class NodeRegistry;

class HeartbeatMonitor {
public:
    struct Config {
        int64_t ping_interval_ms;      // Time between ticks
        int64_t ping_timeout_ms;       // Silence longer than this evicts

        Config()
            : ping_interval_ms(30000)
            , ping_timeout_ms(60000)
        {}
    };

    HeartbeatMonitor(NodeRegistry& registry, const Config& config);
    ~HeartbeatMonitor();

    // Lifecycle
    void start();
    void stop();             // Wakes and joins the thread immediately
    bool is_running() const { return running_.load(); }

    // One sweep: ping everyone, then evict the stale. Returns evicted count.
    size_t tick();

    uint64_t tick_count() const { return ticks_.load(); }

private:
    void monitor_loop();

    NodeRegistry& registry_;
    Config config_;

    std::atomic<bool> running_;
    std::atomic<uint64_t> ticks_;
    std::thread monitor_thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
};

} // namespace meshgate

#endif // MESHGATE_GATEWAY_HEARTBEAT_HPP
