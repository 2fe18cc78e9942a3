/*
 * meshgate - HTTP long-poll bridge
 *
 * Per-node mailboxes for clients that cannot hold a WebSocket open.
 * A poll either drains the mailbox at once or parks a completion
 * callback that fires exactly once: when something is queued, when the
 * poll times out, when a newer poll replaces it, or on shutdown.
 */
#ifndef MESHGATE_GATEWAY_BRIDGE_HPP
#define MESHGATE_GATEWAY_BRIDGE_HPP

#include "connection.hpp"
#include "../core/json.hpp"
#include <string>
#include <deque>
#include <map>
#include <vector>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <functional>
#include <cstdint>

namespace meshgate {

class BridgeHub {
public:
    typedef std::function<int64_t()> Clock;

    // Receives the response body, a JSON array of queued envelopes
    typedef std::function<void(const std::string& body)> PollCallback;

    struct Config {
        int64_t poll_timeout_ms;       // Parked poll resolves with [] after this
        size_t max_queue;              // Oldest message dropped beyond this
        int64_t reap_interval_ms;      // Reaper wake-up period

        Config()
            : poll_timeout_ms(30000)
            , max_queue(1000)
            , reap_interval_ms(500)
        {}
    };

    // A null clock means wall-clock milliseconds
    explicit BridgeHub(const Config& config, Clock clock = Clock());
    ~BridgeHub();

    // Reaper thread lifecycle. stop() resolves every parked poll with [];
    // polls arriving after it are answered at once instead of parking.
    void start();
    void stop();

    // Mailbox lifecycle
    void open_mailbox(const std::string& node_id);
    bool has_mailbox(const std::string& node_id) const;

    // Resolves a parked poll with [] and discards queued messages
    void close_mailbox(const std::string& node_id);

    // Queue one envelope. Wakes the node's parked poll. False if no mailbox.
    bool enqueue(const std::string& node_id, const std::string& text);

    // Deliver queued messages now, or park `cb` until something arrives.
    // A poll already parked for this node is resolved with [] first.
    // False (and `cb` untouched) if the node has no mailbox.
    bool poll(const std::string& node_id, PollCallback cb);

    // Resolve parked polls whose deadline has passed. Returns how many.
    size_t expire(int64_t now_ms);

    size_t mailbox_count() const;
    size_t queued_count(const std::string& node_id) const;
    size_t waiter_count() const;

    Json get_stats() const;

private:
    struct Waiter {
        PollCallback cb;
        int64_t deadline_ms;
    };

    struct Mailbox {
        std::deque<std::string> messages;
        bool has_waiter;
        Waiter waiter;
        uint64_t dropped;

        Mailbox() : has_waiter(false), dropped(0) {}
    };

    static std::string to_array(const std::deque<std::string>& messages);

    void reaper_loop();

    Config config_;
    Clock clock_;

    std::map<std::string, Mailbox> mailboxes_;
    bool stopped_;                 // Guarded by mutex_
    mutable std::mutex mutex_;

    std::atomic<bool> running_;
    std::thread reaper_thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
};

// Connection backed by a bridge mailbox. Sends queue into the mailbox;
// close() discards it and releases any parked poll.
class BridgeConnection : public Connection {
public:
    explicit BridgeConnection(BridgeHub& hub);

    // Attach to the node id the registry assigned; opens the mailbox
    void bind(const std::string& node_id);
    std::string node_id() const;

    virtual bool send(const std::string& text);
    virtual void close();
    virtual const char* transport() const { return "http"; }

private:
    BridgeHub& hub_;
    std::string node_id_;
    bool closed_;
    mutable std::mutex mutex_;
};

} // namespace meshgate

#endif // MESHGATE_GATEWAY_BRIDGE_HPP
