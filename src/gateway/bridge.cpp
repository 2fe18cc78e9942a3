/*
 * meshgate - HTTP long-poll bridge implementation
 */

#include <meshgate/gateway/bridge.hpp>
#include <meshgate/core/logger.hpp>
#include <meshgate/core/utils.hpp>
#include <algorithm>
#include <chrono>

namespace meshgate {

static const char* const EMPTY_ARRAY = "[]";

BridgeHub::BridgeHub(const Config& config, Clock clock)
    : config_(config)
    , clock_(clock)
    , stopped_(false)
    , running_(false) {
    if (!clock_) {
        clock_ = current_timestamp_ms;
    }
}

BridgeHub::~BridgeHub() {
    stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

void BridgeHub::start() {
    if (running_.load()) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = false;
    }
    running_.store(true);
    reaper_thread_ = std::thread(&BridgeHub::reaper_loop, this);
    LOG_DEBUG("[BridgeHub] reaper started (poll timeout=%lldms, max queue=%zu)",
              static_cast<long long>(config_.poll_timeout_ms), config_.max_queue);
}

void BridgeHub::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        if (running_.exchange(false)) {
            wake_cv_.notify_all();
        }
    }
    if (reaper_thread_.joinable()) {
        reaper_thread_.join();
    }

    std::vector<PollCallback> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
        for (std::map<std::string, Mailbox>::iterator it = mailboxes_.begin();
             it != mailboxes_.end(); ++it) {
            if (it->second.has_waiter) {
                pending.push_back(it->second.waiter.cb);
                it->second.has_waiter = false;
                it->second.waiter.cb = PollCallback();
            }
        }
    }

    if (!pending.empty()) {
        LOG_DEBUG("[BridgeHub] releasing %zu pending poll(s)", pending.size());
    }
    for (size_t i = 0; i < pending.size(); ++i) {
        pending[i](EMPTY_ARRAY);
    }
}

void BridgeHub::reaper_loop() {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    while (running_.load()) {
        wake_cv_.wait_for(lock, std::chrono::milliseconds(config_.reap_interval_ms),
                          [this]() { return !running_.load(); });
        if (!running_.load()) break;

        lock.unlock();
        expire(clock_());
        lock.lock();
    }
}

// ============================================================================
// Mailboxes
// ============================================================================

std::string BridgeHub::to_array(const std::deque<std::string>& messages) {
    std::string body = "[";
    for (size_t i = 0; i < messages.size(); ++i) {
        if (i > 0) body += ",";
        body += messages[i];
    }
    body += "]";
    return body;
}

void BridgeHub::open_mailbox(const std::string& node_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    mailboxes_[node_id];
}

bool BridgeHub::has_mailbox(const std::string& node_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mailboxes_.find(node_id) != mailboxes_.end();
}

void BridgeHub::close_mailbox(const std::string& node_id) {
    PollCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, Mailbox>::iterator it = mailboxes_.find(node_id);
        if (it == mailboxes_.end()) return;

        if (it->second.has_waiter) {
            cb = it->second.waiter.cb;
        }
        if (!it->second.messages.empty()) {
            LOG_DEBUG("[BridgeHub] discarding %zu undelivered message(s) for %s",
                      it->second.messages.size(), node_id.c_str());
        }
        mailboxes_.erase(it);
    }

    if (cb) cb(EMPTY_ARRAY);
}

bool BridgeHub::enqueue(const std::string& node_id, const std::string& text) {
    PollCallback cb;
    std::string body;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, Mailbox>::iterator it = mailboxes_.find(node_id);
        if (it == mailboxes_.end()) return false;

        Mailbox& box = it->second;
        box.messages.push_back(text);
        while (box.messages.size() > config_.max_queue) {
            box.messages.pop_front();
            ++box.dropped;
            LOG_WARN("[BridgeHub] mailbox for %s full (%zu), dropped oldest message",
                     node_id.c_str(), config_.max_queue);
        }

        if (box.has_waiter) {
            cb = box.waiter.cb;
            box.has_waiter = false;
            box.waiter.cb = PollCallback();
            body = to_array(box.messages);
            box.messages.clear();
        }
    }

    if (cb) cb(body);
    return true;
}

bool BridgeHub::poll(const std::string& node_id, PollCallback cb) {
    PollCallback replaced;
    std::string body;
    bool immediate = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<std::string, Mailbox>::iterator it = mailboxes_.find(node_id);
        if (it == mailboxes_.end()) return false;

        Mailbox& box = it->second;
        if (box.has_waiter) {
            replaced = box.waiter.cb;
            box.has_waiter = false;
            box.waiter.cb = PollCallback();
        }

        if (!box.messages.empty()) {
            body = to_array(box.messages);
            box.messages.clear();
            immediate = true;
        } else if (stopped_) {
            body = EMPTY_ARRAY;
            immediate = true;
        } else {
            box.has_waiter = true;
            box.waiter.cb = cb;
            box.waiter.deadline_ms = clock_() + config_.poll_timeout_ms;
        }
    }

    if (replaced) {
        LOG_DEBUG("[BridgeHub] overlapping poll for %s, releasing the earlier one", node_id.c_str());
        replaced(EMPTY_ARRAY);
    }
    if (immediate) {
        cb(body);
    }
    return true;
}

size_t BridgeHub::expire(int64_t now_ms) {
    std::vector<PollCallback> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (std::map<std::string, Mailbox>::iterator it = mailboxes_.begin();
             it != mailboxes_.end(); ++it) {
            Mailbox& box = it->second;
            if (box.has_waiter && now_ms >= box.waiter.deadline_ms) {
                expired.push_back(box.waiter.cb);
                box.has_waiter = false;
                box.waiter.cb = PollCallback();
            }
        }
    }

    for (size_t i = 0; i < expired.size(); ++i) {
        expired[i](EMPTY_ARRAY);
    }
    return expired.size();
}

size_t BridgeHub::mailbox_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mailboxes_.size();
}

size_t BridgeHub::queued_count(const std::string& node_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, Mailbox>::const_iterator it = mailboxes_.find(node_id);
    return it == mailboxes_.end() ? 0 : it->second.messages.size();
}

size_t BridgeHub::waiter_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (std::map<std::string, Mailbox>::const_iterator it = mailboxes_.begin();
         it != mailboxes_.end(); ++it) {
        if (it->second.has_waiter) ++n;
    }
    return n;
}

Json BridgeHub::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t queued = 0;
    size_t waiting = 0;
    uint64_t dropped = 0;
    for (std::map<std::string, Mailbox>::const_iterator it = mailboxes_.begin();
         it != mailboxes_.end(); ++it) {
        queued += it->second.messages.size();
        if (it->second.has_waiter) ++waiting;
        dropped += it->second.dropped;
    }

    Json stats = Json::object();
    stats["mailboxes"] = mailboxes_.size();
    stats["queuedMessages"] = queued;
    stats["pendingPolls"] = waiting;
    stats["droppedMessages"] = dropped;
    return stats;
}

// ============================================================================
// BridgeConnection
// ============================================================================

BridgeConnection::BridgeConnection(BridgeHub& hub)
    : hub_(hub)
    , closed_(false) {
}

void BridgeConnection::bind(const std::string& node_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        node_id_ = node_id;
    }
    hub_.open_mailbox(node_id);
}

std::string BridgeConnection::node_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return node_id_;
}

bool BridgeConnection::send(const std::string& text) {
    std::string id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || node_id_.empty()) return false;
        id = node_id_;
    }
    return hub_.enqueue(id, text);
}

void BridgeConnection::close() {
    std::string id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
        id = node_id_;
    }
    if (!id.empty()) {
        hub_.close_mailbox(id);
    }
}

} // namespace meshgate
