#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "chat/events.hpp"

namespace klatsch::chat {

enum class ReceiveStatus {
    kEvent,
    kTimeout,
    // The hub was closed or the listener unsubscribed.
    kClosed,
    // The listener fell behind and was dropped by the hub.
    kOverrun
};

const char* ToString(ReceiveStatus status);

// One live listener. Owns a bounded buffer that the hub fills without ever
// blocking; the connection task drains it with Receive().
class Subscription {
public:
    Subscription(std::uint64_t id, std::size_t capacity);

    // Blocks until an event is buffered, the subscription ends, or the timeout
    // expires. Events buffered before an overrun are still handed out first.
    ReceiveStatus Receive(Event& event, std::chrono::milliseconds timeout);

    std::uint64_t Id() const { return id_; }
    std::size_t Capacity() const { return capacity_; }
    bool IsActive() const;
    std::size_t Pending() const;

private:
    friend class BroadcastHub;

    // False if the buffer is full; the subscription is then marked overrun.
    bool Offer(const Event& event);
    void Close();

    const std::uint64_t id_;
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> queue_;
    bool closed_ = false;
    bool overrun_ = false;
};

// Process-wide fan-out of committed events to live listeners.
class BroadcastHub {
public:
    explicit BroadcastHub(std::size_t buffer_size = 64);
    ~BroadcastHub();

    BroadcastHub(const BroadcastHub&) = delete;
    BroadcastHub& operator=(const BroadcastHub&) = delete;

    // After Close() the returned subscription is already closed.
    std::shared_ptr<Subscription> Subscribe();
    void Unsubscribe(std::uint64_t subscription_id);

    // Non-blocking. Listeners with a full buffer are dropped. Returns the
    // number of listeners the event was delivered to.
    std::size_t Publish(const Event& event);

    // Terminates every listener and refuses new ones.
    void Close();

    std::size_t ListenerCount() const;
    std::size_t BufferSize() const { return buffer_size_; }
    bool IsClosed() const;

private:
    const std::size_t buffer_size_;
    mutable std::mutex mutex_;
    std::unordered_map<std::uint64_t, std::shared_ptr<Subscription>> listeners_;
    std::uint64_t next_id_ = 1;
    bool closed_ = false;
};

}  // namespace klatsch::chat
