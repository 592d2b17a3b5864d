#include "chat/broadcast_hub.hpp"

#include <algorithm>
#include <vector>

#include "utils/logging.hpp"

namespace klatsch::chat {

const char* ToString(ReceiveStatus status) {
    switch (status) {
        case ReceiveStatus::kEvent: return "event";
        case ReceiveStatus::kTimeout: return "timeout";
        case ReceiveStatus::kClosed: return "closed";
        case ReceiveStatus::kOverrun: return "overrun";
    }
    return "unknown";
}

Subscription::Subscription(std::uint64_t id, std::size_t capacity)
    : id_(id)
    , capacity_(std::max<std::size_t>(1, capacity)) {}

ReceiveStatus Subscription::Receive(Event& event, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; })) {
        return ReceiveStatus::kTimeout;
    }
    // Shutdown and unsubscribe end the stream at once; an overrun listener
    // still gets what was buffered before it fell behind.
    if (closed_ && !overrun_) {
        return ReceiveStatus::kClosed;
    }
    if (queue_.empty()) {
        return ReceiveStatus::kOverrun;
    }
    event = std::move(queue_.front());
    queue_.pop_front();
    return ReceiveStatus::kEvent;
}

bool Subscription::IsActive() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !closed_;
}

std::size_t Subscription::Pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool Subscription::Offer(const Event& event) {
    bool accepted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        if (queue_.size() >= capacity_) {
            overrun_ = true;
            closed_ = true;
        } else {
            queue_.push_back(event);
            accepted = true;
        }
    }
    cv_.notify_one();
    return accepted;
}

void Subscription::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

BroadcastHub::BroadcastHub(std::size_t buffer_size)
    : buffer_size_(std::max<std::size_t>(1, buffer_size)) {}

BroadcastHub::~BroadcastHub() {
    Close();
}

std::shared_ptr<Subscription> BroadcastHub::Subscribe() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto subscription = std::make_shared<Subscription>(next_id_++, buffer_size_);
    if (closed_) {
        subscription->Close();
        return subscription;
    }
    listeners_.emplace(subscription->Id(), subscription);
    klatsch::utils::LogDebug("hub", "listener " + std::to_string(subscription->Id())
        + " subscribed, listeners=" + std::to_string(listeners_.size()));
    return subscription;
}

void BroadcastHub::Unsubscribe(std::uint64_t subscription_id) {
    std::shared_ptr<Subscription> subscription;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = listeners_.find(subscription_id);
        if (it == listeners_.end()) {
            return;
        }
        subscription = std::move(it->second);
        listeners_.erase(it);
    }
    subscription->Close();
    klatsch::utils::LogDebug("hub", "listener " + std::to_string(subscription_id) + " unsubscribed");
}

std::size_t BroadcastHub::Publish(const Event& event) {
    std::size_t delivered = 0;
    std::vector<std::uint64_t> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = listeners_.begin(); it != listeners_.end();) {
            if (it->second->Offer(event)) {
                ++delivered;
                ++it;
            } else {
                dropped.push_back(it->first);
                it = listeners_.erase(it);
            }
        }
    }
    for (const auto id : dropped) {
        klatsch::utils::Log({klatsch::utils::LogLevel::kWarn, "hub", "dropped slow listener",
            {{"listener", std::to_string(id)}, {"sequence", std::to_string(event.sequence)}}});
    }
    return delivered;
}

void BroadcastHub::Close() {
    std::unordered_map<std::uint64_t, std::shared_ptr<Subscription>> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        listeners.swap(listeners_);
    }
    for (auto& [_, subscription] : listeners) {
        subscription->Close();
    }
}

std::size_t BroadcastHub::ListenerCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
}

bool BroadcastHub::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

}  // namespace klatsch::chat
