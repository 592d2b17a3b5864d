#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "chat/broadcast_hub.hpp"
#include "chat/events.hpp"
#include "store/message_store.hpp"

namespace klatsch::chat {

struct ValidationLimits {
    std::size_t max_id_length = 128;
    std::size_t max_sender_length = 100;
    std::size_t max_content_length = 4000;
};

// Throws InvalidMessage describing the first violated rule.
void ValidateMessage(const Message& message, const ValidationLimits& limits);

// The server side of one subscriber connection: the replayed history followed
// by live events, without gaps or duplicates at the seam. Unsubscribes from the
// hub when destroyed.
class EventStream {
public:
    enum class State {
        kConnecting,
        kStreaming,
        kClosed
    };

    EventStream(BroadcastHub& hub,
                std::shared_ptr<Subscription> subscription,
                std::uint64_t last_sequence);
    ~EventStream();

    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    // Queues history to be delivered before any live event and enters kStreaming.
    void Replay(std::vector<Event> history);

    // Next event in sequence order. kTimeout leaves the stream usable; kClosed
    // and kOverrun are terminal.
    ReceiveStatus Next(Event& event, std::chrono::milliseconds timeout);

    void Close();

    State GetState() const { return state_; }
    std::uint64_t LastSequence() const { return last_sequence_; }
    std::size_t PendingReplay() const { return replay_.size(); }

private:
    BroadcastHub& hub_;
    std::shared_ptr<Subscription> subscription_;
    std::deque<Event> replay_;
    std::uint64_t last_sequence_ = 0;
    State state_ = State::kConnecting;
};

// Ingestion and subscription on top of a store and a hub. AddMessage is the
// single writer: insert, sequence assignment and publish happen under one lock.
class ChatService {
public:
    ChatService(klatsch::store::MessageStore& store,
                BroadcastHub& hub,
                ValidationLimits limits = {});

    // Validates and commits a message, then publishes it. A retry with a known
    // id returns the originally committed event and publishes nothing.
    // Throws InvalidMessage or StorageUnavailable.
    klatsch::store::InsertResult AddMessage(const Message& message);

    // Registers a listener and replays the events after replay_after. With
    // std::nullopt nothing is replayed and only future events are streamed.
    // Throws StorageUnavailable if the history cannot be read.
    std::unique_ptr<EventStream> OpenStream(std::optional<std::uint64_t> replay_after);

    std::vector<Event> History() const;

    BroadcastHub& Hub() { return hub_; }
    const ValidationLimits& Limits() const { return limits_; }

private:
    klatsch::store::MessageStore& store_;
    BroadcastHub& hub_;
    ValidationLimits limits_;
    std::mutex writer_mutex_;
};

}  // namespace klatsch::chat
