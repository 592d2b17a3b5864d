#include "chat/chat_service.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "chat/chat_error.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace klatsch::chat {

void ValidateMessage(const Message& message, const ValidationLimits& limits) {
    if (message.id.empty()) {
        throw InvalidMessage("message id must not be empty");
    }
    if (message.id.size() > limits.max_id_length) {
        throw InvalidMessage("message id exceeds " + std::to_string(limits.max_id_length) + " bytes");
    }
    const auto sender_length = klatsch::utils::Utf8Length(message.sender);
    if (sender_length == 0) {
        throw InvalidMessage("sender must not be empty");
    }
    if (sender_length > limits.max_sender_length) {
        throw InvalidMessage("sender exceeds " + std::to_string(limits.max_sender_length) + " characters");
    }
    if (klatsch::utils::IsBlank(message.content)) {
        throw InvalidMessage("content must not be blank");
    }
    if (klatsch::utils::Utf8Length(message.content) > limits.max_content_length) {
        throw InvalidMessage("content exceeds " + std::to_string(limits.max_content_length) + " characters");
    }
}

EventStream::EventStream(BroadcastHub& hub,
                         std::shared_ptr<Subscription> subscription,
                         std::uint64_t last_sequence)
    : hub_(hub)
    , subscription_(std::move(subscription))
    , last_sequence_(last_sequence) {}

EventStream::~EventStream() {
    Close();
}

void EventStream::Replay(std::vector<Event> history) {
    for (auto& event : history) {
        if (event.sequence > last_sequence_) {
            replay_.push_back(std::move(event));
        }
    }
    if (state_ == State::kConnecting) {
        state_ = State::kStreaming;
    }
}

ReceiveStatus EventStream::Next(Event& event, std::chrono::milliseconds timeout) {
    if (state_ == State::kClosed) {
        return ReceiveStatus::kClosed;
    }
    if (!replay_.empty()) {
        event = std::move(replay_.front());
        replay_.pop_front();
        last_sequence_ = event.sequence;
        return ReceiveStatus::kEvent;
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() < 0) {
            return ReceiveStatus::kTimeout;
        }
        const auto status = subscription_->Receive(event, remaining);
        if (status == ReceiveStatus::kEvent) {
            // Already part of the replay.
            if (event.sequence <= last_sequence_) {
                continue;
            }
            last_sequence_ = event.sequence;
            return status;
        }
        if (status == ReceiveStatus::kClosed || status == ReceiveStatus::kOverrun) {
            Close();
        }
        return status;
    }
}

void EventStream::Close() {
    if (state_ == State::kClosed) {
        return;
    }
    state_ = State::kClosed;
    replay_.clear();
    hub_.Unsubscribe(subscription_->Id());
}

ChatService::ChatService(klatsch::store::MessageStore& store,
                         BroadcastHub& hub,
                         ValidationLimits limits)
    : store_(store)
    , hub_(hub)
    , limits_(limits) {}

klatsch::store::InsertResult ChatService::AddMessage(const Message& message) {
    ValidateMessage(message, limits_);

    std::lock_guard<std::mutex> lock(writer_mutex_);
    auto result = store_.InsertIfAbsent(message);
    if (!result.was_new) {
        klatsch::utils::LogDebug("chat", "duplicate message id " + message.id + " ignored");
        return result;
    }
    const auto listeners = hub_.Publish(result.event);
    klatsch::utils::Log({klatsch::utils::LogLevel::kDebug, "chat", "message committed",
        {{"sequence", std::to_string(result.event.sequence)},
         {"listeners", std::to_string(listeners)}}});
    return result;
}

std::unique_ptr<EventStream> ChatService::OpenStream(std::optional<std::uint64_t> replay_after) {
    // Subscribing and reading the replay under the writer lock means no event
    // can be committed in between.
    std::lock_guard<std::mutex> lock(writer_mutex_);
    const auto last_committed = store_.LastSequence();
    // A client may remember ids from a database that has since been replaced.
    const auto start = replay_after.has_value() ? std::min(*replay_after, last_committed) : last_committed;
    auto stream = std::make_unique<EventStream>(hub_, hub_.Subscribe(), start);
    if (replay_after.has_value()) {
        stream->Replay(store_.EventsSince(start));
    } else {
        stream->Replay({});
    }
    return stream;
}

std::vector<Event> ChatService::History() const {
    return store_.ListAll();
}

}  // namespace klatsch::chat
