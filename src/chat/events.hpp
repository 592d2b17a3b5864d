#pragma once

#include <cstdint>
#include <string>

namespace klatsch::chat {

// A message as submitted by a client. The id is chosen by the client and is
// the idempotency key: resubmitting it never creates a second message.
struct Message {
    std::string id;
    std::string sender;
    std::string content;

    bool operator==(const Message& other) const {
        return id == other.id && sender == other.sender && content == other.content;
    }
    bool operator!=(const Message& other) const { return !(*this == other); }
};

// A committed message. Sequence numbers start at 1 and are gap-free.
struct Event {
    std::uint64_t sequence = 0;
    Message message;
    std::int64_t timestamp_ms = 0;

    bool operator==(const Event& other) const {
        return sequence == other.sequence && message == other.message
            && timestamp_ms == other.timestamp_ms;
    }
    bool operator!=(const Event& other) const { return !(*this == other); }
};

}  // namespace klatsch::chat
