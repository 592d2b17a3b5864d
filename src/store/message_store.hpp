#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "chat/events.hpp"

namespace klatsch::store {

struct InsertResult {
    klatsch::chat::Event event;
    bool was_new = false;
};

// Append-only record of committed messages.
//
// InsertIfAbsent is atomic per message id: of any number of calls carrying
// the same id exactly one reports was_new, and every call returns the event
// that was committed first. Sequence assignment happens inside the same
// atomic unit, so an event is never observable without its sequence number.
// Failures throw klatsch::chat::StorageUnavailable and leave no partial state.
class MessageStore {
public:
    virtual ~MessageStore() = default;

    virtual InsertResult InsertIfAbsent(const klatsch::chat::Message& message) = 0;

    // Every committed event, ordered by sequence.
    virtual std::vector<klatsch::chat::Event> ListAll() const = 0;

    // Events with a sequence greater than last_sequence, ordered by sequence.
    virtual std::vector<klatsch::chat::Event> EventsSince(std::uint64_t last_sequence) const = 0;

    virtual std::optional<klatsch::chat::Event> Find(const std::string& message_id) const = 0;
    virtual std::size_t Size() const = 0;
    virtual std::uint64_t LastSequence() const = 0;
};

}  // namespace klatsch::store
