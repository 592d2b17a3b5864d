#pragma once

#include <cstdint>

namespace klatsch::chat {

// Hands out gap-free sequence numbers and non-decreasing commit timestamps.
// A number is only consumed by Commit(), so a reservation whose insert fails
// is simply dropped and the next Reserve() yields the same sequence again.
// Not thread-safe; the owner serializes access.
class Sequencer {
public:
    struct Reservation {
        std::uint64_t sequence = 0;
        std::int64_t timestamp_ms = 0;
    };

    Sequencer() = default;
    Sequencer(std::uint64_t last_sequence, std::int64_t last_timestamp_ms);

    Reservation Reserve(std::int64_t now_ms) const;
    void Commit(const Reservation& reservation);

    // Resets the position, used after the store has been read back at startup.
    void ResumeFrom(std::uint64_t last_sequence, std::int64_t last_timestamp_ms);

    std::uint64_t LastSequence() const { return last_sequence_; }
    std::uint64_t NextSequence() const { return last_sequence_ + 1; }

private:
    std::uint64_t last_sequence_ = 0;
    std::int64_t last_timestamp_ms_ = 0;
};

}  // namespace klatsch::chat
