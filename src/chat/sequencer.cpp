#include "chat/sequencer.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace klatsch::chat {

Sequencer::Sequencer(std::uint64_t last_sequence, std::int64_t last_timestamp_ms)
    : last_sequence_(last_sequence)
    , last_timestamp_ms_(last_timestamp_ms) {}

Sequencer::Reservation Sequencer::Reserve(std::int64_t now_ms) const {
    Reservation reservation{};
    reservation.sequence = last_sequence_ + 1;
    // The wall clock may step backwards; commit times must not.
    reservation.timestamp_ms = std::max(now_ms, last_timestamp_ms_);
    return reservation;
}

void Sequencer::Commit(const Reservation& reservation) {
    if (reservation.sequence != last_sequence_ + 1) {
        throw std::logic_error("sequence reservation is stale: expected "
            + std::to_string(last_sequence_ + 1) + ", got "
            + std::to_string(reservation.sequence));
    }
    last_sequence_ = reservation.sequence;
    last_timestamp_ms_ = std::max(last_timestamp_ms_, reservation.timestamp_ms);
}

void Sequencer::ResumeFrom(std::uint64_t last_sequence, std::int64_t last_timestamp_ms) {
    last_sequence_ = last_sequence;
    last_timestamp_ms_ = last_timestamp_ms;
}

}  // namespace klatsch::chat
