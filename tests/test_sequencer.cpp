#include <doctest/doctest.h>

#include <stdexcept>

#include "chat/sequencer.hpp"

using klatsch::chat::Sequencer;

TEST_CASE("Sequencer starts at one and only advances on commit") {
    Sequencer sequencer;
    CHECK(sequencer.LastSequence() == 0);

    const auto first = sequencer.Reserve(1000);
    CHECK(first.sequence == 1);
    // A reservation that is never committed does not burn the number.
    CHECK(sequencer.Reserve(1001).sequence == 1);

    sequencer.Commit(first);
    CHECK(sequencer.LastSequence() == 1);
    CHECK(sequencer.NextSequence() == 2);
    CHECK(sequencer.Reserve(1002).sequence == 2);
}

TEST_CASE("Sequencer keeps timestamps monotonic when the clock steps back") {
    Sequencer sequencer;
    sequencer.Commit(sequencer.Reserve(5000));

    const auto earlier = sequencer.Reserve(4000);
    CHECK(earlier.timestamp_ms == 5000);
    sequencer.Commit(earlier);

    const auto later = sequencer.Reserve(6000);
    CHECK(later.timestamp_ms == 6000);
}

TEST_CASE("Sequencer rejects a stale reservation") {
    Sequencer sequencer;
    const auto reservation = sequencer.Reserve(1);
    sequencer.Commit(reservation);
    CHECK_THROWS_AS(sequencer.Commit(reservation), std::logic_error);
    CHECK(sequencer.LastSequence() == 1);
}

TEST_CASE("Sequencer resumes after a restart") {
    Sequencer sequencer(41, 9000);
    CHECK(sequencer.NextSequence() == 42);
    CHECK(sequencer.Reserve(100).timestamp_ms == 9000);

    sequencer.ResumeFrom(3, 10);
    CHECK(sequencer.Reserve(20).sequence == 4);
}
