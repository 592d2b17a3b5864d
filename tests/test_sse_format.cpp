#include <doctest/doctest.h>

#include <string>

#include "nlohmann/json.hpp"
#include "server/sse_format.hpp"

using klatsch::server::FormatComment;
using klatsch::server::FormatError;
using klatsch::server::FormatEvent;
using klatsch::server::ParseLastEventId;

TEST_CASE("FormatEvent writes the sequence as id and the message as data") {
    klatsch::chat::Event event;
    event.sequence = 12;
    event.message.id = "a";
    event.message.sender = "Bob";
    event.message.content = "hi";
    event.timestamp_ms = 1700000000000;

    CHECK(FormatEvent(event) ==
          "id: 12\n"
          "data: {\"id\":\"a\",\"sender\":\"Bob\",\"content\":\"hi\",\"timestamp_ms\":1700000000000}\n\n");
}

TEST_CASE("FormatEvent keeps multi-line content on one data line") {
    klatsch::chat::Event event;
    event.sequence = 1;
    event.message.id = "a";
    event.message.sender = "Bob";
    event.message.content = "line one\nline two";

    const auto frame = FormatEvent(event);
    const auto data_start = frame.find("data: ") + 6;
    const auto data_end = frame.find('\n', data_start);
    const auto payload = nlohmann::json::parse(frame.substr(data_start, data_end - data_start));
    CHECK(payload["content"] == "line one\nline two");
    CHECK(frame.substr(data_end) == "\n\n");
}

TEST_CASE("FormatError produces a named error event") {
    CHECK(FormatError("listener fell behind") ==
          "event: error\ndata: {\"message\":\"listener fell behind\"}\n\n");
}

TEST_CASE("FormatComment produces a comment frame") {
    CHECK(FormatComment("keep-alive") == ": keep-alive\n\n");
}

TEST_CASE("ParseLastEventId accepts decimal sequences only") {
    CHECK(ParseLastEventId("42") == 42);
    CHECK(ParseLastEventId(" 7 ") == 7);
    CHECK(ParseLastEventId("") == 0);
    CHECK(ParseLastEventId("abc") == 0);
    CHECK(ParseLastEventId("-3") == 0);
    CHECK(ParseLastEventId("12x") == 0);
    CHECK(ParseLastEventId("18446744073709551615") == 18446744073709551615ULL);
    CHECK(ParseLastEventId("18446744073709551616") == 0);
}
