#include <doctest/doctest.h>

#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "chat/chat_error.hpp"
#include "store/sqlite_message_store.hpp"
#include "test_support.hpp"

using klatsch::chat::Message;
using klatsch::store::SqliteMessageStore;

namespace {

Message MakeMessage(const std::string& id, const std::string& sender, const std::string& content) {
    Message message;
    message.id = id;
    message.sender = sender;
    message.content = content;
    return message;
}

}  // namespace

TEST_CASE("SqliteMessageStore assigns consecutive sequences in insert order") {
    SqliteMessageStore store(":memory:");
    CHECK(store.Size() == 0);
    CHECK(store.LastSequence() == 0);

    const auto a = store.InsertIfAbsent(MakeMessage("a", "Bob", "hi"));
    const auto b = store.InsertIfAbsent(MakeMessage("b", "Alice", "hello"));
    CHECK(a.was_new);
    CHECK(b.was_new);
    CHECK(a.event.sequence == 1);
    CHECK(b.event.sequence == 2);

    const auto all = store.ListAll();
    REQUIRE(all.size() == 2);
    CHECK(all[0].message.id == "a");
    CHECK(all[1].message.id == "b");
    CHECK(all[0] == a.event);
    CHECK(all[1] == b.event);
}

TEST_CASE("SqliteMessageStore returns the original event for a known id") {
    SqliteMessageStore store(":memory:");
    const auto first = store.InsertIfAbsent(MakeMessage("a", "Bob", "hi"));
    const auto retry = store.InsertIfAbsent(MakeMessage("a", "Bob", "bye"));

    CHECK_FALSE(retry.was_new);
    CHECK(retry.event == first.event);
    CHECK(retry.event.message.content == "hi");
    CHECK(store.Size() == 1);
    CHECK(store.LastSequence() == 1);

    const auto found = store.Find("a");
    REQUIRE(found.has_value());
    CHECK(found->message.content == "hi");
    CHECK_FALSE(store.Find("missing").has_value());
}

TEST_CASE("SqliteMessageStore keeps identical payloads with different ids apart") {
    SqliteMessageStore store(":memory:");
    CHECK(store.InsertIfAbsent(MakeMessage("x", "Bob", "same")).was_new);
    CHECK(store.InsertIfAbsent(MakeMessage("y", "Bob", "same")).was_new);
    CHECK(store.Size() == 2);
}

TEST_CASE("SqliteMessageStore EventsSince slices history by sequence") {
    SqliteMessageStore store(":memory:");
    for (int i = 1; i <= 5; ++i) {
        store.InsertIfAbsent(MakeMessage("m" + std::to_string(i), "Bob", "text"));
    }

    const auto tail = store.EventsSince(3);
    REQUIRE(tail.size() == 2);
    CHECK(tail[0].sequence == 4);
    CHECK(tail[1].sequence == 5);

    CHECK(store.EventsSince(0).size() == 5);
    CHECK(store.EventsSince(5).empty());
    CHECK(store.EventsSince(100).empty());
}

TEST_CASE("SqliteMessageStore keeps commit timestamps non-decreasing") {
    std::vector<std::int64_t> ticks{3000, 1000, 2000, 4000};
    std::size_t next = 0;
    SqliteMessageStore store(":memory:", [&ticks, &next]() { return ticks[next++ % ticks.size()]; });

    std::int64_t previous = 0;
    for (int i = 0; i < 4; ++i) {
        const auto result = store.InsertIfAbsent(MakeMessage("t" + std::to_string(i), "Bob", "tick"));
        CHECK(result.event.timestamp_ms >= previous);
        previous = result.event.timestamp_ms;
    }
    CHECK(previous == 4000);
}

TEST_CASE("SqliteMessageStore survives a restart") {
    klatsch::testing::TempDir dir;
    const auto db_path = dir.Path() / "nested" / "chat.db";

    {
        SqliteMessageStore store(db_path);
        store.InsertIfAbsent(MakeMessage("a", "Bob", "hi"));
        store.InsertIfAbsent(MakeMessage("b", "Alice", "hey"));
    }

    SqliteMessageStore reopened(db_path);
    const auto all = reopened.ListAll();
    REQUIRE(all.size() == 2);
    CHECK(all[0].message.content == "hi");
    CHECK(all[1].message.sender == "Alice");
    CHECK(reopened.LastSequence() == 2);

    CHECK_FALSE(reopened.InsertIfAbsent(MakeMessage("a", "Bob", "again")).was_new);
    const auto next = reopened.InsertIfAbsent(MakeMessage("c", "Carol", "new"));
    CHECK(next.event.sequence == 3);
    CHECK(next.event.timestamp_ms >= all[1].timestamp_ms);
}

TEST_CASE("SqliteMessageStore stores multi-byte text unchanged") {
    SqliteMessageStore store(":memory:");
    const auto message = MakeMessage("u", "J\xC3\xBCrgen", "gr\xC3\xBC\xC3\x9F" "e \xF0\x9F\x91\x8B");
    store.InsertIfAbsent(message);
    CHECK(store.ListAll().at(0).message == message);
}

TEST_CASE("SqliteMessageStore reports an unusable path as StorageUnavailable") {
    klatsch::testing::TempDir dir;
    // A directory cannot be opened as a database file.
    CHECK_THROWS_AS(SqliteMessageStore(dir.Path()), klatsch::chat::StorageUnavailable);
}

TEST_CASE("SqliteMessageStore creates one event per id under concurrent retries") {
    SqliteMessageStore store(":memory:");
    std::vector<std::thread> threads;
    std::vector<int> created(8, 0);
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&store, &created, t]() {
            for (int i = 0; i < 20; ++i) {
                if (store.InsertIfAbsent(MakeMessage("id" + std::to_string(i), "Bob", "x")).was_new) {
                    ++created[t];
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    int total = 0;
    for (const auto count : created) {
        total += count;
    }
    CHECK(total == 20);
    CHECK(store.Size() == 20);
    CHECK(store.LastSequence() == 20);
}

TEST_CASE("SqliteMessageStore keeps embedded NUL bytes across a restart") {
    klatsch::testing::TempDir dir;
    const auto db_path = dir.Path() / "chat.db";
    const std::string content("hi\0secret", 9);

    {
        SqliteMessageStore store(db_path);
        const auto inserted = store.InsertIfAbsent(MakeMessage("a", "Bob", content));
        CHECK(inserted.event.message.content.size() == 9);
        CHECK(store.ListAll().at(0).message.content == content);
    }

    SqliteMessageStore reopened(db_path);
    CHECK(reopened.ListAll().at(0).message.content == content);
    CHECK(reopened.EventsSince(0).at(0).message.content == content);
}

TEST_CASE("SqliteMessageStore tells apart ids that differ after a NUL byte") {
    SqliteMessageStore store(":memory:");
    const std::string first_id("x\0y", 3);
    const std::string second_id("x\0z", 3);

    CHECK(store.InsertIfAbsent(MakeMessage(first_id, "Bob", "one")).was_new);
    const auto second = store.InsertIfAbsent(MakeMessage(second_id, "Bob", "two"));
    CHECK(second.was_new);
    CHECK(second.event.sequence == 2);

    const auto all = store.ListAll();
    REQUIRE(all.size() == 2);
    CHECK(all[0].message.id == first_id);
    CHECK(all[1].message.id == second_id);
    CHECK_FALSE(store.InsertIfAbsent(MakeMessage(second_id, "Bob", "again")).was_new);
}
