#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "chat/chat_error.hpp"
#include "store/message_store.hpp"

namespace klatsch::testing {

// A fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path()
            / ("klatsch_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

// A store that is always unavailable: every insert and replay read throws.
class FailingStore : public klatsch::store::MessageStore {
public:
    klatsch::store::InsertResult InsertIfAbsent(const klatsch::chat::Message&) override {
        throw klatsch::chat::StorageUnavailable("disk on fire");
    }
    std::vector<klatsch::chat::Event> ListAll() const override { return {}; }
    std::vector<klatsch::chat::Event> EventsSince(std::uint64_t) const override {
        throw klatsch::chat::StorageUnavailable("disk on fire");
    }
    std::optional<klatsch::chat::Event> Find(const std::string&) const override { return std::nullopt; }
    std::size_t Size() const override { return 0; }
    std::uint64_t LastSequence() const override { return 0; }
};

}  // namespace klatsch::testing
