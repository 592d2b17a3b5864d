#pragma once

#include <cstddef>
#include <string>

namespace klatsch::config {

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 3000;
    // Worker threads of the HTTP server. Every open event stream holds one.
    int max_connections = 64;
};

struct StoreConfig {
    // Required. ":memory:" keeps everything in memory.
    std::string database_path;
};

struct StreamConfig {
    std::size_t buffer_size = 64;
    int keepalive_ms = 15000;
};

struct LimitsConfig {
    std::size_t max_sender_length = 100;
    std::size_t max_content_length = 4000;
};

struct LogSettings {
    std::string level = "info";
};

struct Config {
    ServerConfig server;
    StoreConfig store;
    StreamConfig stream;
    LimitsConfig limits;
    LogSettings log;
};

}  // namespace klatsch::config
