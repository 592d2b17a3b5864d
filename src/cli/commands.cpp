#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "chat/broadcast_hub.hpp"
#include "chat/chat_error.hpp"
#include "chat/chat_service.hpp"
#include "config/config_loader.hpp"
#include "nlohmann/json.hpp"
#include "server/chat_server.hpp"
#include "server/sse_format.hpp"
#include "store/sqlite_message_store.hpp"
#include "utils/logging.hpp"

namespace {

std::atomic<bool> g_running{true};
volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

bool LoadValidatedConfig(klatsch::config::Config& config) {
    klatsch::config::LoadDotEnv(".env");
    try {
        config = klatsch::config::LoadConfig();
        klatsch::config::ValidateConfig(config);
    } catch (const klatsch::config::ConfigError& ex) {
        std::cerr << "ERROR [config] " << ex.what() << std::endl;
        return false;
    }
    klatsch::utils::LogConfig log_config{};
    log_config.min_level = klatsch::utils::ParseLogLevel(config.log.level);
    klatsch::utils::ConfigureLogging(log_config);
    return true;
}

std::unique_ptr<klatsch::store::SqliteMessageStore> OpenStore(const klatsch::config::Config& config) {
    try {
        return std::make_unique<klatsch::store::SqliteMessageStore>(config.store.database_path);
    } catch (const klatsch::chat::StorageUnavailable& ex) {
        klatsch::utils::Log({klatsch::utils::LogLevel::kError, "store", "cannot open message store",
            {{"path", config.store.database_path}, {"error", ex.what()}}});
        return nullptr;
    }
}

int RunServer() {
    klatsch::config::Config config;
    if (!LoadValidatedConfig(config)) {
        return 1;
    }
    klatsch::utils::Log({klatsch::utils::LogLevel::kInfo, "main", "Starting",
        {{"host", config.server.host}, {"port", std::to_string(config.server.port)},
         {"database", config.store.database_path}}});

    auto store = OpenStore(config);
    if (!store) {
        return 1;
    }

    klatsch::chat::BroadcastHub hub(config.stream.buffer_size);
    klatsch::chat::ValidationLimits limits{};
    limits.max_sender_length = config.limits.max_sender_length;
    limits.max_content_length = config.limits.max_content_length;
    klatsch::chat::ChatService service(*store, hub, limits);

    klatsch::server::ServerOptions options{};
    options.host = config.server.host;
    options.port = config.server.port;
    options.max_connections = config.server.max_connections;
    options.api.keepalive = std::chrono::milliseconds(config.stream.keepalive_ms);
    klatsch::server::ChatServer server(service, options);

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    if (!server.Start()) {
        return 1;
    }
    klatsch::utils::Log({klatsch::utils::LogLevel::kInfo, "main", "Ready",
        {{"port", std::to_string(server.Port())},
         {"messages", std::to_string(store->Size())}}});

    while (g_running.load()) {
        if (g_signal != 0) {
            klatsch::utils::Log({klatsch::utils::LogLevel::kInfo, "main", "Shutdown signal received",
                {{"signal", std::to_string(static_cast<int>(g_signal))}}});
            g_running.store(false);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    server.Stop();
    klatsch::utils::LogInfo("main", "Shutdown complete");
    return 0;
}

int PrintHistory() {
    klatsch::config::Config config;
    if (!LoadValidatedConfig(config)) {
        return 1;
    }
    auto store = OpenStore(config);
    if (!store) {
        return 1;
    }
    nlohmann::ordered_json json = nlohmann::ordered_json::array();
    for (const auto& event : store->ListAll()) {
        auto entry = klatsch::server::EventToJson(event);
        entry["sequence"] = event.sequence;
        json.push_back(std::move(entry));
    }
    std::cout << json.dump(2) << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    const std::string command = argc >= 2 ? argv[1] : "serve";
    if (command == "serve") {
        return RunServer();
    }
    if (command == "history") {
        return PrintHistory();
    }
    std::cout << "Usage: klatsch [serve] | klatsch history" << std::endl;
    return 1;
}
