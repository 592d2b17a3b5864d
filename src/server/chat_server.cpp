#include "server/chat_server.hpp"

#include <algorithm>
#include <utility>

#include "utils/logging.hpp"

namespace klatsch::server {

ChatServer::ChatServer(klatsch::chat::ChatService& service, ServerOptions options)
    : service_(service)
    , options_(std::move(options)) {
    // Each open event stream keeps a worker busy until it disconnects.
    const auto streams = static_cast<std::size_t>(std::max(1, options_.max_connections));
    options_.api.max_streams = streams;
    const auto workers = streams + static_cast<std::size_t>(std::max(1, options_.ingestion_workers));
    http_server_.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
    http_server_.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        if (!klatsch::utils::IsEnabled(klatsch::utils::LogLevel::kDebug)) {
            return;
        }
        klatsch::utils::Log({klatsch::utils::LogLevel::kDebug, "http", req.method + " " + req.path,
            {{"status", std::to_string(res.status)}, {"remote", req.remote_addr}}});
    });
    RegisterRoutes(http_server_, service_, options_.api);
}

ChatServer::~ChatServer() {
    Stop();
}

bool ChatServer::Start() {
    if (running_.load()) {
        return true;
    }
    if (options_.port == 0) {
        port_ = http_server_.bind_to_any_port(options_.host);
        if (port_ <= 0) {
            klatsch::utils::LogError("server", "failed to bind " + options_.host + " on any port");
            return false;
        }
    } else {
        if (!http_server_.bind_to_port(options_.host, options_.port)) {
            klatsch::utils::LogError("server", "failed to bind " + options_.host + ":"
                + std::to_string(options_.port));
            return false;
        }
        port_ = options_.port;
    }

    running_.store(true);
    listen_thread_ = std::thread([this]() {
        if (!http_server_.listen_after_bind()) {
            klatsch::utils::LogError("server", "listener stopped unexpectedly");
        }
    });
    http_server_.wait_until_ready();
    klatsch::utils::Log({klatsch::utils::LogLevel::kInfo, "server", "listening",
        {{"host", options_.host}, {"port", std::to_string(port_)},
         {"streams", std::to_string(options_.api.max_streams)}}});
    return true;
}

void ChatServer::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    // Streams blocked in Receive() would otherwise hold their workers until the
    // next keep-alive tick.
    service_.Hub().Close();
    http_server_.stop();
    if (listen_thread_.joinable()) {
        listen_thread_.join();
    }
    klatsch::utils::LogInfo("server", "stopped");
}

}  // namespace klatsch::server
