#pragma once

#include <atomic>
#include <string>
#include <thread>

#include "chat/chat_service.hpp"
#include "httplib.h"
#include "server/http_api.hpp"

namespace klatsch::server {

struct ServerOptions {
    std::string host = "0.0.0.0";
    // 0 binds an ephemeral port; see Port().
    int port = 3000;
    // Event streams served at once.
    int max_connections = 64;
    // Workers no event stream can occupy, so ingestion keeps flowing while
    // every stream place is taken.
    int ingestion_workers = 4;
    ApiOptions api;
};

// The HTTP front end. Owns the httplib server and the thread it listens on.
class ChatServer {
public:
    ChatServer(klatsch::chat::ChatService& service, ServerOptions options);
    ~ChatServer();

    ChatServer(const ChatServer&) = delete;
    ChatServer& operator=(const ChatServer&) = delete;

    // Binds and starts accepting connections on a background thread.
    // Returns false if the address cannot be bound.
    bool Start();

    // Ends every open event stream, stops the listener and joins the workers.
    void Stop();

    int Port() const { return port_; }
    bool IsRunning() const { return running_.load(); }

private:
    klatsch::chat::ChatService& service_;
    ServerOptions options_;
    httplib::Server http_server_;
    std::thread listen_thread_;
    std::atomic<bool> running_{false};
    int port_ = 0;
};

}  // namespace klatsch::server
