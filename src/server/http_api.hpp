#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "chat/chat_service.hpp"
#include "httplib.h"

namespace klatsch::server {

struct ApiOptions {
    // Idle interval after which an event stream writes a keep-alive comment.
    std::chrono::milliseconds keepalive{15000};
    // Event streams open at once. Further connections get 503 so that they
    // cannot take the workers ingestion needs.
    std::size_t max_streams = 64;
};

// Installs the chat routes:
//   POST /api/v0/add_message
//   GET  /api/v0/events
//   GET  /health
void RegisterRoutes(httplib::Server& server,
                    klatsch::chat::ChatService& service,
                    const ApiOptions& options);

// Parses an add_message body. Throws InvalidMessage when the body is not a JSON
// object with string fields id, sender and content.
klatsch::chat::Message ParseMessageBody(const std::string& body);

}  // namespace klatsch::server
