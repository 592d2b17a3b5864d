#pragma once

#include <cstdint>
#include <string>

#include "chat/events.hpp"
#include "nlohmann/json.hpp"

namespace klatsch::server {

// JSON body of a "data:" line. Keys are kept in wire order.
nlohmann::ordered_json EventToJson(const klatsch::chat::Event& event);

// "id: <sequence>\ndata: <json>\n\n"
std::string FormatEvent(const klatsch::chat::Event& event);

// "event: error\ndata: {\"message\": ...}\n\n"
std::string FormatError(const std::string& message);

// A comment frame, ignored by clients. Used for keep-alives.
std::string FormatComment(const std::string& text);

// Value of a Last-Event-ID header. Returns 0 when absent or malformed.
std::uint64_t ParseLastEventId(const std::string& header);

}  // namespace klatsch::server
