#include "server/sse_format.hpp"

#include <cctype>

#include "utils/common.hpp"

namespace klatsch::server {

nlohmann::ordered_json EventToJson(const klatsch::chat::Event& event) {
    nlohmann::ordered_json json;
    json["id"] = event.message.id;
    json["sender"] = event.message.sender;
    json["content"] = event.message.content;
    json["timestamp_ms"] = event.timestamp_ms;
    return json;
}

std::string FormatEvent(const klatsch::chat::Event& event) {
    // dump() escapes newlines, so the payload always fits on one data line.
    std::string frame = "id: " + std::to_string(event.sequence) + "\n";
    frame += "data: " + EventToJson(event).dump() + "\n\n";
    return frame;
}

std::string FormatError(const std::string& message) {
    nlohmann::ordered_json json;
    json["message"] = message;
    return "event: error\ndata: " + json.dump() + "\n\n";
}

std::string FormatComment(const std::string& text) {
    return ": " + text + "\n\n";
}

std::uint64_t ParseLastEventId(const std::string& header) {
    const auto value = klatsch::utils::Trim(header);
    if (value.empty() || value.size() > 20) {
        return 0;
    }
    std::uint64_t result = 0;
    for (const char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return 0;
        }
        const std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (result > (UINT64_MAX - digit) / 10) {
            return 0;
        }
        result = result * 10 + digit;
    }
    return result;
}

}  // namespace klatsch::server
