#include "server/http_api.hpp"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "chat/chat_error.hpp"
#include "nlohmann/json.hpp"
#include "server/sse_format.hpp"
#include "utils/logging.hpp"

namespace klatsch::server {
namespace {

constexpr const char* kEventStreamType = "text/event-stream";

// Holds one of the limited event stream places until destroyed.
class StreamSlot {
public:
    explicit StreamSlot(std::shared_ptr<std::atomic<std::size_t>> active)
        : active_(std::move(active)) {}
    ~StreamSlot() { Release(); }

    StreamSlot(const StreamSlot&) = delete;
    StreamSlot& operator=(const StreamSlot&) = delete;

    // Null when all places are taken.
    static std::shared_ptr<StreamSlot> TryAcquire(const std::shared_ptr<std::atomic<std::size_t>>& active,
                                                  std::size_t limit) {
        if (active->fetch_add(1) >= limit) {
            active->fetch_sub(1);
            return nullptr;
        }
        return std::make_shared<StreamSlot>(active);
    }

    void Release() {
        if (!released_.exchange(true)) {
            active_->fetch_sub(1);
        }
    }

private:
    std::shared_ptr<std::atomic<std::size_t>> active_;
    std::atomic<bool> released_{false};
};

std::string RequireString(const nlohmann::json& data, const char* key) {
    if (!data.contains(key)) {
        throw klatsch::chat::InvalidMessage(std::string("missing field: ") + key);
    }
    const auto& value = data[key];
    if (!value.is_string()) {
        throw klatsch::chat::InvalidMessage(std::string("field must be a string: ") + key);
    }
    return value.get<std::string>();
}

void HandleAddMessage(klatsch::chat::ChatService& service,
                      const httplib::Request& req,
                      httplib::Response& res) {
    try {
        const auto message = ParseMessageBody(req.body);
        const auto result = service.AddMessage(message);
        if (!result.was_new) {
            klatsch::utils::LogDebug("http", "retry of " + message.id + " acknowledged");
        }
        res.status = 200;
    } catch (const klatsch::chat::InvalidMessage& ex) {
        klatsch::utils::LogDebug("http", std::string("rejected message: ") + ex.what());
        res.status = 400;
        res.set_content(ex.what(), "text/plain");
    } catch (const klatsch::chat::StorageUnavailable& ex) {
        klatsch::utils::LogError("http", std::string("storage unavailable: ") + ex.what());
        res.status = 503;
        res.set_content("storage unavailable", "text/plain");
    }
}

// Everything after Last-Event-ID, or everything when the header is missing.
// "?replay=false" without the header streams live events only.
std::optional<std::uint64_t> ReplayStart(const httplib::Request& req) {
    if (req.has_header("Last-Event-ID")) {
        return ParseLastEventId(req.get_header_value("Last-Event-ID"));
    }
    if (req.has_param("replay") && req.get_param_value("replay") == "false") {
        return std::nullopt;
    }
    return 0;
}

void HandleEvents(klatsch::chat::ChatService& service,
                  const ApiOptions& options,
                  const std::shared_ptr<std::atomic<std::size_t>>& active_streams,
                  const httplib::Request& req,
                  httplib::Response& res) {
    auto slot = StreamSlot::TryAcquire(active_streams, options.max_streams);
    if (!slot) {
        klatsch::utils::Log({klatsch::utils::LogLevel::kWarn, "http", "event stream refused",
            {{"remote", req.remote_addr}, {"limit", std::to_string(options.max_streams)}}});
        res.status = 503;
        res.set_content("too many event streams", "text/plain");
        return;
    }

    std::shared_ptr<klatsch::chat::EventStream> stream;
    try {
        stream = service.OpenStream(ReplayStart(req));
    } catch (const klatsch::chat::StorageUnavailable& ex) {
        klatsch::utils::LogError("http", std::string("replay failed: ") + ex.what());
        res.set_header("Cache-Control", "no-cache");
        res.set_content(FormatError("history unavailable"), kEventStreamType);
        return;
    }

    klatsch::utils::Log({klatsch::utils::LogLevel::kDebug, "http", "event stream opened",
        {{"remote", req.remote_addr}, {"after", std::to_string(stream->LastSequence())}}});

    res.set_header("Cache-Control", "no-cache");
    res.set_header("X-Accel-Buffering", "no");
    const auto keepalive = options.keepalive;
    res.set_chunked_content_provider(
        kEventStreamType,
        [stream, slot, keepalive](std::size_t, httplib::DataSink& sink) {
            klatsch::chat::Event event;
            const auto status = stream->Next(event, keepalive);
            switch (status) {
                case klatsch::chat::ReceiveStatus::kEvent: {
                    const auto frame = FormatEvent(event);
                    return sink.write(frame.data(), frame.size());
                }
                case klatsch::chat::ReceiveStatus::kTimeout: {
                    const auto frame = FormatComment("keep-alive");
                    return sink.write(frame.data(), frame.size());
                }
                case klatsch::chat::ReceiveStatus::kOverrun: {
                    const auto frame = FormatError("listener fell behind; reconnect with Last-Event-ID");
                    if (!sink.write(frame.data(), frame.size())) {
                        return false;
                    }
                    sink.done();
                    return true;
                }
                case klatsch::chat::ReceiveStatus::kClosed:
                    sink.done();
                    return true;
            }
            return false;
        },
        [stream, slot](bool success) {
            slot->Release();
            stream->Close();
            klatsch::utils::Log({klatsch::utils::LogLevel::kDebug, "http", "event stream closed",
                {{"last", std::to_string(stream->LastSequence())},
                 {"clean", success ? "true" : "false"}}});
        });
}

}  // namespace

klatsch::chat::Message ParseMessageBody(const std::string& body) {
    const auto data = nlohmann::json::parse(body, nullptr, false);
    if (data.is_discarded()) {
        throw klatsch::chat::InvalidMessage("body is not valid JSON");
    }
    if (!data.is_object()) {
        throw klatsch::chat::InvalidMessage("body must be a JSON object");
    }
    klatsch::chat::Message message;
    message.id = RequireString(data, "id");
    message.sender = RequireString(data, "sender");
    message.content = RequireString(data, "content");
    return message;
}

void RegisterRoutes(httplib::Server& server,
                    klatsch::chat::ChatService& service,
                    const ApiOptions& options) {
    server.Post("/api/v0/add_message", [&service](const httplib::Request& req, httplib::Response& res) {
        HandleAddMessage(service, req, res);
    });
    auto active_streams = std::make_shared<std::atomic<std::size_t>>(0);
    server.Get("/api/v0/events",
               [&service, options, active_streams](const httplib::Request& req, httplib::Response& res) {
        HandleEvents(service, options, active_streams, req, res);
    });
    server.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("OK", "text/plain");
    });
}

}  // namespace klatsch::server
