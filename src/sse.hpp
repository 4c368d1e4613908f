#pragma once
#include <string>
#include <vector>
#include <functional>

namespace switchboard {

struct SseEvent {
    std::string event = "message";
    std::string data;
    std::string id;
};

// Incremental Server-Sent-Events parser. Bytes may arrive split anywhere;
// complete events are delivered once their terminating blank line is seen.
class SseParser {
public:
    using Handler = std::function<void(const SseEvent&)>;

    explicit SseParser(Handler on_event) : on_event_(std::move(on_event)) {}

    void feed(const char* data, size_t len);
    void feed(const std::string& chunk) { feed(chunk.data(), chunk.size()); }

    // Flushes a trailing event that was not followed by a blank line.
    void finish();

private:
    Handler on_event_;
    std::string buffer_;
    std::string event_;
    std::vector<std::string> data_lines_;
    std::string id_;
    bool has_fields_ = false;

    void process_line(const std::string& line);
    void dispatch();
};

// Serializes one event in wire format, terminated by a blank line.
std::string format_sse(const std::string& event, const std::string& data);

} // namespace switchboard
