#include "sse.hpp"

namespace switchboard {

void SseParser::feed(const char* data, size_t len) {
    buffer_.append(data, len);
    size_t start = 0;
    while (true) {
        size_t nl = buffer_.find('\n', start);
        if (nl == std::string::npos) break;
        std::string line = buffer_.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        start = nl + 1;
        process_line(line);
    }
    buffer_.erase(0, start);
}

void SseParser::finish() {
    if (!buffer_.empty()) {
        std::string line;
        line.swap(buffer_);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        process_line(line);
    }
    dispatch();
}

void SseParser::process_line(const std::string& line) {
    if (line.empty()) {
        dispatch();
        return;
    }
    if (line[0] == ':') return; // comment / keep-alive

    std::string field = line;
    std::string value;
    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value[0] == ' ') value.erase(0, 1);
    }

    if (field == "event") {
        event_ = value;
        has_fields_ = true;
    } else if (field == "data") {
        data_lines_.push_back(value);
        has_fields_ = true;
    } else if (field == "id") {
        id_ = value;
        has_fields_ = true;
    }
}

void SseParser::dispatch() {
    if (!has_fields_) return;
    SseEvent ev;
    if (!event_.empty()) ev.event = event_;
    ev.id = id_;
    for (size_t i = 0; i < data_lines_.size(); i++) {
        if (i) ev.data += '\n';
        ev.data += data_lines_[i];
    }
    event_.clear();
    data_lines_.clear();
    id_.clear();
    has_fields_ = false;
    if (!ev.data.empty() || ev.event != "message") on_event_(ev);
}

std::string format_sse(const std::string& event, const std::string& data) {
    std::string out = "event: " + event + "\n";
    size_t start = 0;
    while (true) {
        size_t nl = data.find('\n', start);
        out += "data: " + data.substr(start, nl == std::string::npos ? std::string::npos : nl - start) + "\n";
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return out + "\n";
}

} // namespace switchboard
