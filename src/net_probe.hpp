#pragma once
#include <string>
#include <functional>

namespace switchboard {

struct HttpUrl {
    std::string scheme = "http";
    std::string host = "127.0.0.1";
    int port = 80;
    std::string path;   // without trailing slash, may be empty

    std::string base() const { return scheme + "://" + host + ":" + std::to_string(port); }
};

// Splits scheme://host[:port][/path]. Missing scheme means http.
HttpUrl parse_http_url(const std::string& url);

// Non-blocking TCP connect with a deadline. Never throws.
bool port_open(const std::string& host, int port, int timeout_ms);

// Polls port_open every poll_ms until the port accepts connections or
// timeout_ms elapses. `still_alive` is checked between polls so a child that
// exits early fails fast; returns false on timeout or when it reports false.
bool wait_for_port(const std::string& host, int port, int timeout_ms, int poll_ms,
                   const std::function<bool()>& still_alive = nullptr);

} // namespace switchboard
