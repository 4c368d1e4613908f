#include "net_probe.hpp"
#include <chrono>
#include <thread>
#include <cstring>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <errno.h>
#include <sys/socket.h>

namespace switchboard {

HttpUrl parse_http_url(const std::string& url) {
    HttpUrl u;
    size_t pos = 0;
    if (url.compare(0, 8, "https://") == 0) {
        u.scheme = "https"; pos = 8; u.port = 443;
    } else if (url.compare(0, 7, "http://") == 0) {
        pos = 7;
    }

    size_t slash = url.find('/', pos);
    std::string host_port = (slash != std::string::npos) ? url.substr(pos, slash - pos) : url.substr(pos);
    if (slash != std::string::npos) {
        u.path = url.substr(slash);
        while (!u.path.empty() && u.path.back() == '/') u.path.pop_back();
    }

    size_t colon = host_port.rfind(':');
    if (colon != std::string::npos && host_port.find(']', colon) == std::string::npos) {
        u.host = host_port.substr(0, colon);
        try {
            u.port = std::stoi(host_port.substr(colon + 1));
        } catch (const std::exception&) {
            u.port = 0;
        }
    } else if (!host_port.empty()) {
        u.host = host_port;
    }
    return u;
}

bool port_open(const std::string& host, int port, int timeout_ms) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    if (getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res) != 0 || !res) {
        return false;
    }

    bool open = false;
    for (addrinfo* ai = res; ai && !open; ai = ai->ai_next) {
        int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) continue;
        fcntl(fd, F_SETFL, fcntl(fd, F_GETFL, 0) | O_NONBLOCK);

        int rc = connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc == 0) {
            open = true;
        } else if (errno == EINPROGRESS) {
            pollfd pfd{fd, POLLOUT, 0};
            if (poll(&pfd, 1, timeout_ms) == 1) {
                int err = 0;
                socklen_t len = sizeof(err);
                getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len);
                open = (err == 0);
            }
        }
        close(fd);
    }
    freeaddrinfo(res);
    return open;
}

bool wait_for_port(const std::string& host, int port, int timeout_ms, int poll_ms,
                   const std::function<bool()>& still_alive) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (still_alive && !still_alive()) return false;
        if (port_open(host, port, poll_ms)) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(poll_ms));
    }
    return false;
}

} // namespace switchboard
