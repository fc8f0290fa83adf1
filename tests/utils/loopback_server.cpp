#include "loopback_server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace test_utils {

namespace {

int openListener(std::uint16_t& port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "socket");
    }

    int enable = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(fd, 1) != 0) {
        int err = errno;
        ::close(fd);
        throw std::system_error(err, std::generic_category(), "bind/listen");
    }

    socklen_t len = sizeof(addr);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    port = ntohs(addr.sin_port);
    return fd;
}

bool waitReadable(int fd, int timeout_ms) {
    pollfd pfd{fd, POLLIN, 0};
    return ::poll(&pfd, 1, timeout_ms) > 0;
}

}  // namespace

LoopbackServer::LoopbackServer(std::string raw_response, bool hold_open)
    : response_(std::move(raw_response)), hold_open_(hold_open) {
    listen_fd_ = openListener(port_);
    thread_ = std::thread([this]() { serve(); });
}

LoopbackServer::~LoopbackServer() {
    release();
    if (thread_.joinable()) {
        thread_.join();
    }
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
    }
}

std::string LoopbackServer::url(const std::string& path) const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
}

std::string LoopbackServer::request() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return request_;
}

void LoopbackServer::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
    }
    cv_.notify_all();
}

std::uint16_t LoopbackServer::closedPort() {
    std::uint16_t port = 0;
    int fd = openListener(port);
    ::close(fd);
    return port;
}

void LoopbackServer::serve() {
    // Poll in short slices so release() can end a server nobody connected to
    int client = -1;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (client < 0 && std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (released_) {
                return;
            }
        }
        if (waitReadable(listen_fd_, 50)) {
            client = ::accept(listen_fd_, nullptr, nullptr);
        }
    }
    if (client < 0) {
        return;
    }

    std::string head;
    char buffer[1024];
    while (head.find("\r\n\r\n") == std::string::npos && waitReadable(client, 5000)) {
        ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
        if (n <= 0) {
            break;
        }
        head.append(buffer, static_cast<size_t>(n));
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        request_ = head;
    }

    size_t sent = 0;
    while (sent < response_.size()) {
        ssize_t n = ::send(client, response_.data() + sent, response_.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            break;
        }
        sent += static_cast<size_t>(n);
    }

    if (hold_open_) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::seconds(10), [this]() { return released_; });
    }
    ::close(client);
}

}  // namespace test_utils
