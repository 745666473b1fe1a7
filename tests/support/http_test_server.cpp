#include "support/http_test_server.hpp"

#include <cstring>
#include <stdexcept>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <fmt/format.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace podshuttle::testing {

namespace {

const char* reasonPhrase(int status) {
    switch (status) {
    case 200:
        return "OK";
    case 404:
        return "Not Found";
    case 500:
        return "Internal Server Error";
    default:
        return "Status";
    }
}

bool sendAll(int fd, const std::string& data) {
    std::size_t sent = 0;
    while (sent < data.size()) {
        const ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            return false;
        }
        sent += static_cast<std::size_t>(n);
    }
    return true;
}

} // namespace

HttpTestServer::HttpTestServer() {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        throw std::runtime_error("socket() failed");
    }

    int reuse = 1;
    ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::listen(listen_fd_, 16) != 0) {
        ::close(listen_fd_);
        throw std::runtime_error("bind()/listen() failed");
    }

    socklen_t len = sizeof(addr);
    ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);

    thread_ = std::thread([this]() { serve(); });
}

HttpTestServer::~HttpTestServer() {
    stopping_ = true;
    if (thread_.joinable()) {
        thread_.join();
    }
    ::close(listen_fd_);
}

void HttpTestServer::route(const std::string& path, Response response) {
    std::lock_guard<std::mutex> lock(mutex_);
    routes_[path] = std::move(response);
}

std::string HttpTestServer::url(const std::string& path) const {
    return fmt::format("http://127.0.0.1:{}{}", port_, path);
}

std::size_t HttpTestServer::hits(const std::string& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = hits_.find(path);
    return it == hits_.end() ? 0 : it->second;
}

void HttpTestServer::serve() {
    while (!stopping_) {
        pollfd pfd{listen_fd_, POLLIN, 0};
        if (::poll(&pfd, 1, 50) <= 0) {
            continue;
        }
        const int client = ::accept(listen_fd_, nullptr, nullptr);
        if (client < 0) {
            continue;
        }
        handle(client);
        ::close(client);
    }
}

void HttpTestServer::handle(int client) {
    std::string request;
    char buffer[4096];
    while (request.find("\r\n\r\n") == std::string::npos) {
        const ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
        if (n <= 0) {
            return;
        }
        request.append(buffer, static_cast<std::size_t>(n));
    }

    // "GET /path?query HTTP/1.1"
    const auto first_space = request.find(' ');
    const auto second_space = request.find(' ', first_space + 1);
    if (first_space == std::string::npos || second_space == std::string::npos) {
        return;
    }
    std::string path = request.substr(first_space + 1, second_space - first_space - 1);
    path = path.substr(0, path.find('?'));

    Response response{404, "not found", true};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++hits_[path];
        auto it = routes_.find(path);
        if (it != routes_.end()) {
            response = it->second;
        }
    }

    std::string head = fmt::format("HTTP/1.1 {} {}\r\nConnection: close\r\nContent-Type: audio/mpeg\r\n",
                                   response.status, reasonPhrase(response.status));
    if (response.send_content_length) {
        const auto length = response.declared_length > 0 ? response.declared_length : response.body.size();
        head += fmt::format("Content-Length: {}\r\n", length);
    }
    head += "\r\n";

    if (sendAll(client, head)) {
        constexpr std::size_t chunk = 16 * 1024;
        for (std::size_t offset = 0; offset < response.body.size(); offset += chunk) {
            if (!sendAll(client, response.body.substr(offset, chunk))) {
                break;
            }
            if (response.chunk_delay.count() > 0) {
                std::this_thread::sleep_for(response.chunk_delay);
            }
        }
    }
    ::shutdown(client, SHUT_WR);
}

} // namespace podshuttle::testing
