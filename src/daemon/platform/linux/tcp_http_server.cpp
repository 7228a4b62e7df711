#include "platform/linux/tcp_http_server.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <print>
#include <sys/socket.h>
#include <unistd.h>

TcpHttpServer::TcpHttpServer() = default;

TcpHttpServer::~TcpHttpServer() {
    stop();
}

bool TcpHttpServer::start(const std::string& bind_address, uint16_t port) {
    server_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        std::println(stderr, "http: socket() failed: {}", std::strerror(errno));
        return false;
    }

    int one = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (::inet_pton(AF_INET, bind_address.c_str(), &addr.sin_addr) != 1) {
        std::println(stderr, "http: invalid bind address {}", bind_address);
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "http: bind() failed: {}", std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (::listen(server_fd_, 64) < 0) {
        std::println(stderr, "http: listen() failed: {}", std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    socklen_t len = sizeof(addr);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
        port_ = ntohs(addr.sin_port);
    } else {
        port_ = port;
    }
    return true;
}

void TcpHttpServer::stop() {
    for (auto& c : clients_) {
        ::close(c.fd);
    }
    clients_.clear();

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }
}

int TcpHttpServer::accept_client() {
    int fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) return -1;
    clients_.push_back(Client{.fd = fd, .parser = {}, .out = {}, .out_pos = 0});
    return fd;
}

HttpServer::ReadResult TcpHttpServer::read_request(int client_fd, HttpRequest& request) {
    auto* client = find_client(client_fd);
    if (!client) return ReadResult::Closed;

    char buf[8192];
    ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
    if (n == 0) return ReadResult::Closed;
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return ReadResult::Incomplete;
        return ReadResult::Closed;
    }

    switch (client->parser.feed(std::string_view(buf, static_cast<size_t>(n)))) {
        case HttpRequestParser::Status::Incomplete:
            return ReadResult::Incomplete;
        case HttpRequestParser::Status::Malformed:
            return ReadResult::Malformed;
        case HttpRequestParser::Status::TooLarge:
            return ReadResult::TooLarge;
        case HttpRequestParser::Status::Complete:
            request = std::move(client->parser.request());
            return ReadResult::Request;
    }
    return ReadResult::Malformed;
}

HttpServer::SendResult TcpHttpServer::send_response(int client_fd, const HttpResponse& response) {
    auto* client = find_client(client_fd);
    if (!client) return SendResult::Failed;
    client->out = response.serialize();
    client->out_pos = 0;
    return flush(client_fd);
}

HttpServer::SendResult TcpHttpServer::flush(int client_fd) {
    auto* client = find_client(client_fd);
    if (!client) return SendResult::Failed;

    while (client->out_pos < client->out.size()) {
        ssize_t sent = ::send(client_fd, client->out.data() + client->out_pos,
                              client->out.size() - client->out_pos, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return SendResult::Pending;
            return SendResult::Failed;
        }
        client->out_pos += static_cast<size_t>(sent);
    }
    return SendResult::Done;
}

void TcpHttpServer::close_client(int client_fd) {
    ::close(client_fd);
    std::erase_if(clients_, [client_fd](const Client& c) { return c.fd == client_fd; });
}

TcpHttpServer::Client* TcpHttpServer::find_client(int fd) {
    auto it = std::ranges::find_if(clients_, [fd](const Client& c) { return c.fd == fd; });
    return it != clients_.end() ? &*it : nullptr;
}
