#include <catch2/catch_test_macros.hpp>

#include "platform/linux/tcp_http_server.hpp"

#include <arpa/inet.h>
#include <chrono>
#include <netinet/in.h>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

namespace {

// Blocking loopback client.
struct TestClient {
    int fd = -1;

    bool connect(uint16_t port) {
        fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd < 0) return false;
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        return ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    }

    bool send(const std::string& data) const {
        return ::send(fd, data.data(), data.size(), MSG_NOSIGNAL) == static_cast<ssize_t>(data.size());
    }

    // Reads until the server closes the connection.
    std::string read_all(int timeout_ms = 1000) const {
        std::string out;
        pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
        while (::poll(&pfd, 1, timeout_ms) > 0) {
            char buf[4096];
            ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
            if (n <= 0) break;
            out.append(buf, static_cast<size_t>(n));
        }
        return out;
    }

    ~TestClient() {
        if (fd >= 0) ::close(fd);
    }
};

int accept_with_retry(TcpHttpServer& server) {
    for (int i = 0; i < 100; i++) {
        int fd = server.accept_client();
        if (fd >= 0) return fd;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return -1;
}

HttpServer::ReadResult read_with_retry(TcpHttpServer& server, int fd, HttpRequest& req) {
    auto result = HttpServer::ReadResult::Incomplete;
    for (int i = 0; i < 200 && result == HttpServer::ReadResult::Incomplete; i++) {
        result = server.read_request(fd, req);
        if (result == HttpServer::ReadResult::Incomplete) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
    return result;
}

} // namespace

TEST_CASE("TCP HTTP server", "[http]") {
    TcpHttpServer server;
    REQUIRE(server.start("127.0.0.1", 0));
    REQUIRE(server.server_fd() >= 0);
    REQUIRE(server.port() != 0);

    SECTION("RejectsBadBindAddress") {
        TcpHttpServer other;
        REQUIRE_FALSE(other.start("not-an-address", 0));
        REQUIRE(other.server_fd() < 0);
    }

    SECTION("RequestResponseRoundTrip") {
        TestClient client;
        REQUIRE(client.connect(server.port()));
        int fd = accept_with_retry(server);
        REQUIRE(fd >= 0);

        std::string body = R"({"jsonrpc":"2.0","id":1,"method":"ping"})";
        REQUIRE(client.send("POST /mcp HTTP/1.1\r\nHost: x\r\nContent-Length: " +
                            std::to_string(body.size()) + "\r\n\r\n" + body));

        HttpRequest req;
        REQUIRE(read_with_retry(server, fd, req) == HttpServer::ReadResult::Request);
        REQUIRE(req.method == "POST");
        REQUIRE(req.path == "/mcp");
        REQUIRE(req.body == body);

        auto sent = server.send_response(fd, json_response(200, {{"ok", true}}));
        REQUIRE(sent == HttpServer::SendResult::Done);
        server.close_client(fd);

        auto reply = client.read_all();
        REQUIRE(reply.starts_with("HTTP/1.1 200 OK\r\n"));
        REQUIRE(reply.find("Connection: close") != std::string::npos);
        REQUIRE(reply.ends_with(R"({"ok":true})"));
    }

    SECTION("MalformedRequest") {
        TestClient client;
        REQUIRE(client.connect(server.port()));
        int fd = accept_with_retry(server);
        REQUIRE(fd >= 0);

        REQUIRE(client.send("garbage\r\n\r\n"));
        HttpRequest req;
        REQUIRE(read_with_retry(server, fd, req) == HttpServer::ReadResult::Malformed);
        server.close_client(fd);
    }

    SECTION("OversizedBody") {
        TestClient client;
        REQUIRE(client.connect(server.port()));
        int fd = accept_with_retry(server);
        REQUIRE(fd >= 0);

        REQUIRE(client.send("POST /mcp HTTP/1.1\r\nContent-Length: 99999999\r\n\r\n"));
        HttpRequest req;
        REQUIRE(read_with_retry(server, fd, req) == HttpServer::ReadResult::TooLarge);
        server.close_client(fd);
    }

    SECTION("ClientDisconnect") {
        int fd = -1;
        {
            TestClient client;
            REQUIRE(client.connect(server.port()));
            fd = accept_with_retry(server);
            REQUIRE(fd >= 0);
        }
        HttpRequest req;
        REQUIRE(read_with_retry(server, fd, req) == HttpServer::ReadResult::Closed);
        server.close_client(fd);
    }

    SECTION("UnknownClientFd") {
        HttpRequest req;
        REQUIRE(server.read_request(12345, req) == HttpServer::ReadResult::Closed);
        REQUIRE(server.send_response(12345, HttpResponse{}) == HttpServer::SendResult::Failed);
    }

    server.stop();
    REQUIRE(server.server_fd() < 0);
}
