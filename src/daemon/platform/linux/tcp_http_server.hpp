#pragma once

#include "http/http_message.hpp"
#include "platform/http_server.hpp"

#include <string>
#include <vector>

class TcpHttpServer : public HttpServer {
public:
    TcpHttpServer();
    ~TcpHttpServer() override;

    TcpHttpServer(const TcpHttpServer&) = delete;
    TcpHttpServer& operator=(const TcpHttpServer&) = delete;

    bool start(const std::string& bind_address, uint16_t port) override;
    void stop() override;
    int server_fd() const override { return server_fd_; }
    uint16_t port() const override { return port_; }
    int accept_client() override;
    ReadResult read_request(int client_fd, HttpRequest& request) override;
    SendResult send_response(int client_fd, const HttpResponse& response) override;
    SendResult flush(int client_fd) override;
    void close_client(int client_fd) override;

private:
    int server_fd_ = -1;
    uint16_t port_ = 0;

    struct Client {
        int fd;
        HttpRequestParser parser;
        std::string out;
        size_t out_pos = 0;
    };
    std::vector<Client> clients_;

    Client* find_client(int fd);
};
