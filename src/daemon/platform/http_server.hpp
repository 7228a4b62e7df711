#pragma once

#include "http/http_message.hpp"

#include <cstdint>
#include <string>

class HttpServer {
public:
    enum class ReadResult { Incomplete, Request, Closed, Malformed, TooLarge };
    enum class SendResult { Done, Pending, Failed };

    virtual ~HttpServer() = default;
    virtual bool start(const std::string& bind_address, uint16_t port) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;
    // Actual bound port (differs from the requested one when that was 0).
    virtual uint16_t port() const = 0;
    virtual int accept_client() = 0;
    virtual ReadResult read_request(int client_fd, HttpRequest& request) = 0;
    // Queues the response; Pending means the rest goes out on flush().
    virtual SendResult send_response(int client_fd, const HttpResponse& response) = 0;
    virtual SendResult flush(int client_fd) = 0;
    virtual void close_client(int client_fd) = 0;
};
