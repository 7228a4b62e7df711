#pragma once

#include "config.hpp"
#include "platform/linux/fixture_device.hpp"
#include "platform/linux/tcp_http_server.hpp"
#include "server_core.hpp"

#include <atomic>
#include <cstdint>
#include <unordered_map>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

    uint16_t port() const { return http_server_.port(); }

private:
    void on_client_readable(int fd);
    void on_client_writable(int fd);
    void deliver_completed();
    void send_and_maybe_close(int fd, const HttpResponse& response);
    void drop_client(int fd);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    FixtureDevice device_;
    TcpHttpServer http_server_;

    // Portable request handling
    ServerCore core_;

    // Requests handed to workers: connection serial <-> client fd
    uint64_t next_serial_ = 1;
    std::unordered_map<uint64_t, int> in_flight_;
    std::unordered_map<int, uint64_t> fd_serial_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;

    std::atomic<bool> running_{false};
};
