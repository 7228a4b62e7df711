#include "platform/linux/linux_event_loop.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      device_(config_.device.snapshot_path, config_.device.screenshot_path),
      core_(config_, verbose_, device_, device_, device_,
            // NotifyCallback, runs on worker threads
            [this]() {
                uint64_t val = 1;
                if (::write(worker_event_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
                    std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
                }
            }) {}

LinuxEventLoop::~LinuxEventLoop() {
    core_.shutdown();
    http_server_.stop();
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
}

bool LinuxEventLoop::init() {
    // Worker notification eventfd, needed before any worker can finish
    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    if (!core_.init()) return false;

    if (!http_server_.start(config_.server.bind_address, config_.server.port)) return false;
    log(std::format("HTTP listening on {}:{}", config_.server.bind_address, http_server_.port()));

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(http_server_.server_fd(), EPOLLIN) ||
        !add_fd(worker_event_fd_, EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 32;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;
            uint32_t ev = events[i].events;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log("Received signal, shutting down");
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == http_server_.server_fd()) {
                // Drain the accept backlog
                for (;;) {
                    int client_fd = http_server_.accept_client();
                    if (client_fd < 0) break;
                    epoll_event cev{.events = EPOLLIN | EPOLLRDHUP, .data = {.fd = client_fd}};
                    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &cev) != 0) {
                        http_server_.close_client(client_fd);
                    }
                }
                continue;
            }

            if (fd == worker_event_fd_) {
                uint64_t val;
                if (::read(worker_event_fd_, &val, sizeof(val)) > 0) {
                    deliver_completed();
                }
                continue;
            }

            if (ev & (EPOLLERR | EPOLLHUP)) {
                drop_client(fd);
                continue;
            }
            if (ev & EPOLLOUT) {
                on_client_writable(fd);
                continue;
            }
            if (ev & (EPOLLIN | EPOLLRDHUP)) {
                on_client_readable(fd);
            }
        }
    }

    // Let in-flight requests finish; their responses are discarded.
    core_.shutdown();
    for (auto& [client_fd, serial] : fd_serial_) {
        http_server_.close_client(client_fd);
    }
    fd_serial_.clear();
    in_flight_.clear();
}

void LinuxEventLoop::on_client_readable(int fd) {
    if (fd_serial_.contains(fd)) return;

    HttpRequest request;
    switch (http_server_.read_request(fd, request)) {
        case HttpServer::ReadResult::Incomplete:
            return;
        case HttpServer::ReadResult::Closed:
            drop_client(fd);
            return;
        case HttpServer::ReadResult::Malformed:
            send_and_maybe_close(fd, json_response(400, {{"error", "bad_request"}}));
            return;
        case HttpServer::ReadResult::TooLarge:
            send_and_maybe_close(fd, json_response(413, {{"error", "payload_too_large"}}));
            return;
        case HttpServer::ReadResult::Request:
            break;
    }

    log(std::format("{} {}", request.method, request.target));

    uint64_t serial = next_serial_++;
    in_flight_[serial] = fd;
    fd_serial_[fd] = serial;

    // Stop reading until the response is out; EPOLLHUP/EPOLLERR still arrive.
    epoll_event ev{.events = 0, .data = {.fd = fd}};
    epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev);

    core_.submit(serial, std::move(request));
}

void LinuxEventLoop::on_client_writable(int fd) {
    switch (http_server_.flush(fd)) {
        case HttpServer::SendResult::Pending:
            return;
        case HttpServer::SendResult::Done:
        case HttpServer::SendResult::Failed:
            drop_client(fd);
            return;
    }
}

void LinuxEventLoop::deliver_completed() {
    for (auto& done : core_.take_completed()) {
        auto it = in_flight_.find(done.connection);
        if (it == in_flight_.end()) {
            log(std::format("Dropping response for closed connection {}", done.connection));
            continue;
        }
        int fd = it->second;
        in_flight_.erase(it);
        fd_serial_.erase(fd);
        send_and_maybe_close(fd, done.response);
    }
}

void LinuxEventLoop::send_and_maybe_close(int fd, const HttpResponse& response) {
    switch (http_server_.send_response(fd, response)) {
        case HttpServer::SendResult::Pending: {
            epoll_event ev{.events = EPOLLOUT, .data = {.fd = fd}};
            epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev);
            return;
        }
        case HttpServer::SendResult::Done:
        case HttpServer::SendResult::Failed:
            drop_client(fd);
            return;
    }
}

void LinuxEventLoop::drop_client(int fd) {
    if (auto it = fd_serial_.find(fd); it != fd_serial_.end()) {
        in_flight_.erase(it->second);
        fd_serial_.erase(it);
    }
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    http_server_.close_client(fd);
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[rcmcp] {}", msg);
    }
}
