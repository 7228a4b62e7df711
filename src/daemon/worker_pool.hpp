#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Fixed set of threads running queued jobs in FIFO order. Destruction stops
// accepting work, finishes what is queued, and joins.
class WorkerPool {
public:
    using Job = std::function<void()>;

    explicit WorkerPool(int threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // False once shutdown() has begun.
    bool submit(Job job);
    void shutdown();

private:
    void run(std::stop_token stop);

    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<Job> jobs_;
    bool closed_ = false;
    std::vector<std::jthread> threads_;
};
