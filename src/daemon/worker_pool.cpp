#include "worker_pool.hpp"

#include <print>

WorkerPool::WorkerPool(int threads) {
    threads_.reserve(static_cast<size_t>(threads));
    for (int i = 0; i < threads; i++) {
        threads_.emplace_back([this](std::stop_token stop) { run(stop); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(Job job) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) return false;
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
    return true;
}

void WorkerPool::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (closed_ && threads_.empty()) return;
        closed_ = true;
    }
    cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
}

void WorkerPool::run(std::stop_token stop) {
    while (true) {
        Job job;
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, stop, [this] { return closed_ || !jobs_.empty(); });
            if (jobs_.empty()) return; // closed or stop requested, nothing left
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        try {
            job();
        } catch (const std::exception& e) {
            std::println(stderr, "worker: job threw: {}", e.what());
        } catch (...) {
            std::println(stderr, "worker: job threw a non-standard exception");
        }
    }
}
