#include "thread_pool.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

ThreadPool::ThreadPool(size_t workers) {
    if (workers == 0)
        throw std::invalid_argument("ThreadPool: need at least one worker");

    workers_.reserve(workers);
    try {
        for (size_t i = 0; i < workers; ++i)
            workers_.emplace_back(&ThreadPool::workerLoop, this, i);
    } catch (...) {
        // thread creation failed: stop the workers already running
        shutdown();
        throw;
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::submit(Job job) {
    {
        std::lock_guard<std::mutex> lk(m_);
        if (closed_)
            throw std::logic_error("ThreadPool: submit after shutdown");
        jobs_.push(std::move(job));
    }
    cv_.notify_one();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lk(m_);
        closed_ = true;
    }
    cv_.notify_all();

    for (auto &th : workers_) {
        if (th.joinable()) th.join();
    }
}

void ThreadPool::workerLoop(size_t id) {
    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lk(m_);
            cv_.wait(lk, [this] { return closed_ || !jobs_.empty(); });
            if (jobs_.empty()) return; // closed and drained
            job = std::move(jobs_.front());
            jobs_.pop();
        }

        try {
            job();
        } catch (const std::exception &e) {
            std::cerr << "worker " << id << ": job failed: " << e.what() << "\n";
        } catch (...) {
            std::cerr << "worker " << id << ": job failed with unknown exception\n";
        }
    }
}
