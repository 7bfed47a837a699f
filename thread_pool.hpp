#ifndef BLUR_THREAD_POOL_HPP
#define BLUR_THREAD_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

// Fixed set of worker threads pulling jobs from one shared queue.
//
// Workers live until the queue is closed and drained. Destruction (or
// shutdown()) closes the queue, lets the workers finish every job already
// submitted and joins them. A job that throws is logged to std::cerr and
// the worker goes on with the next one.
class ThreadPool {
public:
    using Job = std::function<void()>;

    // throws std::invalid_argument if workers == 0
    explicit ThreadPool(size_t workers);
    ~ThreadPool();

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;

    // throws std::logic_error once the pool is shut down
    void submit(Job job);

    // idempotent; blocks until every worker has exited
    void shutdown();

    size_t size() const { return workers_.size(); }

private:
    void workerLoop(size_t id);

    std::vector<std::thread> workers_;
    std::queue<Job> jobs_;
    std::mutex m_;
    std::condition_variable cv_;
    bool closed_ = false;
};

#endif
