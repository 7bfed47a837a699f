#ifndef BLUR_CHANNEL_HPP
#define BLUR_CHANNEL_HPP

#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

// Unbounded multi-producer / single-consumer queue.
template <typename T>
class Channel {
public:
    void send(T value) {
        {
            std::lock_guard<std::mutex> lk(m_);
            items_.push_back(std::move(value));
        }
        cv_.notify_one();
    }

    // blocks until an item is available
    T recv() {
        std::unique_lock<std::mutex> lk(m_);
        cv_.wait(lk, [this] { return !items_.empty(); });
        T value = std::move(items_.front());
        items_.pop_front();
        return value;
    }

private:
    std::mutex m_;
    std::condition_variable cv_;
    std::deque<T> items_;
};

#endif
