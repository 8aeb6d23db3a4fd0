#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace powgate {

class ChannelClosedError : public std::runtime_error {
public:
    ChannelClosedError() : std::runtime_error("channel closed") {}
};

// Unbounded multi-producer single-consumer queue used between solver lanes
// and the coordinator. Lanes never touch coordinator state; they only send
// messages.
//
// After close(), sends are dropped and receivers drain whatever is still
// buffered.
template<typename T>
class Channel {
public:
    Channel() = default;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Returns false if closed.
    bool send(T item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return false;
        queue_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    // Blocks until an item arrives. Throws ChannelClosedError once closed and drained.
    T receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return !queue_.empty() || closed_; });
        if (queue_.empty()) {
            throw ChannelClosedError();
        }
        return pop_locked();
    }

    // std::nullopt on timeout or when closed and drained.
    template<class Rep, class Period>
    std::optional<T> receive_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool ready = not_empty_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
        if (!ready || queue_.empty()) return std::nullopt;
        return pop_locked();
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        not_empty_.notify_all();
    }

private:
    T pop_locked() {
        T item = std::move(queue_.front());
        queue_.pop_front();
        return item;
    }

    std::mutex mutex_;
    std::condition_variable not_empty_;
    std::deque<T> queue_;
    bool closed_ = false;
};

}
