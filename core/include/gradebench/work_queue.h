#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <utility>

namespace gradebench {

// WorkQueue
// - Thread-safe FIFO push/pop
// - Blocking pop with shutdown(); items queued before shutdown are still handed out
//
// Used twice per grading run: jobs flow to the workers through one queue,
// finished grades flow back to the orchestrating thread through another.

template <typename T>
class WorkQueue {
public:
    WorkQueue() = default;

    // Returns false when shut down (value dropped).
    bool push(T value) {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) return false;
        q_.push_back(std::move(value));
        cv_.notify_one();
        return true;
    }

    // Returns false when shut down and drained.
    bool pop(T& out) {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [&]{ return closed_ || !q_.empty(); });
        if (q_.empty()) return false;
        out = std::move(q_.front());
        q_.pop_front();
        return true;
    }

    void shutdown() {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
        cv_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return q_.size();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<T> q_;
    bool closed_{false};
};

} // namespace gradebench
