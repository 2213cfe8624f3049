#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>

namespace sc {
    template <class T>
    class BoundedQueue {
    public:
        explicit BoundedQueue(size_t capacity) : cap_(capacity) {}

        // Blocks while full. Returns false once the queue was stopped.
        bool push(T v) {
            {
                std::unique_lock lk(m_);
                not_full_.wait(lk, [&]{ return stopped_ || q_.size() < cap_; });
                if (stopped_) return false;
                q_.push_back(std::move(v));
            }
            not_empty_.notify_one();
            return true;
        }

        // Blocks while empty. Returns false once the queue was stopped.
        bool pop(T& out) {
            {
                std::unique_lock lk(m_);
                not_empty_.wait(lk, [&]{ return stopped_ || !q_.empty(); });
                if (stopped_) return false;
                out = std::move(q_.front());
                q_.pop_front();
            }
            not_full_.notify_one();
            return true;
        }

        void stop() {
            {
                std::lock_guard lk(m_);
                stopped_ = true;
            }
            not_full_.notify_all();
            not_empty_.notify_all();
        }
    private:
        size_t cap_;
        std::mutex m_;
        std::condition_variable not_full_;
        std::condition_variable not_empty_;
        std::deque<T> q_;
        bool stopped_ = false;
    };
}
