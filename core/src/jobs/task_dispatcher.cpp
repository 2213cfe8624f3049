#include <jobs/task_dispatcher.hpp>

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace sc {
    LocalDispatcher::LocalDispatcher(Handler handler, int max_attempts)
        : handler_(std::move(handler)), max_attempts_(max_attempts) {
        if (!handler_) throw std::invalid_argument("[Dispatcher] handler is required");
        if (max_attempts_ < 1) throw std::invalid_argument("[Dispatcher] max_attempts must be >= 1");
    }

    void LocalDispatcher::enqueue(const std::string& job_id, std::chrono::seconds deadline) {
        {
            std::lock_guard lk(m_);
            Task t;
            t.job_id = job_id;
            t.deadline = deadline;
            schedule_.emplace(SteadyClock::now(), std::move(t));
        }
        cv_.notify_one();
    }

    void LocalDispatcher::start() {
        if (running_) return;
        running_ = true;
        worker_ = std::thread([this] { worker_loop_(); });
    }

    void LocalDispatcher::stop() {
        if (!running_) return;
        {
            std::lock_guard lk(m_);
            running_ = false;
        }
        cv_.notify_all();
        if (worker_.joinable()) worker_.join();
        idle_cv_.notify_all();
    }

    bool LocalDispatcher::wait_idle(std::chrono::milliseconds timeout) {
        std::unique_lock lk(m_);
        return idle_cv_.wait_for(lk, timeout, [&] { return schedule_.empty() && in_flight_ == 0; });
    }

    void LocalDispatcher::worker_loop_() {
        std::unique_lock lk(m_);
        while (running_) {
            if (schedule_.empty()) {
                cv_.wait(lk, [&] { return !running_ || !schedule_.empty(); });
                continue;
            }

            const auto due = schedule_.begin()->first;
            if (SteadyClock::now() < due) {
                cv_.wait_until(lk, due);
                continue;
            }

            Task task = std::move(schedule_.begin()->second);
            schedule_.erase(schedule_.begin());
            ++in_flight_;

            lk.unlock();
            deliver_(std::move(task));
            lk.lock();

            --in_flight_;
            if (schedule_.empty() && in_flight_ == 0) idle_cv_.notify_all();
        }
    }

    void LocalDispatcher::deliver_(Task task) {
        const auto leased_until = SteadyClock::now() + task.deadline;
        ++task.attempts;
        ++deliveries_;

        Delivery result = Delivery::Retry;
        try {
            result = handler_(task.job_id);
        } catch (const std::exception& e) {
            std::cerr << "[Dispatcher](deliver) " << task.job_id << " attempt " << task.attempts
                      << " threw: " << e.what() << "\n";
        }
        if (result == Delivery::Ack) return;

        if (task.attempts >= max_attempts_) {
            ++abandoned_;
            std::cerr << "[Dispatcher](deliver) giving up on " << task.job_id
                      << " after " << task.attempts << " attempts\n";
            return;
        }

        const auto due = std::max(leased_until, SteadyClock::now());
        std::lock_guard lk(m_);
        schedule_.emplace(due, std::move(task));
    }
}
