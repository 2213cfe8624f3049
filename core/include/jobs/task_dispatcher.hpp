#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace sc {
    // Hands job ids to a worker endpoint with at-least-once delivery. The
    // deadline is a lease: a task is not redelivered before it elapses.
    class TaskDispatcher {
    public:
        virtual ~TaskDispatcher() = default;
        virtual void enqueue(const std::string& job_id, std::chrono::seconds deadline) = 0;
    };

    enum class Delivery {
        Ack,
        Retry
    };

    // In-process dispatcher backed by a single worker thread. A task whose
    // handler throws or returns Retry is redelivered once its deadline has
    // passed, up to max_attempts deliveries in total.
    class LocalDispatcher : public TaskDispatcher {
    public:
        using Handler = std::function<Delivery(const std::string& job_id)>;

        LocalDispatcher(Handler handler, int max_attempts);
        ~LocalDispatcher() override { stop(); }

        LocalDispatcher(const LocalDispatcher&) = delete;
        LocalDispatcher& operator=(const LocalDispatcher&) = delete;

        void enqueue(const std::string& job_id, std::chrono::seconds deadline) override;

        void start();
        void stop();

        // Blocks until nothing is scheduled or running. False on timeout.
        bool wait_idle(std::chrono::milliseconds timeout);

        size_t deliveries() const { return deliveries_.load(); }
        size_t abandoned() const { return abandoned_.load(); }

    private:
        using SteadyClock = std::chrono::steady_clock;

        struct Task {
            std::string job_id;
            std::chrono::seconds deadline{0};
            int attempts = 0;
        };

        void worker_loop_();
        void deliver_(Task task);

        Handler handler_;
        int max_attempts_;

        std::mutex m_;
        std::condition_variable cv_;
        std::condition_variable idle_cv_;
        std::multimap<SteadyClock::time_point, Task> schedule_;
        size_t in_flight_ = 0;

        std::atomic<bool> running_{false};
        std::atomic<size_t> deliveries_{0};
        std::atomic<size_t> abandoned_{0};
        std::thread worker_;
    };
}
