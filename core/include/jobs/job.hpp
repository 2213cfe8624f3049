#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace sc {
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    enum class JobStatus {
        Queued,
        Processing,
        Done,
        Failed
    };

    const char* to_string(JobStatus s);
    std::optional<JobStatus> parse_job_status(const std::string& s);

    inline bool is_terminal(JobStatus s) {
        return s == JobStatus::Done || s == JobStatus::Failed;
    }

    // queued -> processing -> {done, failed}; queued/processing -> failed
    // (stall, bad record); processing -> processing for a redelivered claim.
    // Nothing leaves done or failed.
    bool transition_allowed(JobStatus from, JobStatus to);

    struct Job {
        std::string id;
        std::string uri;
        JobStatus status = JobStatus::Queued;
        TimePoint created_at;
        TimePoint updated_at;
        std::optional<std::string> result_uri; // done only
        std::optional<std::string> error;      // failed only
    };

    // Partial write. Applied only when the stored status is one of `expect`
    // (any status when empty).
    struct JobUpdate {
        std::string id;
        std::optional<JobStatus> status;
        std::optional<std::string> result_uri;
        std::optional<std::string> error;
        TimePoint updated_at;
        std::vector<JobStatus> expect;
    };

    struct WriteBatch {
        std::vector<JobUpdate> updates;
        std::vector<std::string> deletes;

        bool empty() const { return updates.empty() && deletes.empty(); }
    };

    // Applies `u` to `job` when its guard holds; returns whether it did.
    bool apply_update(Job& job, const JobUpdate& u);

    std::string format_iso8601(TimePoint t);
    // Inverse of format_iso8601; throws std::invalid_argument.
    TimePoint parse_iso8601(const std::string& s);

    // 32 lowercase hex characters.
    std::string new_job_id();
}
