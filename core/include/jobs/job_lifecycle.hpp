#pragma once

#include <functional>
#include <optional>
#include <string>

#include <common/config.hpp>
#include <jobs/job_store.hpp>

namespace sc {
    struct CleanupReport {
        size_t deleted = 0;
        TimePoint cutoff;
        size_t stalled_marked = 0;
        std::optional<TimePoint> stalled_cutoff; // unset when the stall scan is off
    };

    // Owns every status write so the store only ever sees legal transitions.
    class JobLifecycle {
    public:
        using NowFn = std::function<TimePoint()>;

        JobLifecycle(JobStore& store, JobsConfig cfg, NowFn now = [] { return Clock::now(); });

        Job create(const std::string& uri);
        std::optional<Job> get(const std::string& id);

        // queued|processing -> processing. False when the job is missing or terminal.
        bool mark_processing(const std::string& id);
        bool mark_done(const std::string& id, const std::string& result_uri);
        bool mark_failed(const std::string& id, const std::string& error);

        // Stall scan (when enabled) followed by the retention scan, both paged.
        CleanupReport cleanup();

    private:
        size_t reclaim_stalled_(JobStatus s, TimePoint cutoff, const std::string& message);
        size_t reclaim_expired_(TimePoint cutoff);

        JobStore& store_;
        JobsConfig cfg_;
        NowFn now_;
    };
}
