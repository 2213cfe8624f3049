#include <jobs/job_lifecycle.hpp>

#include <iostream>
#include <stdexcept>

namespace sc {
    JobLifecycle::JobLifecycle(JobStore& store, JobsConfig cfg, NowFn now)
        : store_(store), cfg_(std::move(cfg)), now_(std::move(now)) {
        if (!now_) throw std::invalid_argument("[Jobs] clock is required");
        if (cfg_.page_size < 1) throw std::invalid_argument("[Jobs] page_size must be >= 1");
    }

    Job JobLifecycle::create(const std::string& uri) {
        Job job;
        job.id = new_job_id();
        job.uri = uri;
        job.status = JobStatus::Queued;
        job.created_at = now_();
        job.updated_at = job.created_at;
        store_.create(job);
        std::cout << "[Jobs](create) " << job.id << " uri=" << uri << "\n";
        return job;
    }

    std::optional<Job> JobLifecycle::get(const std::string& id) {
        return store_.get(id);
    }

    bool JobLifecycle::mark_processing(const std::string& id) {
        JobUpdate u;
        u.id = id;
        u.status = JobStatus::Processing;
        u.updated_at = now_();
        u.expect = {JobStatus::Queued, JobStatus::Processing};
        return store_.update(u);
    }

    bool JobLifecycle::mark_done(const std::string& id, const std::string& result_uri) {
        JobUpdate u;
        u.id = id;
        u.status = JobStatus::Done;
        u.result_uri = result_uri;
        u.updated_at = now_();
        u.expect = {JobStatus::Processing};
        return store_.update(u);
    }

    bool JobLifecycle::mark_failed(const std::string& id, const std::string& error) {
        JobUpdate u;
        u.id = id;
        u.status = JobStatus::Failed;
        u.error = error;
        u.updated_at = now_();
        u.expect = {JobStatus::Queued, JobStatus::Processing};
        return store_.update(u);
    }

    size_t JobLifecycle::reclaim_stalled_(JobStatus s, TimePoint cutoff, const std::string& message) {
        const auto page = static_cast<size_t>(cfg_.page_size);
        size_t total = 0;
        for (;;) {
            const auto jobs = store_.stale_with_status(s, cutoff, page);
            if (jobs.empty()) break;

            WriteBatch batch;
            const TimePoint t = now_();
            for (const auto& job : jobs) {
                JobUpdate u;
                u.id = job.id;
                u.status = JobStatus::Failed;
                u.error = message;
                u.updated_at = t;
                u.expect = {s};
                batch.updates.push_back(std::move(u));
            }
            const size_t applied = store_.commit(batch);
            total += applied;
            // every row raced with a worker; nothing left to make progress on
            if (applied == 0 || jobs.size() < page) break;
        }
        return total;
    }

    size_t JobLifecycle::reclaim_expired_(TimePoint cutoff) {
        const auto page = static_cast<size_t>(cfg_.page_size);
        size_t total = 0;
        for (;;) {
            const auto jobs = store_.created_before(cutoff, page);
            if (jobs.empty()) break;

            WriteBatch batch;
            for (const auto& job : jobs) batch.deletes.push_back(job.id);
            const size_t applied = store_.commit(batch);
            total += applied;
            if (applied == 0 || jobs.size() < page) break;
        }
        return total;
    }

    CleanupReport JobLifecycle::cleanup() {
        CleanupReport report;
        const TimePoint t = now_();

        if (cfg_.stalled_minutes > 0) {
            const TimePoint stalled_cutoff = t - std::chrono::minutes(cfg_.stalled_minutes);
            const std::string message =
                "stalled: no update in " + std::to_string(cfg_.stalled_minutes) + " minutes";
            report.stalled_cutoff = stalled_cutoff;
            report.stalled_marked += reclaim_stalled_(JobStatus::Queued, stalled_cutoff, message);
            report.stalled_marked += reclaim_stalled_(JobStatus::Processing, stalled_cutoff, message);
        }

        report.cutoff = t - std::chrono::hours(24) * cfg_.retention_days;
        report.deleted = reclaim_expired_(report.cutoff);

        std::cout << "[Jobs](cleanup) deleted=" << report.deleted
                  << " cutoff=" << format_iso8601(report.cutoff)
                  << " stalled_marked=" << report.stalled_marked << "\n";
        return report;
    }
}
