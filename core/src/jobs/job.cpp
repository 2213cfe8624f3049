#include <jobs/job.hpp>

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <random>
#include <stdexcept>

namespace sc {
    const char* to_string(JobStatus s) {
        switch (s) {
            case JobStatus::Queued: return "queued";
            case JobStatus::Processing: return "processing";
            case JobStatus::Done: return "done";
            case JobStatus::Failed: return "failed";
        }
        return "unknown";
    }

    std::optional<JobStatus> parse_job_status(const std::string& s) {
        if (s == "queued") return JobStatus::Queued;
        if (s == "processing") return JobStatus::Processing;
        if (s == "done") return JobStatus::Done;
        if (s == "failed") return JobStatus::Failed;
        return std::nullopt;
    }

    bool transition_allowed(JobStatus from, JobStatus to) {
        switch (from) {
            case JobStatus::Queued:
                return to == JobStatus::Processing || to == JobStatus::Failed;
            case JobStatus::Processing:
                return to == JobStatus::Processing || to == JobStatus::Done || to == JobStatus::Failed;
            case JobStatus::Done:
            case JobStatus::Failed:
                return false;
        }
        return false;
    }

    bool apply_update(Job& job, const JobUpdate& u) {
        if (!u.expect.empty() &&
            std::find(u.expect.begin(), u.expect.end(), job.status) == u.expect.end()) {
            return false;
        }
        if (u.status) {
            if (*u.status != job.status && !transition_allowed(job.status, *u.status)) return false;
            if (*u.status == job.status && is_terminal(job.status)) return false;
            job.status = *u.status;
        }
        if (u.result_uri) job.result_uri = u.result_uri;
        if (u.error) job.error = u.error;
        job.updated_at = u.updated_at;
        return true;
    }

    std::string format_iso8601(TimePoint t) {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
        std::time_t secs = static_cast<std::time_t>(ms / 1000);
        long frac = static_cast<long>(ms % 1000);
        if (frac < 0) {
            frac += 1000;
            secs -= 1;
        }

        std::tm tm{};
        gmtime_r(&secs, &tm);
        char buf[40];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03ldZ",
                      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                      tm.tm_hour, tm.tm_min, tm.tm_sec, frac);
        return buf;
    }

    TimePoint parse_iso8601(const std::string& s) {
        std::tm tm{};
        int ms = 0;
        const int n = std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3dZ",
                                  &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                                  &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &ms);
        if (n < 6) throw std::invalid_argument("bad timestamp: " + s);
        tm.tm_year -= 1900;
        tm.tm_mon -= 1;
        const std::time_t secs = timegm(&tm);
        return TimePoint(std::chrono::seconds(secs)) + std::chrono::milliseconds(n == 7 ? ms : 0);
    }

    std::string new_job_id() {
        thread_local std::mt19937_64 rng{std::random_device{}()};
        char buf[33];
        std::snprintf(buf, sizeof(buf), "%016llx%016llx",
                      static_cast<unsigned long long>(rng()),
                      static_cast<unsigned long long>(rng()));
        return buf;
    }
}
