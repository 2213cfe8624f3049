#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <jobs/job.hpp>

namespace sc {
    // Durable job records keyed by id.
    class JobStore {
    public:
        virtual ~JobStore() = default;

        virtual std::optional<Job> get(const std::string& id) = 0;
        // Throws std::runtime_error when the id is taken.
        virtual void create(const Job& job) = 0;
        // False when the job is missing or the update's guard does not hold.
        virtual bool update(const JobUpdate& u) = 0;

        // created_at < cutoff, any status, oldest first.
        virtual std::vector<Job> created_before(TimePoint cutoff, size_t limit) = 0;
        // status == s and updated_at < cutoff, oldest first.
        virtual std::vector<Job> stale_with_status(JobStatus s, TimePoint cutoff, size_t limit) = 0;

        // Applies every write of the batch; returns how many took effect.
        virtual size_t commit(const WriteBatch& batch) = 0;
    };

    class MemoryJobStore : public JobStore {
    public:
        std::optional<Job> get(const std::string& id) override;
        void create(const Job& job) override;
        bool update(const JobUpdate& u) override;
        std::vector<Job> created_before(TimePoint cutoff, size_t limit) override;
        std::vector<Job> stale_with_status(JobStatus s, TimePoint cutoff, size_t limit) override;
        size_t commit(const WriteBatch& batch) override;

        size_t size() const;

    private:
        mutable std::mutex m_;
        std::map<std::string, Job> jobs_;
    };

    // One YAML document per job under `dir`, replaced atomically on every
    // write. Survives restarts; not meant for concurrent writers in
    // different processes.
    class FileJobStore : public JobStore {
    public:
        explicit FileJobStore(std::string dir);

        std::optional<Job> get(const std::string& id) override;
        void create(const Job& job) override;
        bool update(const JobUpdate& u) override;
        std::vector<Job> created_before(TimePoint cutoff, size_t limit) override;
        std::vector<Job> stale_with_status(JobStatus s, TimePoint cutoff, size_t limit) override;
        size_t commit(const WriteBatch& batch) override;

    private:
        std::string path_for_(const std::string& id) const;
        std::optional<Job> read_(const std::string& id) const;
        void write_(const Job& job) const;
        std::vector<Job> load_all_() const;

        std::string dir_;
        std::mutex m_;
    };

    std::string job_to_yaml(const Job& job);
    Job job_from_yaml(const std::string& text);
}
