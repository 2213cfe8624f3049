#include <jobs/job_store.hpp>

#include <algorithm>
#include <stdexcept>

namespace sc {
    std::optional<Job> MemoryJobStore::get(const std::string& id) {
        std::lock_guard lk(m_);
        auto it = jobs_.find(id);
        if (it == jobs_.end()) return std::nullopt;
        return it->second;
    }

    void MemoryJobStore::create(const Job& job) {
        std::lock_guard lk(m_);
        if (!jobs_.emplace(job.id, job).second) {
            throw std::runtime_error("job already exists: " + job.id);
        }
    }

    bool MemoryJobStore::update(const JobUpdate& u) {
        std::lock_guard lk(m_);
        auto it = jobs_.find(u.id);
        if (it == jobs_.end()) return false;
        return apply_update(it->second, u);
    }

    std::vector<Job> MemoryJobStore::created_before(TimePoint cutoff, size_t limit) {
        std::lock_guard lk(m_);
        std::vector<Job> out;
        for (const auto& kv : jobs_) {
            if (kv.second.created_at < cutoff) out.push_back(kv.second);
        }
        std::sort(out.begin(), out.end(), [](const Job& a, const Job& b) { return a.created_at < b.created_at; });
        if (out.size() > limit) out.resize(limit);
        return out;
    }

    std::vector<Job> MemoryJobStore::stale_with_status(JobStatus s, TimePoint cutoff, size_t limit) {
        std::lock_guard lk(m_);
        std::vector<Job> out;
        for (const auto& kv : jobs_) {
            if (kv.second.status == s && kv.second.updated_at < cutoff) out.push_back(kv.second);
        }
        std::sort(out.begin(), out.end(), [](const Job& a, const Job& b) { return a.updated_at < b.updated_at; });
        if (out.size() > limit) out.resize(limit);
        return out;
    }

    size_t MemoryJobStore::commit(const WriteBatch& batch) {
        std::lock_guard lk(m_);
        size_t applied = 0;
        for (const auto& u : batch.updates) {
            auto it = jobs_.find(u.id);
            if (it != jobs_.end() && apply_update(it->second, u)) ++applied;
        }
        for (const auto& id : batch.deletes) {
            applied += jobs_.erase(id);
        }
        return applied;
    }

    size_t MemoryJobStore::size() const {
        std::lock_guard lk(m_);
        return jobs_.size();
    }
}
