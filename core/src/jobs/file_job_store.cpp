#include <jobs/job_store.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <yaml-cpp/yaml.h>

namespace sc {
    namespace {
        constexpr const char* kExt = ".yaml";

        bool valid_id(const std::string& id) {
            if (id.empty() || id.size() > 128) return false;
            return std::all_of(id.begin(), id.end(), [](unsigned char c) {
                return std::isalnum(c) || c == '-' || c == '_';
            });
        }
    } // namespace

    std::string job_to_yaml(const Job& job) {
        YAML::Emitter out;
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << job.id;
        out << YAML::Key << "uri" << YAML::Value << job.uri;
        out << YAML::Key << "status" << YAML::Value << to_string(job.status);
        out << YAML::Key << "created_at" << YAML::Value << format_iso8601(job.created_at);
        out << YAML::Key << "updated_at" << YAML::Value << format_iso8601(job.updated_at);
        if (job.result_uri) {
            out << YAML::Key << "result" << YAML::Value
                << YAML::BeginMap << YAML::Key << "output_uri" << YAML::Value << *job.result_uri << YAML::EndMap;
        }
        if (job.error) out << YAML::Key << "error" << YAML::Value << *job.error;
        out << YAML::EndMap;
        return out.c_str();
    }

    Job job_from_yaml(const std::string& text) {
        const YAML::Node n = YAML::Load(text);
        if (!n || !n.IsMap()) throw std::runtime_error("[JobStore] job record is not a map");

        Job job;
        job.id = n["id"].as<std::string>();
        job.uri = n["uri"] ? n["uri"].as<std::string>() : std::string();

        const auto status = parse_job_status(n["status"].as<std::string>());
        if (!status) throw std::runtime_error("[JobStore] unknown status in job " + job.id);
        job.status = *status;

        job.created_at = parse_iso8601(n["created_at"].as<std::string>());
        job.updated_at = parse_iso8601(n["updated_at"].as<std::string>());
        if (n["result"] && n["result"]["output_uri"]) job.result_uri = n["result"]["output_uri"].as<std::string>();
        if (n["error"]) job.error = n["error"].as<std::string>();
        return job;
    }

    FileJobStore::FileJobStore(std::string dir) : dir_(std::move(dir)) {
        std::error_code ec;
        std::filesystem::create_directories(dir_, ec);
        if (ec) throw std::runtime_error("[JobStore] cannot create " + dir_ + ": " + ec.message());
    }

    std::string FileJobStore::path_for_(const std::string& id) const {
        if (!valid_id(id)) throw std::invalid_argument("[JobStore] invalid job id: " + id);
        return (std::filesystem::path(dir_) / (id + kExt)).string();
    }

    std::optional<Job> FileJobStore::read_(const std::string& id) const {
        std::ifstream in(path_for_(id));
        if (!in.is_open()) return std::nullopt;
        std::stringstream ss;
        ss << in.rdbuf();
        return job_from_yaml(ss.str());
    }

    void FileJobStore::write_(const Job& job) const {
        namespace fs = std::filesystem;
        const std::string path = path_for_(job.id);
        const std::string tmp = path + ".tmp";
        {
            std::ofstream out(tmp, std::ios::trunc);
            if (!out.is_open()) throw std::runtime_error("[JobStore] cannot write " + tmp);
            out << job_to_yaml(job) << "\n";
            out.flush();
            if (!out) throw std::runtime_error("[JobStore] short write to " + tmp);
        }
        std::error_code ec;
        fs::rename(tmp, path, ec);
        if (ec) throw std::runtime_error("[JobStore] cannot replace " + path + ": " + ec.message());
    }

    std::vector<Job> FileJobStore::load_all_() const {
        namespace fs = std::filesystem;
        std::vector<Job> out;
        for (const auto& entry : fs::directory_iterator(dir_)) {
            if (!entry.is_regular_file() || entry.path().extension() != kExt) continue;
            const std::string id = entry.path().stem().string();
            try {
                if (auto job = read_(id)) out.push_back(std::move(*job));
            } catch (const std::exception& e) {
                std::cerr << "[JobStore](scan) skipping unreadable record " << entry.path() << ": " << e.what() << "\n";
            }
        }
        return out;
    }

    std::optional<Job> FileJobStore::get(const std::string& id) {
        std::lock_guard lk(m_);
        if (!valid_id(id)) return std::nullopt;
        return read_(id);
    }

    void FileJobStore::create(const Job& job) {
        std::lock_guard lk(m_);
        if (std::filesystem::exists(path_for_(job.id))) {
            throw std::runtime_error("job already exists: " + job.id);
        }
        write_(job);
    }

    bool FileJobStore::update(const JobUpdate& u) {
        std::lock_guard lk(m_);
        if (!valid_id(u.id)) return false;
        auto job = read_(u.id);
        if (!job || !apply_update(*job, u)) return false;
        write_(*job);
        return true;
    }

    std::vector<Job> FileJobStore::created_before(TimePoint cutoff, size_t limit) {
        std::lock_guard lk(m_);
        std::vector<Job> out;
        for (auto& job : load_all_()) {
            if (job.created_at < cutoff) out.push_back(std::move(job));
        }
        std::sort(out.begin(), out.end(), [](const Job& a, const Job& b) { return a.created_at < b.created_at; });
        if (out.size() > limit) out.resize(limit);
        return out;
    }

    std::vector<Job> FileJobStore::stale_with_status(JobStatus s, TimePoint cutoff, size_t limit) {
        std::lock_guard lk(m_);
        std::vector<Job> out;
        for (auto& job : load_all_()) {
            if (job.status == s && job.updated_at < cutoff) out.push_back(std::move(job));
        }
        std::sort(out.begin(), out.end(), [](const Job& a, const Job& b) { return a.updated_at < b.updated_at; });
        if (out.size() > limit) out.resize(limit);
        return out;
    }

    size_t FileJobStore::commit(const WriteBatch& batch) {
        std::lock_guard lk(m_);
        size_t applied = 0;
        for (const auto& u : batch.updates) {
            if (!valid_id(u.id)) continue;
            auto job = read_(u.id);
            if (!job || !apply_update(*job, u)) continue;
            write_(*job);
            ++applied;
        }
        for (const auto& id : batch.deletes) {
            if (!valid_id(id)) continue;
            std::error_code ec;
            if (std::filesystem::remove(path_for_(id), ec)) ++applied;
            if (ec) std::cerr << "[JobStore](commit) delete " << id << " failed: " << ec.message() << "\n";
        }
        return applied;
    }
}
