#include <jobs/job_service.hpp>

#include <iostream>
#include <stdexcept>

#include <common/errors.hpp>
#include <storage/object_store.hpp>

namespace sc {
    const char* to_string(ProcessOutcome o) {
        switch (o) {
            case ProcessOutcome::NotFound: return "not_found";
            case ProcessOutcome::MissingUri: return "missing_uri";
            case ProcessOutcome::AlreadyTerminal: return "already_terminal";
            case ProcessOutcome::Done: return "done";
            case ProcessOutcome::Failed: return "failed";
        }
        return "unknown";
    }

    Delivery delivery_for(ProcessOutcome o) {
        // a claim can arrive before the record is visible
        return o == ProcessOutcome::NotFound ? Delivery::Retry : Delivery::Ack;
    }

    JobService::JobService(JobLifecycle& lifecycle, TaskDispatcher& dispatcher, IJobRunner& runner, JobsConfig cfg)
        : lifecycle_(lifecycle), dispatcher_(dispatcher), runner_(runner), cfg_(std::move(cfg)) {}

    std::string JobService::submit(const std::string& uri) {
        if (uri.empty()) throw std::invalid_argument("uri is required");
        if (!is_gs_uri(uri) && !is_http_uri(uri)) {
            throw std::invalid_argument("uri must be gs://, http:// or https://");
        }
        const Job job = lifecycle_.create(uri);
        dispatcher_.enqueue(job.id, std::chrono::seconds(cfg_.dispatch_deadline_s));
        return job.id;
    }

    std::optional<Job> JobService::status(const std::string& id) {
        return lifecycle_.get(id);
    }

    ProcessOutcome JobService::process(const std::string& id) {
        const auto job = lifecycle_.get(id);
        if (!job) {
            std::cerr << "[Jobs](process) " << id << " not found\n";
            return ProcessOutcome::NotFound;
        }
        if (is_terminal(job->status)) {
            std::cout << "[Jobs](process) " << id << " already " << to_string(job->status) << "\n";
            return ProcessOutcome::AlreadyTerminal;
        }
        if (job->uri.empty()) {
            if (!lifecycle_.mark_failed(id, "Job missing uri")) {
                std::cerr << "[Jobs](process) " << id << " could not be marked failed\n";
            }
            return ProcessOutcome::MissingUri;
        }
        if (!lifecycle_.mark_processing(id)) {
            // lost a race with cleanup or another delivery
            return ProcessOutcome::AlreadyTerminal;
        }

        std::string error;
        try {
            const CropResult res = runner_.run(job->uri);
            if (!lifecycle_.mark_done(id, res.output_uri)) {
                std::cerr << "[Jobs](process) " << id << " finished but was no longer processing\n";
                return ProcessOutcome::AlreadyTerminal;
            }
            std::cout << "[Jobs](process) " << id << " done -> " << res.output_uri << "\n";
            return ProcessOutcome::Done;
        } catch (const ProcessingError& e) {
            error = e.what();
        } catch (const std::exception& e) {
            error = std::string("unexpected: ") + e.what();
        }

        std::cerr << "[Jobs](process) " << id << " failed: " << error << "\n";
        if (!lifecycle_.mark_failed(id, error)) {
            std::cerr << "[Jobs](process) " << id << " failure was not recorded, job no longer processing\n";
            return ProcessOutcome::AlreadyTerminal;
        }
        return ProcessOutcome::Failed;
    }

    CleanupReport JobService::cleanup() {
        return lifecycle_.cleanup();
    }
}
