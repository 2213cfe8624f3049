#pragma once

#include <optional>
#include <string>

#include <common/config.hpp>
#include <jobs/job_lifecycle.hpp>
#include <jobs/task_dispatcher.hpp>
#include <pipeline/video_cropper.hpp>

namespace sc {
    enum class ProcessOutcome {
        NotFound,
        MissingUri,
        AlreadyTerminal,
        Done,
        Failed
    };

    const char* to_string(ProcessOutcome o);

    // What a dispatcher should do with a task after process() returned.
    Delivery delivery_for(ProcessOutcome o);

    // Submission, status lookup, the worker claim and the cleanup scans.
    class JobService {
    public:
        JobService(JobLifecycle& lifecycle, TaskDispatcher& dispatcher, IJobRunner& runner, JobsConfig cfg);

        // Throws std::invalid_argument on an empty uri or one that is not
        // gs://, http:// or https://.
        std::string submit(const std::string& uri);
        std::optional<Job> status(const std::string& id);
        ProcessOutcome process(const std::string& id);
        CleanupReport cleanup();

    private:
        JobLifecycle& lifecycle_;
        TaskDispatcher& dispatcher_;
        IJobRunner& runner_;
        JobsConfig cfg_;
    };
}
