#include <common/errors.hpp>
#include <jobs/job.hpp>
#include <jobs/job_lifecycle.hpp>
#include <jobs/job_service.hpp>
#include <jobs/job_store.hpp>
#include <jobs/task_dispatcher.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace {
    using namespace std::chrono_literals;

    int g_failures = 0;

    void check(bool condition, const std::string& message) {
        if (!condition) {
            ++g_failures;
            std::cerr << "[FAIL] " << message << "\n";
        }
    }

    struct ManualClock {
        sc::TimePoint t = sc::parse_iso8601("2024-03-01T12:00:00.000Z");
        sc::TimePoint operator()() const { return t; }
    };

    sc::Job make_job(const std::string& id, sc::JobStatus s, sc::TimePoint created, sc::TimePoint updated) {
        sc::Job j;
        j.id = id;
        j.uri = "gs://in/" + id + ".mp4";
        j.status = s;
        j.created_at = created;
        j.updated_at = updated;
        return j;
    }

    class RecordingDispatcher : public sc::TaskDispatcher {
    public:
        void enqueue(const std::string& job_id, std::chrono::seconds deadline) override {
            ids.push_back(job_id);
            deadlines.push_back(deadline);
        }
        std::vector<std::string> ids;
        std::vector<std::chrono::seconds> deadlines;
    };

    class ScriptedRunner : public sc::IJobRunner {
    public:
        enum class Mode { Ok, ProcessingFailure, Unexpected };

        sc::CropResult run(const std::string& input_uri) override {
            ++calls;
            if (mode == Mode::ProcessingFailure) throw sc::DownloadError("download failed for " + input_uri + ": HTTP 404");
            if (mode == Mode::Unexpected) throw std::logic_error("bad state");
            sc::CropResult r;
            r.input_uri = input_uri;
            r.output_uri = input_uri + ".out";
            return r;
        }

        Mode mode = Mode::Ok;
        int calls = 0;
    };

    void test_transition_table() {
        using S = sc::JobStatus;
        check(sc::transition_allowed(S::Queued, S::Processing), "queued -> processing");
        check(sc::transition_allowed(S::Processing, S::Done), "processing -> done");
        check(sc::transition_allowed(S::Processing, S::Failed), "processing -> failed");
        check(sc::transition_allowed(S::Queued, S::Failed), "queued -> failed (stall)");
        check(!sc::transition_allowed(S::Queued, S::Done), "queued cannot jump to done");
        for (S from : {S::Done, S::Failed}) {
            for (S to : {S::Queued, S::Processing, S::Done, S::Failed}) {
                check(!sc::transition_allowed(from, to), "terminal states never move");
            }
        }
    }

    void test_iso8601_roundtrip() {
        const sc::TimePoint t = sc::parse_iso8601("2024-02-29T23:59:58.125Z");
        check(sc::format_iso8601(t) == "2024-02-29T23:59:58.125Z", "timestamps should keep milliseconds");
        check(sc::format_iso8601(sc::parse_iso8601("1970-01-01T00:00:00Z")) == "1970-01-01T00:00:00.000Z",
              "fraction should be optional on input");

        bool threw = false;
        try {
            (void)sc::parse_iso8601("yesterday");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        check(threw, "garbage timestamps should be rejected");
    }

    void test_job_ids() {
        const std::string a = sc::new_job_id();
        const std::string b = sc::new_job_id();
        check(a.size() == 32 && b.size() == 32, "job ids should be 32 characters");
        check(a != b, "job ids should be unique");
        check(a.find_first_not_of("0123456789abcdef") == std::string::npos, "job ids should be lowercase hex");
    }

    // Fails the job itself mid-run, as a stall reclaim would, then throws.
    class ReclaimedRunner : public sc::IJobRunner {
    public:
        explicit ReclaimedRunner(sc::JobLifecycle& lc) : lc_(lc) {}

        sc::CropResult run(const std::string& input_uri) override {
            check(lc_.mark_failed(job_id, "reclaimed while processing"), "reclaim should fail the running job");
            throw sc::DownloadError("download failed for " + input_uri);
        }

        std::string job_id;

    private:
        sc::JobLifecycle& lc_;
    };

    void test_happy_path() {
        sc::MemoryJobStore store;
        ManualClock clock;
        sc::JobLifecycle lc(store, sc::JobsConfig{}, [&] { return clock(); });

        const sc::Job job = lc.create("gs://b/v.mp4");
        check(job.status == sc::JobStatus::Queued, "new jobs start queued");
        check(job.created_at == clock.t && job.updated_at == clock.t, "timestamps come from the clock");

        clock.t += 1min;
        check(lc.mark_processing(job.id), "queued job can be claimed");
        clock.t += 1min;
        check(lc.mark_done(job.id, "gs://b/v_cropped.mp4"), "processing job can finish");

        const auto j = lc.get(job.id);
        check(j && j->status == sc::JobStatus::Done, "job should be done");
        check(j && j->result_uri && *j->result_uri == "gs://b/v_cropped.mp4", "done job carries its result");
        check(j && j->updated_at == clock.t, "updated_at should track the last write");
        check(j && j->created_at == job.created_at, "created_at never changes");
    }

    void test_terminal_jobs_never_reopen() {
        sc::MemoryJobStore store;
        ManualClock clock;
        sc::JobLifecycle lc(store, sc::JobsConfig{}, [&] { return clock(); });

        const sc::Job job = lc.create("gs://b/v.mp4");
        check(lc.mark_processing(job.id), "claim should succeed");
        check(lc.mark_processing(job.id), "redelivered claim on a processing job should succeed");
        check(lc.mark_failed(job.id, "boom"), "processing job can fail");

        check(!lc.mark_processing(job.id), "failed job cannot be claimed again");
        check(!lc.mark_done(job.id, "gs://x"), "failed job cannot become done");
        check(!lc.mark_failed(job.id, "again"), "failed job keeps its first error");

        const auto j = lc.get(job.id);
        check(j && j->status == sc::JobStatus::Failed && j->error && *j->error == "boom",
              "terminal record should be unchanged");
        check(!lc.mark_done("missing", "gs://x"), "unknown job cannot be updated");
    }

    void test_stall_scan() {
        sc::MemoryJobStore store;
        ManualClock clock;
        sc::JobsConfig cfg;
        cfg.stalled_minutes = 30;
        const auto now = clock.t;

        store.create(make_job("stuck", sc::JobStatus::Processing, now - 50min, now - 45min));
        store.create(make_job("waiting", sc::JobStatus::Queued, now - 40min, now - 40min));
        store.create(make_job("busy", sc::JobStatus::Processing, now - 50min, now - 10min));
        store.create(make_job("old-done", sc::JobStatus::Done, now - 2h, now - 2h));

        sc::JobLifecycle lc(store, cfg, [&] { return clock(); });
        const auto report = lc.cleanup();

        check(report.stalled_marked == 2, "two jobs are past the stall threshold");
        check(report.stalled_cutoff && *report.stalled_cutoff == now - 30min, "stall cutoff is now - 30min");
        const auto stuck = store.get("stuck");
        check(stuck && stuck->status == sc::JobStatus::Failed, "stuck processing job should fail");
        check(stuck && stuck->error && stuck->error->find("30 minutes") != std::string::npos,
              "stall message should name the threshold");
        check(store.get("waiting")->status == sc::JobStatus::Failed, "stuck queued job should fail");
        check(store.get("busy")->status == sc::JobStatus::Processing, "recently updated job is left alone");
        check(store.get("old-done")->status == sc::JobStatus::Done, "terminal jobs are not stall-reclaimed");
        check(report.deleted == 0, "nothing is old enough for retention");
    }

    void test_stall_scan_disabled() {
        sc::MemoryJobStore store;
        ManualClock clock;
        sc::JobsConfig cfg;
        cfg.stalled_minutes = 0;
        store.create(make_job("stuck", sc::JobStatus::Processing, clock.t - 5h, clock.t - 5h));

        sc::JobLifecycle lc(store, cfg, [&] { return clock(); });
        const auto report = lc.cleanup();
        check(!report.stalled_cutoff.has_value(), "disabled stall scan reports no cutoff");
        check(report.stalled_marked == 0, "disabled stall scan marks nothing");
        check(store.get("stuck")->status == sc::JobStatus::Processing, "disabled stall scan leaves jobs alone");
    }

    void test_retention_scan() {
        sc::MemoryJobStore store;
        ManualClock clock;
        sc::JobsConfig cfg;
        cfg.retention_days = 14;
        const auto now = clock.t;
        const auto day = std::chrono::hours(24);

        store.create(make_job("old-done", sc::JobStatus::Done, now - 20 * day, now - 20 * day));
        store.create(make_job("old-queued", sc::JobStatus::Queued, now - 15 * day, now - 15 * day));
        store.create(make_job("fresh", sc::JobStatus::Failed, now - 13 * day, now - 13 * day));

        sc::JobLifecycle lc(store, cfg, [&] { return clock(); });
        const auto report = lc.cleanup();

        check(report.cutoff == now - 14 * day, "retention cutoff is now - 14 days");
        check(report.deleted == 2, "jobs past retention are deleted regardless of status");
        check(!store.get("old-done") && !store.get("old-queued"), "expired jobs should be gone");
        check(store.get("fresh").has_value(), "jobs inside the window are kept");
    }

    void test_scans_are_paged() {
        sc::MemoryJobStore store;
        ManualClock clock;
        sc::JobsConfig cfg;
        cfg.page_size = 3;
        cfg.stalled_minutes = 30;
        cfg.retention_days = 1;

        for (int i = 0; i < 10; ++i) {
            store.create(make_job("exp" + std::to_string(i), sc::JobStatus::Done, clock.t - 72h, clock.t - 72h));
        }
        for (int i = 0; i < 7; ++i) {
            store.create(make_job("stall" + std::to_string(i), sc::JobStatus::Processing,
                                  clock.t - 2h, clock.t - 2h));
        }

        sc::JobLifecycle lc(store, cfg, [&] { return clock(); });
        const auto report = lc.cleanup();
        check(report.deleted == 10, "every expired job is deleted across pages");
        check(report.stalled_marked == 7, "every stalled job is marked across pages");
        check(store.size() == 7, "only the reclaimed stalled jobs remain");
    }

    void test_service_submit_and_process() {
        sc::MemoryJobStore store;
        ManualClock clock;
        sc::JobsConfig cfg;
        cfg.dispatch_deadline_s = 120;
        sc::JobLifecycle lc(store, cfg, [&] { return clock(); });
        RecordingDispatcher dispatcher;
        ScriptedRunner runner;
        sc::JobService svc(lc, dispatcher, runner, cfg);

        bool threw = false;
        try {
            (void)svc.submit("");
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        check(threw, "empty uri should be rejected");

        for (const std::string bad : {"ftp://host/video.mp4", "/local/video.mp4", "s3://b/v.mp4", "gs:/b/v.mp4"}) {
            threw = false;
            try {
                (void)svc.submit(bad);
            } catch (const std::invalid_argument&) {
                threw = true;
            }
            check(threw, "unsupported scheme should be rejected at submission: " + bad);
        }
        check(store.size() == 0, "rejected submissions create nothing");
        check(dispatcher.ids.empty(), "rejected submissions enqueue nothing");

        const std::string id = svc.submit("gs://b/clip.mp4");
        check(dispatcher.ids.size() == 1 && dispatcher.ids[0] == id, "submission should enqueue the job id");
        check(dispatcher.deadlines[0] == 120s, "enqueue should carry the dispatch deadline");
        check(svc.status(id)->status == sc::JobStatus::Queued, "submitted job is queued");

        check(svc.process(id) == sc::ProcessOutcome::Done, "successful run should be done");
        const auto j = svc.status(id);
        check(j && j->result_uri && *j->result_uri == "gs://b/clip.mp4.out", "result uri should be recorded");

        check(svc.process(id) == sc::ProcessOutcome::AlreadyTerminal, "redelivery of a done job is a no-op");
        check(runner.calls == 1, "done jobs are not re-run");
        check(!svc.status("nope").has_value(), "unknown ids are not found");
        check(svc.process("nope") == sc::ProcessOutcome::NotFound, "processing an unknown id is NotFound");
        check(sc::delivery_for(sc::ProcessOutcome::NotFound) == sc::Delivery::Retry, "not found is retried");
        check(sc::delivery_for(sc::ProcessOutcome::Failed) == sc::Delivery::Ack, "failures are acknowledged");
    }

    void test_service_records_failures() {
        sc::MemoryJobStore store;
        ManualClock clock;
        sc::JobLifecycle lc(store, sc::JobsConfig{}, [&] { return clock(); });
        RecordingDispatcher dispatcher;
        ScriptedRunner runner;
        sc::JobService svc(lc, dispatcher, runner, sc::JobsConfig{});

        runner.mode = ScriptedRunner::Mode::ProcessingFailure;
        const std::string a = svc.submit("https://example.com/gone.mp4");
        check(svc.process(a) == sc::ProcessOutcome::Failed, "processing error fails the job");
        const auto ja = svc.status(a);
        check(ja && ja->error && ja->error->find("download failed for") == 0, "processing error message is kept");

        runner.mode = ScriptedRunner::Mode::Unexpected;
        const std::string b = svc.submit("gs://b/c.mp4");
        check(svc.process(b) == sc::ProcessOutcome::Failed, "unexpected error fails the job");
        const auto jb = svc.status(b);
        check(jb && jb->error && *jb->error == "unexpected: bad state", "unexpected errors are labelled");

        sc::Job blank = make_job("blank", sc::JobStatus::Queued, clock.t, clock.t);
        blank.uri.clear();
        store.create(blank);
        check(svc.process("blank") == sc::ProcessOutcome::MissingUri, "job without uri is rejected");
        const auto jc = svc.status("blank");
        check(jc && jc->status == sc::JobStatus::Failed && jc->error && *jc->error == "Job missing uri",
              "missing uri is recorded on the job");
    }

    void test_late_failure_keeps_first_error() {
        sc::MemoryJobStore store;
        ManualClock clock;
        sc::JobLifecycle lc(store, sc::JobsConfig{}, [&] { return clock(); });
        RecordingDispatcher dispatcher;
        ReclaimedRunner runner(lc);
        sc::JobService svc(lc, dispatcher, runner, sc::JobsConfig{});

        runner.job_id = svc.submit("gs://b/slow.mp4");
        check(svc.process(runner.job_id) == sc::ProcessOutcome::AlreadyTerminal,
              "a failure that cannot be recorded should report the job as already terminal");
        const auto job = svc.status(runner.job_id);
        check(job && job->status == sc::JobStatus::Failed, "job should stay failed");
        check(job && job->error && *job->error == "reclaimed while processing", "first error should be kept");
        check(sc::delivery_for(sc::ProcessOutcome::AlreadyTerminal) == sc::Delivery::Ack, "terminal jobs are acked");
    }

    void test_file_store_persists() {
        namespace fs = std::filesystem;
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        const fs::path dir = fs::temp_directory_path() / ("sc_jobs_" + std::to_string(stamp));
        ManualClock clock;

        std::string id;
        {
            sc::FileJobStore store(dir.string());
            sc::JobLifecycle lc(store, sc::JobsConfig{}, [&] { return clock(); });
            id = lc.create("https://example.com/a b.mp4?sig=1").id;
            check(lc.mark_processing(id), "file store claim should succeed");
            check(lc.mark_done(id, "gs://out/a b_cropped.mp4"), "file store finish should succeed");

            bool threw = false;
            try {
                store.create(make_job(id, sc::JobStatus::Queued, clock.t, clock.t));
            } catch (const std::runtime_error&) {
                threw = true;
            }
            check(threw, "duplicate ids should be rejected");
        }

        sc::FileJobStore reopened(dir.string());
        const auto j = reopened.get(id);
        check(j.has_value(), "job should survive reopening the store");
        check(j && j->uri == "https://example.com/a b.mp4?sig=1", "uri should survive");
        check(j && j->status == sc::JobStatus::Done, "status should survive");
        check(j && j->result_uri && *j->result_uri == "gs://out/a b_cropped.mp4", "result should survive");
        check(j && j->created_at == clock.t, "created_at should survive at millisecond precision");
        check(!reopened.get("../etc/passwd").has_value(), "path-like ids are never found");

        clock.t += std::chrono::hours(24 * 30);
        sc::JobLifecycle lc(reopened, sc::JobsConfig{}, [&] { return clock(); });
        check(lc.cleanup().deleted == 1, "retention should delete from the file store");
        check(!reopened.get(id).has_value(), "deleted job should be gone");

        fs::remove_all(dir);
    }

    void test_yaml_record_format() {
        sc::Job j = make_job("abc", sc::JobStatus::Failed,
                             sc::parse_iso8601("2024-01-02T03:04:05.006Z"),
                             sc::parse_iso8601("2024-01-02T03:04:06.000Z"));
        j.error = "stalled: no update in 30 minutes";
        const std::string text = sc::job_to_yaml(j);
        check(text.find("status: failed") != std::string::npos, "status is stored by name");
        check(text.find("2024-01-02T03:04:05.006Z") != std::string::npos, "times are ISO-8601 UTC");

        const sc::Job back = sc::job_from_yaml(text);
        check(back.error && *back.error == *j.error, "error should be read back");
        check(!back.result_uri.has_value(), "absent result stays absent");
    }

    void test_local_dispatcher_redelivers() {
        std::mutex m;
        std::vector<std::string> seen;
        std::atomic<int> calls{0};

        sc::LocalDispatcher d([&](const std::string& id) {
            {
                std::lock_guard lk(m);
                seen.push_back(id);
            }
            const int n = ++calls;
            if (n == 1) throw std::runtime_error("worker crashed");
            if (n == 2) return sc::Delivery::Retry;
            return sc::Delivery::Ack;
        }, 5);

        d.enqueue("job-1", 0s);
        d.start();
        check(d.wait_idle(5000ms), "dispatcher should drain");
        d.stop();

        check(calls == 3, "task should be delivered until acknowledged");
        check(d.deliveries() == 3 && d.abandoned() == 0, "delivery counters should match");
        check(seen.size() == 3 && seen[2] == "job-1", "every delivery carries the job id");
    }

    void test_local_dispatcher_gives_up() {
        std::atomic<int> calls{0};
        sc::LocalDispatcher d([&](const std::string&) {
            ++calls;
            return sc::Delivery::Retry;
        }, 2);

        d.start();
        d.enqueue("job-2", 0s);
        check(d.wait_idle(5000ms), "dispatcher should drain");
        d.stop();
        check(calls == 2, "delivery stops at max_attempts");
        check(d.abandoned() == 1, "exhausted task is abandoned");
    }

    void test_local_dispatcher_honours_lease() {
        std::atomic<int> calls{0};
        sc::LocalDispatcher d([&](const std::string&) {
            ++calls;
            return sc::Delivery::Retry;
        }, 3);

        d.start();
        d.enqueue("job-3", 3600s);
        check(!d.wait_idle(300ms), "leased task stays scheduled");
        check(calls == 1, "no redelivery before the deadline");
        d.stop();
    }
}

int main() {
    test_transition_table();
    test_iso8601_roundtrip();
    test_job_ids();
    test_happy_path();
    test_terminal_jobs_never_reopen();
    test_stall_scan();
    test_stall_scan_disabled();
    test_retention_scan();
    test_scans_are_paged();
    test_service_submit_and_process();
    test_service_records_failures();
    test_late_failure_keeps_first_error();
    test_file_store_persists();
    test_yaml_record_format();
    test_local_dispatcher_redelivers();
    test_local_dispatcher_gives_up();
    test_local_dispatcher_honours_lease();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all job tests passed\n";
    return 0;
}
