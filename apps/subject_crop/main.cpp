#include <common/config.hpp>
#include <common/errors.hpp>
#include <inference/yolo_detector.hpp>
#include <jobs/job_lifecycle.hpp>
#include <jobs/job_service.hpp>
#include <jobs/job_store.hpp>
#include <jobs/task_dispatcher.hpp>
#include <pipeline/crop_pipeline.hpp>
#include <pipeline/video_cropper.hpp>
#include <storage/object_store.hpp>

#include <yaml-cpp/exceptions.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

static std::atomic<bool> g_running(true);
static void handle_sigint(int) { g_running = false; }

static void usage() {
    std::cerr << "usage: subject_crop <config.yaml> submit <uri>\n"
              << "       subject_crop <config.yaml> status <job-id>\n"
              << "       subject_crop <config.yaml> cleanup\n"
              << "       subject_crop <config.yaml> crop <input-file> <output-file>\n";
}

static void print_job(const sc::Job& job) {
    std::cout << "id: " << job.id << "\n"
              << "uri: " << job.uri << "\n"
              << "status: " << sc::to_string(job.status) << "\n"
              << "created_at: " << sc::format_iso8601(job.created_at) << "\n"
              << "updated_at: " << sc::format_iso8601(job.updated_at) << "\n";
    if (job.result_uri) std::cout << "output_uri: " << *job.result_uri << "\n";
    if (job.error) std::cout << "error: " << *job.error << "\n";
}

static int run_submit(const sc::AppConfig& cfg, const std::string& uri) {
    sc::YoloDetector detector(cfg.detector);
    sc::ObjectStore objects(cfg.storage);
    sc::VideoCropper cropper(cfg, detector, objects);

    sc::FileJobStore store(cfg.jobs.store_dir);
    sc::JobLifecycle lifecycle(store, cfg.jobs);

    // the service is wired after the dispatcher that calls back into it
    sc::JobService* service = nullptr;
    sc::LocalDispatcher dispatcher([&service](const std::string& id) {
        return sc::delivery_for(service->process(id));
    }, cfg.jobs.max_attempts);
    sc::JobService svc(lifecycle, dispatcher, cropper, cfg.jobs);
    service = &svc;

    const std::string id = svc.submit(uri);
    std::cout << "job_id: " << id << "\n";

    dispatcher.start();
    while (g_running && !dispatcher.wait_idle(std::chrono::milliseconds(200))) {}
    if (!g_running) std::cerr << "Shutting down...\n";
    dispatcher.stop();

    const auto job = svc.status(id);
    if (!job) {
        std::cerr << "job " << id << " disappeared\n";
        return 1;
    }
    print_job(*job);
    return job->status == sc::JobStatus::Done ? 0 : 1;
}

static int run_status(const sc::AppConfig& cfg, const std::string& id) {
    sc::FileJobStore store(cfg.jobs.store_dir);
    sc::JobLifecycle lifecycle(store, cfg.jobs);
    const auto job = lifecycle.get(id);
    if (!job) {
        std::cerr << "Job not found: " << id << "\n";
        return 2;
    }
    print_job(*job);
    return 0;
}

static int run_cleanup(const sc::AppConfig& cfg) {
    sc::FileJobStore store(cfg.jobs.store_dir);
    sc::JobLifecycle lifecycle(store, cfg.jobs);
    const sc::CleanupReport r = lifecycle.cleanup();

    std::cout << "deleted: " << r.deleted << "\n"
              << "cutoff: " << sc::format_iso8601(r.cutoff) << "\n"
              << "stalled_marked: " << r.stalled_marked << "\n";
    if (r.stalled_cutoff) std::cout << "stalled_cutoff: " << sc::format_iso8601(*r.stalled_cutoff) << "\n";
    return 0;
}

static int run_crop(const sc::AppConfig& cfg, const std::string& in, const std::string& out) {
    sc::YoloDetector detector(cfg.detector);
    sc::CropPipeline pipeline(cfg.cropper, detector);
    const sc::PipelineStats st = pipeline.process_file(in, out, cfg.encoder, cfg.cropper.tmp_dir);
    std::cout << "frames: " << st.frames << " batches: " << st.batches
              << " frames_with_subject: " << st.frames_with_subject << "\n";
    return 0;
}

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_sigint);
    std::signal(SIGTERM, handle_sigint);

    if (argc < 3) {
        usage();
        return 2;
    }
    const std::string cfg_path = argv[1];
    const std::string cmd = argv[2];

    sc::AppConfig cfg;
    try {
        cfg = sc::load_config_yaml(cfg_path);
    } catch (const YAML::Exception& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    } catch (const sc::ConfigurationError& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    try {
        if (cmd == "submit" && argc == 4) return run_submit(cfg, argv[3]);
        if (cmd == "status" && argc == 4) return run_status(cfg, argv[3]);
        if (cmd == "cleanup" && argc == 3) return run_cleanup(cfg);
        if (cmd == "crop" && argc == 5) return run_crop(cfg, argv[3], argv[4]);
    } catch (const sc::ProcessingError& e) {
        std::cerr << "Processing failed: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    usage();
    return 2;
}
