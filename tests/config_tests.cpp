#include <common/config.hpp>
#include <common/errors.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {
    int g_failures = 0;

    void check(bool condition, const std::string& message) {
        if (!condition) {
            ++g_failures;
            std::cerr << "[FAIL] " << message << "\n";
        }
    }

    std::string write_yaml_file(const std::string& prefix, const std::string& body) {
        namespace fs = std::filesystem;
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        const fs::path path = fs::temp_directory_path() /
                              (prefix + "_" + std::to_string(stamp) + ".yaml");

        std::ofstream out(path);
        if (!out.is_open()) {
            throw std::runtime_error("failed to open temp config file: " + path.string());
        }
        out << body;
        out.close();
        return path.string();
    }

    bool load_throws_config_error(const std::string& yaml) {
        const std::string path = write_yaml_file("sc_cfg", yaml);
        try {
            (void)sc::load_config_yaml(path);
            std::filesystem::remove(path);
            return false;
        } catch (const sc::ConfigurationError&) {
            std::filesystem::remove(path);
            return true;
        }
    }

    void test_empty_file_uses_defaults() {
        const std::string path = write_yaml_file("sc_cfg_empty", "{}\n");
        const auto cfg = sc::load_config_yaml(path);
        std::filesystem::remove(path);

        const sc::AppConfig def;
        check(cfg.cropper.batch_size == def.cropper.batch_size, "default batch_size should survive an empty file");
        check(cfg.cropper.queue_capacity == def.cropper.queue_capacity, "default queue_capacity should survive");
        check(cfg.encoder.binary == "ffmpeg", "default encoder binary should be ffmpeg");
        check(cfg.jobs.stalled_minutes == 0, "stall scan should be disabled by default");
        check(cfg.storage.output_bucket.empty(), "output_bucket should default to unset");
    }

    void test_sections_override_defaults() {
        const std::string yaml =
            "detector:\n"
            "  conf: 0.4\n"
            "  ncnn_threads: 4\n"
            "cropper:\n"
            "  batch_size: 16\n"
            "  queue_capacity: 2\n"
            "  padding_ratio: 0.1\n"
            "  keep_aspect: false\n"
            "  draw_timestamp: false\n"
            "encoder:\n"
            "  crf: 20\n"
            "  faststart: false\n"
            "storage:\n"
            "  output_bucket: \"out-bucket\"\n"
            "jobs:\n"
            "  retention_days: 7\n"
            "  stalled_minutes: 30\n"
            "  page_size: 50\n";

        const std::string path = write_yaml_file("sc_cfg_ok", yaml);
        const auto cfg = sc::load_config_yaml(path);
        std::filesystem::remove(path);

        check(cfg.detector.conf > 0.39f && cfg.detector.conf < 0.41f, "detector.conf should be read");
        check(cfg.detector.ncnn_threads == 4, "detector.ncnn_threads should be read");
        check(cfg.cropper.batch_size == 16, "cropper.batch_size should be read");
        check(cfg.cropper.queue_capacity == 2, "cropper.queue_capacity should be read");
        check(!cfg.cropper.keep_aspect, "cropper.keep_aspect should be read");
        check(!cfg.cropper.draw_timestamp, "cropper.draw_timestamp should be read");
        check(cfg.cropper.smooth_alpha == sc::CropperConfig{}.smooth_alpha, "unset keys keep their default");
        check(cfg.encoder.crf == 20 && !cfg.encoder.faststart, "encoder keys should be read");
        check(cfg.storage.output_bucket == "out-bucket", "storage.output_bucket should be read");
        check(cfg.jobs.retention_days == 7, "jobs.retention_days should be read");
        check(cfg.jobs.stalled_minutes == 30, "jobs.stalled_minutes should be read");
        check(cfg.jobs.page_size == 50, "jobs.page_size should be read");
    }

    void test_rejects_bad_alpha() {
        check(load_throws_config_error("cropper:\n  smooth_alpha: 0\n"), "smooth_alpha 0 should be rejected");
        check(load_throws_config_error("cropper:\n  smooth_alpha: 1.5\n"), "smooth_alpha > 1 should be rejected");
        check(!load_throws_config_error("cropper:\n  smooth_alpha: 1.0\n"), "smooth_alpha 1 should be accepted");
    }

    void test_rejects_bad_batching() {
        check(load_throws_config_error("cropper:\n  batch_size: 0\n"), "batch_size 0 should be rejected");
        check(load_throws_config_error("cropper:\n  queue_capacity: 0\n"), "queue_capacity 0 should be rejected");
        check(load_throws_config_error("cropper:\n  queue_capacity: -1\n"), "negative queue_capacity should be rejected");
    }

    void test_rejects_negative_ratios() {
        check(load_throws_config_error("cropper:\n  padding_ratio: -0.1\n"), "negative padding should be rejected");
        check(load_throws_config_error("cropper:\n  min_crop_ratio: -1\n"), "negative min_crop_ratio should be rejected");
    }

    void test_rejects_bad_jobs_section() {
        check(load_throws_config_error("jobs:\n  page_size: 0\n"), "page_size 0 should be rejected");
        check(load_throws_config_error("jobs:\n  retention_days: -1\n"), "negative retention should be rejected");
        check(load_throws_config_error("jobs:\n  max_attempts: 0\n"), "max_attempts 0 should be rejected");
    }
}

int main() {
    test_empty_file_uses_defaults();
    test_sections_override_defaults();
    test_rejects_bad_alpha();
    test_rejects_bad_batching();
    test_rejects_negative_ratios();
    test_rejects_bad_jobs_section();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all config tests passed\n";
    return 0;
}
