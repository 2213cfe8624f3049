#include <common/config.hpp>
#include <common/errors.hpp>

#include <yaml-cpp/yaml.h>

namespace sc {
    static bool get_bool(
        const YAML::Node& n, const char* key, bool def) {
        return (n && n[key]) ? n[key].as<bool>() : def;
    }

    static int get_int(
        const YAML::Node& n, const char* key, int def) {
        return (n && n[key]) ? n[key].as<int>() : def;
    }

    static double get_double(
        const YAML::Node& n, const char* key, double def) {
        return (n && n[key]) ? n[key].as<double>() : def;
    }

    static std::string get_str(
        const YAML::Node& n, const char* key, const std::string& def) {
        return (n && n[key]) ? n[key].as<std::string>() : def;
    }

    static DetectorConfig parse_detector_config(const YAML::Node& d) {
        DetectorConfig c;
        if (!d) return c;
        c.param_path = get_str(d, "param_path", c.param_path);
        c.bin_path = get_str(d, "bin_path", c.bin_path);
        c.input_w = get_int(d, "input_w", c.input_w);
        c.input_h = get_int(d, "input_h", c.input_h);
        c.conf = static_cast<float>(get_double(d, "conf", c.conf));
        c.iou = static_cast<float>(get_double(d, "iou", c.iou));
        c.person_class = get_int(d, "person_class", c.person_class);
        c.num_classes = get_int(d, "num_classes", c.num_classes);
        c.ncnn_threads = get_int(d, "ncnn_threads", c.ncnn_threads);
        return c;
    }

    static CropperConfig parse_cropper_config(const YAML::Node& n) {
        CropperConfig c;
        if (!n) return c;
        c.batch_size = get_int(n, "batch_size", c.batch_size);
        c.queue_capacity = get_int(n, "queue_capacity", c.queue_capacity);
        c.padding_ratio = get_double(n, "padding_ratio", c.padding_ratio);
        c.min_crop_ratio = get_double(n, "min_crop_ratio", c.min_crop_ratio);
        c.smooth_alpha = get_double(n, "smooth_alpha", c.smooth_alpha);
        c.keep_aspect = get_bool(n, "keep_aspect", c.keep_aspect);
        c.max_upscale = get_double(n, "max_upscale", c.max_upscale);
        c.draw_timestamp = get_bool(n, "draw_timestamp", c.draw_timestamp);
        c.timestamp_font_scale = get_double(n, "timestamp_font_scale", c.timestamp_font_scale);
        c.timestamp_thickness = get_int(n, "timestamp_thickness", c.timestamp_thickness);
        c.timestamp_margin_px = get_int(n, "timestamp_margin_px", c.timestamp_margin_px);
        c.tmp_dir = get_str(n, "tmp_dir", c.tmp_dir);
        return c;
    }

    static EncoderConfig parse_encoder_config(const YAML::Node& n) {
        EncoderConfig c;
        if (!n) return c;
        c.binary = get_str(n, "binary", c.binary);
        c.video_codec = get_str(n, "video_codec", c.video_codec);
        c.preset = get_str(n, "preset", c.preset);
        c.crf = get_int(n, "crf", c.crf);
        c.audio_codec = get_str(n, "audio_codec", c.audio_codec);
        c.faststart = get_bool(n, "faststart", c.faststart);
        return c;
    }

    static StorageConfig parse_storage_config(const YAML::Node& n) {
        StorageConfig c;
        if (!n) return c;
        c.gs_root = get_str(n, "gs_root", c.gs_root);
        c.output_bucket = get_str(n, "output_bucket", c.output_bucket);
        c.http_timeout_s = get_int(n, "http_timeout_s", c.http_timeout_s);
        return c;
    }

    static JobsConfig parse_jobs_config(const YAML::Node& n) {
        JobsConfig c;
        if (!n) return c;
        c.store_dir = get_str(n, "store_dir", c.store_dir);
        c.retention_days = get_int(n, "retention_days", c.retention_days);
        c.stalled_minutes = get_int(n, "stalled_minutes", c.stalled_minutes);
        c.page_size = get_int(n, "page_size", c.page_size);
        c.dispatch_deadline_s = get_int(n, "dispatch_deadline_s", c.dispatch_deadline_s);
        c.max_attempts = get_int(n, "max_attempts", c.max_attempts);
        return c;
    }

    void validate_config(const AppConfig& cfg) {
        const CropperConfig& c = cfg.cropper;
        if (c.padding_ratio < 0.0 || c.min_crop_ratio < 0.0 || c.max_upscale < 0.0) {
            throw ConfigurationError("[Config] cropper ratios must be non-negative!");
        }
        if (!(c.smooth_alpha > 0.0 && c.smooth_alpha <= 1.0)) {
            throw ConfigurationError("[Config] cropper.smooth_alpha must be in (0, 1]!");
        }
        if (c.batch_size < 1) {
            throw ConfigurationError("[Config] cropper.batch_size must be >= 1!");
        }
        if (c.queue_capacity < 1) {
            throw ConfigurationError("[Config] cropper.queue_capacity must be >= 1!");
        }
        if (cfg.detector.input_w <= 0 || cfg.detector.input_h <= 0) {
            throw ConfigurationError("[Config] detector input size must be positive!");
        }
        if (cfg.jobs.page_size < 1) {
            throw ConfigurationError("[Config] jobs.page_size must be >= 1!");
        }
        if (cfg.jobs.retention_days < 0 || cfg.jobs.stalled_minutes < 0) {
            throw ConfigurationError("[Config] jobs windows must be non-negative!");
        }
        if (cfg.jobs.max_attempts < 1) {
            throw ConfigurationError("[Config] jobs.max_attempts must be >= 1!");
        }
    }

    AppConfig load_config_yaml(const std::string& path) {
        AppConfig cfg;
        YAML::Node root = YAML::LoadFile(path);

        cfg.detector = parse_detector_config(root["detector"]);
        cfg.cropper = parse_cropper_config(root["cropper"]);
        cfg.encoder = parse_encoder_config(root["encoder"]);
        cfg.storage = parse_storage_config(root["storage"]);
        cfg.jobs = parse_jobs_config(root["jobs"]);

        validate_config(cfg);
        return cfg;
    }
}
