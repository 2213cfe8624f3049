#pragma once

#include <string>

namespace sc {
    struct DetectorConfig {
        std::string param_path = "models/detector/yolov8n.ncnn.param";
        std::string bin_path = "models/detector/yolov8n.ncnn.bin";
        int input_w = 640;
        int input_h = 640;
        float conf = 0.25f;
        float iou = 0.5f;
        int person_class = 0;
        int num_classes = 80;
        int ncnn_threads = 2;
    };

    struct CropperConfig {
        // detection batching
        int batch_size = 8;
        int queue_capacity = 4; // in batches

        // crop behavior
        double padding_ratio = 0.12;  // relative to the union box size
        double min_crop_ratio = 0.35; // of the full frame area
        double smooth_alpha = 0.85;   // higher = steadier
        bool keep_aspect = true;
        double max_upscale = 1.0;

        // timestamp overlay
        bool draw_timestamp = true;
        double timestamp_font_scale = 0.8;
        int timestamp_thickness = 2;
        int timestamp_margin_px = 12;

        std::string tmp_dir = "/tmp";
    };

    struct EncoderConfig {
        std::string binary = "ffmpeg";
        std::string video_codec = "libx264";
        std::string preset = "fast";
        int crf = 23;
        std::string audio_codec = "aac";
        bool faststart = true;
    };

    struct StorageConfig {
        std::string gs_root = "/mnt/buckets"; // gs://<bucket>/<blob> -> <gs_root>/<bucket>/<blob>
        std::string output_bucket;           // required for http(s) inputs
        int http_timeout_s = 600;
    };

    struct JobsConfig {
        std::string store_dir = "jobs";
        int retention_days = 14;
        int stalled_minutes = 0; // 0 disables the stall scan
        int page_size = 500;
        int dispatch_deadline_s = 1800;
        int max_attempts = 3;
    };

    struct AppConfig {
        DetectorConfig detector;
        CropperConfig cropper;
        EncoderConfig encoder;
        StorageConfig storage;
        JobsConfig jobs;
    };

    void validate_config(const AppConfig& cfg);

    AppConfig load_config_yaml(const std::string& path);
}
