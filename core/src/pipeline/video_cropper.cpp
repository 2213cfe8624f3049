#include <pipeline/video_cropper.hpp>

#include <chrono>
#include <iostream>

#include <common/scratch_dir.hpp>

namespace sc {
    VideoCropper::VideoCropper(const AppConfig& cfg, IDetector& detector, const ObjectStore& store)
        : cfg_(cfg),
          store_(store),
          pipeline_(cfg_.cropper, detector) {}

    CropResult VideoCropper::run(const std::string& input_uri) {
        CropResult result;
        result.input_uri = input_uri;
        result.output_uri = store_.output_uri_for(input_uri);

        std::cout << "[Cropper](run) run_start input_uri=" << input_uri
                  << " output_uri=" << result.output_uri << "\n";
        const auto t0 = std::chrono::steady_clock::now();

        ScratchDir tmp(cfg_.cropper.tmp_dir, "video-crop-");
        const std::string in_path = tmp.file("input.mp4");
        const std::string out_path = tmp.file("output.mp4");

        store_.download(input_uri, in_path);
        result.stats = pipeline_.process_file(in_path, out_path, cfg_.encoder, tmp.path());
        store_.upload(out_path, result.output_uri);

        const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
        std::cout << "[Cropper](run) run_complete output_uri=" << result.output_uri
                  << " elapsed_s=" << elapsed << "\n";
        return result;
    }
}
