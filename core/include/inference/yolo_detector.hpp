#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include <opencv2/core.hpp>

#include <common/config.hpp>
#include <inference/detector.hpp>

namespace sc {
    // YOLOv8-style person detector on ncnn. The network is loaded on the
    // first batch and reused, read-only, for every later call.
    class YoloDetector : public IDetector {
    public:
        explicit YoloDetector(DetectorConfig cfg);
        ~YoloDetector() override;

        YoloDetector(const YoloDetector&) = delete;
        YoloDetector& operator=(const YoloDetector&) = delete;

        std::vector<std::vector<Box>> detect_batch(const std::vector<cv::Mat>& frames) override;

    private:
        class Impl;
        const Impl& impl_();

        DetectorConfig cfg_;
        std::mutex load_mtx_;
        std::unique_ptr<Impl> impl_ptr_;
    };
}
