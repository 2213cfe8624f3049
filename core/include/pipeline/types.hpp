#pragma once

#include <opencv2/core.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sc {
    // Detector output box in frame pixel coordinates (x1,y1,x2,y2).
    struct Box {
        float x1 = 0.0f;
        float y1 = 0.0f;
        float x2 = 0.0f;
        float y2 = 0.0f;
        float score = 0.0f;
        int label = -1;
    };

    // Union of all subject boxes in one frame, absent when nothing was found.
    using DetectionResult = std::optional<Box>;

    // Crop rectangle; floating point while smoothing, integral once clamped.
    template <class T>
    struct Window {
        T x1 = 0;
        T y1 = 0;
        T x2 = 0;
        T y2 = 0;

        T width() const { return x2 - x1; }
        T height() const { return y2 - y1; }
    };

    using WindowF = Window<double>;
    using WindowI = Window<int>;

    struct StreamInfo {
        double fps = 0.0;
        int width = 0;
        int height = 0;
        int64_t frame_count = 0; // 0 when unknown
    };

    struct Frame {
        int64_t index = 0;
        cv::Mat bgr; // width x height, CV_8UC3
    };

    using FrameBatch = std::vector<Frame>;
}
