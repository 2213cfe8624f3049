#pragma once

#include <optional>

#include <common/config.hpp>
#include <pipeline/types.hpp>

namespace sc {
    // Exponential moving average over crop windows:
    //   s_n = alpha * s_{n-1} + (1 - alpha) * x_n
    // The first window becomes the initial state unchanged.
    class CropSmoother {
    public:
        explicit CropSmoother(double alpha);

        WindowF update(const WindowF& w);
        const std::optional<WindowF>& state() const { return prev_; }

    private:
        double alpha_;
        std::optional<WindowF> prev_;
    };

    // x1,y1 in [0, dim-1]; x2,y2 at least one pixel past them and within the frame.
    WindowI clamp_window(WindowI win, int w, int h);

    // Padding, minimum area and aspect correction for one detection.
    // No detection means the full frame.
    WindowI compute_raw_window(const DetectionResult& det, int w, int h, const CropperConfig& cfg);

    // Per-job crop state. Built fresh for every job so nothing carries over
    // from a previous video.
    class CropWindowEngine {
    public:
        CropWindowEngine(const CropperConfig& cfg, CropSmoother smoother);

        WindowI next(const DetectionResult& det, int w, int h);

        const CropSmoother& smoother() const { return smoother_; }

    private:
        const CropperConfig& cfg_;
        CropSmoother smoother_;
    };
}
