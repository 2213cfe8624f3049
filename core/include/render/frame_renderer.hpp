#pragma once

#include <cstdint>
#include <string>

#include <opencv2/core.hpp>

#include <common/config.hpp>
#include <pipeline/types.hpp>

namespace sc {
    // "HH:MM:SS.mmm" for frame `index` at `fps`.
    std::string format_timestamp(int64_t index, double fps);

    // Crops to `crop`, scales uniformly (at most `max_upscale`) and centers the
    // result on a black out_w x out_h canvas. A crop with no overlap with the
    // frame returns the frame unchanged.
    cv::Mat crop_and_letterbox(const cv::Mat& frame,
                               const WindowI& crop,
                               int out_w,
                               int out_h,
                               double max_upscale);

    class FrameRenderer {
    public:
        FrameRenderer(const CropperConfig& cfg, int out_w, int out_h, double fps);

        cv::Mat render(const Frame& frame, const WindowI& crop) const;

        // Background box of the label, top-right; depends only on text
        // metrics, the margin and the canvas width.
        cv::Rect timestamp_rect(const std::string& label) const;
        void draw_timestamp(cv::Mat& canvas, int64_t index) const;

    private:
        const CropperConfig& cfg_;
        int out_w_;
        int out_h_;
        double fps_;
    };
}
