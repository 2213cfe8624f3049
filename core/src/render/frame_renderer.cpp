#include <render/frame_renderer.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>

#include <opencv2/imgproc.hpp>

namespace sc {
    namespace {
        constexpr int kFont = cv::FONT_HERSHEY_SIMPLEX;
        constexpr int kLabelPad = 6;
    } // namespace

    std::string format_timestamp(int64_t index, double fps) {
        if (fps <= 0.0) fps = 30.0;
        const auto total_ms = static_cast<int64_t>(
            std::floor(static_cast<double>(index) * 1000.0 / fps + 1e-6));

        const int64_t hh = total_ms / 3600000;
        const int64_t mm = (total_ms / 60000) % 60;
        const int64_t ss = (total_ms / 1000) % 60;
        const int64_t ms = total_ms % 1000;

        char buf[32];
        std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld.%03lld",
                      static_cast<long long>(hh), static_cast<long long>(mm),
                      static_cast<long long>(ss), static_cast<long long>(ms));
        return buf;
    }

    cv::Mat crop_and_letterbox(const cv::Mat& frame,
                               const WindowI& crop,
                               int out_w,
                               int out_h,
                               double max_upscale) {
        const cv::Rect roi = cv::Rect(crop.x1, crop.y1, crop.width(), crop.height()) &
                             cv::Rect(0, 0, frame.cols, frame.rows);
        if (roi.area() <= 0 || out_w <= 0 || out_h <= 0) return frame;

        const cv::Mat cropped = frame(roi);

        double s = std::min(double(out_w) / double(cropped.cols),
                            double(out_h) / double(cropped.rows));
        if (max_upscale > 0.0) s = std::min(s, max_upscale);

        const int new_w = std::clamp(int(cropped.cols * s), 1, out_w);
        const int new_h = std::clamp(int(cropped.rows * s), 1, out_h);

        cv::Mat resized;
        if (new_w == cropped.cols && new_h == cropped.rows) {
            resized = cropped;
        } else {
            cv::resize(cropped, resized, {new_w, new_h}, 0, 0, cv::INTER_LINEAR);
        }

        cv::Mat out(out_h, out_w, frame.type(), cv::Scalar::all(0));
        const int x = (out_w - new_w) / 2;
        const int y = (out_h - new_h) / 2;
        resized.copyTo(out(cv::Rect(x, y, new_w, new_h)));
        return out;
    }

    FrameRenderer::FrameRenderer(const CropperConfig& cfg, int out_w, int out_h, double fps)
        : cfg_(cfg),
          out_w_(out_w),
          out_h_(out_h),
          fps_(fps) {}

    cv::Mat FrameRenderer::render(const Frame& frame, const WindowI& crop) const {
        cv::Mat out = crop_and_letterbox(frame.bgr, crop, out_w_, out_h_, cfg_.max_upscale);
        if (cfg_.draw_timestamp) {
            // the degenerate fallback hands back the source frame itself
            if (out.data == frame.bgr.data) out = out.clone();
            draw_timestamp(out, frame.index);
        }
        return out;
    }

    cv::Rect FrameRenderer::timestamp_rect(const std::string& label) const {
        int baseline = 0;
        const cv::Size ts = cv::getTextSize(label, kFont, cfg_.timestamp_font_scale,
                                            cfg_.timestamp_thickness, &baseline);
        const int margin = cfg_.timestamp_margin_px;
        const int x = std::max(margin, out_w_ - margin - ts.width);
        const int y = margin + ts.height;

        return cv::Rect(cv::Point(x - kLabelPad, y - ts.height - kLabelPad),
                        cv::Point(x + ts.width + kLabelPad, y + baseline + kLabelPad));
    }

    void FrameRenderer::draw_timestamp(cv::Mat& canvas, int64_t index) const {
        const std::string label = format_timestamp(index, fps_);
        const cv::Rect bg = timestamp_rect(label);

        cv::rectangle(canvas, bg, cv::Scalar(0, 0, 0), cv::FILLED);

        int baseline = 0;
        const cv::Size ts = cv::getTextSize(label, kFont, cfg_.timestamp_font_scale,
                                            cfg_.timestamp_thickness, &baseline);
        const cv::Point origin(bg.x + kLabelPad, bg.y + kLabelPad + ts.height);
        cv::putText(canvas, label, origin, kFont, cfg_.timestamp_font_scale,
                    cv::Scalar(255, 255, 255), cfg_.timestamp_thickness, cv::LINE_AA);
    }
}
