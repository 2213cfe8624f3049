#include <cropping/crop_window.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace sc {
    namespace {
        // Places a span of `len` centered on `center` inside [0, limit],
        // sliding it back in rather than cutting it when it sticks out.
        void place_span(double center, double len, int limit, int& lo, int& hi) {
            len = std::min(len, static_cast<double>(limit));
            double a = center - len / 2.0;
            double b = center + len / 2.0;
            if (a < 0.0) {
                b -= a;
                a = 0.0;
            }
            if (b > limit) {
                a -= (b - limit);
                b = limit;
            }
            lo = std::max(0, static_cast<int>(std::floor(a)));
            hi = std::min(limit, static_cast<int>(std::ceil(b)));
        }
    } // namespace

    CropSmoother::CropSmoother(double alpha) : alpha_(alpha) {
        if (!(alpha_ > 0.0 && alpha_ <= 1.0)) {
            throw std::invalid_argument("smooth_alpha must be in (0, 1]");
        }
    }

    WindowF CropSmoother::update(const WindowF& w) {
        if (!prev_) {
            prev_ = w;
            return w;
        }
        // p + (1-a)(x-p) == a*p + (1-a)*x, exact when x == p
        const double k = 1.0 - alpha_;
        WindowF s;
        s.x1 = prev_->x1 + k * (w.x1 - prev_->x1);
        s.y1 = prev_->y1 + k * (w.y1 - prev_->y1);
        s.x2 = prev_->x2 + k * (w.x2 - prev_->x2);
        s.y2 = prev_->y2 + k * (w.y2 - prev_->y2);
        prev_ = s;
        return s;
    }

    WindowI clamp_window(WindowI win, int w, int h) {
        win.x1 = std::clamp(win.x1, 0, std::max(0, w - 1));
        win.y1 = std::clamp(win.y1, 0, std::max(0, h - 1));
        win.x2 = std::max(win.x1 + 1, std::min(w, win.x2));
        win.y2 = std::max(win.y1 + 1, std::min(h, win.y2));
        return win;
    }

    WindowI compute_raw_window(const DetectionResult& det, int w, int h, const CropperConfig& cfg) {
        if (!det) return WindowI{0, 0, w, h};

        int x1 = std::clamp(static_cast<int>(std::floor(det->x1)), 0, w);
        int y1 = std::clamp(static_cast<int>(std::floor(det->y1)), 0, h);
        int x2 = std::clamp(static_cast<int>(std::floor(det->x2)), x1, w);
        int y2 = std::clamp(static_cast<int>(std::floor(det->y2)), y1, h);

        // padding relative to the box itself
        const int bw = std::max(1, x2 - x1);
        const int bh = std::max(1, y2 - y1);
        const int pad_x = static_cast<int>(cfg.padding_ratio * bw);
        const int pad_y = static_cast<int>(cfg.padding_ratio * bh);

        x1 = std::max(0, x1 - pad_x);
        y1 = std::max(0, y1 - pad_y);
        x2 = std::min(w, x2 + pad_x);
        y2 = std::min(h, y2 + pad_y);

        // minimum area: grow to a square around the padded center
        const double min_area = cfg.min_crop_ratio * static_cast<double>(w) * static_cast<double>(h);
        const double cur_area = std::max(1.0, static_cast<double>(x2 - x1) * static_cast<double>(y2 - y1));
        if (cur_area < min_area) {
            const double cx = (x1 + x2) / 2.0;
            const double cy = (y1 + y2) / 2.0;
            double tw = std::sqrt(min_area);
            double th = tw;
            if (th > h) {
                th = h;
                tw = min_area / h;
            }
            if (tw > w) {
                tw = w;
                th = std::min(static_cast<double>(h), min_area / w);
            }
            place_span(cx, tw, w, x1, x2);
            place_span(cy, th, h, y1, y2);
        }

        // aspect: grow one axis until it matches the frame
        if (cfg.keep_aspect) {
            const double target_aspect = static_cast<double>(w) / static_cast<double>(h);
            const int cw = std::max(1, x2 - x1);
            const int ch = std::max(1, y2 - y1);
            const double cur_aspect = static_cast<double>(cw) / static_cast<double>(ch);
            const double cx = (x1 + x2) / 2.0;
            const double cy = (y1 + y2) / 2.0;

            if (cur_aspect > target_aspect) {
                const double new_h = std::round(cw / target_aspect);
                place_span(cy, new_h, h, y1, y2);
            } else if (cur_aspect < target_aspect) {
                const double new_w = std::round(ch * target_aspect);
                place_span(cx, new_w, w, x1, x2);
            }
        }

        return clamp_window(WindowI{x1, y1, x2, y2}, w, h);
    }

    CropWindowEngine::CropWindowEngine(const CropperConfig& cfg, CropSmoother smoother)
        : cfg_(cfg),
          smoother_(std::move(smoother)) {}

    WindowI CropWindowEngine::next(const DetectionResult& det, int w, int h) {
        const WindowI raw = compute_raw_window(det, w, h, cfg_);
        const WindowF s = smoother_.update(WindowF{
            static_cast<double>(raw.x1), static_cast<double>(raw.y1),
            static_cast<double>(raw.x2), static_cast<double>(raw.y2)});

        // smoothing can nudge the window slightly out of the frame
        return clamp_window(WindowI{static_cast<int>(std::lround(s.x1)),
                                    static_cast<int>(std::lround(s.y1)),
                                    static_cast<int>(std::lround(s.x2)),
                                    static_cast<int>(std::lround(s.y2))},
                            w, h);
    }
}
