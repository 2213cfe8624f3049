#include <inference/yolo_detector.hpp>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <ncnn/allocator.h>
#include <ncnn/net.h>

namespace sc {
    namespace {
        float area_of(const Box& b) {
            return std::max(0.0f, b.x2 - b.x1) * std::max(0.0f, b.y2 - b.y1);
        }

        float iou_of(const Box& a, const Box& b) {
            const float xx1 = std::max(a.x1, b.x1);
            const float yy1 = std::max(a.y1, b.y1);
            const float xx2 = std::min(a.x2, b.x2);
            const float yy2 = std::min(a.y2, b.y2);

            const float iw = std::max(0.0f, xx2 - xx1);
            const float ih = std::max(0.0f, yy2 - yy1);
            const float inter = iw * ih;
            if (inter <= 0.0f) return 0.0f;

            const float uni = area_of(a) + area_of(b) - inter;
            if (uni <= 0.0f) return 0.0f;
            return inter / uni;
        }

        std::string resolve_path_or_throw(const std::string& p) {
            namespace fs = std::filesystem;
            if (fs::exists(fs::path(p))) return p;
            const fs::path alt = fs::path("../../../") / p;
            if (fs::exists(alt)) return alt.string();
            throw std::runtime_error("Model path not found: " + p);
        }
    } // namespace

    class YoloDetector::Impl {
    public:
        explicit Impl(const DetectorConfig& cfg) {
            net_.opt.use_vulkan_compute = false;
            net_.opt.num_threads = std::max(1, cfg.ncnn_threads);
            workspace_pool_allocator_.set_size_compare_ratio(0.0f);

            const std::string param = resolve_path_or_throw(cfg.param_path);
            const std::string bin = resolve_path_or_throw(cfg.bin_path);

            if (net_.load_param(param.c_str()) != 0) {
                throw std::runtime_error("Failed to load YOLO param: " + param);
            }
            if (net_.load_model(bin.c_str()) != 0) {
                throw std::runtime_error("Failed to load YOLO weights: " + bin);
            }
        }

        std::vector<Box> detect(const cv::Mat& bgr, const DetectorConfig& cfg) const {
            if (bgr.empty()) return {};

            // letterbox into the model input, keeping aspect
            const float scale = std::min(static_cast<float>(cfg.input_w) / static_cast<float>(bgr.cols),
                                         static_cast<float>(cfg.input_h) / static_cast<float>(bgr.rows));
            const int scaled_w = std::max(1, static_cast<int>(std::round(bgr.cols * scale)));
            const int scaled_h = std::max(1, static_cast<int>(std::round(bgr.rows * scale)));
            const int pad_left = (cfg.input_w - scaled_w) / 2;
            const int pad_top = (cfg.input_h - scaled_h) / 2;

            ncnn::Mat resized = ncnn::Mat::from_pixels_resize(
                bgr.data,
                ncnn::Mat::PIXEL_BGR2RGB,
                bgr.cols,
                bgr.rows,
                static_cast<int>(bgr.step[0]),
                scaled_w,
                scaled_h);

            ncnn::Mat in;
            ncnn::copy_make_border(resized, in,
                                   pad_top, cfg.input_h - scaled_h - pad_top,
                                   pad_left, cfg.input_w - scaled_w - pad_left,
                                   ncnn::BORDER_CONSTANT, 114.0f);

            static const float kNorm[3] = {1.0f / 255.0f, 1.0f / 255.0f, 1.0f / 255.0f};
            in.substract_mean_normalize(nullptr, kNorm);

            ncnn::Extractor ex = net_.create_extractor();
            ex.set_light_mode(true);
            thread_local ncnn::UnlockedPoolAllocator blob_pool_allocator;
            thread_local bool blob_pool_initialized = false;
            if (!blob_pool_initialized) {
                blob_pool_allocator.set_size_compare_ratio(0.0f);
                blob_pool_initialized = true;
            }
            ex.set_blob_allocator(&blob_pool_allocator);
            ex.set_workspace_allocator(&workspace_pool_allocator_);
            if (ex.input("in0", in) != 0) {
                throw std::runtime_error("YOLO input blob rejected");
            }

            // out0: (4 + num_classes) rows x num_anchors cols, boxes as cx,cy,w,h
            ncnn::Mat out;
            if (ex.extract("out0", out) != 0) {
                throw std::runtime_error("YOLO output blob missing");
            }
            if (out.h < 4 + cfg.num_classes || cfg.person_class < 0 || cfg.person_class >= cfg.num_classes) {
                throw std::runtime_error("YOLO output shape does not match num_classes");
            }

            const int num_anchors = out.w;
            const float* cx_row = out.row(0);
            const float* cy_row = out.row(1);
            const float* w_row = out.row(2);
            const float* h_row = out.row(3);
            const float* cls_row = out.row(4 + cfg.person_class);

            std::vector<Box> candidates;
            candidates.reserve(256);

            for (int i = 0; i < num_anchors; ++i) {
                const float score = cls_row[i];
                if (score < cfg.conf) continue;

                const float x1 = (cx_row[i] - w_row[i] * 0.5f - pad_left) / scale;
                const float y1 = (cy_row[i] - h_row[i] * 0.5f - pad_top) / scale;
                const float x2 = (cx_row[i] + w_row[i] * 0.5f - pad_left) / scale;
                const float y2 = (cy_row[i] + h_row[i] * 0.5f - pad_top) / scale;

                Box b;
                b.x1 = std::clamp(x1, 0.0f, static_cast<float>(bgr.cols));
                b.y1 = std::clamp(y1, 0.0f, static_cast<float>(bgr.rows));
                b.x2 = std::clamp(x2, 0.0f, static_cast<float>(bgr.cols));
                b.y2 = std::clamp(y2, 0.0f, static_cast<float>(bgr.rows));
                if (b.x2 <= b.x1 || b.y2 <= b.y1) continue;
                b.score = score;
                b.label = cfg.person_class;
                candidates.push_back(b);
            }

            std::sort(candidates.begin(),
                      candidates.end(),
                      [](const Box& a, const Box& b) { return a.score > b.score; });

            std::vector<Box> kept;
            kept.reserve(candidates.size());
            for (const Box& cand : candidates) {
                bool keep = true;
                for (const Box& k : kept) {
                    if (iou_of(cand, k) > cfg.iou) {
                        keep = false;
                        break;
                    }
                }
                if (keep) kept.push_back(cand);
            }
            return kept;
        }

    private:
        ncnn::Net net_;
        mutable ncnn::PoolAllocator workspace_pool_allocator_;
    };

    YoloDetector::YoloDetector(DetectorConfig cfg)
        : cfg_(std::move(cfg)) {}

    YoloDetector::~YoloDetector() = default;

    const YoloDetector::Impl& YoloDetector::impl_() {
        std::lock_guard lk(load_mtx_);
        if (!impl_ptr_) {
            std::cout << "[Detector](load) loading_model param=" << cfg_.param_path << "\n";
            impl_ptr_ = std::make_unique<Impl>(cfg_);
        }
        return *impl_ptr_;
    }

    std::vector<std::vector<Box>> YoloDetector::detect_batch(const std::vector<cv::Mat>& frames) {
        const Impl& impl = impl_();
        std::vector<std::vector<Box>> out;
        out.reserve(frames.size());
        for (const auto& f : frames) {
            out.push_back(impl.detect(f, cfg_));
        }
        return out;
    }
}
