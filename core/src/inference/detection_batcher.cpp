#include <inference/detection_batcher.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace sc {
    DetectionResult union_box(const std::vector<Box>& boxes) {
        if (boxes.empty()) return std::nullopt;

        Box u = boxes.front();
        for (const auto& b : boxes) {
            u.x1 = std::min(u.x1, b.x1);
            u.y1 = std::min(u.y1, b.y1);
            u.x2 = std::max(u.x2, b.x2);
            u.y2 = std::max(u.y2, b.y2);
            u.score = std::max(u.score, b.score);
        }
        return u;
    }

    DetectionBatcher::DetectionBatcher(IDetector& detector, int batch_size)
        : detector_(detector),
          batch_size_(std::max(1, batch_size)) {}

    std::vector<DetectionResult> DetectionBatcher::detect(const FrameBatch& batch) {
        if (batch.empty()) return {};
        if (static_cast<int>(batch.size()) > batch_size_) {
            throw std::invalid_argument("batch of " + std::to_string(batch.size()) +
                                        " frames exceeds batch_size " + std::to_string(batch_size_));
        }

        std::vector<cv::Mat> frames;
        frames.reserve(batch.size());
        for (const auto& f : batch) frames.push_back(f.bgr);

        const auto per_frame = detector_.detect_batch(frames);
        if (per_frame.size() != batch.size()) {
            throw std::runtime_error("detector returned " + std::to_string(per_frame.size()) +
                                     " results for " + std::to_string(batch.size()) + " frames");
        }

        std::vector<DetectionResult> out;
        out.reserve(per_frame.size());
        for (const auto& boxes : per_frame) out.push_back(union_box(boxes));
        return out;
    }
}
