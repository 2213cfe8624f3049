#pragma once

#include <vector>

#include <inference/detector.hpp>
#include <pipeline/types.hpp>

namespace sc {
    // Smallest rectangle enclosing every box, or none for an empty set.
    DetectionResult union_box(const std::vector<Box>& boxes);

    class DetectionBatcher {
    public:
        DetectionBatcher(IDetector& detector, int batch_size);

        // One detector call for the whole batch; results keep frame order.
        std::vector<DetectionResult> detect(const FrameBatch& batch);

    private:
        IDetector& detector_;
        int batch_size_;
    };
}
