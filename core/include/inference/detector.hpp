#pragma once

#include <vector>

#include <opencv2/core.hpp>

#include <pipeline/types.hpp>

namespace sc {
    // Batched subject detector: one call per batch, one box list per input,
    // restricted to the class of interest.
    class IDetector {
    public:
        virtual ~IDetector() = default;
        virtual std::vector<std::vector<Box>> detect_batch(const std::vector<cv::Mat>& frames) = 0;
    };
}
