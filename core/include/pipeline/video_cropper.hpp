#pragma once

#include <string>

#include <common/config.hpp>
#include <inference/detector.hpp>
#include <pipeline/crop_pipeline.hpp>
#include <storage/object_store.hpp>

namespace sc {
    struct CropResult {
        std::string input_uri;
        std::string output_uri;
        PipelineStats stats;
    };

    // Runs one input URI end to end: scratch dir, download, crop, upload.
    class IJobRunner {
    public:
        virtual ~IJobRunner() = default;
        virtual CropResult run(const std::string& input_uri) = 0;
    };

    class VideoCropper : public IJobRunner {
    public:
        // The detector is built once by the caller and shared across jobs.
        VideoCropper(const AppConfig& cfg, IDetector& detector, const ObjectStore& store);

        CropResult run(const std::string& input_uri) override;

    private:
        const AppConfig& cfg_;
        const ObjectStore& store_;
        CropPipeline pipeline_;
    };
}
