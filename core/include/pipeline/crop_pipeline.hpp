#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <variant>

#include <common/config.hpp>
#include <encode/frame_sink.hpp>
#include <inference/detector.hpp>
#include <ingest/frame_source.hpp>
#include <pipeline/bounded_queue.hpp>
#include <pipeline/types.hpp>

namespace sc {
    // Producer -> consumer channel protocol: frames, a clean end, or a
    // decoder failure forwarded as a message.
    struct EndOfStream {};
    struct StreamFailure {
        enum class Kind {
            Processing, // a ProcessingError raised by the source
            Unexpected  // anything else
        };
        Kind kind = Kind::Processing;
        std::string message;
    };
    using BatchMessage = std::variant<FrameBatch, EndOfStream, StreamFailure>;

    struct PipelineStats {
        int64_t frames = 0;
        int64_t batches = 0;
        int64_t frames_with_subject = 0;
    };

    // One decode thread feeding batches through a bounded queue to the
    // calling thread, which detects, crops, renders and encodes in order.
    // A pipeline holds no per-job state; one job runs at a time.
    class CropPipeline {
    public:
        using SinkFactory = std::function<std::unique_ptr<IFrameSink>(const StreamInfo&)>;

        CropPipeline(const CropperConfig& cfg, IDetector& detector);

        PipelineStats run(IFrameSource& source, const SinkFactory& make_sink);

        // Local file in, encoded file out; the input also supplies audio.
        PipelineStats process_file(const std::string& in_path,
                                   const std::string& out_path,
                                   const EncoderConfig& enc,
                                   const std::string& scratch_dir);

    private:
        void produce_(IFrameSource& source, BoundedQueue<BatchMessage>& channel, const std::atomic<bool>& stop) const;

        const CropperConfig& cfg_;
        IDetector& detector_;
    };
}
