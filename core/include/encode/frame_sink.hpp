#pragma once

#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include <common/config.hpp>
#include <pipeline/types.hpp>

namespace sc {
    class Subprocess;

    // Destination of rendered frames, written strictly in frame order.
    class IFrameSink {
    public:
        virtual ~IFrameSink() = default;
        virtual void write(const cv::Mat& frame) = 0;
        // Normal completion; throws EncodeError on a failed finish.
        virtual void finish() = 0;
        // Failure path: stop without producing output.
        virtual void abort() = 0;
    };

    // ffmpeg argv: raw bgr24 frames on stdin, `audio_source` as second
    // input for an optional audio track, muxed into `output_path`.
    std::vector<std::string> build_encode_command(const EncoderConfig& cfg,
                                                  const StreamInfo& info,
                                                  const std::string& audio_source,
                                                  const std::string& output_path);

    class EncoderSink : public IFrameSink {
    public:
        static constexpr size_t kDiagnosticTail = 800;

        // Spawns the encoder immediately.
        EncoderSink(std::vector<std::string> argv, const StreamInfo& info, const std::string& scratch_dir);
        ~EncoderSink() override;

        void write(const cv::Mat& frame) override;
        void finish() override;
        void abort() override;

        int64_t frames_written() const { return frames_written_; }

    private:
        std::unique_ptr<Subprocess> proc_;
        StreamInfo info_;
        std::string program_;
        int64_t frames_written_ = 0;
    };
}
