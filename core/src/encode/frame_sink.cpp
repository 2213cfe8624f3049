#include <encode/frame_sink.hpp>
#include <encode/subprocess.hpp>
#include <common/errors.hpp>

#include <iostream>
#include <sstream>

namespace sc {
    std::vector<std::string> build_encode_command(const EncoderConfig& cfg,
                                                  const StreamInfo& info,
                                                  const std::string& audio_source,
                                                  const std::string& output_path) {
        std::ostringstream fps;
        fps.precision(10);
        fps << info.fps;

        std::vector<std::string> cmd = {
            cfg.binary, "-y", "-hide_banner", "-loglevel", "error",
            "-f", "rawvideo", "-vcodec", "rawvideo",
            "-s", std::to_string(info.width) + "x" + std::to_string(info.height),
            "-pix_fmt", "bgr24",
            "-r", fps.str(),
            "-i", "pipe:0",
            "-i", audio_source,
            "-map", "0:v:0",
            "-map", "1:a?",
            "-c:v", cfg.video_codec,
            "-preset", cfg.preset,
            "-crf", std::to_string(cfg.crf),
        };
        if (cfg.faststart) {
            cmd.push_back("-movflags");
            cmd.push_back("+faststart");
        }
        cmd.push_back("-c:a");
        cmd.push_back(cfg.audio_codec);
        cmd.push_back("-shortest");
        cmd.push_back(output_path);
        return cmd;
    }

    EncoderSink::EncoderSink(std::vector<std::string> argv, const StreamInfo& info, const std::string& scratch_dir)
        : info_(info),
          program_(argv.empty() ? std::string() : argv.front()) {
        proc_ = std::make_unique<Subprocess>(argv, scratch_dir);
        std::cout << "[Encoder](start) " << program_ << " " << info_.width << "x" << info_.height
                  << " @ " << info_.fps << " fps\n";
    }

    EncoderSink::~EncoderSink() {
        if (proc_ && proc_->running()) abort();
    }

    void EncoderSink::write(const cv::Mat& frame) {
        if (frame.cols != info_.width || frame.rows != info_.height || frame.type() != CV_8UC3) {
            throw EncodeError("frame " + std::to_string(frames_written_) + " is " +
                              std::to_string(frame.cols) + "x" + std::to_string(frame.rows) +
                              ", encoder expects " + std::to_string(info_.width) + "x" +
                              std::to_string(info_.height) + " bgr24");
        }

        if (frame.isContinuous()) {
            proc_->write_all(frame.data, frame.total() * frame.elemSize());
        } else {
            const size_t row_bytes = static_cast<size_t>(frame.cols) * frame.elemSize();
            for (int r = 0; r < frame.rows; ++r) proc_->write_all(frame.ptr(r), row_bytes);
        }
        ++frames_written_;
    }

    void EncoderSink::finish() {
        proc_->close_stdin();
        const int code = proc_->wait();
        std::cout << "[Encoder](finish) " << program_ << " exited with " << code
                  << " after " << frames_written_ << " frames\n";
        if (code != 0) {
            throw EncodeError(program_ + " encode failed (exit " + std::to_string(code) + "): " +
                              proc_->diagnostic_tail(kDiagnosticTail));
        }
    }

    void EncoderSink::abort() {
        if (!proc_ || !proc_->running()) return;
        std::cerr << "[Encoder](abort) terminating " << program_ << "\n";
        proc_->kill();
    }
}
