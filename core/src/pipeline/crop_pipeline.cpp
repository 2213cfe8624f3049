#include <pipeline/crop_pipeline.hpp>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <utility>

#include <common/errors.hpp>
#include <cropping/crop_window.hpp>
#include <inference/detection_batcher.hpp>
#include <render/frame_renderer.hpp>

namespace sc {
    namespace {
        constexpr int64_t kLogEveryFrames = 64;

        template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
        template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;
    } // namespace

    CropPipeline::CropPipeline(const CropperConfig& cfg, IDetector& detector)
        : cfg_(cfg),
          detector_(detector) {}

    void CropPipeline::produce_(IFrameSource& source,
                                BoundedQueue<BatchMessage>& channel,
                                const std::atomic<bool>& stop) const {
        const size_t batch_size = static_cast<size_t>(std::max(1, cfg_.batch_size));
        try {
            FrameBatch buf;
            buf.reserve(batch_size);
            Frame f;
            while (!stop.load(std::memory_order_relaxed) && source.read(f)) {
                buf.push_back(std::move(f));
                f = Frame{};
                if (buf.size() >= batch_size) {
                    if (!channel.push(std::move(buf))) return;
                    buf = FrameBatch{};
                    buf.reserve(batch_size);
                }
            }
            if (stop.load(std::memory_order_relaxed)) return;
            if (!buf.empty() && !channel.push(std::move(buf))) return;
            channel.push(EndOfStream{});
        } catch (const ProcessingError& e) {
            channel.push(StreamFailure{StreamFailure::Kind::Processing, e.what()});
        } catch (const std::exception& e) {
            channel.push(StreamFailure{StreamFailure::Kind::Unexpected, e.what()});
        } catch (...) {
            channel.push(StreamFailure{StreamFailure::Kind::Unexpected, "unknown decoder failure"});
        }
    }

    PipelineStats CropPipeline::run(IFrameSource& source, const SinkFactory& make_sink) {
        source.open();
        const StreamInfo info = source.info();
        std::cout << "[Pipeline](run) video_info fps=" << info.fps
                  << " w=" << info.width << " h=" << info.height
                  << " frames=" << info.frame_count << "\n";

        std::unique_ptr<IFrameSink> sink;
        try {
            sink = make_sink(info);
        } catch (...) {
            source.close();
            throw;
        }

        // per-job state, never shared with a previous run
        CropWindowEngine engine(cfg_, CropSmoother(cfg_.smooth_alpha));
        DetectionBatcher batcher(detector_, cfg_.batch_size);
        FrameRenderer renderer(cfg_, info.width, info.height, info.fps);

        BoundedQueue<BatchMessage> channel(static_cast<size_t>(std::max(1, cfg_.queue_capacity)));
        std::atomic<bool> stop{false};
        std::thread producer([this, &source, &channel, &stop] { produce_(source, channel, stop); });

        auto shutdown_producer = [&] {
            stop = true;
            channel.stop();
            if (producer.joinable()) {
                producer.join();
                std::cout << "[Pipeline](run) producer joined\n";
            }
            source.close();
        };

        PipelineStats stats;
        int64_t last_logged = 0;
        try {
            bool done = false;
            while (!done) {
                BatchMessage msg;
                if (!channel.pop(msg)) {
                    throw DecodeError("frame channel closed before end of stream");
                }

                std::visit(overloaded{
                    [&](FrameBatch& batch) {
                        const auto dets = batcher.detect(batch);
                        for (size_t i = 0; i < batch.size(); ++i) {
                            const Frame& frame = batch[i];
                            if (frame.index != stats.frames) {
                                throw DecodeError("frame " + std::to_string(frame.index) +
                                                  " arrived out of order, expected " +
                                                  std::to_string(stats.frames));
                            }
                            if (dets[i]) ++stats.frames_with_subject;

                            const WindowI crop = engine.next(dets[i], info.width, info.height);
                            sink->write(renderer.render(frame, crop));
                            ++stats.frames;
                        }
                        ++stats.batches;

                        if (stats.frames - last_logged >= kLogEveryFrames) {
                            std::cout << "[Pipeline](run) processed_frames n=" << stats.frames << "\n";
                            last_logged = stats.frames;
                        }
                    },
                    [&](EndOfStream&) { done = true; },
                    [&](StreamFailure& failure) {
                        if (failure.kind == StreamFailure::Kind::Unexpected) {
                            throw std::runtime_error("decoder thread: " + failure.message);
                        }
                        throw DecodeError(failure.message);
                    },
                }, msg);
            }
        } catch (...) {
            sink->abort();
            shutdown_producer();
            throw;
        }

        shutdown_producer();
        sink->finish();

        std::cout << "[Pipeline](run) done frames=" << stats.frames
                  << " batches=" << stats.batches
                  << " with_subject=" << stats.frames_with_subject << "\n";
        return stats;
    }

    PipelineStats CropPipeline::process_file(const std::string& in_path,
                                             const std::string& out_path,
                                             const EncoderConfig& enc,
                                             const std::string& scratch_dir) {
        auto source = make_file_source(in_path);
        return run(*source, [&](const StreamInfo& info) -> std::unique_ptr<IFrameSink> {
            return std::make_unique<EncoderSink>(build_encode_command(enc, info, in_path, out_path),
                                                 info,
                                                 scratch_dir);
        });
    }
}
