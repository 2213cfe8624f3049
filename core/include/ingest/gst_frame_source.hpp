#pragma once

#include <ingest/frame_source.hpp>
#include <string>

struct _GstElement;
using GstElement = _GstElement;

namespace sc {
    class GstFrameSource: public IFrameSource {
    public:
        explicit GstFrameSource(std::string path);

        void open() override;
        const StreamInfo& info() const override { return info_; }
        bool read(Frame& out) override;
        void close() override;

        ~GstFrameSource() override;

        static std::string file_pipeline(const std::string& path, const std::string& sink_name);

        // Stream geometry from negotiated caps. Throws OpenError unless both
        // dimensions are positive; an unknown frame rate falls back to 30.
        static StreamInfo stream_info_from_caps(int width, int height, int fps_n, int fps_d);

    private:
        bool pop_bus_error_(std::string& msg) const;
        std::string bus_error_() const;

        std::string path_;
        std::string pipeline_str_;

        GstElement* pipeline_ = nullptr;
        GstElement* sink_ = nullptr;

        StreamInfo info_;
        int64_t frame_id_ = 0;
        bool eos_ = false;
    };
}
