#include <ingest/gst_frame_source.hpp>
#include <common/errors.hpp>

#include <gst/gst.h>
#include <gst/app/gstappsink.h>
#include <gst/video/video.h>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cmath>
#include <iostream>
#include <mutex>

namespace sc {
    namespace {
        constexpr const char* kSinkName = "crop_sink";
        constexpr GstClockTime kPrerollTimeout = 30 * GST_SECOND;
        constexpr GstClockTime kPullTimeout = 500 * GST_MSECOND;
        constexpr double kFallbackFps = 30.0;
    } // namespace

    GstFrameSource::GstFrameSource(std::string path)
        : path_(std::move(path)),
          pipeline_str_(file_pipeline(path_, kSinkName)) {}

    std::string GstFrameSource::file_pipeline(const std::string& path, const std::string& sink_name) {
        // every frame is needed downstream: no dropping, no clock sync
        return "filesrc location=\"" + path + "\" ! "
               "decodebin ! videoconvert ! video/x-raw,format=BGR ! "
               "appsink name=" + sink_name + " max-buffers=4 drop=false sync=false";
    }

    StreamInfo GstFrameSource::stream_info_from_caps(int width, int height, int fps_n, int fps_d) {
        if (width <= 0 || height <= 0) {
            throw OpenError("Invalid video dimensions: " + std::to_string(width) + "x" + std::to_string(height));
        }
        StreamInfo info;
        info.width = width;
        info.height = height;
        info.fps = (fps_n > 0 && fps_d > 0) ? static_cast<double>(fps_n) / fps_d : kFallbackFps;
        return info;
    }

    bool GstFrameSource::pop_bus_error_(std::string& msg) const {
        if (!pipeline_) return false;
        GstBus* bus = gst_element_get_bus(pipeline_);
        if (!bus) return false;

        GstMessage* m = gst_bus_pop_filtered(bus, GST_MESSAGE_ERROR);
        gst_object_unref(bus);
        if (!m) return false;

        GError* err = nullptr;
        gchar* dbg = nullptr;
        gst_message_parse_error(m, &err, &dbg);
        msg = err ? err->message : "unknown decoder error";
        if (err) g_error_free(err);
        g_free(dbg);
        gst_message_unref(m);
        return true;
    }

    std::string GstFrameSource::bus_error_() const {
        std::string msg;
        if (!pop_bus_error_(msg)) msg = "unknown decoder error";
        return msg;
    }

    void GstFrameSource::open() {
        static std::once_flag gst_init_flag;
        std::call_once(gst_init_flag, [] { gst_init(nullptr, nullptr); });

        GError* err = nullptr;
        pipeline_ = gst_parse_launch(pipeline_str_.c_str(), &err);
        if (!pipeline_) {
            std::string msg = err ? err->message : "unk error";
            if (err) g_error_free(err);
            throw OpenError("Failed to open input video: " + msg);
        }
        if (err) {
            // recoverable parse warnings still yield a pipeline
            std::cerr << "[GStreamer] parse_launch warning: " << err->message << "\n";
            g_error_free(err);
        }

        sink_ = gst_bin_get_by_name(GST_BIN(pipeline_), kSinkName);
        if (!sink_) {
            close();
            throw OpenError("Failed to open input video: appsink not found");
        }

        GstAppSink* appsink = GST_APP_SINK(sink_);
        gst_app_sink_set_drop(appsink, FALSE);
        gst_app_sink_set_max_buffers(appsink, 4);
        gst_app_sink_set_emit_signals(appsink, FALSE);

        gst_element_set_state(pipeline_, GST_STATE_PAUSED);
        GstStateChangeReturn ret = gst_element_get_state(pipeline_, nullptr, nullptr, kPrerollTimeout);
        if (ret == GST_STATE_CHANGE_FAILURE) {
            const std::string msg = bus_error_();
            close();
            throw OpenError("Failed to open input video: " + msg);
        }

        GstSample* preroll = gst_app_sink_try_pull_preroll(appsink, kPrerollTimeout);
        if (!preroll) {
            const std::string msg = gst_app_sink_is_eos(appsink) ? "no video frames" : bus_error_();
            close();
            throw OpenError("Failed to open input video: " + msg);
        }

        GstCaps* caps = gst_sample_get_caps(preroll);
        int width = 0, height = 0, fps_n = 0, fps_d = 1;
        if (caps) {
            GstStructure* st = gst_caps_get_structure(caps, 0);
            gst_structure_get_int(st, "width", &width);
            gst_structure_get_int(st, "height", &height);
            gst_structure_get_fraction(st, "framerate", &fps_n, &fps_d);
        }
        gst_sample_unref(preroll);

        try {
            info_ = stream_info_from_caps(width, height, fps_n, fps_d);
        } catch (const OpenError&) {
            close();
            throw;
        }

        gint64 duration_ns = 0;
        if (gst_element_query_duration(pipeline_, GST_FORMAT_TIME, &duration_ns) && duration_ns > 0) {
            info_.frame_count = static_cast<int64_t>(
                std::llround(static_cast<double>(duration_ns) * info_.fps / GST_SECOND));
        } else {
            info_.frame_count = 0;
        }

        if (gst_element_set_state(pipeline_, GST_STATE_PLAYING) == GST_STATE_CHANGE_FAILURE) {
            const std::string msg = bus_error_();
            close();
            throw OpenError("Failed to start decoder: " + msg);
        }

        frame_id_ = 0;
        eos_ = false;
    }

    bool GstFrameSource::read(Frame& out) {
        if (!sink_ || eos_) return false;

        GstAppSink* appsink = GST_APP_SINK(sink_);
        GstSample* sample = nullptr;
        while (!sample) {
            sample = gst_app_sink_try_pull_sample(appsink, kPullTimeout);
            if (sample) break;
            if (gst_app_sink_is_eos(appsink)) {
                eos_ = true;
                return false;
            }

            std::string msg;
            if (pop_bus_error_(msg)) {
                throw DecodeError("decode failed at frame " + std::to_string(frame_id_) + ": " + msg);
            }
        }

        GstBuffer* buffer = gst_sample_get_buffer(sample);
        GstCaps* caps = gst_sample_get_caps(sample);
        if (!buffer || !caps) {
            gst_sample_unref(sample);
            throw DecodeError("decoder produced an empty sample at frame " + std::to_string(frame_id_));
        }

        GstVideoInfo vinfo;
        if (!gst_video_info_from_caps(&vinfo, caps)) {
            gst_sample_unref(sample);
            throw DecodeError("decoder produced unreadable caps at frame " + std::to_string(frame_id_));
        }
        const int width = GST_VIDEO_INFO_WIDTH(&vinfo);
        const int height = GST_VIDEO_INFO_HEIGHT(&vinfo);
        int stride = GST_VIDEO_INFO_PLANE_STRIDE(&vinfo, 0);
        if (stride <= 0) stride = width * 3;

        GstMapInfo map;
        if (!gst_buffer_map(buffer, &map, GST_MAP_READ) || !map.data) {
            gst_sample_unref(sample);
            throw DecodeError("failed to map frame " + std::to_string(frame_id_));
        }

        const size_t min_bytes = static_cast<size_t>(stride) * static_cast<size_t>(height);
        if (map.size < min_bytes) {
            gst_buffer_unmap(buffer, &map);
            gst_sample_unref(sample);
            throw DecodeError("short frame buffer at frame " + std::to_string(frame_id_));
        }

        cv::Mat tmp(height, width, CV_8UC3, (void*)map.data, stride);
        if (width == info_.width && height == info_.height) {
            out.bgr = tmp.clone();
        } else {
            // keep every frame at the declared stream size
            cv::resize(tmp, out.bgr, cv::Size(info_.width, info_.height), 0, 0, cv::INTER_LINEAR);
        }
        out.index = frame_id_++;

        gst_buffer_unmap(buffer, &map);
        gst_sample_unref(sample);
        return true;
    }

    void GstFrameSource::close() {
        if (pipeline_) {
            gst_element_set_state(pipeline_, GST_STATE_NULL);

            if (sink_) {
                gst_object_unref(sink_);
                sink_ = nullptr;
            }
            gst_object_unref(pipeline_);
            pipeline_ = nullptr;
        }
    }

    GstFrameSource::~GstFrameSource() {
        close();
    }

    std::unique_ptr<IFrameSource> make_file_source(const std::string& path) {
        return std::make_unique<GstFrameSource>(path);
    }
}
