#pragma once

#include <memory>
#include <string>

#include <pipeline/types.hpp>

namespace sc {
    // Finite, non-restartable frame sequence over one input file.
    struct IFrameSource {
        virtual ~IFrameSource() = default;

        // Throws OpenError when the input cannot be decoded.
        virtual void open() = 0;
        virtual const StreamInfo& info() const = 0;

        // Next frame in index order. Returns false at end of stream,
        // throws DecodeError when decoding fails midway.
        virtual bool read(Frame& out) = 0;
        virtual void close() = 0;
    };

    std::unique_ptr<IFrameSource> make_file_source(const std::string& path);
}
