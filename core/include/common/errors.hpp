#pragma once

#include <stdexcept>
#include <string>

namespace sc {
    // Expected processing failures. Anything else reaching the job boundary
    // is recorded as "unexpected".
    class ProcessingError : public std::runtime_error {
    public:
        explicit ProcessingError(const std::string& msg) : std::runtime_error(msg) {}
    };

    class DownloadError : public ProcessingError {
    public:
        explicit DownloadError(const std::string& msg) : ProcessingError(msg) {}
    };

    class OpenError : public ProcessingError {
    public:
        explicit OpenError(const std::string& msg) : ProcessingError(msg) {}
    };

    class DecodeError : public ProcessingError {
    public:
        explicit DecodeError(const std::string& msg) : ProcessingError(msg) {}
    };

    class EncodeError : public ProcessingError {
    public:
        explicit EncodeError(const std::string& msg) : ProcessingError(msg) {}
    };

    class ConfigurationError : public ProcessingError {
    public:
        explicit ConfigurationError(const std::string& msg) : ProcessingError(msg) {}
    };
}
