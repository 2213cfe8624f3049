#pragma once

#include <string>

namespace sc {
    // Per-job temporary directory, removed with everything in it when the
    // owner goes out of scope.
    class ScratchDir {
    public:
        // Creates <parent>/<prefix>XXXXXX. Throws std::runtime_error on failure.
        ScratchDir(const std::string& parent, const std::string& prefix);
        ~ScratchDir();

        ScratchDir(const ScratchDir&) = delete;
        ScratchDir& operator=(const ScratchDir&) = delete;

        const std::string& path() const { return path_; }
        std::string file(const std::string& name) const;

    private:
        std::string path_;
    };
}
