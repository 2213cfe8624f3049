#include <common/scratch_dir.hpp>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <vector>

#include <stdlib.h>

namespace sc {
    ScratchDir::ScratchDir(const std::string& parent, const std::string& prefix) {
        namespace fs = std::filesystem;
        std::error_code ec;
        fs::create_directories(parent, ec);

        std::string tmpl = (fs::path(parent) / (prefix + "XXXXXX")).string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (!::mkdtemp(buf.data())) {
            throw std::runtime_error("cannot create scratch dir under " + parent + ": " + std::strerror(errno));
        }
        path_ = buf.data();
    }

    ScratchDir::~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            std::cerr << "[Scratch](cleanup) failed to remove " << path_ << ": " << ec.message() << "\n";
        }
    }

    std::string ScratchDir::file(const std::string& name) const {
        return (std::filesystem::path(path_) / name).string();
    }
}
