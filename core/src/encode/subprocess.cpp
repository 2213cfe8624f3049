#include <encode/subprocess.hpp>
#include <common/errors.hpp>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <mutex>

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace sc {
    namespace {
        std::string errno_str(int e) {
            return std::string(std::strerror(e));
        }

        int open_diag_file(const std::string& dir) {
            std::string tmpl = (std::filesystem::path(dir) / "encoder-diag-XXXXXX").string();
            std::vector<char> buf(tmpl.begin(), tmpl.end());
            buf.push_back('\0');
            const int fd = ::mkostemp(buf.data(), O_CLOEXEC);
            if (fd < 0) {
                throw EncodeError("cannot create encoder diagnostic file in " + dir + ": " + errno_str(errno));
            }
            // the descriptor keeps the file alive; no path left to clean up
            ::unlink(buf.data());
            return fd;
        }
    } // namespace

    Subprocess::Subprocess(const std::vector<std::string>& argv, const std::string& scratch_dir) {
        if (argv.empty()) throw EncodeError("empty encoder command");

        // a dead reader must surface as EPIPE, not kill the process
        static std::once_flag sigpipe_flag;
        std::call_once(sigpipe_flag, [] { std::signal(SIGPIPE, SIG_IGN); });

        diag_fd_ = open_diag_file(scratch_dir);

        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            const int e = errno;
            ::close(diag_fd_);
            diag_fd_ = -1;
            throw EncodeError("pipe failed: " + errno_str(e));
        }

        posix_spawn_file_actions_t actions;
        posix_spawn_file_actions_init(&actions);
        posix_spawn_file_actions_adddup2(&actions, fds[0], STDIN_FILENO);
        posix_spawn_file_actions_adddup2(&actions, diag_fd_, STDOUT_FILENO);
        posix_spawn_file_actions_adddup2(&actions, diag_fd_, STDERR_FILENO);

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
        args.push_back(nullptr);

        pid_t pid = -1;
        const int rc = ::posix_spawnp(&pid, args[0], &actions, nullptr, args.data(), environ);
        posix_spawn_file_actions_destroy(&actions);
        ::close(fds[0]);

        if (rc != 0) {
            ::close(fds[1]);
            ::close(diag_fd_);
            diag_fd_ = -1;
            throw EncodeError("cannot start " + argv[0] + ": " + errno_str(rc));
        }

        pid_ = pid;
        stdin_fd_ = fds[1];
    }

    Subprocess::~Subprocess() {
        if (pid_ > 0) kill();
        close_stdin();
        if (diag_fd_ >= 0) ::close(diag_fd_);
    }

    void Subprocess::write_all(const void* data, size_t size) {
        if (stdin_fd_ < 0) throw EncodeError("encoder input already closed");

        const auto* p = static_cast<const char*>(data);
        while (size > 0) {
            const ssize_t n = ::write(stdin_fd_, p, size);
            if (n < 0) {
                if (errno == EINTR) continue;
                const int e = errno;
                throw EncodeError("encoder input write failed: " + errno_str(e) + ": " + diagnostic_tail(800));
            }
            p += n;
            size -= static_cast<size_t>(n);
        }
    }

    void Subprocess::close_stdin() {
        if (stdin_fd_ >= 0) {
            ::close(stdin_fd_);
            stdin_fd_ = -1;
        }
    }

    int Subprocess::wait() {
        if (pid_ <= 0) return exit_code_;

        int status = 0;
        pid_t r;
        do {
            r = ::waitpid(pid_, &status, 0);
        } while (r < 0 && errno == EINTR);
        pid_ = -1;

        if (r < 0) {
            exit_code_ = -1;
        } else if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = 128 + WTERMSIG(status);
        } else {
            exit_code_ = -1;
        }
        return exit_code_;
    }

    void Subprocess::kill() {
        if (pid_ <= 0) return;
        ::kill(pid_, SIGKILL);
        close_stdin();
        wait();
    }

    std::string Subprocess::diagnostic_tail(size_t max_bytes) const {
        if (diag_fd_ < 0) return {};

        const off_t end = ::lseek(diag_fd_, 0, SEEK_END);
        if (end <= 0) return {};

        const off_t start = end > static_cast<off_t>(max_bytes) ? end - static_cast<off_t>(max_bytes) : 0;
        std::string out(static_cast<size_t>(end - start), '\0');
        size_t got = 0;
        while (got < out.size()) {
            const ssize_t n = ::pread(diag_fd_, &out[got], out.size() - got, start + static_cast<off_t>(got));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) break;
            got += static_cast<size_t>(n);
        }
        out.resize(got);
        return out;
    }
}
