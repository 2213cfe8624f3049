#pragma once

#include <string>
#include <sys/types.h>
#include <vector>

namespace sc {
    // Child process with a writable stdin pipe. stdout/stderr go to an
    // unlinked temporary file, so a chatty child can never block on a full
    // pipe. Ordered shutdown: close_stdin() -> wait() -> check the code.
    class Subprocess {
    public:
        // Throws EncodeError when the process cannot be spawned.
        Subprocess(const std::vector<std::string>& argv, const std::string& scratch_dir);
        ~Subprocess();

        Subprocess(const Subprocess&) = delete;
        Subprocess& operator=(const Subprocess&) = delete;

        // Blocks until every byte is in the pipe; throws EncodeError when the
        // child stopped reading.
        void write_all(const void* data, size_t size);

        void close_stdin();
        int wait();
        // SIGKILL then reap. Safe to call on an exited child.
        void kill();

        bool running() const { return pid_ > 0; }
        std::string diagnostic_tail(size_t max_bytes) const;

    private:
        pid_t pid_ = -1;
        int stdin_fd_ = -1;
        int diag_fd_ = -1;
        int exit_code_ = -1;
    };
}
