#pragma once

#include "exec/command.hpp"

#include <optional>

#include <sys/types.h>

namespace zsend::exec {

// ── UniqueFd ──────────────────────────────────────────────────────────────────
// Owning file descriptor; closes on destruction.

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&)            = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    [[nodiscard]] int  get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ != -1; }

    // Give up ownership without closing.
    [[nodiscard]] int release() noexcept {
        const int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1) noexcept;

private:
    int fd_ = -1;
};

// ── Pipe ──────────────────────────────────────────────────────────────────────
// Both ends are created close-on-exec; a child only sees the ends that were
// dup2()'d onto its standard descriptors.

struct Pipe {
    UniqueFd read;
    UniqueFd write;

    // Throws std::system_error on failure.
    [[nodiscard]] static Pipe create();
};

// ── ChildProcess ──────────────────────────────────────────────────────────────
//
// A spawned program.  The destructor kills (SIGKILL) and reaps a child that is
// still running, so a ChildProcess never leaks a zombie.

struct StdioFds {
    int in  = -1;   // -1 → /dev/null
    int out = -1;   // -1 → /dev/null
    int err = -1;   // -1 → /dev/null
};

class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&)            = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;

    // fork + execvp.  The child resets SIGPIPE to its default disposition.
    // If the program cannot be executed the child writes a diagnostic to its
    // stderr and exits with 127, the way a shell reports it.
    // Throws std::system_error if fork() itself fails.
    [[nodiscard]] static ChildProcess spawn(const Command& cmd, const StdioFds& stdio);

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }
    [[nodiscard]] bool running() const noexcept { return pid_ > 0 && !status_; }

    // Non-blocking reap.  Returns the exit status once the child has exited.
    [[nodiscard]] std::optional<int> try_wait();

    // Blocking reap.  Returns the exit status.
    int wait();

    // Send `signo` to a running child.  No-op once the child has been reaped.
    void kill(int signo) noexcept;

private:
    explicit ChildProcess(pid_t pid) noexcept : pid_(pid) {}

    pid_t              pid_ = -1;
    std::optional<int> status_;
};

// Convert a waitpid() status word to an exit status (128 + signal if killed).
[[nodiscard]] int decode_wait_status(int wstatus) noexcept;

} // namespace zsend::exec
