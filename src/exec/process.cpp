#include "exec/process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace zsend::exec {

namespace {

[[nodiscard]] std::error_code errno_error() {
    return {errno, std::system_category()};
}

// Runs in the forked child: only async-signal-safe calls from here on.
[[noreturn]] void exec_child(const std::vector<char*>& args, const StdioFds& stdio) {
    ::signal(SIGPIPE, SIG_DFL);

    int null_fd = -1;
    if (stdio.in == -1 || stdio.out == -1 || stdio.err == -1) {
        null_fd = ::open("/dev/null", O_RDWR);
    }

    const int in  = stdio.in  == -1 ? null_fd : stdio.in;
    const int out = stdio.out == -1 ? null_fd : stdio.out;
    const int err = stdio.err == -1 ? null_fd : stdio.err;

    if (in  != -1) ::dup2(in,  STDIN_FILENO);
    if (out != -1) ::dup2(out, STDOUT_FILENO);
    if (err != -1) ::dup2(err, STDERR_FILENO);

    ::execvp(args[0], args.data());

    // exec failed: report like a shell would.
    static constexpr char kPrefix[] = "zsend: cannot execute ";
    (void)!::write(STDERR_FILENO, kPrefix, sizeof(kPrefix) - 1);
    (void)!::write(STDERR_FILENO, args[0], std::strlen(args[0]));
    (void)!::write(STDERR_FILENO, "\n", 1);
    ::_exit(127);
}

} // anonymous namespace

// ── UniqueFd ──────────────────────────────────────────────────────────────────

void UniqueFd::reset(int fd) noexcept {
    if (fd_ != -1) {
        ::close(fd_);
    }
    fd_ = fd;
}

// ── Pipe ──────────────────────────────────────────────────────────────────────

Pipe Pipe::create() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        throw std::system_error(errno_error(), "pipe2");
    }
    Pipe p;
    p.read.reset(fds[0]);
    p.write.reset(fds[1]);
    return p;
}

// ── ChildProcess ──────────────────────────────────────────────────────────────

ChildProcess::~ChildProcess() {
    if (running()) {
        kill(SIGKILL);
        wait();
    }
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(other.pid_),
      status_(other.status_) {
    other.pid_ = -1;
    other.status_.reset();
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        if (running()) {
            kill(SIGKILL);
            wait();
        }
        pid_    = other.pid_;
        status_ = other.status_;
        other.pid_ = -1;
        other.status_.reset();
    }
    return *this;
}

ChildProcess ChildProcess::spawn(const Command& cmd, const StdioFds& stdio) {
    if (cmd.empty()) {
        throw std::system_error(std::make_error_code(std::errc::invalid_argument),
                                "spawn: empty command");
    }

    // Build argv before fork(): no allocation in the child.
    std::vector<char*> args;
    args.reserve(cmd.argv.size() + 1);
    for (const auto& a : cmd.argv) {
        args.push_back(const_cast<char*>(a.c_str()));
    }
    args.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        throw std::system_error(errno_error(), "fork");
    }
    if (pid == 0) {
        exec_child(args, stdio);
    }
    return ChildProcess{pid};
}

std::optional<int> ChildProcess::try_wait() {
    if (status_) return status_;
    if (pid_ <= 0) return std::nullopt;

    int wstatus = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &wstatus, WNOHANG);
    } while (r < 0 && errno == EINTR);

    if (r == pid_) {
        status_ = decode_wait_status(wstatus);
    } else if (r < 0) {
        // ECHILD: somebody else reaped it; nothing more to learn.
        status_ = 128 + SIGKILL;
    }
    return status_;
}

int ChildProcess::wait() {
    if (status_) return *status_;
    if (pid_ <= 0) return -1;

    int wstatus = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &wstatus, 0);
    } while (r < 0 && errno == EINTR);

    status_ = (r == pid_) ? decode_wait_status(wstatus) : 128 + SIGKILL;
    return *status_;
}

void ChildProcess::kill(int signo) noexcept {
    if (running()) {
        ::kill(pid_, signo);
    }
}

int decode_wait_status(int wstatus) noexcept {
    if (WIFEXITED(wstatus)) {
        return WEXITSTATUS(wstatus);
    }
    if (WIFSIGNALED(wstatus)) {
        return 128 + WTERMSIG(wstatus);
    }
    return -1;
}

} // namespace zsend::exec
