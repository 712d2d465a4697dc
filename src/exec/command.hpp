#pragma once

#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace zsend::exec {

// ── Command ───────────────────────────────────────────────────────────────────
//
// One program invocation as an argv vector.  argv[0] is looked up on $PATH.

struct Command {
    std::vector<std::string> argv;

    Command() = default;
    Command(std::initializer_list<std::string> args) : argv(args) {}
    explicit Command(std::vector<std::string> args) : argv(std::move(args)) {}

    [[nodiscard]] bool empty() const noexcept { return argv.empty(); }
    [[nodiscard]] const std::string& program() const { return argv.front(); }

    Command& arg(std::string a) {
        argv.push_back(std::move(a));
        return *this;
    }

    bool operator==(const Command&) const = default;
};

// ── CommandResult ─────────────────────────────────────────────────────────────
//
// Outcome of a finished command.
//   exit_status – the program's exit code; 128 + signal number when it was
//                 killed by a signal; 127 when it could not be executed
//   timed_out   – the command was killed because its timeout elapsed

struct CommandResult {
    int         exit_status = 0;
    std::string out;
    std::string err;
    bool        timed_out = false;

    [[nodiscard]] bool ok() const noexcept { return exit_status == 0 && !timed_out; }

    // Throws CommandError (with `context`, status and stderr) unless ok().
    void check(const std::string& context) const;
};

// Quote `arg` for a POSIX shell.  Strings made of safe characters only are
// returned unchanged; everything else is single-quoted.
[[nodiscard]] std::string shell_quote(std::string_view arg);

// Join argv into one shell command line, quoting each word as needed.
[[nodiscard]] std::string to_shell_string(const Command& cmd);

} // namespace zsend::exec
