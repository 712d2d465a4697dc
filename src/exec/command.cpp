#include "exec/command.hpp"

#include "common/errors.hpp"

namespace zsend::exec {

namespace {

[[nodiscard]] bool is_safe_char(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') ||
           c == '_' || c == '-' || c == '.' || c == '/' || c == '@' ||
           c == ':' || c == '%' || c == '+' || c == '=' || c == ',';
}

} // anonymous namespace

void CommandResult::check(const std::string& context) const {
    if (!ok()) {
        throw CommandError(context, exit_status, err, timed_out);
    }
}

std::string shell_quote(std::string_view arg) {
    if (arg.empty()) {
        return "''";
    }

    bool safe = true;
    for (char c : arg) {
        if (!is_safe_char(c)) {
            safe = false;
            break;
        }
    }
    if (safe) {
        return std::string(arg);
    }

    // 'it'"'"'s' – close the quote, emit a quoted ', reopen.
    std::string quoted;
    quoted.reserve(arg.size() + 2);
    quoted.push_back('\'');
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\"'\"'";
        } else {
            quoted.push_back(c);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

std::string to_shell_string(const Command& cmd) {
    std::string line;
    for (const auto& a : cmd.argv) {
        if (!line.empty()) {
            line.push_back(' ');
        }
        line += shell_quote(a);
    }
    return line;
}

} // namespace zsend::exec
