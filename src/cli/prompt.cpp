#include "cli/prompt.hpp"

#include <istream>
#include <ostream>

namespace zsend::cli {

std::optional<std::string> prompt_line(std::istream& in,
                                       std::ostream& out,
                                       const std::string& question)
{
    out << question << ' ' << std::flush;
    std::string line;
    if (!std::getline(in, line)) {
        out << '\n';
        return std::nullopt;
    }
    return line;
}

bool confirm_proceed(std::istream& in, std::ostream& out) {
    auto is_answer = [](const std::string& a) {
        return a == "y" || a == "Y" || a == "n" || a == "N";
    };

    auto answer = prompt_line(in, out, "Would you like to proceed? (y/n)");
    while (answer && !is_answer(*answer)) {
        answer = prompt_line(in, out, "Would you like to proceed (y/n only)?");
    }
    return answer && (*answer == "y" || *answer == "Y");
}

} // namespace zsend::cli
