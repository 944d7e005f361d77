#include "cli/console.hpp"

#include <istream>
#include <ostream>

namespace minigpt::cli {

StreamConsole::StreamConsole(std::istream& in, std::ostream& out)
    : in_(in)
    , out_(out) {}

std::optional<std::string> StreamConsole::ReadLine(const std::string& prompt) {
    out_ << prompt << std::flush;
    std::string line;
    if (!std::getline(in_, line)) {
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

void StreamConsole::Write(const std::string& text) {
    out_ << text << std::flush;
}

}  // namespace minigpt::cli
