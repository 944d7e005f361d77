#pragma once

#include <iosfwd>
#include <optional>
#include <string>

namespace minigpt::cli {

// Line-oriented terminal used by the menu shell. Implementations decide where
// prompts go and where input comes from.
class Console {
public:
    virtual ~Console() = default;

    // Shows the prompt and reads one line. std::nullopt once input is exhausted.
    virtual std::optional<std::string> ReadLine(const std::string& prompt) = 0;
    virtual void Write(const std::string& text) = 0;

    void WriteLine(const std::string& text) { Write(text + "\n"); }
};

class StreamConsole : public Console {
public:
    StreamConsole(std::istream& in, std::ostream& out);

    std::optional<std::string> ReadLine(const std::string& prompt) override;
    void Write(const std::string& text) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

}  // namespace minigpt::cli
