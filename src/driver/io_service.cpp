#include "cmdtree/io_service.hpp"

#include <iostream>
#include <termios.h>
#include <unistd.h>

namespace cmdtree {

namespace {

constexpr const char* kErrorColour = "\x1b[31m";
constexpr const char* kResetColour = "\x1b[0m";

class RawTerminalMode {
public:
    RawTerminalMode() {
        if (::tcgetattr(STDIN_FILENO, &original_) != 0) return;
        termios raw = original_;
        raw.c_lflag &= static_cast<tcflag_t>(~(ICANON | ECHO));
        raw.c_cc[VMIN] = 1;
        raw.c_cc[VTIME] = 0;
        active_ = ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) == 0;
    }

    ~RawTerminalMode() {
        if (active_) {
            ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &original_);
        }
    }

    RawTerminalMode(const RawTerminalMode&) = delete;
    RawTerminalMode& operator=(const RawTerminalMode&) = delete;

    bool ok() const { return active_; }

private:
    termios original_{};
    bool active_ = false;
};

} // namespace

StreamIoService::StreamIoService(std::istream& in, std::ostream& out, std::ostream& err)
    : in_(in), out_(out), err_(err) {}

void StreamIoService::write(std::string_view text) {
    out_ << text;
    out_.flush();
}

void StreamIoService::write_line(std::string_view text) {
    out_ << text << '\n';
    out_.flush();
}

void StreamIoService::write_error(std::string_view text) {
    err_ << text;
    err_.flush();
}

void StreamIoService::write_error_line(std::string_view text) {
    err_ << text << '\n';
    err_.flush();
}

std::optional<std::string> StreamIoService::read_line() {
    std::string line;
    if (!std::getline(in_, line)) {
        return std::nullopt;
    }
    return line;
}

std::optional<char> StreamIoService::read_key() {
    char ch = 0;
    if (!in_.get(ch)) {
        return std::nullopt;
    }
    return ch;
}

ConsoleIoService::ConsoleIoService()
    : StreamIoService(std::cin, std::cout, std::cerr),
      colour_errors_(::isatty(STDERR_FILENO) == 1) {}

void ConsoleIoService::write_error(std::string_view text) {
    if (!colour_errors_) {
        StreamIoService::write_error(text);
        return;
    }
    err_ << kErrorColour << text << kResetColour;
    err_.flush();
}

void ConsoleIoService::write_error_line(std::string_view text) {
    write_error(text);
    err_ << '\n';
    err_.flush();
}

std::optional<char> ConsoleIoService::read_key() {
    std::cout.flush();
    // Characters already buffered by read_line() come first.
    if (in_.rdbuf() != nullptr && in_.rdbuf()->in_avail() > 0) {
        return StreamIoService::read_key();
    }
    RawTerminalMode raw;
    if (!raw.ok()) {
        return StreamIoService::read_key();
    }
    char ch = 0;
    const ssize_t count = ::read(STDIN_FILENO, &ch, 1);
    if (count != 1) {
        return std::nullopt;
    }
    return ch;
}

} // namespace cmdtree
