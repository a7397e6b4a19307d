#include "consolebar/bar/terminal.hpp"
#include "consolebar/common/constants.hpp"
#include "consolebar/common/error_codes.hpp"
#include "consolebar/common/logger.hpp"
#include <spdlog/fmt/fmt.h>
#include <chrono>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <termios.h>
#include <poll.h>
#include <unistd.h>

namespace consolebar {
namespace bar {

namespace {

using common::ConsoleBarException;
using common::ErrorCode;

class RawModeGuard {
public:
    explicit RawModeGuard(int fd) : fd_(fd) {
        if (tcgetattr(fd_, &saved_) != 0) {
            throw ConsoleBarException(ErrorCode::IO_ERROR,
                fmt::format("tcgetattr failed: {}", std::strerror(errno)));
        }
        
        struct termios raw = saved_;
        raw.c_lflag &= ~(ICANON | ECHO);
        raw.c_cc[VMIN] = 0;
        raw.c_cc[VTIME] = 0;
        
        if (tcsetattr(fd_, TCSANOW, &raw) != 0) {
            throw ConsoleBarException(ErrorCode::IO_ERROR,
                fmt::format("tcsetattr failed: {}", std::strerror(errno)));
        }
    }
    
    ~RawModeGuard() {
        if (tcsetattr(fd_, TCSANOW, &saved_) != 0) {
            common::Logger::instance().warn("[Terminal] Failed to restore terminal mode | error={}",
                                            std::strerror(errno));
        }
    }
    
    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;

private:
    int fd_;
    struct termios saved_;
};

}

AnsiTerminal::AnsiTerminal(std::ostream& out, int output_fd, int input_fd)
    : out_(out), output_fd_(output_fd), input_fd_(input_fd) {}

CursorPosition AnsiTerminal::cursorPosition() {
    if (!isatty(output_fd_)) {
        throw ConsoleBarException(ErrorCode::IO_ERROR, "output is not a terminal");
    }
    if (!isatty(input_fd_)) {
        throw ConsoleBarException(ErrorCode::IO_ERROR, "input is not a terminal, cursor position unavailable");
    }
    
    std::string reply;
    {
        RawModeGuard raw_mode(input_fd_);
        emit("\033[6n");
        reply = readCursorReply();
    }
    
    auto start = reply.rfind("\033[");
    int row = 0;
    int column = 0;
    if (start == std::string::npos ||
        std::sscanf(reply.c_str() + start, "\033[%d;%dR", &row, &column) != 2 ||
        row < 1 || column < 1) {
        throw ConsoleBarException(ErrorCode::IO_ERROR, "malformed cursor position reply");
    }
    
    return CursorPosition{column - 1, row - 1};
}

void AnsiTerminal::setCursorPosition(int column, int row) {
    emit(fmt::format("\033[{};{}H", row + 1, column + 1));
}

void AnsiTerminal::setCursorVisible(bool visible) {
    emit(visible ? "\033[?25h" : "\033[?25l");
}

void AnsiTerminal::write(const std::string& text) {
    emit(text);
}

void AnsiTerminal::emit(const std::string& sequence) {
    out_ << sequence << std::flush;
    if (!out_) {
        out_.clear();
        throw ConsoleBarException(ErrorCode::IO_ERROR, "write to terminal failed");
    }
}

std::string AnsiTerminal::readCursorReply() {
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + std::chrono::milliseconds(constants::terminal::CURSOR_QUERY_TIMEOUT_MS);
    
    std::string reply;
    while (reply.size() < constants::terminal::CURSOR_REPLY_MAX_BYTES) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
        if (remaining.count() <= 0) {
            break;
        }
        
        struct pollfd pfd{};
        pfd.fd = input_fd_;
        pfd.events = POLLIN;
        
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw ConsoleBarException(ErrorCode::IO_ERROR,
                fmt::format("poll failed: {}", std::strerror(errno)));
        }
        if (ready == 0) {
            break;
        }
        
        char c = 0;
        ssize_t n = ::read(input_fd_, &c, 1);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            throw ConsoleBarException(ErrorCode::IO_ERROR,
                fmt::format("read failed: {}", std::strerror(errno)));
        }
        if (n == 0) {
            continue;
        }
        
        reply.push_back(c);
        if (c == 'R') {
            return reply;
        }
    }
    
    throw ConsoleBarException(ErrorCode::IO_ERROR, "terminal did not answer cursor position query");
}

}}
