#include "consolebar/bar/bar_context.hpp"
#include "consolebar/common/error_codes.hpp"
#include "consolebar/common/logger.hpp"
#include <algorithm>
#include <iostream>
#include <unistd.h>

namespace consolebar {
namespace bar {

BarContext& BarContext::instance() {
    static BarContext instance(std::make_shared<AnsiTerminal>(std::cout, STDOUT_FILENO, STDIN_FILENO));
    return instance;
}

BarContext::BarContext(std::shared_ptr<Terminal> terminal)
    : BarContext(std::move(terminal), std::make_shared<std::mutex>()) {}

BarContext::BarContext(std::shared_ptr<Terminal> terminal, TerminalLock default_lock)
    : terminal_(std::move(terminal)) {
    if (!terminal_) {
        throw common::ConsoleBarException(common::ErrorCode::INVALID_ARGUMENT, "terminal must not be null");
    }
    setDefaultLockObject(std::move(default_lock));
}

void BarContext::setDefaultLockObject(TerminalLock lock) {
    if (!lock) {
        throw common::ConsoleBarException(common::ErrorCode::INVALID_ARGUMENT, "default lock must not be null");
    }
    
    std::lock_guard<std::mutex> guard(mutex_);
    default_lock_ = std::move(lock);
    common::Logger::instance().debug("[BarContext] Default lock replaced");
}

TerminalLock BarContext::defaultLockObject() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return default_lock_;
}

void BarContext::print(const std::string& text, const TerminalLock& lock) {
    if (!lock) {
        throw common::ConsoleBarException(common::ErrorCode::INVALID_ARGUMENT, "lock object must not be null");
    }
    
    std::lock_guard<std::mutex> terminal_guard(*lock);
    
    int newlines = static_cast<int>(std::count(text.begin(), text.end(), '\n'));
    if (newlines == 0) {
        terminal_->write(text);
        return;
    }
    
    int before = terminal_->cursorPosition().row;
    terminal_->write(text);
    int after = terminal_->cursorPosition().row;
    
    recordScroll(before + newlines - after);
}

void BarContext::print(const std::string& text) {
    print(text, defaultLockObject());
}

void BarContext::recordScroll(int rows) {
    if (rows <= 0) {
        return;
    }
    
    std::lock_guard<std::mutex> guard(mutex_);
    scrolled_rows_ += rows;
    common::Logger::instance().debug("[BarContext] Screen scrolled | rows={} | total={}", rows, scrolled_rows_);
}

long BarContext::scrolledRows() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return scrolled_rows_;
}

}}
