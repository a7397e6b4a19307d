#include "consolebar/bar/progress_bar.hpp"
#include "consolebar/bar/renderer.hpp"
#include "consolebar/common/error_codes.hpp"
#include "consolebar/common/logger.hpp"

namespace consolebar {
namespace bar {

using common::ConsoleBarException;
using common::ErrorCode;

ProgressBar::ProgressBar()
    : ProgressBar(BarContext::instance()) {}

ProgressBar::ProgressBar(BarContext& context)
    : ProgressBar(context, BarConfig{}) {}

ProgressBar::ProgressBar(std::optional<std::string> text, int bar_length, int text_space)
    : ProgressBar(BarContext::instance(), std::move(text), bar_length, text_space) {}

ProgressBar::ProgressBar(BarContext& context, std::optional<std::string> text, int bar_length, int text_space)
    : ProgressBar(context, BarConfig{}, std::move(text)) {
    setBarLength(bar_length);
    setTextSpace(text_space);
}

ProgressBar::ProgressBar(BarContext& context, const BarConfig& config, std::optional<std::string> text)
    : context_(context),
      terminal_(context.terminal()),
      terminal_lock_(context.defaultLockObject()),
      config_(config),
      text_(std::move(text)) {
    validateLength("bar_length", config_.bar_length);
    validateLength("text_space", config_.text_space);
}

void ProgressBar::start() {
    std::lock_guard<std::mutex> render_guard(render_mutex_);
    std::lock_guard<std::mutex> terminal_guard(*terminal_lock_);
    
    CursorPosition before = terminal_->cursorPosition();
    int newlines = 1;
    if (before.column != 0) {
        terminal_->write("\n");
        ++newlines;
    }
    terminal_->write("\n");
    
    // At the bottom of the screen each newline scrolls everything up one row.
    int after = terminal_->cursorPosition().row;
    context_.recordScroll(before.row + newlines - after);
    
    int row = after - 1;
    reserved_line_ = row + context_.scrolledRows();
    common::Logger::instance().debug("[ProgressBar] Started | row={}", row);
}

void ProgressBar::update(double progress) {
    std::lock_guard<std::mutex> guard(render_mutex_);
    requireStarted();
    
    draw(BarRenderer::composeBar(config_, progress, text_), text_);
}

void ProgressBar::update(double progress, std::optional<std::string> text) {
    std::lock_guard<std::mutex> guard(render_mutex_);
    requireStarted();
    
    std::string buffer = BarRenderer::composeBar(config_, progress, text);
    draw(buffer, std::move(text));
}

void ProgressBar::write(std::optional<std::string> text) {
    std::lock_guard<std::mutex> guard(render_mutex_);
    requireStarted();
    
    std::string buffer = BarRenderer::composeText(text);
    draw(buffer, std::move(text));
}

// Text and length are committed only once the terminal accepted the render.
void ProgressBar::draw(const std::string& buffer, std::optional<std::string> text) {
    size_t length = last_rendered_length_;
    std::string output = BarRenderer::finalize(buffer, length);
    
    {
        std::lock_guard<std::mutex> terminal_guard(*terminal_lock_);
        long row = *reserved_line_ - context_.scrolledRows();
        if (row >= 0) {
            BarRenderer::emit(*terminal_, static_cast<int>(row), output);
        } else {
            common::Logger::instance().debug("[ProgressBar] Row scrolled off screen | row={}", row);
        }
    }
    
    text_ = std::move(text);
    last_rendered_length_ = length;
}

void ProgressBar::requireStarted() const {
    if (!reserved_line_) {
        throw ConsoleBarException(ErrorCode::NOT_STARTED, "call start() before update() or write()");
    }
}

void ProgressBar::validateLength(const char* name, int value) {
    if (value < 0) {
        throw ConsoleBarException(ErrorCode::INVALID_ARGUMENT,
            fmt::format("{} cannot be negative, got {}", name, value));
    }
}

int ProgressBar::barLength() const {
    std::lock_guard<std::mutex> guard(render_mutex_);
    return config_.bar_length;
}

void ProgressBar::setBarLength(int length) {
    validateLength("bar_length", length);
    std::lock_guard<std::mutex> guard(render_mutex_);
    config_.bar_length = length;
}

int ProgressBar::textSpace() const {
    std::lock_guard<std::mutex> guard(render_mutex_);
    return config_.text_space;
}

void ProgressBar::setTextSpace(int space) {
    validateLength("text_space", space);
    std::lock_guard<std::mutex> guard(render_mutex_);
    config_.text_space = space;
}

char ProgressBar::charFill() const {
    std::lock_guard<std::mutex> guard(render_mutex_);
    return config_.char_fill;
}

void ProgressBar::setCharFill(char c) {
    std::lock_guard<std::mutex> guard(render_mutex_);
    config_.char_fill = c;
}

char ProgressBar::charEmpty() const {
    std::lock_guard<std::mutex> guard(render_mutex_);
    return config_.char_empty;
}

void ProgressBar::setCharEmpty(char c) {
    std::lock_guard<std::mutex> guard(render_mutex_);
    config_.char_empty = c;
}

bool ProgressBar::showPercentage() const {
    std::lock_guard<std::mutex> guard(render_mutex_);
    return config_.show_percentage;
}

void ProgressBar::setShowPercentage(bool show) {
    std::lock_guard<std::mutex> guard(render_mutex_);
    config_.show_percentage = show;
}

std::string ProgressBar::percentageFormat() const {
    std::lock_guard<std::mutex> guard(render_mutex_);
    return config_.percentage_format;
}

void ProgressBar::setPercentageFormat(const std::string& format) {
    std::lock_guard<std::mutex> guard(render_mutex_);
    config_.percentage_format = format;
}

std::string ProgressBar::barOpening() const {
    std::lock_guard<std::mutex> guard(render_mutex_);
    return config_.bar_opening;
}

void ProgressBar::setBarOpening(const std::string& opening) {
    std::lock_guard<std::mutex> guard(render_mutex_);
    config_.bar_opening = opening;
}

std::string ProgressBar::barClosing() const {
    std::lock_guard<std::mutex> guard(render_mutex_);
    return config_.bar_closing;
}

void ProgressBar::setBarClosing(const std::string& closing) {
    std::lock_guard<std::mutex> guard(render_mutex_);
    config_.bar_closing = closing;
}

BarConfig ProgressBar::config() const {
    std::lock_guard<std::mutex> guard(render_mutex_);
    return config_;
}

TerminalLock ProgressBar::lockObject() const {
    std::lock_guard<std::mutex> guard(render_mutex_);
    return terminal_lock_;
}

void ProgressBar::setLockObject(TerminalLock lock) {
    if (!lock) {
        throw ConsoleBarException(ErrorCode::INVALID_ARGUMENT, "lock object must not be null");
    }
    std::lock_guard<std::mutex> guard(render_mutex_);
    terminal_lock_ = std::move(lock);
}

std::optional<std::string> ProgressBar::text() const {
    std::lock_guard<std::mutex> guard(render_mutex_);
    return text_;
}

std::optional<int> ProgressBar::reservedRow() const {
    std::lock_guard<std::mutex> guard(render_mutex_);
    if (!reserved_line_) {
        return std::nullopt;
    }
    return static_cast<int>(*reserved_line_ - context_.scrolledRows());
}

size_t ProgressBar::lastRenderedLength() const {
    std::lock_guard<std::mutex> guard(render_mutex_);
    return last_rendered_length_;
}

}}
