#pragma once

#include "bar_config.hpp"
#include "bar_context.hpp"
#include "terminal.hpp"
#include <spdlog/fmt/fmt.h>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <cstddef>

namespace consolebar {
namespace bar {

template<typename T>
double progressFraction(T current, T total) {
    static_assert(std::is_arithmetic<T>::value, "progress steps must be numeric");
    return static_cast<double>(current) / static_cast<double>(total);
}

// A single progress bar that owns one terminal row.
//
// Construction produces no output. start() reserves the row under the current
// cursor; update() and write() redraw only that row and leave the caller's
// cursor where it was. Bars sharing a terminal lock never interleave their
// cursor moves. The row follows scrolls recorded on the context; once it has
// scrolled off the top of the screen, renders update state without drawing.
class ProgressBar {
public:
    ProgressBar();
    explicit ProgressBar(BarContext& context);
    explicit ProgressBar(std::optional<std::string> text,
                         int bar_length = constants::bar_defaults::BAR_LENGTH,
                         int text_space = constants::bar_defaults::TEXT_SPACE);
    ProgressBar(BarContext& context, std::optional<std::string> text, int bar_length, int text_space);
    ProgressBar(BarContext& context, const BarConfig& config, std::optional<std::string> text = std::nullopt);
    
    ProgressBar(const ProgressBar&) = delete;
    ProgressBar& operator=(const ProgressBar&) = delete;
    
    void start();
    
    void update(double progress);
    void update(double progress, std::optional<std::string> text);
    
    template<typename Arg, typename... Args>
    void update(double progress, const std::string& format, Arg&& arg, Args&&... args) {
        update(progress, std::optional<std::string>(
            fmt::format(fmt::runtime(format), std::forward<Arg>(arg), std::forward<Args>(args)...)));
    }
    
    template<typename T, typename = std::enable_if_t<std::is_integral<T>::value>>
    void update(T current, T total) {
        update(progressFraction(current, total));
    }
    
    template<typename T, typename = std::enable_if_t<std::is_integral<T>::value>>
    void update(T current, T total, std::optional<std::string> text) {
        update(progressFraction(current, total), std::move(text));
    }
    
    // Replaces the bar with plain text.
    void write(std::optional<std::string> text);
    
    template<typename Arg, typename... Args>
    void write(const std::string& format, Arg&& arg, Args&&... args) {
        write(std::optional<std::string>(
            fmt::format(fmt::runtime(format), std::forward<Arg>(arg), std::forward<Args>(args)...)));
    }
    
    int barLength() const;
    void setBarLength(int length);
    
    int textSpace() const;
    void setTextSpace(int space);
    
    char charFill() const;
    void setCharFill(char c);
    
    char charEmpty() const;
    void setCharEmpty(char c);
    
    bool showPercentage() const;
    void setShowPercentage(bool show);
    
    std::string percentageFormat() const;
    void setPercentageFormat(const std::string& format);
    
    std::string barOpening() const;
    void setBarOpening(const std::string& opening);
    
    std::string barClosing() const;
    void setBarClosing(const std::string& closing);
    
    BarConfig config() const;
    
    // Replaces the terminal lock of this bar only.
    TerminalLock lockObject() const;
    void setLockObject(TerminalLock lock);
    
    std::optional<std::string> text() const;
    // Current screen row of the bar, accounting for recorded scrolls.
    std::optional<int> reservedRow() const;
    size_t lastRenderedLength() const;

private:
    BarContext& context_;
    std::shared_ptr<Terminal> terminal_;
    
    mutable std::mutex render_mutex_;
    TerminalLock terminal_lock_;
    
    BarConfig config_;
    std::optional<std::string> text_;
    size_t last_rendered_length_ = 0;
    // Reserved row plus the context's scroll count at reservation time.
    std::optional<long> reserved_line_;
    
    void requireStarted() const;
    void draw(const std::string& buffer, std::optional<std::string> text);
    
    static void validateLength(const char* name, int value);
};

}}
