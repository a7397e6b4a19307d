#include "consolebar/bar/renderer.hpp"
#include "consolebar/bar/percentage_format.hpp"
#include "consolebar/common/error_codes.hpp"
#include "consolebar/common/logger.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace consolebar {
namespace bar {

int BarRenderer::computeFill(double progress, int bar_length) {
    if (!std::isfinite(progress)) {
        throw common::ConsoleBarException(common::ErrorCode::COMPUTATION_ERROR,
            fmt::format("progress must be finite, got {}", progress));
    }
    
    if (progress <= 0.0 || bar_length <= 0) {
        return 0;
    }
    
    double fill = std::floor(progress * bar_length);
    if (fill >= bar_length) {
        return bar_length;
    }
    return static_cast<int>(fill);
}

std::string BarRenderer::composeBar(const BarConfig& config, double progress,
                                    const std::optional<std::string>& text) {
    if (config.bar_length < 0 || config.text_space < 0) {
        throw common::ConsoleBarException(common::ErrorCode::INVALID_ARGUMENT,
            fmt::format("bar_length={} text_space={}", config.bar_length, config.text_space));
    }
    
    int fill = computeFill(progress, config.bar_length);
    
    std::string buffer;
    
    if (text) {
        buffer.append(*text);
        if (buffer.size() < static_cast<size_t>(config.text_space)) {
            buffer.append(config.text_space - buffer.size(), ' ');
        }
    }
    
    buffer.append(config.bar_opening);
    buffer.append(fill, config.char_fill);
    buffer.append(config.bar_length - fill, config.char_empty);
    buffer.append(config.bar_closing);
    
    if (config.show_percentage) {
        buffer.push_back(' ');
        buffer.append(formatPercentage(progress, config.percentage_format));
    }
    
    return buffer;
}

std::string BarRenderer::composeText(const std::optional<std::string>& text) {
    return text ? *text : std::string();
}

std::string BarRenderer::finalize(std::string buffer, size_t& last_length) {
    size_t length = buffer.size();
    
    if (last_length > length) {
        size_t diff = last_length - length;
        buffer.append(diff, ' ');
        buffer.append(diff, '\b');
    }
    
    last_length = length;
    return buffer;
}

namespace {

// Puts the cursor back where the caller had it if the render is interrupted.
class CursorRestoreGuard {
public:
    CursorRestoreGuard(Terminal& terminal, CursorPosition saved)
        : terminal_(terminal), saved_(saved) {}
    
    ~CursorRestoreGuard() {
        if (dismissed_) {
            return;
        }
        try {
            terminal_.setCursorPosition(saved_.column, saved_.row);
            terminal_.setCursorVisible(true);
        } catch (const common::ConsoleBarException& e) {
            common::Logger::instance().warn("[Renderer] Cursor restore failed | error={}", e.what());
        }
    }
    
    void restore() {
        terminal_.setCursorPosition(saved_.column, saved_.row);
        terminal_.setCursorVisible(true);
        dismissed_ = true;
    }
    
    CursorRestoreGuard(const CursorRestoreGuard&) = delete;
    CursorRestoreGuard& operator=(const CursorRestoreGuard&) = delete;

private:
    Terminal& terminal_;
    CursorPosition saved_;
    bool dismissed_ = false;
};

}

void BarRenderer::emit(Terminal& terminal, int row, const std::string& buffer) {
    CursorPosition saved = terminal.cursorPosition();
    
    terminal.setCursorVisible(false);
    CursorRestoreGuard guard(terminal, saved);
    
    terminal.setCursorPosition(0, row);
    terminal.write(buffer);
    
    guard.restore();
}

}}
