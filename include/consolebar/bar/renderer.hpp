#pragma once

#include "bar_config.hpp"
#include "terminal.hpp"
#include <optional>
#include <string>
#include <cstddef>

namespace consolebar {
namespace bar {

class BarRenderer {
public:
    // Number of filled segments for progress, clamped to [0, bar_length].
    // Throws COMPUTATION_ERROR for NaN or infinite progress.
    static int computeFill(double progress, int bar_length);
    
    // Text (padded to text_space), decorations, segments and percentage.
    static std::string composeBar(const BarConfig& config, double progress,
                                  const std::optional<std::string>& text);
    
    static std::string composeText(const std::optional<std::string>& text);
    
    // Appends blank-out padding when the new render is shorter than the last
    // one and stores the unpadded length in last_length.
    static std::string finalize(std::string buffer, size_t& last_length);
    
    // Caller must hold the terminal lock.
    static void emit(Terminal& terminal, int row, const std::string& buffer);
};

}}
