#pragma once

#include "consolebar/common/constants.hpp"
#include "consolebar/common/config.hpp"
#include <string>

namespace consolebar {
namespace bar {

struct BarConfig {
    int bar_length = constants::bar_defaults::BAR_LENGTH;
    char char_fill = constants::bar_defaults::CHAR_FILL;
    char char_empty = constants::bar_defaults::CHAR_EMPTY;
    int text_space = constants::bar_defaults::TEXT_SPACE;
    bool show_percentage = constants::bar_defaults::SHOW_PERCENTAGE;
    std::string percentage_format = constants::bar_defaults::PERCENTAGE_FORMAT;
    std::string bar_opening = constants::bar_defaults::BAR_OPENING;
    std::string bar_closing = constants::bar_defaults::BAR_CLOSING;
    
    static BarConfig fromStyle(const common::BarStyleConfig& style) {
        BarConfig config;
        config.bar_length = style.bar_length;
        config.char_fill = style.char_fill;
        config.char_empty = style.char_empty;
        config.text_space = style.text_space;
        config.show_percentage = style.show_percentage;
        config.percentage_format = style.percentage_format;
        config.bar_opening = style.bar_opening;
        config.bar_closing = style.bar_closing;
        return config;
    }
};

}}
