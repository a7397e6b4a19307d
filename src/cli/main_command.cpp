#include "main_command.hpp"
#include "consolebar/common/config.hpp"

namespace consolebar {
namespace cli {

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

bool MainCommand::validateArguments() const {
    return true;
}

void MainCommand::addStyleOptions(CLI::App* subcommand) {
    subcommand->add_option("-l,--bar-length", style_.bar_length, "Number of bar segments")
              ->check(CLI::NonNegativeNumber);
    subcommand->add_option("-s,--text-space", style_.text_space, "Columns reserved for text before the bar")
              ->check(CLI::NonNegativeNumber);
    subcommand->add_option("--fill", style_.char_fill, "Character for filled segments");
    subcommand->add_option("--empty", style_.char_empty, "Character for empty segments");
    subcommand->add_option("--format", style_.percentage_format, "Percentage format pattern (e.g. 0%, 0.0%, P1)");
    subcommand->add_option("--opening", style_.bar_opening, "Text before the segments");
    subcommand->add_option("--closing", style_.bar_closing, "Text after the segments");
    subcommand->add_flag("--no-percentage", style_.hide_percentage, "Do not show the percentage");
}

bar::BarConfig MainCommand::effectiveBarConfig() const {
    auto config = bar::BarConfig::fromStyle(common::Config::instance().global().bar);
    
    if (style_.bar_length) config.bar_length = *style_.bar_length;
    if (style_.text_space) config.text_space = *style_.text_space;
    if (style_.char_fill) config.char_fill = *style_.char_fill;
    if (style_.char_empty) config.char_empty = *style_.char_empty;
    if (style_.percentage_format) config.percentage_format = *style_.percentage_format;
    if (style_.bar_opening) config.bar_opening = *style_.bar_opening;
    if (style_.bar_closing) config.bar_closing = *style_.bar_closing;
    if (style_.hide_percentage) config.show_percentage = false;
    
    return config;
}

}}
