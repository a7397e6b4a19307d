#pragma once

#include "consolebar/bar/bar_config.hpp"
#include <CLI/CLI.hpp>
#include <optional>
#include <string>

namespace consolebar {
namespace cli {

struct StyleOverrides {
    std::optional<int> bar_length;
    std::optional<int> text_space;
    std::optional<char> char_fill;
    std::optional<char> char_empty;
    std::optional<std::string> percentage_format;
    std::optional<std::string> bar_opening;
    std::optional<std::string> bar_closing;
    bool hide_percentage = false;
};

class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();
    
    virtual bool validateArguments() const;

protected:
    CLI::App* subcommand_ = nullptr;
    StyleOverrides style_;
    
    void addStyleOptions(CLI::App* subcommand);
    bar::BarConfig effectiveBarConfig() const;
};

}}
