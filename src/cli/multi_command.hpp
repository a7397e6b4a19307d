#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <optional>

namespace consolebar {
namespace cli {

class MultiCommand : public MainCommand {
public:
    MultiCommand();
    
    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();

private:
    bool was_called_;
    int bar_count_ = 3;
    std::optional<int> steps_;
    std::optional<int> delay_ms_;
    std::optional<int> threads_;
    bool isolated_locks_ = false;
};

}}
