#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <optional>
#include <string>

namespace consolebar {
namespace cli {

class RunCommand : public MainCommand {
public:
    RunCommand();
    
    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    bool validateArguments() const override;
    int execute();

private:
    bool was_called_;
    std::optional<int> steps_;
    std::optional<int> delay_ms_;
    std::string text_format_ = "Step {}/{}";
    bool no_text_ = false;
    std::string done_message_ = "Done!";
    int echo_every_ = 0;
};

}}
