#include "run_command.hpp"
#include "consolebar/bar/progress_bar.hpp"
#include "consolebar/common/config.hpp"
#include "consolebar/common/logger.hpp"
#include <spdlog/fmt/fmt.h>
#include <chrono>
#include <iostream>
#include <thread>

namespace consolebar {
namespace cli {

RunCommand::RunCommand() : was_called_(false) {}

void RunCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    subcommand->add_option("-n,--steps", steps_, "Number of steps (default: demo.steps)")
              ->check(CLI::PositiveNumber);
    subcommand->add_option("-d,--delay-ms", delay_ms_, "Delay between steps in milliseconds (default: demo.delay_ms)")
              ->check(CLI::NonNegativeNumber);
    subcommand->add_option("-t,--text", text_format_, "Text format, receives current step and total")
              ->capture_default_str();
    subcommand->add_flag("--no-text", no_text_, "Render the bar without a text prefix");
    subcommand->add_option("--done", done_message_, "Message replacing the bar when finished (empty keeps the bar)")
              ->capture_default_str();
    subcommand->add_option("--echo-every", echo_every_, "Print an ordinary output line every N steps")
              ->check(CLI::NonNegativeNumber);
    addStyleOptions(subcommand);
    
    subcommand->callback([this]() { was_called_ = true; });
}

bool RunCommand::wasCalled() const {
    return was_called_;
}

bool RunCommand::validateArguments() const {
    if (no_text_) {
        return true;
    }
    
    try {
        (void)fmt::format(fmt::runtime(text_format_), 0, 1);
    } catch (const fmt::format_error& e) {
        std::cerr << "Error: invalid --text format: " << e.what() << "\n";
        return false;
    }
    return true;
}

int RunCommand::execute() {
    if (!validateArguments()) {
        return 1;
    }
    
    const auto& demo = common::Config::instance().global().demo;
    int steps = steps_.value_or(demo.steps);
    int delay_ms = delay_ms_.value_or(demo.delay_ms);
    
    auto& context = bar::BarContext::instance();
    bar::ProgressBar progress(context, effectiveBarConfig());
    progress.start();
    
    common::Logger::instance().info("[Run] Started | steps={} | delay_ms={}", steps, delay_ms);
    
    for (int step = 0; step <= steps; ++step) {
        double fraction = bar::progressFraction(step, steps);
        if (no_text_) {
            progress.update(fraction, std::nullopt);
        } else {
            progress.update(fraction, text_format_, step, steps);
        }
        
        if (echo_every_ > 0 && step > 0 && step % echo_every_ == 0) {
            context.print(fmt::format("reached step {} of {}\n", step, steps), progress.lockObject());
        }
        
        if (step < steps && delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }
    }
    
    if (!done_message_.empty()) {
        progress.write(done_message_);
    }
    
    common::Logger::instance().info("[Run] Finished | steps={}", steps);
    return 0;
}

}}
