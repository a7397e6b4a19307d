#include "multi_command.hpp"
#include "consolebar/bar/progress_bar.hpp"
#include "consolebar/common/config.hpp"
#include "consolebar/common/logger.hpp"
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <spdlog/fmt/fmt.h>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

namespace consolebar {
namespace cli {

MultiCommand::MultiCommand() : was_called_(false) {}

void MultiCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    subcommand->add_option("-b,--bars", bar_count_, "Number of bars")
              ->check(CLI::Range(1, 64))
              ->capture_default_str();
    subcommand->add_option("-n,--steps", steps_, "Steps per bar (default: demo.steps)")
              ->check(CLI::PositiveNumber);
    subcommand->add_option("-d,--delay-ms", delay_ms_, "Base delay between steps in milliseconds")
              ->check(CLI::NonNegativeNumber);
    subcommand->add_option("-j,--threads", threads_, "Worker threads (default: demo.threads)")
              ->check(CLI::PositiveNumber);
    subcommand->add_flag("--isolated-locks", isolated_locks_, "Give every bar its own terminal lock");
    addStyleOptions(subcommand);
    
    subcommand->callback([this]() { was_called_ = true; });
}

bool MultiCommand::wasCalled() const {
    return was_called_;
}

int MultiCommand::execute() {
    const auto& demo = common::Config::instance().global().demo;
    int steps = steps_.value_or(demo.steps);
    int delay_ms = delay_ms_.value_or(demo.delay_ms);
    int threads = threads_.value_or(demo.threads);
    
    auto& context = bar::BarContext::instance();
    auto bar_config = effectiveBarConfig();
    
    std::vector<std::unique_ptr<bar::ProgressBar>> bars;
    bars.reserve(bar_count_);
    for (int i = 0; i < bar_count_; ++i) {
        auto progress = std::make_unique<bar::ProgressBar>(context, bar_config, fmt::format("Worker {}", i + 1));
        if (isolated_locks_) {
            progress->setLockObject(std::make_shared<std::mutex>());
        }
        progress->start();
        bars.push_back(std::move(progress));
    }
    
    common::Logger::instance().info("[Multi] Started | bars={} | threads={} | isolated_locks={}",
                                    bar_count_, threads, isolated_locks_);
    
    tbb::task_arena arena(threads);
    arena.execute([&] {
        tbb::parallel_for(size_t(0), bars.size(), [&](size_t i) {
            auto& progress = *bars[i];
            auto pace = std::chrono::milliseconds(delay_ms * static_cast<int>(i + 1));
            
            for (int step = 0; step <= steps; ++step) {
                progress.update(bar::progressFraction(step, steps), "Worker {} {}/{}", i + 1, step, steps);
                if (step < steps && pace.count() > 0) {
                    std::this_thread::sleep_for(pace);
                }
            }
            
            progress.write("Worker {}: done", i + 1);
        });
    });
    
    common::Logger::instance().info("[Multi] Finished | bars={}", bar_count_);
    return 0;
}

}}
