#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>
#include <string>

#include "consolebar/common/config.hpp"
#include "consolebar/common/constants.hpp"
#include "consolebar/common/error_codes.hpp"
#include "consolebar/common/logger.hpp"
#include "consolebar/common/paths.hpp"
#include "cli/config_command.hpp"
#include "cli/multi_command.hpp"
#include "cli/run_command.hpp"

namespace {

void initializeLogging(const consolebar::common::GlobalConfig& global, bool log_to_file) {
    using consolebar::common::LogMode;
    
    std::string log_file = global.log_file;
    if (log_file.empty() && log_to_file) {
        log_file = consolebar::common::PathManager::instance().getLogFile();
    }
    
    LogMode mode = log_file.empty() ? LogMode::CONSOLE_ONLY : LogMode::FILE_ONLY;
    consolebar::common::Logger::instance().initialize(mode, log_file, global.log_level, global.logging);
}

}

int main(int argc, char** argv) {
    auto& logger = consolebar::common::Logger::instance();
    
    try {
        CLI::App app{"Line-stable terminal progress bars", consolebar::constants::system::APPLICATION_NAME};
        app.set_version_flag("--version,-v", consolebar::constants::version::getFullVersion());
        app.require_subcommand(0, 1);
        
        std::string config_file;
        app.add_option("-c,--config", config_file, "Configuration file path");
        
        bool log_to_file = false;
        app.add_flag("--log-to-file", log_to_file, "Log to the default log file when log_file is unset");
        
        auto config_cmd = std::make_unique<consolebar::cli::ConfigCommand>();
        auto run_cmd = std::make_unique<consolebar::cli::RunCommand>();
        auto multi_cmd = std::make_unique<consolebar::cli::MultiCommand>();
        
        run_cmd->setup(app.add_subcommand("run", "Drive a single progress bar"));
        multi_cmd->setup(app.add_subcommand("multi", "Drive several progress bars concurrently"));
        config_cmd->setup(app.add_subcommand("config", "Manage configuration"));
        
        CLI11_PARSE(app, argc, argv);
        
        auto& config = consolebar::common::Config::instance();
        bool config_loaded = config.load(config_file);
        initializeLogging(config.global(), log_to_file);
        if (!config_loaded) {
            std::cerr << "Warning: failed to load " << config.getConfigPath() << ", using defaults\n";
        }
        
        int result = 0;
        if (run_cmd->wasCalled()) {
            result = run_cmd->execute();
        } else if (multi_cmd->wasCalled()) {
            result = multi_cmd->execute();
        } else if (config_cmd->wasCalled()) {
            result = config_cmd->execute();
        } else {
            std::cout << app.help() << std::endl;
        }
        
        logger.shutdown();
        return result;
        
    } catch (const consolebar::common::ConsoleBarException& e) {
        logger.error("[Main] Failed | code={} | error={}", e.codeString(), e.what());
        logger.shutdown();
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        logger.error("[Main] Failed | error={}", e.what());
        logger.shutdown();
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
