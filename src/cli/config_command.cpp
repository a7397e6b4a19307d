#include "config_command.hpp"
#include "consolebar/common/config.hpp"
#include "consolebar/common/logger.hpp"
#include <iostream>

namespace consolebar {
namespace cli {

ConfigCommand::ConfigCommand() : was_called_(false) {}

void ConfigCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    init_cmd_ = subcommand->add_subcommand("init", "Write a configuration file with default values");
    init_cmd_->add_flag("-f,--force", init_force_, "Overwrite an existing file");
    init_cmd_->callback([this]() { was_called_ = true; });
    
    set_cmd_ = subcommand->add_subcommand("set", "Set a dotted configuration key and save");
    set_cmd_->add_option("key", set_key_, "Dotted key, e.g. bar.char_fill")->required();
    set_cmd_->add_option("value", set_value_, "New value")->required();
    set_cmd_->callback([this]() { was_called_ = true; });
    
    get_cmd_ = subcommand->add_subcommand("get", "Print the value of a dotted configuration key");
    get_cmd_->add_option("key", get_key_, "Dotted key, e.g. bar.char_fill")->required();
    get_cmd_->callback([this]() { was_called_ = true; });
    
    show_cmd_ = subcommand->add_subcommand("show", "Show effective configuration");
    show_cmd_->add_flag("--json", show_json_, "Print as JSON");
    show_cmd_->callback([this]() { was_called_ = true; });
    
    validate_cmd_ = subcommand->add_subcommand("validate", "Check the loaded configuration for invalid values");
    validate_cmd_->callback([this]() { was_called_ = true; });
}

bool ConfigCommand::wasCalled() const {
    return was_called_;
}

int ConfigCommand::execute() {
    if (init_cmd_->parsed()) {
        return executeInit();
    } else if (set_cmd_->parsed()) {
        return executeSet();
    } else if (get_cmd_->parsed()) {
        return executeGet();
    } else if (show_cmd_->parsed()) {
        return executeShow();
    } else if (validate_cmd_->parsed()) {
        return executeValidate();
    }
    
    std::cout << subcommand_->help() << std::endl;
    return 0;
}

int ConfigCommand::executeInit() {
    auto& config = common::Config::instance();
    std::string path = config.getConfigPath();
    
    if (config.exists() && !init_force_) {
        std::cerr << "Configuration already exists: " << path << "\n";
        std::cerr << "Use --force to overwrite.\n";
        return 1;
    }
    
    config.reset();
    if (!config.save(path)) {
        std::cerr << "Failed to write configuration: " << path << "\n";
        return 1;
    }
    
    std::cout << "Configuration written: " << path << "\n";
    return 0;
}

int ConfigCommand::executeSet() {
    auto& config = common::Config::instance();
    
    if (!config.setValue(set_key_, set_value_)) {
        std::cerr << "Invalid key or value: " << set_key_ << " = " << set_value_ << "\n";
        return 1;
    }
    
    auto errors = config.validate();
    if (!errors.empty()) {
        for (const auto& error : errors) {
            std::cerr << "Error: " << error << "\n";
        }
        return 1;
    }
    
    if (!config.save()) {
        std::cerr << "Failed to save configuration.\n";
        return 1;
    }
    
    std::cout << "Configuration updated: " << set_key_ << " = " << set_value_ << "\n";
    return 0;
}

int ConfigCommand::executeGet() {
    auto value = common::Config::instance().getValue(get_key_);
    if (!value) {
        std::cerr << "Unknown key: " << get_key_ << "\n";
        return 1;
    }
    
    std::cout << *value << "\n";
    return 0;
}

int ConfigCommand::executeShow() {
    auto& config = common::Config::instance();
    
    if (show_json_) {
        std::cout << config.toJson().dump(2) << std::endl;
        return 0;
    }
    
    std::cout << "# " << config.getConfigPath();
    std::cout << (config.exists() ? "\n" : " (not found, defaults)\n");
    
    for (const auto& key : common::Config::knownKeys()) {
        auto value = config.getValue(key);
        std::cout << key << " = \"" << value.value_or("") << "\"\n";
    }
    return 0;
}

int ConfigCommand::executeValidate() {
    auto errors = common::Config::instance().validate();
    
    if (errors.empty()) {
        std::cout << "Configuration is valid\n";
        return 0;
    }
    
    for (const auto& error : errors) {
        std::cerr << "Error: " << error << "\n";
    }
    return 1;
}

}}
