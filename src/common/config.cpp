#include "consolebar/common/config.hpp"
#include "consolebar/common/constants.hpp"
#include "consolebar/common/paths.hpp"
#include "consolebar/common/logger.hpp"
#include <toml.hpp>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <filesystem>
#include <unistd.h>

namespace consolebar {
namespace common {

namespace {

std::optional<char> parseGlyph(const std::string& value) {
    if (value.size() != 1) {
        return std::nullopt;
    }
    return value[0];
}

// Whole-string integer; trailing characters are rejected.
int parseInt(const std::string& value) {
    size_t pos = 0;
    int result = std::stoi(value, &pos);
    if (pos != value.size()) {
        throw std::invalid_argument("trailing characters in '" + value + "'");
    }
    return result;
}

size_t parseSize(const std::string& value) {
    if (value.empty() || value[0] == '-' || value[0] == '+' || std::isspace(static_cast<unsigned char>(value[0]))) {
        throw std::invalid_argument("expected an unsigned number, got '" + value + "'");
    }
    size_t pos = 0;
    unsigned long long result = std::stoull(value, &pos);
    if (pos != value.size()) {
        throw std::invalid_argument("trailing characters in '" + value + "'");
    }
    return static_cast<size_t>(result);
}

std::optional<bool> parseBool(const std::string& value) {
    if (value == "true" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "0" || value == "no") return false;
    return std::nullopt;
}

}

std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
    }
    return "INFO";
}

std::optional<LogLevel> parseLogLevel(const std::string& value) {
    if (value == "DEBUG") return LogLevel::DEBUG;
    if (value == "INFO") return LogLevel::INFO;
    if (value == "WARN") return LogLevel::WARN;
    if (value == "ERROR") return LogLevel::ERROR;
    return std::nullopt;
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants;
    
    GlobalConfig config;
    
    config.log_level = LogLevel::WARN;
    config.log_file = "";
    
    config.logging.rotation_size_mb = config_defaults::LOG_ROTATION_SIZE_MB;
    config.logging.max_files = config_defaults::LOG_MAX_FILES;
    config.logging.format = LogFormat::TEXT;
    
    config.bar.bar_length = bar_defaults::BAR_LENGTH;
    config.bar.text_space = bar_defaults::TEXT_SPACE;
    config.bar.char_fill = bar_defaults::CHAR_FILL;
    config.bar.char_empty = bar_defaults::CHAR_EMPTY;
    config.bar.show_percentage = bar_defaults::SHOW_PERCENTAGE;
    config.bar.percentage_format = bar_defaults::PERCENTAGE_FORMAT;
    config.bar.bar_opening = bar_defaults::BAR_OPENING;
    config.bar.bar_closing = bar_defaults::BAR_CLOSING;
    
    config.demo.steps = config_defaults::DEMO_STEPS;
    config.demo.delay_ms = config_defaults::DEMO_DELAY_MS;
    config.demo.threads = config_defaults::DEMO_THREADS;
    
    return config;
}

std::vector<std::string> Config::knownKeys() {
    return {
        "log_level", "log_file",
        "logging.rotation_size_mb", "logging.max_files", "logging.format",
        "bar.bar_length", "bar.text_space", "bar.char_fill", "bar.char_empty",
        "bar.show_percentage", "bar.percentage_format", "bar.bar_opening", "bar.bar_closing",
        "demo.steps", "demo.delay_ms", "demo.threads"
    };
}

void Config::reset() {
    global_ = createDefaultConfig();
    current_config_path_.clear();
}

std::optional<std::string> Config::findBestConfig() const {
    auto paths = PathManager::instance().getConfigSearchPaths();
    
    for (const auto& path : paths) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }
    
    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    global_ = createDefaultConfig();
    
    std::string effective_config_file = config_file;
    if (effective_config_file.empty()) {
        auto best = findBestConfig();
        effective_config_file = best ? *best : PathManager::instance().getConfigFile();
    }
    
    current_config_path_ = effective_config_file;
    
    if (!std::filesystem::exists(effective_config_file)) {
        Logger::instance().debug("[Config] Not found, using defaults | path={}", effective_config_file);
        return true;
    }
    
    return tryLoadTomlFile(effective_config_file);
}

bool Config::tryLoadTomlFile(const std::string& path) {
    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().warn("[Config] Not readable | path={}", path);
        return false;
    }
    
    try {
        auto data = toml::parse(path);
        
        if (data.contains("global")) {
            auto global_section = data.at("global");
            
            if (global_section.contains("log_level")) {
                auto level = parseLogLevel(toml::find<std::string>(global_section, "log_level"));
                if (level) global_.log_level = *level;
            }
            if (global_section.contains("log_file")) {
                global_.log_file = toml::find<std::string>(global_section, "log_file");
            }
        }
        
        if (data.contains("logging")) {
            auto logging_section = data.at("logging");
            
            if (logging_section.contains("rotation_size_mb")) {
                global_.logging.rotation_size_mb = toml::find<size_t>(logging_section, "rotation_size_mb");
            }
            if (logging_section.contains("max_files")) {
                global_.logging.max_files = toml::find<size_t>(logging_section, "max_files");
            }
            if (logging_section.contains("format")) {
                std::string format_str = toml::find<std::string>(logging_section, "format");
                global_.logging.format = (format_str == "json") ? LogFormat::JSON : LogFormat::TEXT;
            }
        }
        
        if (data.contains("bar")) {
            auto bar_section = data.at("bar");
            
            if (bar_section.contains("bar_length")) {
                global_.bar.bar_length = toml::find<int>(bar_section, "bar_length");
            }
            if (bar_section.contains("text_space")) {
                global_.bar.text_space = toml::find<int>(bar_section, "text_space");
            }
            if (bar_section.contains("char_fill")) {
                auto glyph = parseGlyph(toml::find<std::string>(bar_section, "char_fill"));
                if (glyph) global_.bar.char_fill = *glyph;
            }
            if (bar_section.contains("char_empty")) {
                auto glyph = parseGlyph(toml::find<std::string>(bar_section, "char_empty"));
                if (glyph) global_.bar.char_empty = *glyph;
            }
            if (bar_section.contains("show_percentage")) {
                global_.bar.show_percentage = toml::find<bool>(bar_section, "show_percentage");
            }
            if (bar_section.contains("percentage_format")) {
                global_.bar.percentage_format = toml::find<std::string>(bar_section, "percentage_format");
            }
            if (bar_section.contains("bar_opening")) {
                global_.bar.bar_opening = toml::find<std::string>(bar_section, "bar_opening");
            }
            if (bar_section.contains("bar_closing")) {
                global_.bar.bar_closing = toml::find<std::string>(bar_section, "bar_closing");
            }
        }
        
        if (data.contains("demo")) {
            auto demo_section = data.at("demo");
            
            if (demo_section.contains("steps")) {
                global_.demo.steps = toml::find<int>(demo_section, "steps");
            }
            if (demo_section.contains("delay_ms")) {
                global_.demo.delay_ms = toml::find<int>(demo_section, "delay_ms");
            }
            if (demo_section.contains("threads")) {
                global_.demo.threads = toml::find<int>(demo_section, "threads");
            }
        }
        
        Logger::instance().info("[Config] Loaded | path={}", path);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Parse failed | path={} | error={}", path, e.what());
        return false;
    }
}

bool Config::save(const std::string& config_file) {
    std::string effective_config_file = config_file;
    if (effective_config_file.empty()) {
        effective_config_file = current_config_path_.empty() 
            ? PathManager::instance().getConfigFile() 
            : current_config_path_;
    }
    
    try {
        std::filesystem::path config_dir = std::filesystem::path(effective_config_file).parent_path();
        if (!config_dir.empty() && !std::filesystem::exists(config_dir)) {
            std::filesystem::create_directories(config_dir);
        }
        
        toml::value data = toml::table{
            {"global", toml::table{
                {"log_level", logLevelToString(global_.log_level)},
                {"log_file", global_.log_file}
            }},
            {"logging", toml::table{
                {"rotation_size_mb", global_.logging.rotation_size_mb},
                {"max_files", global_.logging.max_files},
                {"format", global_.logging.format == LogFormat::JSON ? "json" : "text"}
            }},
            {"bar", toml::table{
                {"bar_length", global_.bar.bar_length},
                {"text_space", global_.bar.text_space},
                {"char_fill", std::string(1, global_.bar.char_fill)},
                {"char_empty", std::string(1, global_.bar.char_empty)},
                {"show_percentage", global_.bar.show_percentage},
                {"percentage_format", global_.bar.percentage_format},
                {"bar_opening", global_.bar.bar_opening},
                {"bar_closing", global_.bar.bar_closing}
            }},
            {"demo", toml::table{
                {"steps", global_.demo.steps},
                {"delay_ms", global_.demo.delay_ms},
                {"threads", global_.demo.threads}
            }}
        };
        
        std::ofstream file(effective_config_file);
        if (!file) {
            Logger::instance().error("[Config] File open failed | path={}", effective_config_file);
            return false;
        }
        
        file << toml::format(data);
        file.close();
        if (!file) {
            Logger::instance().error("[Config] Write failed | path={}", effective_config_file);
            return false;
        }
        
        current_config_path_ = effective_config_file;
        
        Logger::instance().info("[Config] Saved | path={}", effective_config_file);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Save failed | path={} | error={}", effective_config_file, e.what());
        return false;
    }
}

bool Config::exists() const {
    return std::filesystem::exists(getConfigPath());
}

bool Config::setValue(const std::string& key, const std::string& value) {
    try {
        if (key == "log_level") {
            auto level = parseLogLevel(value);
            if (!level) return false;
            global_.log_level = *level;
        }
        else if (key == "log_file") global_.log_file = value;
        else if (key == "logging.rotation_size_mb") global_.logging.rotation_size_mb = parseSize(value);
        else if (key == "logging.max_files") global_.logging.max_files = parseSize(value);
        else if (key == "logging.format") {
            if (value != "json" && value != "text") return false;
            global_.logging.format = (value == "json") ? LogFormat::JSON : LogFormat::TEXT;
        }
        else if (key == "bar.bar_length") global_.bar.bar_length = parseInt(value);
        else if (key == "bar.text_space") global_.bar.text_space = parseInt(value);
        else if (key == "bar.char_fill" || key == "bar.char_empty") {
            auto glyph = parseGlyph(value);
            if (!glyph) return false;
            (key == "bar.char_fill" ? global_.bar.char_fill : global_.bar.char_empty) = *glyph;
        }
        else if (key == "bar.show_percentage") {
            auto flag = parseBool(value);
            if (!flag) return false;
            global_.bar.show_percentage = *flag;
        }
        else if (key == "bar.percentage_format") global_.bar.percentage_format = value;
        else if (key == "bar.bar_opening") global_.bar.bar_opening = value;
        else if (key == "bar.bar_closing") global_.bar.bar_closing = value;
        else if (key == "demo.steps") global_.demo.steps = parseInt(value);
        else if (key == "demo.delay_ms") global_.demo.delay_ms = parseInt(value);
        else if (key == "demo.threads") global_.demo.threads = parseInt(value);
        else {
            Logger::instance().warn("[Config] Unknown key | key={}", key);
            return false;
        }
    } catch (const std::exception& e) {
        Logger::instance().warn("[Config] Invalid value | key={} | value={} | error={}", key, value, e.what());
        return false;
    }
    
    return true;
}

std::optional<std::string> Config::getValue(const std::string& key) const {
    if (key == "log_level") return logLevelToString(global_.log_level);
    else if (key == "log_file") return global_.log_file;
    else if (key == "logging.rotation_size_mb") return std::to_string(global_.logging.rotation_size_mb);
    else if (key == "logging.max_files") return std::to_string(global_.logging.max_files);
    else if (key == "logging.format") return global_.logging.format == LogFormat::JSON ? "json" : "text";
    else if (key == "bar.bar_length") return std::to_string(global_.bar.bar_length);
    else if (key == "bar.text_space") return std::to_string(global_.bar.text_space);
    else if (key == "bar.char_fill") return std::string(1, global_.bar.char_fill);
    else if (key == "bar.char_empty") return std::string(1, global_.bar.char_empty);
    else if (key == "bar.show_percentage") return global_.bar.show_percentage ? "true" : "false";
    else if (key == "bar.percentage_format") return global_.bar.percentage_format;
    else if (key == "bar.bar_opening") return global_.bar.bar_opening;
    else if (key == "bar.bar_closing") return global_.bar.bar_closing;
    else if (key == "demo.steps") return std::to_string(global_.demo.steps);
    else if (key == "demo.delay_ms") return std::to_string(global_.demo.delay_ms);
    else if (key == "demo.threads") return std::to_string(global_.demo.threads);
    
    return std::nullopt;
}

std::vector<std::string> Config::validate() const {
    std::vector<std::string> errors;
    
    if (global_.bar.bar_length < 0) {
        errors.push_back("bar.bar_length must not be negative");
    }
    if (global_.bar.text_space < 0) {
        errors.push_back("bar.text_space must not be negative");
    }
    if (global_.demo.steps <= 0) {
        errors.push_back("demo.steps must be positive");
    }
    if (global_.demo.delay_ms < 0) {
        errors.push_back("demo.delay_ms must not be negative");
    }
    if (global_.demo.threads <= 0) {
        errors.push_back("demo.threads must be positive");
    }
    if (global_.logging.max_files == 0) {
        errors.push_back("logging.max_files must be positive");
    }
    if (global_.logging.rotation_size_mb == 0) {
        errors.push_back("logging.rotation_size_mb must be positive");
    }
    
    return errors;
}

nlohmann::json Config::toJson() const {
    nlohmann::json json;
    
    json["global"]["log_level"] = logLevelToString(global_.log_level);
    json["global"]["log_file"] = global_.log_file;
    
    json["logging"]["rotation_size_mb"] = global_.logging.rotation_size_mb;
    json["logging"]["max_files"] = global_.logging.max_files;
    json["logging"]["format"] = global_.logging.format == LogFormat::JSON ? "json" : "text";
    
    nlohmann::json bar;
    bar["bar_length"] = global_.bar.bar_length;
    bar["text_space"] = global_.bar.text_space;
    bar["char_fill"] = std::string(1, global_.bar.char_fill);
    bar["char_empty"] = std::string(1, global_.bar.char_empty);
    bar["show_percentage"] = global_.bar.show_percentage;
    bar["percentage_format"] = global_.bar.percentage_format;
    bar["bar_opening"] = global_.bar.bar_opening;
    bar["bar_closing"] = global_.bar.bar_closing;
    json["bar"] = bar;
    
    json["demo"]["steps"] = global_.demo.steps;
    json["demo"]["delay_ms"] = global_.demo.delay_ms;
    json["demo"]["threads"] = global_.demo.threads;
    
    json["metadata"]["path"] = getConfigPath();
    json["metadata"]["exists"] = exists();
    
    return json;
}

std::string Config::getConfigPath() const {
    if (!current_config_path_.empty()) {
        return current_config_path_;
    }
    return PathManager::instance().getConfigFile();
}

}}
