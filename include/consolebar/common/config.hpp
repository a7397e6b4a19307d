#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstddef>

namespace consolebar {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

struct LoggingConfig {
    size_t rotation_size_mb;
    size_t max_files;
    LogFormat format;
};

struct BarStyleConfig {
    int bar_length;
    int text_space;
    char char_fill;
    char char_empty;
    bool show_percentage;
    std::string percentage_format;
    std::string bar_opening;
    std::string bar_closing;
};

struct DemoConfig {
    int steps;
    int delay_ms;
    int threads;
};

struct GlobalConfig {
    LogLevel log_level;
    std::string log_file;
    LoggingConfig logging;
    BarStyleConfig bar;
    DemoConfig demo;
};

class Config {
public:
    static Config& instance();
    
    bool load(const std::string& config_file = "");
    bool save(const std::string& config_file = "");
    bool exists() const;
    void reset();
    
    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }
    
    bool setValue(const std::string& key, const std::string& value);
    std::optional<std::string> getValue(const std::string& key) const;
    
    std::vector<std::string> validate() const;
    
    // Effective configuration grouped by section, with typed values.
    nlohmann::json toJson() const;
    
    std::string getConfigPath() const;
    std::optional<std::string> findBestConfig() const;
    
    static GlobalConfig createDefaultConfig();
    static std::vector<std::string> knownKeys();

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;
    
    bool tryLoadTomlFile(const std::string& path);
};

std::string logLevelToString(LogLevel level);
std::optional<LogLevel> parseLogLevel(const std::string& value);

}}
