#pragma once

#include "config.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <memory>
#include <mutex>
#include <string>

namespace consolebar {
namespace common {

enum class LogMode {
    CONSOLE_ONLY,
    FILE_ONLY
};

class Logger {
public:
    static Logger& instance();
    
    void initialize(LogMode mode, const std::string& log_file, LogLevel level, const LoggingConfig& logging_config);
    void setLevel(LogLevel level);
    void shutdown();
    
    template<typename... Args>
    void error(const std::string& format, Args&&... args) {
        if (auto logger = current()) logger->error(fmt::runtime(format), std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void warn(const std::string& format, Args&&... args) {
        if (auto logger = current()) logger->warn(fmt::runtime(format), std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void info(const std::string& format, Args&&... args) {
        if (auto logger = current()) logger->info(fmt::runtime(format), std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void debug(const std::string& format, Args&&... args) {
        if (auto logger = current()) logger->debug(fmt::runtime(format), std::forward<Args>(args)...);
    }
    
    void flush();
    
    bool isInitialized() const;

private:
    Logger() = default;
    
    mutable std::mutex mutex_;
    std::shared_ptr<spdlog::logger> logger_;
    bool initialized_ = false;
    
    std::shared_ptr<spdlog::logger> current() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return logger_;
    }
    
    static spdlog::level::level_enum toSpdlogLevel(LogLevel level);
    static std::string getLogFileWithSuffix(LogFormat format, const std::string& base_path);
};

}}
