#include "consolebar/common/logger.hpp"
#include "consolebar/common/constants.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <filesystem>
#include <vector>

namespace consolebar {
namespace common {

namespace {

constexpr const char* TEXT_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";
constexpr const char* JSON_PATTERN = R"({"timestamp":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","thread":%t,"message":"%v"})";

spdlog::sink_ptr makeConsoleSink(spdlog::level::level_enum level) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(level);
    return console_sink;
}

}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(LogMode mode, const std::string& log_file, LogLevel level, const LoggingConfig& logging_config) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (initialized_) {
        if (logger_) {
            logger_->warn("[Logger] Already initialized, ignoring duplicate initialization");
        }
        return;
    }
    
    auto spdlog_level = toSpdlogLevel(level);
    std::vector<spdlog::sink_ptr> sinks;
    LogFormat effective_format = LogFormat::TEXT;
    
    if (mode == LogMode::FILE_ONLY && log_file.empty()) {
        std::cerr << "[Logger] Log file path required for FILE_ONLY mode, using console" << std::endl;
        mode = LogMode::CONSOLE_ONLY;
    }
    
    if (mode == LogMode::FILE_ONLY) {
        std::string effective_log_file = getLogFileWithSuffix(logging_config.format, log_file);
        std::filesystem::path log_dir = std::filesystem::path(effective_log_file).parent_path();
        
        std::error_code ec;
        if (!log_dir.empty() && !std::filesystem::exists(log_dir, ec)) {
            std::filesystem::create_directories(log_dir, ec);
        }
        
        try {
            size_t max_size = logging_config.rotation_size_mb * 1024 * 1024;
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                effective_log_file, max_size, logging_config.max_files);
            file_sink->set_level(spdlog_level);
            sinks.push_back(file_sink);
            effective_format = logging_config.format;
        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "[Logger] Failed to open log file: " << effective_log_file
                      << " - " << ex.what() << std::endl;
            std::cerr << "[Logger] Falling back to console output" << std::endl;
            sinks.push_back(makeConsoleSink(spdlog_level));
        }
    } else {
        sinks.push_back(makeConsoleSink(spdlog_level));
    }
    
    spdlog::drop(constants::system::LOGGER_NAME);
    logger_ = std::make_shared<spdlog::logger>(constants::system::LOGGER_NAME, sinks.begin(), sinks.end());
    logger_->set_pattern(effective_format == LogFormat::JSON ? JSON_PATTERN : TEXT_PATTERN);
    logger_->set_level(spdlog_level);
    
    if (mode == LogMode::FILE_ONLY) {
        logger_->flush_on(spdlog::level::warn);
    }
    
    spdlog::register_logger(logger_);
    initialized_ = true;
}

void Logger::setLevel(LogLevel level) {
    if (auto logger = current()) {
        logger->set_level(toSpdlogLevel(level));
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->flush();
        spdlog::drop(constants::system::LOGGER_NAME);
        logger_.reset();
    }
    initialized_ = false;
}

void Logger::flush() {
    if (auto logger = current()) {
        logger->flush();
    }
}

bool Logger::isInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

spdlog::level::level_enum Logger::toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::DEBUG: return spdlog::level::debug;
    }
    return spdlog::level::info;
}

std::string Logger::getLogFileWithSuffix(LogFormat format, const std::string& base_path) {
    if (format != LogFormat::JSON) {
        return base_path;
    }
    
    std::filesystem::path p(base_path);
    std::filesystem::path json_name = p.stem().string() + ".json" + p.extension().string();
    return p.has_parent_path() ? (p.parent_path() / json_name).string() : json_name.string();
}

}}
