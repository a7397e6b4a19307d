#include "consolebar/common/logger.hpp"
#include "consolebar/common/error_codes.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using consolebar::common::ConsoleBarException;
using consolebar::common::ErrorCode;
using consolebar::common::ErrorCodeHelper;
using consolebar::common::LogFormat;
using consolebar::common::Logger;
using consolebar::common::LoggingConfig;
using consolebar::common::LogLevel;
using consolebar::common::LogMode;

namespace fs = std::filesystem;

class LoggerTest : public ::testing::Test {
protected:
    fs::path dir_;
    
    void SetUp() override {
        Logger::instance().shutdown();
        dir_ = fs::temp_directory_path() / ("consolebar_logger_test_" + std::to_string(getpid()));
        fs::create_directories(dir_);
    }
    
    void TearDown() override {
        Logger::instance().shutdown();
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }
    
    static std::string readAll(const fs::path& path) {
        std::ifstream in(path);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }
};

TEST_F(LoggerTest, LoggingBeforeInitializeIsIgnored) {
    EXPECT_FALSE(Logger::instance().isInitialized());
    Logger::instance().info("[Test] Dropped | value={}", 1);
    Logger::instance().flush();
}

TEST_F(LoggerTest, FileModeWritesFormattedMessages) {
    fs::path log_file = dir_ / "run.log";
    LoggingConfig logging{1, 2, LogFormat::TEXT};
    
    auto& logger = Logger::instance();
    logger.initialize(LogMode::FILE_ONLY, log_file.string(), LogLevel::INFO, logging);
    ASSERT_TRUE(logger.isInitialized());
    
    logger.info("[Test] Step | current={} | total={}", 3, 10);
    logger.debug("[Test] Hidden");
    logger.flush();
    
    std::string content = readAll(log_file);
    EXPECT_NE(content.find("[Test] Step | current=3 | total=10"), std::string::npos);
    EXPECT_EQ(content.find("[Test] Hidden"), std::string::npos);
}

TEST_F(LoggerTest, SetLevelFiltersLaterMessages) {
    fs::path log_file = dir_ / "level.log";
    LoggingConfig logging{1, 2, LogFormat::TEXT};
    
    auto& logger = Logger::instance();
    logger.initialize(LogMode::FILE_ONLY, log_file.string(), LogLevel::DEBUG, logging);
    logger.setLevel(LogLevel::ERROR);
    
    logger.warn("[Test] Suppressed");
    logger.error("[Test] Kept");
    logger.flush();
    
    std::string content = readAll(log_file);
    EXPECT_EQ(content.find("Suppressed"), std::string::npos);
    EXPECT_NE(content.find("Kept"), std::string::npos);
}

TEST_F(LoggerTest, JsonFormatUsesJsonFileName) {
    fs::path log_file = dir_ / "run.log";
    LoggingConfig logging{1, 2, LogFormat::JSON};
    
    auto& logger = Logger::instance();
    logger.initialize(LogMode::FILE_ONLY, log_file.string(), LogLevel::INFO, logging);
    logger.info("[Test] Json");
    logger.flush();
    
    fs::path json_file = dir_ / "run.json.log";
    ASSERT_TRUE(fs::exists(json_file));
    std::string content = readAll(json_file);
    EXPECT_NE(content.find("\"level\":\"info\""), std::string::npos);
    EXPECT_NE(content.find("\"message\":\"[Test] Json\""), std::string::npos);
}

TEST(ErrorCodeTest, RegistryNamesEveryCode) {
    EXPECT_STREQ(ErrorCodeHelper::toString(ErrorCode::INVALID_ARGUMENT), "INVALID_ARGUMENT");
    EXPECT_STREQ(ErrorCodeHelper::toString(ErrorCode::NOT_STARTED), "NOT_STARTED");
    EXPECT_STREQ(ErrorCodeHelper::toString(ErrorCode::COMPUTATION_ERROR), "COMPUTATION_ERROR");
    EXPECT_STREQ(ErrorCodeHelper::toString(ErrorCode::IO_ERROR), "IO_ERROR");
    EXPECT_STREQ(ErrorCodeHelper::toString(static_cast<ErrorCode>(7)), "UNKNOWN");
}

TEST(ErrorCodeTest, ExceptionCarriesCodeAndDetail) {
    ConsoleBarException with_detail(ErrorCode::NOT_STARTED, "call start() first");
    EXPECT_EQ(with_detail.code(), ErrorCode::NOT_STARTED);
    EXPECT_STREQ(with_detail.codeString(), "NOT_STARTED");
    EXPECT_STREQ(with_detail.what(), "Progress bar has not been started: call start() first");
    
    ConsoleBarException bare(ErrorCode::IO_ERROR);
    EXPECT_STREQ(bare.what(), "Terminal I/O failed");
}
