#include "consolebar/common/config.hpp"
#include "consolebar/bar/bar_config.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using consolebar::bar::BarConfig;
using consolebar::common::Config;
using consolebar::common::LogFormat;
using consolebar::common::LogLevel;

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path dir_;
    
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("consolebar_config_test_" + std::to_string(getpid()));
        fs::create_directories(dir_);
        Config::instance().reset();
    }
    
    void TearDown() override {
        Config::instance().reset();
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }
    
    std::string writeFile(const std::string& name, const std::string& content) {
        fs::path path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }
};

TEST_F(ConfigTest, MissingFileKeepsDefaults) {
    auto& config = Config::instance();
    
    EXPECT_TRUE(config.load((dir_ / "absent.toml").string()));
    EXPECT_EQ(config.global().log_level, LogLevel::WARN);
    EXPECT_EQ(config.global().bar.bar_length, 30);
    EXPECT_EQ(config.global().bar.text_space, 50);
    EXPECT_EQ(config.global().bar.percentage_format, "0%");
    EXPECT_TRUE(config.validate().empty());
}

TEST_F(ConfigTest, LoadsSectionsFromToml) {
    std::string path = writeFile("style.toml",
        "[global]\n"
        "log_level = \"DEBUG\"\n"
        "\n"
        "[logging]\n"
        "format = \"json\"\n"
        "max_files = 7\n"
        "\n"
        "[bar]\n"
        "bar_length = 12\n"
        "char_fill = \"=\"\n"
        "show_percentage = false\n"
        "bar_opening = \"<\"\n"
        "\n"
        "[demo]\n"
        "threads = 2\n");
    
    auto& config = Config::instance();
    ASSERT_TRUE(config.load(path));
    
    const auto& global = config.global();
    EXPECT_EQ(global.log_level, LogLevel::DEBUG);
    EXPECT_EQ(global.logging.format, LogFormat::JSON);
    EXPECT_EQ(global.logging.max_files, 7u);
    EXPECT_EQ(global.bar.bar_length, 12);
    EXPECT_EQ(global.bar.char_fill, '=');
    EXPECT_FALSE(global.bar.show_percentage);
    EXPECT_EQ(global.bar.bar_opening, "<");
    EXPECT_EQ(global.bar.bar_closing, " ] ");
    EXPECT_EQ(global.demo.threads, 2);
    EXPECT_EQ(config.getConfigPath(), path);
}

TEST_F(ConfigTest, MalformedTomlFailsToLoad) {
    std::string path = writeFile("broken.toml", "[bar\nbar_length = \n");
    
    EXPECT_FALSE(Config::instance().load(path));
}

TEST_F(ConfigTest, SavedValuesSurviveReload) {
    auto& config = Config::instance();
    ASSERT_TRUE(config.setValue("bar.char_empty", "."));
    ASSERT_TRUE(config.setValue("bar.percentage_format", "0.0%"));
    ASSERT_TRUE(config.setValue("demo.steps", "250"));
    
    std::string path = (dir_ / "nested" / "consolebar.toml").string();
    ASSERT_TRUE(config.save(path));
    
    config.reset();
    EXPECT_EQ(config.global().demo.steps, 100);
    
    ASSERT_TRUE(config.load(path));
    EXPECT_EQ(config.getValue("bar.char_empty"), std::optional<std::string>("."));
    EXPECT_EQ(config.getValue("bar.percentage_format"), std::optional<std::string>("0.0%"));
    EXPECT_EQ(config.getValue("demo.steps"), std::optional<std::string>("250"));
}

TEST_F(ConfigTest, SetValueRejectsBadInput) {
    auto& config = Config::instance();
    
    EXPECT_FALSE(config.setValue("bar.char_fill", "##"));
    EXPECT_FALSE(config.setValue("bar.show_percentage", "maybe"));
    EXPECT_FALSE(config.setValue("bar.bar_length", "long"));
    EXPECT_FALSE(config.setValue("log_level", "LOUD"));
    EXPECT_FALSE(config.setValue("no.such.key", "1"));
    
    EXPECT_EQ(config.global().bar.char_fill, '#');
    EXPECT_TRUE(config.global().bar.show_percentage);
    EXPECT_EQ(config.global().bar.bar_length, 30);
}

TEST_F(ConfigTest, EveryKnownKeyIsReadable) {
    auto& config = Config::instance();
    
    for (const auto& key : Config::knownKeys()) {
        EXPECT_TRUE(config.getValue(key).has_value()) << key;
    }
    EXPECT_FALSE(config.getValue("bar.colour").has_value());
}

TEST_F(ConfigTest, ValidateReportsNegativeLengths) {
    auto& config = Config::instance();
    ASSERT_TRUE(config.setValue("bar.bar_length", "-4"));
    ASSERT_TRUE(config.setValue("demo.threads", "0"));
    
    auto errors = config.validate();
    
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0], "bar.bar_length must not be negative");
    EXPECT_EQ(errors[1], "demo.threads must be positive");
}

TEST_F(ConfigTest, BarConfigFollowsStyleSection) {
    auto& config = Config::instance();
    ASSERT_TRUE(config.setValue("bar.bar_length", "8"));
    ASSERT_TRUE(config.setValue("bar.bar_closing", "|"));
    
    BarConfig bar = BarConfig::fromStyle(config.global().bar);
    
    EXPECT_EQ(bar.bar_length, 8);
    EXPECT_EQ(bar.bar_closing, "|");
    EXPECT_EQ(bar.char_fill, '#');
}

TEST_F(ConfigTest, JsonViewKeepsValueTypes) {
    auto& config = Config::instance();
    ASSERT_TRUE(config.setValue("bar.show_percentage", "no"));
    ASSERT_TRUE(config.setValue("demo.delay_ms", "5"));
    
    auto json = config.toJson();
    
    EXPECT_EQ(json["bar"]["show_percentage"], false);
    EXPECT_EQ(json["bar"]["bar_length"], 30);
    EXPECT_EQ(json["bar"]["char_fill"], "#");
    EXPECT_EQ(json["demo"]["delay_ms"], 5);
    EXPECT_EQ(json["global"]["log_level"], "WARN");
    EXPECT_TRUE(json["metadata"].contains("path"));
}

TEST_F(ConfigTest, SetValueRejectsSignedOrPartialNumbers) {
    auto& config = Config::instance();
    
    EXPECT_FALSE(config.setValue("logging.max_files", "-1"));
    EXPECT_FALSE(config.setValue("logging.rotation_size_mb", "+5"));
    EXPECT_FALSE(config.setValue("logging.rotation_size_mb", "5mb"));
    EXPECT_FALSE(config.setValue("bar.bar_length", "12abc"));
    EXPECT_FALSE(config.setValue("demo.steps", "3.5"));
    
    EXPECT_EQ(config.global().logging.max_files, 3u);
    EXPECT_EQ(config.global().logging.rotation_size_mb, 10u);
    EXPECT_EQ(config.global().bar.bar_length, 30);
    EXPECT_EQ(config.global().demo.steps, 100);
    
    EXPECT_TRUE(config.setValue("logging.max_files", "5"));
    EXPECT_EQ(config.global().logging.max_files, 5u);
}
