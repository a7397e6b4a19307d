#pragma once

#include <string>
#include <cstddef>

namespace consolebar {
namespace constants {

namespace version {
    constexpr const char* CLI_VERSION = "1.2.0";
    
    inline std::string getFullVersion() {
        return std::string("consolebar v") + CLI_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "consolebar";
    constexpr const char* LOGGER_NAME = "consolebar";
    constexpr const char* CONFIG_ENV = "CONSOLEBAR_CONFIG";
    constexpr const char* CONFIG_FILE_NAME = "consolebar.toml";
    constexpr const char* LOG_FILE_NAME = "consolebar.log";
}

namespace bar_defaults {
    constexpr int BAR_LENGTH = 30;
    constexpr int TEXT_SPACE = 50;
    constexpr char CHAR_FILL = '#';
    constexpr char CHAR_EMPTY = '-';
    constexpr bool SHOW_PERCENTAGE = true;
    constexpr const char* PERCENTAGE_FORMAT = "0%";
    constexpr const char* BAR_OPENING = "[ ";
    constexpr const char* BAR_CLOSING = " ] ";
}

namespace terminal {
    constexpr int CURSOR_QUERY_TIMEOUT_MS = 500;
    constexpr size_t CURSOR_REPLY_MAX_BYTES = 32;
}

namespace config_defaults {
    constexpr size_t LOG_ROTATION_SIZE_MB = 10;
    constexpr size_t LOG_MAX_FILES = 3;
    
    constexpr int DEMO_STEPS = 100;
    constexpr int DEMO_DELAY_MS = 30;
    constexpr int DEMO_THREADS = 4;
}

}}
