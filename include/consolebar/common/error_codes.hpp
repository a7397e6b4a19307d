#pragma once

#include "error_framework.hpp"
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace consolebar {
namespace common {

enum class ErrorCode {
    INVALID_ARGUMENT = 100,
    NOT_STARTED = 200,
    COMPUTATION_ERROR = 300,
    IO_ERROR = 400
};

using ErrorCodeHelper = ErrorRegistry<ErrorCode>;

template<>
inline const std::unordered_map<ErrorCode, ErrorInfo<ErrorCode>>& 
ErrorRegistry<ErrorCode>::getInfoMap() {
    static const std::unordered_map<ErrorCode, ErrorInfo<ErrorCode>> map = {
        {ErrorCode::INVALID_ARGUMENT, {
            ErrorCode::INVALID_ARGUMENT,
            "INVALID_ARGUMENT",
            "Invalid argument"
        }},
        {ErrorCode::NOT_STARTED, {
            ErrorCode::NOT_STARTED,
            "NOT_STARTED",
            "Progress bar has not been started"
        }},
        {ErrorCode::COMPUTATION_ERROR, {
            ErrorCode::COMPUTATION_ERROR,
            "COMPUTATION_ERROR",
            "Progress value cannot be rendered"
        }},
        {ErrorCode::IO_ERROR, {
            ErrorCode::IO_ERROR,
            "IO_ERROR",
            "Terminal I/O failed"
        }}
    };
    return map;
}

class ConsoleBarException : public std::runtime_error {
public:
    ConsoleBarException(ErrorCode code, const std::string& detail)
        : std::runtime_error(buildMessage(code, detail)), code_(code) {}
    
    explicit ConsoleBarException(ErrorCode code)
        : ConsoleBarException(code, "") {}
    
    ErrorCode code() const noexcept { return code_; }
    const char* codeString() const noexcept { return ErrorCodeHelper::toString(code_); }

private:
    ErrorCode code_;
    
    static std::string buildMessage(ErrorCode code, const std::string& detail) {
        std::string message = ErrorCodeHelper::getMessage(code);
        if (!detail.empty()) {
            message += ": " + detail;
        }
        return message;
    }
};

}}
