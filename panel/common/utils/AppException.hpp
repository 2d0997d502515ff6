#pragma once

#include "ErrorCodes.hpp"

#include <exception>
#include <string>
#include <utility>

/**
 * @brief 应用异常基类
 */
class AppException : public std::exception {
private:
    int code_;
    std::string message_;

public:
    AppException(int code, std::string message)
        : code_(code), message_(std::move(message)) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    int getCode() const { return code_; }
    const std::string& getMessage() const { return message_; }
};

/**
 * @brief 参数/配置验证失败
 *
 * 属于调用方编程错误，同步抛出，不经过事件循环
 */
class ValidationException : public AppException {
public:
    explicit ValidationException(const std::string& message = "验证失败")
        : AppException(ErrorCodes::BAD_REQUEST, message) {}
};
