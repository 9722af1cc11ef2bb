#pragma once

#include "ErrorCodes.hpp"

/**
 * @brief 应用异常基类
 */
class AppException : public std::exception {
public:
    using HttpStatusCode = drogon::HttpStatusCode;
    using enum drogon::HttpStatusCode;

private:
    int code_;
    std::string message_;
    HttpStatusCode status_;

public:
    AppException(int code, std::string message, HttpStatusCode status = k400BadRequest)
        : code_(code), message_(std::move(message)), status_(status) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    int getCode() const { return code_; }
    const std::string& getMessage() const { return message_; }
    HttpStatusCode getStatus() const { return status_; }
};

/**
 * @brief 通用异常 - 资源不存在
 */
class NotFoundException : public AppException {
public:
    explicit NotFoundException(const std::string& message = "资源不存在")
        : AppException(ErrorCodes::NOT_FOUND, message, k404NotFound) {}
};

/**
 * @brief 通用异常 - 验证失败
 */
class ValidationException : public AppException {
public:
    explicit ValidationException(const std::string& message = "验证失败")
        : AppException(ErrorCodes::VALIDATION_FAILED, message, k400BadRequest) {}
};

/**
 * @brief 存储器 I/O 异常（越界、设备无响应、文件读写失败）
 */
class StorageException : public AppException {
public:
    explicit StorageException(const std::string& message = "存储器读写失败")
        : AppException(ErrorCodes::STORAGE_ERROR, message, k500InternalServerError) {}
};

/**
 * @brief 配置页主副本 CRC 均不正确
 */
class WrongCrcException : public AppException {
public:
    explicit WrongCrcException(const std::string& message = "配置页 CRC 校验失败")
        : AppException(ErrorCodes::WRONG_CRC, message, k500InternalServerError) {}
};

/**
 * @brief 历史缓冲相关异常
 */
namespace HistoryException {
    using enum drogon::HttpStatusCode;

    inline AppException Uninitialized() {
        return AppException(ErrorCodes::HISTORY_UNINITIALIZED, "历史缓冲未初始化", k503ServiceUnavailable);
    }

    inline AppException NoRecords() {
        return AppException(ErrorCodes::HISTORY_NO_RECORDS, "历史缓冲无记录", k404NotFound);
    }
}
