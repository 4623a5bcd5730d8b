#pragma once

#include "ErrorTypes.hpp"

/**
 * @brief 应用异常基类
 *
 * type 为错误类型标识（见 ErrorTypes），用于 API 错误响应的 type 字段
 */
class AppException : public std::exception {
public:
    using HttpStatusCode = drogon::HttpStatusCode;
    using enum drogon::HttpStatusCode;

private:
    std::string type_;
    std::string message_;
    HttpStatusCode status_;

public:
    AppException(std::string type, std::string message, HttpStatusCode status = k500InternalServerError)
        : type_(std::move(type)), message_(std::move(message)), status_(status) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    const std::string& getType() const { return type_; }
    HttpStatusCode getStatus() const { return status_; }
};

/**
 * @brief 存储访问异常
 *
 * Structural: 查询引用了不存在的表/列（可回退到简化查询）
 * Failure: 其他存储错误（打开失败、锁超时、I/O 错误等）
 */
class StorageError : public AppException {
public:
    enum class Kind { Structural, Failure };

    StorageError(Kind kind, const std::string& message)
        : AppException(ErrorTypes::DATABASE_ERROR, message), kind_(kind) {}

    bool isStructural() const { return kind_ == Kind::Structural; }

private:
    Kind kind_;
};

/**
 * @brief 端口扫描失败（启动期致命错误）
 */
class NoFreePortError : public AppException {
public:
    NoFreePortError(int start, int end)
        : AppException(ErrorTypes::PORT_ERROR,
                       "No free port available in range " + std::to_string(start) + "-" + std::to_string(end)),
          start_(start), end_(end) {}

    int getStart() const { return start_; }
    int getEnd() const { return end_; }

private:
    int start_;
    int end_;
};

/**
 * @brief 配置校验失败（启动期致命错误）
 *
 * 携带全部错误信息，便于一次性输出
 */
class ConfigValidationError : public AppException {
public:
    explicit ConfigValidationError(std::vector<std::string> errors)
        : AppException(ErrorTypes::CONFIG_ERROR, joinMessages(errors)), errors_(std::move(errors)) {}

    const std::vector<std::string>& getErrors() const { return errors_; }

private:
    std::vector<std::string> errors_;

    static std::string joinMessages(const std::vector<std::string>& errors) {
        std::string joined;
        for (const auto& err : errors) {
            if (!joined.empty()) joined += "; ";
            joined += err;
        }
        return joined;
    }
};
