#pragma once

#include "AppException.hpp"
#include "Constants.hpp"
#include "ErrorTypes.hpp"
#include "Response.hpp"

/**
 * @brief 全局异常处理器
 *
 * 错误响应按请求路径区分：
 * - /api/ 前缀：JSON {"error", "type"}
 * - 其他路径：渲染首页并内联显示错误信息
 *
 * 查询语句和参数只写日志，不返回给客户端
 */
class AppExceptionHandler {
public:
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;
    using HttpStatusCode = drogon::HttpStatusCode;
    using enum drogon::HttpStatusCode;

    static void setup() {
        // 兜底：处理器之外逃逸的异常
        drogon::app().setExceptionHandler([](const std::exception& e,
                                             const HttpRequestPtr& req,
                                             std::function<void (const HttpResponsePtr &)> &&callback) {
            LOG_ERROR << "Internal server error on " << req->path() << ": " << e.what();
            if (isApiPath(req->path())) {
                callback(Response::error(Constants::MSG_INTERNAL_SERVER_ERROR, k500InternalServerError));
            } else {
                callback(Response::errorPage(Constants::MSG_INTERNAL_SERVER_ERROR, k500InternalServerError));
            }
        });

        // 未匹配任何路由
        drogon::app().setDefaultHandler([](const HttpRequestPtr& req,
                                           std::function<void (const HttpResponsePtr &)> &&callback) {
            callback(notFound(req));
        });
    }

    /**
     * @brief 执行处理函数，将异常转换为统一错误响应
     */
    template<typename Handler>
    static HttpResponsePtr guard(const HttpRequestPtr& req, Handler&& handler) {
        try {
            return std::forward<Handler>(handler)();
        } catch (const std::exception& e) {
            return translate(req, e);
        }
    }

    /**
     * @brief 路由级错误处理：处理函数内的任何异常都返回 api_error 和路由自己的提示
     *
     * 外层仍由 guard 兜底（例如日志或响应构造本身抛出）
     */
    template<typename Handler>
    static HttpResponsePtr guardRoute(const HttpRequestPtr& req, const std::string& failureMessage,
                                      const std::string& logContext, Handler&& handler) {
        return guard(req, [&]() -> HttpResponsePtr {
            try {
                return std::forward<Handler>(handler)();
            } catch (const std::exception& e) {
                LOG_ERROR << logContext << " failed: " << e.what();
                return Response::error(failureMessage, ErrorTypes::API_ERROR, k500InternalServerError);
            }
        });
    }

    /**
     * @brief 异常 -> 错误响应
     *
     * AppException 的 type / status 直接写入响应，其余异常按 internal_error 处理；
     * 非 API 路径渲染页面（状态码 200）
     */
    static HttpResponsePtr translate(const HttpRequestPtr& req, const std::exception& e) {
        std::string type = ErrorTypes::INTERNAL_ERROR;
        HttpStatusCode status = k500InternalServerError;
        if (const auto* appError = dynamic_cast<const AppException*>(&e)) {
            type = appError->getType();
            status = appError->getStatus();
        }

        LOG_ERROR << "Error [" << type << "] in " << req->methodString() << " " << req->path()
                  << ": " << e.what();

        auto message = messageFor(type);
        if (isApiPath(req->path())) {
            return Response::error(message, type, status);
        }
        return Response::errorPage(message);
    }

    static HttpResponsePtr notFound(const HttpRequestPtr& req) {
        if (isApiPath(req->path())) {
            return Response::notFound(Constants::MSG_ENDPOINT_NOT_FOUND);
        }
        return Response::errorPage(Constants::MSG_PAGE_NOT_FOUND, k404NotFound);
    }

    static bool isApiPath(const std::string& path) {
        return path.starts_with("/api/");
    }

private:
    /** 面向客户端的提示文案（不包含异常原文） */
    static std::string messageFor(const std::string& type) {
        if (type == ErrorTypes::DATABASE_ERROR) {
            return Constants::MSG_DATABASE_ERROR;
        }
        return Constants::MSG_UNEXPECTED_ERROR;
    }
};
