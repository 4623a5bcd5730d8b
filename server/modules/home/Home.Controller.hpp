#pragma once

#include "Home.Service.hpp"
#include "common/utils/Response.hpp"
#include "common/utils/ExceptionHandler.hpp"

/**
 * @brief 首页控制器
 *
 * 职责：页面渲染、健康检查、缓存清理，业务逻辑委托给 HomeService。
 */
class HomeController : public drogon::HttpController<HomeController, false> {
private:
    std::shared_ptr<HomeService> service_;

public:
    using enum drogon::HttpMethod;
    using enum drogon::HttpStatusCode;
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;
    using Callback = std::function<void(const HttpResponsePtr&)>;

    METHOD_LIST_BEGIN
    ADD_METHOD_TO(HomeController::index, "/", Get);
    ADD_METHOD_TO(HomeController::health, "/api/health", Get);
    ADD_METHOD_TO(HomeController::clearCache, "/api/cache/clear", Post);
    METHOD_LIST_END

    explicit HomeController(std::shared_ptr<HomeService> service)
        : service_(std::move(service)) {}

    /**
     * @brief 设备列表页面（加载失败时页面内显示错误，不向客户端抛出）
     */
    void index(const HttpRequestPtr& req, Callback&& callback) {
        LOG_INFO << "Index page requested";
        callback(AppExceptionHandler::guard(req, [this] {
            return Response::page(service_->getIndexData());
        }));
    }

    /**
     * @brief 健康检查（数据库不可用时 503）
     */
    void health(const HttpRequestPtr& /*req*/, Callback&& callback) {
        HttpResponsePtr resp;
        try {
            resp = Response::json(service_->checkHealth());
        } catch (const std::exception& e) {
            LOG_ERROR << "Health check failed: " << e.what();

            Json::Value data;
            data["status"] = "unhealthy";
            data["error"] = e.what();
            data["timestamp"] = TimestampHelper::now();
            resp = Response::json(data, k503ServiceUnavailable);
        }
        callback(resp);
    }

    /**
     * @brief 清理应用缓存
     */
    void clearCache(const HttpRequestPtr& req, Callback&& callback) {
        callback(AppExceptionHandler::guard(req, [this] {
            return Response::json(service_->clearCache());
        }));
    }
};
