#pragma once

#include "Constants.hpp"

/**
 * @brief 统一响应格式工具类
 *
 * JSON: 成功时直接返回数据对象；失败时 {"error": ...[, "type": ...]}
 * HTML: 渲染 DeviceIndex 视图，error 非空时页面内联显示错误
 */
class Response {
public:
    using HttpResponsePtr = drogon::HttpResponsePtr;
    using HttpResponse = drogon::HttpResponse;
    using HttpStatusCode = drogon::HttpStatusCode;
    using HttpViewData = drogon::HttpViewData;
    using enum drogon::HttpStatusCode;

    static HttpResponsePtr json(const Json::Value &data, HttpStatusCode status = k200OK) {
        auto resp = HttpResponse::newHttpJsonResponse(data);
        resp->setStatusCode(status);
        return resp;
    }

    static HttpResponsePtr error(const std::string &message, HttpStatusCode status) {
        Json::Value body;
        body["error"] = message;
        return json(body, status);
    }

    static HttpResponsePtr error(const std::string &message,
                                 const std::string &type,
                                 HttpStatusCode status = k500InternalServerError) {
        Json::Value body;
        body["error"] = message;
        body["type"] = type;
        return json(body, status);
    }

    static HttpResponsePtr notFound(const std::string &message = Constants::MSG_ENDPOINT_NOT_FOUND) {
        return error(message, k404NotFound);
    }

    static HttpResponsePtr page(const HttpViewData &data, HttpStatusCode status = k200OK) {
        auto resp = HttpResponse::newHttpViewResponse("DeviceIndex", data);
        resp->setStatusCode(status);
        return resp;
    }

    /** 不带设备数据的错误页 */
    static HttpResponsePtr errorPage(const std::string &message, HttpStatusCode status = k200OK) {
        HttpViewData data;
        data.insert("title", std::string(Constants::APP_TITLE));
        data.insert("error", message);
        return page(data, status);
    }
};
