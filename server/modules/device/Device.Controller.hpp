#pragma once

#include "DeviceReader.hpp"
#include "common/utils/Response.hpp"
#include "common/utils/ExceptionHandler.hpp"
#include "common/utils/StringUtils.hpp"
#include "common/utils/TimestampHelper.hpp"

/**
 * @brief 设备 API 控制器
 *
 * 非自动创建：依赖由 main 注入后通过 registerController 注册。
 * 路由内异常经 AppExceptionHandler::guardRoute 转换为 {"error", "type": "api_error"}。
 */
class DeviceController : public drogon::HttpController<DeviceController, false> {
private:
    std::shared_ptr<DeviceReader> reader_;

public:
    using enum drogon::HttpMethod;
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;
    using Callback = std::function<void(const HttpResponsePtr&)>;

    METHOD_LIST_BEGIN
    ADD_METHOD_TO(DeviceController::list, "/api/devices", Get);
    ADD_METHOD_TO(DeviceController::detail, "/api/devices/{id}", Get);
    METHOD_LIST_END

    explicit DeviceController(std::shared_ptr<DeviceReader> reader)
        : reader_(std::move(reader)) {}

    /**
     * @brief 设备列表
     */
    void list(const HttpRequestPtr& req, Callback&& callback) {
        LOG_INFO << "API devices endpoint requested";
        callback(AppExceptionHandler::guardRoute(req, Constants::MSG_RETRIEVE_DEVICES_FAILED,
                                                 "API devices request", [this] {
            auto devices = reader_->listDevices();

            Json::Value items(Json::arrayValue);
            for (const auto& device : *devices) {
                items.append(device.toJson());
            }

            Json::Value data;
            data["devices"] = items;
            data["count"] = static_cast<Json::UInt64>(devices->size());
            data["timestamp"] = TimestampHelper::now();
            return Response::json(data);
        }));
    }

    /**
     * @brief 设备详情（ID 不是纯数字时按未知路由处理）
     */
    void detail(const HttpRequestPtr& req, Callback&& callback, const std::string& id) {
        auto deviceId = StringUtils::isDigits(id) ? StringUtils::parseInt(id) : std::nullopt;
        if (!deviceId) {
            callback(AppExceptionHandler::notFound(req));
            return;
        }

        LOG_INFO << "API device detail requested for device " << *deviceId;
        callback(AppExceptionHandler::guardRoute(req, Constants::MSG_RETRIEVE_DEVICE_FAILED,
                                                 "API device detail request", [this, deviceId] {
            auto device = reader_->findDevice(*deviceId);
            if (!device) {
                return Response::notFound(Constants::MSG_DEVICE_NOT_FOUND);
            }
            return Response::json(device->toJson());
        }));
    }
};
