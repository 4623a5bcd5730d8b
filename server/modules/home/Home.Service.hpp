#pragma once

#include "common/database/DatabaseService.hpp"
#include "common/utils/Constants.hpp"
#include "common/utils/TimestampHelper.hpp"
#include "modules/device/DeviceReader.hpp"

/**
 * @brief 首页业务服务层
 *
 * 负责首页数据、健康检查、缓存管理。
 */
class HomeService {
private:
    std::shared_ptr<QueryExecutor> db_;
    std::shared_ptr<DeviceReader> reader_;

public:
    HomeService(std::shared_ptr<QueryExecutor> db, std::shared_ptr<DeviceReader> reader)
        : db_(std::move(db)), reader_(std::move(reader)) {}

    // ==================== 首页 ====================

    /**
     * @brief 首页视图数据，加载失败时返回空列表 + 错误提示
     */
    drogon::HttpViewData getIndexData() {
        drogon::HttpViewData data;
        data.insert("title", std::string(Constants::APP_TITLE));

        try {
            auto devices = reader_->listDevices();
            LOG_INFO << "Rendering index page with " << devices->size() << " devices";
            data.insert("devices", DeviceList(*devices));
            data.insert("error", std::string());
        } catch (const std::exception& e) {
            LOG_ERROR << "Failed to load devices: " << e.what();
            data.insert("devices", DeviceList());
            data.insert("error", std::string(Constants::MSG_LOAD_DEVICES_FAILED));
        }
        return data;
    }

    // ==================== 健康检查 ====================

    /**
     * @brief 数据库连通性检查
     * @throws StorageError 数据库不可用时
     */
    Json::Value checkHealth() {
        db_->execute("SELECT 1");

        Json::Value data;
        data["status"] = "healthy";
        data["database"] = "connected";
        data["timestamp"] = TimestampHelper::now();
        data["version"] = Constants::APP_VERSION;
        return data;
    }

    // ==================== 缓存管理 ====================

    /**
     * @brief 清理设备缓存，下次读取强制查库
     */
    Json::Value clearCache() {
        reader_->clearCache();

        Json::Value data;
        data["message"] = Constants::MSG_CACHE_CLEARED;
        data["timestamp"] = TimestampHelper::now();
        return data;
    }
};
