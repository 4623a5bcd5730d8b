#pragma once

#include "Device.Service.hpp"
#include "common/cache/TtlCache.hpp"
#include "common/utils/Constants.hpp"

/**
 * @brief 设备读取入口（DeviceService + TTL 缓存）
 *
 * HTTP 层只通过此类读取设备，缓存实例由组合根创建并注入
 */
class DeviceReader {
public:
    using Cache = TtlCache<DeviceList>;
    using DeviceListPtr = Cache::ValuePtr;

    DeviceReader(std::shared_ptr<DeviceService> service,
                 std::shared_ptr<Cache> cache,
                 std::chrono::seconds ttl)
        : service_(std::move(service)), cache_(std::move(cache)), ttl_(ttl) {}

    /**
     * @brief 获取设备列表（TTL 内复用缓存结果）
     */
    DeviceListPtr listDevices() {
        static const std::string key = Cache::makeKey(Constants::CACHE_OP_LIST_DEVICES);
        return cache_->getOrCompute(key, [this] { return service_->listDevices(); }, ttl_);
    }

    /**
     * @brief 在缓存的设备列表中按 ID 查找
     */
    std::optional<DeviceRecord> findDevice(int64_t id) {
        auto devices = listDevices();
        auto it = std::find_if(devices->begin(), devices->end(),
                               [id](const DeviceRecord& d) { return d.id == id; });
        if (it == devices->end()) {
            return std::nullopt;
        }
        return *it;
    }

    void clearCache() {
        cache_->clear();
        LOG_INFO << "[DeviceReader] Application cache cleared";
    }

private:
    std::shared_ptr<DeviceService> service_;
    std::shared_ptr<Cache> cache_;
    std::chrono::seconds ttl_;
};
