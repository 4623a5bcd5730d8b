#pragma once

#include "domain/Device.hpp"
#include "DeviceDataTransformer.hpp"
#include "common/database/DatabaseService.hpp"
#include "common/utils/TimestampHelper.hpp"

/**
 * @brief 设备服务（设备列表聚合）
 *
 * 查询策略：
 * 1. 主查询：devices LEFT JOIN device_states，按设备分组合并状态
 * 2. 主查询因缺表/缺列失败时，回退到只查 devices 的简化查询（仅一次）
 * 3. 其他错误直接向上传播
 *
 * 注意：LIMIT 作用于联表后的行数而非去重后的设备数，
 * 状态较多的设备会占用多行，可能把其他设备挤出结果。
 */
class DeviceService {
public:
    static constexpr const char* PRIMARY_SQL = R"(
        SELECT
            d.id,
            d.name,
            d.type,
            d.manufacturername AS manufacturer,
            d.modelid AS model,
            d.swversion AS software_version,
            d.lastseen,
            s.name AS state_name,
            s.value AS state_value
        FROM devices d
        LEFT JOIN device_states s ON d.id = s.device_id
        WHERE d.id IS NOT NULL
        ORDER BY d.lastseen DESC, d.id ASC
        LIMIT ?
    )";

    static constexpr const char* FALLBACK_SQL = R"(
        SELECT id, name, type, manufacturername AS manufacturer,
               modelid AS model, lastseen
        FROM devices
        WHERE id IS NOT NULL
        ORDER BY lastseen DESC, id ASC
        LIMIT ?
    )";

    DeviceService(std::shared_ptr<QueryExecutor> db, int maxDevices)
        : db_(std::move(db)), maxDevices_(maxDevices) {}

    /**
     * @brief 获取设备列表（未缓存）
     * @throws StorageError 主查询非结构性失败，或回退查询失败
     */
    DeviceList listDevices() const {
        std::vector<SqlParam> params{static_cast<int64_t>(maxDevices_)};

        DeviceList devices;
        auto outcome = db_->tryExecute(PRIMARY_SQL, params);
        if (outcome.ok()) {
            devices = DeviceDataTransformer::groupRows(outcome.rows);
            LOG_INFO << "[DeviceService] Retrieved " << devices.size() << " devices from database";
        } else if (outcome.isStructural()) {
            LOG_WARN << "[DeviceService] Advanced query failed (" << outcome.error
                     << "), falling back to simple query";
            devices = DeviceDataTransformer::fromPlainRows(db_->execute(FALLBACK_SQL, params));
            LOG_INFO << "[DeviceService] Retrieved " << devices.size() << " devices using fallback query";
        } else {
            throw outcome.toError();
        }

        for (auto& device : devices) {
            device.lastSeen = TimestampHelper::normalize(device.lastSeen);
        }
        return devices;
    }

private:
    std::shared_ptr<QueryExecutor> db_;
    int maxDevices_;
};
