#pragma once

#include "domain/Device.hpp"
#include "common/utils/FieldHelper.hpp"

/**
 * @brief 设备数据转换器
 *
 * 单一职责：把查询行转换为 DeviceRecord，不涉及数据库访问
 */
class DeviceDataTransformer {
public:
    /**
     * @brief 从查询行构造设备标量字段（不含 states）
     */
    static DeviceRecord fromRow(const Row& row) {
        DeviceRecord device;
        device.id = FieldHelper::getInt64(row, "id");
        device.name = FieldHelper::getNonEmpty(row, "name").value_or(DeviceRecord::defaultName(device.id));
        device.type = FieldHelper::getOptional(row, "type");
        device.manufacturer = FieldHelper::getOptional(row, "manufacturer");
        device.model = FieldHelper::getOptional(row, "model");
        device.softwareVersion = FieldHelper::getOptional(row, "software_version");
        device.lastSeen = FieldHelper::getOptional(row, "lastseen");
        return device;
    }

    /**
     * @brief 按设备 ID 分组联表结果，合并状态行
     *
     * 保持设备首次出现的顺序；标量字段取自该设备的第一行
     */
    static DeviceList groupRows(const std::vector<Row>& rows) {
        DeviceList devices;
        std::unordered_map<int64_t, size_t> index;  // deviceId -> devices 下标

        for (const auto& row : rows) {
            int64_t id = FieldHelper::getInt64(row, "id");
            auto [it, inserted] = index.try_emplace(id, devices.size());
            if (inserted) {
                devices.push_back(fromRow(row));
            }

            auto stateName = FieldHelper::getNonEmpty(row, "state_name");
            auto stateValue = FieldHelper::getNonEmpty(row, "state_value");
            if (stateName && stateValue) {
                devices[it->second].states[*stateName] = *stateValue;
            }
        }

        return devices;
    }

    /**
     * @brief 无状态表时的逐行转换（states 为空）
     */
    static DeviceList fromPlainRows(const std::vector<Row>& rows) {
        DeviceList devices;
        devices.reserve(rows.size());
        for (const auto& row : rows) {
            devices.push_back(fromRow(row));
        }
        return devices;
    }
};
