#pragma once

/**
 * @brief 设备记录（deCONZ devices 表 + device_states 聚合结果）
 *
 * states 仅包含名称与取值均非空的状态项，同名状态后出现者覆盖先出现者
 */
struct DeviceRecord {
    int64_t id = 0;
    std::string name;
    std::optional<std::string> type;
    std::optional<std::string> manufacturer;
    std::optional<std::string> model;
    std::optional<std::string> softwareVersion;
    std::optional<std::string> lastSeen;
    std::map<std::string, std::string> states;

    /** 名称缺失时的默认显示名 */
    static std::string defaultName(int64_t id) {
        return "Device " + std::to_string(id);
    }

    Json::Value toJson() const {
        Json::Value json;
        json["id"] = static_cast<Json::Int64>(id);
        json["name"] = name;
        json["type"] = optionalToJson(type);
        json["manufacturer"] = optionalToJson(manufacturer);
        json["model"] = optionalToJson(model);
        json["software_version"] = optionalToJson(softwareVersion);
        json["last_seen"] = optionalToJson(lastSeen);

        Json::Value stateJson(Json::objectValue);
        for (const auto& [key, value] : states) {
            stateJson[key] = value;
        }
        json["states"] = stateJson;
        return json;
    }

    bool operator==(const DeviceRecord&) const = default;

private:
    static Json::Value optionalToJson(const std::optional<std::string>& value) {
        return value ? Json::Value(*value) : Json::Value(Json::nullValue);
    }
};

using DeviceList = std::vector<DeviceRecord>;
