#pragma once

#include "common/database/DatabaseService.hpp"

/**
 * @brief 查询行字段读取辅助类
 *
 * 列不存在与值为 NULL 同等对待
 */
class FieldHelper {
public:
    static std::optional<std::string> getOptional(const Row& row, const std::string& column) {
        auto it = row.find(column);
        if (it == row.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /** NULL 与空串均视为缺失 */
    static std::optional<std::string> getNonEmpty(const Row& row, const std::string& column) {
        auto value = getOptional(row, column);
        if (!value || value->empty()) {
            return std::nullopt;
        }
        return value;
    }

    /**
     * @throws std::runtime_error 值存在但不是整数时
     */
    static int64_t getInt64(const Row& row, const std::string& column, int64_t defaultValue = 0) {
        auto value = getOptional(row, column);
        if (!value) {
            return defaultValue;
        }
        auto parsed = StringUtils::parseInt(*value);
        if (!parsed) {
            throw std::runtime_error("Column '" + column + "' is not an integer: " + *value);
        }
        return *parsed;
    }
};
