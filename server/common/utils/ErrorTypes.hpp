#pragma once

/**
 * @brief 统一错误类型定义
 *
 * 对应 API 错误响应中的 type 字段，客户端据此区分错误来源：
 * - api_error: 设备 API 路由自身捕获的失败
 * - database_error: 存储访问失败（连接、查询）
 * - internal_error: 其他未预期的服务端异常
 * - config_error / port_error: 仅在启动阶段出现
 */
namespace ErrorTypes {

// ==================== 运行期错误 ====================

/** 设备 API 路由级失败 */
inline constexpr const char* API_ERROR = "api_error";

/** 数据库连接或查询失败 */
inline constexpr const char* DATABASE_ERROR = "database_error";

/** 未预期的内部错误 */
inline constexpr const char* INTERNAL_ERROR = "internal_error";

// ==================== 启动期错误 ====================

/** 配置校验失败 */
inline constexpr const char* CONFIG_ERROR = "config_error";

/** 端口范围内无可用端口 */
inline constexpr const char* PORT_ERROR = "port_error";

}  // namespace ErrorTypes
