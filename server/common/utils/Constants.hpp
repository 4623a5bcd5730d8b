#pragma once

/**
 * @brief 全局常量定义
 *
 * 集中管理项目中的魔法数字和固定文案
 */
namespace Constants {

// ==================== 应用信息 ====================

/** 健康检查返回的版本号 */
inline constexpr const char* APP_VERSION = "2.0.0";

/** 页面标题 */
inline constexpr const char* APP_TITLE = "deCONZ Device Viewer";

// ==================== 日志相关 ====================

/** 调试日志中 SQL 截断长度 */
inline constexpr size_t QUERY_LOG_PREVIEW_LENGTH = 50;

/** 单个日志文件大小上限（字节）- 100MB */
inline constexpr uint64_t LOG_FILE_SIZE_LIMIT = 100 * 1024 * 1024;

// ==================== 数据库相关 ====================

/** SQLite 忙等待超时（秒） */
inline constexpr double DB_BUSY_TIMEOUT_SEC = 10.0;

// ==================== 缓存相关 ====================

/** 设备列表缓存操作名（缓存键前缀） */
inline constexpr const char* CACHE_OP_LIST_DEVICES = "list_devices";

// ==================== 默认配置 ====================

inline constexpr const char* DEFAULT_DB_RELATIVE_PATH = ".local/share/deCONZ/zll.db";
inline constexpr const char* DEFAULT_SECRET_KEY = "dev-secret-key-change-in-production";
inline constexpr const char* DEFAULT_HOST = "0.0.0.0";
inline constexpr int DEFAULT_PORT_START = 8500;
inline constexpr int DEFAULT_PORT_END = 8600;
inline constexpr int DEFAULT_MAX_DEVICES = 50;
inline constexpr int DEFAULT_CACHE_TIMEOUT = 300;
inline constexpr const char* DEFAULT_LOG_LEVEL = "INFO";
inline constexpr const char* DEFAULT_LOG_FILE = "deconz_viewer.log";

// ==================== 响应文案 ====================

inline constexpr const char* MSG_DEVICE_NOT_FOUND = "Device not found";
inline constexpr const char* MSG_ENDPOINT_NOT_FOUND = "Endpoint not found";
inline constexpr const char* MSG_PAGE_NOT_FOUND = "Page not found";
inline constexpr const char* MSG_INTERNAL_SERVER_ERROR = "Internal server error";
inline constexpr const char* MSG_DATABASE_ERROR = "Database connection error. Please check if deCONZ is running.";
inline constexpr const char* MSG_UNEXPECTED_ERROR = "An unexpected error occurred. Please try again.";
inline constexpr const char* MSG_RETRIEVE_DEVICES_FAILED = "Failed to retrieve device data";
inline constexpr const char* MSG_RETRIEVE_DEVICE_FAILED = "Failed to retrieve device details";
inline constexpr const char* MSG_LOAD_DEVICES_FAILED = "Failed to load device data. Please check your deCONZ installation.";
inline constexpr const char* MSG_CACHE_CLEARED = "Cache cleared successfully";

}  // namespace Constants
