// mimalloc: 全局替换 new/delete（仅在本翻译单元包含一次）
#include <mimalloc.h>
#include <mimalloc-new-delete.h>

// Utils
#include "common/utils/LoggerManager.hpp"
#include "common/utils/ConfigManager.hpp"
#include "common/utils/ExceptionHandler.hpp"

// Filters
#include "common/filters/RequestAdvices.hpp"

// Database / Cache / Network
#include "common/database/DatabaseService.hpp"
#include "common/cache/TtlCache.hpp"
#include "common/network/PortFinder.hpp"

// Controllers
#include "modules/device/Device.Controller.hpp"
#include "modules/home/Home.Controller.hpp"

using namespace drogon;

// ─── 启动错误输出 ──────────────────────────────────────────

/**
 * @brief 输出启动阶段错误到控制台和日志
 */
void printStartupError(const std::string& title, const std::string& detail,
                       const std::vector<std::string>& hints = {}) {
    std::string border(60, '=');
    std::cerr << "\n" << border << "\n";
    std::cerr << " [ERROR] " << title << "\n";
    std::cerr << std::string(60, '-') << "\n";
    std::cerr << "  " << detail << "\n";
    if (!hints.empty()) {
        std::cerr << "\n  请检查:\n";
        for (const auto& hint : hints) {
            std::cerr << "    - " << hint << "\n";
        }
    }
    std::cerr << border << "\n" << std::endl;

    LOG_FATAL << "[Startup] " << title << ": " << detail;
}

/**
 * @brief 服务器启动回调
 */
void onServerStarted(const AppConfig& config) {
    for (const auto& addr : app().getListeners()) {
        std::cout << "  -> http://" << addr.toIpPort() << std::endl;
        LOG_INFO << "Server listening on http://" << addr.toIpPort();
    }
    LOG_INFO << "Debug mode: " << (config.debug ? "true" : "false");
    LOG_INFO << "Database: " << config.dbPath;
    std::cout << "Logs: " << config.logFile << std::endl;
}

/**
 * @brief 退出时释放资源
 */
void cleanup(const std::shared_ptr<DatabaseService>& database) {
    LOG_INFO << "Cleaning up application resources...";
    if (database) {
        database->close();
    }
    LOG_INFO << "Cleanup completed";
}

int main() {
    // 0. 验证 mimalloc 已激活
    int v = mi_version();
    std::cout << "mimalloc v" << (v / 100) << "." << (v % 100) << " active" << std::endl;

    // 1. 从环境变量加载配置
    const auto& config = ConfigManager::load();

    // 2. 初始化日志系统（AsyncFileLogger 异步写盘 + 控制台输出）
    try {
        LoggerManager::initialize(config.logFile);
    } catch (const std::exception& e) {
        printStartupError("日志初始化失败", e.what(), {"LOG_FILE 所在目录是否可写"});
        return 1;
    }
    LoggerManager::setLogLevel(config.effectiveLogLevel());

    // 3. 校验运行环境（数据库文件缺失仅告警）
    try {
        ConfigManager::validateEnvironment(config);
    } catch (const ConfigValidationError& e) {
        printStartupError("Environment validation failed - exiting", e.what());
        return 1;
    }

    // 4. 组装依赖：单连接数据库 -> 设备服务 -> TTL 缓存
    auto database = std::make_shared<DatabaseService>(config.dbPath);
    auto deviceService = std::make_shared<DeviceService>(database, config.maxDevices);
    auto deviceReader = std::make_shared<DeviceReader>(
        deviceService,
        std::make_shared<DeviceReader::Cache>(),
        std::chrono::seconds(config.cacheTimeout));
    auto homeService = std::make_shared<HomeService>(database, deviceReader);

    try {
        // 5. 查找空闲端口
        auto port = PortFinder::findFreePort(config.host, config.portStart, config.portEnd);
        LOG_INFO << "Starting deCONZ Device Viewer on " << config.host << ":" << port;

        // 6. 错误处理与请求日志
        AppExceptionHandler::setup();
        RequestAdvices::setup();

        // 7. 注册控制器
        app().registerController(std::make_shared<DeviceController>(deviceReader));
        app().registerController(std::make_shared<HomeController>(homeService));

        // 8. 监听与线程配置
        app().addListener(config.host, port)
             .setThreadNum(config.numberOfThreads)
             .registerBeginningAdvice([&config]() { onServerStarted(config); });

        // 9. 启动服务器（SIGINT/SIGTERM 时返回）
        app().run();
    } catch (const NoFreePortError& e) {
        printStartupError("Failed to start application", e.what(), {
            "PORT_START / PORT_END 范围内的端口是否全部被占用",
            "HOST 是否为本机可绑定的地址",
        });
        cleanup(database);
        return 1;
    } catch (const std::exception& e) {
        printStartupError("Failed to start application", e.what());
        cleanup(database);
        return 1;
    }

    // 10. 服务器退出后清理资源
    LOG_INFO << "Application stopped";
    cleanup(database);
    LoggerManager::close();

    return 0;
}
