#pragma once

#include "AppException.hpp"
#include "Constants.hpp"
#include "StringUtils.hpp"

namespace fs = std::filesystem;

/**
 * @brief 应用配置（启动时从环境变量加载一次，之后只读）
 */
struct AppConfig {
    std::string dbPath;
    bool debug = false;
    std::string secretKey = Constants::DEFAULT_SECRET_KEY;
    std::string host = Constants::DEFAULT_HOST;
    int portStart = Constants::DEFAULT_PORT_START;
    int portEnd = Constants::DEFAULT_PORT_END;
    int maxDevices = Constants::DEFAULT_MAX_DEVICES;
    int cacheTimeout = Constants::DEFAULT_CACHE_TIMEOUT;
    std::string logLevel = Constants::DEFAULT_LOG_LEVEL;
    std::string logFile = Constants::DEFAULT_LOG_FILE;
    size_t numberOfThreads = 0;

    /** 环境变量中无法解析的值（校验阶段作为错误输出） */
    std::vector<std::string> parseErrors;

    /** 实际生效的日志级别（调试模式强制 DEBUG） */
    std::string effectiveLogLevel() const {
        return debug ? "DEBUG" : logLevel;
    }
};

/**
 * @brief 配置校验结果
 *
 * 数据库文件缺失仅为警告（降级运行），其余错误均阻断启动
 */
struct ConfigReport {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    bool databaseMissing = false;

    bool isFatal() const { return !errors.empty(); }
};

/**
 * @brief 配置管理器 - 负责从环境变量加载、验证应用配置
 *
 * 支持的环境变量：
 * - DECONZ_DB_PATH: deCONZ 数据库路径（默认 ~/.local/share/deCONZ/zll.db）
 * - DEBUG（未设置时读取 FLASK_DEBUG）/ SECRET_KEY / HOST / PORT_START / PORT_END
 * - MAX_DEVICES / CACHE_TIMEOUT / LOG_LEVEL / LOG_FILE / THREADS
 */
class ConfigManager {
public:
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * @brief 从进程环境加载配置并保存为全局只读实例
     */
    static const AppConfig& load(const EnvLookup& lookup = systemEnv) {
        config_ = fromEnvironment(lookup);
        return config_;
    }

    /**
     * @brief 解析环境变量（不校验取值范围）
     */
    static AppConfig fromEnvironment(const EnvLookup& lookup) {
        AppConfig config;
        config.dbPath = lookup("DECONZ_DB_PATH").value_or(defaultDbPath(lookup));
        auto debug = lookup("DEBUG");
        if (!debug) debug = lookup("FLASK_DEBUG");
        config.debug = StringUtils::toLower(debug.value_or("false")) == "true";
        config.secretKey = lookup("SECRET_KEY").value_or(Constants::DEFAULT_SECRET_KEY);
        config.host = lookup("HOST").value_or(Constants::DEFAULT_HOST);
        config.portStart = readInt(lookup, "PORT_START", Constants::DEFAULT_PORT_START, config.parseErrors);
        config.portEnd = readInt(lookup, "PORT_END", Constants::DEFAULT_PORT_END, config.parseErrors);
        config.maxDevices = readInt(lookup, "MAX_DEVICES", Constants::DEFAULT_MAX_DEVICES, config.parseErrors);
        config.cacheTimeout = readInt(lookup, "CACHE_TIMEOUT", Constants::DEFAULT_CACHE_TIMEOUT, config.parseErrors);
        config.logLevel = StringUtils::toUpper(lookup("LOG_LEVEL").value_or(Constants::DEFAULT_LOG_LEVEL));
        config.logFile = lookup("LOG_FILE").value_or(Constants::DEFAULT_LOG_FILE);

        int threads = readInt(lookup, "THREADS", 0, config.parseErrors);
        if (threads < 0) {
            config.parseErrors.emplace_back("THREADS must be non-negative");
        } else {
            config.numberOfThreads = static_cast<size_t>(threads);
        }
        return config;
    }

    /**
     * @brief 校验配置
     */
    static ConfigReport validate(const AppConfig& config) {
        ConfigReport report;
        report.errors = config.parseErrors;

        std::error_code ec;
        fs::path dbPath(config.dbPath);
        if (!fs::exists(dbPath, ec)) {
            report.databaseMissing = true;
            report.warnings.push_back("Database file not found: " + config.dbPath);
        } else if (!fs::is_regular_file(dbPath, ec)) {
            report.errors.push_back("Database path is not a file: " + config.dbPath);
        }

        if (config.portStart >= config.portEnd) {
            report.errors.emplace_back("PORT_START must be less than PORT_END");
        }
        validatePort("PORT_START", config.portStart, report.errors);
        validatePort("PORT_END", config.portEnd, report.errors);

        if (config.maxDevices <= 0) {
            report.errors.emplace_back("MAX_DEVICES must be a positive integer");
        }
        if (config.cacheTimeout < 0) {
            report.errors.emplace_back("CACHE_TIMEOUT must be non-negative");
        }
        if (!isKnownLogLevel(config.logLevel)) {
            report.errors.push_back("LOG_LEVEL is invalid: " + config.logLevel +
                " (expected TRACE/DEBUG/INFO/WARN/ERROR/FATAL)");
        }
        if (config.secretKey == Constants::DEFAULT_SECRET_KEY) {
            report.warnings.emplace_back("SECRET_KEY is the development default, change it in production");
        }

        return report;
    }

    /**
     * @brief 校验运行环境，输出警告与错误
     * @throws ConfigValidationError 存在致命错误时
     */
    static void validateEnvironment(const AppConfig& config) {
        LOG_INFO << "[Config] Validating application environment...";
        auto report = validate(config);

        if (!report.warnings.empty()) {
            printWarnings("配置警告", report.warnings);
        }
        if (report.databaseMissing) {
            LOG_WARN << "[Config] Database file not found - application will work with limited functionality";
        }
        if (report.isFatal()) {
            printErrors("配置验证失败", report.errors);
            throw ConfigValidationError(report.errors);
        }

        LOG_INFO << "[Config] Environment validation completed";
    }

    static std::optional<std::string> systemEnv(const std::string& name) {
        const char* value = std::getenv(name.c_str());
        if (!value) return std::nullopt;
        return std::string(value);
    }

private:
    inline static AppConfig config_;

    static std::string defaultDbPath(const EnvLookup& lookup) {
        fs::path home = lookup("HOME").value_or(".");
        return (home / Constants::DEFAULT_DB_RELATIVE_PATH).string();
    }

    static int readInt(const EnvLookup& lookup, const std::string& name, int defaultValue,
                       std::vector<std::string>& errors) {
        auto raw = lookup(name);
        if (!raw) return defaultValue;

        auto parsed = StringUtils::parseInt(*raw);
        if (!parsed || *parsed < std::numeric_limits<int>::min() || *parsed > std::numeric_limits<int>::max()) {
            errors.push_back(name + " must be an integer, got '" + *raw + "'");
            return defaultValue;
        }
        return static_cast<int>(*parsed);
    }

    static void validatePort(const std::string& name, int port, std::vector<std::string>& errors) {
        if (port < 1 || port > 65535) {
            errors.push_back(name + " is invalid: " + std::to_string(port) + " (valid range: 1-65535)");
        }
    }

    static bool isKnownLogLevel(const std::string& level) {
        static const std::set<std::string> levels = {
            "TRACE", "DEBUG", "INFO", "WARN", "WARNING", "ERROR", "FATAL", "CRITICAL"
        };
        return levels.contains(level);
    }

    static void printErrors(const std::string& title, const std::vector<std::string>& messages) {
        std::string border(60, '=');
        std::cerr << "\n" << border << "\n";
        std::cerr << " [ERROR] " << title << "\n";
        std::cerr << std::string(60, '-') << "\n";
        for (const auto& msg : messages) {
            std::cerr << "  " << msg << "\n";
            LOG_ERROR << "[Config] Configuration error: " << msg;
        }
        std::cerr << border << "\n" << std::endl;
    }

    static void printWarnings(const std::string& title, const std::vector<std::string>& messages) {
        std::cerr << "\n" << std::string(60, '-') << "\n";
        std::cerr << " [WARN] " << title << "\n";
        for (const auto& msg : messages) {
            std::cerr << "  " << msg << "\n";
            LOG_WARN << "[Config] " << msg;
        }
        std::cerr << std::string(60, '-') << "\n" << std::endl;
    }
};
