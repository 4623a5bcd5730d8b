#pragma once

#include "common/utils/AppException.hpp"
#include "common/utils/Constants.hpp"
#include "common/utils/StringUtils.hpp"

/** SQL 绑定参数（SQLite 原生 ? 占位符） */
using SqlParam = std::variant<int64_t, double, std::string>;

/** 单行查询结果：列名 -> 值（NULL 为 nullopt） */
using Row = std::map<std::string, std::optional<std::string>>;

/**
 * @brief 查询结果（显式区分成功 / 结构性错误 / 其他错误）
 *
 * 调用方据此决定是否回退到简化查询，而不是依赖异常类型判断
 */
struct QueryOutcome {
    enum class Status { Ok, Structural, Failure };

    Status status = Status::Ok;
    std::vector<Row> rows;
    std::string error;

    bool ok() const { return status == Status::Ok; }
    bool isStructural() const { return status == Status::Structural; }

    static QueryOutcome success(std::vector<Row> rows) {
        QueryOutcome outcome;
        outcome.rows = std::move(rows);
        return outcome;
    }

    static QueryOutcome failure(Status status, std::string error) {
        QueryOutcome outcome;
        outcome.status = status;
        outcome.error = std::move(error);
        return outcome;
    }

    /** 失败结果转换为 StorageError */
    StorageError toError() const {
        return StorageError(isStructural() ? StorageError::Kind::Structural : StorageError::Kind::Failure, error);
    }
};

/**
 * @brief 查询执行接口
 *
 * DatabaseService 为 SQLite 实现；测试中可替换为内存实现
 */
class QueryExecutor {
public:
    virtual ~QueryExecutor() = default;

    /**
     * @brief 执行查询，失败时返回带状态的结果（不抛异常）
     */
    virtual QueryOutcome tryExecute(const std::string& sql, const std::vector<SqlParam>& params = {}) = 0;

    /**
     * @brief 执行查询
     * @throws StorageError 存储报告任何错误时
     */
    std::vector<Row> execute(const std::string& sql, const std::vector<SqlParam>& params = {}) {
        auto outcome = tryExecute(sql, params);
        if (!outcome.ok()) {
            throw outcome.toError();
        }
        return std::move(outcome.rows);
    }
};

/**
 * @brief 数据库服务类（deCONZ SQLite 只读访问）
 *
 * - 单连接：首次查询时惰性打开，进程生命周期内复用
 * - 所有查询经同一把互斥锁串行执行（无连接池、无读写并发）
 * - 查询失败时记录完整 SQL 与参数，不向调用方之外泄露
 */
class DatabaseService : public QueryExecutor {
public:
    using DbClientPtr = drogon::orm::DbClientPtr;
    using Result = drogon::orm::Result;

    explicit DatabaseService(std::string dbPath) : dbPath_(std::move(dbPath)) {}

    ~DatabaseService() override {
        close();
    }

    DatabaseService(const DatabaseService&) = delete;
    DatabaseService& operator=(const DatabaseService&) = delete;

    QueryOutcome tryExecute(const std::string& sql, const std::vector<SqlParam>& params = {}) override {
        std::lock_guard lock(mutex_);

        std::optional<Result> result;
        std::string error;
        try {
            auto binder = *getClient() << sql;
            for (const auto& param : params) {
                std::visit([&binder](const auto& value) { binder << value; }, param);
            }
            binder << drogon::orm::Mode::Blocking;
            binder >> [&result](const Result& r) {
                result = r;
            };
            binder >> [&error](const drogon::orm::DrogonDbException& e) {
                error = e.base().what();
            };
            binder.exec();
        } catch (const drogon::orm::DrogonDbException& e) {
            error = e.base().what();
        } catch (const std::exception& e) {
            error = e.what();
        }

        if (!result) {
            if (error.empty()) error = "query produced no result";
            auto status = classify(error);
            LOG_ERROR << "[Database] Query execution failed: " << error;
            LOG_ERROR << "[Database] Query: " << sql;
            LOG_ERROR << "[Database] Params: " << describeParams(params);
            return QueryOutcome::failure(status, error);
        }

        LOG_DEBUG << "[Database] Query executed successfully: "
                  << StringUtils::preview(StringUtils::trim(sql), Constants::QUERY_LOG_PREVIEW_LENGTH);
        return QueryOutcome::success(toRows(*result));
    }

    /**
     * @brief 关闭连接（进程退出时调用）
     */
    void close() {
        std::lock_guard lock(mutex_);
        if (client_) {
            client_->closeAll();
            client_.reset();
            LOG_INFO << "[Database] Connection closed";
        }
    }

    /**
     * @brief 根据 SQLite 错误信息判断是否为结构性错误（缺表/缺列）
     */
    static QueryOutcome::Status classify(const std::string& message) {
        auto lower = StringUtils::toLower(message);
        if (StringUtils::contains(lower, "no such table") ||
            StringUtils::contains(lower, "no such column")) {
            return QueryOutcome::Status::Structural;
        }
        return QueryOutcome::Status::Failure;
    }

private:
    std::string dbPath_;
    DbClientPtr client_;
    std::mutex mutex_;

    /** 惰性创建单连接客户端（调用方已持有 mutex_） */
    const DbClientPtr& getClient() {
        if (!client_) {
            auto client = drogon::orm::DbClient::newSqlite3Client("filename=" + dbPath_, 1);
            if (!client) {
                LOG_ERROR << "[Database] Database connection failed: " << dbPath_;
                throw StorageError(StorageError::Kind::Failure, "Failed to create SQLite client: " + dbPath_);
            }
            client->setTimeout(Constants::DB_BUSY_TIMEOUT_SEC);
            // 打开失败时在此抛出，client_ 保持为空，下次查询重试
            client->execSqlSync("PRAGMA busy_timeout = " +
                std::to_string(static_cast<int>(Constants::DB_BUSY_TIMEOUT_SEC * 1000)));
            client_ = std::move(client);
            LOG_INFO << "[Database] Connected to database: " << dbPath_;
        }
        return client_;
    }

    static std::vector<Row> toRows(const Result& result) {
        std::vector<Row> rows;
        rows.reserve(result.size());
        auto columns = result.columns();
        for (const auto& dbRow : result) {
            Row row;
            for (decltype(columns) i = 0; i < columns; ++i) {
                const auto& field = dbRow[i];
                row[result.columnName(i)] = field.isNull()
                    ? std::nullopt
                    : std::optional<std::string>(field.as<std::string>());
            }
            rows.push_back(std::move(row));
        }
        return rows;
    }

    static std::string describeParams(const std::vector<SqlParam>& params) {
        std::ostringstream oss;
        oss << "(";
        for (size_t i = 0; i < params.size(); ++i) {
            if (i > 0) oss << ", ";
            std::visit([&oss](const auto& value) { oss << value; }, params[i]);
        }
        oss << ")";
        return oss.str();
    }
};
