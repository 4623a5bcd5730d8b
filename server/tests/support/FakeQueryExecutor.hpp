#pragma once

#include "common/database/DatabaseService.hpp"

/**
 * @brief 内存查询执行器：按 SQL 内容路由到预设结果，并记录调用
 */
class FakeQueryExecutor : public QueryExecutor {
public:
    using Handler = std::function<QueryOutcome(const std::string&, const std::vector<SqlParam>&)>;

    explicit FakeQueryExecutor(Handler handler) : handler_(std::move(handler)) {}

    QueryOutcome tryExecute(const std::string& sql, const std::vector<SqlParam>& params = {}) override {
        ++calls;
        queries.push_back(sql);
        lastParams = params;
        return handler_(sql, params);
    }

    int calls = 0;
    std::vector<std::string> queries;
    std::vector<SqlParam> lastParams;

private:
    Handler handler_;
};

/** 构造查询行，nullopt 表示 NULL */
inline Row makeRow(std::initializer_list<std::pair<const std::string, std::optional<std::string>>> columns) {
    return Row(columns);
}

inline bool isJoinQuery(const std::string& sql) {
    return sql.find("device_states") != std::string::npos;
}
