#pragma once

/**
 * @brief 请求/响应拦截器
 *
 * 注册全局的 pre-handling 和 post-handling advices，
 * 用于记录请求耗时并为 API 响应禁用缓存
 */
class RequestAdvices {
public:
    using HttpRequestPtr = drogon::HttpRequestPtr;
    using HttpResponsePtr = drogon::HttpResponsePtr;

    static void setup() {
        setupPreHandling();
        setupPostHandling();
    }

    /**
     * @brief 为响应补充通用头（API 响应禁止代理/浏览器缓存）
     */
    static void decorate(const HttpRequestPtr &req, const HttpResponsePtr &resp) {
        if (req->path().starts_with("/api/") && resp->getHeader("Cache-Control").empty()) {
            resp->addHeader("Cache-Control", "no-cache");
        }
    }

private:
    /** 请求前拦截：记录请求开始时间 */
    static void setupPreHandling() {
        drogon::app().registerPreHandlingAdvice([](const HttpRequestPtr &req) {
            req->attributes()->insert("startTime", std::chrono::steady_clock::now());
        });
    }

    /** 请求后拦截：记录请求日志 */
    static void setupPostHandling() {
        drogon::app().registerPostHandlingAdvice([](const HttpRequestPtr &req, const HttpResponsePtr &resp) {
            decorate(req, resp);

            std::string duration = "-";
            if (req->attributes()->find("startTime")) {
                auto startTime = req->attributes()->get<std::chrono::steady_clock::time_point>("startTime");
                auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - startTime).count();
                duration = std::to_string(elapsed) + "ms";
            }

            LOG_DEBUG << req->methodString() << " " << req->path()
                      << (req->query().empty() ? "" : "?" + req->query())
                      << " -> " << static_cast<int>(resp->statusCode())
                      << " (" << duration << ")";
        });
    }
};
