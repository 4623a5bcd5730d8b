#include <gtest/gtest.h>

#include "modules/device/Device.Controller.hpp"
#include "modules/home/Home.Controller.hpp"
#include "common/filters/RequestAdvices.hpp"
#include "support/FakeQueryExecutor.hpp"

namespace {

using drogon::HttpRequest;
using drogon::HttpRequestPtr;
using drogon::HttpResponsePtr;
using enum drogon::HttpStatusCode;

/**
 * @brief 控制器夹具：假执行器 -> DeviceService -> DeviceReader，直接调用处理函数
 */
class ControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_ = std::make_shared<FakeQueryExecutor>([this](const std::string& sql, const std::vector<SqlParam>&) {
            if (sql == "SELECT 1") return healthOutcome_;
            return devicesOutcome_;
        });
        auto service = std::make_shared<DeviceService>(db_, 50);
        auto reader = std::make_shared<DeviceReader>(
            service, std::make_shared<DeviceReader::Cache>(), std::chrono::seconds(300));
        devices_ = std::make_shared<DeviceController>(reader);
        home_ = std::make_shared<HomeController>(std::make_shared<HomeService>(db_, reader));

        devicesOutcome_ = QueryOutcome::success({
            makeRow({{"id", std::string("1")}, {"name", std::string("Lamp")}, {"type", std::string("Color light")},
                     {"manufacturer", std::nullopt}, {"model", std::nullopt}, {"software_version", std::nullopt},
                     {"lastseen", std::string("2024-05-01T12:00:00Z")},
                     {"state_name", std::string("on")}, {"state_value", std::string("true")}}),
        });
        healthOutcome_ = QueryOutcome::success({makeRow({{"1", std::string("1")}})});
    }

    static HttpRequestPtr request(const std::string& path, drogon::HttpMethod method = drogon::Get) {
        auto req = HttpRequest::newHttpRequest();
        req->setPath(path);
        req->setMethod(method);
        return req;
    }

    template<typename Invoke>
    static HttpResponsePtr capture(Invoke&& invoke) {
        HttpResponsePtr captured;
        int invocations = 0;
        invoke([&captured, &invocations](const HttpResponsePtr& resp) {
            captured = resp;
            ++invocations;
        });
        EXPECT_EQ(invocations, 1);
        return captured;
    }

    HttpResponsePtr listDevices() {
        auto req = request("/api/devices");
        return capture([&](DeviceController::Callback&& cb) { devices_->list(req, std::move(cb)); });
    }

    HttpResponsePtr deviceDetail(const std::string& id) {
        auto req = request("/api/devices/" + id);
        return capture([&](DeviceController::Callback&& cb) { devices_->detail(req, std::move(cb), id); });
    }

    std::shared_ptr<FakeQueryExecutor> db_;
    std::shared_ptr<DeviceController> devices_;
    std::shared_ptr<HomeController> home_;
    QueryOutcome devicesOutcome_;
    QueryOutcome healthOutcome_;
};

}  // namespace

TEST_F(ControllerTest, ListReturnsDevicesWithCount) {
    auto resp = listDevices();

    ASSERT_TRUE(resp);
    EXPECT_EQ(resp->statusCode(), k200OK);
    auto json = resp->getJsonObject();
    ASSERT_TRUE(json);
    EXPECT_EQ((*json)["count"].asInt(), 1);
    EXPECT_EQ((*json)["devices"][0]["name"].asString(), "Lamp");
    EXPECT_EQ((*json)["devices"][0]["last_seen"].asString(), "2024-05-01 12:00:00");
    EXPECT_EQ((*json)["devices"][0]["states"]["on"].asString(), "true");
    EXPECT_TRUE((*json)["devices"][0]["manufacturer"].isNull());
    EXPECT_TRUE((*json)["timestamp"].isString());
}

TEST_F(ControllerTest, ListIsServedFromCacheUntilCleared) {
    listDevices();
    listDevices();
    EXPECT_EQ(db_->calls, 1);

    auto req = request("/api/cache/clear", drogon::Post);
    auto cleared = capture([&](HomeController::Callback&& cb) { home_->clearCache(req, std::move(cb)); });
    ASSERT_TRUE(cleared);
    EXPECT_EQ(cleared->statusCode(), k200OK);
    EXPECT_EQ((*cleared->getJsonObject())["message"].asString(), "Cache cleared successfully");

    listDevices();
    EXPECT_EQ(db_->calls, 2);
}

TEST_F(ControllerTest, DetailReturnsKnownDevice) {
    auto resp = deviceDetail("1");

    ASSERT_TRUE(resp);
    EXPECT_EQ(resp->statusCode(), k200OK);
    EXPECT_EQ((*resp->getJsonObject())["id"].asInt64(), 1);
}

TEST_F(ControllerTest, DetailUnknownDeviceIs404) {
    auto resp = deviceDetail("42");

    ASSERT_TRUE(resp);
    EXPECT_EQ(resp->statusCode(), k404NotFound);
    EXPECT_EQ((*resp->getJsonObject())["error"].asString(), "Device not found");
}

TEST_F(ControllerTest, DetailNonIntegerIdIsUnknownEndpoint) {
    auto resp = deviceDetail("abc");

    ASSERT_TRUE(resp);
    EXPECT_EQ(resp->statusCode(), k404NotFound);
    EXPECT_EQ((*resp->getJsonObject())["error"].asString(), "Endpoint not found");
    EXPECT_EQ(db_->calls, 0);
}

TEST_F(ControllerTest, ListFailureIsApiError) {
    devicesOutcome_ = QueryOutcome::failure(QueryOutcome::Status::Failure, "unable to open database file");

    auto resp = listDevices();

    ASSERT_TRUE(resp);
    EXPECT_EQ(resp->statusCode(), k500InternalServerError);
    auto json = resp->getJsonObject();
    EXPECT_EQ((*json)["type"].asString(), "api_error");
    EXPECT_EQ((*json)["error"].asString(), "Failed to retrieve device data");
}

TEST_F(ControllerTest, DetailFailureIsApiError) {
    devicesOutcome_ = QueryOutcome::failure(QueryOutcome::Status::Failure, "database is locked");

    auto resp = deviceDetail("1");

    ASSERT_TRUE(resp);
    EXPECT_EQ(resp->statusCode(), k500InternalServerError);
    auto json = resp->getJsonObject();
    EXPECT_EQ((*json)["type"].asString(), "api_error");
    EXPECT_EQ((*json)["error"].asString(), "Failed to retrieve device details");
    EXPECT_EQ((*json)["error"].asString().find("locked"), std::string::npos);
}

TEST_F(ControllerTest, DetailSignedOrPaddedIdIsUnknownEndpoint) {
    for (const std::string id : {"-5", "+1", " 1", "1 ", "1.0"}) {
        auto resp = deviceDetail(id);

        ASSERT_TRUE(resp) << id;
        EXPECT_EQ(resp->statusCode(), k404NotFound) << id;
        EXPECT_EQ((*resp->getJsonObject())["error"].asString(), "Endpoint not found") << id;
    }
    EXPECT_EQ(db_->calls, 0);
}

TEST_F(ControllerTest, TranslateUsesExceptionType) {
    StorageError storage(StorageError::Kind::Failure, "SELECT secret FROM devices");

    auto api = AppExceptionHandler::translate(request("/api/cache/clear", drogon::Post), storage);
    EXPECT_EQ(api->statusCode(), k500InternalServerError);
    EXPECT_EQ((*api->getJsonObject())["type"].asString(), "database_error");
    EXPECT_EQ((*api->getJsonObject())["error"].asString(), Constants::MSG_DATABASE_ERROR);

    auto other = AppExceptionHandler::translate(request("/api/cache/clear", drogon::Post),
                                                std::runtime_error("boom"));
    EXPECT_EQ((*other->getJsonObject())["type"].asString(), "internal_error");
    EXPECT_EQ((*other->getJsonObject())["error"].asString(), Constants::MSG_UNEXPECTED_ERROR);

    auto page = AppExceptionHandler::translate(request("/"), storage);
    EXPECT_EQ(page->statusCode(), k200OK);
    auto body = std::string(page->body());
    EXPECT_NE(body.find("Database connection error"), std::string::npos);
    EXPECT_EQ(body.find("SELECT secret"), std::string::npos);
}

TEST_F(ControllerTest, HealthReportsConnectedDatabase) {
    auto req = request("/api/health");
    auto resp = capture([&](HomeController::Callback&& cb) { home_->health(req, std::move(cb)); });

    ASSERT_TRUE(resp);
    EXPECT_EQ(resp->statusCode(), k200OK);
    auto json = resp->getJsonObject();
    EXPECT_EQ((*json)["status"].asString(), "healthy");
    EXPECT_EQ((*json)["database"].asString(), "connected");
    EXPECT_EQ((*json)["version"].asString(), "2.0.0");
}

TEST_F(ControllerTest, HealthIs503WhenDatabaseUnavailable) {
    healthOutcome_ = QueryOutcome::failure(QueryOutcome::Status::Failure, "disk I/O error");

    auto req = request("/api/health");
    auto resp = capture([&](HomeController::Callback&& cb) { home_->health(req, std::move(cb)); });

    ASSERT_TRUE(resp);
    EXPECT_EQ(resp->statusCode(), k503ServiceUnavailable);
    auto json = resp->getJsonObject();
    EXPECT_EQ((*json)["status"].asString(), "unhealthy");
    EXPECT_EQ((*json)["error"].asString(), "disk I/O error");
}

TEST_F(ControllerTest, IndexRendersDevices) {
    auto req = request("/");
    auto resp = capture([&](HomeController::Callback&& cb) { home_->index(req, std::move(cb)); });

    ASSERT_TRUE(resp);
    EXPECT_EQ(resp->statusCode(), k200OK);
    auto body = std::string(resp->body());
    EXPECT_NE(body.find("deCONZ Device Viewer"), std::string::npos);
    EXPECT_NE(body.find("Lamp"), std::string::npos);
}

TEST_F(ControllerTest, IndexShowsLoadErrorInline) {
    devicesOutcome_ = QueryOutcome::failure(QueryOutcome::Status::Failure, "database is locked");

    auto req = request("/");
    auto resp = capture([&](HomeController::Callback&& cb) { home_->index(req, std::move(cb)); });

    ASSERT_TRUE(resp);
    EXPECT_EQ(resp->statusCode(), k200OK);
    auto body = std::string(resp->body());
    EXPECT_NE(body.find(Constants::MSG_LOAD_DEVICES_FAILED), std::string::npos);
    EXPECT_EQ(body.find("database is locked"), std::string::npos);
}

TEST_F(ControllerTest, UnknownPathsFollowRequestKind) {
    auto api = AppExceptionHandler::notFound(request("/api/nope"));
    EXPECT_EQ(api->statusCode(), k404NotFound);
    EXPECT_EQ((*api->getJsonObject())["error"].asString(), "Endpoint not found");

    auto page = AppExceptionHandler::notFound(request("/nope"));
    EXPECT_EQ(page->statusCode(), k404NotFound);
    EXPECT_NE(std::string(page->body()).find("Page not found"), std::string::npos);
}

TEST_F(ControllerTest, ApiResponsesAreNotCached) {
    auto api = listDevices();
    RequestAdvices::decorate(request("/api/devices"), api);
    EXPECT_EQ(api->getHeader("Cache-Control"), "no-cache");

    auto page = Response::errorPage("x");
    RequestAdvices::decorate(request("/"), page);
    EXPECT_TRUE(page->getHeader("Cache-Control").empty());
}
