#include <gtest/gtest.h>

#include "modules/device/Device.Service.hpp"
#include "support/FakeQueryExecutor.hpp"

namespace {

Row deviceRow(const std::string& id,
              std::optional<std::string> name,
              std::optional<std::string> lastSeen,
              std::optional<std::string> stateName = std::nullopt,
              std::optional<std::string> stateValue = std::nullopt) {
    return makeRow({
        {"id", id},
        {"name", std::move(name)},
        {"type", std::string("Color light")},
        {"manufacturer", std::string("IKEA of Sweden")},
        {"model", std::string("TRADFRI bulb")},
        {"software_version", std::string("2.3.095")},
        {"lastseen", std::move(lastSeen)},
        {"state_name", std::move(stateName)},
        {"state_value", std::move(stateValue)},
    });
}

}  // namespace

TEST(DeviceServiceTest, GroupsJoinedRowsAndMergesStates) {
    auto db = std::make_shared<FakeQueryExecutor>([](const std::string&, const std::vector<SqlParam>&) {
        return QueryOutcome::success({
            deviceRow("7", std::string("Kitchen"), std::string("2024-01-02T03:04:05Z"), std::string("on"), std::string("true")),
            deviceRow("3", std::string("Hall"), std::string("2024-01-01 10:00:00"), std::string("bri"), std::string("120")),
            deviceRow("7", std::string("Kitchen"), std::string("2024-01-02T03:04:05Z"), std::string("bri"), std::string("80")),
            deviceRow("7", std::string("Kitchen"), std::string("2024-01-02T03:04:05Z"), std::string("on"), std::string("false")),
        });
    });

    DeviceService service(db, 50);
    auto devices = service.listDevices();

    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].id, 7);
    EXPECT_EQ(devices[1].id, 3);

    std::map<std::string, std::string> expected{{"on", "false"}, {"bri", "80"}};
    EXPECT_EQ(devices[0].states, expected);
    EXPECT_EQ(devices[0].lastSeen, "2024-01-02 03:04:05");
    EXPECT_EQ(devices[0].softwareVersion, "2.3.095");
    EXPECT_EQ(devices[1].states.at("bri"), "120");

    ASSERT_EQ(db->calls, 1);
    ASSERT_EQ(db->lastParams.size(), 1u);
    EXPECT_EQ(std::get<int64_t>(db->lastParams[0]), 50);
}

TEST(DeviceServiceTest, SkipsStatesWithMissingNameOrValue) {
    auto db = std::make_shared<FakeQueryExecutor>([](const std::string&, const std::vector<SqlParam>&) {
        return QueryOutcome::success({
            deviceRow("1", std::string("Plug"), std::nullopt),
            deviceRow("1", std::string("Plug"), std::nullopt, std::string("on"), std::nullopt),
            deviceRow("1", std::string("Plug"), std::nullopt, std::nullopt, std::string("1")),
            deviceRow("1", std::string("Plug"), std::nullopt, std::string(""), std::string("1")),
            deviceRow("1", std::string("Plug"), std::nullopt, std::string("reachable"), std::string("true")),
        });
    });

    auto devices = DeviceService(db, 50).listDevices();

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].states.size(), 1u);
    EXPECT_EQ(devices[0].states.at("reachable"), "true");
    EXPECT_FALSE(devices[0].lastSeen.has_value());
}

TEST(DeviceServiceTest, MissingNameFallsBackToDeviceLabel) {
    auto db = std::make_shared<FakeQueryExecutor>([](const std::string&, const std::vector<SqlParam>&) {
        return QueryOutcome::success({
            deviceRow("12", std::nullopt, std::nullopt),
            deviceRow("13", std::string(""), std::nullopt),
        });
    });

    auto devices = DeviceService(db, 50).listDevices();

    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].name, "Device 12");
    EXPECT_EQ(devices[1].name, "Device 13");
}

TEST(DeviceServiceTest, FallsBackToPlainQueryOnMissingStateTable) {
    auto db = std::make_shared<FakeQueryExecutor>([](const std::string& sql, const std::vector<SqlParam>&) {
        if (isJoinQuery(sql)) {
            return QueryOutcome::failure(QueryOutcome::Status::Structural, "no such table: device_states");
        }
        return QueryOutcome::success({
            makeRow({{"id", std::string("5")}, {"name", std::string("Sensor")}, {"type", std::nullopt},
                     {"manufacturer", std::nullopt}, {"model", std::string("lumi.weather")},
                     {"lastseen", std::string("2023-12-31T23:59:59Z")}}),
        });
    });

    auto devices = DeviceService(db, 50).listDevices();

    ASSERT_EQ(db->calls, 2);
    EXPECT_FALSE(isJoinQuery(db->queries[1]));
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].id, 5);
    EXPECT_TRUE(devices[0].states.empty());
    EXPECT_FALSE(devices[0].softwareVersion.has_value());
    EXPECT_EQ(devices[0].lastSeen, "2023-12-31 23:59:59");
}

TEST(DeviceServiceTest, NonStructuralFailureDoesNotFallBack) {
    auto db = std::make_shared<FakeQueryExecutor>([](const std::string&, const std::vector<SqlParam>&) {
        return QueryOutcome::failure(QueryOutcome::Status::Failure, "database is locked");
    });

    DeviceService service(db, 50);
    try {
        service.listDevices();
        FAIL() << "expected StorageError";
    } catch (const StorageError& e) {
        EXPECT_FALSE(e.isStructural());
        EXPECT_STREQ(e.what(), "database is locked");
    }
    EXPECT_EQ(db->calls, 1);
}

TEST(DeviceServiceTest, FallbackFailurePropagates) {
    auto db = std::make_shared<FakeQueryExecutor>([](const std::string&, const std::vector<SqlParam>&) {
        return QueryOutcome::failure(QueryOutcome::Status::Structural, "no such table: devices");
    });

    EXPECT_THROW(DeviceService(db, 50).listDevices(), StorageError);
    EXPECT_EQ(db->calls, 2);
}

TEST(DeviceServiceTest, DeviceJsonUsesNullForMissingFields) {
    DeviceRecord device;
    device.id = 9;
    device.name = "Remote";
    device.states["buttonevent"] = "1002";

    auto json = device.toJson();
    EXPECT_EQ(json["id"].asInt64(), 9);
    EXPECT_EQ(json["name"].asString(), "Remote");
    EXPECT_TRUE(json["type"].isNull());
    EXPECT_TRUE(json["last_seen"].isNull());
    EXPECT_EQ(json["states"]["buttonevent"].asString(), "1002");
}
