#include "config_loader.h"
#include "lot_builder.h"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {

class TempFile {
public:
    explicit TempFile(const std::string& content)
        : path(::testing::TempDir() + "parking_hub_config_"
               + ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".json") {
        std::ofstream out(path);
        out << content;
    }
    ~TempFile() { std::remove(path.c_str()); }

    std::string path;
};

}  // namespace

TEST(ConfigLoaderTest, EmptyObjectKeepsDefaults) {
    LotConfig config = parseLotConfig(nlohmann::json::object());
    EXPECT_EQ(config.name, "Park-Wella Parking Hub");
    EXPECT_EQ(config.floorCount, 5u);
    EXPECT_EQ(config.defaultRegularSpots, DEFAULT_REGULAR_SPOTS);
    EXPECT_DOUBLE_EQ(config.hourlyRate, DEFAULT_HOURLY_RATE);
    EXPECT_EQ(config.port, DEFAULT_SERVER_PORT);
    EXPECT_EQ(config.logLevel, LogLevel::INFO);
}

TEST(ConfigLoaderTest, ReadsAllFieldsFromFile) {
    TempFile file(R"({
        "name": "Harbour Garage",
        "address": "Pier 4",
        "uid": "hg-01",
        "floors": 3,
        "defaultRegularSpots": 4,
        "groundFloorLargeSpots": 2,
        "hourlyRate": 7.5,
        "port": 9090,
        "logLevel": "debug"
    })");

    LotConfig config = loadLotConfig(file.path);
    EXPECT_EQ(config.name, "Harbour Garage");
    EXPECT_EQ(config.address, "Pier 4");
    EXPECT_EQ(config.uid, "hg-01");
    EXPECT_EQ(config.floorCount, 3u);
    EXPECT_EQ(config.defaultRegularSpots, 4u);
    EXPECT_EQ(config.groundFloorLargeSpots, 2u);
    EXPECT_DOUBLE_EQ(config.hourlyRate, 7.5);
    EXPECT_EQ(config.port, 9090);
    EXPECT_EQ(config.logLevel, LogLevel::DEBUG);
}

TEST(ConfigLoaderTest, RejectsBadInput) {
    EXPECT_THROW(loadLotConfig("/nonexistent/parking_hub.json"), std::runtime_error);

    TempFile broken("{ not json");
    EXPECT_THROW(loadLotConfig(broken.path), std::runtime_error);

    EXPECT_THROW(parseLotConfig(nlohmann::json::array()), std::runtime_error);
    EXPECT_THROW(parseLotConfig({{"floors", "three"}}), std::runtime_error);
    EXPECT_THROW(parseLotConfig({{"hourlyRate", -1.0}}), std::runtime_error);
    EXPECT_THROW(parseLotConfig({{"logLevel", "chatty"}}), std::runtime_error);
}

TEST(ConfigLoaderTest, RejectsOutOfRangeIntegers) {
    EXPECT_THROW(parseLotConfig({{"floors", -1}}), std::runtime_error);
    EXPECT_THROW(parseLotConfig({{"floors", 0}}), std::runtime_error);
    EXPECT_THROW(parseLotConfig({{"floors", 4294967297ULL}}), std::runtime_error);
    EXPECT_THROW(parseLotConfig({{"floors", MAX_FLOORS + 1}}), std::runtime_error);
    EXPECT_THROW(parseLotConfig({{"floors", 2.5}}), std::runtime_error);
    EXPECT_THROW(parseLotConfig({{"port", 70000}}), std::runtime_error);
    EXPECT_THROW(parseLotConfig({{"port", 0}}), std::runtime_error);
    EXPECT_THROW(parseLotConfig({{"port", -80}}), std::runtime_error);
    EXPECT_THROW(parseLotConfig({{"defaultRegularSpots", -5}}), std::runtime_error);
    EXPECT_THROW(parseLotConfig({{"defaultRegularSpots", 1ULL << 40}}), std::runtime_error);
    EXPECT_THROW(parseLotConfig({{"groundFloorLargeSpots", MAX_SPOTS_PER_FLOOR + 1}}), std::runtime_error);

    TempFile file(R"({"floors": -1, "port": 70000})");
    EXPECT_THROW(loadLotConfig(file.path), std::runtime_error);

    LotConfig config = parseLotConfig({{"floors", MAX_FLOORS}, {"port", 65535}});
    EXPECT_EQ(config.floorCount, MAX_FLOORS);
    EXPECT_EQ(config.port, 65535);
}

TEST(LotBuilderTest, BuildsFloorsFromConfig) {
    LotConfig config;
    config.floorCount = 3;
    config.defaultRegularSpots = 4;
    config.groundFloorLargeSpots = 2;
    config.hourlyRate = 6.0;

    auto lot = buildParkingLot(config);
    DisplayBoard board = lot->displayInfo();
    EXPECT_EQ(board.uid, config.uid);
    EXPECT_EQ(board.numFloors, 3u);
    EXPECT_EQ(board.numTotalSpots, 3u * 4u + 2u);
    EXPECT_DOUBLE_EQ(lot->getHourlyRate(), 6.0);

    ParkingTicket ticket;
    ASSERT_EQ(lot->parkVehicle(Vehicle(VehicleType::Heavy, "Mac", "XYZ789"), ticket), ParkingError::None);
    ASSERT_NE(lot->getFloorById(1), nullptr);
    EXPECT_TRUE(lot->getFloorById(1)->getSpot(ticket.getSpotId()).has_value());
}

TEST(LotBuilderTest, RejectsOversizedConfig) {
    LotConfig config;
    config.floorCount = MAX_FLOORS + 1;
    EXPECT_THROW(buildParkingLot(config), std::invalid_argument);

    config.floorCount = 1;
    config.defaultRegularSpots = MAX_SPOTS_PER_FLOOR + 1;
    EXPECT_THROW(buildParkingLot(config), std::invalid_argument);

    config.defaultRegularSpots = 1;
    config.groundFloorLargeSpots = MAX_SPOTS_PER_FLOOR + 1;
    EXPECT_THROW(buildParkingLot(config), std::invalid_argument);
}
