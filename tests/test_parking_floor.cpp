#include "parking_floor.h"
#include <gtest/gtest.h>
#include <set>
#include <stdexcept>

TEST(ParkingFloorTest, PrePopulatesRegularSpots) {
    ParkingFloor floor(1);
    EXPECT_EQ(floor.spotCount(), DEFAULT_REGULAR_SPOTS);

    FloorStats stats = floor.getStats();
    EXPECT_EQ(stats.totalSpots, DEFAULT_REGULAR_SPOTS);
    EXPECT_EQ(stats.freeSpots, DEFAULT_REGULAR_SPOTS);
    EXPECT_EQ(stats.occupiedSpots, 0u);

    auto spot = floor.getSpot("F1-spot_0");
    ASSERT_TRUE(spot.has_value());
    EXPECT_EQ(spot->getType(), SpotType::Regular);
}

TEST(ParkingFloorTest, GeneratedSpotIdsAreUnique) {
    ParkingFloor floor(2, 3);
    std::set<std::string> ids;
    ids.insert(floor.addSpot(SpotType::Large));
    ids.insert(floor.addSpot(SpotType::XLarge));
    ids.insert(floor.addSpot(SpotType::Handicapped));

    EXPECT_EQ(ids.size(), 3u);
    EXPECT_EQ(floor.spotCount(), 6u);
    for (const auto& id : ids) {
        EXPECT_EQ(id.rfind("F2-spot_", 0), 0u);
    }
}

TEST(ParkingFloorTest, AddSpotOverwritesExistingId) {
    ParkingFloor floor(1, 0);
    floor.addSpot(ParkingSpot("dup", true, SpotType::Regular));
    floor.addSpot(ParkingSpot("dup", true, SpotType::Large));

    EXPECT_EQ(floor.spotCount(), 1u);
    ASSERT_TRUE(floor.getSpot("dup").has_value());
    EXPECT_EQ(floor.getSpot("dup")->getType(), SpotType::Large);
}

TEST(ParkingFloorTest, FindAvailableSpotReturnsNoneWhenNothingFits) {
    ParkingFloor floor(1);  // 只有普通车位
    EXPECT_FALSE(floor.findAvailableSpot(VehicleType::Heavy).has_value());

    ParkingFloor empty(2, 0);
    EXPECT_FALSE(empty.findAvailableSpot(VehicleType::Compact).has_value());
}

TEST(ParkingFloorTest, FindAvailableSpotIsFirstFit) {
    ParkingFloor floor(1, 0);
    floor.addSpot(ParkingSpot("a-xlarge", true, SpotType::XLarge));
    floor.addSpot(ParkingSpot("b-regular", true, SpotType::Regular));

    // 首次适配：小型车会占用排在前面的超大车位
    auto spotId = floor.findAvailableSpot(VehicleType::Compact);
    ASSERT_TRUE(spotId.has_value());
    EXPECT_EQ(*spotId, "a-xlarge");

    ASSERT_EQ(floor.occupySpot("a-xlarge", Vehicle(VehicleType::Compact, "Toyota", "A1")),
              ParkingError::None);
    spotId = floor.findAvailableSpot(VehicleType::Compact);
    ASSERT_TRUE(spotId.has_value());
    EXPECT_EQ(*spotId, "b-regular");
}

TEST(ParkingFloorTest, FindAvailableSpotSkipsIncompatibleSpots) {
    ParkingFloor floor(1, 0);
    floor.addSpot(ParkingSpot("a-handicapped", true, SpotType::Handicapped));
    floor.addSpot(ParkingSpot("b-regular", true, SpotType::Regular));
    floor.addSpot(ParkingSpot("c-large", true, SpotType::Large));

    EXPECT_EQ(floor.findAvailableSpot(VehicleType::Light).value_or(""), "b-regular");
    EXPECT_EQ(floor.findAvailableSpot(VehicleType::Heavy).value_or(""), "c-large");
}

TEST(ParkingFloorTest, StaleScanResultFailsWithAlreadyOccupied) {
    ParkingFloor floor(1, 0);
    floor.addSpot(ParkingSpot("only", true, SpotType::Regular));

    auto first = floor.findAvailableSpot(VehicleType::Compact);
    auto second = floor.findAvailableSpot(VehicleType::Compact);
    ASSERT_TRUE(first && second);
    ASSERT_EQ(*first, *second);

    EXPECT_EQ(floor.occupySpot(*first, Vehicle(VehicleType::Compact, "M", "ONE")), ParkingError::None);
    EXPECT_EQ(floor.occupySpot(*second, Vehicle(VehicleType::Compact, "M", "TWO")),
              ParkingError::AlreadyOccupied);
    EXPECT_EQ(floor.getSpot("only")->getVehicle()->getLicensePlate(), "ONE");
}

TEST(ParkingFloorTest, OccupyUnknownSpotFails) {
    ParkingFloor floor(1, 0);
    EXPECT_EQ(floor.occupySpot("missing", Vehicle(VehicleType::Compact, "M", "P")),
              ParkingError::AlreadyOccupied);
}

TEST(ParkingFloorTest, VacateSpotFreesIt) {
    ParkingFloor floor(1, 1);
    ASSERT_EQ(floor.occupySpot("F1-spot_0", Vehicle(VehicleType::Light, "Suzuki", "B1")),
              ParkingError::None);
    EXPECT_EQ(floor.getStats().occupiedSpots, 1u);

    EXPECT_TRUE(floor.vacateSpot("F1-spot_0"));
    EXPECT_EQ(floor.getStats().freeSpots, 1u);
    EXPECT_TRUE(floor.vacateSpot("F1-spot_0"));
    EXPECT_FALSE(floor.vacateSpot("missing"));
}

TEST(ParkingFloorTest, RejectsTooManyDefaultSpots) {
    EXPECT_THROW(ParkingFloor(1, MAX_SPOTS_PER_FLOOR + 1), std::invalid_argument);
    ParkingFloor floor(1, MAX_SPOTS_PER_FLOOR);
    EXPECT_EQ(floor.spotCount(), MAX_SPOTS_PER_FLOOR);
}
