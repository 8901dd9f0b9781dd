#include "parking_spot.h"
#include <gtest/gtest.h>
#include <vector>

namespace {

const std::vector<VehicleType> ALL_VEHICLE_TYPES = {
    VehicleType::Compact, VehicleType::Heavy, VehicleType::Light
};
const std::vector<SpotType> ALL_SPOT_TYPES = {
    SpotType::Large, SpotType::Regular, SpotType::XLarge, SpotType::Handicapped
};

Vehicle makeVehicle(VehicleType type, const std::string& plate = "ABC123") {
    return Vehicle(type, "Model", plate);
}

}  // namespace

TEST(CompatibilityTest, MatchesFixedTable) {
    EXPECT_TRUE(isCompatible(VehicleType::Compact, SpotType::Large));
    EXPECT_TRUE(isCompatible(VehicleType::Compact, SpotType::Regular));
    EXPECT_TRUE(isCompatible(VehicleType::Compact, SpotType::XLarge));
    EXPECT_FALSE(isCompatible(VehicleType::Compact, SpotType::Handicapped));

    EXPECT_TRUE(isCompatible(VehicleType::Heavy, SpotType::Large));
    EXPECT_FALSE(isCompatible(VehicleType::Heavy, SpotType::Regular));
    EXPECT_TRUE(isCompatible(VehicleType::Heavy, SpotType::XLarge));
    EXPECT_FALSE(isCompatible(VehicleType::Heavy, SpotType::Handicapped));

    EXPECT_TRUE(isCompatible(VehicleType::Light, SpotType::Large));
    EXPECT_TRUE(isCompatible(VehicleType::Light, SpotType::Regular));
    EXPECT_TRUE(isCompatible(VehicleType::Light, SpotType::XLarge));
    EXPECT_FALSE(isCompatible(VehicleType::Light, SpotType::Handicapped));
}

TEST(ParkingSpotTest, AssignSucceedsOnlyForCompatiblePairs) {
    for (VehicleType vehicleType : ALL_VEHICLE_TYPES) {
        for (SpotType spotType : ALL_SPOT_TYPES) {
            ParkingSpot spot("spot", true, spotType);
            ParkingError result = spot.assignVehicle(makeVehicle(vehicleType));

            SCOPED_TRACE(std::string(toString(vehicleType)) + " -> " + toString(spotType));
            if (isCompatible(vehicleType, spotType)) {
                EXPECT_EQ(result, ParkingError::None);
                EXPECT_FALSE(spot.isAvailable());
                ASSERT_TRUE(spot.getVehicle().has_value());
            } else {
                EXPECT_EQ(result, ParkingError::IncompatibleClass);
                EXPECT_TRUE(spot.isAvailable());
                EXPECT_FALSE(spot.getVehicle().has_value());
            }
        }
    }
}

TEST(ParkingSpotTest, BikeOnHandicappedSpotIsIncompatible) {
    ParkingSpot spot("h1", true, SpotType::Handicapped);
    EXPECT_EQ(spot.assignVehicle(makeVehicle(VehicleType::Light)), ParkingError::IncompatibleClass);
    EXPECT_TRUE(spot.isAvailable());
}

TEST(ParkingSpotTest, SecondAssignReportsAlreadyOccupied) {
    ParkingSpot spot("r1", true, SpotType::Regular);
    ASSERT_EQ(spot.assignVehicle(makeVehicle(VehicleType::Compact, "FIRST")), ParkingError::None);

    EXPECT_EQ(spot.assignVehicle(makeVehicle(VehicleType::Compact, "SECOND")),
              ParkingError::AlreadyOccupied);
    EXPECT_EQ(spot.getVehicle()->getLicensePlate(), "FIRST");
}

TEST(ParkingSpotTest, OccupancyIsCheckedBeforeCompatibility) {
    ParkingSpot spot("r1", true, SpotType::Regular);
    ASSERT_EQ(spot.assignVehicle(makeVehicle(VehicleType::Compact)), ParkingError::None);

    // 货车与普通车位不兼容，但车位已被占用，优先报告占用
    EXPECT_EQ(spot.assignVehicle(makeVehicle(VehicleType::Heavy)), ParkingError::AlreadyOccupied);
}

TEST(ParkingSpotTest, RemoveVehicleIsIdempotent) {
    ParkingSpot spot("r1", true, SpotType::Regular);
    ASSERT_EQ(spot.assignVehicle(makeVehicle(VehicleType::Compact)), ParkingError::None);

    spot.removeVehicle();
    EXPECT_TRUE(spot.isAvailable());
    EXPECT_FALSE(spot.getVehicle().has_value());

    spot.removeVehicle();
    EXPECT_TRUE(spot.isAvailable());
    EXPECT_FALSE(spot.getVehicle().has_value());
}

TEST(ParkingSpotTest, SpotCreatedNotFreeRejectsVehicles) {
    ParkingSpot spot("blocked", false, SpotType::Large);
    EXPECT_EQ(spot.assignVehicle(makeVehicle(VehicleType::Compact)), ParkingError::AlreadyOccupied);
    EXPECT_FALSE(spot.getVehicle().has_value());
}

TEST(ParkingSpotTest, ParsesTypeNames) {
    SpotType spotType;
    EXPECT_TRUE(parseSpotType("XLarge", spotType));
    EXPECT_EQ(spotType, SpotType::XLarge);
    EXPECT_FALSE(parseSpotType("tiny", spotType));

    VehicleType vehicleType;
    EXPECT_TRUE(parseVehicleType("truck", vehicleType));
    EXPECT_EQ(vehicleType, VehicleType::Heavy);
    EXPECT_TRUE(parseVehicleType("LIGHT", vehicleType));
    EXPECT_EQ(vehicleType, VehicleType::Light);
    EXPECT_FALSE(parseVehicleType("boat", vehicleType));
}
