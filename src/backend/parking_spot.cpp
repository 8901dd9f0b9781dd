/**
 * @file parking_spot.cpp
 * @brief ParkingSpot实现与兼容表
 */
#include "parking_spot.h"
#include <algorithm>
#include <cctype>

namespace {

constexpr int VEHICLE_TYPE_COUNT = 3;
constexpr int SPOT_TYPE_COUNT = 4;

// 行：Compact, Heavy, Light
// 列：Large, Regular, XLarge, Handicapped
constexpr bool COMPATIBILITY[VEHICLE_TYPE_COUNT][SPOT_TYPE_COUNT] = {
    {true, true,  true, false},
    {true, false, true, false},
    {true, true,  true, false},
};

}  // namespace

const char* toString(SpotType type) {
    switch (type) {
        case SpotType::Large: return "large";
        case SpotType::Regular: return "regular";
        case SpotType::XLarge: return "xlarge";
        case SpotType::Handicapped: return "handicapped";
        default: return "unknown";
    }
}

bool parseSpotType(const std::string& text, SpotType& outType) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "large") {
        outType = SpotType::Large;
    } else if (lower == "regular") {
        outType = SpotType::Regular;
    } else if (lower == "xlarge") {
        outType = SpotType::XLarge;
    } else if (lower == "handicapped") {
        outType = SpotType::Handicapped;
    } else {
        return false;
    }
    return true;
}

bool isCompatible(VehicleType vehicleType, SpotType spotType) {
    return COMPATIBILITY[static_cast<int>(vehicleType)][static_cast<int>(spotType)];
}

ParkingSpot::ParkingSpot(const std::string& spotId, bool free, SpotType spotType)
    : id(spotId)
    , isFree(free)
    , type(spotType) {
}

bool ParkingSpot::isCompatible(VehicleType vehicleType) const {
    return ::isCompatible(vehicleType, type);
}

ParkingError ParkingSpot::assignVehicle(const Vehicle& newVehicle) {
    if (!isFree) {
        return ParkingError::AlreadyOccupied;
    }
    if (!isCompatible(newVehicle.getType())) {
        return ParkingError::IncompatibleClass;
    }

    vehicle = newVehicle;
    isFree = false;
    return ParkingError::None;
}

void ParkingSpot::removeVehicle() {
    vehicle.reset();
    isFree = true;
}
