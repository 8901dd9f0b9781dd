/**
 * @file parking_floor.cpp
 * @brief ParkingFloor的线程安全实现
 */
#include "parking_floor.h"
#include <mutex>
#include <stdexcept>

ParkingFloor::ParkingFloor(uint32_t floorId, size_t defaultRegularSpots)
    : id(floorId)
    , spotIds("F" + std::to_string(floorId) + "-spot_") {
    if (defaultRegularSpots > MAX_SPOTS_PER_FLOOR) {
        throw std::invalid_argument("Too many default spots for floor " + std::to_string(floorId)
                                    + ": " + std::to_string(defaultRegularSpots));
    }
    // 构造期间对象尚未共享，无需加锁
    for (size_t i = 0; i < defaultRegularSpots; ++i) {
        std::string spotId = spotIds.next();
        spots.emplace(spotId, ParkingSpot(spotId, true, SpotType::Regular));
    }
}

void ParkingFloor::addSpot(const ParkingSpot& spot) {
    std::unique_lock<std::shared_mutex> lock(spotsMutex);
    spots.insert_or_assign(spot.getId(), spot);
}

std::string ParkingFloor::addSpot(SpotType type) {
    std::string spotId = spotIds.next();
    addSpot(ParkingSpot(spotId, true, type));
    return spotId;
}

std::optional<std::string> ParkingFloor::findAvailableSpot(VehicleType vehicleType) const {
    std::shared_lock<std::shared_mutex> lock(spotsMutex);

    for (const auto& [spotId, spot] : spots) {
        if (spot.isAvailable() && spot.isCompatible(vehicleType)) {
            return spotId;
        }
    }
    return std::nullopt;
}

ParkingError ParkingFloor::occupySpot(const std::string& spotId, const Vehicle& vehicle) {
    std::unique_lock<std::shared_mutex> lock(spotsMutex);

    auto it = spots.find(spotId);
    if (it == spots.end()) {
        return ParkingError::AlreadyOccupied;
    }
    // 检查并设置在同一把写锁内完成，保证不会重复占用
    return it->second.assignVehicle(vehicle);
}

bool ParkingFloor::vacateSpot(const std::string& spotId) {
    std::unique_lock<std::shared_mutex> lock(spotsMutex);

    auto it = spots.find(spotId);
    if (it == spots.end()) {
        return false;
    }
    it->second.removeVehicle();
    return true;
}

std::optional<ParkingSpot> ParkingFloor::getSpot(const std::string& spotId) const {
    std::shared_lock<std::shared_mutex> lock(spotsMutex);

    auto it = spots.find(spotId);
    if (it == spots.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t ParkingFloor::spotCount() const {
    std::shared_lock<std::shared_mutex> lock(spotsMutex);
    return spots.size();
}

FloorStats ParkingFloor::getStats() const {
    std::shared_lock<std::shared_mutex> lock(spotsMutex);

    FloorStats stats;
    stats.totalSpots = spots.size();
    for (const auto& [_, spot] : spots) {
        if (spot.isAvailable()) {
            stats.freeSpots++;
        } else {
            stats.occupiedSpots++;
        }
    }
    return stats;
}
