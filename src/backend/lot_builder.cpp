/**
 * @file lot_builder.cpp
 * @brief buildParkingLot实现
 */
#include "lot_builder.h"
#include "logger.h"
#include <stdexcept>
#include <string>

std::unique_ptr<ParkingLot> buildParkingLot(const LotConfig& config, ParkingLot::Clock clock) {
    if (config.floorCount > MAX_FLOORS) {
        throw std::invalid_argument("Floor count exceeds limit: " + std::to_string(config.floorCount));
    }
    if (config.groundFloorLargeSpots > MAX_SPOTS_PER_FLOOR) {
        throw std::invalid_argument("Too many ground floor large spots: "
                                    + std::to_string(config.groundFloorLargeSpots));
    }

    auto lot = std::make_unique<ParkingLot>(config.name, config.address, config.uid,
                                            config.hourlyRate, nullptr, std::move(clock));

    for (uint32_t floorId = 1; floorId <= config.floorCount; ++floorId) {
        auto floor = std::make_shared<ParkingFloor>(floorId, config.defaultRegularSpots);
        if (floorId == 1) {
            // 货车只能停在大型车位，统一放在1层
            for (size_t i = 0; i < config.groundFloorLargeSpots; ++i) {
                floor->addSpot(SpotType::Large);
            }
        }
        lot->addFloor(floor);
    }

    Logger::info("Parking lot '" + config.name + "' ready with "
                 + std::to_string(config.floorCount) + " floors");
    return lot;
}
