/**
 * @file user_account.cpp
 * @brief UserAccount实现
 */
#include "user_account.h"

UserAccount::UserAccount(const std::string& userName, const std::string& userPhone)
    : name(userName)
    , phone(userPhone)
    , nextVehicleNumber(1) {
}

std::string UserAccount::registerVehicle(const Vehicle& vehicle) {
    std::string vehicleId = "veh_" + std::to_string(nextVehicleNumber++);
    vehicles.emplace(vehicleId, vehicle);
    return vehicleId;
}

bool UserAccount::removeVehicle(const Vehicle& vehicle) {
    for (auto it = vehicles.begin(); it != vehicles.end(); ++it) {
        if (it->second.getLicensePlate() == vehicle.getLicensePlate()) {
            vehicles.erase(it);
            return true;
        }
    }
    return false;
}

std::optional<Vehicle> UserAccount::getVehicleById(const std::string& vehicleId) const {
    auto it = vehicles.find(vehicleId);
    if (it == vehicles.end()) {
        return std::nullopt;
    }
    return it->second;
}
