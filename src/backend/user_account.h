/**
 * @file user_account.h
 * @brief 车主账户，记录车主名下的车辆
 */
#pragma once
#include "vehicle.h"
#include <cstdint>
#include <map>
#include <optional>
#include <string>

/**
 * @class UserAccount
 * @brief 车主与其车辆的简单登记表
 *
 * 与停车场核心无关，核心不会调用本类。非线程安全。
 */
class UserAccount {
private:
    std::string name;
    std::string phone;
    std::map<std::string, Vehicle> vehicles;  // veh_<n> -> 车辆
    uint64_t nextVehicleNumber;

public:
    UserAccount(const std::string& userName, const std::string& userPhone);

    const std::string& getName() const { return name; }
    const std::string& getPhone() const { return phone; }

    /**
     * @brief 登记车辆
     * @return 车辆编号 veh_<n>，编号不复用
     */
    std::string registerVehicle(const Vehicle& vehicle);

    /**
     * @brief 按车牌号注销车辆
     * @return 是否找到并删除
     */
    bool removeVehicle(const Vehicle& vehicle);

    std::optional<Vehicle> getVehicleById(const std::string& vehicleId) const;

    size_t vehicleCount() const { return vehicles.size(); }
};
