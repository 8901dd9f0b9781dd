/**
 * @file parking_spot.h
 * @brief 车位类型、车型兼容表与车位类
 */
#pragma once
#include "parking_error.h"
#include "vehicle.h"
#include <optional>
#include <string>

/**
 * @brief 车位类型
 */
enum class SpotType {
    Large,
    Regular,
    XLarge,
    Handicapped
};

const char* toString(SpotType type);
bool parseSpotType(const std::string& text, SpotType& outType);

/**
 * @brief 查询静态兼容表
 * @return 该车型是否允许停入该类型车位
 *
 * 兼容表固定且覆盖所有(车型, 车位类型)组合。
 */
bool isCompatible(VehicleType vehicleType, SpotType spotType);

/**
 * @class ParkingSpot
 * @brief 最小的可分配单元
 *
 * 不变式：vehicle有值 ⇒ isFree为false。
 * 以isFree=false构造且没有车辆的车位视为停用车位，不会被分配。
 *
 * 本类自身不加锁，由所属ParkingFloor的车位表锁保护。
 */
class ParkingSpot {
private:
    std::string id;                  // 车位编号（停车场内唯一）
    bool isFree;                     // 是否空闲
    SpotType type;                   // 车位类型
    std::optional<Vehicle> vehicle;  // 当前停放的车辆

public:
    ParkingSpot(const std::string& spotId, bool free, SpotType spotType);

    const std::string& getId() const { return id; }
    SpotType getType() const { return type; }
    bool isAvailable() const { return isFree; }
    const std::optional<Vehicle>& getVehicle() const { return vehicle; }

    bool isCompatible(VehicleType vehicleType) const;

    /**
     * @brief 停入车辆
     * @return AlreadyOccupied（先检查）、IncompatibleClass 或 None
     *
     * 失败时车位状态不变。
     */
    ParkingError assignVehicle(const Vehicle& newVehicle);

    /**
     * @brief 清空车位，空闲车位上调用也是安全的
     */
    void removeVehicle();
};
