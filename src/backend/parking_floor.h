/**
 * @file parking_floor.h
 * @brief 停车楼层 - 管理本层车位
 */
#pragma once
#include "lot_config.h"
#include "parking_spot.h"
#include "sequence_generator.h"
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>

/**
 * @brief 楼层车位统计（同一把锁下取得的快照）
 */
struct FloorStats {
    size_t totalSpots = 0;
    size_t freeSpots = 0;
    size_t occupiedSpots = 0;
};

/**
 * @class ParkingFloor
 * @brief 一个楼层，独占本层的全部车位
 *
 * 并发控制：
 * 1. 车位表由spotsMutex保护，只读扫描使用共享锁，修改使用写锁
 * 2. 与停车场的楼层表锁同时持有时，楼层表锁在外，车位表锁在内
 */
class ParkingFloor {
private:
    uint32_t id;
    std::map<std::string, ParkingSpot> spots;  // 按编号有序，扫描顺序固定
    mutable std::shared_mutex spotsMutex;
    SequenceGenerator spotIds;                 // 本层车位编号 F<id>-spot_<n>

public:
    /**
     * @brief 构造函数
     * @param floorId 楼层编号（停车场内唯一）
     * @param defaultRegularSpots 预置的普通车位数量
     * @throws std::invalid_argument 超过MAX_SPOTS_PER_FLOOR
     */
    explicit ParkingFloor(uint32_t floorId, size_t defaultRegularSpots = DEFAULT_REGULAR_SPOTS);

    ParkingFloor(const ParkingFloor&) = delete;
    ParkingFloor& operator=(const ParkingFloor&) = delete;

    uint32_t getId() const { return id; }

    /**
     * @brief 按车位编号加入车位，编号冲突时直接覆盖
     */
    void addSpot(const ParkingSpot& spot);

    /**
     * @brief 新建一个空闲车位
     * @param type 车位类型
     * @return 新车位编号
     */
    std::string addSpot(SpotType type);

    /**
     * @brief 首次适配：返回第一个空闲且兼容的车位编号
     *
     * 不做最佳适配，小型车可能占用遇到的第一个超大车位。
     */
    std::optional<std::string> findAvailableSpot(VehicleType vehicleType) const;

    /**
     * @brief 在写锁下占用车位
     * @return 车位不存在时返回AlreadyOccupied（扫描后被并发替换）
     */
    ParkingError occupySpot(const std::string& spotId, const Vehicle& vehicle);

    /**
     * @brief 在写锁下清空车位
     * @return 车位是否属于本层
     */
    bool vacateSpot(const std::string& spotId);

    std::optional<ParkingSpot> getSpot(const std::string& spotId) const;

    size_t spotCount() const;
    FloorStats getStats() const;
};
