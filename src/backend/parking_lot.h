/**
 * @file parking_lot.h
 * @brief 停车场管理类 - 线程安全实现
 */
#pragma once
#include "lot_config.h"
#include "parking_error.h"
#include "parking_floor.h"
#include "parking_ticket.h"
#include "sequence_generator.h"
#include "vehicle.h"
#include <atomic>
#include <ctime>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

/**
 * @brief 停车场看板数据（只读快照）
 *
 * numEmptySpots为空闲车位数；numTotalSpots为所有车位总数。
 */
struct DisplayBoard {
    std::string uid;
    uint32_t numFloors = 0;
    uint32_t numTotalSpots = 0;
    uint32_t numEmptySpots = 0;
    uint32_t numParkedVehicles = 0;
};

/**
 * @class ParkingLot
 * @brief 线程安全的多层停车场
 *
 * 并发安全保证：
 * 1. 楼层表、每层的车位表、停车票表各自由独立的读写锁保护
 * 2. 加锁顺序固定：楼层表锁在外，车位表锁在内
 * 3. 停车票表锁从不与其他两把锁同时持有
 * 4. 停车分为"扫描"和"占用"两个临界区（乐观策略）：
 *    扫描到的车位在占用前可能被其他线程抢走，此时返回AlreadyOccupied，
 *    由占用时的检查保证同一车位不会被重复占用
 * 5. 取车同样由若干个顺序临界区组成，期间看板可能短暂不一致
 * 6. 持锁期间不写日志、不做IO
 */
class ParkingLot {
public:
    using Clock = std::function<time_t()>;

private:
    std::string name;
    std::string address;
    std::string uid;

    std::map<uint32_t, std::shared_ptr<ParkingFloor>> floors;  // 楼层表（按编号有序）
    std::map<std::string, ParkingTicket> tickets;             // 停车票表（在场与历史）

    std::atomic<double> hourlyRate;
    std::shared_ptr<SequenceGenerator> ticketIds;
    Clock clock;

    // 并发控制
    mutable std::shared_mutex floorsMutex;
    mutable std::shared_mutex ticketsMutex;

public:
    /**
     * @brief 构造函数
     * @param lotName 停车场名称
     * @param lotAddress 地址
     * @param lotUid 唯一标识
     * @param rate 每小时费率
     * @param ticketSequence 停车票编号生成器，为空时创建独立的生成器
     * @param clockFn 时钟，为空时使用系统时间（测试中可注入）
     */
    ParkingLot(const std::string& lotName,
               const std::string& lotAddress,
               const std::string& lotUid,
               double rate = DEFAULT_HOURLY_RATE,
               std::shared_ptr<SequenceGenerator> ticketSequence = nullptr,
               Clock clockFn = nullptr);

    // 禁止拷贝构造和赋值
    ParkingLot(const ParkingLot&) = delete;
    ParkingLot& operator=(const ParkingLot&) = delete;

    const std::string& getName() const { return name; }
    const std::string& getAddress() const { return address; }
    const std::string& getUid() const { return uid; }

    /**
     * @brief 加入楼层，编号冲突时覆盖原楼层
     * @throws std::invalid_argument floor为空
     */
    void addFloor(std::shared_ptr<ParkingFloor> floor);

    /**
     * @brief 按编号获取楼层
     * @return 楼层句柄，不存在时为空
     *
     * 返回的句柄与停车场共享同一楼层，可用于追加车位。
     */
    std::shared_ptr<ParkingFloor> getFloorById(uint32_t floorId) const;

    /**
     * @brief 车辆入场（线程安全）
     * @param vehicle 车辆
     * @param[out] outTicket 成功时写入停车票副本
     * @return NoAvailableSpot、AlreadyOccupied、IncompatibleClass 或 None
     *
     * 流程：
     * 1. 共享锁下按楼层编号顺序扫描，取第一个报告空位的楼层
     * 2. 重新进入该楼层，在车位表写锁下占用车位
     * 3. 生成新停车票（Pending，无出场时间）并存入停车票表
     */
    ParkingError parkVehicle(const Vehicle& vehicle, ParkingTicket& outTicket);

    /**
     * @brief 车辆出场（线程安全）
     * @param ticketId 停车票编号
     * @param[out] outCharge 成功时写入费用
     * @return InvalidTicket 或 None
     *
     * 停车票不存在或已结算时返回InvalidTicket，且不修改任何状态。
     * 结算后的停车票以Succeeded状态重新存入停车票表作为历史记录。
     */
    ParkingError unparkVehicle(const std::string& ticketId, ParkingCharge& outCharge);

    /**
     * @brief 获取看板数据
     */
    DisplayBoard displayInfo() const;

    /**
     * @brief 查询停车票（线程安全）
     * @param ticketId 停车票编号
     * @param[out] outTicket 输出参数
     * @return 是否找到
     */
    bool queryTicket(const std::string& ticketId, ParkingTicket& outTicket) const;

    /**
     * @brief 获取在场车辆的停车票，按签发顺序排列
     */
    std::vector<ParkingTicket> getActiveTickets() const;

    /**
     * @brief 获取已结算的历史停车票，按签发顺序排列
     */
    std::vector<ParkingTicket> getHistoryTickets() const;

    double getHourlyRate() const { return hourlyRate.load(); }
    void setHourlyRate(double rate);
};
