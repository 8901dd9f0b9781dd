/**
 * @file parking_ticket.h
 * @brief 停车票、费用与计费函数
 */
#pragma once
#include "vehicle.h"
#include <ctime>
#include <optional>
#include <string>

enum class PaymentStatus {
    Pending,
    Succeeded,
    Failed
};

const char* toString(PaymentStatus status);

/**
 * @class ParkingTicket
 * @brief 一次停车过程的记录
 *
 * 停车时创建（Pending，无出场时间），取车时修改一次（写入出场时间与支付状态），
 * 之后作为历史记录保留，不会删除。
 */
class ParkingTicket {
private:
    std::string ticketId;   // 停车票编号（TKT_n）
    Vehicle vehicle;        // 停放的车辆
    std::string spotId;     // 占用的车位编号
    time_t entryTime;       // 入场时间（Unix时间戳）
    std::optional<time_t> exitTime;  // 离场时间（未离场时为空）
    PaymentStatus paymentStatus;

public:
    ParkingTicket() : entryTime(0), paymentStatus(PaymentStatus::Pending) {}

    /**
     * @brief 构造一张新停车票
     * @param id 停车票编号
     * @param parkedVehicle 停放的车辆
     * @param spot 车位编号
     * @param entry 入场时间
     */
    ParkingTicket(const std::string& id, const Vehicle& parkedVehicle,
                  const std::string& spot, time_t entry);

    const std::string& getTicketId() const { return ticketId; }
    const Vehicle& getVehicle() const { return vehicle; }
    const std::string& getSpotId() const { return spotId; }
    time_t getEntryTime() const { return entryTime; }
    const std::optional<time_t>& getExitTime() const { return exitTime; }
    PaymentStatus getPaymentStatus() const { return paymentStatus; }

    bool hasExited() const { return exitTime.has_value(); }

    /**
     * @brief 登记出场并写入支付结果
     */
    void checkout(time_t exit, PaymentStatus status);
};

/**
 * @brief 一次取车产生的费用
 */
struct ParkingCharge {
    double total = 0.0;
    double chargeback = 0.0;  // 目前没有退款流程，恒为0
};

/**
 * @brief 计算停车费用
 * @param entry 入场时间
 * @param exit 出场时间
 * @param ratePerHour 每小时费率
 * @return 费用金额
 *
 * 只按整小时计费，不足一小时的部分不收费：
 * 59分钟收0小时，60分钟收1小时，119分钟收1小时。时长为负时收0。
 */
double calculateFee(time_t entry, time_t exit, double ratePerHour);
