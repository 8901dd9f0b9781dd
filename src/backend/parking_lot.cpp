/**
 * @file parking_lot.cpp
 * @brief ParkingLot类的线程安全实现
 */
#include "parking_lot.h"
#include "logger.h"
#include <algorithm>
#include <iomanip>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {

std::string formatAmount(double amount) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << amount;
    return out.str();
}

/**
 * @brief 把停车票编号拆成前缀和去掉前导零的末尾序号
 */
std::pair<std::string, std::string> splitTicketId(const std::string& ticketId) {
    size_t last = ticketId.find_last_not_of("0123456789");
    size_t pos = last == std::string::npos ? 0 : last + 1;
    std::string number = ticketId.substr(pos);
    number.erase(0, std::min(number.find_first_not_of('0'), number.size()));
    return {ticketId.substr(0, pos), number};
}

/**
 * @brief 按签发顺序比较：先比前缀，再按数值比较序号（TKT_2 在 TKT_10 之前）
 */
bool issuedBefore(const ParkingTicket& a, const ParkingTicket& b) {
    auto [prefixA, numberA] = splitTicketId(a.getTicketId());
    auto [prefixB, numberB] = splitTicketId(b.getTicketId());
    if (prefixA != prefixB) {
        return prefixA < prefixB;
    }
    if (numberA.size() != numberB.size()) {
        return numberA.size() < numberB.size();
    }
    return numberA < numberB;
}

}  // namespace

ParkingLot::ParkingLot(const std::string& lotName,
                       const std::string& lotAddress,
                       const std::string& lotUid,
                       double rate,
                       std::shared_ptr<SequenceGenerator> ticketSequence,
                       Clock clockFn)
    : name(lotName)
    , address(lotAddress)
    , uid(lotUid)
    , hourlyRate(rate)
    , ticketIds(ticketSequence ? std::move(ticketSequence)
                               : std::make_shared<SequenceGenerator>("TKT_"))
    , clock(clockFn ? std::move(clockFn) : Clock([] { return std::time(nullptr); })) {
}

void ParkingLot::addFloor(std::shared_ptr<ParkingFloor> floor) {
    if (!floor) {
        throw std::invalid_argument("floor must not be null");
    }

    uint32_t floorId = floor->getId();
    {
        std::unique_lock<std::shared_mutex> lock(floorsMutex);
        floors.insert_or_assign(floorId, std::move(floor));
    }
    Logger::debug("Floor " + std::to_string(floorId) + " added to lot " + uid);
}

std::shared_ptr<ParkingFloor> ParkingLot::getFloorById(uint32_t floorId) const {
    std::shared_lock<std::shared_mutex> lock(floorsMutex);

    auto it = floors.find(floorId);
    if (it == floors.end()) {
        return nullptr;
    }
    return it->second;
}

ParkingError ParkingLot::parkVehicle(const Vehicle& vehicle, ParkingTicket& outTicket) {
    // 1. 扫描楼层，寻找第一个空闲且兼容的车位
    std::optional<std::pair<uint32_t, std::string>> candidate;
    {
        std::shared_lock<std::shared_mutex> lock(floorsMutex);
        for (const auto& [floorId, floor] : floors) {
            if (auto spotId = floor->findAvailableSpot(vehicle.getType())) {
                candidate.emplace(floorId, *spotId);
                break;
            }
        }
    }

    if (!candidate) {
        Logger::warning("No available spot for " + std::string(toString(vehicle.getType()))
                        + " vehicle " + vehicle.getLicensePlate());
        return ParkingError::NoAvailableSpot;
    }

    const auto& [floorId, spotId] = *candidate;

    // 2. 重新进入楼层占用车位，扫描后车位可能已被抢占或楼层已被替换
    ParkingError result = ParkingError::AlreadyOccupied;
    {
        std::shared_lock<std::shared_mutex> lock(floorsMutex);
        auto it = floors.find(floorId);
        if (it != floors.end()) {
            result = it->second->occupySpot(spotId, vehicle);
        }
    }

    if (result != ParkingError::None) {
        Logger::warning("Failed to occupy spot " + spotId + " for vehicle "
                        + vehicle.getLicensePlate() + ": " + toString(result));
        return result;
    }

    // 3. 生成停车票
    ParkingTicket ticket(ticketIds->next(), vehicle, spotId, clock());

    // 4. 存入停车票表
    {
        std::unique_lock<std::shared_mutex> lock(ticketsMutex);
        tickets.insert_or_assign(ticket.getTicketId(), ticket);
    }

    Logger::info("Vehicle " + vehicle.getLicensePlate() + " parked at " + spotId
                 + " on floor " + std::to_string(floorId) + ". Ticket ID: " + ticket.getTicketId());
    outTicket = std::move(ticket);
    return ParkingError::None;
}

ParkingError ParkingLot::unparkVehicle(const std::string& ticketId, ParkingCharge& outCharge) {
    // 1. 取出停车票，已结算的停车票不能再次结算
    ParkingTicket ticket;
    bool found = false;
    {
        std::unique_lock<std::shared_mutex> lock(ticketsMutex);
        auto it = tickets.find(ticketId);
        if (it != tickets.end() && !it->second.hasExited()) {
            ticket = std::move(it->second);
            tickets.erase(it);
            found = true;
        }
    }

    if (!found) {
        Logger::warning("Unpark rejected, invalid ticket ID: " + ticketId);
        return ParkingError::InvalidTicket;
    }

    // 2. 释放车位
    bool vacated = false;
    {
        std::shared_lock<std::shared_mutex> lock(floorsMutex);
        for (const auto& [_, floor] : floors) {
            if (floor->vacateSpot(ticket.getSpotId())) {
                vacated = true;
                break;
            }
        }
    }

    if (!vacated) {
        Logger::warning("Spot " + ticket.getSpotId() + " of ticket " + ticketId
                        + " no longer exists, nothing to vacate");
    }

    // 3. 计算费用
    time_t now = clock();
    ParkingCharge charge;
    charge.total = calculateFee(ticket.getEntryTime(), now, hourlyRate.load());
    charge.chargeback = 0.0;

    // 4. 写入出场信息，作为历史记录放回停车票表
    ticket.checkout(now, PaymentStatus::Succeeded);
    {
        std::unique_lock<std::shared_mutex> lock(ticketsMutex);
        tickets.insert_or_assign(ticketId, ticket);
    }

    Logger::info("Vehicle " + ticket.getVehicle().getLicensePlate()
                 + " unparked. Total charge: $" + formatAmount(charge.total));
    outCharge = charge;
    return ParkingError::None;
}

DisplayBoard ParkingLot::displayInfo() const {
    DisplayBoard board;
    board.uid = uid;

    std::shared_lock<std::shared_mutex> lock(floorsMutex);
    board.numFloors = static_cast<uint32_t>(floors.size());
    for (const auto& [_, floor] : floors) {
        FloorStats stats = floor->getStats();
        board.numTotalSpots += static_cast<uint32_t>(stats.totalSpots);
        board.numEmptySpots += static_cast<uint32_t>(stats.freeSpots);
        board.numParkedVehicles += static_cast<uint32_t>(stats.occupiedSpots);
    }
    return board;
}

bool ParkingLot::queryTicket(const std::string& ticketId, ParkingTicket& outTicket) const {
    std::shared_lock<std::shared_mutex> lock(ticketsMutex);

    auto it = tickets.find(ticketId);
    if (it != tickets.end()) {
        outTicket = it->second;
        return true;
    }
    return false;
}

std::vector<ParkingTicket> ParkingLot::getActiveTickets() const {
    std::shared_lock<std::shared_mutex> lock(ticketsMutex);

    std::vector<ParkingTicket> active;
    for (const auto& [_, ticket] : tickets) {
        if (!ticket.hasExited()) {
            active.push_back(ticket);
        }
    }
    std::sort(active.begin(), active.end(), issuedBefore);
    return active;
}

std::vector<ParkingTicket> ParkingLot::getHistoryTickets() const {
    std::shared_lock<std::shared_mutex> lock(ticketsMutex);

    std::vector<ParkingTicket> history;
    for (const auto& [_, ticket] : tickets) {
        if (ticket.hasExited()) {
            history.push_back(ticket);
        }
    }
    std::sort(history.begin(), history.end(), issuedBefore);
    return history;
}

void ParkingLot::setHourlyRate(double rate) {
    hourlyRate.store(rate);
    Logger::info("Hourly rate updated to " + formatAmount(rate));
}
