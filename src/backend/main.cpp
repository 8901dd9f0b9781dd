/**
 * @file main.cpp
 * @brief 停车场系统的主程序入口
 *
 * 该文件负责：
 * 1. 读取配置并创建停车场
 * 2. 运行演示流程（登记车辆、入场、看板、出场、并发入场）
 * 3. 按需启动HTTP服务器
 * 4. 处理异常情况
 *
 * 用法：parking_hub [config.json] [--serve]
 */
#include "config_loader.h"
#include "crow_server.h"
#include "logger.h"
#include "lot_builder.h"
#include "parking_lot.h"
#include "thread_pool.h"
#include "user_account.h"
#include <atomic>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr int BURST_ARRIVALS = 20;

/**
 * @brief 打印停车票详细信息到控制台
 */
void printTicketInfo(const ParkingTicket& ticket) {
    const Vehicle& vehicle = ticket.getVehicle();
    std::cout << "停车票: " << ticket.getTicketId() << std::endl;
    std::cout << "车牌号: " << vehicle.getLicensePlate()
              << " (" << vehicle.getModel() << ", " << toString(vehicle.getType()) << ")" << std::endl;
    std::cout << "车位: " << ticket.getSpotId() << std::endl;

    std::tm tm{};
    time_t entryTime = ticket.getEntryTime();
    localtime_r(&entryTime, &tm);
    std::cout << "入场时间: " << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << std::endl;

    if (ticket.getExitTime()) {
        time_t exitTime = *ticket.getExitTime();
        localtime_r(&exitTime, &tm);
        std::cout << "离场时间: " << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << std::endl;
    }
    std::cout << "支付状态: " << toString(ticket.getPaymentStatus()) << std::endl;
    std::cout << "------------------------" << std::endl;
}

void printDisplayBoard(const DisplayBoard& board) {
    std::cout << "=== 停车场 " << board.uid << " ===" << std::endl;
    std::cout << "楼层数: " << board.numFloors << std::endl;
    std::cout << "车位总数: " << board.numTotalSpots << std::endl;
    std::cout << "空闲车位: " << board.numEmptySpots << std::endl;
    std::cout << "在场车辆: " << board.numParkedVehicles << std::endl;
    std::cout << "------------------------" << std::endl;
}

/**
 * @brief 演示流程：一位车主登记三辆车并依次入场，随后一辆车出场
 */
void runDemo(ParkingLot& lot) {
    UserAccount user("Larry", "123");

    std::vector<Vehicle> vehicles = {
        Vehicle(VehicleType::Compact, "Toyota", "ABC123"),
        Vehicle(VehicleType::Heavy, "Mac", "XYZ789"),
        Vehicle(VehicleType::Light, "Suzuki", "DEF456"),
    };
    for (const auto& vehicle : vehicles) {
        std::string vehicleId = user.registerVehicle(vehicle);
        std::cout << user.getName() << " registered " << vehicle.getLicensePlate()
                  << " as " << vehicleId << std::endl;
    }

    printDisplayBoard(lot.displayInfo());

    std::string lastTicketId;
    for (const auto& vehicle : vehicles) {
        ParkingTicket ticket;
        ParkingError result = lot.parkVehicle(vehicle, ticket);
        if (result != ParkingError::None) {
            std::cerr << "An error occurred while getting your parking ticket: "
                      << toString(result) << std::endl;
            continue;
        }
        printTicketInfo(ticket);
        lastTicketId = ticket.getTicketId();
    }

    printDisplayBoard(lot.displayInfo());

    ParkingCharge charge;
    ParkingError result = lot.unparkVehicle(lastTicketId, charge);
    if (result == ParkingError::None) {
        std::cout << "Vehicle successfully unparked. Grand total: " << charge.total
                  << ", chargeback: " << charge.chargeback << std::endl;
    } else {
        std::cerr << "An error occurred while unparking: " << toString(result) << std::endl;
    }
}

/**
 * @brief 并发入场演示：多个线程同时为自行车申请车位
 */
void runArrivalBurst(ParkingLot& lot) {
    std::atomic<int> parked(0);
    std::atomic<int> rejected(0);
    {
        ThreadPool pool(std::thread::hardware_concurrency());
        for (int i = 0; i < BURST_ARRIVALS; ++i) {
            pool.enqueue([&lot, &parked, &rejected, i] {
                Vehicle bike(VehicleType::Light, "Bike", "BIKE-" + std::to_string(i));
                ParkingTicket ticket;
                if (lot.parkVehicle(bike, ticket) == ParkingError::None) {
                    ++parked;
                } else {
                    ++rejected;
                }
            });
        }
        pool.waitIdle();
    }

    std::cout << "Burst of " << BURST_ARRIVALS << " bikes: " << parked.load()
              << " parked, " << rejected.load() << " rejected" << std::endl;
    printDisplayBoard(lot.displayInfo());
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        std::string configPath;
        bool serve = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--serve") {
                serve = true;
            } else {
                configPath = arg;
            }
        }

        LotConfig config = configPath.empty() ? LotConfig() : loadLotConfig(configPath);
        Logger::setLogLevel(config.logLevel);

        std::cout << "Parking Lot Project Demo" << std::endl;
        std::shared_ptr<ParkingLot> lot = buildParkingLot(config);

        runDemo(*lot);
        runArrivalBurst(*lot);

        if (serve) {
            CrowParkingServer server(lot);
            std::cout << "Server is running on http://localhost:" << config.port << std::endl;
            std::cout << "Available endpoints:" << std::endl;
            std::cout << "POST   /api/park              - Park a vehicle" << std::endl;
            std::cout << "DELETE /api/ticket/:id        - Unpark and pay" << std::endl;
            std::cout << "GET    /api/ticket/:id        - Query ticket" << std::endl;
            std::cout << "GET    /api/status            - Display board" << std::endl;
            std::cout << "GET    /api/tickets/active    - Active tickets" << std::endl;
            std::cout << "GET    /api/history           - Completed tickets" << std::endl;
            std::cout << "PUT    /api/rate              - Update hourly rate" << std::endl;
            std::cout << "POST   /api/floor             - Add a floor" << std::endl;
            std::cout << "POST   /api/floor/:id/spot    - Add a spot to a floor" << std::endl;
            server.start(config.port);
        }
        return 0;

    } catch (const std::exception& e) {
        Logger::error(std::string("Fatal error: ") + e.what());
        return 1;
    }
}
