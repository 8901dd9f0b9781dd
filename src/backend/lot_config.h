/**
 * @file lot_config.h
 * @brief 停车场配置与默认值
 */
#pragma once
#include "logger.h"
#include <cstddef>
#include <cstdint>
#include <string>

constexpr double DEFAULT_HOURLY_RATE = 10.0;      // 每小时费率
constexpr size_t DEFAULT_REGULAR_SPOTS = 10;      // 每层默认普通车位数
constexpr uint16_t DEFAULT_SERVER_PORT = 8080;

constexpr uint32_t MAX_FLOORS = 1000;             // 配置中楼层数上限
constexpr size_t MAX_SPOTS_PER_FLOOR = 10000;     // 每层批量创建车位数上限
constexpr uint64_t MAX_FLOOR_ID = UINT32_MAX;

/**
 * @struct LotConfig
 * @brief 启动停车场所需的全部配置
 *
 * 未在配置文件中出现的字段保持此处的默认值。
 */
struct LotConfig {
    std::string name = "Park-Wella Parking Hub";
    std::string address = "Lagos, Nigeria";
    std::string uid = "1234";

    uint32_t floorCount = 5;                          // 楼层编号为 1..floorCount
    size_t defaultRegularSpots = DEFAULT_REGULAR_SPOTS;
    size_t groundFloorLargeSpots = 5;                 // 1层额外的大型车位（供货车使用）

    double hourlyRate = DEFAULT_HOURLY_RATE;

    uint16_t port = DEFAULT_SERVER_PORT;
    LogLevel logLevel = LogLevel::INFO;
};
