/**
 * @file lot_builder.h
 * @brief 根据配置创建停车场
 */
#pragma once
#include "lot_config.h"
#include "parking_lot.h"
#include <memory>

/**
 * @brief 按配置创建停车场并加入楼层
 *
 * 楼层编号为1..floorCount，每层预置defaultRegularSpots个普通车位，
 * 1层另外追加groundFloorLargeSpots个大型车位。
 * @throws std::invalid_argument 楼层数或车位数超过上限
 */
std::unique_ptr<ParkingLot> buildParkingLot(const LotConfig& config,
                                            ParkingLot::Clock clock = nullptr);
