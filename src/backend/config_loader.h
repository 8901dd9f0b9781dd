/**
 * @file config_loader.h
 * @brief 从JSON文件读取停车场配置
 */
#pragma once
#include "lot_config.h"
#include <nlohmann/json.hpp>
#include <string>

/**
 * @brief 从JSON对象解析配置
 * @throws std::runtime_error 字段类型错误或取值非法
 *
 * 支持的字段：name, address, uid, floors, defaultRegularSpots,
 * groundFloorLargeSpots, hourlyRate, port, logLevel。
 * 缺省字段保持LotConfig的默认值。
 */
LotConfig parseLotConfig(const nlohmann::json& j);

/**
 * @brief 读取配置文件
 * @throws std::runtime_error 文件无法打开或内容不是合法JSON
 */
LotConfig loadLotConfig(const std::string& path);
