/**
 * @file json_codec.h
 * @brief 领域对象与JSON之间的转换（nlohmann::json的ADL接口）
 */
#pragma once
#include "parking_lot.h"
#include "parking_ticket.h"
#include "vehicle.h"
#include <nlohmann/json.hpp>

void to_json(nlohmann::json& j, const Vehicle& vehicle);
void to_json(nlohmann::json& j, const ParkingTicket& ticket);
void to_json(nlohmann::json& j, const ParkingCharge& charge);
void to_json(nlohmann::json& j, const DisplayBoard& board);
