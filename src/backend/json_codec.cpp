/**
 * @file json_codec.cpp
 * @brief JSON转换实现
 */
#include "json_codec.h"

void to_json(nlohmann::json& j, const Vehicle& vehicle) {
    j = nlohmann::json{
        {"type", toString(vehicle.getType())},
        {"model", vehicle.getModel()},
        {"plate", vehicle.getLicensePlate()}
    };
}

void to_json(nlohmann::json& j, const ParkingTicket& ticket) {
    j = nlohmann::json{
        {"ticketId", ticket.getTicketId()},
        {"vehicle", ticket.getVehicle()},
        {"spotId", ticket.getSpotId()},
        {"entryTime", static_cast<int64_t>(ticket.getEntryTime())},
        {"paymentStatus", toString(ticket.getPaymentStatus())}
    };

    // 未离场时exitTime为null
    if (ticket.getExitTime()) {
        j["exitTime"] = static_cast<int64_t>(*ticket.getExitTime());
    } else {
        j["exitTime"] = nullptr;
    }
}

void to_json(nlohmann::json& j, const ParkingCharge& charge) {
    j = nlohmann::json{
        {"total", charge.total},
        {"chargeback", charge.chargeback}
    };
}

void to_json(nlohmann::json& j, const DisplayBoard& board) {
    j = nlohmann::json{
        {"uid", board.uid},
        {"floors", board.numFloors},
        {"totalSpots", board.numTotalSpots},
        {"emptySpots", board.numEmptySpots},
        {"parkedVehicles", board.numParkedVehicles}
    };
}
