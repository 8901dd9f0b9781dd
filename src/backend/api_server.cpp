/**
 * @file api_server.cpp
 * @brief 停车场RESTful API处理函数的实现
 *
 * 主要功能：
 * 1. 解析JSON请求体（nlohmann::json，解析失败不抛异常）
 * 2. 调用ParkingLot完成入场、出场、查询、调价、扩容
 * 3. 把业务错误码映射为HTTP状态码
 *
 * 状态码约定：
 * - 400：请求体或参数不合法
 * - 404：停车票或楼层不存在
 * - 409：没有可用车位 / 车位已被占用 / 车型不兼容
 * - 500：内部错误
 */
#include "api_server.h"
#include "json_codec.h"
#include "logger.h"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <exception>
#include <utility>

namespace {

/**
 * @brief 解析请求体，要求为JSON对象
 * @return 解析失败时返回discarded值
 */
nlohmann::json parseBody(const std::string& body) {
    nlohmann::json j = nlohmann::json::parse(body, nullptr, false);
    if (!j.is_discarded() && !j.is_object()) {
        return nlohmann::json(nlohmann::json::value_t::discarded);
    }
    return j;
}

bool readString(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

/**
 * @brief 读取非负整数并检查上限，不合法时返回false
 */
bool readUnsigned(const nlohmann::json& value, uint64_t maxValue, uint64_t& out) {
    if (!value.is_number_integer()) {
        return false;
    }
    if (value.is_number_unsigned()) {
        out = value.get<uint64_t>();
    } else {
        int64_t signedValue = value.get<int64_t>();
        if (signedValue < 0) {
            return false;
        }
        out = static_cast<uint64_t>(signedValue);
    }
    return out <= maxValue;
}

bool parseFloorId(const std::string& text, uint32_t& outId) {
    if (text.empty() || text.size() > 9
        || !std::all_of(text.begin(), text.end(),
                        [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return false;
    }
    outId = static_cast<uint32_t>(std::stoul(text));
    return true;
}

std::string getParam(const HttpRequest& req, const std::string& key) {
    auto it = req.params.find(key);
    return it != req.params.end() ? it->second : std::string();
}

}  // namespace

ParkingApiService::ParkingApiService(std::shared_ptr<ParkingLot> lot)
    : parkingLot(std::move(lot)) {
}

std::string ParkingApiService::createJsonResponse(bool success, const std::string& message,
                                                  const nlohmann::json& data) const {
    nlohmann::json j{
        {"success", success},
        {"message", message}
    };
    if (!data.is_null()) {
        j["data"] = data;
    }
    return j.dump();
}

HttpResponse ParkingApiService::makeResponse(int status, bool success, const std::string& message,
                                             const nlohmann::json& data) const {
    HttpResponse response(status);
    response.body = createJsonResponse(success, message, data);
    return response;
}

HttpResponse ParkingApiService::makeErrorResponse(ParkingError error) const {
    int status = 500;
    switch (error) {
        case ParkingError::NoAvailableSpot:
        case ParkingError::AlreadyOccupied:
        case ParkingError::IncompatibleClass:
            status = 409;
            break;
        case ParkingError::InvalidTicket:
            status = 404;
            break;
        case ParkingError::None:
            status = 200;
            break;
    }
    return makeResponse(status, false, toString(error));
}

/**
 * @brief 处理车辆入场请求
 */
HttpResponse ParkingApiService::handlePark(const HttpRequest& req) {
    try {
        nlohmann::json body = parseBody(req.body);
        if (body.is_discarded()) {
            return makeResponse(400, false, "Request body must be a JSON object");
        }

        std::string typeText;
        std::string plate;
        if (!readString(body, "type", typeText) || !readString(body, "plate", plate)) {
            return makeResponse(400, false, "Missing plate or type in request");
        }
        std::string model;
        readString(body, "model", model);  // 型号可选

        VehicleType type;
        if (!parseVehicleType(typeText, type)) {
            return makeResponse(400, false, "Unknown vehicle type: " + typeText);
        }

        ParkingTicket ticket;
        ParkingError result = parkingLot->parkVehicle(Vehicle(type, model, plate), ticket);
        if (result != ParkingError::None) {
            return makeErrorResponse(result);
        }
        return makeResponse(200, true, "Vehicle parked successfully", ticket);
    } catch (const std::exception& e) {
        Logger::error(std::string("handlePark: ") + e.what());
        return makeResponse(500, false, std::string("Internal error: ") + e.what());
    }
}

/**
 * @brief 处理车辆出场请求，返回费用
 */
HttpResponse ParkingApiService::handleUnpark(const HttpRequest& req) {
    try {
        std::string ticketId = getParam(req, "ticketId");
        if (ticketId.empty()) {
            return makeResponse(400, false, "Missing ticket ID");
        }

        ParkingCharge charge;
        ParkingError result = parkingLot->unparkVehicle(ticketId, charge);
        if (result != ParkingError::None) {
            return makeErrorResponse(result);
        }
        return makeResponse(200, true, "Vehicle unparked successfully", charge);
    } catch (const std::exception& e) {
        Logger::error(std::string("handleUnpark: ") + e.what());
        return makeResponse(500, false, std::string("Internal error: ") + e.what());
    }
}

HttpResponse ParkingApiService::handleQueryTicket(const HttpRequest& req) {
    try {
        ParkingTicket ticket;
        if (!parkingLot->queryTicket(getParam(req, "ticketId"), ticket)) {
            return makeResponse(404, false, "Ticket not found");
        }
        return makeResponse(200, true, "Ticket found", ticket);
    } catch (const std::exception& e) {
        Logger::error(std::string("handleQueryTicket: ") + e.what());
        return makeResponse(500, false, std::string("Internal error: ") + e.what());
    }
}

HttpResponse ParkingApiService::handleGetStatus(const HttpRequest&) {
    try {
        nlohmann::json data = parkingLot->displayInfo();
        data["name"] = parkingLot->getName();
        data["address"] = parkingLot->getAddress();
        data["hourlyRate"] = parkingLot->getHourlyRate();
        return makeResponse(200, true, "Status retrieved", data);
    } catch (const std::exception& e) {
        Logger::error(std::string("handleGetStatus: ") + e.what());
        return makeResponse(500, false, std::string("Internal error: ") + e.what());
    }
}

HttpResponse ParkingApiService::handleGetActiveTickets(const HttpRequest&) {
    try {
        nlohmann::json data = parkingLot->getActiveTickets();
        return makeResponse(200, true, "Active tickets retrieved", data);
    } catch (const std::exception& e) {
        Logger::error(std::string("handleGetActiveTickets: ") + e.what());
        return makeResponse(500, false, std::string("Internal error: ") + e.what());
    }
}

HttpResponse ParkingApiService::handleGetHistory(const HttpRequest&) {
    try {
        nlohmann::json data = parkingLot->getHistoryTickets();
        return makeResponse(200, true, "History retrieved", data);
    } catch (const std::exception& e) {
        Logger::error(std::string("handleGetHistory: ") + e.what());
        return makeResponse(500, false, std::string("Internal error: ") + e.what());
    }
}

HttpResponse ParkingApiService::handleSetRate(const HttpRequest& req) {
    try {
        nlohmann::json body = parseBody(req.body);
        if (body.is_discarded()) {
            return makeResponse(400, false, "Request body must be a JSON object");
        }

        auto it = body.find("hourlyRate");
        if (it == body.end() || !it->is_number()) {
            return makeResponse(400, false, "Missing rate parameters");
        }

        double rate = it->get<double>();
        if (rate < 0) {
            return makeResponse(400, false, "Rate must not be negative");
        }

        parkingLot->setHourlyRate(rate);
        return makeResponse(200, true, "Rate updated successfully");
    } catch (const std::exception& e) {
        Logger::error(std::string("handleSetRate: ") + e.what());
        return makeResponse(500, false, std::string("Internal error: ") + e.what());
    }
}

HttpResponse ParkingApiService::handleAddFloor(const HttpRequest& req) {
    try {
        nlohmann::json body = parseBody(req.body);
        if (body.is_discarded()) {
            return makeResponse(400, false, "Request body must be a JSON object");
        }

        uint64_t floorIdValue = 0;
        auto idIt = body.find("id");
        if (idIt == body.end() || !readUnsigned(*idIt, MAX_FLOOR_ID, floorIdValue)) {
            return makeResponse(400, false, "Missing or invalid floor id");
        }

        uint64_t defaultSpots = DEFAULT_REGULAR_SPOTS;
        auto spotsIt = body.find("defaultRegularSpots");
        if (spotsIt != body.end() && !readUnsigned(*spotsIt, MAX_SPOTS_PER_FLOOR, defaultSpots)) {
            return makeResponse(400, false, "Invalid defaultRegularSpots");
        }

        uint32_t floorId = static_cast<uint32_t>(floorIdValue);
        parkingLot->addFloor(std::make_shared<ParkingFloor>(floorId, static_cast<size_t>(defaultSpots)));
        return makeResponse(200, true, "Floor added successfully", {{"id", floorId}});
    } catch (const std::exception& e) {
        Logger::error(std::string("handleAddFloor: ") + e.what());
        return makeResponse(500, false, std::string("Internal error: ") + e.what());
    }
}

HttpResponse ParkingApiService::handleAddSpot(const HttpRequest& req) {
    try {
        uint32_t floorId = 0;
        if (!parseFloorId(getParam(req, "floorId"), floorId)) {
            return makeResponse(400, false, "Invalid floor id");
        }

        auto floor = parkingLot->getFloorById(floorId);
        if (!floor) {
            return makeResponse(404, false, "Floor not found");
        }

        nlohmann::json body = parseBody(req.body);
        std::string typeText;
        if (body.is_discarded() || !readString(body, "type", typeText)) {
            return makeResponse(400, false, "Missing spot type in request");
        }

        SpotType type;
        if (!parseSpotType(typeText, type)) {
            return makeResponse(400, false, "Unknown spot type: " + typeText);
        }

        std::string spotId = floor->addSpot(type);
        return makeResponse(200, true, "Spot added successfully",
                            {{"floorId", floorId}, {"spotId", spotId}, {"type", toString(type)}});
    } catch (const std::exception& e) {
        Logger::error(std::string("handleAddSpot: ") + e.what());
        return makeResponse(500, false, std::string("Internal error: ") + e.what());
    }
}
