/**
 * @file api_server.h
 * @brief 停车场HTTP接口的请求处理（与具体HTTP框架无关）
 */
#pragma once
#include "parking_lot.h"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <string>

class HttpRequest {
public:
    std::string method;
    std::string path;
    std::string body;
    std::map<std::string, std::string> params;  // 路径参数，如 ticketId / floorId
};

class HttpResponse {
public:
    int status;
    std::string body;
    std::map<std::string, std::string> headers;

    HttpResponse(int s = 200) : status(s) {
        headers["Content-Type"] = "application/json";
    }
};

/**
 * @class ParkingApiService
 * @brief RESTful API的处理函数集合
 *
 * 每个处理函数把HttpRequest转换为对ParkingLot的调用，并返回
 * {"success":bool,"message":string,"data":...} 格式的JSON响应。
 * 处理函数不会抛出异常，内部错误统一转换为500响应。
 */
class ParkingApiService {
private:
    std::shared_ptr<ParkingLot> parkingLot;

    std::string createJsonResponse(bool success, const std::string& message,
                                   const nlohmann::json& data = nullptr) const;
    HttpResponse makeResponse(int status, bool success, const std::string& message,
                              const nlohmann::json& data = nullptr) const;
    HttpResponse makeErrorResponse(ParkingError error) const;

public:
    explicit ParkingApiService(std::shared_ptr<ParkingLot> lot);

    // POST /api/park  {"type":"compact","model":"Toyota","plate":"ABC123"}
    HttpResponse handlePark(const HttpRequest& req);
    // DELETE /api/ticket/<ticketId>
    HttpResponse handleUnpark(const HttpRequest& req);
    // GET /api/ticket/<ticketId>
    HttpResponse handleQueryTicket(const HttpRequest& req);
    // GET /api/status
    HttpResponse handleGetStatus(const HttpRequest& req);
    // GET /api/tickets/active
    HttpResponse handleGetActiveTickets(const HttpRequest& req);
    // GET /api/history
    HttpResponse handleGetHistory(const HttpRequest& req);
    // PUT /api/rate  {"hourlyRate":12.5}
    HttpResponse handleSetRate(const HttpRequest& req);
    // POST /api/floor  {"id":6,"defaultRegularSpots":10}
    HttpResponse handleAddFloor(const HttpRequest& req);
    // POST /api/floor/<floorId>/spot  {"type":"large"}
    HttpResponse handleAddSpot(const HttpRequest& req);
};
