/**
 * @file crow_server.cpp
 * @brief CrowParkingServer实现：把Crow路由转发到ParkingApiService
 */
#include "crow_server.h"
#include "logger.h"
#include <utility>

namespace {

HttpRequest toHttpRequest(const crow::request& req) {
    HttpRequest request;
    request.method = crow::method_name(req.method);
    request.path = req.url;
    request.body = req.body;
    return request;
}

crow::response toCrowResponse(const HttpResponse& response) {
    crow::response res(response.status);
    for (const auto& [key, value] : response.headers) {
        res.set_header(key, value);
    }
    res.write(response.body);
    return res;
}

}  // namespace

CrowParkingServer::CrowParkingServer(std::shared_ptr<ParkingLot> lot)
    : service(std::move(lot)) {
    setupCORS();
    setupRoutes();
}

void CrowParkingServer::setupCORS() {
    auto& cors = app.get_middleware<crow::CORSHandler>();
    cors.global()
        .origin("*")
        .headers("Content-Type")
        .methods("GET"_method, "POST"_method, "PUT"_method, "DELETE"_method);
}

void CrowParkingServer::setupRoutes() {
    CROW_ROUTE(app, "/api/park").methods("POST"_method)
    ([this](const crow::request& req) {
        return toCrowResponse(service.handlePark(toHttpRequest(req)));
    });

    CROW_ROUTE(app, "/api/ticket/<string>").methods("GET"_method, "DELETE"_method)
    ([this](const crow::request& req, std::string ticketId) {
        HttpRequest request = toHttpRequest(req);
        request.params["ticketId"] = ticketId;
        if (req.method == "DELETE"_method) {
            return toCrowResponse(service.handleUnpark(request));
        }
        return toCrowResponse(service.handleQueryTicket(request));
    });

    CROW_ROUTE(app, "/api/status").methods("GET"_method)
    ([this](const crow::request& req) {
        return toCrowResponse(service.handleGetStatus(toHttpRequest(req)));
    });

    CROW_ROUTE(app, "/api/tickets/active").methods("GET"_method)
    ([this](const crow::request& req) {
        return toCrowResponse(service.handleGetActiveTickets(toHttpRequest(req)));
    });

    CROW_ROUTE(app, "/api/history").methods("GET"_method)
    ([this](const crow::request& req) {
        return toCrowResponse(service.handleGetHistory(toHttpRequest(req)));
    });

    CROW_ROUTE(app, "/api/rate").methods("PUT"_method)
    ([this](const crow::request& req) {
        return toCrowResponse(service.handleSetRate(toHttpRequest(req)));
    });

    CROW_ROUTE(app, "/api/floor").methods("POST"_method)
    ([this](const crow::request& req) {
        return toCrowResponse(service.handleAddFloor(toHttpRequest(req)));
    });

    CROW_ROUTE(app, "/api/floor/<string>/spot").methods("POST"_method)
    ([this](const crow::request& req, std::string floorId) {
        HttpRequest request = toHttpRequest(req);
        request.params["floorId"] = floorId;
        return toCrowResponse(service.handleAddSpot(request));
    });
}

void CrowParkingServer::start(uint16_t port) {
    Logger::info("HTTP server listening on port " + std::to_string(port));
    app.port(port).multithreaded().run();
}

void CrowParkingServer::stop() {
    app.stop();
}
