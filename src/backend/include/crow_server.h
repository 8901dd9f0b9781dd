/**
 * @file crow_server.h
 * @brief 基于Crow的停车场HTTP服务器
 */
#pragma once

#ifndef CROW_USE_BOOST_ASIO
#define CROW_USE_BOOST_ASIO
#endif
#include <boost/asio.hpp>
#include "crow.h"
#include "crow/middlewares/cors.h"
#include "api_server.h"
#include "parking_lot.h"
#include <cstdint>
#include <memory>

class CrowParkingServer {
public:
    explicit CrowParkingServer(std::shared_ptr<ParkingLot> lot);

    /**
     * @brief 启动服务器并阻塞直到stop()被调用
     * @param port 监听端口
     */
    void start(uint16_t port = 8080);
    void stop();

private:
    void setupRoutes();
    void setupCORS();

    ParkingApiService service;
    crow::App<crow::CORSHandler> app;
};
