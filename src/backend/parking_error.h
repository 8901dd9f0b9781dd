/**
 * @file parking_error.h
 * @brief 停车业务错误码
 */
#pragma once

/**
 * @brief 停车/取车操作的结果
 *
 * 业务失败通过返回值传递给直接调用方，不抛异常，也不在内部重试。
 * 是否重试（例如遇到AlreadyOccupied后重新扫描）由调用方决定。
 */
enum class ParkingError {
    None,               // 成功
    NoAvailableSpot,    // 扫描时没有空闲且兼容的车位
    AlreadyOccupied,    // 车位已被占用（包括扫描与占用之间的竞争）
    IncompatibleClass,  // 车型与车位类型不兼容
    InvalidTicket       // 停车票不存在或已结算
};

const char* toString(ParkingError error);
