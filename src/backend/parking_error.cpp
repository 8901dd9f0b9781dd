/**
 * @file parking_error.cpp
 * @brief 错误码描述
 */
#include "parking_error.h"

const char* toString(ParkingError error) {
    switch (error) {
        case ParkingError::None: return "OK";
        case ParkingError::NoAvailableSpot: return "No available spots";
        case ParkingError::AlreadyOccupied: return "Spot is already occupied";
        case ParkingError::IncompatibleClass: return "Vehicle type not compatible with spot type";
        case ParkingError::InvalidTicket: return "Invalid ticket ID";
        default: return "Unknown error";
    }
}
