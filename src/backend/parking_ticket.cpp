/**
 * @file parking_ticket.cpp
 * @brief ParkingTicket与计费实现
 */
#include "parking_ticket.h"

namespace {
constexpr long SECONDS_PER_HOUR = 3600;
}

const char* toString(PaymentStatus status) {
    switch (status) {
        case PaymentStatus::Pending: return "pending";
        case PaymentStatus::Succeeded: return "succeeded";
        case PaymentStatus::Failed: return "failed";
        default: return "unknown";
    }
}

ParkingTicket::ParkingTicket(const std::string& id, const Vehicle& parkedVehicle,
                             const std::string& spot, time_t entry)
    : ticketId(id)
    , vehicle(parkedVehicle)
    , spotId(spot)
    , entryTime(entry)
    , paymentStatus(PaymentStatus::Pending) {
}

void ParkingTicket::checkout(time_t exit, PaymentStatus status) {
    exitTime = exit;
    paymentStatus = status;
}

double calculateFee(time_t entry, time_t exit, double ratePerHour) {
    double seconds = std::difftime(exit, entry);
    if (seconds <= 0) {
        return 0.0;
    }

    // 截断为整小时
    long wholeHours = static_cast<long>(seconds) / SECONDS_PER_HOUR;
    return static_cast<double>(wholeHours) * ratePerHour;
}
