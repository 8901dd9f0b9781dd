/**
 * @file vehicle.cpp
 * @brief Vehicle类的实现文件
 */
#include "vehicle.h"
#include <algorithm>
#include <cctype>

Vehicle::Vehicle(VehicleType vType, const std::string& vModel, const std::string& plate)
    : type(vType)
    , model(vModel)
    , licensePlate(plate) {
}

VehicleType Vehicle::getType() const {
    return type;
}

const std::string& Vehicle::getModel() const {
    return model;
}

const std::string& Vehicle::getLicensePlate() const {
    return licensePlate;
}

bool Vehicle::operator==(const Vehicle& other) const {
    return type == other.type
        && model == other.model
        && licensePlate == other.licensePlate;
}

const char* toString(VehicleType type) {
    switch (type) {
        case VehicleType::Compact: return "compact";
        case VehicleType::Heavy: return "heavy";
        case VehicleType::Light: return "light";
        default: return "unknown";
    }
}

bool parseVehicleType(const std::string& text, VehicleType& outType) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // 同时接受参考领域中的叫法：motor/truck/bike
    if (lower == "compact" || lower == "motor") {
        outType = VehicleType::Compact;
    } else if (lower == "heavy" || lower == "truck") {
        outType = VehicleType::Heavy;
    } else if (lower == "light" || lower == "bike") {
        outType = VehicleType::Light;
    } else {
        return false;
    }
    return true;
}
