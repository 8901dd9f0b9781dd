/**
 * @file config_loader.cpp
 * @brief 配置读取实现
 */
#include "config_loader.h"
#include "logger.h"
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {

template<typename T>
void readField(const nlohmann::json& j, const char* key, T& field) {
    auto it = j.find(key);
    if (it != j.end()) {
        field = it->template get<T>();
    }
}

/**
 * @brief 读取整数字段并在收窄前检查范围
 *
 * nlohmann对无符号目标类型的转换不做溢出检查，这里统一按64位读取。
 */
template<typename T>
void readBounded(const nlohmann::json& j, const char* key, uint64_t minValue, uint64_t maxValue, T& field) {
    auto it = j.find(key);
    if (it == j.end()) {
        return;
    }
    if (!it->is_number_integer()) {
        throw std::runtime_error(std::string(key) + " must be an integer");
    }

    uint64_t value = 0;
    if (it->is_number_unsigned()) {
        value = it->template get<uint64_t>();
    } else {
        int64_t signedValue = it->template get<int64_t>();
        if (signedValue < 0) {
            throw std::runtime_error(std::string(key) + " must not be negative");
        }
        value = static_cast<uint64_t>(signedValue);
    }

    if (value < minValue || value > maxValue) {
        throw std::runtime_error(std::string(key) + " out of range [" + std::to_string(minValue)
                                 + ", " + std::to_string(maxValue) + "]: " + std::to_string(value));
    }
    field = static_cast<T>(value);
}

}  // namespace

LotConfig parseLotConfig(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Config root must be a JSON object");
    }

    LotConfig config;
    try {
        readField(j, "name", config.name);
        readField(j, "address", config.address);
        readField(j, "uid", config.uid);
        readBounded(j, "floors", 1, MAX_FLOORS, config.floorCount);
        readBounded(j, "defaultRegularSpots", 0, MAX_SPOTS_PER_FLOOR, config.defaultRegularSpots);
        readBounded(j, "groundFloorLargeSpots", 0, MAX_SPOTS_PER_FLOOR, config.groundFloorLargeSpots);
        readField(j, "hourlyRate", config.hourlyRate);
        readBounded(j, "port", 1, UINT16_MAX, config.port);

        std::string level;
        readField(j, "logLevel", level);
        if (!level.empty() && !parseLogLevel(level, config.logLevel)) {
            throw std::runtime_error("Unknown log level: " + level);
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    if (config.hourlyRate < 0) {
        throw std::runtime_error("hourlyRate must not be negative");
    }
    return config;
}

LotConfig loadLotConfig(const std::string& path) {
    std::ifstream inFile(path);
    if (!inFile) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json j = nlohmann::json::parse(inFile, nullptr, false);
    if (j.is_discarded()) {
        throw std::runtime_error("Config file is not valid JSON: " + path);
    }

    LotConfig config = parseLotConfig(j);
    Logger::info("Loaded config from " + path);
    return config;
}
