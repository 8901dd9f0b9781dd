/**
 * @file vehicle.h
 * @brief 车辆类的声明，描述一辆请求车位的车辆
 */
#pragma once
#include <string>

/**
 * @brief 车型分类
 *
 * Compact 小型机动车，Heavy 货车，Light 摩托/自行车。
 * 车型决定能够停入哪些车位类型。
 */
enum class VehicleType {
    Compact,
    Heavy,
    Light
};

/**
 * @class Vehicle
 * @brief 不可变的车辆值对象
 *
 * 包含车型、型号和车牌号。车牌号理论上唯一，但停车场核心不做校验。
 */
class Vehicle {
private:
    VehicleType type;          // 车型
    std::string model;         // 型号（例：Toyota）
    std::string licensePlate;  // 车牌号（例：ABC123）

public:
    /**
     * @brief 默认构造函数，仅用于输出参数占位
     */
    Vehicle() : type(VehicleType::Compact) {}

    /**
     * @brief 构造函数
     * @param vType 车型
     * @param vModel 型号
     * @param plate 车牌号
     */
    Vehicle(VehicleType vType, const std::string& vModel, const std::string& plate);

    VehicleType getType() const;
    const std::string& getModel() const;
    const std::string& getLicensePlate() const;

    bool operator==(const Vehicle& other) const;
    bool operator!=(const Vehicle& other) const { return !(*this == other); }
};

/**
 * @brief 车型转字符串（compact/heavy/light）
 */
const char* toString(VehicleType type);

/**
 * @brief 解析车型字符串
 * @param text 车型字符串，不区分大小写；也接受motor/truck/bike
 * @param[out] outType 解析结果
 * @return 是否解析成功
 */
bool parseVehicleType(const std::string& text, VehicleType& outType);
