#pragma once

#include "common/utils/AppException.hpp"
#include "common/utils/Constants.hpp"

#include <cstdint>
#include <string>

/**
 * @brief UV 灯控制柜 PLC 寄存器表
 *
 * 地址均为 0 基（PLC 手册中的编号 - 1）。
 * 每个区段 4 根灯管，lampIndex 取值 1..4。
 */
namespace uv::Registers {

// ==================== 线圈 (FC05) ====================

/** 区段总电源 */
inline constexpr uint16_t POWER_COIL = 8;

/** 灯管 1 运行时间复位，后续灯管间隔 2 */
inline constexpr uint16_t LAMP_HOURS_RESET_COIL_BASE = 0;

/** 灯管 1 清洗计时复位，后续灯管间隔 2 */
inline constexpr uint16_t CLEANING_RESET_COIL_BASE = 10;

// ==================== 离散输入 (FC02) ====================

/** 灯管 1 清洗状态，后续灯管间隔 4；寿命状态在其后 +2 */
inline constexpr uint16_t LAMP_STATUS_INPUT_BASE = 0;

inline constexpr uint16_t DPS_STATUS_INPUT = 16;
inline constexpr uint16_t PRESSURE_BUTTON_INPUT = 18;
inline constexpr uint16_t POWER_STATUS_INPUT = 20;
inline constexpr uint16_t COMBINED_CLEANING_STATUS_INPUT = 24;

// ==================== 输入寄存器 (FC04) ====================

/** 灯管 1 当前运行小时（u16），后续灯管间隔 4 */
inline constexpr uint16_t LAMP_HOURS_INPUT_BASE = 1;

/** 电流（float32，2 个寄存器） */
inline constexpr uint16_t CURRENT_AMPS_INPUT = 17;

/** 在线灯管数（float32，取整） */
inline constexpr uint16_t LAMPS_ONLINE_INPUT = 21;

/** 灯管 1 清洗后运行小时（float32），后续灯管间隔 2 */
inline constexpr uint16_t CLEANING_RUN_HOURS_INPUT_BASE = 23;

// ==================== 保持寄存器 (FC03 / FC10) ====================

/** 灯管 1 寿命上限（u16，与输入寄存器同地址），后续灯管间隔 4 */
inline constexpr uint16_t LAMP_MAX_HOURS_HOLDING_BASE = 1;

/** 清洗周期设定（float32） */
inline constexpr uint16_t CLEANING_HOURS_SETPOINT = 1;

/** 灯管寿命设定（float32） */
inline constexpr uint16_t LAMP_LIFE_SETPOINT = 5;

// ==================== 按灯管编号计算地址 ====================

/**
 * @throws ValidationException lampIndex 不在 1..LAMP_COUNT
 */
inline void validateLampIndex(int lampIndex) {
    if (lampIndex < 1 || lampIndex > Constants::LAMP_COUNT) {
        throw ValidationException("Invalid lamp index " + std::to_string(lampIndex)
            + " (expected 1-" + std::to_string(Constants::LAMP_COUNT) + ")");
    }
}

inline uint16_t lampHoursResetCoil(int lampIndex) {
    validateLampIndex(lampIndex);
    return static_cast<uint16_t>(LAMP_HOURS_RESET_COIL_BASE + (lampIndex - 1) * 2);
}

inline uint16_t cleaningResetCoil(int lampIndex) {
    validateLampIndex(lampIndex);
    return static_cast<uint16_t>(CLEANING_RESET_COIL_BASE + (lampIndex - 1) * 2);
}

inline uint16_t lampHoursRegister(int lampIndex) {
    validateLampIndex(lampIndex);
    return static_cast<uint16_t>(LAMP_HOURS_INPUT_BASE + (lampIndex - 1) * 4);
}

inline uint16_t lampMaxHoursRegister(int lampIndex) {
    validateLampIndex(lampIndex);
    return static_cast<uint16_t>(LAMP_MAX_HOURS_HOLDING_BASE + (lampIndex - 1) * 4);
}

inline uint16_t cleaningRunHoursRegister(int lampIndex) {
    validateLampIndex(lampIndex);
    return static_cast<uint16_t>(CLEANING_RUN_HOURS_INPUT_BASE + (lampIndex - 1) * 2);
}

inline uint16_t lampCleanStatusInput(int lampIndex) {
    validateLampIndex(lampIndex);
    return static_cast<uint16_t>(LAMP_STATUS_INPUT_BASE + (lampIndex - 1) * 4);
}

inline uint16_t lampLifeStatusInput(int lampIndex) {
    validateLampIndex(lampIndex);
    return static_cast<uint16_t>(LAMP_STATUS_INPUT_BASE + (lampIndex - 1) * 4 + 2);
}

}  // namespace uv::Registers
