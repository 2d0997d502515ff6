#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace modbus {

/** 一帧完整的 Modbus TCP 报文（MBAP Header + PDU），构建后不再修改 */
using Frame = std::vector<uint8_t>;

// ==================== 功能码常量 ====================

struct FuncCodes {
    static constexpr uint8_t READ_COILS = 0x01;
    static constexpr uint8_t READ_DISCRETE_INPUTS = 0x02;
    static constexpr uint8_t READ_HOLDING_REGISTERS = 0x03;
    static constexpr uint8_t READ_INPUT_REGISTERS = 0x04;
    static constexpr uint8_t WRITE_SINGLE_COIL = 0x05;
    static constexpr uint8_t WRITE_SINGLE_REGISTER = 0x06;
    static constexpr uint8_t WRITE_MULTIPLE_COILS = 0x0F;
    static constexpr uint8_t WRITE_MULTIPLE_REGISTERS = 0x10;

    /** 异常应答标志位 */
    static constexpr uint8_t EXCEPTION_FLAG = 0x80;
};

/** 线圈写入值：FC05 使用 0xFF00 表示 ON，0x0000 表示 OFF */
inline constexpr uint16_t COIL_ON = 0xFF00;
inline constexpr uint16_t COIL_OFF = 0x0000;

// ==================== 帧结构 ====================

/**
 * @brief Modbus 请求参数
 *
 * quantity 的含义随功能码变化：
 * - FC01-04: 读取数量
 * - FC05/06: 写入值（FC05 为 0xFF00/0x0000）
 * - FC0F: 线圈数量（data 为打包后的位数据）
 * - FC10: 忽略，由 data.size() / 2 推导
 */
struct ModbusRequest {
    uint8_t unitId = 1;
    uint8_t functionCode = 0;
    uint16_t startAddress = 0;
    uint16_t quantity = 0;
    std::vector<uint8_t> data;
    uint16_t transactionId = 0;
};

/** 解析后的 Modbus 响应 */
struct ModbusResponse {
    uint16_t transactionId = 0;
    uint8_t unitId = 0;
    uint8_t functionCode = 0;     // 已去掉异常标志
    std::vector<uint8_t> body;    // 功能码之后的全部字节
    bool isException = false;
    uint8_t exceptionCode = 0;
};

// ==================== 功能码工具 ====================

inline bool isReadFunctionCode(uint8_t fc) {
    return fc >= FuncCodes::READ_COILS && fc <= FuncCodes::READ_INPUT_REGISTERS;
}

inline bool isBitReadFunctionCode(uint8_t fc) {
    return fc == FuncCodes::READ_COILS || fc == FuncCodes::READ_DISCRETE_INPUTS;
}

inline bool isWriteFunctionCode(uint8_t fc) {
    return fc == FuncCodes::WRITE_SINGLE_COIL ||
           fc == FuncCodes::WRITE_SINGLE_REGISTER ||
           fc == FuncCodes::WRITE_MULTIPLE_COILS ||
           fc == FuncCodes::WRITE_MULTIPLE_REGISTERS;
}

inline bool isSupportedFunctionCode(uint8_t fc) {
    return isReadFunctionCode(fc) || isWriteFunctionCode(fc);
}

inline std::string functionCodeToString(uint8_t fc) {
    switch (fc) {
        case FuncCodes::READ_COILS: return "READ_COILS";
        case FuncCodes::READ_DISCRETE_INPUTS: return "READ_DISCRETE_INPUTS";
        case FuncCodes::READ_HOLDING_REGISTERS: return "READ_HOLDING_REGISTERS";
        case FuncCodes::READ_INPUT_REGISTERS: return "READ_INPUT_REGISTERS";
        case FuncCodes::WRITE_SINGLE_COIL: return "WRITE_SINGLE_COIL";
        case FuncCodes::WRITE_SINGLE_REGISTER: return "WRITE_SINGLE_REGISTER";
        case FuncCodes::WRITE_MULTIPLE_COILS: return "WRITE_MULTIPLE_COILS";
        case FuncCodes::WRITE_MULTIPLE_REGISTERS: return "WRITE_MULTIPLE_REGISTERS";
    }
    return "FC" + std::to_string(static_cast<int>(fc));
}

/** 标准异常码说明（Modbus Application Protocol V1.1b3 §7） */
inline const char* exceptionCodeToString(uint8_t code) {
    switch (code) {
        case 0x01: return "ILLEGAL FUNCTION";
        case 0x02: return "ILLEGAL DATA ADDRESS";
        case 0x03: return "ILLEGAL DATA VALUE";
        case 0x04: return "SERVER DEVICE FAILURE";
        case 0x05: return "ACKNOWLEDGE";
        case 0x06: return "SERVER DEVICE BUSY";
        case 0x08: return "MEMORY PARITY ERROR";
        case 0x0A: return "GATEWAY PATH UNAVAILABLE";
        case 0x0B: return "GATEWAY TARGET DEVICE FAILED TO RESPOND";
    }
    return "UNKNOWN EXCEPTION";
}

}  // namespace modbus
