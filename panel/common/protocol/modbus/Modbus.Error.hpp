#pragma once

#include "Modbus.Types.hpp"
#include "common/utils/AppException.hpp"
#include "common/utils/ErrorCodes.hpp"

#include <string>

namespace modbus {

/** 请求失败原因（调用方据此区分超时/异常应答/传输/关闭） */
enum class ModbusErrorKind {
    Timeout,            // 超时未收到完整应答
    ProtocolException,  // 从站异常应答
    TransportError,     // 套接字错误或应答格式错误
    Closed              // 连接被关闭或端点已挂起
};

inline const char* errorKindToString(ModbusErrorKind kind) {
    switch (kind) {
        case ModbusErrorKind::Timeout: return "timeout";
        case ModbusErrorKind::ProtocolException: return "exception";
        case ModbusErrorKind::TransportError: return "transport";
        case ModbusErrorKind::Closed: return "closed";
    }
    return "unknown";
}

/**
 * @brief Modbus 请求错误
 *
 * 通过失败回调或 std::future 传递给调用方，不跨事件循环抛出
 */
class ModbusError : public AppException {
public:
    ModbusError(ModbusErrorKind kind, const std::string& message,
                uint8_t functionCode = 0, uint8_t exceptionCode = 0)
        : AppException(codeForKind(kind), message),
          kind_(kind), functionCode_(functionCode), exceptionCode_(exceptionCode) {}

    static ModbusError timeout(const std::string& message = "Modbus request timed out") {
        return {ModbusErrorKind::Timeout, message};
    }

    static ModbusError protocolException(uint8_t functionCode, uint8_t exceptionCode) {
        return {ModbusErrorKind::ProtocolException,
                "Modbus Exception " + std::to_string(exceptionCode)
                    + " (" + exceptionCodeToString(exceptionCode) + ")"
                    + " for function " + std::to_string(functionCode),
                functionCode, exceptionCode};
    }

    static ModbusError transport(const std::string& message) {
        return {ModbusErrorKind::TransportError, message};
    }

    static ModbusError closed(const std::string& message = "Connection closed") {
        return {ModbusErrorKind::Closed, message};
    }

    ModbusErrorKind kind() const { return kind_; }
    uint8_t functionCode() const { return functionCode_; }
    uint8_t exceptionCode() const { return exceptionCode_; }

private:
    ModbusErrorKind kind_;
    uint8_t functionCode_;
    uint8_t exceptionCode_;

    static int codeForKind(ModbusErrorKind kind) {
        switch (kind) {
            case ModbusErrorKind::Timeout: return ErrorCodes::MODBUS_TIMEOUT;
            case ModbusErrorKind::ProtocolException: return ErrorCodes::MODBUS_PROTOCOL_EXCEPTION;
            case ModbusErrorKind::TransportError: return ErrorCodes::MODBUS_TRANSPORT_ERROR;
            case ModbusErrorKind::Closed: return ErrorCodes::MODBUS_CLOSED;
        }
        return ErrorCodes::INTERNAL_ERROR;
    }
};

}  // namespace modbus
