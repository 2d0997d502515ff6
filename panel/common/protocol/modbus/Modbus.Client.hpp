#pragma once

#include "Modbus.Codec.hpp"
#include "Modbus.Error.hpp"
#include "Modbus.Types.hpp"
#include "common/network/EndpointState.hpp"
#include "common/network/ModbusConnectionManager.hpp"
#include "common/utils/AppException.hpp"
#include "common/utils/Constants.hpp"

#include <trantor/utils/Logger.h>

#include <functional>
#include <string>
#include <vector>

namespace modbus {

/**
 * @brief 单个端点上的 Modbus 读写操作
 *
 * 构建请求帧 → ModbusConnectionManager::send → 按请求形状解码应答。
 * 参数错误同步抛出 ValidationException，通信失败通过 ErrorCallback 返回。
 */
class ModbusClient {
public:
    using ErrorCallback = std::function<void(const ModbusError&)>;
    using BitsCallback = std::function<void(const std::vector<bool>&)>;
    using RegistersCallback = std::function<void(const std::vector<uint16_t>&)>;
    using FloatCallback = std::function<void(float)>;
    using DoneCallback = std::function<void()>;

    ModbusClient(ModbusConnectionManager& manager, Endpoint endpoint,
                 uint8_t unitId = Constants::MODBUS_DEFAULT_UNIT_ID)
        : manager_(manager), endpoint_(std::move(endpoint)), unitId_(unitId) {}

    const Endpoint& endpoint() const { return endpoint_; }
    uint8_t unitId() const { return unitId_; }

    // ==================== 读操作 ====================

    void readCoils(uint16_t address, uint16_t quantity, BitsCallback onBits, ErrorCallback onError) {
        readBits(FuncCodes::READ_COILS, address, quantity, std::move(onBits), std::move(onError));
    }

    void readDiscreteInputs(uint16_t address, uint16_t quantity, BitsCallback onBits, ErrorCallback onError) {
        readBits(FuncCodes::READ_DISCRETE_INPUTS, address, quantity, std::move(onBits), std::move(onError));
    }

    void readHoldingRegisters(uint16_t address, uint16_t quantity,
                              RegistersCallback onRegisters, ErrorCallback onError) {
        readRegisters(FuncCodes::READ_HOLDING_REGISTERS, address, quantity,
                      std::move(onRegisters), std::move(onError));
    }

    void readInputRegisters(uint16_t address, uint16_t quantity,
                            RegistersCallback onRegisters, ErrorCallback onError) {
        readRegisters(FuncCodes::READ_INPUT_REGISTERS, address, quantity,
                      std::move(onRegisters), std::move(onError));
    }

    /**
     * @brief 读取两个连续寄存器组成的大端 float32
     * @param functionCode FC03（保持寄存器）或 FC04（输入寄存器）
     */
    void readFloat32(uint8_t functionCode, uint16_t address, FloatCallback onValue, ErrorCallback onError) {
        if (functionCode != FuncCodes::READ_HOLDING_REGISTERS &&
            functionCode != FuncCodes::READ_INPUT_REGISTERS) {
            throw ValidationException("readFloat32 requires FC03 or FC04, got "
                + functionCodeToString(functionCode));
        }
        readRegisters(functionCode, address, 2,
            [onValue = std::move(onValue)](const std::vector<uint16_t>& regs) {
                onValue(ModbusCodec::registersToFloat32(regs[0], regs[1]));
            },
            std::move(onError));
    }

    // ==================== 写操作 ====================

    void writeSingleCoil(uint16_t address, bool on, DoneCallback onDone, ErrorCallback onError) {
        ModbusRequest req = makeRequest(FuncCodes::WRITE_SINGLE_COIL, address, on ? COIL_ON : COIL_OFF);
        execWrite(std::move(req), std::move(onDone), std::move(onError));
    }

    void writeSingleRegister(uint16_t address, uint16_t value, DoneCallback onDone, ErrorCallback onError) {
        ModbusRequest req = makeRequest(FuncCodes::WRITE_SINGLE_REGISTER, address, value);
        execWrite(std::move(req), std::move(onDone), std::move(onError));
    }

    void writeMultipleCoils(uint16_t address, const std::vector<bool>& values,
                            DoneCallback onDone, ErrorCallback onError) {
        ModbusRequest req = makeRequest(FuncCodes::WRITE_MULTIPLE_COILS, address,
                                        static_cast<uint16_t>(values.size()));
        req.data = ModbusCodec::packBits(values);
        execWrite(std::move(req), std::move(onDone), std::move(onError));
    }

    void writeMultipleRegisters(uint16_t address, const std::vector<uint16_t>& values,
                                DoneCallback onDone, ErrorCallback onError) {
        ModbusRequest req = makeRequest(FuncCodes::WRITE_MULTIPLE_REGISTERS, address,
                                        static_cast<uint16_t>(values.size()));
        req.data = ModbusCodec::encodeRegisters(values);
        execWrite(std::move(req), std::move(onDone), std::move(onError));
    }

    /** FC10 写入两个寄存器的大端 float32 */
    void writeFloat32(uint16_t address, float value, DoneCallback onDone, ErrorCallback onError) {
        ModbusRequest req = makeRequest(FuncCodes::WRITE_MULTIPLE_REGISTERS, address, 2);
        req.data = ModbusCodec::encodeFloat32(value);
        execWrite(std::move(req), std::move(onDone), std::move(onError));
    }

private:
    ModbusConnectionManager& manager_;
    Endpoint endpoint_;
    uint8_t unitId_;

    ModbusRequest makeRequest(uint8_t functionCode, uint16_t address, uint16_t quantityOrValue) const {
        ModbusRequest req;
        req.unitId = unitId_;
        req.functionCode = functionCode;
        req.startAddress = address;
        req.quantity = quantityOrValue;
        req.transactionId = ModbusCodec::nextTransactionId();
        return req;
    }

    void readBits(uint8_t functionCode, uint16_t address, uint16_t quantity,
                  BitsCallback onBits, ErrorCallback onError) {
        ModbusRequest req = makeRequest(functionCode, address, quantity);
        exec(std::move(req),
             [onBits = std::move(onBits)](const ModbusRequest& sent, const ModbusResponse& resp) {
                 onBits(ModbusCodec::decodeBits(sent, resp));
             },
             std::move(onError));
    }

    void readRegisters(uint8_t functionCode, uint16_t address, uint16_t quantity,
                       RegistersCallback onRegisters, ErrorCallback onError) {
        ModbusRequest req = makeRequest(functionCode, address, quantity);
        exec(std::move(req),
             [onRegisters = std::move(onRegisters)](const ModbusRequest& sent, const ModbusResponse& resp) {
                 onRegisters(ModbusCodec::decodeRegisters(sent, resp));
             },
             std::move(onError));
    }

    void execWrite(ModbusRequest req, DoneCallback onDone, ErrorCallback onError) {
        exec(std::move(req),
             [onDone = std::move(onDone)](const ModbusRequest& sent, const ModbusResponse& resp) {
                 ModbusCodec::verifyWriteEcho(sent, resp);
                 onDone();
             },
             std::move(onError));
    }

    using Decoder = std::function<void(const ModbusRequest&, const ModbusResponse&)>;

    /**
     * @brief 发送请求，应答解码失败转为 ErrorCallback
     * @throws ValidationException 请求参数不合法
     */
    void exec(ModbusRequest req, Decoder decode, ErrorCallback onError) {
        Frame frame = ModbusCodec::buildRequest(req);
        const std::string target = endpoint_.toString();

        LOG_TRACE << "[Modbus] " << target << " " << functionCodeToString(req.functionCode)
                  << " addr=" << req.startAddress << " tx: " << ModbusCodec::toHexString(frame);

        manager_.send(endpoint_.host, endpoint_.port, std::move(frame),
            [req, decode = std::move(decode), onError, target](const Frame& response) {
                try {
                    decode(req, ModbusCodec::parseResponse(response));
                } catch (const ModbusError& e) {
                    LOG_WARN << "[Modbus] " << target << " " << functionCodeToString(req.functionCode)
                             << " addr=" << req.startAddress << ": " << e.getMessage();
                    if (onError) onError(e);
                }
            },
            [onError](const ModbusError& error) {
                if (onError) onError(error);
            });
    }
};

}  // namespace modbus
