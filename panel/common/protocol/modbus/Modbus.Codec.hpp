#pragma once

#include "Modbus.Error.hpp"
#include "Modbus.Types.hpp"
#include "common/utils/AppException.hpp"

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace modbus {

/**
 * @brief Modbus TCP 编解码（无状态）
 * 请求帧构建、拆包重组、应答解析、数值转换
 */
class ModbusCodec {
public:
    /** TransID(2) + ProtocolID(2) + Length(2)，决定整帧长度所需的最少字节 */
    static constexpr size_t MBAP_PREFIX_SIZE = 6;
    /** 完整 MBAP Header（含 UnitID） */
    static constexpr size_t MBAP_HEADER_SIZE = 7;
    /** Length 字段上限：UnitID(1) + PDU(253) */
    static constexpr uint16_t MAX_MBAP_LENGTH = 254;
    /** 写多个寄存器/线圈时 PDU 中数据字节上限 */
    static constexpr size_t MAX_WRITE_DATA_BYTES = 246;
    /** 帧头校验失败标记 */
    static constexpr size_t FRAME_CORRUPT = SIZE_MAX;

    // ==================== 帧构建 ====================

    /** 随机事务号 */
    static uint16_t nextTransactionId() {
        thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_int_distribution<int> dist(0, 0xFFFF);
        return static_cast<uint16_t>(dist(rng));
    }

    /**
     * @brief 构建 Modbus TCP 请求帧
     *
     * FC01-04: [MBAP(7)][FC(1)][StartAddr(2)][Quantity(2)]
     * FC05/06: [MBAP(7)][FC(1)][Addr(2)][Value(2)]
     * FC0F/10: [MBAP(7)][FC(1)][StartAddr(2)][Count(2)][ByteCount(1)][Data...]
     *
     * @throws ValidationException 不支持的功能码或参数不合法
     */
    static Frame buildRequest(const ModbusRequest& req) {
        std::vector<uint8_t> pdu;
        const uint8_t fc = req.functionCode;

        if (isReadFunctionCode(fc)) {
            uint16_t maxQty = isBitReadFunctionCode(fc) ? 2000 : 125;
            if (req.quantity == 0 || req.quantity > maxQty) {
                throw ValidationException("Invalid read quantity " + std::to_string(req.quantity)
                    + " for " + functionCodeToString(fc) + " (1-" + std::to_string(maxQty) + ")");
            }
            pdu = {fc, hi(req.startAddress), lo(req.startAddress), hi(req.quantity), lo(req.quantity)};
        } else if (fc == FuncCodes::WRITE_SINGLE_COIL) {
            if (req.quantity != COIL_ON && req.quantity != COIL_OFF) {
                throw ValidationException("Invalid coil value 0x" + toHex16(req.quantity)
                    + " (expected 0xFF00 or 0x0000)");
            }
            pdu = {fc, hi(req.startAddress), lo(req.startAddress), hi(req.quantity), lo(req.quantity)};
        } else if (fc == FuncCodes::WRITE_SINGLE_REGISTER) {
            pdu = {fc, hi(req.startAddress), lo(req.startAddress), hi(req.quantity), lo(req.quantity)};
        } else if (fc == FuncCodes::WRITE_MULTIPLE_COILS) {
            size_t expectedBytes = (static_cast<size_t>(req.quantity) + 7) / 8;
            if (req.quantity == 0 || req.quantity > 1968 || req.data.size() != expectedBytes) {
                throw ValidationException("Invalid WRITE_MULTIPLE_COILS payload: count="
                    + std::to_string(req.quantity) + " bytes=" + std::to_string(req.data.size()));
            }
            pdu = buildMultiWritePdu(fc, req.startAddress, req.quantity, req.data);
        } else if (fc == FuncCodes::WRITE_MULTIPLE_REGISTERS) {
            if (req.data.empty() || req.data.size() % 2 != 0 || req.data.size() > MAX_WRITE_DATA_BYTES) {
                throw ValidationException("Invalid WRITE_MULTIPLE_REGISTERS payload: bytes="
                    + std::to_string(req.data.size()));
            }
            pdu = buildMultiWritePdu(fc, req.startAddress,
                                     static_cast<uint16_t>(req.data.size() / 2), req.data);
        } else {
            throw ValidationException("Unsupported Modbus function code: " + std::to_string(fc));
        }

        // Length = UnitID + PDU
        auto length = static_cast<uint16_t>(pdu.size() + 1);
        Frame frame;
        frame.reserve(MBAP_HEADER_SIZE + pdu.size());
        frame.push_back(hi(req.transactionId));
        frame.push_back(lo(req.transactionId));
        frame.push_back(0x00);  // Protocol ID
        frame.push_back(0x00);
        frame.push_back(hi(length));
        frame.push_back(lo(length));
        frame.push_back(req.unitId);
        frame.insert(frame.end(), pdu.begin(), pdu.end());
        return frame;
    }

    /** 便捷构建：自动分配随机事务号 */
    static Frame buildRequest(uint8_t unitId, uint8_t functionCode, uint16_t startAddress,
                              uint16_t quantityOrValue, const std::vector<uint8_t>& writeData = {}) {
        ModbusRequest req;
        req.unitId = unitId;
        req.functionCode = functionCode;
        req.startAddress = startAddress;
        req.quantity = quantityOrValue;
        req.data = writeData;
        req.transactionId = nextTransactionId();
        return buildRequest(req);
    }

    // ==================== 拆包重组 ====================

    /**
     * @brief 判断缓冲区头部是否已有一帧完整报文
     * @return 整帧字节数；0 = 数据不足；FRAME_CORRUPT = 帧头非法
     */
    static size_t completeFrameLength(const uint8_t* data, size_t size) {
        if (size < MBAP_PREFIX_SIZE) return 0;

        uint16_t protoId = readU16(data + 2);
        uint16_t length = readU16(data + 4);

        // Length 至少包含 UnitID + FC
        if (protoId != 0 || length < 2 || length > MAX_MBAP_LENGTH) return FRAME_CORRUPT;

        size_t totalLen = MBAP_PREFIX_SIZE + length;
        return size < totalLen ? 0 : totalLen;
    }

    static size_t completeFrameLength(const std::vector<uint8_t>& buffer) {
        return completeFrameLength(buffer.data(), buffer.size());
    }

    /**
     * @brief 从接收缓冲区取出头部的一帧完整报文
     * @return 数据不足时返回 nullopt，缓冲区保持不变
     * @throws ModbusError(TransportError) 帧头非法
     */
    static std::optional<Frame> takeFrame(std::vector<uint8_t>& buffer) {
        size_t len = completeFrameLength(buffer);
        if (len == FRAME_CORRUPT) {
            throw ModbusError::transport("Malformed MBAP header: "
                + toHexString(buffer.data(), (std::min)(buffer.size(), MBAP_HEADER_SIZE)));
        }
        if (len == 0) return std::nullopt;

        Frame frame(buffer.begin(), buffer.begin() + static_cast<ptrdiff_t>(len));
        buffer.erase(buffer.begin(), buffer.begin() + static_cast<ptrdiff_t>(len));
        return frame;
    }

    // ==================== 应答解析 ====================

    /** 功能码字节最高位置 1 即为异常应答 */
    static bool isExceptionFrame(const Frame& frame) {
        return frame.size() > MBAP_HEADER_SIZE && (frame[MBAP_HEADER_SIZE] & FuncCodes::EXCEPTION_FLAG);
    }

    /**
     * @brief 解析一帧完整的应答
     *
     * 正常应答: [MBAP(7)][FC(1)][Body...]
     * 异常应答: [MBAP(7)][FC|0x80(1)][ExceptionCode(1)]
     *
     * @throws ModbusError(TransportError) 帧不完整或长度字段不一致
     */
    static ModbusResponse parseResponse(const Frame& frame) {
        size_t len = completeFrameLength(frame);
        if (len == FRAME_CORRUPT || len == 0 || len != frame.size()) {
            throw ModbusError::transport("Malformed response frame: " + toHexString(frame));
        }

        ModbusResponse out;
        out.transactionId = readU16(frame.data());
        out.unitId = frame[6];
        uint8_t fc = frame[7];

        if (fc & FuncCodes::EXCEPTION_FLAG) {
            out.isException = true;
            out.functionCode = fc & 0x7F;
            out.exceptionCode = frame.size() > 8 ? frame[8] : 0;
        } else {
            out.functionCode = fc;
        }
        out.body.assign(frame.begin() + 8, frame.end());
        return out;
    }

    /**
     * @brief 按请求形状解析 FC01/FC02 位数据
     * 应答: [FC][ByteCount][Bits...]，LSB 对应起始地址
     */
    static std::vector<bool> decodeBits(const ModbusRequest& req, const ModbusResponse& resp) {
        expectSuccess(req, resp);
        if (!isBitReadFunctionCode(req.functionCode)) {
            throw ModbusError::transport("decodeBits: request is not a bit read");
        }

        size_t expectedBytes = (static_cast<size_t>(req.quantity) + 7) / 8;
        if (resp.body.empty() || resp.body[0] != expectedBytes || resp.body.size() != 1 + expectedBytes) {
            throw malformed(req, resp);
        }

        std::vector<bool> bits(req.quantity);
        for (uint16_t i = 0; i < req.quantity; ++i) {
            bits[i] = (resp.body[1 + i / 8] >> (i % 8)) & 0x01;
        }
        return bits;
    }

    /**
     * @brief 按请求形状解析 FC03/FC04 寄存器数据
     * 应答: [FC][ByteCount][Reg0 Hi][Reg0 Lo]...
     */
    static std::vector<uint16_t> decodeRegisters(const ModbusRequest& req, const ModbusResponse& resp) {
        expectSuccess(req, resp);
        if (req.functionCode != FuncCodes::READ_HOLDING_REGISTERS &&
            req.functionCode != FuncCodes::READ_INPUT_REGISTERS) {
            throw ModbusError::transport("decodeRegisters: request is not a register read");
        }

        size_t expectedBytes = static_cast<size_t>(req.quantity) * 2;
        if (resp.body.empty() || resp.body[0] != expectedBytes || resp.body.size() != 1 + expectedBytes) {
            throw malformed(req, resp);
        }

        std::vector<uint16_t> regs(req.quantity);
        for (uint16_t i = 0; i < req.quantity; ++i) {
            regs[i] = readU16(resp.body.data() + 1 + i * 2);
        }
        return regs;
    }

    /**
     * @brief 校验写操作回显
     * FC05/06: 回显 Addr(2) + Value(2)
     * FC0F/10: 回显 StartAddr(2) + Count(2)
     */
    static void verifyWriteEcho(const ModbusRequest& req, const ModbusResponse& resp) {
        expectSuccess(req, resp);
        if (!isWriteFunctionCode(req.functionCode)) {
            throw ModbusError::transport("verifyWriteEcho: request is not a write");
        }
        if (resp.body.size() != 4) throw malformed(req, resp);

        uint16_t expectedSecond = req.quantity;
        if (req.functionCode == FuncCodes::WRITE_MULTIPLE_REGISTERS) {
            expectedSecond = static_cast<uint16_t>(req.data.size() / 2);
        }

        if (readU16(resp.body.data()) != req.startAddress ||
            readU16(resp.body.data() + 2) != expectedSecond) {
            throw malformed(req, resp);
        }
    }

    // ==================== 数值转换 ====================

    /** float32 → 大端 IEEE-754 4 字节（占两个连续寄存器） */
    static std::vector<uint8_t> encodeFloat32(float value) {
        auto raw = std::bit_cast<uint32_t>(value);
        return {
            static_cast<uint8_t>(raw >> 24),
            static_cast<uint8_t>((raw >> 16) & 0xFF),
            static_cast<uint8_t>((raw >> 8) & 0xFF),
            static_cast<uint8_t>(raw & 0xFF)
        };
    }

    /** 两个寄存器（高字在前）→ float32 */
    static float registersToFloat32(uint16_t high, uint16_t low) {
        uint32_t raw = (static_cast<uint32_t>(high) << 16) | low;
        return std::bit_cast<float>(raw);
    }

    /** uint16 列表 → 大端字节流（FC10 数据区） */
    static std::vector<uint8_t> encodeRegisters(const std::vector<uint16_t>& values) {
        std::vector<uint8_t> out;
        out.reserve(values.size() * 2);
        for (uint16_t v : values) {
            out.push_back(hi(v));
            out.push_back(lo(v));
        }
        return out;
    }

    /** 线圈状态打包（FC0F 数据区），LSB 对应起始地址 */
    static std::vector<uint8_t> packBits(const std::vector<bool>& bits) {
        std::vector<uint8_t> out((bits.size() + 7) / 8, 0);
        for (size_t i = 0; i < bits.size(); ++i) {
            if (bits[i]) out[i / 8] |= static_cast<uint8_t>(1u << (i % 8));
        }
        return out;
    }

    static uint16_t transactionIdOf(const Frame& frame) {
        return frame.size() >= 2 ? readU16(frame.data()) : 0;
    }

    static std::string toHexString(const uint8_t* data, size_t size) {
        std::ostringstream oss;
        for (size_t i = 0; i < size; ++i) {
            if (i > 0) oss << " ";
            oss << std::hex << std::uppercase << std::setw(2)
                << std::setfill('0') << static_cast<int>(data[i]);
        }
        return oss.str();
    }

    static std::string toHexString(const std::vector<uint8_t>& data) {
        return toHexString(data.data(), data.size());
    }

private:
    static uint8_t hi(uint16_t v) { return static_cast<uint8_t>(v >> 8); }
    static uint8_t lo(uint16_t v) { return static_cast<uint8_t>(v & 0xFF); }

    static uint16_t readU16(const uint8_t* p) {
        return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
    }

    static std::string toHex16(uint16_t v) {
        std::ostringstream oss;
        oss << std::hex << std::uppercase << std::setw(4) << std::setfill('0') << v;
        return oss.str();
    }

    static std::vector<uint8_t> buildMultiWritePdu(uint8_t fc, uint16_t start, uint16_t count,
                                                   const std::vector<uint8_t>& data) {
        std::vector<uint8_t> pdu = {fc, hi(start), lo(start), hi(count), lo(count),
                                    static_cast<uint8_t>(data.size())};
        pdu.insert(pdu.end(), data.begin(), data.end());
        return pdu;
    }

    /** 异常应答直接转为 ProtocolException；功能码不匹配视为格式错误 */
    static void expectSuccess(const ModbusRequest& req, const ModbusResponse& resp) {
        if (resp.isException) {
            throw ModbusError::protocolException(resp.functionCode, resp.exceptionCode);
        }
        if (resp.functionCode != req.functionCode) {
            throw malformed(req, resp);
        }
    }

    static ModbusError malformed(const ModbusRequest& req, const ModbusResponse& resp) {
        std::vector<uint8_t> pdu;
        pdu.push_back(resp.functionCode);
        pdu.insert(pdu.end(), resp.body.begin(), resp.body.end());
        return ModbusError::transport("Malformed response for " + functionCodeToString(req.functionCode)
            + " addr=" + std::to_string(req.startAddress) + ": " + toHexString(pdu));
    }
};

}  // namespace modbus
