#include "common/protocol/modbus/Modbus.Codec.hpp"
#include "support/FakeIo.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <functional>
#include <vector>

using modbus::Frame;
using modbus::FuncCodes;
using modbus::ModbusCodec;
using modbus::ModbusError;
using modbus::ModbusErrorKind;
using modbus::ModbusRequest;
using testing_support::makeFrame;

namespace {

ModbusRequest makeRequest(uint8_t fc, uint16_t addr, uint16_t qty, std::vector<uint8_t> data = {}) {
    ModbusRequest req;
    req.unitId = 1;
    req.functionCode = fc;
    req.startAddress = addr;
    req.quantity = qty;
    req.data = std::move(data);
    req.transactionId = 0x1234;
    return req;
}

ModbusErrorKind kindOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const ModbusError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected ModbusError";
    return ModbusErrorKind::Closed;
}

}  // namespace

// ==================== 帧构建 ====================

TEST(ModbusCodecBuild, ReadHoldingRegistersLayout) {
    Frame frame = ModbusCodec::buildRequest(makeRequest(FuncCodes::READ_HOLDING_REGISTERS, 5, 2));
    Frame expected = {0x12, 0x34, 0x00, 0x00, 0x00, 0x06, 0x01, 0x03, 0x00, 0x05, 0x00, 0x02};
    EXPECT_EQ(frame, expected);
}

TEST(ModbusCodecBuild, ReadFunctionCodesShareLayout) {
    for (uint8_t fc : {FuncCodes::READ_COILS, FuncCodes::READ_DISCRETE_INPUTS,
                       FuncCodes::READ_INPUT_REGISTERS}) {
        Frame frame = ModbusCodec::buildRequest(makeRequest(fc, 0x0102, 3));
        ASSERT_EQ(frame.size(), 12u);
        EXPECT_EQ(frame[7], fc);
        EXPECT_EQ(frame[8], 0x01);
        EXPECT_EQ(frame[9], 0x02);
        EXPECT_EQ(frame[11], 0x03);
    }
}

TEST(ModbusCodecBuild, WriteSingleCoilOnAtAddress8) {
    Frame frame = ModbusCodec::buildRequest(makeRequest(FuncCodes::WRITE_SINGLE_COIL, 8, modbus::COIL_ON));
    EXPECT_EQ(testing_support::pduOf(frame), (std::vector<uint8_t>{0x05, 0x00, 0x08, 0xFF, 0x00}));
    EXPECT_EQ(frame[5], 0x06);
}

TEST(ModbusCodecBuild, WriteSingleRegister) {
    Frame frame = ModbusCodec::buildRequest(makeRequest(FuncCodes::WRITE_SINGLE_REGISTER, 1, 0xABCD));
    EXPECT_EQ(testing_support::pduOf(frame), (std::vector<uint8_t>{0x06, 0x00, 0x01, 0xAB, 0xCD}));
}

TEST(ModbusCodecBuild, WriteMultipleCoilsPacksLsbFirst) {
    std::vector<bool> bits = {true, false, true, true, false, false, false, false, true, true};
    auto packed = ModbusCodec::packBits(bits);
    ASSERT_EQ(packed, (std::vector<uint8_t>{0x0D, 0x03}));

    Frame frame = ModbusCodec::buildRequest(makeRequest(FuncCodes::WRITE_MULTIPLE_COILS, 0x13, 10, packed));
    Frame expected = {0x12, 0x34, 0x00, 0x00, 0x00, 0x0A, 0x01,
                      0x0F, 0x00, 0x13, 0x00, 0x0A, 0x02, 0x0D, 0x03};
    EXPECT_EQ(frame, expected);
}

TEST(ModbusCodecBuild, WriteMultipleRegistersDerivesCount) {
    auto data = ModbusCodec::encodeRegisters({0x000A, 0x0102});
    Frame frame = ModbusCodec::buildRequest(makeRequest(FuncCodes::WRITE_MULTIPLE_REGISTERS, 1, 0, data));
    Frame expected = {0x12, 0x34, 0x00, 0x00, 0x00, 0x0B, 0x01,
                      0x10, 0x00, 0x01, 0x00, 0x02, 0x04, 0x00, 0x0A, 0x01, 0x02};
    EXPECT_EQ(frame, expected);
}

TEST(ModbusCodecBuild, RejectsInvalidRequests) {
    EXPECT_THROW(ModbusCodec::buildRequest(makeRequest(0x07, 0, 1)), ValidationException);
    EXPECT_THROW(ModbusCodec::buildRequest(makeRequest(FuncCodes::READ_COILS, 0, 0)), ValidationException);
    EXPECT_THROW(ModbusCodec::buildRequest(makeRequest(FuncCodes::READ_HOLDING_REGISTERS, 0, 126)),
                 ValidationException);
    EXPECT_THROW(ModbusCodec::buildRequest(makeRequest(FuncCodes::WRITE_SINGLE_COIL, 8, 0x1234)),
                 ValidationException);
    EXPECT_THROW(ModbusCodec::buildRequest(makeRequest(FuncCodes::WRITE_MULTIPLE_REGISTERS, 0, 0, {0x01})),
                 ValidationException);
    EXPECT_THROW(ModbusCodec::buildRequest(makeRequest(FuncCodes::WRITE_MULTIPLE_COILS, 0, 10, {0x01})),
                 ValidationException);
}

// ==================== 拆包重组 ====================

TEST(ModbusCodecFraming, IncompleteHeaderWaitsForMoreData) {
    std::vector<uint8_t> buffer = {0x00, 0x01, 0x00, 0x00, 0x00};
    EXPECT_EQ(ModbusCodec::completeFrameLength(buffer), 0u);
    EXPECT_FALSE(ModbusCodec::takeFrame(buffer).has_value());
    EXPECT_EQ(buffer.size(), 5u);
}

TEST(ModbusCodecFraming, ReassemblesAcrossSingleByteChunks) {
    Frame first = makeFrame(0x0001, 1, {0x03, 0x02, 0x00, 0x2A});
    Frame second = makeFrame(0x0002, 1, {0x05, 0x00, 0x08, 0xFF, 0x00});
    std::vector<uint8_t> stream = first;
    stream.insert(stream.end(), second.begin(), second.end());

    std::vector<uint8_t> buffer;
    std::vector<Frame> frames;
    for (uint8_t byte : stream) {
        buffer.push_back(byte);
        while (auto frame = ModbusCodec::takeFrame(buffer)) {
            frames.push_back(*frame);
        }
    }

    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0], first);
    EXPECT_EQ(frames[1], second);
    EXPECT_TRUE(buffer.empty());
}

TEST(ModbusCodecFraming, TwoFramesInOneChunk) {
    Frame first = makeFrame(0x0010, 1, {0x02, 0x01, 0x01});
    Frame second = makeFrame(0x0011, 1, {0x82, 0x02});
    std::vector<uint8_t> buffer = first;
    buffer.insert(buffer.end(), second.begin(), second.end());
    buffer.push_back(0x00);  // 下一帧的第一个字节

    auto a = ModbusCodec::takeFrame(buffer);
    auto b = ModbusCodec::takeFrame(buffer);
    ASSERT_TRUE(a && b);
    EXPECT_EQ(*a, first);
    EXPECT_EQ(*b, second);
    EXPECT_FALSE(ModbusCodec::takeFrame(buffer).has_value());
    EXPECT_EQ(buffer.size(), 1u);
}

TEST(ModbusCodecFraming, CorruptHeaderIsTransportError) {
    std::vector<uint8_t> badProtocol = {0x00, 0x01, 0x12, 0x34, 0x00, 0x03, 0x01, 0x03, 0x00};
    EXPECT_EQ(ModbusCodec::completeFrameLength(badProtocol), ModbusCodec::FRAME_CORRUPT);
    EXPECT_EQ(kindOf([&] { ModbusCodec::takeFrame(badProtocol); }), ModbusErrorKind::TransportError);

    std::vector<uint8_t> badLength = {0x00, 0x01, 0x00, 0x00, 0x01, 0x00};
    EXPECT_EQ(ModbusCodec::completeFrameLength(badLength), ModbusCodec::FRAME_CORRUPT);

    std::vector<uint8_t> tooShort = {0x00, 0x01, 0x00, 0x00, 0x00, 0x01, 0x01};
    EXPECT_EQ(ModbusCodec::completeFrameLength(tooShort), ModbusCodec::FRAME_CORRUPT);
}

// ==================== 应答解析 ====================

TEST(ModbusCodecParse, DetectsExceptionRegardlessOfChunking) {
    Frame exception = makeFrame(0x0042, 1, {0x83, 0x02});
    std::vector<uint8_t> buffer(exception.begin(), exception.begin() + 8);
    EXPECT_FALSE(ModbusCodec::takeFrame(buffer).has_value());
    buffer.push_back(exception[8]);

    auto frame = ModbusCodec::takeFrame(buffer);
    ASSERT_TRUE(frame.has_value());
    EXPECT_TRUE(ModbusCodec::isExceptionFrame(*frame));

    auto resp = ModbusCodec::parseResponse(*frame);
    EXPECT_TRUE(resp.isException);
    EXPECT_EQ(resp.functionCode, FuncCodes::READ_HOLDING_REGISTERS);
    EXPECT_EQ(resp.exceptionCode, 0x02);
    EXPECT_EQ(resp.transactionId, 0x0042);
}

TEST(ModbusCodecParse, ExceptionResponseDecodesAsProtocolException) {
    auto req = makeRequest(FuncCodes::READ_INPUT_REGISTERS, 1, 1);
    auto resp = ModbusCodec::parseResponse(makeFrame(0x1234, 1, {0x84, 0x04}));
    try {
        ModbusCodec::decodeRegisters(req, resp);
        FAIL() << "expected ModbusError";
    } catch (const ModbusError& e) {
        EXPECT_EQ(e.kind(), ModbusErrorKind::ProtocolException);
        EXPECT_EQ(e.functionCode(), FuncCodes::READ_INPUT_REGISTERS);
        EXPECT_EQ(e.exceptionCode(), 0x04);
        EXPECT_EQ(e.getCode(), ErrorCodes::MODBUS_PROTOCOL_EXCEPTION);
        EXPECT_NE(e.getMessage().find("SERVER DEVICE FAILURE"), std::string::npos);
    }
}

TEST(ModbusCodecParse, DecodeBits) {
    auto req = makeRequest(FuncCodes::READ_COILS, 0, 10);
    auto resp = ModbusCodec::parseResponse(makeFrame(0x1234, 1, {0x01, 0x02, 0x0D, 0x03}));
    auto bits = ModbusCodec::decodeBits(req, resp);
    std::vector<bool> expected = {true, false, true, true, false, false, false, false, true, true};
    EXPECT_EQ(bits, expected);
}

TEST(ModbusCodecParse, DecodeRegisters) {
    auto req = makeRequest(FuncCodes::READ_HOLDING_REGISTERS, 5, 2);
    auto resp = ModbusCodec::parseResponse(makeFrame(0x1234, 1, {0x03, 0x04, 0x1F, 0x40, 0x00, 0x07}));
    auto regs = ModbusCodec::decodeRegisters(req, resp);
    EXPECT_EQ(regs, (std::vector<uint16_t>{8000, 7}));
}

TEST(ModbusCodecParse, ByteCountMismatchIsTransportError) {
    auto req = makeRequest(FuncCodes::READ_HOLDING_REGISTERS, 5, 2);
    auto shortResp = ModbusCodec::parseResponse(makeFrame(0x1234, 1, {0x03, 0x02, 0x1F, 0x40}));
    EXPECT_EQ(kindOf([&] { ModbusCodec::decodeRegisters(req, shortResp); }), ModbusErrorKind::TransportError);

    auto wrongFc = ModbusCodec::parseResponse(makeFrame(0x1234, 1, {0x04, 0x04, 0, 1, 0, 2}));
    EXPECT_EQ(kindOf([&] { ModbusCodec::decodeRegisters(req, wrongFc); }), ModbusErrorKind::TransportError);
}

TEST(ModbusCodecParse, WriteSingleCoilEcho) {
    auto req = makeRequest(FuncCodes::WRITE_SINGLE_COIL, 8, modbus::COIL_ON);

    auto echo = ModbusCodec::parseResponse(makeFrame(0x1234, 1, {0x05, 0x00, 0x08, 0xFF, 0x00}));
    EXPECT_NO_THROW(ModbusCodec::verifyWriteEcho(req, echo));

    auto wrongValue = ModbusCodec::parseResponse(makeFrame(0x1234, 1, {0x05, 0x00, 0x08, 0x00, 0x00}));
    EXPECT_EQ(kindOf([&] { ModbusCodec::verifyWriteEcho(req, wrongValue); }), ModbusErrorKind::TransportError);

    auto wrongAddress = ModbusCodec::parseResponse(makeFrame(0x1234, 1, {0x05, 0x00, 0x09, 0xFF, 0x00}));
    EXPECT_EQ(kindOf([&] { ModbusCodec::verifyWriteEcho(req, wrongAddress); }), ModbusErrorKind::TransportError);

    auto truncated = ModbusCodec::parseResponse(makeFrame(0x1234, 1, {0x05, 0x00, 0x08}));
    EXPECT_EQ(kindOf([&] { ModbusCodec::verifyWriteEcho(req, truncated); }), ModbusErrorKind::TransportError);
}

TEST(ModbusCodecParse, WriteMultipleRegistersEchoCarriesCount) {
    auto req = makeRequest(FuncCodes::WRITE_MULTIPLE_REGISTERS, 5, 0, ModbusCodec::encodeFloat32(9000.0f));
    auto echo = ModbusCodec::parseResponse(makeFrame(0x1234, 1, {0x10, 0x00, 0x05, 0x00, 0x02}));
    EXPECT_NO_THROW(ModbusCodec::verifyWriteEcho(req, echo));
}

TEST(ModbusCodecParse, LengthFieldMustMatchFrameSize) {
    Frame frame = makeFrame(0x0001, 1, {0x03, 0x02, 0x00, 0x01});
    frame.push_back(0xFF);
    EXPECT_EQ(kindOf([&] { ModbusCodec::parseResponse(frame); }), ModbusErrorKind::TransportError);
}

// ==================== 数值转换 ====================

TEST(ModbusCodecValues, Float32IsBigEndianHighWordFirst) {
    EXPECT_EQ(ModbusCodec::encodeFloat32(1.0f), (std::vector<uint8_t>{0x3F, 0x80, 0x00, 0x00}));
    EXPECT_FLOAT_EQ(ModbusCodec::registersToFloat32(0x4120, 0x0000), 10.0f);
    EXPECT_FLOAT_EQ(ModbusCodec::registersToFloat32(0x4020, 0x0000), 2.5f);
}

TEST(ModbusCodecValues, HexString) {
    EXPECT_EQ(ModbusCodec::toHexString({0x05, 0x00, 0x08, 0xFF, 0x00}), "05 00 08 FF 00");
    EXPECT_EQ(ModbusCodec::toHexString(std::vector<uint8_t>{}), "");
}

TEST(ModbusCodecValues, TransactionIdOf) {
    EXPECT_EQ(ModbusCodec::transactionIdOf(makeFrame(0xBEEF, 1, {0x01})), 0xBEEF);
}
