#pragma once

/**
 * @brief 统一错误码定义
 *
 * 错误码规则：
 * - 1xxx: 调用方错误（参数、配置）
 * - 3xxx: Modbus 通信错误
 * - 5xxx: 内部错误
 */
namespace ErrorCodes {

// ==================== 调用方错误 (1xxx) ====================

/** 请求参数错误（不支持的功能码、灯管编号越界等） */
inline constexpr int BAD_REQUEST = 1002;

// ==================== Modbus 通信错误 (3xxx) ====================

/** 请求超时，未在规定时间内收到完整应答 */
inline constexpr int MODBUS_TIMEOUT = 3001;

/** 从站返回异常应答（功能码最高位置 1） */
inline constexpr int MODBUS_PROTOCOL_EXCEPTION = 3002;

/** 套接字连接/读写失败，或应答格式错误 */
inline constexpr int MODBUS_TRANSPORT_ERROR = 3003;

/** 连接被主动关闭或端点已挂起 */
inline constexpr int MODBUS_CLOSED = 3004;

// ==================== 内部错误 (5xxx) ====================

/** 内部错误 */
inline constexpr int INTERNAL_ERROR = 5000;

}  // namespace ErrorCodes
