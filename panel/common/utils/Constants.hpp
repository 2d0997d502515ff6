#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @brief 全局常量定义
 *
 * 集中管理项目中的魔法数字，提高可维护性和可读性
 */
namespace Constants {

// ==================== 日志相关 ====================

/** 日志文件名前缀 */
inline constexpr const char* LOG_FILE_PREFIX = "uv-panel";

/** 默认日志目录 */
inline constexpr const char* LOG_DEFAULT_DIR = "./logs";

// ==================== Modbus 相关 ====================

/** Modbus TCP 默认端口 */
inline constexpr uint16_t MODBUS_DEFAULT_PORT = 502;

/** PLC 默认从站地址 */
inline constexpr uint8_t MODBUS_DEFAULT_UNIT_ID = 1;

/** 单个请求超时（秒） */
inline constexpr double REQUEST_TIMEOUT_SEC = 5.0;

/** 连接看门狗超时（秒）- 该时间内未收到任何数据则强制重连 */
inline constexpr double WATCHDOG_TIMEOUT_SEC = 30.0;

// ==================== TCP 重连策略 ====================

/** 重连基础延迟（秒） */
inline constexpr double RECONNECT_BASE_DELAY_SEC = 2.0;

/** 重连最大延迟（秒） */
inline constexpr double RECONNECT_MAX_DELAY_SEC = 30.0;

/** 连续重连失败多少次后挂起端点 */
inline constexpr int MAX_RECONNECT_ATTEMPTS = 5;

// ==================== UV 面板相关 ====================

/** 每个区段的灯管数量 */
inline constexpr int LAMP_COUNT = 4;

/** 复位线圈 ON → OFF 之间的保持时间（秒） */
inline constexpr double RESET_PULSE_SEC = 0.5;

/** 读取最大寿命失败时使用的默认值（小时） */
inline constexpr uint16_t DEFAULT_MAX_LAMP_HOURS = 8000;

/** 单个区段快照的整体超时（秒） */
inline constexpr double SNAPSHOT_TIMEOUT_SEC = 30.0;

}  // namespace Constants
