#pragma once

#include "common/utils/Constants.hpp"

#include <trantor/utils/Logger.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <tuple>

/**
 * @brief PLC 端点标识（IP + 端口）
 */
struct Endpoint {
    std::string host;
    uint16_t port = Constants::MODBUS_DEFAULT_PORT;

    std::string toString() const {
        return host + ":" + std::to_string(port);
    }

    bool operator<(const Endpoint& other) const {
        return std::tie(host, port) < std::tie(other.host, other.port);
    }

    bool operator==(const Endpoint& other) const {
        return host == other.host && port == other.port;
    }
};

/**
 * @brief 端点连接状态
 *
 * 挂起是独立的标志位，不是连接状态的一种：
 * 挂起的端点连接状态一定是 Disconnected。
 */
enum class ConnState {
    Disconnected,
    Connecting,
    Connected
};

inline std::string connStateToString(ConnState state) {
    switch (state) {
        case ConnState::Disconnected: return "disconnected";
        case ConnState::Connecting:   return "connecting";
        case ConnState::Connected:    return "connected";
    }
    return "disconnected";
}

/**
 * @brief 连接管理参数（由配置文件覆盖）
 */
struct ConnectionOptions {
    double requestTimeoutSec = Constants::REQUEST_TIMEOUT_SEC;
    double watchdogTimeoutSec = Constants::WATCHDOG_TIMEOUT_SEC;
    double reconnectBaseDelaySec = Constants::RECONNECT_BASE_DELAY_SEC;
    double reconnectMaxDelaySec = Constants::RECONNECT_MAX_DELAY_SEC;
    int maxReconnectAttempts = Constants::MAX_RECONNECT_ATTEMPTS;
};

/**
 * @brief 指数退避重连策略
 *
 * - delay = min(base * 2^attempts, max)
 * - 连续失败达到上限后由状态机触发自动挂起
 * - 无随机抖动
 */
class ReconnectPolicy {
public:
    ReconnectPolicy() = default;

    ReconnectPolicy(double baseDelaySec, double maxDelaySec, int maxAttempts)
        : baseDelaySec_(baseDelaySec), maxDelaySec_(maxDelaySec), maxAttempts_(maxAttempts) {}

    /**
     * @brief 获取当前重试的延迟时间（秒）
     */
    double getDelay() const {
        double delay = baseDelaySec_ * std::pow(2.0, static_cast<double>(attempts_));
        return (std::min)(delay, maxDelaySec_);
    }

    void recordAttempt() { ++attempts_; }

    /**
     * @brief 重置（连接成功或手动恢复时调用）
     */
    void reset() { attempts_ = 0; }

    bool exhausted() const { return attempts_ >= maxAttempts_; }

    int attempts() const { return attempts_; }
    int maxAttempts() const { return maxAttempts_; }

private:
    double baseDelaySec_ = Constants::RECONNECT_BASE_DELAY_SEC;
    double maxDelaySec_ = Constants::RECONNECT_MAX_DELAY_SEC;
    int maxAttempts_ = Constants::MAX_RECONNECT_ATTEMPTS;
    int attempts_ = 0;
};

/**
 * @brief 端点状态机
 *
 * 每个 EndpointRuntime 持有一个实例，所有状态转换集中在此。
 *
 * 状态转换表：
 *   Disconnected →[connect]→ Connecting →[connected]→ Connected
 *   Connecting/Connected →[disconnected]→ Disconnected
 *   Disconnected →[reconnectTimer]→ Connecting（attempts + 1）
 *   Any →[suspend]→ Disconnected + suspended
 *   suspended →[resume]→ Disconnected（attempts 清零）
 */
class EndpointStateMachine {
public:
    EndpointStateMachine() = default;

    explicit EndpointStateMachine(const ConnectionOptions& options)
        : reconnect_(options.reconnectBaseDelaySec, options.reconnectMaxDelaySec,
                     options.maxReconnectAttempts) {}

    ConnState state() const { return state_; }
    std::string stateString() const {
        return suspended_ ? "suspended" : connStateToString(state_);
    }
    bool isSuspended() const { return suspended_; }

    /** 已连接或正在连接 */
    bool isActive() const { return state_ != ConnState::Disconnected; }

    // ==================== 状态事件 ====================

    void onConnecting() {
        transition(ConnState::Connecting, "connect");
    }

    void onConnected() {
        transition(ConnState::Connected, "connected");
        reconnect_.reset();
    }

    void onDisconnected(const std::string& reason = "") {
        errorMsg_ = reason;
        transition(ConnState::Disconnected, "disconnected");
    }

    /**
     * @brief 重连定时器触发 → 进入 Connecting
     */
    void onReconnecting() {
        reconnect_.recordAttempt();
        transition(ConnState::Connecting, "reconnectTimer");
    }

    void onSuspended(const std::string& reason = "") {
        transition(ConnState::Disconnected, "suspend");
        if (!suspended_) {
            LOG_DEBUG << "EndpointFSM: suspended";
        }
        suspended_ = true;
        if (!reason.empty()) errorMsg_ = reason;
    }

    void onResumed() {
        if (suspended_) {
            LOG_DEBUG << "EndpointFSM: resumed";
        }
        suspended_ = false;
        reconnect_.reset();
        errorMsg_.clear();
    }

    // ==================== 重连策略 ====================

    double getReconnectDelay() const { return reconnect_.getDelay(); }
    int reconnectAttempts() const { return reconnect_.attempts(); }
    bool reconnectExhausted() const { return reconnect_.exhausted(); }
    const std::string& errorMsg() const { return errorMsg_; }

private:
    ConnState state_ = ConnState::Disconnected;
    bool suspended_ = false;
    ReconnectPolicy reconnect_;
    std::string errorMsg_;

    void transition(ConnState newState, const char* event) {
        if (state_ != newState) {
            LOG_DEBUG << "EndpointFSM: " << connStateToString(state_)
                      << " →[" << event << "]→ " << connStateToString(newState);
            state_ = newState;
        }
    }
};
