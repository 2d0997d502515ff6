#pragma once

#include "common/network/EventScheduler.hpp"
#include "common/network/ModbusSocket.hpp"
#include "common/protocol/modbus/Modbus.Types.hpp"

#include <algorithm>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace testing_support {

/**
 * @brief 手动推进的调度器
 *
 * runInLoop 立即执行（测试线程即循环线程），queueInLoop 在 drain/advance 时执行，
 * 定时器按到期时间（相同时间按注册顺序）触发。
 */
class ManualScheduler : public EventScheduler {
public:
    TimerId runAfter(double delaySec, Callback cb) override {
        TimerId id = nextId_++;
        timers_.emplace(id, Timer{now_ + delaySec, std::move(cb)});
        return id;
    }

    void cancel(TimerId id) override {
        timers_.erase(id);
    }

    void runInLoop(Callback cb) override {
        cb();
    }

    void queueInLoop(Callback cb) override {
        queued_.push_back(std::move(cb));
    }

    /** 执行所有已投递的任务 */
    void drain() {
        while (!queued_.empty()) {
            auto cb = std::move(queued_.front());
            queued_.pop_front();
            cb();
        }
    }

    /** 时钟前进 sec 秒，依次触发期间到期的定时器 */
    void advance(double sec) {
        const double target = now_ + sec;
        drain();
        for (;;) {
            auto it = nextDue();
            if (it == timers_.end() || it->second.due > target + 1e-9) break;
            now_ = (std::max)(now_, it->second.due);
            auto cb = std::move(it->second.cb);
            timers_.erase(it);
            cb();
            drain();
        }
        now_ = target;
    }

    double now() const { return now_; }
    size_t pendingTimerCount() const { return timers_.size(); }
    size_t queuedTaskCount() const { return queued_.size(); }

    /** 最近一个定时器距现在的秒数 */
    std::optional<double> nextTimerDelay() const {
        auto it = nextDue();
        if (it == timers_.end()) return std::nullopt;
        return it->second.due - now_;
    }

private:
    struct Timer {
        double due;
        Callback cb;
    };

    double now_ = 0.0;
    TimerId nextId_ = 1;
    std::map<TimerId, Timer> timers_;  // id 递增，同一到期时间按注册顺序
    std::deque<Callback> queued_;

    std::map<TimerId, Timer>::iterator nextDue() {
        auto best = timers_.end();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
            if (best == timers_.end() || it->second.due < best->second.due) best = it;
        }
        return best;
    }

    std::map<TimerId, Timer>::const_iterator nextDue() const {
        auto best = timers_.cend();
        for (auto it = timers_.cbegin(); it != timers_.cend(); ++it) {
            if (best == timers_.cend() || it->second.due < best->second.due) best = it;
        }
        return best;
    }
};

/**
 * @brief 脚本化套接字的共享状态
 *
 * 套接字对象由连接管理器持有并随时销毁，测试通过该状态观察写入并注入事件。
 * close() 之后注入的事件全部忽略，与 TrantorSocket 一致。
 */
struct FakeSocketState {
    Endpoint endpoint;
    ModbusSocket::Callbacks callbacks;
    std::vector<modbus::Frame> writes;
    size_t answered = 0;        // 已回复的写入数（由测试维护）
    bool connectCalled = false;
    bool connected = false;
    bool closed = false;
    bool failWrites = false;

    void emitConnected() {
        if (closed) return;
        connected = true;
        auto cb = callbacks.onConnected;
        if (cb) cb();
    }

    void emitData(const std::vector<uint8_t>& data) {
        if (closed) return;
        auto cb = callbacks.onData;
        if (cb) cb(data.data(), data.size());
    }

    void emitError(const std::string& reason = "Connection refused") {
        if (closed) return;
        auto cb = callbacks.onError;
        if (cb) cb(reason);
    }

    void emitClosed() {
        if (closed) return;
        connected = false;
        auto cb = callbacks.onClosed;
        if (cb) cb();
    }
};

class FakeSocket : public ModbusSocket {
public:
    explicit FakeSocket(std::shared_ptr<FakeSocketState> state) : state_(std::move(state)) {}

    void connect() override {
        state_->connectCalled = true;
    }

    bool write(const std::vector<uint8_t>& frame) override {
        if (state_->closed || !state_->connected || state_->failWrites) return false;
        state_->writes.push_back(frame);
        return true;
    }

    void close() override {
        state_->closed = true;
        state_->connected = false;
    }

private:
    std::shared_ptr<FakeSocketState> state_;
};

class FakeSocketFactory : public SocketFactory {
public:
    std::unique_ptr<ModbusSocket> create(const Endpoint& endpoint,
                                         ModbusSocket::Callbacks callbacks) override {
        auto state = std::make_shared<FakeSocketState>();
        state->endpoint = endpoint;
        state->callbacks = std::move(callbacks);
        sockets_.push_back(state);
        return std::make_unique<FakeSocket>(state);
    }

    size_t count() const { return sockets_.size(); }

    std::shared_ptr<FakeSocketState> at(size_t index) const { return sockets_.at(index); }

    std::shared_ptr<FakeSocketState> last() const {
        return sockets_.empty() ? nullptr : sockets_.back();
    }

    /** 指定端点最近创建的套接字 */
    std::shared_ptr<FakeSocketState> lastFor(const Endpoint& endpoint) const {
        for (auto it = sockets_.rbegin(); it != sockets_.rend(); ++it) {
            if ((*it)->endpoint == endpoint) return *it;
        }
        return nullptr;
    }

private:
    std::vector<std::shared_ptr<FakeSocketState>> sockets_;
};

// ==================== 帧工具 ====================

/** 按 MBAP 格式拼装应答帧（Length 自动计算） */
inline modbus::Frame makeFrame(uint16_t transactionId, uint8_t unitId, const std::vector<uint8_t>& pdu) {
    auto length = static_cast<uint16_t>(pdu.size() + 1);
    modbus::Frame frame = {
        static_cast<uint8_t>(transactionId >> 8), static_cast<uint8_t>(transactionId & 0xFF),
        0x00, 0x00,
        static_cast<uint8_t>(length >> 8), static_cast<uint8_t>(length & 0xFF),
        unitId
    };
    frame.insert(frame.end(), pdu.begin(), pdu.end());
    return frame;
}

/** 取请求帧的事务号 */
inline uint16_t transactionIdOf(const modbus::Frame& frame) {
    return static_cast<uint16_t>((frame[0] << 8) | frame[1]);
}

/** 请求帧 PDU 部分（功能码起） */
inline std::vector<uint8_t> pduOf(const modbus::Frame& frame) {
    return std::vector<uint8_t>(frame.begin() + 7, frame.end());
}

}  // namespace testing_support
