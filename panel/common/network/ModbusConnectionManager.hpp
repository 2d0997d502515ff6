#pragma once

#include "EndpointState.hpp"
#include "EventScheduler.hpp"
#include "ModbusSocket.hpp"
#include "common/protocol/modbus/Modbus.Codec.hpp"
#include "common/protocol/modbus/Modbus.Error.hpp"
#include "common/utils/AppException.hpp"

#include <trantor/utils/Date.h>
#include <trantor/utils/Logger.h>

#include <algorithm>
#include <deque>
#include <exception>
#include <functional>
#include <future>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief 单个待处理请求
 *
 * 严格 FIFO，同一时刻每个端点最多一个 written 的请求
 */
struct PendingRequest {
    using ResponseCallback = std::function<void(const modbus::Frame&)>;
    using FailureCallback = std::function<void(const modbus::ModbusError&)>;

    uint64_t id = 0;
    modbus::Frame frame;
    ResponseCallback onResponse;
    FailureCallback onFailure;
    std::optional<EventScheduler::TimerId> timeoutTimer;
    bool written = false;
};

/**
 * @brief 单个端点的运行时信息
 */
struct EndpointRuntime {
    Endpoint endpoint;
    uint64_t generation = 0;                            // close 后重建的端点 generation 不同
    EndpointStateMachine fsm;
    std::unique_ptr<ModbusSocket> socket;
    uint64_t socketId = 0;                              // 当前套接字序号，过滤旧套接字的事件
    std::deque<PendingRequest> queue;
    std::vector<uint8_t> recvBuffer;                    // 半帧重组缓冲，随套接字销毁
    std::optional<EventScheduler::TimerId> reconnectTimer;
    std::optional<EventScheduler::TimerId> watchdogTimer;
    trantor::Date lastResponseAt;
};

/**
 * @brief Modbus TCP 连接管理器
 *
 * 每个 (host, port) 一条持久连接，请求排队串行发送。
 * 通过 EndpointStateMachine 管理连接状态，ReconnectPolicy 实现指数退避重连，
 * 连续重连失败达到上限后自动挂起端点。
 *
 * 线程模型：所有状态只在调度器的事件循环线程上修改，
 * 公共写操作通过 runInLoop 投递；查询接口只能在循环线程调用。
 * 必须在循环线程上析构（或在循环停止之后）。
 */
class ModbusConnectionManager {
public:
    using Frame = modbus::Frame;
    using ModbusError = modbus::ModbusError;
    using ResponseCallback = PendingRequest::ResponseCallback;
    using FailureCallback = PendingRequest::FailureCallback;
    using ErrorListener = std::function<void(const std::string& host, uint16_t port, const ModbusError& error)>;

    ModbusConnectionManager(EventScheduler& scheduler, SocketFactory& socketFactory,
                            ConnectionOptions options = {})
        : scheduler_(scheduler), socketFactory_(socketFactory), options_(options) {}

    ~ModbusConnectionManager() {
        shuttingDown_ = true;
        closeAllInLoop();
    }

    ModbusConnectionManager(const ModbusConnectionManager&) = delete;
    ModbusConnectionManager& operator=(const ModbusConnectionManager&) = delete;

    // ==================== 请求发送 ====================

    /**
     * @brief 发送一帧并等待应答
     *
     * 端点不存在时自动创建并建立连接。两个回调恰好有一个被调用一次，
     * 均在事件循环线程执行。
     *
     * @throws ValidationException host 为空、端口为 0 或帧长度不足
     */
    void send(const std::string& host, uint16_t port, Frame frame,
              ResponseCallback onResponse, FailureCallback onFailure) {
        validateEndpoint(host, port);
        if (frame.size() <= modbus::ModbusCodec::MBAP_HEADER_SIZE) {
            throw ValidationException("Request frame too short: " + std::to_string(frame.size()) + " bytes");
        }

        scheduler_.runInLoop([this, endpoint = Endpoint{host, port}, frame = std::move(frame),
                              onResponse = std::move(onResponse), onFailure = std::move(onFailure)]() mutable {
            sendInLoop(endpoint, std::move(frame), std::move(onResponse), std::move(onFailure));
        });
    }

    /**
     * @brief 发送一帧，结果通过 future 返回（失败时 future 中保存 ModbusError）
     */
    std::future<Frame> send(const std::string& host, uint16_t port, Frame frame) {
        auto promise = std::make_shared<std::promise<Frame>>();
        auto future = promise->get_future();
        send(host, port, std::move(frame),
             [promise](const Frame& response) { promise->set_value(response); },
             [promise](const ModbusError& error) {
                 promise->set_exception(std::make_exception_ptr(error));
             });
        return future;
    }

    // ==================== 挂起 / 恢复 / 关闭 ====================

    /**
     * @brief 挂起端点：断开连接、取消定时器、排队请求以 Closed 失败，
     * 之后的 send 立即以 Closed 失败，直到 resume
     */
    void suspend(const std::string& host, uint16_t port) {
        validateEndpoint(host, port);
        scheduler_.runInLoop([this, endpoint = Endpoint{host, port}]() {
            auto& rt = getOrCreateRuntime(endpoint);
            LOG_INFO << "[ModbusConn] " << endpoint.toString() << " suspended";
            auto failed = suspendRuntime(rt, "Endpoint suspended");
            rejectAll(failed, ModbusError::closed("Endpoint " + endpoint.toString() + " suspended"));
        });
    }

    /**
     * @brief 恢复挂起的端点：重连计数清零并立即建立连接
     */
    void resume(const std::string& host, uint16_t port) {
        validateEndpoint(host, port);
        scheduler_.runInLoop([this, endpoint = Endpoint{host, port}]() {
            auto* rt = findRuntime(endpoint);
            if (!rt || !rt->fsm.isSuspended()) return;

            rt->fsm.onResumed();
            LOG_INFO << "[ModbusConn] " << endpoint.toString() << " resumed";
            openConnection(*rt);
        });
    }

    bool isSuspended(const std::string& host, uint16_t port) const {
        auto* rt = findRuntime(Endpoint{host, port});
        return rt && rt->fsm.isSuspended();
    }

    /**
     * @brief 强制关闭单个端点并移除其状态（排队请求以 Closed 失败）
     */
    void close(const std::string& host, uint16_t port) {
        scheduler_.runInLoop([this, endpoint = Endpoint{host, port}]() {
            auto it = runtimes_.find(endpoint);
            if (it == runtimes_.end()) return;

            auto runtime = std::move(it->second);
            runtimes_.erase(it);

            LOG_INFO << "[ModbusConn] Force closing connection to " << endpoint.toString();
            auto failed = teardown(*runtime);
            rejectAll(failed, ModbusError::closed());
        });
    }

    /**
     * @brief 关闭所有端点（退出时调用），不留任何定时器
     */
    void closeAll() {
        scheduler_.runInLoop([this]() { closeAllInLoop(); });
    }

    // ==================== 错误监听 ====================

    /**
     * @brief 注册错误监听（套接字错误、看门狗断开、超时断开、自动挂起）
     */
    void onError(ErrorListener listener) {
        scheduler_.runInLoop([this, listener = std::move(listener)]() mutable {
            errorListeners_.push_back(std::move(listener));
        });
    }

    // ==================== 状态查询（循环线程） ====================

    ConnState state(const std::string& host, uint16_t port) const {
        auto* rt = findRuntime(Endpoint{host, port});
        return rt ? rt->fsm.state() : ConnState::Disconnected;
    }

    size_t pendingCount(const std::string& host, uint16_t port) const {
        auto* rt = findRuntime(Endpoint{host, port});
        return rt ? rt->queue.size() : 0;
    }

    int reconnectAttempts(const std::string& host, uint16_t port) const {
        auto* rt = findRuntime(Endpoint{host, port});
        return rt ? rt->fsm.reconnectAttempts() : 0;
    }

    bool hasEndpoint(const std::string& host, uint16_t port) const {
        return findRuntime(Endpoint{host, port}) != nullptr;
    }

    size_t endpointCount() const { return runtimes_.size(); }

    const ConnectionOptions& options() const { return options_; }

private:
    EventScheduler& scheduler_;
    SocketFactory& socketFactory_;
    ConnectionOptions options_;

    std::map<Endpoint, std::unique_ptr<EndpointRuntime>> runtimes_;
    std::vector<ErrorListener> errorListeners_;

    uint64_t nextGeneration_ = 1;
    uint64_t nextSocketId_ = 1;
    uint64_t nextRequestId_ = 1;
    bool shuttingDown_ = false;

    static void validateEndpoint(const std::string& host, uint16_t port) {
        if (host.empty()) throw ValidationException("Endpoint host must not be empty");
        if (port == 0) throw ValidationException("Endpoint port must not be 0");
    }

    // ==================== 端点查找 ====================

    EndpointRuntime* findRuntime(const Endpoint& endpoint) const {
        auto it = runtimes_.find(endpoint);
        return it == runtimes_.end() ? nullptr : it->second.get();
    }

    /** 用户回调可能已关闭或重建端点，回调之后都要重新查找 */
    EndpointRuntime* findRuntime(const Endpoint& endpoint, uint64_t generation) const {
        auto* rt = findRuntime(endpoint);
        return (rt && rt->generation == generation) ? rt : nullptr;
    }

    EndpointRuntime* findSocketOwner(const Endpoint& endpoint, uint64_t socketId) const {
        auto* rt = findRuntime(endpoint);
        return (rt && rt->socket && rt->socketId == socketId) ? rt : nullptr;
    }

    EndpointRuntime& getOrCreateRuntime(const Endpoint& endpoint) {
        auto& slot = runtimes_[endpoint];
        if (!slot) {
            slot = std::make_unique<EndpointRuntime>();
            slot->endpoint = endpoint;
            slot->generation = nextGeneration_++;
            slot->fsm = EndpointStateMachine(options_);
            slot->lastResponseAt = trantor::Date::now();
        }
        return *slot;
    }

    // ==================== 发送流程 ====================

    void sendInLoop(const Endpoint& endpoint, Frame frame,
                    ResponseCallback onResponse, FailureCallback onFailure) {
        if (shuttingDown_) {
            invokeFailure(onFailure, ModbusError::closed("Connection manager shutting down"));
            return;
        }

        auto& rt = getOrCreateRuntime(endpoint);
        if (rt.fsm.isSuspended()) {
            LOG_DEBUG << "[ModbusConn] " << endpoint.toString() << " is suspended, request rejected";
            invokeFailure(onFailure, ModbusError::closed("Endpoint " + endpoint.toString() + " is suspended"));
            return;
        }

        PendingRequest req;
        req.id = nextRequestId_++;
        req.frame = std::move(frame);
        req.onResponse = std::move(onResponse);
        req.onFailure = std::move(onFailure);
        req.timeoutTimer = scheduler_.runAfter(options_.requestTimeoutSec,
            [this, endpoint, generation = rt.generation, id = req.id]() {
                handleRequestTimeout(endpoint, generation, id);
            });

        LOG_TRACE << "[ModbusConn] " << endpoint.toString() << " enqueue #" << req.id
                  << " (queue " << rt.queue.size() + 1 << ")";
        rt.queue.push_back(std::move(req));

        switch (rt.fsm.state()) {
            case ConnState::Connected:
                flushQueue(rt);
                break;
            case ConnState::Connecting:
                break;
            case ConnState::Disconnected:
                // 退避等待中只排队，由重连定时器建立连接
                if (!rt.reconnectTimer) openConnection(rt);
                break;
        }
    }

    /**
     * @brief 写出队首请求（每个端点同一时刻最多一个在途请求）
     */
    void flushQueue(EndpointRuntime& rt) {
        if (rt.fsm.state() != ConnState::Connected || !rt.socket) return;
        if (rt.queue.empty() || rt.queue.front().written) return;

        auto& head = rt.queue.front();
        if (!rt.socket->write(head.frame)) {
            LOG_WARN << "[ModbusConn] Write failed on " << rt.endpoint.toString();
            handleDisconnect(rt, ModbusError::transport("Write failed"));
            return;
        }
        head.written = true;
        LOG_TRACE << "[ModbusConn] " << rt.endpoint.toString() << " write #" << head.id
                  << " " << modbus::ModbusCodec::toHexString(head.frame);
    }

    // ==================== 连接建立 ====================

    void openConnection(EndpointRuntime& rt) {
        if (rt.fsm.isSuspended() || rt.fsm.isActive()) return;
        rt.fsm.onConnecting();
        startSocket(rt);
    }

    /** 创建新套接字并发起连接（状态已是 Connecting） */
    void startSocket(EndpointRuntime& rt) {
        destroySocket(rt);
        rt.recvBuffer.clear();

        const Endpoint endpoint = rt.endpoint;
        const uint64_t socketId = nextSocketId_++;

        ModbusSocket::Callbacks callbacks;
        callbacks.onConnected = [this, endpoint, socketId]() {
            handleConnected(endpoint, socketId);
        };
        callbacks.onData = [this, endpoint, socketId](const uint8_t* data, size_t len) {
            handleData(endpoint, socketId, data, len);
        };
        callbacks.onError = [this, endpoint, socketId](const std::string& reason) {
            handleSocketFailure(endpoint, socketId, ModbusError::transport(reason));
        };
        callbacks.onClosed = [this, endpoint, socketId]() {
            handleSocketFailure(endpoint, socketId, ModbusError::closed());
        };

        rt.socketId = socketId;
        rt.socket = socketFactory_.create(endpoint, std::move(callbacks));

        LOG_INFO << "[ModbusConn] Creating connection to " << endpoint.toString()
                 << " (attempt " << rt.fsm.reconnectAttempts() << ")";

        armWatchdog(rt);
        rt.socket->connect();
    }

    void handleConnected(const Endpoint& endpoint, uint64_t socketId) {
        auto* rt = findSocketOwner(endpoint, socketId);
        if (!rt) return;

        rt->fsm.onConnected();
        rt->lastResponseAt = trantor::Date::now();
        LOG_INFO << "[ModbusConn] Connected to " << endpoint.toString();

        armWatchdog(*rt);
        flushQueue(*rt);
    }

    void handleSocketFailure(const Endpoint& endpoint, uint64_t socketId, const ModbusError& error) {
        auto* rt = findSocketOwner(endpoint, socketId);
        if (!rt) return;

        LOG_WARN << "[ModbusConn] Socket " << modbus::errorKindToString(error.kind())
                 << " on " << endpoint.toString() << ": " << error.getMessage();
        handleDisconnect(*rt, error);
    }

    // ==================== 接收与重组 ====================

    void handleData(const Endpoint& endpoint, uint64_t socketId, const uint8_t* data, size_t len) {
        auto* rt = findSocketOwner(endpoint, socketId);
        if (!rt) return;

        rt->lastResponseAt = trantor::Date::now();
        armWatchdog(*rt);
        rt->recvBuffer.insert(rt->recvBuffer.end(), data, data + len);

        while ((rt = findSocketOwner(endpoint, socketId)) != nullptr) {
            std::optional<Frame> frame;
            try {
                frame = modbus::ModbusCodec::takeFrame(rt->recvBuffer);
            } catch (const ModbusError& e) {
                LOG_WARN << "[ModbusConn] Corrupt stream from " << endpoint.toString() << ": " << e.getMessage();
                handleDisconnect(*rt, e);
                return;
            }
            if (!frame) break;

            if (rt->queue.empty() || !rt->queue.front().written) {
                LOG_WARN << "[ModbusConn] Unsolicited frame from " << endpoint.toString()
                         << " dropped: " << modbus::ModbusCodec::toHexString(*frame);
                continue;
            }

            PendingRequest req = std::move(rt->queue.front());
            rt->queue.pop_front();
            cancelTimer(req.timeoutTimer);

            uint16_t sentTid = modbus::ModbusCodec::transactionIdOf(req.frame);
            uint16_t recvTid = modbus::ModbusCodec::transactionIdOf(*frame);
            if (sentTid != recvTid) {
                LOG_WARN << "[ModbusConn] Transaction id mismatch on " << endpoint.toString()
                         << ": sent " << sentTid << ", received " << recvTid << " (matched by order)";
            }

            if (modbus::ModbusCodec::isExceptionFrame(*frame)) {
                auto resp = modbus::ModbusCodec::parseResponse(*frame);
                auto error = ModbusError::protocolException(resp.functionCode, resp.exceptionCode);
                LOG_WARN << "[ModbusConn] " << endpoint.toString() << ": " << error.getMessage();
                invokeFailure(req.onFailure, error);
            } else {
                invokeResponse(req.onResponse, *frame);
            }
        }

        if ((rt = findSocketOwner(endpoint, socketId)) != nullptr) {
            flushQueue(*rt);
        }
    }

    // ==================== 超时 / 看门狗 ====================

    void handleRequestTimeout(const Endpoint& endpoint, uint64_t generation, uint64_t id) {
        auto* rt = findRuntime(endpoint, generation);
        if (!rt) return;

        auto it = std::find_if(rt->queue.begin(), rt->queue.end(),
                               [id](const PendingRequest& p) { return p.id == id; });
        if (it == rt->queue.end()) return;

        PendingRequest req = std::move(*it);
        rt->queue.erase(it);
        req.timeoutTimer.reset();

        LOG_WARN << "[ModbusConn] Request #" << id << " timed out for " << endpoint.toString();

        if (rt->fsm.isActive()) {
            handleDisconnect(*rt, ModbusError::timeout("Request timed out"));
        }
        invokeFailure(req.onFailure, ModbusError::timeout());
    }

    void armWatchdog(EndpointRuntime& rt) {
        cancelTimer(rt.watchdogTimer);
        rt.watchdogTimer = scheduler_.runAfter(options_.watchdogTimeoutSec,
            [this, endpoint = rt.endpoint, socketId = rt.socketId]() {
                auto* rt2 = findSocketOwner(endpoint, socketId);
                if (!rt2) return;
                rt2->watchdogTimer.reset();
                LOG_WARN << "[ModbusConn] Watchdog: no response from " << endpoint.toString()
                         << " since " << rt2->lastResponseAt.toFormattedString(false)
                         << ", forcing reconnect";
                handleDisconnect(*rt2, ModbusError::transport("Watchdog timeout: no response"));
            });
    }

    // ==================== 断线处理 ====================

    /**
     * @brief 断线：销毁套接字和看门狗，丢弃半帧，
     * 排队请求以触发错误失败，通知监听者，未挂起时调度重连
     */
    void handleDisconnect(EndpointRuntime& rt, const ModbusError& error) {
        const Endpoint endpoint = rt.endpoint;
        const bool wasActive = rt.fsm.isActive();

        destroySocket(rt);
        cancelTimer(rt.watchdogTimer);
        rt.recvBuffer.clear();
        rt.fsm.onDisconnected(error.getMessage());
        auto failed = takeQueue(rt);

        std::optional<ModbusError> suspension;
        if (wasActive && !rt.fsm.isSuspended()) {
            if (rt.fsm.reconnectExhausted()) {
                LOG_ERROR << "[ModbusConn] Too many reconnect attempts for " << endpoint.toString()
                          << ", suspending connection";
                auto rest = suspendRuntime(rt, "Reconnect attempts exhausted");
                std::move(rest.begin(), rest.end(), std::back_inserter(failed));
                suspension = ModbusError::closed("Endpoint " + endpoint.toString() + " suspended after "
                    + std::to_string(rt.fsm.reconnectAttempts()) + " failed reconnect attempts");
            } else {
                scheduleReconnect(rt);
            }
        }

        emitError(endpoint, error);
        if (suspension) emitError(endpoint, *suspension);
        rejectAll(failed, error);
    }

    /**
     * @brief 调度重连（指数退避，同一时刻最多一个重连定时器）
     */
    void scheduleReconnect(EndpointRuntime& rt) {
        if (rt.reconnectTimer) return;

        double delay = rt.fsm.getReconnectDelay();
        LOG_INFO << "[ModbusConn] Scheduling reconnect to " << rt.endpoint.toString() << " in "
                 << delay << "s (attempt " << rt.fsm.reconnectAttempts() + 1 << ")";

        rt.reconnectTimer = scheduler_.runAfter(delay,
            [this, endpoint = rt.endpoint, generation = rt.generation]() {
                auto* rt2 = findRuntime(endpoint, generation);
                if (!rt2) return;
                rt2->reconnectTimer.reset();
                if (rt2->fsm.isSuspended() || rt2->fsm.isActive()) return;

                rt2->fsm.onReconnecting();
                startSocket(*rt2);
            });
    }

    // ==================== 拆除 ====================

    /** 挂起并清空端点（不调用任何回调），返回被移出的请求 */
    std::deque<PendingRequest> suspendRuntime(EndpointRuntime& rt, const std::string& reason) {
        destroySocket(rt);
        cancelTimer(rt.watchdogTimer);
        cancelTimer(rt.reconnectTimer);
        rt.recvBuffer.clear();
        rt.fsm.onSuspended(reason);
        return takeQueue(rt);
    }

    /** 完全拆除端点（close / closeAll），返回被移出的请求 */
    std::deque<PendingRequest> teardown(EndpointRuntime& rt) {
        destroySocket(rt);
        cancelTimer(rt.watchdogTimer);
        cancelTimer(rt.reconnectTimer);
        rt.recvBuffer.clear();
        rt.fsm.onDisconnected("closed");
        return takeQueue(rt);
    }

    void closeAllInLoop() {
        std::map<Endpoint, std::unique_ptr<EndpointRuntime>> toClose;
        toClose.swap(runtimes_);

        std::deque<PendingRequest> failed;
        for (auto& [endpoint, runtime] : toClose) {
            LOG_INFO << "[ModbusConn] Force closing connection to " << endpoint.toString();
            auto taken = teardown(*runtime);
            std::move(taken.begin(), taken.end(), std::back_inserter(failed));
        }
        rejectAll(failed, ModbusError::closed());
    }

    /**
     * @brief 销毁套接字
     *
     * 可能正处于该套接字自己的回调栈中，对象释放推迟到下一轮循环
     */
    void destroySocket(EndpointRuntime& rt) {
        if (!rt.socket) return;
        std::shared_ptr<ModbusSocket> dead = std::move(rt.socket);
        dead->close();
        if (!shuttingDown_) {
            scheduler_.queueInLoop([dead]() {});
        }
    }

    std::deque<PendingRequest> takeQueue(EndpointRuntime& rt) {
        std::deque<PendingRequest> taken;
        taken.swap(rt.queue);
        for (auto& req : taken) cancelTimer(req.timeoutTimer);
        return taken;
    }

    void cancelTimer(std::optional<EventScheduler::TimerId>& timer) {
        if (timer) {
            scheduler_.cancel(*timer);
            timer.reset();
        }
    }

    // ==================== 回调分发 ====================

    void rejectAll(std::deque<PendingRequest>& requests, const ModbusError& error) {
        for (auto& req : requests) {
            invokeFailure(req.onFailure, error);
        }
        requests.clear();
    }

    void emitError(const Endpoint& endpoint, const ModbusError& error) {
        // 监听者可能注册新的监听者，遍历副本
        auto listeners = errorListeners_;
        for (const auto& listener : listeners) {
            try {
                listener(endpoint.host, endpoint.port, error);
            } catch (const std::exception& e) {
                LOG_ERROR << "[ModbusConn] Error listener threw: " << e.what();
            }
        }
    }

    static void invokeResponse(const ResponseCallback& cb, const Frame& frame) {
        if (!cb) return;
        try {
            cb(frame);
        } catch (const std::exception& e) {
            LOG_ERROR << "[ModbusConn] Response callback threw: " << e.what();
        }
    }

    static void invokeFailure(const FailureCallback& cb, const ModbusError& error) {
        if (!cb) return;
        try {
            cb(error);
        } catch (const std::exception& e) {
            LOG_ERROR << "[ModbusConn] Failure callback threw: " << e.what();
        }
    }
};
