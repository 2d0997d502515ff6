#pragma once

#include "EndpointState.hpp"

#include <trantor/net/EventLoop.h>
#include <trantor/net/InetAddress.h>
#include <trantor/net/TcpClient.h>
#include <trantor/net/TcpConnection.h>
#include <trantor/utils/Logger.h>
#include <trantor/utils/MsgBuffer.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief 单条到 PLC 的 TCP 连接（只用 connect / write / read）
 *
 * 事件回调均在事件循环线程触发；close() 之后不再触发任何回调。
 */
class ModbusSocket {
public:
    struct Callbacks {
        std::function<void()> onConnected;
        std::function<void(const uint8_t* data, size_t len)> onData;
        std::function<void(const std::string& reason)> onError;
        std::function<void()> onClosed;  // 对端关闭
    };

    virtual ~ModbusSocket() = default;

    virtual void connect() = 0;

    /** 写入一帧，未连接时返回 false */
    virtual bool write(const std::vector<uint8_t>& frame) = 0;

    virtual void close() = 0;
};

/**
 * @brief 套接字工厂（生产环境使用 trantor，测试中替换为脚本化实现）
 */
class SocketFactory {
public:
    virtual ~SocketFactory() = default;

    virtual std::unique_ptr<ModbusSocket> create(const Endpoint& endpoint,
                                                 ModbusSocket::Callbacks callbacks) = 0;
};

/**
 * @brief 基于 trantor::TcpClient 的套接字
 *
 * 重连由 ModbusConnectionManager 负责，不启用 TcpClient 自带的 retry。
 */
class TrantorSocket : public ModbusSocket {
public:
    using TcpClient = trantor::TcpClient;
    using TcpConnectionPtr = trantor::TcpConnectionPtr;
    using MsgBuffer = trantor::MsgBuffer;
    using EventLoop = trantor::EventLoop;
    using InetAddress = trantor::InetAddress;

    TrantorSocket(EventLoop* loop, const Endpoint& endpoint, Callbacks callbacks)
        : loop_(loop), endpoint_(endpoint), callbacks_(std::move(callbacks)),
          alive_(std::make_shared<bool>(true)) {}

    ~TrantorSocket() override {
        close();
    }

    void connect() override {
        if (client_) return;

        std::weak_ptr<bool> aliveWeak = alive_;

        InetAddress address(endpoint_.host, endpoint_.port, endpoint_.host.find(':') != std::string::npos);
        if (address.isUnspecified()) {
            // 非法地址不能交给 TcpClient，否则会连到 0.0.0.0
            LOG_ERROR << "[ModbusConn] Invalid address: " << endpoint_.toString();
            loop_->queueInLoop([this, aliveWeak]() {
                if (aliveWeak.expired()) return;
                if (callbacks_.onError) callbacks_.onError("Invalid address: " + endpoint_.host);
            });
            return;
        }

        client_ = std::make_shared<TcpClient>(loop_, address, "ModbusClient_" + endpoint_.toString());

        client_->setConnectionCallback([this, aliveWeak](const TcpConnectionPtr& conn) {
            if (aliveWeak.expired()) return;
            if (conn->connected()) {
                conn_ = conn;
                if (callbacks_.onConnected) callbacks_.onConnected();
            } else {
                conn_.reset();
                if (callbacks_.onClosed) callbacks_.onClosed();
            }
        });

        client_->setMessageCallback([this, aliveWeak](const TcpConnectionPtr&, MsgBuffer* buf) {
            if (aliveWeak.expired()) return;
            std::vector<uint8_t> chunk(buf->peek(), buf->peek() + buf->readableBytes());
            buf->retrieveAll();
            LOG_TRACE << "[ModbusConn] " << endpoint_.toString() << " recv " << chunk.size() << "B";
            if (callbacks_.onData) callbacks_.onData(chunk.data(), chunk.size());
        });

        client_->setConnectionErrorCallback([this, aliveWeak]() {
            if (aliveWeak.expired()) return;
            if (callbacks_.onError) callbacks_.onError("Connection failed");
        });

        client_->connect();
    }

    bool write(const std::vector<uint8_t>& frame) override {
        if (!conn_ || !conn_->connected()) return false;
        conn_->send(reinterpret_cast<const char*>(frame.data()), frame.size());
        LOG_TRACE << "[ModbusConn] " << endpoint_.toString() << " sent " << frame.size() << "B";
        return true;
    }

    /**
     * @brief 关闭连接
     *
     * TcpClient 可能正处于自己的回调栈中，销毁推迟到下一轮循环
     */
    void close() override {
        if (!alive_) return;
        alive_.reset();

        if (conn_) {
            conn_->forceClose();
            conn_.reset();
        }
        if (client_) {
            auto client = std::move(client_);
            client->stop();
            loop_->queueInLoop([client]() {});
        }
    }

private:
    EventLoop* loop_;
    Endpoint endpoint_;
    Callbacks callbacks_;
    std::shared_ptr<TcpClient> client_;
    TcpConnectionPtr conn_;
    std::shared_ptr<bool> alive_;  // 释放后迟到的回调全部忽略
};

class TrantorSocketFactory : public SocketFactory {
public:
    explicit TrantorSocketFactory(trantor::EventLoop* loop) : loop_(loop) {}

    std::unique_ptr<ModbusSocket> create(const Endpoint& endpoint,
                                         ModbusSocket::Callbacks callbacks) override {
        return std::make_unique<TrantorSocket>(loop_, endpoint, std::move(callbacks));
    }

private:
    trantor::EventLoop* loop_;
};
