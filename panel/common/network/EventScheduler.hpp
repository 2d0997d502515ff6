#pragma once

#include <trantor/net/EventLoop.h>

#include <cstdint>
#include <functional>

/**
 * @brief 事件循环调度接口（定时器 + 线程投递）
 *
 * 连接管理器的所有状态变更都在同一个循环线程上执行，
 * 测试中以手动推进的时钟替换。
 */
class EventScheduler {
public:
    using TimerId = uint64_t;
    using Callback = std::function<void()>;

    virtual ~EventScheduler() = default;

    /** delaySec 秒后在循环线程执行 cb，返回可用于取消的 TimerId */
    virtual TimerId runAfter(double delaySec, Callback cb) = 0;

    /** 取消尚未触发的定时器（已触发或不存在时忽略） */
    virtual void cancel(TimerId id) = 0;

    /** 在循环线程执行；若当前已在循环线程则立即执行 */
    virtual void runInLoop(Callback cb) = 0;

    /** 投递到循环线程的下一轮执行 */
    virtual void queueInLoop(Callback cb) = 0;
};

/**
 * @brief 基于 trantor::EventLoop 的调度实现
 */
class LoopScheduler : public EventScheduler {
public:
    explicit LoopScheduler(trantor::EventLoop* loop) : loop_(loop) {}

    TimerId runAfter(double delaySec, Callback cb) override {
        return loop_->runAfter(delaySec, std::move(cb));
    }

    void cancel(TimerId id) override {
        loop_->invalidateTimer(id);
    }

    void runInLoop(Callback cb) override {
        loop_->runInLoop(std::move(cb));
    }

    void queueInLoop(Callback cb) override {
        loop_->queueInLoop(std::move(cb));
    }

    trantor::EventLoop* loop() const { return loop_; }

private:
    trantor::EventLoop* loop_;
};
