#pragma once

#include "common/network/EventScheduler.hpp"
#include "common/network/ModbusConnectionManager.hpp"
#include "common/protocol/modbus/Modbus.Client.hpp"
#include "common/utils/Constants.hpp"
#include "modules/uv/domain/Registers.hpp"
#include "modules/uv/domain/UvPanel.hpp"

#include <trantor/utils/Logger.h>

#include <cmath>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>

namespace uv {

/**
 * @brief UV 灯控制柜业务服务层
 *
 * 每个操作对应 PLC 上的一个寄存器/线圈，结果通过回调返回。
 * 灯管编号越界等参数错误同步抛出 ValidationException。
 */
class UvPanelService {
public:
    using ModbusError = modbus::ModbusError;
    using ErrorCallback = modbus::ModbusClient::ErrorCallback;
    using DoneCallback = modbus::ModbusClient::DoneCallback;
    using BoolCallback = std::function<void(bool)>;
    using IntCallback = std::function<void(int)>;
    using FloatCallback = std::function<void(float)>;
    using LampHoursCallback = std::function<void(const LampHours&)>;
    using SnapshotCallback = std::function<void(const SectionSnapshot&)>;

    struct Options {
        uint8_t unitId = Constants::MODBUS_DEFAULT_UNIT_ID;
        double resetPulseSec = Constants::RESET_PULSE_SEC;
        double snapshotTimeoutSec = Constants::SNAPSHOT_TIMEOUT_SEC;
    };

    UvPanelService(ModbusConnectionManager& manager, EventScheduler& scheduler)
        : UvPanelService(manager, scheduler, Options{}) {}

    UvPanelService(ModbusConnectionManager& manager, EventScheduler& scheduler, Options options)
        : manager_(manager), scheduler_(scheduler), options_(options),
          alive_(std::make_shared<bool>(true)) {}

    // ==================== 电源 ====================

    void setPower(const Endpoint& endpoint, bool on, DoneCallback onDone, ErrorCallback onError) {
        LOG_INFO << "[UvPanel] " << endpoint.toString() << " set power " << (on ? "ON" : "OFF");
        client(endpoint).writeSingleCoil(Registers::POWER_COIL, on, std::move(onDone), std::move(onError));
    }

    void readPowerStatus(const Endpoint& endpoint, BoolCallback onValue, ErrorCallback onError) {
        readBit(endpoint, Registers::POWER_STATUS_INPUT, std::move(onValue), std::move(onError));
    }

    // ==================== 灯管运行时间 ====================

    /**
     * @brief 复位灯管运行时间（线圈 ON → 保持 resetPulseSec → OFF）
     */
    void resetLampHours(const Endpoint& endpoint, int lampIndex, DoneCallback onDone, ErrorCallback onError) {
        uint16_t coil = Registers::lampHoursResetCoil(lampIndex);
        LOG_INFO << "[UvPanel] " << endpoint.toString() << " reset lamp " << lampIndex << " hours";
        pulseCoil(endpoint, coil, std::move(onDone), std::move(onError));
    }

    /**
     * @brief 读取灯管当前小时（FC04）与寿命上限（FC03，同地址）
     *
     * 当前小时读取失败则整体失败；上限读取失败回退为默认值
     */
    void readLampHours(const Endpoint& endpoint, int lampIndex, LampHoursCallback onValue, ErrorCallback onError) {
        uint16_t currentReg = Registers::lampHoursRegister(lampIndex);
        uint16_t maxReg = Registers::lampMaxHoursRegister(lampIndex);
        auto alive = std::weak_ptr<bool>(alive_);

        client(endpoint).readInputRegisters(currentReg, 1,
            [this, alive, endpoint, lampIndex, maxReg, onValue](const std::vector<uint16_t>& current) {
                if (alive.expired()) return;
                LampHours hours;
                hours.currentHours = current[0];

                client(endpoint).readHoldingRegisters(maxReg, 1,
                    [hours, onValue](const std::vector<uint16_t>& max) mutable {
                        hours.maxHours = max[0];
                        hours.maxFromDevice = true;
                        onValue(hours);
                    },
                    [hours, onValue, lampIndex](const ModbusError& e) {
                        LOG_WARN << "[UvPanel] Lamp " << lampIndex << " max hours unavailable ("
                                 << e.getMessage() << "), using default " << hours.maxHours;
                        onValue(hours);
                    });
            },
            onError);
    }

    // ==================== 灯管寿命设定 ====================

    void setLampLife(const Endpoint& endpoint, float hours, DoneCallback onDone, ErrorCallback onError) {
        LOG_INFO << "[UvPanel] " << endpoint.toString() << " set lamp life " << hours << "h";
        client(endpoint).writeFloat32(Registers::LAMP_LIFE_SETPOINT, hours, std::move(onDone), std::move(onError));
    }

    void readLampLifeSetpoint(const Endpoint& endpoint, FloatCallback onValue, ErrorCallback onError) {
        client(endpoint).readFloat32(modbus::FuncCodes::READ_HOLDING_REGISTERS, Registers::LAMP_LIFE_SETPOINT,
                                     std::move(onValue), std::move(onError));
    }

    // ==================== 清洗 ====================

    void readCombinedCleaningStatus(const Endpoint& endpoint, BoolCallback onValue, ErrorCallback onError) {
        readBit(endpoint, Registers::COMBINED_CLEANING_STATUS_INPUT, std::move(onValue), std::move(onError));
    }

    void resetCleaningHours(const Endpoint& endpoint, int lampIndex, DoneCallback onDone, ErrorCallback onError) {
        uint16_t coil = Registers::cleaningResetCoil(lampIndex);
        LOG_INFO << "[UvPanel] " << endpoint.toString() << " reset lamp " << lampIndex << " cleaning hours";
        pulseCoil(endpoint, coil, std::move(onDone), std::move(onError));
    }

    void readLampCleaningRunHours(const Endpoint& endpoint, int lampIndex, FloatCallback onValue, ErrorCallback onError) {
        uint16_t reg = Registers::cleaningRunHoursRegister(lampIndex);
        client(endpoint).readFloat32(modbus::FuncCodes::READ_INPUT_REGISTERS, reg,
                                     std::move(onValue), std::move(onError));
    }

    void setCleaningHours(const Endpoint& endpoint, float hours, DoneCallback onDone, ErrorCallback onError) {
        LOG_INFO << "[UvPanel] " << endpoint.toString() << " set cleaning hours " << hours << "h";
        client(endpoint).writeFloat32(Registers::CLEANING_HOURS_SETPOINT, hours, std::move(onDone), std::move(onError));
    }

    void readCleaningHoursSetpoint(const Endpoint& endpoint, FloatCallback onValue, ErrorCallback onError) {
        client(endpoint).readFloat32(modbus::FuncCodes::READ_HOLDING_REGISTERS, Registers::CLEANING_HOURS_SETPOINT,
                                     std::move(onValue), std::move(onError));
    }

    // ==================== 传感器 / 状态 ====================

    void readDpsStatus(const Endpoint& endpoint, BoolCallback onValue, ErrorCallback onError) {
        readBit(endpoint, Registers::DPS_STATUS_INPUT, std::move(onValue), std::move(onError));
    }

    void readPressureButton(const Endpoint& endpoint, BoolCallback onValue, ErrorCallback onError) {
        readBit(endpoint, Registers::PRESSURE_BUTTON_INPUT, std::move(onValue), std::move(onError));
    }

    /** 在线灯管数（PLC 以 float32 存储，四舍五入取整） */
    void readLampsOnline(const Endpoint& endpoint, IntCallback onValue, ErrorCallback onError) {
        client(endpoint).readFloat32(modbus::FuncCodes::READ_INPUT_REGISTERS, Registers::LAMPS_ONLINE_INPUT,
            [onValue = std::move(onValue)](float count) {
                onValue(static_cast<int>(std::lround(count)));
            },
            std::move(onError));
    }

    void readCurrentAmps(const Endpoint& endpoint, FloatCallback onValue, ErrorCallback onError) {
        client(endpoint).readFloat32(modbus::FuncCodes::READ_INPUT_REGISTERS, Registers::CURRENT_AMPS_INPUT,
                                     std::move(onValue), std::move(onError));
    }

    void readLampCleanStatus(const Endpoint& endpoint, int lampIndex, BoolCallback onValue, ErrorCallback onError) {
        readBit(endpoint, Registers::lampCleanStatusInput(lampIndex), std::move(onValue), std::move(onError));
    }

    void readLampLifeStatus(const Endpoint& endpoint, int lampIndex, BoolCallback onValue, ErrorCallback onError) {
        readBit(endpoint, Registers::lampLifeStatusInput(lampIndex), std::move(onValue), std::move(onError));
    }

    // ==================== 区段快照 ====================

    /**
     * @brief 读取一个区段的全部状态
     *
     * 所有读数并发入队（同一端点上串行执行），全部完成或整体超时后回调一次。
     * 超时未完成的读数记为 "Snapshot timed out"。
     */
    void readSectionSnapshot(const PanelSection& section, SnapshotCallback onSnapshot) {
        struct Collector {
            SectionSnapshot snapshot;
            SnapshotCallback onSnapshot;
            int remaining = SectionSnapshot::fieldCount();
            bool delivered = false;
            std::optional<EventScheduler::TimerId> guardTimer;
        };

        auto collector = std::make_shared<Collector>();
        collector->snapshot.section = section.name;
        collector->snapshot.endpoint = section.endpoint();
        collector->onSnapshot = std::move(onSnapshot);

        auto deliver = [scheduler = &scheduler_](const std::shared_ptr<Collector>& c) {
            if (c->delivered) return;
            c->delivered = true;
            if (c->guardTimer) {
                scheduler->cancel(*c->guardTimer);
                c->guardTimer.reset();
            }
            LOG_DEBUG << "[UvPanel] Snapshot of " << c->snapshot.section << " done, "
                      << c->snapshot.failureCount() << " failed field(s)";
            c->onSnapshot(c->snapshot);
        };

        // 每项完成时写入读数，最后一项完成时交付
        auto settle = [deliver](const std::shared_ptr<Collector>& c, auto apply) {
            if (c->delivered) return;
            apply(c->snapshot);
            if (--c->remaining == 0) deliver(c);
        };

        auto failWith = [settle, collector](auto member) {
            return [settle, collector, member](const ModbusError& e) {
                settle(collector, [&](SectionSnapshot& s) {
                    (s.*member) = std::remove_reference_t<decltype(s.*member)>::failure(e.getMessage());
                });
            };
        };

        collector->guardTimer = scheduler_.runAfter(options_.snapshotTimeoutSec, [collector, deliver]() {
            collector->guardTimer.reset();
            if (collector->delivered) return;
            LOG_WARN << "[UvPanel] Snapshot of " << collector->snapshot.section << " timed out";
            markUnsettled(collector->snapshot);
            deliver(collector);
        });

        const Endpoint endpoint = section.endpoint();

        readPowerStatus(endpoint,
            [settle, collector](bool on) {
                settle(collector, [&](SectionSnapshot& s) { s.power = Reading<bool>::success(on); });
            },
            failWith(&SectionSnapshot::power));

        readLampsOnline(endpoint,
            [settle, collector](int count) {
                settle(collector, [&](SectionSnapshot& s) { s.lampsOnline = Reading<int>::success(count); });
            },
            failWith(&SectionSnapshot::lampsOnline));

        readCurrentAmps(endpoint,
            [settle, collector](float amps) {
                settle(collector, [&](SectionSnapshot& s) { s.currentAmps = Reading<float>::success(amps); });
            },
            failWith(&SectionSnapshot::currentAmps));

        for (int lamp = 1; lamp <= Constants::LAMP_COUNT; ++lamp) {
            const size_t slot = static_cast<size_t>(lamp - 1);
            readLampHours(endpoint, lamp,
                [settle, collector, slot](const LampHours& hours) {
                    settle(collector, [&](SectionSnapshot& s) {
                        s.lampHours[slot] = Reading<LampHours>::success(hours);
                    });
                },
                [settle, collector, slot](const ModbusError& e) {
                    settle(collector, [&](SectionSnapshot& s) {
                        s.lampHours[slot] = Reading<LampHours>::failure(e.getMessage());
                    });
                });
        }

        readCombinedCleaningStatus(endpoint,
            [settle, collector](bool cleaning) {
                settle(collector, [&](SectionSnapshot& s) { s.cleaningStatus = Reading<bool>::success(cleaning); });
            },
            failWith(&SectionSnapshot::cleaningStatus));

        readDpsStatus(endpoint,
            [settle, collector](bool ok) {
                settle(collector, [&](SectionSnapshot& s) { s.dpsStatus = Reading<bool>::success(ok); });
            },
            failWith(&SectionSnapshot::dpsStatus));

        readPressureButton(endpoint,
            [settle, collector](bool pressed) {
                settle(collector, [&](SectionSnapshot& s) { s.pressureButton = Reading<bool>::success(pressed); });
            },
            failWith(&SectionSnapshot::pressureButton));
    }

private:
    ModbusConnectionManager& manager_;
    EventScheduler& scheduler_;
    Options options_;
    std::shared_ptr<bool> alive_;  // 析构后延迟回调（复位脉冲）不再执行

    modbus::ModbusClient client(const Endpoint& endpoint) {
        return modbus::ModbusClient(manager_, endpoint, options_.unitId);
    }

    void readBit(const Endpoint& endpoint, uint16_t address, BoolCallback onValue, ErrorCallback onError) {
        client(endpoint).readDiscreteInputs(address, 1,
            [onValue = std::move(onValue)](const std::vector<bool>& bits) { onValue(bits[0]); },
            std::move(onError));
    }

    /**
     * @brief 线圈脉冲：ON 成功后等待 resetPulseSec 再写 OFF
     */
    void pulseCoil(const Endpoint& endpoint, uint16_t coil, DoneCallback onDone, ErrorCallback onError) {
        auto alive = std::weak_ptr<bool>(alive_);
        client(endpoint).writeSingleCoil(coil, true,
            [this, alive, endpoint, coil, onDone, onError]() {
                if (alive.expired()) return;
                scheduler_.runAfter(options_.resetPulseSec, [this, alive, endpoint, coil, onDone, onError]() {
                    if (alive.expired()) return;
                    client(endpoint).writeSingleCoil(coil, false, onDone, onError);
                });
            },
            onError);
    }

    /** 快照超时：把尚未写入的读数标记为超时 */
    static void markUnsettled(SectionSnapshot& s) {
        const std::string reason = "Snapshot timed out";
        if (!s.power.ok() && s.power.error.empty()) s.power.error = reason;
        if (!s.lampsOnline.ok() && s.lampsOnline.error.empty()) s.lampsOnline.error = reason;
        if (!s.currentAmps.ok() && s.currentAmps.error.empty()) s.currentAmps.error = reason;
        if (!s.cleaningStatus.ok() && s.cleaningStatus.error.empty()) s.cleaningStatus.error = reason;
        if (!s.dpsStatus.ok() && s.dpsStatus.error.empty()) s.dpsStatus.error = reason;
        if (!s.pressureButton.ok() && s.pressureButton.error.empty()) s.pressureButton.error = reason;
        for (auto& lamp : s.lampHours) {
            if (!lamp.ok() && lamp.error.empty()) lamp.error = reason;
        }
    }
};

}  // namespace uv
