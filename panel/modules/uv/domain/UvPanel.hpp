#pragma once

#include "common/network/EndpointState.hpp"
#include "common/utils/Constants.hpp"

#include <json/json.h>

#include <array>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>

namespace uv {

/**
 * @brief 面板区段（一台 PLC）
 */
struct PanelSection {
    std::string name;
    std::string ip;
    uint16_t port = Constants::MODBUS_DEFAULT_PORT;

    Endpoint endpoint() const { return Endpoint{ip, port}; }
};

/**
 * @brief 单根灯管的运行小时
 *
 * maxHours 读取失败时回退为 DEFAULT_MAX_LAMP_HOURS，maxFromDevice = false
 */
struct LampHours {
    uint16_t currentHours = 0;
    uint16_t maxHours = Constants::DEFAULT_MAX_LAMP_HOURS;
    bool maxFromDevice = false;

    /** 剩余寿命百分比（0-100） */
    double remainingPercent() const {
        if (maxHours == 0 || currentHours >= maxHours) return 0.0;
        return 100.0 * static_cast<double>(maxHours - currentHours) / maxHours;
    }
};

/**
 * @brief 快照中的单项读数：成功为值，失败为原因
 */
template<typename T>
struct Reading {
    std::optional<T> value;
    std::string error;

    bool ok() const { return value.has_value(); }

    static Reading success(T v) {
        Reading r;
        r.value = std::move(v);
        return r;
    }

    static Reading failure(std::string reason) {
        Reading r;
        r.error = std::move(reason);
        return r;
    }
};

/**
 * @brief 单个区段的一次状态快照
 */
struct SectionSnapshot {
    std::string section;
    Endpoint endpoint;
    Reading<bool> power;
    Reading<int> lampsOnline;
    Reading<float> currentAmps;
    std::array<Reading<LampHours>, Constants::LAMP_COUNT> lampHours;
    Reading<bool> cleaningStatus;
    Reading<bool> dpsStatus;
    Reading<bool> pressureButton;

    int failureCount() const {
        int failed = 0;
        if (!power.ok()) ++failed;
        if (!lampsOnline.ok()) ++failed;
        if (!currentAmps.ok()) ++failed;
        if (!cleaningStatus.ok()) ++failed;
        if (!dpsStatus.ok()) ++failed;
        if (!pressureButton.ok()) ++failed;
        for (const auto& lamp : lampHours) {
            if (!lamp.ok()) ++failed;
        }
        return failed;
    }

    static constexpr int fieldCount() { return 6 + Constants::LAMP_COUNT; }

    /** 按读取顺序返回第一个失败原因，全部成功时为空 */
    std::string firstError() const {
        for (const std::string* error : {&power.error, &lampsOnline.error, &currentAmps.error}) {
            if (!error->empty()) return *error;
        }
        for (const auto& lamp : lampHours) {
            if (!lamp.error.empty()) return lamp.error;
        }
        for (const std::string* error : {&cleaningStatus.error, &dpsStatus.error, &pressureButton.error}) {
            if (!error->empty()) return *error;
        }
        return {};
    }

    /** 所有读数均失败视为不可达 */
    bool reachable() const { return failureCount() < fieldCount(); }

    Json::Value toJson() const {
        Json::Value json;
        json["section"] = section;
        json["endpoint"] = endpoint.toString();
        json["reachable"] = reachable();
        json["power"] = readingToJson(power, [](bool v) { return Json::Value(v); });
        json["lamps_online"] = readingToJson(lampsOnline, [](int v) { return Json::Value(v); });
        json["current_amps"] = readingToJson(currentAmps, [](float v) { return Json::Value(static_cast<double>(v)); });
        json["cleaning_status"] = readingToJson(cleaningStatus, [](bool v) { return Json::Value(v); });
        json["dps_status"] = readingToJson(dpsStatus, [](bool v) { return Json::Value(v); });
        json["pressure_button"] = readingToJson(pressureButton, [](bool v) { return Json::Value(v); });

        Json::Value lamps(Json::arrayValue);
        for (size_t i = 0; i < lampHours.size(); ++i) {
            Json::Value lamp = readingToJson(lampHours[i], [](const LampHours& h) {
                Json::Value v;
                v["current_hours"] = h.currentHours;
                v["max_hours"] = h.maxHours;
                v["max_from_device"] = h.maxFromDevice;
                v["remaining_percent"] = h.remainingPercent();
                return v;
            });
            lamp["lamp"] = static_cast<int>(i + 1);
            lamps.append(lamp);
        }
        json["lamps"] = lamps;
        return json;
    }

private:
    template<typename T, typename F>
    static Json::Value readingToJson(const Reading<T>& reading, F toValue) {
        Json::Value json;
        if (reading.ok()) {
            json["value"] = toValue(*reading.value);
        } else {
            json["error"] = reading.error;
        }
        return json;
    }
};

}  // namespace uv
