#pragma once

#include "Constants.hpp"
#include "common/network/EndpointState.hpp"
#include "modules/uv/domain/UvPanel.hpp"

#include <json/json.h>
#include <trantor/net/InetAddress.h>
#include <trantor/utils/Logger.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief 配置管理器 - 负责加载、验证和提供面板配置
 *
 * 启动时检查配置文件的完整性和正确性：
 * - JSON 语法检查
 * - 必填字段检查（sections）
 * - 端口、从站地址、超时范围校验
 * - 重复端点警告
 */
class ConfigManager {
public:
    /**
     * @brief 加载并验证配置文件
     * @param path 指定路径；为空时按默认位置查找
     * @return 是否成功加载，失败时已输出详细错误信息到 stderr 和日志
     */
    static bool load(const std::optional<std::string>& path = std::nullopt) {
        resetDefaults();

        auto configPath = path ? std::optional<std::string>(*path) : findConfigFile();
        if (!configPath) {
            return false;
        }

        Json::Value root;
        if (!parseConfigFile(*configPath, root)) {
            return false;
        }

        if (!applyRoot(root, *configPath)) {
            return false;
        }

        LOG_INFO << "[Config] Loaded from: " << *configPath
                 << " (" << sections_.size() << " section(s))";
        return true;
    }

    /**
     * @brief 从 JSON 文本加载（不查找文件）
     */
    static bool loadFromString(const std::string& text, const std::string& source = "<string>") {
        resetDefaults();

        Json::Value root;
        Json::CharReaderBuilder builder;
        std::string errs;
        std::istringstream iss(text);
        if (!Json::parseFromStream(builder, iss, &root, &errs)) {
            recordErrors("JSON 解析失败: " + source, {errs});
            return false;
        }
        if (!root.isObject()) {
            recordErrors("JSON 格式错误: " + source, {"配置根节点必须是 JSON 对象"});
            return false;
        }
        return applyRoot(root, source);
    }

    // ==================== 配置读取 ====================

    static const std::string& getLogLevel() { return logLevel_; }
    static const std::string& getLogDir() { return logDir_; }
    static bool isConsoleLogEnabled() { return consoleLog_; }

    static uint8_t getUnitId() { return unitId_; }
    static const ConnectionOptions& getConnectionOptions() { return connectionOptions_; }
    static double getResetPulseSec() { return resetPulseSec_; }
    static double getSnapshotTimeoutSec() { return snapshotTimeoutSec_; }
    static const std::vector<uv::PanelSection>& getSections() { return sections_; }

    /** 最近一次加载产生的错误/警告（测试与诊断用） */
    static const std::vector<std::string>& lastErrors() { return lastErrors_; }
    static const std::vector<std::string>& lastWarnings() { return lastWarnings_; }

private:
    inline static std::string logLevel_ = "INFO";
    inline static std::string logDir_ = Constants::LOG_DEFAULT_DIR;
    inline static bool consoleLog_ = false;
    inline static uint8_t unitId_ = Constants::MODBUS_DEFAULT_UNIT_ID;
    inline static ConnectionOptions connectionOptions_{};
    inline static double resetPulseSec_ = Constants::RESET_PULSE_SEC;
    inline static double snapshotTimeoutSec_ = Constants::SNAPSHOT_TIMEOUT_SEC;
    inline static std::vector<uv::PanelSection> sections_;
    inline static std::vector<std::string> lastErrors_;
    inline static std::vector<std::string> lastWarnings_;

    static void resetDefaults() {
        logLevel_ = "INFO";
        logDir_ = Constants::LOG_DEFAULT_DIR;
        consoleLog_ = false;
        unitId_ = Constants::MODBUS_DEFAULT_UNIT_ID;
        connectionOptions_ = ConnectionOptions{};
        resetPulseSec_ = Constants::RESET_PULSE_SEC;
        snapshotTimeoutSec_ = Constants::SNAPSHOT_TIMEOUT_SEC;
        sections_.clear();
        lastErrors_.clear();
        lastWarnings_.clear();
    }

    // ─── 配置文件查找 ───────────────────────────────────────────

    static std::optional<std::string> findConfigFile() {
        static const std::vector<std::string> paths = {
            "./config/config.local.json",
            "./config/config.json",
            "../config/config.json",
            "config.json"
        };

        for (const auto& path : paths) {
            if (fs::exists(path)) {
                return path;
            }
        }

        std::vector<std::string> hints = {"请在以下位置之一创建配置文件:"};
        for (const auto& p : paths) {
            hints.push_back("  - " + p);
        }
        hints.emplace_back("可参考 config/config.example.json");
        recordErrors("未找到配置文件", hints);
        return std::nullopt;
    }

    // ─── JSON 解析 ──────────────────────────────────────────────

    static bool parseConfigFile(const std::string& path, Json::Value& root) {
        std::ifstream ifs(path);
        if (!ifs) {
            recordErrors("无法打开配置文件: " + path, {"请检查文件是否存在及读取权限"});
            return false;
        }

        Json::CharReaderBuilder builder;
        std::string errs;
        if (!Json::parseFromStream(builder, ifs, &root, &errs)) {
            recordErrors("JSON 解析失败: " + path, {
                errs,
                "请检查 JSON 语法（缺少逗号、引号不匹配、尾部逗号等）"
            });
            return false;
        }

        if (!root.isObject()) {
            recordErrors("JSON 格式错误: " + path, {"配置文件根节点必须是 JSON 对象"});
            return false;
        }

        return true;
    }

    // ─── 配置验证 ──────────────────────────────────────────────

    static bool applyRoot(const Json::Value& root, const std::string& source) {
        std::vector<std::string> errors;
        std::vector<std::string> warnings;

        validateLogging(root, errors);
        validateModbus(root, errors);
        validateSections(root, errors, warnings);

        if (!warnings.empty()) {
            recordWarnings("配置警告 (" + source + ")", warnings);
        }

        if (!errors.empty()) {
            recordErrors("配置验证失败: " + source, errors);
            return false;
        }

        applyConfig(root);
        return true;
    }

    static void validateLogging(const Json::Value& root, std::vector<std::string>& errors) {
        if (root.isMember("log_level")) {
            if (!root["log_level"].isString()) {
                errors.emplace_back("[log_level] 必须是字符串");
            } else {
                static const std::set<std::string> levels = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
                const auto level = root["log_level"].asString();
                if (!levels.count(level)) {
                    errors.push_back("[log_level] 无效的日志级别: " + level
                        + "（可选: TRACE/DEBUG/INFO/WARN/ERROR/FATAL）");
                }
            }
        }
        if (root.isMember("log_dir") && (!root["log_dir"].isString() || root["log_dir"].asString().empty())) {
            errors.emplace_back("[log_dir] 必须是非空字符串");
        }
        if (root.isMember("console_log") && !root["console_log"].isBool()) {
            errors.emplace_back("[console_log] 必须是布尔值");
        }
    }

    static void validateModbus(const Json::Value& root, std::vector<std::string>& errors) {
        if (!root.isMember("modbus")) return;

        const auto& modbus = root["modbus"];
        if (!modbus.isObject()) {
            errors.emplace_back("[modbus] 必须是 JSON 对象");
            return;
        }

        if (modbus.isMember("unit_id")) {
            if (!modbus["unit_id"].isInt()) {
                errors.emplace_back("[modbus] unit_id 必须是整数");
            } else if (modbus["unit_id"].asInt() < 0 || modbus["unit_id"].asInt() > 247) {
                errors.push_back("[modbus] unit_id 值无效: " + std::to_string(modbus["unit_id"].asInt())
                    + "（有效范围: 0-247）");
            }
        }

        for (const char* field : {"request_timeout_ms", "watchdog_timeout_ms", "reconnect_base_delay_ms",
                                  "reconnect_max_delay_ms", "reset_pulse_ms", "snapshot_timeout_ms"}) {
            validatePositive(modbus, field, errors);
        }

        if (modbus.isMember("max_reconnect_attempts")) {
            if (!modbus["max_reconnect_attempts"].isInt() || modbus["max_reconnect_attempts"].asInt() < 1) {
                errors.emplace_back("[modbus] max_reconnect_attempts 必须是正整数");
            }
        }

        Json::Value baseValue = modbus.get("reconnect_base_delay_ms", Constants::RECONNECT_BASE_DELAY_SEC * 1000);
        Json::Value maxValue = modbus.get("reconnect_max_delay_ms", Constants::RECONNECT_MAX_DELAY_SEC * 1000);
        if (!baseValue.isNumeric() || !maxValue.isNumeric()) return;

        double base = baseValue.asDouble();
        double max = maxValue.asDouble();
        if (base > 0 && max > 0 && max < base) {
            errors.emplace_back("[modbus] reconnect_max_delay_ms 不能小于 reconnect_base_delay_ms");
        }
    }

    static bool isIpLiteral(const std::string& ip) {
        bool ipv6 = ip.find(':') != std::string::npos;
        return !trantor::InetAddress(ip, Constants::MODBUS_DEFAULT_PORT, ipv6).isUnspecified();
    }

    static void validateSections(const Json::Value& root,
                                 std::vector<std::string>& errors,
                                 std::vector<std::string>& warnings) {
        if (!root.isMember("sections") || !root["sections"].isArray() || root["sections"].empty()) {
            errors.emplace_back("[sections] 缺少区段配置，需要至少一个 PLC 地址");
            return;
        }

        std::set<std::string> seen;
        for (Json::ArrayIndex i = 0; i < root["sections"].size(); ++i) {
            const auto& item = root["sections"][i];
            auto prefix = "[sections[" + std::to_string(i) + "]] ";

            if (!item.isObject()) {
                errors.push_back(prefix + "必须是 JSON 对象");
                continue;
            }

            if (!item.isMember("ip") || !item["ip"].isString() || item["ip"].asString().empty()) {
                errors.push_back(prefix + "缺少 ip 字段");
                continue;
            }

            // 只接受 IPv4/IPv6 字面地址，主机名或非法地址会被 trantor 解析为 0.0.0.0
            if (!isIpLiteral(item["ip"].asString())) {
                errors.push_back(prefix + "ip 不是有效的 IPv4/IPv6 地址: " + item["ip"].asString());
                continue;
            }

            // port 可省略，默认 502
            if (item.isMember("port") && !validatePort(item, prefix, errors)) {
                continue;
            }
            if (item.isMember("name") && !item["name"].isString()) {
                errors.push_back(prefix + "name 必须是字符串");
            }

            std::string key = item["ip"].asString() + ":"
                + std::to_string(item.get("port", Constants::MODBUS_DEFAULT_PORT).asInt());
            if (!seen.insert(key).second) {
                warnings.push_back(prefix + "端点重复: " + key);
            }
        }
    }

    // ─── 配置应用 ──────────────────────────────────────────────

    static void applyConfig(const Json::Value& root) {
        logLevel_ = root.get("log_level", "INFO").asString();
        logDir_ = root.get("log_dir", Constants::LOG_DEFAULT_DIR).asString();
        consoleLog_ = root.get("console_log", false).asBool();

        if (root.isMember("modbus")) {
            const auto& modbus = root["modbus"];
            unitId_ = static_cast<uint8_t>(modbus.get("unit_id", Constants::MODBUS_DEFAULT_UNIT_ID).asInt());
            connectionOptions_.requestTimeoutSec = msToSec(modbus, "request_timeout_ms", Constants::REQUEST_TIMEOUT_SEC);
            connectionOptions_.watchdogTimeoutSec = msToSec(modbus, "watchdog_timeout_ms", Constants::WATCHDOG_TIMEOUT_SEC);
            connectionOptions_.reconnectBaseDelaySec = msToSec(modbus, "reconnect_base_delay_ms", Constants::RECONNECT_BASE_DELAY_SEC);
            connectionOptions_.reconnectMaxDelaySec = msToSec(modbus, "reconnect_max_delay_ms", Constants::RECONNECT_MAX_DELAY_SEC);
            connectionOptions_.maxReconnectAttempts = modbus.get("max_reconnect_attempts", Constants::MAX_RECONNECT_ATTEMPTS).asInt();
            resetPulseSec_ = msToSec(modbus, "reset_pulse_ms", Constants::RESET_PULSE_SEC);
            snapshotTimeoutSec_ = msToSec(modbus, "snapshot_timeout_ms", Constants::SNAPSHOT_TIMEOUT_SEC);
        }

        const auto& sections = root["sections"];
        for (Json::ArrayIndex i = 0; i < sections.size(); ++i) {
            const auto& item = sections[i];
            uv::PanelSection section;
            section.ip = item["ip"].asString();
            section.port = static_cast<uint16_t>(item.get("port", Constants::MODBUS_DEFAULT_PORT).asInt());
            section.name = item.get("name", "Section " + std::to_string(i + 1)).asString();
            sections_.push_back(std::move(section));
        }
    }

    // ─── 工具方法 ──────────────────────────────────────────────

    static double msToSec(const Json::Value& obj, const char* field, double defaultSec) {
        if (!obj.isMember(field)) return defaultSec;
        return obj[field].asDouble() / 1000.0;
    }

    static void validatePositive(const Json::Value& obj, const char* field, std::vector<std::string>& errors) {
        if (!obj.isMember(field)) return;
        if (!obj[field].isNumeric()) {
            errors.push_back(std::string("[modbus] ") + field + " 必须是数字");
        } else if (obj[field].asDouble() <= 0) {
            errors.push_back(std::string("[modbus] ") + field + " 必须大于 0");
        }
    }

    static bool validatePort(const Json::Value& obj, const std::string& prefix,
                             std::vector<std::string>& errors) {
        if (!obj.isMember("port") || !obj["port"].isInt()) {
            errors.push_back(prefix + "port 必须是整数");
            return false;
        }
        int port = obj["port"].asInt();
        if (port < 1 || port > 65535) {
            errors.push_back(prefix + "port 值无效: " +
                std::to_string(port) + "（有效范围: 1-65535）");
            return false;
        }
        return true;
    }

    static void recordErrors(const std::string& title, const std::vector<std::string>& messages) {
        lastErrors_.insert(lastErrors_.end(), messages.begin(), messages.end());
        printErrors(title, messages);
    }

    static void recordWarnings(const std::string& title, const std::vector<std::string>& messages) {
        lastWarnings_.insert(lastWarnings_.end(), messages.begin(), messages.end());
        printWarnings(title, messages);
    }

    static void printErrors(const std::string& title, const std::vector<std::string>& messages) {
        std::string border(60, '=');
        std::cerr << "\n" << border << "\n";
        std::cerr << " [ERROR] " << title << "\n";
        std::cerr << std::string(60, '-') << "\n";
        for (const auto& msg : messages) {
            std::cerr << "  " << msg << "\n";
            LOG_ERROR << "[Config] " << msg;
        }
        std::cerr << border << "\n" << std::endl;
    }

    static void printWarnings(const std::string& title, const std::vector<std::string>& messages) {
        std::cerr << "\n" << std::string(60, '-') << "\n";
        std::cerr << " [WARN] " << title << "\n";
        for (const auto& msg : messages) {
            std::cerr << "  " << msg << "\n";
            LOG_WARN << "[Config] " << msg;
        }
        std::cerr << std::string(60, '-') << "\n" << std::endl;
    }
};
