// mimalloc: 全局替换 new/delete，必须在所有其他 include 之前
#include <mimalloc-new-delete.h>

// Utils
#include "common/utils/LoggerManager.hpp"
#include "common/utils/ConfigManager.hpp"
#include "common/utils/Constants.hpp"

// Network
#include "common/network/EventScheduler.hpp"
#include "common/network/ModbusConnectionManager.hpp"
#include "common/network/ModbusSocket.hpp"

// UV Module
#include "modules/uv/UvPanel.Service.hpp"

#include <trantor/net/EventLoopThread.h>

// ─── 启动错误输出 ──────────────────────────────────────────

/**
 * @brief 输出启动阶段错误到控制台和日志
 */
void printStartupError(const std::string& title, const std::string& detail,
                       const std::vector<std::string>& hints = {}) {
    std::string border(60, '=');
    std::cerr << "\n" << border << "\n";
    std::cerr << " [ERROR] " << title << "\n";
    std::cerr << std::string(60, '-') << "\n";
    std::cerr << "  " << detail << "\n";
    if (!hints.empty()) {
        std::cerr << "\n  请检查:\n";
        for (const auto& hint : hints) {
            std::cerr << "    - " << hint << "\n";
        }
    }
    std::cerr << border << "\n" << std::endl;

    LOG_FATAL << "[Startup] " << title << ": " << detail;
}

/**
 * @brief 在事件循环线程执行 fn 并等待完成
 */
template<typename Fn>
void runInLoopAndWait(trantor::EventLoop* loop, Fn&& fn) {
    std::promise<void> done;
    auto future = done.get_future();
    loop->runInLoop([&]() {
        fn();
        done.set_value();
    });
    future.wait();
}

/**
 * @brief 不可达区段的排查提示
 */
std::vector<std::string> getUnreachableHints(const uv::PanelSection& section) {
    return {
        "PLC 是否上电并接入网络",
        "config 中 sections 的 ip/port 是否正确（当前 " + section.endpoint().toString() + "）",
        "PLC 是否开启 Modbus TCP 服务（默认端口 502）",
        "防火墙是否放行了该端口",
    };
}

int main(int argc, char* argv[]) {
    // 0. 验证 mimalloc 已激活
    int v = mi_version();
    std::cout << "mimalloc v" << (v / 100) << "." << (v % 100) << " active" << std::endl;

    // 1. 初始化日志系统（配置加载前先写默认目录）
    LoggerManager::initialize(Constants::LOG_DEFAULT_DIR);

    // 2. 加载并验证配置文件（失败时 ConfigManager 已输出详细错误）
    std::optional<std::string> configPath;
    if (argc > 1) configPath = argv[1];
    if (!ConfigManager::load(configPath)) {
        std::cerr << "Probe aborted due to configuration errors." << std::endl;
        LoggerManager::close();
        return 1;
    }

    // 3. 应用日志配置
    if (ConfigManager::getLogDir() != Constants::LOG_DEFAULT_DIR || ConfigManager::isConsoleLogEnabled()) {
        LoggerManager::close();
        LoggerManager::initialize(ConfigManager::getLogDir(), ConfigManager::isConsoleLogEnabled());
    }
    LoggerManager::setLogLevel(ConfigManager::getLogLevel());

    const auto& sections = ConfigManager::getSections();
    std::string stage = "startup:init";
    int exitCode = 0;

    try {
        stage = "loop:start";
        LOG_INFO << "[Startup] " << stage;
        trantor::EventLoopThread loopThread("ModbusLoop");
        loopThread.run();
        trantor::EventLoop* loop = loopThread.getLoop();

        LoopScheduler scheduler(loop);
        TrantorSocketFactory socketFactory(loop);
        std::unique_ptr<ModbusConnectionManager> manager;
        std::unique_ptr<uv::UvPanelService> service;

        stage = "modbus:init";
        LOG_INFO << "[Startup] " << stage;
        runInLoopAndWait(loop, [&]() {
            manager = std::make_unique<ModbusConnectionManager>(
                scheduler, socketFactory, ConfigManager::getConnectionOptions());

            uv::UvPanelService::Options options;
            options.unitId = ConfigManager::getUnitId();
            options.resetPulseSec = ConfigManager::getResetPulseSec();
            options.snapshotTimeoutSec = ConfigManager::getSnapshotTimeoutSec();
            service = std::make_unique<uv::UvPanelService>(*manager, scheduler, options);

            manager->onError([](const std::string& host, uint16_t port, const modbus::ModbusError& error) {
                LOG_WARN << "[Startup] " << host << ":" << port << " "
                         << modbus::errorKindToString(error.kind()) << " (" << error.getCode() << "): "
                         << error.getMessage();
            });
        });

        stage = "sections:snapshot";
        LOG_INFO << "[Startup] " << stage << " (" << sections.size() << " section(s))";

        auto results = std::make_shared<std::vector<uv::SectionSnapshot>>();
        auto allDone = std::make_shared<std::promise<void>>();
        auto allDoneFuture = allDone->get_future();

        runInLoopAndWait(loop, [&]() {
            for (const auto& section : sections) {
                service->readSectionSnapshot(section,
                    [results, allDone, total = sections.size()](const uv::SectionSnapshot& snapshot) {
                        results->push_back(snapshot);
                        if (results->size() == total) allDone->set_value();
                    });
            }
        });

        // 每个快照都有整体超时兜底，这里只防止循环线程异常卡死
        auto waitLimit = std::chrono::duration<double>(ConfigManager::getSnapshotTimeoutSec() + 5.0);
        if (allDoneFuture.wait_for(waitLimit) != std::future_status::ready) {
            printStartupError("区段快照未完成", "等待超过 "
                + std::to_string(static_cast<int>(waitLimit.count())) + " 秒");
            exitCode = 3;
        }

        stage = "modbus:close";
        LOG_INFO << "[Startup] " << stage;
        std::vector<uv::SectionSnapshot> snapshots;
        runInLoopAndWait(loop, [&]() {
            manager->closeAll();
            snapshots = *results;
            service.reset();
            manager.reset();
        });

        // 4. 输出结果
        Json::Value report(Json::arrayValue);
        for (const auto& section : sections) {
            auto it = std::find_if(snapshots.begin(), snapshots.end(),
                [&](const uv::SectionSnapshot& s) {
                    return s.section == section.name && s.endpoint == section.endpoint();
                });
            if (it == snapshots.end()) continue;

            report.append(it->toJson());
            if (!it->reachable()) {
                printStartupError("区段不可达: " + section.name,
                                  it->firstError() + " (" + std::to_string(it->failureCount()) + "/"
                                      + std::to_string(uv::SectionSnapshot::fieldCount()) + " 项失败)",
                                  getUnreachableHints(section));
                if (exitCode == 0) exitCode = 2;
            } else {
                LOG_INFO << "[Startup] " << section.name << " ok, "
                         << it->failureCount() << " failed field(s)";
            }
        }

        Json::StreamWriterBuilder writer;
        writer["indentation"] = "  ";
        std::cout << Json::writeString(writer, report) << std::endl;
    } catch (const std::exception& e) {
        printStartupError("启动阶段失败: " + stage, e.what());
        exitCode = 1;
    }

    LOG_INFO << "[Startup] probe finished with exit code " << exitCode;
    LoggerManager::close();
    return exitCode;
}
