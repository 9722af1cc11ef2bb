// mimalloc: 全局替换 new/delete，必须在所有其他 include 之前
#include <mimalloc-new-delete.h>

// Utils
#include "common/utils/LoggerManager.hpp"
#include "common/utils/ConfigManager.hpp"
#include "common/utils/ExceptionHandler.hpp"

// Storage
#include "common/storage/FileStorage.hpp"

// Network
#include "common/network/ModbusLinkServer.hpp"

// Controllers - Meter Module
#include "modules/meter/Meter.Controller.hpp"
#include "modules/meter/Meter.Service.hpp"

using namespace drogon;

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
 * @brief 根据失败阶段返回排查提示
 */
std::vector<std::string> getStageHints(const std::string& stage) {
    if (stage == "storage:open") {
        return {
            "custom_config.storage.image_path 所在目录是否可写",
            "已有镜像文件尺寸是否与 capacity 一致",
        };
    }
    if (stage == "meter:initialize") {
        return {
            "器件容量是否足以容纳配置页与三个历史缓冲",
            "镜像文件是否被其他进程占用",
        };
    }
    if (stage == "modbus:listen") {
        return {
            "custom_config.modbus.port 是否被占用",
            "监听地址是否为本机有效地址",
        };
    }
    return {};
}

/**
 * @brief 周期任务：异常只记日志，下个周期重试
 */
template<typename Fn>
void runTick(const char* name, Fn&& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        LOG_ERROR << "[Meter] " << name << " failed: " << e.what();
    }
}

/**
 * @brief 服务器启动回调
 */
void onServerStarted() {
    const auto& settings = ConfigManager::settings();

    auto listeners = app().getListeners();
    std::cout << "Flowmeter started" << std::endl;
    for (const auto& addr : listeners) {
        std::cout << "  -> http://" << addr.toIpPort() << std::endl;
        LOG_INFO << "Diagnostics listening on http://" << addr.toIpPort();
    }
    std::cout << "Logs: ./logs/flowmeter_*.log" << std::endl;

    std::string stage = "startup:init";
    try {
        stage = "storage:open";
        LOG_INFO << "[Startup] " << stage;
        fs::path imagePath(settings.imagePath);
        if (imagePath.has_parent_path()) {
            fs::create_directories(imagePath.parent_path());
        }
        auto device = std::make_unique<FileStorage>(settings.imagePath, settings.storageCapacity);

        stage = "meter:initialize";
        LOG_INFO << "[Startup] " << stage;
        MeterService::Settings meterSettings;
        meterSettings.defaultSlaveAddress = settings.defaultSlaveAddress;
        MeterService::instance().initialize(
            std::move(device),
            std::make_unique<SystemClock>(),
            std::make_unique<SimulatedFlowSource>(settings.simulatedFlowLpm),
            meterSettings);

        stage = "timers:schedule";
        LOG_INFO << "[Startup] " << stage;
        auto* loop = app().getLoop();
        loop->runEvery(static_cast<double>(settings.sampleIntervalSec), []() {
            runTick("sample", [] { MeterService::instance().sampleTick(); });
        });
        loop->runEvery(static_cast<double>(settings.persistIntervalSec), []() {
            runTick("persist", [] { MeterService::instance().persistTick(); });
        });
        loop->runEvery(static_cast<double>(settings.optionsSaveIntervalSec), []() {
            runTick("options-save", [] { MeterService::instance().optionsSaveTick(); });
        });

        stage = "modbus:listen";
        LOG_INFO << "[Startup] " << stage;
        ModbusLinkServer::instance().start(loop, settings.modbusAddress, settings.modbusPort,
            [](const std::vector<uint8_t>& frame) {
                return MeterService::instance().handleModbusFrame(frame);
            });

        LOG_INFO << "[Startup] bootstrap completed";
    } catch (const std::exception& e) {
        printStartupError("启动阶段失败: " + stage, e.what(), getStageHints(stage));
        app().getLoop()->queueInLoop([]() {
            app().quit();
        });
    }
}

/**
 * @brief 服务器退出回调：停止链路，落盘当前桶和累计计数
 */
void onServerStopping() {
    LOG_INFO << "Server is stopping, flushing meter state...";

    ModbusLinkServer::instance().stop();

    if (MeterService::instance().isInitialized()) {
        runTick("persist", [] { MeterService::instance().persistTick(); });
        runTick("options-save", [] { MeterService::instance().optionsSaveTick(); });
    }

    LOG_INFO << "Meter state flushed";
    LoggerManager::close();
}

int main() {
    // 0. 验证 mimalloc 已激活
    int v = mi_version();
    std::cout << "mimalloc v" << (v / 100) << "." << (v % 100) << " active" << std::endl;

    // 1. 初始化日志系统（AsyncFileLogger 异步写盘 + 按日期轮转）
    LoggerManager::initialize("./logs");

    // 2. 加载并验证配置文件（失败时 ConfigManager 已输出详细错误）
    if (!ConfigManager::load()) {
        std::cerr << "Startup aborted due to configuration errors." << std::endl;
        return 1;
    }

    // 3. 应用配置
    if (!LoggerManager::setLogLevel(ConfigManager::getLogLevel())) {
        LOG_WARN << "[Config] Unknown log_level '" << ConfigManager::getLogLevel() << "', using INFO";
    }
    LoggerManager::setConsoleEcho(ConfigManager::isConsoleLogEnabled());

    // 4. 设置全局异常处理
    AppExceptionHandler::setup();

    // 5. 注册启动回调
    app().registerBeginningAdvice([]() {
        onServerStarted();
    });

    // 6. 启动服务器
    app().run();

    // 7. 服务器退出后清理资源
    onServerStopping();

    return 0;
}
