#pragma once

#include "modules/meter/DeviceLayout.hpp"

namespace fs = std::filesystem;

/**
 * @brief 配置管理器 - 负责加载、验证和管理应用配置
 *
 * 启动时检查配置文件的完整性和正确性：
 * - JSON 语法检查
 * - 必填字段检查（listeners、custom_config.storage、custom_config.modbus）
 * - 端口范围、从站地址、采样周期合法性校验
 * - 器件容量必须容纳整个存储布局
 */
class ConfigManager {
public:
    /** custom_config 中与仪表运行相关的参数 */
    struct Settings {
        std::string imagePath = "./data/eeprom.bin";
        uint32_t storageCapacity = DeviceLayout::DEFAULT_CAPACITY;

        std::string modbusAddress = "0.0.0.0";
        uint16_t modbusPort = 5020;
        uint8_t defaultSlaveAddress = 1;

        uint32_t sampleIntervalSec = 1;
        uint32_t persistIntervalSec = 60;
        uint32_t optionsSaveIntervalSec = 600;
        float simulatedFlowLpm = 0.0f;
    };

    /**
     * @brief 加载并验证配置文件
     * @return 是否成功加载，失败时已输出详细错误信息到 stderr 和日志
     */
    static bool load() {
        // 每次加载前重置为默认值，避免读取失败时沿用旧值
        settings_ = Settings{};

        // 1. 查找配置文件
        auto configPath = findConfigFile();
        if (!configPath) {
            return false;
        }

        // 2. 解析 JSON
        Json::Value root;
        if (!parseConfigFile(*configPath, root)) {
            return false;
        }

        // 3. 验证配置
        if (!validateConfig(root, *configPath)) {
            return false;
        }

        // 4. 提取自定义配置
        applyConfig(root);

        // 5. 加载到 Drogon 框架
        try {
            drogon::app().loadConfigFile(*configPath);
        } catch (const std::exception& e) {
            printErrors("Drogon 加载配置失败", {e.what()});
            return false;
        }

        LOG_INFO << "Config loaded from: " << *configPath;
        return true;
    }

    /**
     * @brief 获取日志级别配置
     */
    static std::string getLogLevel() {
        auto& config = drogon::app().getCustomConfig();
        return config.get("log_level", "INFO").asString();
    }

    /**
     * @brief 获取是否启用控制台日志
     */
    static bool isConsoleLogEnabled() {
        auto& config = drogon::app().getCustomConfig();
        return config.get("console_log", false).asBool();
    }

    static const Settings& settings() {
        return settings_;
    }

    /**
     * @brief 校验 JSON 根节点（供测试和 load 使用）
     * @param errors 阻断启动的错误
     * @param warnings 不阻断启动的警告
     */
    static void collectIssues(const Json::Value& root,
                              std::vector<std::string>& errors,
                              std::vector<std::string>& warnings) {
        validateListeners(root, errors);
        validateCustomConfig(root, errors, warnings);
    }

private:
    inline static Settings settings_;

    // ─── 配置文件查找 ───────────────────────────────────────────

    static std::optional<std::string> findConfigFile() {
        static const std::vector<std::string> paths = {
            "./config/config.local.json",
            "../config/config.local.json",
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
        printErrors("未找到配置文件", hints);
        return std::nullopt;
    }

    // ─── JSON 解析 ──────────────────────────────────────────────

    static bool parseConfigFile(const std::string& path, Json::Value& root) {
        std::ifstream ifs(path);
        if (!ifs) {
            printErrors("无法打开配置文件: " + path, {"请检查文件是否存在及读取权限"});
            return false;
        }

        Json::CharReaderBuilder builder;
        std::string errs;
        if (!Json::parseFromStream(builder, ifs, &root, &errs)) {
            printErrors("JSON 解析失败: " + path, {
                errs,
                "请检查 JSON 语法（缺少逗号、引号不匹配、尾部逗号等）"
            });
            return false;
        }

        if (!root.isObject()) {
            printErrors("JSON 格式错误: " + path, {"配置文件根节点必须是 JSON 对象"});
            return false;
        }

        return true;
    }

    // ─── 配置验证 ──────────────────────────────────────────────

    static bool validateConfig(const Json::Value& root, const std::string& path) {
        std::vector<std::string> errors;
        std::vector<std::string> warnings;

        collectIssues(root, errors, warnings);

        // 先输出警告（不阻断启动）
        if (!warnings.empty()) {
            printWarnings("配置警告 (" + path + ")", warnings);
        }

        // 有错误则中断启动
        if (!errors.empty()) {
            printErrors("配置验证失败: " + path, errors);
            return false;
        }

        return true;
    }

    static void validateListeners(const Json::Value& root, std::vector<std::string>& errors) {
        if (!root.isMember("listeners") || !root["listeners"].isArray() || root["listeners"].empty()) {
            errors.emplace_back("[listeners] 缺少监听配置，需要至少一个监听地址");
            return;
        }

        for (Json::ArrayIndex i = 0; i < root["listeners"].size(); ++i) {
            const auto& item = root["listeners"][i];
            auto prefix = "[listeners[" + std::to_string(i) + "]] ";

            if (!item.isMember("address") || !item["address"].isString() ||
                item["address"].asString().empty()) {
                errors.push_back(prefix + "缺少 address 字段");
            }

            validatePort(item, prefix, errors);
        }
    }

    static void validateCustomConfig(const Json::Value& root,
                                     std::vector<std::string>& errors,
                                     std::vector<std::string>& warnings) {
        if (!root.isMember("custom_config") || !root["custom_config"].isObject()) {
            errors.emplace_back("[custom_config] 缺少自定义配置节");
            return;
        }
        const auto& custom = root["custom_config"];

        // storage
        if (!custom.isMember("storage") || !custom["storage"].isObject()) {
            errors.emplace_back("[custom_config.storage] 缺少存储器配置");
        } else {
            const auto& storage = custom["storage"];
            if (!storage.isMember("image_path") || !storage["image_path"].isString() ||
                storage["image_path"].asString().empty()) {
                errors.emplace_back("[storage] 缺少 image_path 字段");
            }
            if (storage.isMember("capacity")) {
                if (!storage["capacity"].isUInt()) {
                    errors.emplace_back("[storage] capacity 必须是非负整数");
                } else {
                    auto required = DeviceLayout::build().highWaterMark();
                    if (storage["capacity"].asUInt() < required) {
                        errors.push_back("[storage] capacity 过小: " +
                            std::to_string(storage["capacity"].asUInt()) +
                            "（存储布局至少需要 " + std::to_string(required) + " 字节）");
                    }
                }
            }
        }

        // modbus
        if (!custom.isMember("modbus") || !custom["modbus"].isObject()) {
            errors.emplace_back("[custom_config.modbus] 缺少 Modbus 配置");
        } else {
            const auto& modbus = custom["modbus"];
            validatePort(modbus, "[modbus] ", errors);
            if (modbus.isMember("default_slave_address")) {
                int addr = modbus["default_slave_address"].asInt();
                if (addr < 1 || addr > 247) {
                    errors.push_back("[modbus] default_slave_address 值无效: " +
                        std::to_string(addr) + "（有效范围: 1-247）");
                }
            }
            if (!modbus.isMember("address")) {
                warnings.emplace_back("[modbus] 未指定 address，默认监听 0.0.0.0");
            }
        }

        // meter
        if (custom.isMember("meter")) {
            const auto& meter = custom["meter"];
            for (const char* field : {"sample_interval_sec", "persist_interval_sec", "options_save_interval_sec"}) {
                if (meter.isMember(field) && (!meter[field].isNumeric() || meter[field].asInt() <= 0)) {
                    errors.push_back(std::string("[meter] ") + field + " 必须大于 0");
                }
            }
            if (meter.isMember("persist_interval_sec") && meter.isMember("sample_interval_sec") &&
                meter["persist_interval_sec"].asInt() < meter["sample_interval_sec"].asInt()) {
                warnings.emplace_back("[meter] persist_interval_sec 小于 sample_interval_sec，历史写入将比采样更频繁");
            }
        } else {
            warnings.emplace_back("[custom_config.meter] 未配置，使用默认采样周期");
        }
    }

    // ─── 配置应用 ──────────────────────────────────────────────

    static void applyConfig(const Json::Value& root) {
        const auto& custom = root["custom_config"];

        const auto& storage = custom["storage"];
        settings_.imagePath = storage.get("image_path", settings_.imagePath).asString();
        settings_.storageCapacity = storage.get("capacity", settings_.storageCapacity).asUInt();

        const auto& modbus = custom["modbus"];
        settings_.modbusAddress = modbus.get("address", settings_.modbusAddress).asString();
        settings_.modbusPort = static_cast<uint16_t>(modbus["port"].asUInt());
        settings_.defaultSlaveAddress = static_cast<uint8_t>(
            modbus.get("default_slave_address", settings_.defaultSlaveAddress).asUInt());

        if (custom.isMember("meter")) {
            const auto& meter = custom["meter"];
            settings_.sampleIntervalSec = meter.get("sample_interval_sec", settings_.sampleIntervalSec).asUInt();
            settings_.persistIntervalSec = meter.get("persist_interval_sec", settings_.persistIntervalSec).asUInt();
            settings_.optionsSaveIntervalSec =
                meter.get("options_save_interval_sec", settings_.optionsSaveIntervalSec).asUInt();
            settings_.simulatedFlowLpm = meter.get("simulated_flow_lpm", settings_.simulatedFlowLpm).asFloat();
        }
    }

    // ─── 工具方法 ──────────────────────────────────────────────

    static void validatePort(const Json::Value& obj, const std::string& prefix,
                             std::vector<std::string>& errors) {
        if (!obj.isMember("port") || !obj["port"].isNumeric()) {
            errors.push_back(prefix + "缺少 port 字段");
        } else {
            int port = obj["port"].asInt();
            if (port < 1 || port > 65535) {
                errors.push_back(prefix + "port 值无效: " +
                    std::to_string(port) + "（有效范围: 1-65535）");
            }
        }
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
