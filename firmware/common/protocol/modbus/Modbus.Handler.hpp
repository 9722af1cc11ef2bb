#pragma once

#include "Modbus.Types.hpp"
#include "Modbus.Utils.hpp"

#include "modules/options/Options.Service.hpp"

namespace modbus {

/** 实时流量遥测（Modbus 浮点寄存器的数据源） */
struct FlowTelemetry {
    float flowRate = 0.0f;   // L/min
    float hourFlow = 0.0f;   // 本小时累计（L）
    float dayFlow = 0.0f;
    float monthFlow = 0.0f;
};

/**
 * @brief 寄存器映射
 *
 * 保持寄存器 0x0000-0x001F  配置记录字节 0-63 的逐字节镜像（可读写）
 * 保持寄存器 0x0064-0x006B  flow_rate, hour_flow, day_flow, month_flow（只读，float 大端）
 * 输入寄存器 0x0000-0x0007  同上四个浮点
 */
namespace RegisterMap {
    inline constexpr uint16_t OPTIONS_START = 0x0000;
    inline constexpr uint16_t OPTIONS_COUNT = 0x20;
    inline constexpr uint16_t HOLDING_TELEMETRY_START = 0x0064;
    inline constexpr uint16_t INPUT_TELEMETRY_START = 0x0000;
    inline constexpr uint16_t TELEMETRY_COUNT = 8;

    inline constexpr uint16_t MAX_READ_QUANTITY = 125;
    inline constexpr uint16_t MAX_WRITE_QUANTITY = 123;

    static_assert(OPTIONS_COUNT * 2 <= ConfigRecord::SIZE, "mirrored registers exceed ConfigRecord");

    /** [start, start+quantity) 是否完全落在 [base, base+count) 内 */
    inline bool within(uint16_t start, uint16_t quantity, uint16_t base, uint16_t count) {
        return start >= base && static_cast<uint32_t>(start) + quantity <= static_cast<uint32_t>(base) + count;
    }
}

/**
 * @brief Modbus RTU 从站处理器
 *
 * 一帧进、至多一帧出：
 * - 传输层错误（长度/地址/CRC）丢弃不回复
 * - 协议层错误回复异常帧
 * - 广播帧执行写操作但不回复
 * 写入配置失败时回复 ServerDeviceFailure，总线保持可用。
 */
class ModbusHandler {
public:
    using TelemetryProvider = std::function<FlowTelemetry()>;

    struct Stats {
        uint64_t requests = 0;
        uint64_t exceptions = 0;
        uint64_t transportErrors = 0;
        uint64_t broadcasts = 0;
    };

private:
    OptionsService& options_;
    TelemetryProvider telemetry_;
    uint8_t defaultSlaveAddress_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> exceptions_{0};
    std::atomic<uint64_t> transportErrors_{0};
    std::atomic<uint64_t> broadcasts_{0};

public:
    ModbusHandler(OptionsService& options, TelemetryProvider telemetry, uint8_t defaultSlaveAddress = 1)
        : options_(options)
        , telemetry_(std::move(telemetry))
        , defaultSlaveAddress_(ModbusUtils::isValidSlaveAddress(defaultSlaveAddress) ? defaultSlaveAddress : 1) {}

    /** 当前从站地址：记录中的 slave_address，非法值（0 或 >247）回退默认地址 */
    uint8_t slaveAddress() const {
        uint8_t addr = options_.snapshot().slaveAddress();
        return ModbusUtils::isValidSlaveAddress(addr) ? addr : defaultSlaveAddress_;
    }

    /**
     * @brief 处理一帧请求
     * @return 需要回复的帧；nullopt 表示不回复
     */
    std::optional<std::vector<uint8_t>> handleFrame(const uint8_t* frame, size_t len) {
        auto parsed = ModbusUtils::parseRtuRequest(frame, len, slaveAddress());

        if (parsed.error != ModbusError::None && parsed.error != ModbusError::Exception) {
            ++transportErrors_;
            LOG_DEBUG << "[Modbus] Dropped frame (" << modbusErrorToString(parsed.error) << "): "
                      << ModbusUtils::toHexString(frame, len);
            return std::nullopt;
        }

        ++requests_;
        const auto& req = parsed.request;
        if (req.isBroadcast()) {
            ++broadcasts_;
        }

        ModbusResponse resp;
        resp.slaveId = req.slaveId;
        resp.functionCode = req.functionCode;

        std::optional<ExceptionCode> exc;
        if (parsed.error == ModbusError::Exception) {
            exc = parsed.exception;
        } else {
            exc = dispatch(req, resp);
        }

        if (req.isBroadcast()) {
            return std::nullopt;
        }

        if (exc) {
            ++exceptions_;
            LOG_DEBUG << "[Modbus] FC 0x" << std::hex << static_cast<int>(req.functionCode) << std::dec
                      << " exception " << exceptionCodeToString(*exc);
            return ModbusUtils::buildException(req.slaveId, req.functionCode, *exc);
        }

        std::vector<uint8_t> out;
        if (ModbusUtils::buildRtuResponse(resp, out) != ModbusError::None) {
            ++exceptions_;
            LOG_WARN << "[Modbus] Response exceeds ADU size, FC 0x" << std::hex
                     << static_cast<int>(req.functionCode);
            return ModbusUtils::buildException(req.slaveId, req.functionCode, ExceptionCode::ServerDeviceFailure);
        }
        return out;
    }

    std::optional<std::vector<uint8_t>> handleFrame(const std::vector<uint8_t>& frame) {
        return handleFrame(frame.data(), frame.size());
    }

    Stats stats() const {
        return Stats{requests_.load(), exceptions_.load(), transportErrors_.load(), broadcasts_.load()};
    }

private:
    std::optional<ExceptionCode> dispatch(const ModbusRequest& req, ModbusResponse& resp) {
        switch (req.functionCode) {
            case FuncCodes::READ_HOLDING_REGISTERS: return readHolding(req, resp);
            case FuncCodes::READ_INPUT_REGISTERS: return readInput(req, resp);
            case FuncCodes::WRITE_SINGLE_REGISTER: return writeSingle(req, resp);
            case FuncCodes::WRITE_MULTIPLE_REGISTERS: return writeMultiple(req, resp);
            default: return ExceptionCode::IllegalFunction;
        }
    }

    // ==================== 读 ====================

    std::optional<ExceptionCode> readHolding(const ModbusRequest& req, ModbusResponse& resp) {
        using namespace RegisterMap;
        if (req.quantity < 1 || req.quantity > MAX_READ_QUANTITY) {
            return ExceptionCode::IllegalDataValue;
        }

        if (within(req.address, req.quantity, OPTIONS_START, OPTIONS_COUNT)) {
            auto record = options_.snapshot();
            size_t begin = static_cast<size_t>(req.address - OPTIONS_START) * 2;
            size_t count = static_cast<size_t>(req.quantity) * 2;
            resp.data.push_back(static_cast<uint8_t>(count));
            resp.data.insert(resp.data.end(),
                             record.bytes().begin() + begin,
                             record.bytes().begin() + begin + count);
            return std::nullopt;
        }

        if (within(req.address, req.quantity, HOLDING_TELEMETRY_START, TELEMETRY_COUNT)) {
            appendTelemetry(resp, req.address - HOLDING_TELEMETRY_START, req.quantity);
            return std::nullopt;
        }

        return ExceptionCode::IllegalDataAddress;
    }

    std::optional<ExceptionCode> readInput(const ModbusRequest& req, ModbusResponse& resp) {
        using namespace RegisterMap;
        if (req.quantity < 1 || req.quantity > MAX_READ_QUANTITY) {
            return ExceptionCode::IllegalDataValue;
        }
        if (!within(req.address, req.quantity, INPUT_TELEMETRY_START, TELEMETRY_COUNT)) {
            return ExceptionCode::IllegalDataAddress;
        }
        appendTelemetry(resp, req.address - INPUT_TELEMETRY_START, req.quantity);
        return std::nullopt;
    }

    /** 按寄存器偏移截取四个大端浮点 */
    void appendTelemetry(ModbusResponse& resp, uint16_t firstRegister, uint16_t quantity) {
        FlowTelemetry t = telemetry_ ? telemetry_() : FlowTelemetry{};
        std::vector<uint8_t> all;
        all.reserve(RegisterMap::TELEMETRY_COUNT * 2);
        ModbusUtils::appendFloat(all, t.flowRate);
        ModbusUtils::appendFloat(all, t.hourFlow);
        ModbusUtils::appendFloat(all, t.dayFlow);
        ModbusUtils::appendFloat(all, t.monthFlow);

        size_t begin = static_cast<size_t>(firstRegister) * 2;
        size_t count = static_cast<size_t>(quantity) * 2;
        resp.data.push_back(static_cast<uint8_t>(count));
        resp.data.insert(resp.data.end(), all.begin() + begin, all.begin() + begin + count);
    }

    // ==================== 写 ====================

    std::optional<ExceptionCode> writeSingle(const ModbusRequest& req, ModbusResponse& resp) {
        using namespace RegisterMap;
        if (!within(req.address, 1, OPTIONS_START, OPTIONS_COUNT)) {
            return ExceptionCode::IllegalDataAddress;
        }

        uint8_t bytes[2] = {static_cast<uint8_t>(req.value >> 8), static_cast<uint8_t>(req.value & 0xFF)};
        if (auto exc = patchOptions(req.address - OPTIONS_START, bytes, sizeof(bytes))) {
            return exc;
        }

        ModbusUtils::appendU16(resp.data, req.address);
        ModbusUtils::appendU16(resp.data, req.value);
        return std::nullopt;
    }

    std::optional<ExceptionCode> writeMultiple(const ModbusRequest& req, ModbusResponse& resp) {
        using namespace RegisterMap;
        if (req.quantity < 1 || req.quantity > MAX_WRITE_QUANTITY ||
            req.byteCount != req.quantity * 2) {
            return ExceptionCode::IllegalDataValue;
        }
        if (!within(req.address, req.quantity, OPTIONS_START, OPTIONS_COUNT)) {
            return ExceptionCode::IllegalDataAddress;
        }

        if (auto exc = patchOptions(req.address - OPTIONS_START, req.payload.data(), req.payload.size())) {
            return exc;
        }

        ModbusUtils::appendU16(resp.data, req.address);
        ModbusUtils::appendU16(resp.data, req.quantity);
        return std::nullopt;
    }

    /**
     * @brief 把寄存器数据按字节覆盖到记录副本并保存
     * 保存失败不改动内存记录，返回 ServerDeviceFailure
     */
    std::optional<ExceptionCode> patchOptions(uint16_t firstRegister, const uint8_t* data, size_t len) {
        try {
            options_.update([&](ConfigRecord& rec) {
                auto bytes = rec.bytes();
                std::memcpy(bytes.data() + static_cast<size_t>(firstRegister) * 2, data, len);
                rec = ConfigRecord::fromBytes(bytes);
            });
        } catch (const AppException& e) {
            LOG_ERROR << "[Modbus] Options write failed: " << e.what();
            return ExceptionCode::ServerDeviceFailure;
        } catch (const std::exception& e) {
            LOG_ERROR << "[Modbus] Options write failed: " << e.what();
            return ExceptionCode::ServerDeviceFailure;
        }
        LOG_INFO << "[Modbus] Options registers 0x" << std::hex << firstRegister
                 << std::dec << " +" << len / 2 << " written";
        return std::nullopt;
    }
};

}  // namespace modbus
