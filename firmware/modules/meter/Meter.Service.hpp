#pragma once

#include "Clock.hpp"
#include "DeviceLayout.hpp"
#include "FlowSource.hpp"
#include "FlowTotalizer.hpp"
#include "common/protocol/modbus/Modbus.hpp"
#include "modules/history/History.Service.hpp"
#include "modules/options/Options.Service.hpp"

/**
 * @brief 仪表运行服务（单例）
 *
 * 组装存储器、配置、历史缓冲、流量积算与 Modbus 寄存器映射，并提供周期任务入口：
 * - sampleTick        采样并积算，跨桶时立即把旧桶写入历史
 * - persistTick       把当前桶写入历史
 * - optionsSaveTick   有未保存的累计计数时保存配置页
 *
 * 锁顺序：stateMutex_ → OptionsService → SharedStorage
 */
class MeterService {
public:
    struct Settings {
        uint8_t defaultSlaveAddress = 1;
    };

private:
    std::unique_ptr<SharedStorage> storage_;
    std::unique_ptr<Clock> clock_;
    std::unique_ptr<FlowSource> source_;
    std::unique_ptr<modbus::ModbusHandler> modbus_;
    StorageLayout layout_;
    OptionsService options_;
    history::HistoryService history_;

    FlowTotalizer totalizer_;
    double pendingLitres_ = 0.0;
    uint32_t bootTime_ = 0;
    mutable std::mutex stateMutex_;
    std::atomic<bool> initialized_{false};

public:
    static MeterService& instance() {
        static MeterService inst;
        return inst;
    }

    /**
     * @brief 启动：校验布局、载入配置、打开历史缓冲、恢复当前桶
     * @throws AppException 布局非法或存储器不可用
     */
    void initialize(std::unique_ptr<ByteStorage> device,
                    std::unique_ptr<Clock> clock,
                    std::unique_ptr<FlowSource> source,
                    const Settings& settings) {
        std::lock_guard<std::mutex> lock(stateMutex_);

        layout_ = DeviceLayout::buildValidated(device->capacity());
        LOG_INFO << "[Meter] Storage layout (" << device->capacity() << " B device):\n" << layout_.describe();

        storage_ = std::make_unique<SharedStorage>(std::move(device));
        clock_ = std::move(clock);
        source_ = std::move(source);

        options_.initialize(*storage_, settings.defaultSlaveAddress);
        history_.open(*storage_, layout_);

        bootTime_ = clock_->now();
        totalizer_ = FlowTotalizer(options_.snapshot().negativeFlowEnabled());
        pendingLitres_ = 0.0;
        restoreBuckets(bootTime_);

        modbus_ = std::make_unique<modbus::ModbusHandler>(
            options_, [this]() { return telemetry(); }, settings.defaultSlaveAddress);

        initialized_ = true;
        LOG_INFO << "[Meter] Ready, Modbus slave address " << static_cast<int>(modbus_->slaveAddress());
    }

    bool isInitialized() const { return initialized_; }

    // ==================== 周期任务 ====================

    void sampleTick() {
        ensureInitialized();
        float lpm = source_->sampleLpm();
        uint32_t now = clock_->now();

        std::lock_guard<std::mutex> lock(stateMutex_);
        totalizer_.setNegativeEnabled(options_.snapshot().negativeFlowEnabled());
        auto result = totalizer_.sample(lpm, now);

        for (const auto& closed : result.closed) {
            history_.record(closed.kind, toBucketValue(closed.litres), closed.start);
            LOG_DEBUG << "[Meter] Closed " << history::historyKindToString(closed.kind)
                      << " bucket " << closed.start << ": " << closed.litres << " L";
        }

        updateCounters(result);
    }

    void persistTick() {
        ensureInitialized();
        std::lock_guard<std::mutex> lock(stateMutex_);
        for (auto kind : history::HistoryService::ALL_KINDS) {
            const auto& b = totalizer_.bucket(kind);
            if (!b.active) continue;
            history_.record(kind, toBucketValue(b.litres), b.start);
        }
    }

    bool optionsSaveTick() {
        ensureInitialized();
        bool saved = options_.persist();
        if (saved) {
            LOG_DEBUG << "[Meter] Usage counters saved";
        }
        return saved;
    }

    // ==================== Modbus ====================

    std::optional<std::vector<uint8_t>> handleModbusFrame(const std::vector<uint8_t>& frame) {
        ensureInitialized();
        return modbus_->handleFrame(frame);
    }

    // ==================== 查询 ====================

    modbus::FlowTelemetry telemetry() const {
        std::lock_guard<std::mutex> lock(stateMutex_);
        return totalizer_.telemetry();
    }

    Json::Value getStatus() const {
        ensureInitialized();
        auto t = telemetry();
        auto rec = options_.snapshot();
        auto stats = modbus_->stats();

        Json::Value data;
        data["flow_rate"] = t.flowRate;
        data["hour_flow"] = t.hourFlow;
        data["day_flow"] = t.dayFlow;
        data["month_flow"] = t.monthFlow;

        Json::Value counters;
        counters["uptime"] = rec.uptime();
        counters["total"] = rec.total();
        counters["hour_total"] = rec.hourTotal();
        counters["day_total"] = rec.dayTotal();
        counters["month_total"] = rec.monthTotal();
        counters["rest"] = rec.rest();
        data["counters"] = counters;

        Json::Value modbus;
        modbus["slave_address"] = modbus_->slaveAddress();
        modbus["requests"] = static_cast<Json::UInt64>(stats.requests);
        modbus["exceptions"] = static_cast<Json::UInt64>(stats.exceptions);
        modbus["transport_errors"] = static_cast<Json::UInt64>(stats.transportErrors);
        modbus["broadcasts"] = static_cast<Json::UInt64>(stats.broadcasts);
        data["modbus"] = modbus;

        data["config_source"] = pageSourceToString(options_.bootLoad().source);
        data["config_status"] = pageStatusToString(options_.bootLoad().status);
        data["boot_time"] = bootTime_;
        return data;
    }

    Json::Value getOptions() const {
        ensureInitialized();
        auto rec = options_.snapshot();

        Json::Value data;
        data["crc"] = rec.crc();
        data["serial_number"] = rec.serialNumber();
        data["sensor_type"] = rec.sensorType();
        data["tdc1000_regs"] = blobToHex(rec.tdc1000Regs());
        data["tdc7200_regs"] = blobToHex(rec.tdc7200Regs());

        Json::Value zero(Json::arrayValue);
        for (size_t i = 0; i < 2; ++i) {
            zero.append(rec.zeroOffset(i));
        }
        data["zero"] = zero;

        Json::Value velocity(Json::arrayValue);
        Json::Value kFactor(Json::arrayValue);
        for (size_t i = 0; i < ConfigRecord::COEFFICIENT_COUNT; ++i) {
            velocity.append(rec.velocityCoefficient(i));
            kFactor.append(rec.kFactor(i));
        }
        data["velocity"] = velocity;
        data["k_factor"] = kFactor;

        data["enable_negative"] = rec.enableNegative();
        data["slave_address"] = rec.slaveAddress();
        data["comm_type"] = rec.commType();
        data["modbus_mode"] = rec.modbusMode();
        return data;
    }

    /** @throws NotFoundException 该时刻没有记录 */
    Json::Value getHistoryAt(history::HistoryKind kind, uint32_t time) {
        ensureInitialized();
        auto value = history_.find(kind, time);
        if (!value) {
            throw NotFoundException(std::string(history::historyKindToString(kind)) +
                                    " 历史中不存在时刻 " + std::to_string(time));
        }

        Json::Value data;
        data["kind"] = history::historyKindToString(kind);
        data["time"] = history_.bucketTimeOf(kind, time)
                           .value_or(history::RingHistoryStore::quantize(time));
        data["value"] = *value;
        return data;
    }

    /** @throws AppException(HISTORY_NO_RECORDS) */
    Json::Value getHistoryRange(history::HistoryKind kind) {
        ensureInitialized();
        auto r = history_.range(kind);

        Json::Value data;
        data["kind"] = history::historyKindToString(kind);
        data["size"] = r.size;
        data["capacity"] = r.capacity;
        data["element_size"] = r.elementSize;
        data["first"] = r.firstTimestamp;
        data["last"] = r.lastTimestamp;
        return data;
    }

private:
    MeterService() = default;

    void ensureInitialized() const {
        if (!initialized_) {
            throw HistoryException::Uninitialized();
        }
    }

    static int32_t toBucketValue(double litres) {
        return static_cast<int32_t>(std::lround(litres));
    }

    /** 当前桶在历史中已有值时接着累加（重启不丢本小时/本日/本月已计量） */
    void restoreBuckets(uint32_t now) {
        for (auto kind : history::HistoryService::ALL_KINDS) {
            uint32_t start = FlowTotalizer::bucketStart(now, history::geometryOf(kind).elementSize);
            if (auto value = history_.find(kind, start)) {
                totalizer_.restore(kind, start, *value);
                LOG_INFO << "[Meter] Resumed " << history::historyKindToString(kind)
                         << " bucket at " << *value << " L";
            }
        }
    }

    /** 整升计入累计量，零头留待下次 */
    void updateCounters(const FlowTotalizer::SampleResult& result) {
        pendingLitres_ += result.litres;
        auto whole = static_cast<int64_t>(pendingLitres_);
        pendingLitres_ -= static_cast<double>(whole);

        const auto& hour = totalizer_.bucket(history::HistoryKind::Hour);
        const auto& day = totalizer_.bucket(history::HistoryKind::Day);
        const auto& month = totalizer_.bucket(history::HistoryKind::Month);

        options_.modify([&](ConfigRecord& rec) {
            rec.setUptime(rec.uptime() + result.elapsedSec);
            if (whole > 0) {
                rec.setTotal(rec.total() + static_cast<uint32_t>(whole));
                if (rec.rest() > 0) {
                    auto used = static_cast<uint32_t>(whole);
                    rec.setRest(rec.rest() > used ? rec.rest() - used : 0);
                }
            } else if (whole < 0) {
                auto back = static_cast<uint32_t>(-whole);
                rec.setTotal(rec.total() > back ? rec.total() - back : 0);
            }
            rec.setHourTotal(static_cast<uint32_t>(std::max<int32_t>(0, toBucketValue(hour.litres))));
            rec.setDayTotal(static_cast<uint32_t>(std::max<int32_t>(0, toBucketValue(day.litres))));
            rec.setMonthTotal(static_cast<uint32_t>(std::max<int32_t>(0, toBucketValue(month.litres))));
        });
    }

    static std::string blobToHex(const ConfigRecord::Blob& blob) {
        return modbus::ModbusUtils::toHexString(blob.data(), blob.size());
    }
};
