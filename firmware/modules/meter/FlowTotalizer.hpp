#pragma once

#include "common/protocol/modbus/Modbus.Handler.hpp"
#include "modules/history/History.Types.hpp"

/**
 * @brief 流量积算
 *
 * 把周期性的瞬时流量（L/min）积分为体积（L），并维护小时/日/月三个当前桶。
 * 桶起点 = t - t mod elementSize，与历史缓冲的桶边界一致。
 * 跨桶时旧桶作为 closed 返回，由调用方写入历史缓冲。
 *
 * 非线程安全，由 MeterService 加锁使用。
 */
class FlowTotalizer {
public:
    struct Bucket {
        uint32_t start = 0;
        double litres = 0.0;
        bool active = false;
    };

    struct ClosedBucket {
        history::HistoryKind kind;
        uint32_t start;
        double litres;
    };

    struct SampleResult {
        uint32_t elapsedSec = 0;
        double litres = 0.0;
        std::vector<ClosedBucket> closed;
    };

private:
    static constexpr size_t KIND_COUNT = 3;

    std::array<Bucket, KIND_COUNT> buckets_{};
    bool negativeEnabled_;
    float rateLpm_ = 0.0f;
    uint32_t lastTime_ = 0;
    bool started_ = false;

public:
    explicit FlowTotalizer(bool negativeEnabled = false) : negativeEnabled_(negativeEnabled) {}

    static uint32_t bucketStart(uint32_t t, uint32_t elementSize) {
        return t - t % elementSize;
    }

    void setNegativeEnabled(bool enabled) { negativeEnabled_ = enabled; }

    /**
     * @brief 记入一次采样
     *
     * 本次流量作用于上次采样到 now 的区间。首次采样或时钟回拨时只更新瞬时值。
     * 未开启负流量计量时，负流量按 0 计。
     */
    SampleResult sample(float lpm, uint32_t now) {
        SampleResult result;
        rateLpm_ = lpm;

        if (started_ && now > lastTime_) {
            result.elapsedSec = now - lastTime_;
        }
        started_ = true;
        lastTime_ = now;

        rollBuckets(now, result.closed);

        double effective = lpm;
        if (effective < 0.0 && !negativeEnabled_) {
            effective = 0.0;
        }
        result.litres = effective * result.elapsedSec / 60.0;

        for (auto& b : buckets_) {
            b.litres += result.litres;
        }
        return result;
    }

    /** 启动时从历史缓冲恢复当前桶；下次采样若已跨桶，恢复的桶按 closed 返回 */
    void restore(history::HistoryKind kind, uint32_t start, double litres) {
        auto& b = buckets_[index(kind)];
        b.start = start;
        b.litres = litres;
        b.active = true;
    }

    const Bucket& bucket(history::HistoryKind kind) const {
        return buckets_[index(kind)];
    }

    modbus::FlowTelemetry telemetry() const {
        using enum history::HistoryKind;
        return modbus::FlowTelemetry{
            rateLpm_,
            static_cast<float>(bucket(Hour).litres),
            static_cast<float>(bucket(Day).litres),
            static_cast<float>(bucket(Month).litres),
        };
    }

    float rateLpm() const { return rateLpm_; }

private:
    static size_t index(history::HistoryKind kind) {
        return static_cast<size_t>(kind);
    }

    void rollBuckets(uint32_t now, std::vector<ClosedBucket>& closed) {
        for (auto kind : {history::HistoryKind::Hour, history::HistoryKind::Day, history::HistoryKind::Month}) {
            auto& b = buckets_[index(kind)];
            uint32_t start = bucketStart(now, history::geometryOf(kind).elementSize);
            if (b.active && b.start == start) continue;

            if (b.active) {
                closed.push_back({kind, b.start, b.litres});
            }
            b.start = start;
            b.litres = 0.0;
            b.active = true;
        }
    }
};
