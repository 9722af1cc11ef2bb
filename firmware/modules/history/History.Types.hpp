#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include "common/utils/Checksum.hpp"

namespace history {

// ==================== 环形缓冲头部 ====================

/**
 * @brief 环形缓冲服务头（ServiceData）
 *
 * 器件上 14 字节，小端：
 * [size(4)][offset_of_last(4)][time_of_last(4)][crc16(2)]
 * crc 为 CRC16/CCITT-FALSE，覆盖前 12 字节。
 */
struct ServiceData {
    static constexpr size_t WIRE_SIZE = 14;
    static constexpr size_t CRC_OFFSET = 12;

    using Wire = std::array<uint8_t, WIRE_SIZE>;

    uint32_t size = 0;
    uint32_t offsetOfLast = 0;
    uint32_t timeOfLast = 0;
    uint16_t crc = 0;

    /** 序列化并写入新 CRC */
    Wire serialize() {
        Wire w{};
        putU32(w, 0, size);
        putU32(w, 4, offsetOfLast);
        putU32(w, 8, timeOfLast);
        crc = Checksum::crc16CcittFalse(w.data(), CRC_OFFSET);
        w[12] = static_cast<uint8_t>(crc & 0xFF);
        w[13] = static_cast<uint8_t>(crc >> 8);
        return w;
    }

    static ServiceData parse(const Wire& w) {
        ServiceData sd;
        sd.size = getU32(w, 0);
        sd.offsetOfLast = getU32(w, 4);
        sd.timeOfLast = getU32(w, 8);
        sd.crc = static_cast<uint16_t>(w[12] | (w[13] << 8));
        return sd;
    }

    static bool crcMatches(const Wire& w) {
        uint16_t stored = static_cast<uint16_t>(w[12] | (w[13] << 8));
        return Checksum::crc16CcittFalse(w.data(), CRC_OFFSET) == stored;
    }

private:
    static void putU32(Wire& w, size_t off, uint32_t v) {
        for (size_t i = 0; i < 4; ++i) {
            w[off + i] = static_cast<uint8_t>(v >> (8 * i));
        }
    }

    static uint32_t getU32(const Wire& w, size_t off) {
        return static_cast<uint32_t>(w[off])
             | (static_cast<uint32_t>(w[off + 1]) << 8)
             | (static_cast<uint32_t>(w[off + 2]) << 16)
             | (static_cast<uint32_t>(w[off + 3]) << 24);
    }
};

// ==================== 缓冲几何 ====================

/** 历史缓冲种类 */
enum class HistoryKind {
    Hour,
    Day,
    Month
};

/** 容量与桶宽（秒） */
struct HistoryGeometry {
    uint32_t capacity;
    uint32_t elementSize;

    /**
     * @brief 器件上占用字节数
     * 4（历史遗留 u32 前缀）+ capacity·4 + ServiceData + 2
     */
    constexpr uint32_t deviceSize() const {
        return 4 + capacity * 4 + static_cast<uint32_t>(ServiceData::WIRE_SIZE) + 2;
    }
};

/** 槽区相对区域起点的偏移 */
inline constexpr uint32_t SLOTS_OFFSET = static_cast<uint32_t>(ServiceData::WIRE_SIZE) + 2;

inline constexpr HistoryGeometry HOUR_GEOMETRY{2160, 3600};
inline constexpr HistoryGeometry DAY_GEOMETRY{1116, 86400};
inline constexpr HistoryGeometry MONTH_GEOMETRY{120, 2678400};

inline constexpr HistoryGeometry geometryOf(HistoryKind kind) {
    switch (kind) {
        case HistoryKind::Hour: return HOUR_GEOMETRY;
        case HistoryKind::Day: return DAY_GEOMETRY;
        case HistoryKind::Month: return MONTH_GEOMETRY;
    }
    return HOUR_GEOMETRY;
}

inline const char* historyKindToString(HistoryKind kind) {
    switch (kind) {
        case HistoryKind::Hour: return "hour";
        case HistoryKind::Day: return "day";
        case HistoryKind::Month: return "month";
    }
    return "unknown";
}

inline std::optional<HistoryKind> parseHistoryKind(const std::string& str) {
    if (str == "hour") return HistoryKind::Hour;
    if (str == "day") return HistoryKind::Day;
    if (str == "month") return HistoryKind::Month;
    return std::nullopt;
}

/** 布局表中的区域名 */
inline std::string regionNameOf(HistoryKind kind) {
    return std::string("history.") + historyKindToString(kind);
}

/** 缓冲当前覆盖的时间范围 */
struct HistoryRange {
    uint32_t size;
    uint32_t capacity;
    uint32_t elementSize;
    uint32_t firstTimestamp;
    uint32_t lastTimestamp;
};

}  // namespace history
