#pragma once

#include "History.Types.hpp"
#include "common/storage/ByteStorage.hpp"
#include "common/storage/PageStatus.hpp"
#include "common/storage/StorageLayout.hpp"

namespace history {

/**
 * @brief 定容环形历史缓冲
 *
 * 每个桶是一个 int32 累加值，桶宽 elementSize 秒。器件区域布局：
 *   [ServiceData(14)][pad(2)][slot0(4)][slot1(4)]...[slotN-1(4)][legacy(4)]
 *
 * 内存中缓存头部；所有方法都要求调用方已取得器件独占访问。
 * add 先写值槽、后写头部，两次写之间掉电只会丢失最新一次写入。
 */
class RingHistoryStore {
public:
    /** 时间量化粒度（秒） */
    static constexpr uint32_t TIME_QUANTUM = 60;

    struct OpenResult;

private:
    StorageRegion region_;
    HistoryGeometry geometry_;
    ServiceData header_;

public:
    RingHistoryStore(StorageRegion region, HistoryGeometry geometry)
        : region_(std::move(region)), geometry_(geometry) {
        if (geometry_.capacity == 0 || geometry_.elementSize == 0) {
            throw ValidationException("环形缓冲容量和桶宽必须大于 0: " + region_.name);
        }
        if (region_.size < geometry_.deviceSize()) {
            throw AppException(ErrorCodes::LAYOUT_INVALID,
                               "区域 " + region_.name + " 容纳不下 " +
                               std::to_string(geometry_.capacity) + " 个槽",
                               drogon::k500InternalServerError);
        }
    }

    /**
     * @brief 从器件读取头部
     *
     * 头部 CRC 错误或字段越界时返回 Corrupt，全 0xFF/0x00 返回 NeverWritten，
     * 两种情况下 store 都是空缓冲，由调用方决定如何处置。
     * @throws StorageException 器件读失败
     */
    static OpenResult open(ByteStorage& storage, StorageRegion region, HistoryGeometry geometry);

    static uint32_t quantize(uint32_t time) {
        return time - time % TIME_QUANTUM;
    }

    // ==================== 写入 ====================

    /**
     * @brief 把 value 记入 time 所在的桶
     *
     * - 空缓冲：写入槽 0
     * - 向前 k 个桶：k ≥ capacity 视为过期重置；k == 0 覆盖当前桶；
     *   否则补 k-1 个零桶后写入
     * - 向后 k 个桶：k ≥ size 视为越过保留窗口重置；否则回退 k 个桶后覆盖
     * @throws StorageException
     */
    void add(ByteStorage& storage, int32_t value, uint32_t time) {
        const uint32_t t = quantize(time);
        const int64_t es = geometry_.elementSize;

        if (header_.size == 0) {
            writeFirst(storage, value, t);
            return;
        }

        const int64_t dt = static_cast<int64_t>(t) - static_cast<int64_t>(header_.timeOfLast);

        if (dt > 0) {
            const int64_t k = dt / es;
            if (k >= geometry_.capacity) {
                LOG_DEBUG << "[History] " << region_.name << " stale by " << k << " buckets, reset";
                writeFirst(storage, value, t);
                return;
            }
            for (int64_t i = 1; i < k; ++i) {
                advance();
                grow();
                header_.timeOfLast += geometry_.elementSize;
                writeSlot(storage, header_.offsetOfLast, 0);
            }
            if (k > 0) {
                advance();
                grow();
                header_.timeOfLast += geometry_.elementSize;
            }
        } else {
            const int64_t k = -dt / es;
            if (k >= header_.size) {
                LOG_DEBUG << "[History] " << region_.name << " time " << t
                          << " predates retained window, reset";
                writeFirst(storage, value, t);
                return;
            }
            for (int64_t i = 0; i < k; ++i) {
                writeSlot(storage, header_.offsetOfLast, 0);
                retreat();
                header_.size -= 1;
                header_.timeOfLast -= geometry_.elementSize;
            }
        }

        writeSlot(storage, header_.offsetOfLast, value);
        persistHeader(storage);
    }

    // ==================== 查询 ====================

    /**
     * @brief 查找包含 time 的桶
     * 第 j 新的桶覆盖 [time_of_last - j·elementSize, time_of_last - (j-1)·elementSize)，
     * 与 add 的向下取整一致；j ∈ [0, size)
     */
    std::optional<int32_t> find(ByteStorage& storage, uint32_t time) const {
        auto j = bucketsBack(time);
        if (!j) return std::nullopt;
        return readSlot(storage, slotBefore(*j));
    }

    /** 包含 time 的桶的起始时间，不在保留窗口内返回 nullopt */
    std::optional<uint32_t> bucketTimeOf(uint32_t time) const {
        auto j = bucketsBack(time);
        if (!j) return std::nullopt;
        return header_.timeOfLast - *j * geometry_.elementSize;
    }

    /** 最新桶的值，空缓冲返回 nullopt */
    std::optional<int32_t> lastValue(ByteStorage& storage) const {
        if (header_.size == 0) return std::nullopt;
        return readSlot(storage, header_.offsetOfLast);
    }

    /** @throws AppException(HISTORY_NO_RECORDS) 空缓冲 */
    uint32_t firstStoredTimestamp() const {
        if (header_.size == 0) throw HistoryException::NoRecords();
        return header_.timeOfLast - geometry_.elementSize * (header_.size - 1);
    }

    /** @throws AppException(HISTORY_NO_RECORDS) 空缓冲 */
    uint32_t lastStoredTimestamp() const {
        if (header_.size == 0) throw HistoryException::NoRecords();
        return header_.timeOfLast;
    }

    HistoryRange range() const {
        return HistoryRange{header_.size, geometry_.capacity, geometry_.elementSize,
                            firstStoredTimestamp(), lastStoredTimestamp()};
    }

    // ==================== 游标 ====================

    /** offset_of_last 前移一格（模 capacity），不触碰器件 */
    void advance() {
        header_.offsetOfLast = (header_.offsetOfLast + 1) % geometry_.capacity;
    }

    uint32_t size() const { return header_.size; }
    uint32_t offsetOfLast() const { return header_.offsetOfLast; }
    uint32_t timeOfLast() const { return header_.timeOfLast; }
    bool empty() const { return header_.size == 0; }

private:
    void retreat() {
        header_.offsetOfLast = header_.offsetOfLast == 0
            ? geometry_.capacity - 1
            : header_.offsetOfLast - 1;
    }

    void grow() {
        if (header_.size < geometry_.capacity) {
            header_.size += 1;
        }
    }

    /** 从最新桶往回数 j 个桶的槽号 */
    uint32_t slotBefore(uint32_t j) const {
        return (header_.offsetOfLast + geometry_.capacity - j % geometry_.capacity) % geometry_.capacity;
    }

    void writeFirst(ByteStorage& storage, int32_t value, uint32_t t) {
        header_.size = 1;
        header_.offsetOfLast = 0;
        header_.timeOfLast = t;
        writeSlot(storage, 0, value);
        persistHeader(storage);
    }

    std::optional<uint32_t> bucketsBack(uint32_t time) const {
        if (header_.size == 0) return std::nullopt;

        const uint32_t t = quantize(time);
        const uint32_t es = geometry_.elementSize;

        uint32_t j = 0;
        if (t >= header_.timeOfLast) {
            if (t - header_.timeOfLast >= es) return std::nullopt;
        } else {
            const uint32_t back = header_.timeOfLast - t;
            j = back / es + (back % es != 0 ? 1 : 0);
        }
        if (j >= header_.size) return std::nullopt;
        return j;
    }

    uint32_t slotAddress(uint32_t index) const {
        return region_.offset + SLOTS_OFFSET + index * 4;
    }

    void writeSlot(ByteStorage& storage, uint32_t index, int32_t value) {
        auto raw = static_cast<uint32_t>(value);
        uint8_t buf[4];
        for (size_t i = 0; i < 4; ++i) {
            buf[i] = static_cast<uint8_t>(raw >> (8 * i));
        }
        storage.write(slotAddress(index), buf, sizeof(buf));
    }

    int32_t readSlot(ByteStorage& storage, uint32_t index) const {
        uint8_t buf[4];
        storage.read(slotAddress(index), buf, sizeof(buf));
        uint32_t raw = static_cast<uint32_t>(buf[0])
                     | (static_cast<uint32_t>(buf[1]) << 8)
                     | (static_cast<uint32_t>(buf[2]) << 16)
                     | (static_cast<uint32_t>(buf[3]) << 24);
        return static_cast<int32_t>(raw);
    }

    void persistHeader(ByteStorage& storage) {
        auto wire = header_.serialize();
        storage.write(region_.offset, wire.data(), wire.size());
    }

    bool headerPlausible(const ServiceData& sd) const {
        if (sd.size > geometry_.capacity || sd.offsetOfLast >= geometry_.capacity) return false;
        if (sd.size == 0) return true;
        return sd.timeOfLast >= static_cast<uint64_t>(geometry_.elementSize) * (sd.size - 1);
    }
};

struct RingHistoryStore::OpenResult {
    PageStatus status;
    RingHistoryStore store;
};

inline RingHistoryStore::OpenResult RingHistoryStore::open(ByteStorage& storage,
                                                           StorageRegion region,
                                                           HistoryGeometry geometry) {
    RingHistoryStore store(std::move(region), geometry);

    ServiceData::Wire wire{};
    storage.read(store.region_.offset, wire.data(), wire.size());

    if (Checksum::isBlank(wire.data(), wire.size())) {
        return {PageStatus::NeverWritten, std::move(store)};
    }
    if (!ServiceData::crcMatches(wire)) {
        LOG_WARN << "[History] " << store.region_.name << " header crc mismatch";
        return {PageStatus::Corrupt, std::move(store)};
    }

    auto sd = ServiceData::parse(wire);
    if (!store.headerPlausible(sd)) {
        LOG_WARN << "[History] " << store.region_.name << " header out of range: size=" << sd.size
                 << " offset=" << sd.offsetOfLast;
        return {PageStatus::Corrupt, std::move(store)};
    }

    store.header_ = sd;
    return {PageStatus::Validated, std::move(store)};
}

}  // namespace history
