#pragma once

#include "RingHistoryStore.hpp"
#include "common/storage/SharedStorage.hpp"

namespace history {

/**
 * @brief 小时/日/月三个历史缓冲
 *
 * 三个缓冲链式排布在同一器件上，每次调用都在 SharedStorage 独占锁内完成，
 * 内存中的头部缓存也由同一把锁保护。
 */
class HistoryService {
public:
    /** open 时每个缓冲的头部状态 */
    struct OpenReport {
        HistoryKind kind;
        PageStatus status;
        uint32_t size;
    };

    static constexpr HistoryKind ALL_KINDS[] = {HistoryKind::Hour, HistoryKind::Day, HistoryKind::Month};

private:
    SharedStorage* storage_ = nullptr;
    std::map<HistoryKind, RingHistoryStore> rings_;

public:
    /**
     * @brief 读取三个缓冲头部
     *
     * 头部损坏的缓冲以空缓冲继续运行（告警），从未写入的缓冲静默初始化为空。
     * @throws StorageException 器件读失败
     */
    std::vector<OpenReport> open(SharedStorage& storage, const StorageLayout& layout) {
        std::vector<OpenReport> reports;
        rings_.clear();

        storage.withExclusiveAccess([&](ByteStorage& dev) {
            for (auto kind : ALL_KINDS) {
                auto result = RingHistoryStore::open(dev, layout.get(regionNameOf(kind)), geometryOf(kind));
                if (result.status == PageStatus::Corrupt) {
                    LOG_WARN << "[History] " << historyKindToString(kind)
                             << " buffer corrupt, starting empty";
                }
                reports.push_back({kind, result.status, result.store.size()});
                rings_.emplace(kind, std::move(result.store));
            }
        });

        storage_ = &storage;
        for (const auto& r : reports) {
            LOG_INFO << "[History] " << historyKindToString(r.kind) << ": "
                     << pageStatusToString(r.status) << ", " << r.size << " bucket(s)";
        }
        return reports;
    }

    /** 记入 bucketStart 所在桶（覆盖该桶已有值） */
    void record(HistoryKind kind, int32_t value, uint32_t bucketStart) {
        auto& ring = ringOf(kind);
        storage_->withExclusiveAccess([&](ByteStorage& dev) {
            ring.add(dev, value, bucketStart);
        });
    }

    std::optional<int32_t> find(HistoryKind kind, uint32_t time) {
        auto& ring = ringOf(kind);
        return storage_->withExclusiveAccess([&](ByteStorage& dev) {
            return ring.find(dev, time);
        });
    }

    std::optional<uint32_t> bucketTimeOf(HistoryKind kind, uint32_t time) {
        auto& ring = ringOf(kind);
        return storage_->withExclusiveAccess([&](ByteStorage&) {
            return ring.bucketTimeOf(time);
        });
    }

    std::optional<int32_t> lastValue(HistoryKind kind) {
        auto& ring = ringOf(kind);
        return storage_->withExclusiveAccess([&](ByteStorage& dev) {
            return ring.lastValue(dev);
        });
    }

    /** @throws AppException(HISTORY_NO_RECORDS) 缓冲为空 */
    HistoryRange range(HistoryKind kind) {
        auto& ring = ringOf(kind);
        return storage_->withExclusiveAccess([&](ByteStorage&) {
            return ring.range();
        });
    }

    uint32_t size(HistoryKind kind) {
        auto& ring = ringOf(kind);
        return storage_->withExclusiveAccess([&](ByteStorage&) {
            return ring.size();
        });
    }

private:
    RingHistoryStore& ringOf(HistoryKind kind) {
        if (!storage_) {
            throw HistoryException::Uninitialized();
        }
        return rings_.at(kind);
    }
};

}  // namespace history
