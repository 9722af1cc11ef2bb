#pragma once

#include "ConfigRecord.hpp"
#include "common/storage/ByteStorage.hpp"
#include "common/storage/PageStatus.hpp"
#include "common/utils/Checksum.hpp"

/** 载入结果所取的副本 */
enum class PageSource {
    None,
    Primary,
    Secondary
};

inline const char* pageSourceToString(PageSource source) {
    switch (source) {
        case PageSource::None: return "NONE";
        case PageSource::Primary: return "PRIMARY";
        case PageSource::Secondary: return "SECONDARY";
    }
    return "UNKNOWN";
}

/**
 * @brief 配置页载入结果
 *
 * status 为 Validated 时 record 有效；否则 record 为全零记录，由调用方决定回退。
 */
struct ConfigLoad {
    PageStatus status = PageStatus::NeverWritten;
    PageSource source = PageSource::None;
    ConfigRecord record;

    bool ok() const { return status == PageStatus::Validated; }

    /** 严格模式：两份副本都不可用时抛 WrongCrcException */
    const ConfigRecord& valueOrThrow() const {
        if (!ok()) {
            throw WrongCrcException(std::string("配置页不可用: ") + pageStatusToString(status));
        }
        return record;
    }
};

/**
 * @brief 配置页冗余存储
 *
 * 1024 字节页存两份（主 0x0000，副 0x0400），页首 2 字节为 CRC16/CCITT-FALSE，
 * 覆盖页内其余 1022 字节。
 * - load: 先验主页，失败才读副页
 * - save: 重算 CRC 后依次整页写主页、副页；每次保存都无条件覆盖两份，顺带修复损坏副本
 *
 * 主页写完后、副页写入前掉电时，主页已是新数据，load 只在主页校验失败时才看副页。
 */
class ConfigStore {
public:
    static constexpr uint32_t PAGE_SIZE = 1024;
    static constexpr uint32_t OFFSET_PRIMARY = 0x0000;
    static constexpr uint32_t OFFSET_SECONDARY = 0x0400;
    static constexpr uint8_t DEFAULT_SLAVE_ADDRESS = 1;

    static_assert(ConfigRecord::SIZE < PAGE_SIZE, "ConfigRecord must fit in one page");

    using Page = std::array<uint8_t, PAGE_SIZE>;

    /**
     * @brief 读取配置
     * @throws StorageException 器件读失败
     */
    static ConfigLoad load(ByteStorage& storage) {
        ConfigLoad result;

        auto primary = readPage(storage, OFFSET_PRIMARY, result.record);
        if (primary == PageStatus::Validated) {
            result.status = PageStatus::Validated;
            result.source = PageSource::Primary;
            return result;
        }
        LOG_WARN << "[ConfigStore] Primary page " << pageStatusToString(primary)
                 << ", trying secondary";

        auto secondary = readPage(storage, OFFSET_SECONDARY, result.record);
        if (secondary == PageStatus::Validated) {
            result.status = PageStatus::Validated;
            result.source = PageSource::Secondary;
            return result;
        }

        result.record = ConfigRecord{};
        result.source = PageSource::None;
        if (primary == PageStatus::NeverWritten && secondary == PageStatus::NeverWritten) {
            result.status = PageStatus::NeverWritten;
            LOG_WARN << "[ConfigStore] Both pages blank, device never configured";
        } else {
            result.status = PageStatus::Corrupt;
            LOG_ERROR << "[ConfigStore] Wrong CRC on both pages";
        }
        return result;
    }

    /**
     * @brief 保存配置（record 的 crc 字段被更新）
     * @throws StorageException 任一副本写失败
     */
    static void save(ConfigRecord& record, ByteStorage& storage) {
        Page page = serialize(record);
        record.setCrc(pageCrc(page));
        page = serialize(record);

        storage.write(OFFSET_PRIMARY, page.data(), page.size());
        storage.write(OFFSET_SECONDARY, page.data(), page.size());
        LOG_DEBUG << "[ConfigStore] Saved, crc=0x" << std::hex << record.crc();
    }

    /** 出厂默认记录：K 系数为 1，其余清零 */
    static ConfigRecord defaults(uint8_t slaveAddress = DEFAULT_SLAVE_ADDRESS) {
        ConfigRecord rec;
        for (size_t i = 0; i < ConfigRecord::COEFFICIENT_COUNT; ++i) {
            rec.setKFactor(i, 1.0f);
        }
        rec.setSlaveAddress(slaveAddress);
        return rec;
    }

    static uint16_t pageCrc(const Page& page) {
        return Checksum::crc16CcittFalse(page.data() + 2, page.size() - 2);
    }

private:
    static Page serialize(const ConfigRecord& record) {
        Page page{};
        std::copy(record.bytes().begin(), record.bytes().end(), page.begin());
        return page;
    }

    static PageStatus readPage(ByteStorage& storage, uint32_t offset, ConfigRecord& out) {
        Page page{};
        storage.read(offset, page.data(), page.size());

        if (Checksum::isBlank(page.data(), page.size())) {
            return PageStatus::NeverWritten;
        }

        out = ConfigRecord::fromBytes(page.data());
        uint16_t calc = pageCrc(page);
        if (calc != out.crc()) {
            LOG_DEBUG << "[ConfigStore] Page 0x" << std::hex << offset
                      << " crc mismatch: calc=0x" << calc << " stored=0x" << out.crc();
            return PageStatus::Corrupt;
        }
        return PageStatus::Validated;
    }
};
