#pragma once

#include "ConfigStore.hpp"
#include "common/storage/SharedStorage.hpp"

/**
 * @brief 当前配置记录的唯一持有者
 *
 * 内存记录只在这里修改。Modbus 写寄存器、累计计数器和周期保存都经此入口，
 * 避免两份内存副本互相覆盖。
 *
 * 锁顺序：mutex_ → SharedStorage
 */
class OptionsService {
private:
    SharedStorage* storage_ = nullptr;
    ConfigRecord record_;
    ConfigLoad bootLoad_;
    bool dirty_ = false;
    mutable std::mutex mutex_;

public:
    /**
     * @brief 启动时载入配置
     *
     * 两份副本都不可用时写入出厂默认记录（NeverWritten 为首次上电，Corrupt 记错误日志）。
     * @throws StorageException
     */
    const ConfigLoad& initialize(SharedStorage& storage, uint8_t defaultSlaveAddress) {
        std::lock_guard<std::mutex> lock(mutex_);
        storage_ = &storage;

        bootLoad_ = storage.withExclusiveAccess([](ByteStorage& dev) {
            return ConfigStore::load(dev);
        });

        if (bootLoad_.ok()) {
            record_ = bootLoad_.record;
            LOG_INFO << "[ConfigStore] Loaded from " << pageSourceToString(bootLoad_.source)
                     << " page, serial=" << record_.serialNumber()
                     << ", slave=" << static_cast<int>(record_.slaveAddress());
        } else {
            if (bootLoad_.status == PageStatus::Corrupt) {
                LOG_ERROR << "[ConfigStore] Both pages corrupt, restoring factory defaults";
            } else {
                LOG_INFO << "[ConfigStore] First boot, writing factory defaults";
            }
            record_ = ConfigStore::defaults(defaultSlaveAddress);
            storage.withExclusiveAccess([this](ByteStorage& dev) {
                ConfigStore::save(record_, dev);
            });
        }
        dirty_ = false;
        return bootLoad_;
    }

    ConfigRecord snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return record_;
    }

    const ConfigLoad& bootLoad() const { return bootLoad_; }

    /** 只改内存，由 persist() 择机落盘 */
    template<typename Fn>
    void modify(Fn&& fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::forward<Fn>(fn)(record_);
        dirty_ = true;
    }

    /**
     * @brief 修改副本并立即保存，保存成功才替换内存记录
     * @throws StorageException 保存失败，内存记录保持不变
     */
    template<typename Fn>
    void update(Fn&& fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        ensureInitialized();
        ConfigRecord next = record_;
        std::forward<Fn>(fn)(next);
        storage_->withExclusiveAccess([&next](ByteStorage& dev) {
            ConfigStore::save(next, dev);
        });
        record_ = next;
        dirty_ = false;
    }

    /**
     * @brief 有未保存修改时落盘
     * @return 是否执行了写入
     */
    bool persist() {
        std::lock_guard<std::mutex> lock(mutex_);
        ensureInitialized();
        if (!dirty_) return false;
        ConfigRecord next = record_;
        storage_->withExclusiveAccess([&next](ByteStorage& dev) {
            ConfigStore::save(next, dev);
        });
        record_ = next;
        dirty_ = false;
        return true;
    }

private:
    void ensureInitialized() const {
        if (!storage_) {
            throw AppException(ErrorCodes::INTERNAL_ERROR, "配置服务未初始化", drogon::k503ServiceUnavailable);
        }
    }
};
