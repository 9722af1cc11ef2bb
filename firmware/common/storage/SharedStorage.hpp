#pragma once

#include "ByteStorage.hpp"

/**
 * @brief 存储器唯一所有者
 *
 * 配置页、三个历史环形缓冲和 Modbus 写操作共用同一片器件。
 * 所有访问经 withExclusiveAccess 进入，一次逻辑操作（load/save/add/find）持有一次锁，
 * 互斥在此集中保证，而不依赖各调用方自律。
 */
class SharedStorage {
private:
    std::unique_ptr<ByteStorage> device_;
    mutable std::mutex mutex_;

public:
    explicit SharedStorage(std::unique_ptr<ByteStorage> device)
        : device_(std::move(device)) {
        if (!device_) {
            throw StorageException("存储器实例为空");
        }
    }

    SharedStorage(const SharedStorage&) = delete;
    SharedStorage& operator=(const SharedStorage&) = delete;

    template<typename Fn>
    decltype(auto) withExclusiveAccess(Fn&& fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::forward<Fn>(fn)(*device_);
    }

    uint32_t capacity() const {
        return device_->capacity();
    }
};
