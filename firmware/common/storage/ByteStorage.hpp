#pragma once

#include "common/utils/AppException.hpp"

/**
 * @brief 字节寻址非易失存储器接口（EEPROM 模型）
 *
 * 平坦、可随机写、无需先擦除。读写均为同步阻塞操作，
 * 失败时抛出 StorageException。调用方负责互斥（见 SharedStorage）。
 */
class ByteStorage {
public:
    virtual ~ByteStorage() = default;

    virtual void read(uint32_t offset, uint8_t* data, size_t len) = 0;
    virtual void write(uint32_t offset, const uint8_t* data, size_t len) = 0;

    /** 器件容量（字节） */
    virtual uint32_t capacity() const = 0;

protected:
    void checkRange(uint32_t offset, size_t len) const {
        if (static_cast<uint64_t>(offset) + len > capacity()) {
            throw StorageException("存储器访问越界: offset=" + std::to_string(offset) +
                                   " len=" + std::to_string(len) +
                                   " capacity=" + std::to_string(capacity()));
        }
    }
};
