#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @brief 存储页校验和
 *
 * CRC16/CCITT-FALSE: poly 0x1021, init 0xFFFF, 不反射, 无终值异或。
 * 用于配置页和历史缓冲头部；Modbus 帧校验见 modbus::ModbusUtils::crc16。
 */
class Checksum {
public:
    static uint16_t crc16CcittFalse(const uint8_t* data, size_t len) {
        uint16_t crc = 0xFFFF;
        for (size_t i = 0; i < len; ++i) {
            crc ^= static_cast<uint16_t>(data[i]) << 8;
            for (int j = 0; j < 8; ++j) {
                if (crc & 0x8000) {
                    crc = static_cast<uint16_t>((crc << 1) ^ 0x1021);
                } else {
                    crc = static_cast<uint16_t>(crc << 1);
                }
            }
        }
        return crc;
    }

    /** 全 0xFF（擦除态 EEPROM）或全 0x00 视为从未写入 */
    static bool isBlank(const uint8_t* data, size_t len) {
        if (len == 0) return true;
        uint8_t first = data[0];
        if (first != 0xFF && first != 0x00) return false;
        for (size_t i = 1; i < len; ++i) {
            if (data[i] != first) return false;
        }
        return true;
    }
};
