#pragma once

#include <array>
#include <bit>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>

/**
 * @brief 仪表配置记录（Options）
 *
 * 定长紧凑二进制布局，所有多字节字段小端存放。TDC1000/TDC7200 寄存器预置为
 * 80 bit 不透明数据块，由测量驱动读写，这里只保证逐字节原样保存。
 * 标定系数以原始 32 bit 位型存放，浮点视图只做位重解释。
 *
 *   偏移  长度  字段
 *   0     2     crc
 *   2     4     serial_number
 *   6     1     sensor_type
 *   7     10    tdc1000_regs
 *   17    10    tdc7200_regs
 *   27    8     zero1, zero2
 *   35    24    v11 v12 v13 v21 v22 v23
 *   59    24    k11 k12 k13 k21 k22 k23
 *   83    24    uptime total hour_total day_total month_total rest
 *   107   4     enable_negative slave_address comm_type modbus_mode
 */
class ConfigRecord {
public:
    static constexpr size_t SIZE = 111;
    static constexpr size_t BLOB_SIZE = 10;
    static constexpr size_t COEFFICIENT_COUNT = 6;

    // 字段偏移
    static constexpr size_t OFF_CRC = 0;
    static constexpr size_t OFF_SERIAL = 2;
    static constexpr size_t OFF_SENSOR_TYPE = 6;
    static constexpr size_t OFF_TDC1000 = 7;
    static constexpr size_t OFF_TDC7200 = 17;
    static constexpr size_t OFF_ZERO = 27;
    static constexpr size_t OFF_VELOCITY = 35;
    static constexpr size_t OFF_KFACTOR = 59;
    static constexpr size_t OFF_UPTIME = 83;
    static constexpr size_t OFF_TOTAL = 87;
    static constexpr size_t OFF_HOUR_TOTAL = 91;
    static constexpr size_t OFF_DAY_TOTAL = 95;
    static constexpr size_t OFF_MONTH_TOTAL = 99;
    static constexpr size_t OFF_REST = 103;
    static constexpr size_t OFF_ENABLE_NEGATIVE = 107;
    static constexpr size_t OFF_SLAVE_ADDRESS = 108;
    static constexpr size_t OFF_COMM_TYPE = 109;
    static constexpr size_t OFF_MODBUS_MODE = 110;

    static_assert(OFF_MODBUS_MODE + 1 == SIZE, "ConfigRecord layout must be packed");

    using Bytes = std::array<uint8_t, SIZE>;
    using Blob = std::array<uint8_t, BLOB_SIZE>;

private:
    Bytes bytes_{};

public:
    ConfigRecord() = default;

    static ConfigRecord fromBytes(const uint8_t* data) {
        ConfigRecord rec;
        std::memcpy(rec.bytes_.data(), data, SIZE);
        return rec;
    }

    static ConfigRecord fromBytes(const Bytes& data) {
        ConfigRecord rec;
        rec.bytes_ = data;
        return rec;
    }

    const Bytes& bytes() const { return bytes_; }

    // ==================== 头部 ====================

    uint16_t crc() const { return getU16(OFF_CRC); }
    void setCrc(uint16_t v) { setU16(OFF_CRC, v); }

    uint32_t serialNumber() const { return getU32(OFF_SERIAL); }
    void setSerialNumber(uint32_t v) { setU32(OFF_SERIAL, v); }

    uint8_t sensorType() const { return bytes_[OFF_SENSOR_TYPE]; }
    void setSensorType(uint8_t v) { bytes_[OFF_SENSOR_TYPE] = v; }

    // ==================== 测量芯片寄存器预置 ====================

    Blob tdc1000Regs() const { return getBlob(OFF_TDC1000); }
    void setTdc1000Regs(const Blob& v) { setBlob(OFF_TDC1000, v); }

    Blob tdc7200Regs() const { return getBlob(OFF_TDC7200); }
    void setTdc7200Regs(const Blob& v) { setBlob(OFF_TDC7200, v); }

    // ==================== 标定 ====================
    // index: 0..1 零点; 0..5 依次对应 x11 x12 x13 x21 x22 x23

    uint32_t zeroRaw(size_t index) const { return getU32(slot(OFF_ZERO, index, 2)); }
    void setZeroRaw(size_t index, uint32_t v) { setU32(slot(OFF_ZERO, index, 2), v); }

    uint32_t velocityRaw(size_t index) const { return getU32(slot(OFF_VELOCITY, index, COEFFICIENT_COUNT)); }
    void setVelocityRaw(size_t index, uint32_t v) { setU32(slot(OFF_VELOCITY, index, COEFFICIENT_COUNT), v); }

    uint32_t kFactorRaw(size_t index) const { return getU32(slot(OFF_KFACTOR, index, COEFFICIENT_COUNT)); }
    void setKFactorRaw(size_t index, uint32_t v) { setU32(slot(OFF_KFACTOR, index, COEFFICIENT_COUNT), v); }

    float zeroOffset(size_t index) const { return std::bit_cast<float>(zeroRaw(index)); }
    void setZeroOffset(size_t index, float v) { setZeroRaw(index, std::bit_cast<uint32_t>(v)); }

    float velocityCoefficient(size_t index) const { return std::bit_cast<float>(velocityRaw(index)); }
    void setVelocityCoefficient(size_t index, float v) { setVelocityRaw(index, std::bit_cast<uint32_t>(v)); }

    float kFactor(size_t index) const { return std::bit_cast<float>(kFactorRaw(index)); }
    void setKFactor(size_t index, float v) { setKFactorRaw(index, std::bit_cast<uint32_t>(v)); }

    // ==================== 累计计数 ====================

    uint32_t uptime() const { return getU32(OFF_UPTIME); }
    void setUptime(uint32_t v) { setU32(OFF_UPTIME, v); }

    uint32_t total() const { return getU32(OFF_TOTAL); }
    void setTotal(uint32_t v) { setU32(OFF_TOTAL, v); }

    uint32_t hourTotal() const { return getU32(OFF_HOUR_TOTAL); }
    void setHourTotal(uint32_t v) { setU32(OFF_HOUR_TOTAL, v); }

    uint32_t dayTotal() const { return getU32(OFF_DAY_TOTAL); }
    void setDayTotal(uint32_t v) { setU32(OFF_DAY_TOTAL, v); }

    uint32_t monthTotal() const { return getU32(OFF_MONTH_TOTAL); }
    void setMonthTotal(uint32_t v) { setU32(OFF_MONTH_TOTAL, v); }

    uint32_t rest() const { return getU32(OFF_REST); }
    void setRest(uint32_t v) { setU32(OFF_REST, v); }

    // ==================== 通信 ====================

    bool negativeFlowEnabled() const { return bytes_[OFF_ENABLE_NEGATIVE] != 0; }
    uint8_t enableNegative() const { return bytes_[OFF_ENABLE_NEGATIVE]; }
    void setEnableNegative(uint8_t v) { bytes_[OFF_ENABLE_NEGATIVE] = v; }

    uint8_t slaveAddress() const { return bytes_[OFF_SLAVE_ADDRESS]; }
    void setSlaveAddress(uint8_t v) { bytes_[OFF_SLAVE_ADDRESS] = v; }

    uint8_t commType() const { return bytes_[OFF_COMM_TYPE]; }
    void setCommType(uint8_t v) { bytes_[OFF_COMM_TYPE] = v; }

    uint8_t modbusMode() const { return bytes_[OFF_MODBUS_MODE]; }
    void setModbusMode(uint8_t v) { bytes_[OFF_MODBUS_MODE] = v; }

    bool operator==(const ConfigRecord& other) const = default;

private:
    static size_t slot(size_t base, size_t index, size_t count) {
        if (index >= count) {
            throw std::out_of_range("ConfigRecord coefficient index " + std::to_string(index));
        }
        return base + index * 4;
    }

    uint16_t getU16(size_t off) const {
        return static_cast<uint16_t>(bytes_[off] | (bytes_[off + 1] << 8));
    }

    void setU16(size_t off, uint16_t v) {
        bytes_[off] = static_cast<uint8_t>(v & 0xFF);
        bytes_[off + 1] = static_cast<uint8_t>(v >> 8);
    }

    uint32_t getU32(size_t off) const {
        return static_cast<uint32_t>(bytes_[off])
             | (static_cast<uint32_t>(bytes_[off + 1]) << 8)
             | (static_cast<uint32_t>(bytes_[off + 2]) << 16)
             | (static_cast<uint32_t>(bytes_[off + 3]) << 24);
    }

    void setU32(size_t off, uint32_t v) {
        for (size_t i = 0; i < 4; ++i) {
            bytes_[off + i] = static_cast<uint8_t>(v >> (8 * i));
        }
    }

    Blob getBlob(size_t off) const {
        Blob blob{};
        std::memcpy(blob.data(), bytes_.data() + off, BLOB_SIZE);
        return blob;
    }

    void setBlob(size_t off, const Blob& v) {
        std::memcpy(bytes_.data() + off, v.data(), BLOB_SIZE);
    }
};
