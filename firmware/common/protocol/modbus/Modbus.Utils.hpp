#pragma once

#include "Modbus.Types.hpp"

#include <algorithm>
#include <bit>
#include <cstring>
#include <sstream>
#include <iomanip>

namespace modbus {

/**
 * @brief Modbus RTU 从站编解码
 * CRC16、请求帧解析、响应/异常帧构建、流式分帧、数据转换。无状态，不抛异常。
 */
class ModbusUtils {
public:
    /** 帧格式异常标记，调用方应跳过 1 字节重新对齐 */
    static constexpr size_t FRAME_CORRUPT = SIZE_MAX;

    // ==================== CRC16 (Modbus RTU) ====================

    static uint16_t crc16(const uint8_t* data, size_t len) {
        uint16_t crc = 0xFFFF;
        for (size_t i = 0; i < len; ++i) {
            crc ^= data[i];
            for (int j = 0; j < 8; ++j) {
                if (crc & 0x0001) {
                    crc = (crc >> 1) ^ 0xA001;
                } else {
                    crc >>= 1;
                }
            }
        }
        return crc;
    }

    static uint16_t crc16(const std::vector<uint8_t>& data) {
        return crc16(data.data(), data.size());
    }

    /** 追加 CRC16（小端序） */
    static void appendCrc(std::vector<uint8_t>& frame) {
        uint16_t crc = crc16(frame.data(), frame.size());
        frame.push_back(static_cast<uint8_t>(crc & 0xFF));        // CRC Low
        frame.push_back(static_cast<uint8_t>((crc >> 8) & 0xFF)); // CRC High
    }

    static bool isValidSlaveAddress(uint8_t addr) {
        return addr >= 1 && addr <= MAX_SLAVE_ADDRESS;
    }

    // ==================== 请求解析 ====================

    /**
     * @brief 解析一帧完整的 RTU 请求
     * @param slaveAddress 本机从站地址，0（广播）也被接受
     *
     * FC03/04: [Slave][FC][Addr(2)][Qty(2)][CRC(2)]
     * FC06:    [Slave][FC][Addr(2)][Value(2)][CRC(2)]
     * FC10:    [Slave][FC][Addr(2)][Qty(2)][ByteCount][Data...][CRC(2)]
     */
    static ParseResult parseRtuRequest(const uint8_t* frame, size_t len, uint8_t slaveAddress) {
        ParseResult result;

        if (len < MIN_REQUEST_SIZE) {
            result.error = ModbusError::InvalidLength;
            return result;
        }

        uint8_t slave = frame[0];
        if (slave != slaveAddress && slave != BROADCAST_ADDRESS) {
            result.error = ModbusError::InvalidSlaveAddress;
            return result;
        }

        uint16_t crcRecv = static_cast<uint16_t>(frame[len - 2])
                         | (static_cast<uint16_t>(frame[len - 1]) << 8);
        if (crcRecv != crc16(frame, len - 2)) {
            result.error = ModbusError::InvalidCrc;
            return result;
        }

        auto& req = result.request;
        req.slaveId = slave;
        req.functionCode = frame[1];
        req.address = readU16(frame + 2);

        switch (req.functionCode) {
            case FuncCodes::READ_HOLDING_REGISTERS:
            case FuncCodes::READ_INPUT_REGISTERS:
                if (len != MIN_REQUEST_SIZE) {
                    result.error = ModbusError::InvalidLength;
                    return result;
                }
                req.quantity = readU16(frame + 4);
                break;

            case FuncCodes::WRITE_SINGLE_REGISTER:
                if (len != MIN_REQUEST_SIZE) {
                    result.error = ModbusError::InvalidLength;
                    return result;
                }
                req.value = readU16(frame + 4);
                req.quantity = 1;
                break;

            case FuncCodes::WRITE_MULTIPLE_REGISTERS: {
                req.quantity = readU16(frame + 4);
                req.byteCount = frame[6];
                if (req.byteCount > MAX_WRITE_PAYLOAD) {
                    result.error = ModbusError::BufferTooSmall;
                    return result;
                }
                if (7 + static_cast<size_t>(req.byteCount) + 2 != len) {
                    result.error = ModbusError::InvalidLength;
                    return result;
                }
                req.payload.assign(frame + 7, frame + 7 + req.byteCount);
                break;
            }

            default:
                result.error = ModbusError::Exception;
                result.exception = ExceptionCode::IllegalFunction;
                return result;
        }

        return result;
    }

    static ParseResult parseRtuRequest(const std::vector<uint8_t>& frame, uint8_t slaveAddress) {
        return parseRtuRequest(frame.data(), frame.size(), slaveAddress);
    }

    // ==================== 响应构建 ====================

    /**
     * @brief 构建正常响应 [Slave][FC][Data...][CRC16]
     * @return None 或 BufferTooSmall（超过 256 字节 ADU）
     */
    static ModbusError buildRtuResponse(const ModbusResponse& resp, std::vector<uint8_t>& out) {
        if (2 + resp.data.size() + 2 > MAX_ADU_SIZE) {
            return ModbusError::BufferTooSmall;
        }
        out.clear();
        out.reserve(2 + resp.data.size() + 2);
        out.push_back(resp.slaveId);
        out.push_back(resp.functionCode);
        out.insert(out.end(), resp.data.begin(), resp.data.end());
        appendCrc(out);
        return ModbusError::None;
    }

    /**
     * @brief 构建异常响应 [Slave][FC|0x80][ExceptionCode][CRC16]
     */
    static std::vector<uint8_t> buildException(uint8_t slaveId, uint8_t functionCode, ExceptionCode code) {
        std::vector<uint8_t> frame;
        frame.reserve(5);
        frame.push_back(slaveId);
        frame.push_back(static_cast<uint8_t>(functionCode | FuncCodes::EXCEPTION_FLAG));
        frame.push_back(static_cast<uint8_t>(code));
        appendCrc(frame);
        return frame;
    }

    // ==================== 流式分帧 ====================

    /**
     * @brief 从接收缓冲区头部推算下一帧请求长度
     * @return 帧长度；0 = 数据不足；FRAME_CORRUPT = 长度字段越界
     *
     * 不支持的标准功能码也能定界，以便回复 IllegalFunction。
     * 其余功能码按 8 字节定长帧试探，由调用方的 CRC 校验区分真实请求与线路噪声。
     */
    static size_t rtuRequestFrameLength(const uint8_t* data, size_t len) {
        if (len < 2) return 0;

        switch (data[1]) {
            case FuncCodes::READ_COILS:
            case FuncCodes::READ_DISCRETE_INPUTS:
            case FuncCodes::READ_HOLDING_REGISTERS:
            case FuncCodes::READ_INPUT_REGISTERS:
            case FuncCodes::WRITE_SINGLE_COIL:
            case FuncCodes::WRITE_SINGLE_REGISTER:
                return MIN_REQUEST_SIZE;

            case FuncCodes::WRITE_MULTIPLE_COILS:
            case FuncCodes::WRITE_MULTIPLE_REGISTERS: {
                if (len < 7) return 0;
                size_t frameLen = 7 + static_cast<size_t>(data[6]) + 2;
                return frameLen > MAX_ADU_SIZE ? FRAME_CORRUPT : frameLen;
            }

            case FuncCodes::READ_WRITE_MULTIPLE_REGISTERS: {
                if (len < 11) return 0;
                size_t frameLen = 11 + static_cast<size_t>(data[10]) + 2;
                return frameLen > MAX_ADU_SIZE ? FRAME_CORRUPT : frameLen;
            }

            default:
                return MIN_REQUEST_SIZE;
        }
    }

    // ==================== 数据转换 ====================

    static uint16_t readU16(const uint8_t* p) {
        return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
    }

    static void appendU16(std::vector<uint8_t>& out, uint16_t v) {
        out.push_back(static_cast<uint8_t>(v >> 8));
        out.push_back(static_cast<uint8_t>(v & 0xFF));
    }

    /** IEEE-754 单精度，大端（AB CD，标准 Modbus） */
    static void appendFloat(std::vector<uint8_t>& out, float value) {
        uint32_t bits = std::bit_cast<uint32_t>(value);
        out.push_back(static_cast<uint8_t>(bits >> 24));
        out.push_back(static_cast<uint8_t>(bits >> 16));
        out.push_back(static_cast<uint8_t>(bits >> 8));
        out.push_back(static_cast<uint8_t>(bits));
    }

    static float readFloat(const uint8_t* p) {
        uint32_t bits = (static_cast<uint32_t>(p[0]) << 24)
                      | (static_cast<uint32_t>(p[1]) << 16)
                      | (static_cast<uint32_t>(p[2]) << 8)
                      | static_cast<uint32_t>(p[3]);
        return std::bit_cast<float>(bits);
    }

    /** 日志用十六进制串 "01 03 00 00" */
    static std::string toHexString(const uint8_t* data, size_t len) {
        std::ostringstream oss;
        oss << std::hex << std::uppercase << std::setfill('0');
        for (size_t i = 0; i < len; ++i) {
            if (i > 0) oss << ' ';
            oss << std::setw(2) << static_cast<int>(data[i]);
        }
        return oss.str();
    }

    static std::string toHexString(const std::vector<uint8_t>& data) {
        return toHexString(data.data(), data.size());
    }
};

}  // namespace modbus
