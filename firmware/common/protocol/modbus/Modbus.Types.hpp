#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace modbus {

// ==================== 常量 ====================

/** RTU ADU 上限：SlaveAddr(1) + PDU(253) + CRC(2) */
inline constexpr size_t MAX_ADU_SIZE = 256;

/** RTU 请求最短帧：SlaveAddr + FC + 4 字节参数 + CRC */
inline constexpr size_t MIN_REQUEST_SIZE = 8;

/** FC10 载荷上限：256 - SlaveAddr - FC - Addr(2) - Qty(2) - ByteCount - CRC(2) */
inline constexpr size_t MAX_WRITE_PAYLOAD = 246;

inline constexpr uint8_t BROADCAST_ADDRESS = 0;
inline constexpr uint8_t MAX_SLAVE_ADDRESS = 247;

// ==================== 功能码常量 ====================

struct FuncCodes {
    static constexpr uint8_t READ_COILS = 0x01;
    static constexpr uint8_t READ_DISCRETE_INPUTS = 0x02;
    static constexpr uint8_t READ_HOLDING_REGISTERS = 0x03;
    static constexpr uint8_t READ_INPUT_REGISTERS = 0x04;
    static constexpr uint8_t WRITE_SINGLE_COIL = 0x05;
    static constexpr uint8_t WRITE_SINGLE_REGISTER = 0x06;
    static constexpr uint8_t WRITE_MULTIPLE_COILS = 0x0F;
    static constexpr uint8_t WRITE_MULTIPLE_REGISTERS = 0x10;
    static constexpr uint8_t READ_WRITE_MULTIPLE_REGISTERS = 0x17;

    static constexpr uint8_t EXCEPTION_FLAG = 0x80;
};

// ==================== 枚举类型 ====================

/** Modbus 异常码 */
enum class ExceptionCode : uint8_t {
    IllegalFunction = 0x01,
    IllegalDataAddress = 0x02,
    IllegalDataValue = 0x03,
    ServerDeviceFailure = 0x04
};

/**
 * @brief 编解码错误
 * Exception 表示帧合法但需要以异常响应回复，其余均为传输层错误（不回复）
 */
enum class ModbusError {
    None,
    InvalidLength,
    InvalidSlaveAddress,
    InvalidCrc,
    BufferTooSmall,
    Exception
};

inline const char* modbusErrorToString(ModbusError err) {
    switch (err) {
        case ModbusError::None: return "None";
        case ModbusError::InvalidLength: return "InvalidLength";
        case ModbusError::InvalidSlaveAddress: return "InvalidSlaveAddress";
        case ModbusError::InvalidCrc: return "InvalidCrc";
        case ModbusError::BufferTooSmall: return "BufferTooSmall";
        case ModbusError::Exception: return "Exception";
    }
    return "Unknown";
}

inline const char* exceptionCodeToString(ExceptionCode code) {
    switch (code) {
        case ExceptionCode::IllegalFunction: return "IllegalFunction";
        case ExceptionCode::IllegalDataAddress: return "IllegalDataAddress";
        case ExceptionCode::IllegalDataValue: return "IllegalDataValue";
        case ExceptionCode::ServerDeviceFailure: return "ServerDeviceFailure";
    }
    return "Unknown";
}

// ==================== 帧结构 ====================

/**
 * @brief 解码后的请求
 *
 * FC03/FC04: address + quantity
 * FC06:      address + value
 * FC10:      address + quantity + payload（byteCount 字节）
 */
struct ModbusRequest {
    uint8_t slaveId = 0;
    uint8_t functionCode = 0;
    uint16_t address = 0;
    uint16_t quantity = 0;
    uint16_t value = 0;
    uint8_t byteCount = 0;
    std::vector<uint8_t> payload;

    bool isBroadcast() const { return slaveId == BROADCAST_ADDRESS; }
};

/** 待编码的正常响应（data 为 FC 之后的全部 PDU 字节） */
struct ModbusResponse {
    uint8_t slaveId = 0;
    uint8_t functionCode = 0;
    std::vector<uint8_t> data;
};

/** parseRtuRequest 结果 */
struct ParseResult {
    ModbusError error = ModbusError::None;
    ExceptionCode exception = ExceptionCode::IllegalFunction;  // 仅 error == Exception 时有效
    ModbusRequest request;  // error == Exception 时 slaveId/functionCode 有效

    bool ok() const { return error == ModbusError::None; }
};

}  // namespace modbus
