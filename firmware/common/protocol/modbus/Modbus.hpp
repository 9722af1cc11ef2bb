#pragma once

/**
 * @brief Modbus RTU 从站模块
 *
 * 包含:
 * - Modbus.Types.hpp   - 功能码、异常码、错误码、请求/响应结构
 * - Modbus.Utils.hpp   - CRC16、请求解析、响应/异常构建、流式分帧
 * - Modbus.Framer.hpp  - RTU 字节流分帧与重新对齐
 * - Modbus.Handler.hpp - 寄存器映射：配置记录镜像与流量遥测
 */

#include "Modbus.Types.hpp"
#include "Modbus.Utils.hpp"
#include "Modbus.Framer.hpp"
#include "Modbus.Handler.hpp"
