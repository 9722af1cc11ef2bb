#pragma once

#include "Modbus.Utils.hpp"

namespace modbus {

/** 接收缓冲区上限（字节），超过则清空防止内存泄漏 */
inline constexpr size_t MAX_BUFFER_SIZE = 1024;

/**
 * @brief RTU 请求流式分帧（单连接）
 *
 * 处理 TCP 流式传输的粘包/拆包：
 * - 数据追加到缓冲区，while 循环持续切帧（一次接收多帧）
 * - 帧不完整时等待更多数据
 * - 长度越界或 CRC 不匹配时跳过 1 字节重新对齐
 * - 未知功能码按 8 字节帧校验 CRC，通过则交给上层回复 IllegalFunction
 * - 缓冲区超限时清空
 */
class RtuFrameBuffer {
private:
    std::vector<uint8_t> buffer_;
    uint64_t resyncBytes_ = 0;

public:
    std::vector<std::vector<uint8_t>> append(const uint8_t* data, size_t len) {
        std::vector<std::vector<uint8_t>> frames;
        buffer_.insert(buffer_.end(), data, data + len);

        while (!buffer_.empty()) {
            size_t frameLen = ModbusUtils::rtuRequestFrameLength(buffer_.data(), buffer_.size());

            if (frameLen == 0 || (frameLen != ModbusUtils::FRAME_CORRUPT && buffer_.size() < frameLen)) {
                if (buffer_.size() > MAX_BUFFER_SIZE) {
                    LOG_ERROR << "[Modbus] Buffer overflow (" << buffer_.size() << "B), clearing";
                    buffer_.clear();
                }
                break;
            }

            if (frameLen == ModbusUtils::FRAME_CORRUPT || !crcMatches(frameLen)) {
                LOG_DEBUG << "[Modbus] Corrupt frame, skip 1B for resync | head="
                          << ModbusUtils::toHexString(buffer_.data(), (std::min)(buffer_.size(), size_t(8)));
                buffer_.erase(buffer_.begin());
                ++resyncBytes_;
                continue;
            }

            frames.emplace_back(buffer_.begin(), buffer_.begin() + static_cast<ptrdiff_t>(frameLen));
            buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<ptrdiff_t>(frameLen));
        }

        return frames;
    }

    std::vector<std::vector<uint8_t>> append(const std::string& data) {
        return append(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    }

    size_t pending() const { return buffer_.size(); }
    uint64_t resyncBytes() const { return resyncBytes_; }

private:
    bool crcMatches(size_t frameLen) const {
        uint16_t crcRecv = static_cast<uint16_t>(buffer_[frameLen - 2])
                         | (static_cast<uint16_t>(buffer_[frameLen - 1]) << 8);
        return crcRecv == ModbusUtils::crc16(buffer_.data(), frameLen - 2);
    }
};

}  // namespace modbus
