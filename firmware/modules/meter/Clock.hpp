#pragma once

#include <chrono>
#include <cstdint>

/**
 * @brief 实时时钟接口（Unix 秒）
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual uint32_t now() const = 0;
};

/** 主机系统时钟 */
class SystemClock : public Clock {
public:
    uint32_t now() const override {
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        return static_cast<uint32_t>(secs);
    }
};
