#pragma once

/**
 * @brief CRC 保护页的校验结论
 *
 * 存储组件只报告结论，不替调用方决定回退策略：
 * 配置页是否回落默认值、历史缓冲是否从空开始，都由上层服务决定。
 */
enum class PageStatus {
    Validated,      // CRC 正确
    Corrupt,        // 有数据但 CRC 不匹配
    NeverWritten    // 全 0xFF / 全 0x00
};

inline const char* pageStatusToString(PageStatus status) {
    switch (status) {
        case PageStatus::Validated: return "VALIDATED";
        case PageStatus::Corrupt: return "CORRUPT";
        case PageStatus::NeverWritten: return "NEVER_WRITTEN";
    }
    return "UNKNOWN";
}
