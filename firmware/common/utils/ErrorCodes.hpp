#pragma once

/**
 * @brief 统一错误码定义
 *
 * 错误码规则：
 * - 0: 成功
 * - 1xxx: 客户端错误（请求参数、资源不存在等）
 * - 5xxx: 设备内部错误
 *   - 50xx 通用
 *   - 51xx 存储 / 配置页
 *   - 52xx 历史环形缓冲
 */
namespace ErrorCodes {

// ==================== 成功 ====================

/** 操作成功 */
inline constexpr int SUCCESS = 0;

// ==================== 客户端错误 (1xxx) ====================

/** 资源不存在 */
inline constexpr int NOT_FOUND = 1001;

/** 数据验证失败 */
inline constexpr int VALIDATION_FAILED = 1005;

// ==================== 设备错误 (5xxx) ====================

/** 内部错误 */
inline constexpr int INTERNAL_ERROR = 5000;

/** 存储器读写失败 */
inline constexpr int STORAGE_ERROR = 5101;

/** 配置页主副本 CRC 均校验失败 */
inline constexpr int WRONG_CRC = 5102;

/** 存储布局非法（区域重叠或越界） */
inline constexpr int LAYOUT_INVALID = 5103;

/** 历史缓冲未初始化 */
inline constexpr int HISTORY_UNINITIALIZED = 5201;

/** 历史缓冲无记录 */
inline constexpr int HISTORY_NO_RECORDS = 5202;

}  // namespace ErrorCodes
