#pragma once

#include "common/storage/StorageLayout.hpp"
#include "modules/history/History.Types.hpp"
#include "modules/options/ConfigStore.hpp"

/**
 * @brief 仪表存储器布局
 *
 *   0x0000  config.primary    1024
 *   0x0400  config.secondary  1024
 *   0x1000  history.hour      (2160 桶 × 3600 s)
 *           history.day       (1116 桶 × 86400 s)，紧随 hour
 *           history.month     (120 桶 × 2678400 s)，紧随 day
 */
namespace DeviceLayout {

inline constexpr uint32_t HISTORY_BASE = 0x1000;

/** 25LC256 */
inline constexpr uint32_t DEFAULT_CAPACITY = 32768;

inline StorageLayout build() {
    using namespace history;

    StorageLayout layout;
    layout.add("config.primary", ConfigStore::OFFSET_PRIMARY, ConfigStore::PAGE_SIZE)
          .add("config.secondary", ConfigStore::OFFSET_SECONDARY, ConfigStore::PAGE_SIZE)
          .append(regionNameOf(HistoryKind::Hour), HOUR_GEOMETRY.deviceSize(), HISTORY_BASE)
          .append(regionNameOf(HistoryKind::Day), DAY_GEOMETRY.deviceSize())
          .append(regionNameOf(HistoryKind::Month), MONTH_GEOMETRY.deviceSize());
    return layout;
}

/** 构建并按器件容量校验，失败抛 AppException(LAYOUT_INVALID) */
inline StorageLayout buildValidated(uint32_t deviceCapacity) {
    auto layout = build();
    layout.validate(deviceCapacity);
    return layout;
}

}  // namespace DeviceLayout
