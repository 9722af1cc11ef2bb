#pragma once

#include "common/utils/AppException.hpp"

/** 器件上的一段命名区域 */
struct StorageRegion {
    std::string name;
    uint32_t offset = 0;
    uint32_t size = 0;

    uint32_t end() const { return offset + size; }
};

/**
 * @brief 器件布局表
 *
 * 各组件的区域以 (name, offset, size) 显式登记，启动时统一校验：
 * - 区域之间不得重叠
 * - 区域不得越过器件容量
 */
class StorageLayout {
private:
    std::vector<StorageRegion> regions_;

public:
    /** 在指定偏移登记区域 */
    StorageLayout& add(std::string name, uint32_t offset, uint32_t size) {
        regions_.push_back({std::move(name), offset, size});
        return *this;
    }

    /** 紧接在末尾区域之后登记（链式布局） */
    StorageLayout& append(std::string name, uint32_t size, uint32_t minOffset = 0) {
        uint32_t offset = minOffset;
        for (const auto& r : regions_) {
            offset = std::max(offset, r.end());
        }
        return add(std::move(name), offset, size);
    }

    const StorageRegion& get(const std::string& name) const {
        for (const auto& r : regions_) {
            if (r.name == name) return r;
        }
        throw AppException(ErrorCodes::LAYOUT_INVALID, "布局中不存在区域: " + name,
                           drogon::k500InternalServerError);
    }

    /** 所有区域的最高结束地址 */
    uint32_t highWaterMark() const {
        uint32_t end = 0;
        for (const auto& r : regions_) {
            end = std::max(end, r.end());
        }
        return end;
    }

    /**
     * @brief 校验布局
     * @throws AppException(LAYOUT_INVALID) 重叠、越界或零长度区域
     */
    void validate(uint32_t deviceCapacity) const {
        std::vector<std::string> errors;

        for (size_t i = 0; i < regions_.size(); ++i) {
            const auto& a = regions_[i];
            if (a.size == 0) {
                errors.push_back(a.name + " 长度为 0");
            }
            if (static_cast<uint64_t>(a.offset) + a.size > deviceCapacity) {
                errors.push_back(a.name + " 超出器件容量 (" + std::to_string(a.end()) +
                                 " > " + std::to_string(deviceCapacity) + ")");
            }
            for (size_t j = i + 1; j < regions_.size(); ++j) {
                const auto& b = regions_[j];
                if (a.offset < b.end() && b.offset < a.end()) {
                    errors.push_back(a.name + " 与 " + b.name + " 重叠");
                }
            }
        }

        if (!errors.empty()) {
            std::string msg = "存储布局非法:";
            for (const auto& e : errors) {
                msg += " [" + e + "]";
            }
            throw AppException(ErrorCodes::LAYOUT_INVALID, msg, drogon::k500InternalServerError);
        }
    }

    std::string describe() const {
        std::ostringstream oss;
        for (const auto& r : regions_) {
            oss << "  " << std::left << std::setw(18) << r.name
                << " 0x" << std::right << std::hex << std::uppercase << std::setw(4) << std::setfill('0') << r.offset
                << "-0x" << std::setw(4) << (r.end() - 1)
                << std::dec << std::setfill(' ') << " (" << r.size << " B)\n";
        }
        return oss.str();
    }
};
