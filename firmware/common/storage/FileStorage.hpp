#pragma once

#include "ByteStorage.hpp"

namespace fs = std::filesystem;

/**
 * @brief 以镜像文件模拟 EEPROM
 *
 * 首次打开时按容量创建并填充 0xFF（擦除态）；已存在但尺寸不符的镜像视为错误，
 * 避免把不同器件的数据当作本机数据解释。每次写入后 flush，掉电语义与片上写一致。
 */
class FileStorage : public ByteStorage {
private:
    std::string path_;
    uint32_t capacity_;
    std::fstream file_;

public:
    FileStorage(std::string path, uint32_t capacity)
        : path_(std::move(path)), capacity_(capacity) {
        std::error_code ec;
        if (!fs::exists(path_, ec)) {
            createBlankImage();
        } else if (fs::file_size(path_, ec) != capacity_ || ec) {
            throw StorageException("镜像文件尺寸与配置容量不一致: " + path_);
        }

        file_.open(path_, std::ios::in | std::ios::out | std::ios::binary);
        if (!file_) {
            throw StorageException("无法打开存储镜像: " + path_);
        }
        LOG_INFO << "[Storage] Image " << path_ << " opened, " << capacity_ << " bytes";
    }

    void read(uint32_t offset, uint8_t* data, size_t len) override {
        checkRange(offset, len);
        file_.seekg(offset);
        file_.read(reinterpret_cast<char*>(data), static_cast<std::streamsize>(len));
        if (!file_) {
            file_.clear();
            throw StorageException("读取存储镜像失败: offset=" + std::to_string(offset));
        }
    }

    void write(uint32_t offset, const uint8_t* data, size_t len) override {
        checkRange(offset, len);
        file_.seekp(offset);
        file_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
        file_.flush();
        if (!file_) {
            file_.clear();
            throw StorageException("写入存储镜像失败: offset=" + std::to_string(offset));
        }
    }

    uint32_t capacity() const override { return capacity_; }

private:
    void createBlankImage() {
        auto parent = fs::path(path_).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw StorageException("无法创建存储镜像: " + path_);
        }
        std::vector<char> blank(capacity_, static_cast<char>(0xFF));
        out.write(blank.data(), static_cast<std::streamsize>(blank.size()));
        if (!out) {
            throw StorageException("初始化存储镜像失败: " + path_);
        }
        LOG_WARN << "[Storage] Image " << path_ << " not found, created blank (" << capacity_ << " bytes)";
    }
};
