#pragma once

#include "fastdocx/archive/ZipError.hpp"
#include <string>
#include <string_view>
#include <unordered_set>
#include <mutex>
#include <cstdint>

namespace fastdocx {
namespace archive {

/**
 * @brief ZIP写入器，基于 minizip-ng
 *
 * open() 总是新建文件（已存在则覆盖），close() 写出中央目录。
 * 同一路径只写入一次，重复写入返回 InvalidParameter。
 */
class ZipWriter {
public:
    explicit ZipWriter(std::string path);
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    bool open();

    /**
     * @brief 完成归档
     * @return 中央目录写出失败时返回 false
     */
    bool close();
    bool isOpen() const { return is_open_; }

    ZipError addFile(std::string_view internal_path, std::string_view content);

    /**
     * @brief 压缩级别 0-9，0 表示仅存储
     */
    ZipError setCompressionLevel(int level);
    int compressionLevel() const { return compression_level_; }

    size_t entriesWritten() const { return written_paths_.size(); }

private:
    bool initializeWriter();
    void cleanup();
    ZipError writeFileEntry(const std::string& internal_path, const void* data, size_t size);

    void* zip_handle_ = nullptr;
    std::string filename_;
    bool is_open_ = false;
    int compression_level_;

    std::unordered_set<std::string> written_paths_;
    mutable std::mutex mutex_;
};

}} // namespace fastdocx::archive
