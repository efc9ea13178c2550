#pragma once

#include "fastdocx/archive/ZipError.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <mutex>
#include <cstdint>

namespace fastdocx {
namespace archive {

/**
 * @brief ZIP读取器，基于 minizip-ng
 *
 * 打开时建立条目缓存，按路径查找。条目顺序保持归档中的原始顺序。
 */
class ZipReader {
public:
    struct EntryInfo {
        std::string path;
        uint64_t compressed_size = 0;
        uint64_t uncompressed_size = 0;
        uint32_t crc32 = 0;
        bool is_directory = false;
    };

    explicit ZipReader(std::string path);
    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    bool open();
    void close();
    bool isOpen() const { return is_open_; }
    const std::string& path() const { return filename_; }

    /**
     * @brief 归档中所有文件条目（不含目录），保持原始顺序
     */
    std::vector<std::string> listFiles() const;

    ZipError fileExists(std::string_view internal_path) const;
    bool getEntryInfo(std::string_view internal_path, EntryInfo& info) const;

    ZipError extractFile(std::string_view internal_path, std::string& content);

private:
    bool initializeReader();
    void cleanup();
    void buildEntryCache();

    void* unzip_handle_ = nullptr;
    std::string filename_;
    bool is_open_ = false;

    std::vector<EntryInfo> entries_;
    std::map<std::string, size_t, std::less<>> entry_index_;
    mutable std::mutex mutex_;
};

}} // namespace fastdocx::archive
