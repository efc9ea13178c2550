#include "fastdocx/archive/ZipReader.hpp"
#include "fastdocx/utils/ModuleLoggers.hpp"
#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <climits>

namespace fastdocx {
namespace archive {

ZipReader::ZipReader(std::string path) : filename_(std::move(path)) {}

ZipReader::~ZipReader() {
    cleanup();
}

bool ZipReader::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup();
    return initializeReader();
}

void ZipReader::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup();
}

std::vector<std::string> ZipReader::listFiles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> files;
    if (!is_open_) {
        return files;
    }

    files.reserve(entries_.size());
    for (const auto& entry : entries_) {
        if (!entry.is_directory) {
            files.push_back(entry.path);
        }
    }
    return files;
}

ZipError ZipReader::fileExists(std::string_view internal_path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_open_) {
        return ZipError::NotOpen;
    }
    return entry_index_.find(internal_path) != entry_index_.end() ? ZipError::Ok : ZipError::FileNotFound;
}

bool ZipReader::getEntryInfo(std::string_view internal_path, EntryInfo& info) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_open_) {
        return false;
    }
    auto it = entry_index_.find(internal_path);
    if (it == entry_index_.end()) {
        return false;
    }
    info = entries_[it->second];
    return true;
}

ZipError ZipReader::extractFile(std::string_view internal_path, std::string& content) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!is_open_ || !unzip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for reading");
        return ZipError::NotOpen;
    }

    std::string path_str(internal_path);
    if (mz_zip_reader_locate_entry(unzip_handle_, path_str.c_str(), 0) != MZ_OK) {
        ARCHIVE_ERROR("File {} not found in zip archive", path_str);
        return ZipError::FileNotFound;
    }

    mz_zip_file* info = nullptr;
    if (mz_zip_reader_entry_get_info(unzip_handle_, &info) != MZ_OK || !info) {
        return ZipError::BadFormat;
    }
    if (info->uncompressed_size > static_cast<uint64_t>(INT32_MAX)) {
        ARCHIVE_ERROR("File {} is too large ({} bytes)", path_str, info->uncompressed_size);
        return ZipError::TooLarge;
    }

    if (mz_zip_reader_entry_open(unzip_handle_) != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry {}", path_str);
        return ZipError::IoFail;
    }

    std::string buffer(static_cast<size_t>(info->uncompressed_size), '\0');
    int32_t expected = static_cast<int32_t>(info->uncompressed_size);
    int32_t total = 0;
    while (total < expected) {
        int32_t read = mz_zip_reader_entry_read(unzip_handle_, &buffer[static_cast<size_t>(total)], expected - total);
        if (read <= 0) {
            break;
        }
        total += read;
    }
    mz_zip_reader_entry_close(unzip_handle_);

    if (total != expected) {
        ARCHIVE_ERROR("Incomplete read for file {}, expected: {} bytes, read: {} bytes", path_str, expected, total);
        return ZipError::IoFail;
    }

    content.swap(buffer);
    FASTDOCX_LOG_ZIP_DEBUG("Extracted file {} from zip, size: {} bytes", path_str, content.size());
    return ZipError::Ok;
}

bool ZipReader::initializeReader() {
    unzip_handle_ = mz_zip_reader_create();
    if (!unzip_handle_) {
        ARCHIVE_ERROR("Failed to create zip reader");
        return false;
    }

    int32_t result = mz_zip_reader_open_file(unzip_handle_, filename_.c_str());
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open zip file for reading: {}, error: {}", filename_, result);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
        return false;
    }

    is_open_ = true;
    buildEntryCache();
    ARCHIVE_DEBUG("Zip archive opened for reading: {} ({} entries)", filename_, entries_.size());
    return true;
}

void ZipReader::cleanup() {
    if (unzip_handle_) {
        mz_zip_reader_close(unzip_handle_);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
    }
    is_open_ = false;
    entries_.clear();
    entry_index_.clear();
}

void ZipReader::buildEntryCache() {
    entries_.clear();
    entry_index_.clear();

    if (mz_zip_reader_goto_first_entry(unzip_handle_) != MZ_OK) {
        return;
    }

    do {
        mz_zip_file* file_info = nullptr;
        if (mz_zip_reader_entry_get_info(unzip_handle_, &file_info) != MZ_OK || !file_info) {
            continue;
        }
        if (!file_info->filename || file_info->filename[0] == '\0') {
            continue;
        }

        EntryInfo info;
        info.path = file_info->filename;
        info.compressed_size = static_cast<uint64_t>(file_info->compressed_size);
        info.uncompressed_size = static_cast<uint64_t>(file_info->uncompressed_size);
        info.crc32 = file_info->crc;
        info.is_directory = info.path.back() == '/';

        // 重名条目以第一个为准，与 locate_entry 的行为一致
        if (entry_index_.find(info.path) != entry_index_.end()) {
            ARCHIVE_WARN("Duplicate zip entry ignored: {}", info.path);
            continue;
        }
        entry_index_.emplace(info.path, entries_.size());
        entries_.push_back(std::move(info));
    } while (mz_zip_reader_goto_next_entry(unzip_handle_) == MZ_OK);
}

}} // namespace fastdocx::archive
