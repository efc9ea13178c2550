#include "fastdocx/archive/ZipWriter.hpp"
#include "fastdocx/core/Constants.hpp"
#include "fastdocx/utils/ModuleLoggers.hpp"
#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <climits>
#include <ctime>
#include <filesystem>

namespace fastdocx {
namespace archive {

ZipWriter::ZipWriter(std::string path)
    : filename_(std::move(path)),
      compression_level_(core::Constants::kDefaultCompressionLevel) {}

ZipWriter::~ZipWriter() {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup();
}

bool ZipWriter::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    cleanup();
    return initializeWriter();
}

bool ZipWriter::close() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!is_open_ || !zip_handle_) {
        return true;
    }

    bool success = true;
    int32_t result = mz_zip_writer_close(zip_handle_);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to finalize ZIP file: {}, error code: {}", filename_, result);
        success = false;
    } else {
        ARCHIVE_DEBUG("ZIP file finalized: {} ({} entries)", filename_, written_paths_.size());
    }

    mz_zip_writer_delete(&zip_handle_);
    zip_handle_ = nullptr;
    is_open_ = false;
    return success;
}

ZipError ZipWriter::addFile(std::string_view internal_path, std::string_view content) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_open_ || !zip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for writing");
        return ZipError::NotOpen;
    }
    if (internal_path.empty()) {
        return ZipError::InvalidParameter;
    }
    return writeFileEntry(std::string(internal_path), content.data(), content.size());
}

ZipError ZipWriter::setCompressionLevel(int level) {
    if (level < 0 || level > 9) {
        return ZipError::InvalidParameter;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    compression_level_ = level;
    if (zip_handle_) {
        mz_zip_writer_set_compress_level(zip_handle_, static_cast<int16_t>(compression_level_));
    }
    return ZipError::Ok;
}

bool ZipWriter::initializeWriter() {
    zip_handle_ = mz_zip_writer_create();
    if (!zip_handle_) {
        ARCHIVE_ERROR("Failed to create zip writer");
        return false;
    }

    mz_zip_writer_set_compress_method(zip_handle_, MZ_COMPRESS_METHOD_DEFLATE);
    mz_zip_writer_set_compress_level(zip_handle_, static_cast<int16_t>(compression_level_));

    std::error_code ec;
    if (std::filesystem::exists(filename_, ec)) {
        std::filesystem::remove(filename_, ec);
        if (ec) {
            ARCHIVE_ERROR("Failed to remove existing file {}: {}", filename_, ec.message());
            mz_zip_writer_delete(&zip_handle_);
            zip_handle_ = nullptr;
            return false;
        }
    }

    int32_t result = mz_zip_writer_open_file(zip_handle_, filename_.c_str(), 0, 0);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open zip file for writing: {}, error: {}", filename_, result);
        mz_zip_writer_delete(&zip_handle_);
        zip_handle_ = nullptr;
        return false;
    }

    // 不写 Data Descriptor，部分 Office 版本对此处理不佳
    void* zip_handle = nullptr;
    if (mz_zip_writer_get_zip_handle(zip_handle_, &zip_handle) == MZ_OK && zip_handle) {
        mz_zip_set_data_descriptor(zip_handle, 0);
    }

    written_paths_.clear();
    is_open_ = true;
    ARCHIVE_DEBUG("ZIP archive opened for writing: {}", filename_);
    return true;
}

void ZipWriter::cleanup() {
    if (zip_handle_) {
        if (is_open_) {
            int32_t result = mz_zip_writer_close(zip_handle_);
            if (result != MZ_OK) {
                ARCHIVE_WARN("Discarding unfinished zip {}: error {}", filename_, result);
            }
        }
        mz_zip_writer_delete(&zip_handle_);
        zip_handle_ = nullptr;
    }
    is_open_ = false;
}

ZipError ZipWriter::writeFileEntry(const std::string& internal_path, const void* data, size_t size) {
    if (written_paths_.count(internal_path) != 0) {
        ARCHIVE_ERROR("File {} already written to zip", internal_path);
        return ZipError::InvalidParameter;
    }
    if (size > static_cast<size_t>(INT32_MAX)) {
        ARCHIVE_ERROR("File {} is too large ({} bytes)", internal_path, size);
        return ZipError::TooLarge;
    }

    std::time_t now = std::time(nullptr);

    mz_zip_file file_info = {};
    file_info.filename = internal_path.c_str();
    file_info.uncompressed_size = static_cast<int64_t>(size);
    file_info.compression_method = compression_level_ == 0 ? MZ_COMPRESS_METHOD_STORE : MZ_COMPRESS_METHOD_DEFLATE;
    file_info.modified_date = now;
    file_info.creation_date = now;
    file_info.flag = 0;
#ifdef _WIN32
    file_info.version_madeby = (MZ_HOST_SYSTEM_WINDOWS_NTFS << 8) | 20;
#else
    file_info.version_madeby = (MZ_HOST_SYSTEM_UNIX << 8) | 20;
#endif

    int32_t result = mz_zip_writer_entry_open(zip_handle_, &file_info);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry for file {} in zip, error: {}", internal_path, result);
        return ZipError::IoFail;
    }

    if (size > 0) {
        int32_t bytes_written = mz_zip_writer_entry_write(zip_handle_, data, static_cast<int32_t>(size));
        if (bytes_written != static_cast<int32_t>(size)) {
            ARCHIVE_ERROR("Failed to write complete data for file {} to zip", internal_path);
            mz_zip_writer_entry_close(zip_handle_);
            return ZipError::IoFail;
        }
    }

    result = mz_zip_writer_entry_close(zip_handle_);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to close entry for file {} in zip, error: {}", internal_path, result);
        return ZipError::IoFail;
    }

    written_paths_.insert(internal_path);
    FASTDOCX_LOG_ZIP_DEBUG("Added file {} to zip, size: {} bytes", internal_path, size);
    return ZipError::Ok;
}

}} // namespace fastdocx::archive
