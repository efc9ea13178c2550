#pragma once

// FastDocx - OOXML 文档部件库

#include <string>
#include <memory>

#include "fastdocx/core/Exception.hpp"
#include "fastdocx/opc/Package.hpp"
#include "fastdocx/parts/FooterPart.hpp"
#include "fastdocx/parts/NumberingPart.hpp"
#include "fastdocx/parts/SettingsPart.hpp"
#include "fastdocx/parts/StylesPart.hpp"
#include "fastdocx/parts/CorePropertiesPart.hpp"
#include "fastdocx/document/Footer.hpp"

// 版本信息
#define FASTDOCX_VERSION_MAJOR 1
#define FASTDOCX_VERSION_MINOR 0
#define FASTDOCX_VERSION_PATCH 0
#define FASTDOCX_VERSION_STRING "1.0.0"

namespace fastdocx {

inline std::string getVersion() {
    return FASTDOCX_VERSION_STRING;
}

/**
 * @brief 初始化日志系统
 * @return 日志文件无法打开等情况下返回 false
 */
bool initialize(const std::string& log_file_path = "logs/fastdocx.log", bool enable_console = true);

/**
 * @brief 刷新并关闭日志
 */
void cleanup();

/**
 * @brief 打开已有文档包
 * @throws core::FileException / core::PackageException / core::XMLException
 */
std::unique_ptr<opc::Package> openPackage(const std::string& path);

/**
 * @brief 新建只含主文档部件的空文档包
 */
std::unique_ptr<opc::Package> createDocument();

} // namespace fastdocx
