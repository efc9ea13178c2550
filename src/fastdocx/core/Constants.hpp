#pragma once

#include <cstddef>

namespace fastdocx {
namespace core {

// 通用常量集中定义，便于统一调整与复用
struct Constants {
    // I/O 缓冲区大小
    static constexpr size_t kIOBufferSize = 8192;

    // XML 最大嵌套深度（超出部分仍解析，但不再进入轻量元素栈）
    static constexpr size_t kMaxXMLDepth = 256;

    // ZIP 默认压缩级别（0 = STORE）
    static constexpr int kDefaultCompressionLevel = 6;

    // 默认日志文件
    static constexpr const char* kDefaultLogFile = "logs/fastdocx.log";
};

} // namespace core
} // namespace fastdocx
