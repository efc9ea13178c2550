#pragma once

#include "fastdocx/opc/Part.hpp"
#include <functional>
#include <memory>
#include <string>

namespace fastdocx {
namespace opc {

/**
 * @brief 按内容类型选择部件类
 *
 * 已登记的内容类型交给对应部件类加载；其余以 "xml" 结尾的内容类型
 * 加载为通用 XmlPart，剩下的作为二进制 Part 原样保存。
 */
class PartFactory {
public:
    using Loader = std::function<std::unique_ptr<Part>(const PackURI& partname,
                                                       const std::string& content_type,
                                                       const std::string& blob,
                                                       Package* package)>;

    static std::unique_ptr<Part> create(const PackURI& partname, const std::string& content_type,
                                        const std::string& blob, Package* package);

    /**
     * @brief 登记或替换某个内容类型的加载函数
     */
    static void registerLoader(const std::string& content_type, Loader loader);

    static bool hasLoader(const std::string& content_type);
};

}} // namespace fastdocx::opc
