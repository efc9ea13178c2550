#pragma once

#include <string>
#include <optional>

namespace fastdocx {
namespace opc {

/**
 * @brief 包内部件名（以 '/' 开头的绝对路径，如 "/word/footer1.xml"）
 *
 * 根 "/" 表示包本身，其关系文件为 "/_rels/.rels"。
 */
class PackURI {
public:
    /**
     * @throws core::PackageException 不以 '/' 开头时
     */
    explicit PackURI(std::string uri);

    /**
     * @brief 将关系中的相对引用解析为绝对部件名
     * @param base_uri 源部件所在目录，如 "/word"
     * @param relative_ref 如 "../media/image1.png"、"styles.xml"
     */
    static PackURI fromRelRef(const std::string& base_uri, const std::string& relative_ref);

    static PackURI packageUri() { return PackURI("/"); }

    const std::string& str() const { return uri_; }

    // "/word/footer1.xml" -> "/word"，根部件返回 "/"
    std::string baseURI() const;

    // "/word/footer1.xml" -> "footer1.xml"
    std::string filename() const;

    // "/word/footer1.xml" -> "xml"（不含点）
    std::string ext() const;

    /**
     * @brief 文件名末尾的序号，"/word/footer12.xml" -> 12；没有序号时返回 std::nullopt
     */
    std::optional<int> idx() const;

    // ZIP 成员名（去掉开头的 '/'）
    std::string membername() const;

    // 相对 base_uri 的引用，用于写入 .rels 的 Target
    std::string relativeRef(const std::string& base_uri) const;

    // "/word/footer1.xml" -> "/word/_rels/footer1.xml.rels"
    PackURI relsUri() const;

    bool operator==(const PackURI& other) const;
    bool operator!=(const PackURI& other) const { return !(*this == other); }
    bool operator<(const PackURI& other) const;

private:
    static std::string normalize(const std::string& path);

    std::string uri_;
};

}} // namespace fastdocx::opc
