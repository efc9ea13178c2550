#pragma once

#include <string>

namespace fastdocx {
namespace opc {

/**
 * @brief 文档核心属性（docProps/core.xml）
 *
 * 文本字段原样保存；日期字段是 W3CDTF 字符串，设置时校验格式。
 * revision 为正整数，0 表示未设置。
 */
class CoreProperties {
public:
    CoreProperties() = default;

    const std::string& title() const { return title_; }
    void setTitle(const std::string& value) { title_ = value; }

    const std::string& subject() const { return subject_; }
    void setSubject(const std::string& value) { subject_ = value; }

    // dc:creator
    const std::string& author() const { return author_; }
    void setAuthor(const std::string& value) { author_ = value; }

    const std::string& keywords() const { return keywords_; }
    void setKeywords(const std::string& value) { keywords_ = value; }

    // dc:description
    const std::string& comments() const { return comments_; }
    void setComments(const std::string& value) { comments_ = value; }

    const std::string& lastModifiedBy() const { return last_modified_by_; }
    void setLastModifiedBy(const std::string& value) { last_modified_by_ = value; }

    const std::string& category() const { return category_; }
    void setCategory(const std::string& value) { category_ = value; }

    const std::string& contentStatus() const { return content_status_; }
    void setContentStatus(const std::string& value) { content_status_ = value; }

    const std::string& identifier() const { return identifier_; }
    void setIdentifier(const std::string& value) { identifier_ = value; }

    const std::string& language() const { return language_; }
    void setLanguage(const std::string& value) { language_ = value; }

    const std::string& version() const { return version_; }
    void setVersion(const std::string& value) { version_ = value; }

    int revision() const { return revision_; }

    /**
     * @throws core::ParameterException value 不是正整数时
     */
    void setRevision(int value);

    /**
     * @brief 从文本解析修订号，非法或非正数视为未设置
     */
    void setRevisionText(const std::string& text);

    const std::string& created() const { return created_; }
    const std::string& modified() const { return modified_; }
    const std::string& lastPrinted() const { return last_printed_; }

    /**
     * @throws core::ParameterException 非空且不是合法 W3CDTF 时
     */
    void setCreated(const std::string& w3cdtf);
    void setModified(const std::string& w3cdtf);
    void setLastPrinted(const std::string& w3cdtf);

    /**
     * @brief 把 modified 设为当前UTC时间
     */
    void touchModified();

private:
    static void validateDate(const std::string& value, const char* field);

    std::string title_;
    std::string subject_;
    std::string author_;
    std::string keywords_;
    std::string comments_;
    std::string last_modified_by_;
    std::string category_;
    std::string content_status_;
    std::string identifier_;
    std::string language_;
    std::string version_;
    int revision_ = 0;
    std::string created_;
    std::string modified_;
    std::string last_printed_;
};

}} // namespace fastdocx::opc
