#pragma once

#include "fastdocx/xml/XMLElement.hpp"
#include <optional>
#include <vector>

namespace fastdocx {
namespace numbering {

/**
 * @brief 编号定义（w:numbering）
 *
 * 只维护 w:num 实例与其引用的 w:abstractNumId，抽象定义本身不解析。
 */
class Numbering {
public:
    explicit Numbering(xml::XMLElement& root) : root_(root) {}

    size_t numCount() const;

    /**
     * @brief 新增引用 abstract_num_id 的 w:num
     * @return 新的 numId（现有最大值加一）
     */
    int addNum(int abstract_num_id);

    bool hasNum(int num_id) const;
    std::optional<int> abstractNumIdOf(int num_id) const;

    std::vector<int> numIds() const;

private:
    xml::XMLElement* findNum(int num_id) const;

    xml::XMLElement& root_;
};

}} // namespace fastdocx::numbering
