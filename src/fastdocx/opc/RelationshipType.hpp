#pragma once

#include <string>
#include <cstdint>

namespace fastdocx {
namespace opc {

/**
 * @brief 关系类型（封闭枚举）
 *
 * 加载时遇到不认识的类型URI记为 Unknown，原始URI保存在关系上以便写回。
 */
enum class RelationshipType : uint8_t {
    OfficeDocument,
    Styles,
    Numbering,
    Settings,
    CoreProperties,
    ExtendedProperties,
    Footer,
    Header,
    Image,
    Hyperlink,
    Theme,
    FontTable,
    WebSettings,
    Unknown
};

/**
 * @brief 类型对应的规范URI；Unknown 返回空串
 */
const char* toUri(RelationshipType type) noexcept;

RelationshipType relationshipTypeFromUri(const std::string& uri) noexcept;

const char* toString(RelationshipType type) noexcept;

/**
 * @brief 一个部件至多只能有一条该类型的出边
 */
constexpr bool isSingleton(RelationshipType type) noexcept {
    return type == RelationshipType::Styles ||
           type == RelationshipType::Numbering ||
           type == RelationshipType::Settings ||
           type == RelationshipType::CoreProperties;
}

}} // namespace fastdocx::opc
