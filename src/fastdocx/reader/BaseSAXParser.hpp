#pragma once

#include "fastdocx/xml/XMLStreamReader.hpp"
#include "fastdocx/utils/ModuleLoggers.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstdint>

namespace fastdocx {
namespace reader {

/**
 * @brief SAX解析器基类
 *
 * 包装 XMLStreamReader 的回调，维护元素栈和文本收集状态。
 * 子类只需实现 onStartElement / onEndElement，按需重写 onText。
 * 名称一律按原始带前缀的形式比较（如 "dc:title"）。
 */
class BaseSAXParser {
protected:
    struct ParseState {
        std::vector<std::string> element_stack;
        int current_depth = 0;
        std::string current_text;
        bool collecting_text = false;
        bool has_error = false;
        std::string error_message;

        void reset() {
            element_stack.clear();
            current_depth = 0;
            current_text.clear();
            collecting_text = false;
            has_error = false;
            error_message.clear();
        }
    };

    ParseState state_;

public:
    BaseSAXParser() = default;
    virtual ~BaseSAXParser() = default;

    BaseSAXParser(const BaseSAXParser&) = delete;
    BaseSAXParser& operator=(const BaseSAXParser&) = delete;

    /**
     * @brief 解析XML内容的统一入口
     * @return 是否解析成功，失败原因见 getErrorMessage()
     */
    bool parseXML(const std::string& xml_content) {
        state_.reset();

        if (xml_content.empty()) {
            setError("Empty XML content");
            return false;
        }

        xml::XMLStreamReader reader;
        reader.setTrimWhitespace(false);

        reader.setStartElementCallback([this](std::string_view name, core::span<const xml::XMLAttribute> attributes, int depth) {
            handleStartElement(name, attributes, depth);
        });
        reader.setEndElementCallback([this](std::string_view name, int depth) {
            handleEndElement(name, depth);
        });
        reader.setTextCallback([this](std::string_view text, int depth) {
            handleText(text, depth);
        });

        auto result = reader.parseFromString(xml_content);
        if (result != xml::XMLParseError::Ok) {
            if (!state_.has_error) {
                setError(reader.getLastErrorMessage());
            }
            return false;
        }

        return !state_.has_error;
    }

    bool hasError() const { return state_.has_error; }
    const std::string& getErrorMessage() const { return state_.error_message; }

protected:
    virtual void handleStartElement(std::string_view name, core::span<const xml::XMLAttribute> attributes, int depth) {
        state_.element_stack.emplace_back(name);
        state_.current_depth = depth;
        state_.current_text.clear();
        onStartElement(name, attributes, depth);
    }

    virtual void handleEndElement(std::string_view name, int depth) {
        if (!state_.element_stack.empty()) {
            state_.element_stack.pop_back();
        }
        state_.current_depth = depth;
        onEndElement(name, depth);
        state_.current_text.clear();
    }

    virtual void handleText(std::string_view text, int depth) {
        if (state_.collecting_text) {
            state_.current_text.append(text.data(), text.size());
        }
        onText(text, depth);
    }

    virtual void onStartElement(std::string_view name, core::span<const xml::XMLAttribute> attributes, int depth) = 0;
    virtual void onEndElement(std::string_view name, int depth) = 0;
    virtual void onText(std::string_view /*text*/, int /*depth*/) {}

    // ==================== 属性工具 ====================

    std::optional<std::string> findAttribute(core::span<const xml::XMLAttribute> attributes, std::string_view name) const {
        for (const auto& attr : attributes) {
            if (attr.name == name) {
                return std::string(attr.value);
            }
        }
        return std::nullopt;
    }

    std::string getAttributeOr(core::span<const xml::XMLAttribute> attributes, std::string_view name,
                               const std::string& default_value) const {
        auto val = findAttribute(attributes, name);
        return val ? *val : default_value;
    }

    // ==================== 文本收集 ====================

    void startCollectingText() {
        state_.collecting_text = true;
        state_.current_text.clear();
    }

    void stopCollectingText() {
        state_.collecting_text = false;
    }

    const std::string& getCurrentText() const { return state_.current_text; }

    void setError(const std::string& message) {
        state_.has_error = true;
        state_.error_message = message;
        READER_ERROR("Parser error: {}", message);
    }

    // ==================== 状态查询 ====================

    int getCurrentDepth() const { return state_.current_depth; }

    bool isInElement(std::string_view element_name) const {
        for (const auto& name : state_.element_stack) {
            if (name == element_name) return true;
        }
        return false;
    }
};

}} // namespace fastdocx::reader
