#include "fastdocx/opc/PackURI.hpp"
#include "fastdocx/core/Exception.hpp"
#include <algorithm>
#include <cctype>
#include <vector>
#include <fmt/format.h>

namespace fastdocx {
namespace opc {

namespace {

std::vector<std::string> splitSegments(const std::string& path) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) slash = path.size();
        if (slash > start) {
            segments.push_back(path.substr(start, slash - start));
        }
        start = slash + 1;
    }
    return segments;
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // anonymous namespace

PackURI::PackURI(std::string uri) : uri_(std::move(uri)) {
    if (uri_.empty() || uri_.front() != '/') {
        FASTDOCX_THROW(core::PackageException,
                       fmt::format("PackURI must begin with slash, got '{}'", uri_),
                       uri_, core::ErrorCode::InvalidPartName);
    }
}

PackURI PackURI::fromRelRef(const std::string& base_uri, const std::string& relative_ref) {
    if (!relative_ref.empty() && relative_ref.front() == '/') {
        return PackURI(normalize(relative_ref));
    }
    std::string joined = base_uri;
    if (joined.empty() || joined.back() != '/') {
        joined.push_back('/');
    }
    joined += relative_ref;
    return PackURI(normalize(joined));
}

std::string PackURI::normalize(const std::string& path) {
    std::vector<std::string> stack;
    for (auto& segment : splitSegments(path)) {
        if (segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (!stack.empty()) stack.pop_back();
            continue;
        }
        stack.push_back(std::move(segment));
    }

    std::string result;
    for (const auto& segment : stack) {
        result.push_back('/');
        result += segment;
    }
    return result.empty() ? "/" : result;
}

std::string PackURI::baseURI() const {
    size_t last_slash = uri_.find_last_of('/');
    return last_slash == 0 ? "/" : uri_.substr(0, last_slash);
}

std::string PackURI::filename() const {
    return uri_.substr(uri_.find_last_of('/') + 1);
}

std::string PackURI::ext() const {
    std::string name = filename();
    size_t dot = name.find_last_of('.');
    return dot == std::string::npos ? std::string() : name.substr(dot + 1);
}

std::optional<int> PackURI::idx() const {
    std::string name = filename();
    size_t dot = name.find_last_of('.');
    std::string stem = dot == std::string::npos ? name : name.substr(0, dot);

    size_t digits_start = stem.size();
    while (digits_start > 0 && std::isdigit(static_cast<unsigned char>(stem[digits_start - 1]))) {
        --digits_start;
    }
    // 需要有非数字前缀，"/word/1.xml" 不算带序号
    if (digits_start == stem.size() || digits_start == 0 || stem.size() - digits_start > 9) {
        return std::nullopt;
    }
    return std::stoi(stem.substr(digits_start));
}

std::string PackURI::membername() const {
    return uri_.substr(1);
}

std::string PackURI::relativeRef(const std::string& base_uri) const {
    if (base_uri == "/") {
        return uri_.substr(1);
    }

    auto target = splitSegments(uri_);
    auto base = splitSegments(base_uri);

    size_t common = 0;
    while (common < target.size() && common < base.size() && target[common] == base[common]) {
        ++common;
    }

    std::string result;
    for (size_t i = common; i < base.size(); ++i) {
        result += "../";
    }
    for (size_t i = common; i < target.size(); ++i) {
        result += target[i];
        if (i + 1 < target.size()) result.push_back('/');
    }
    return result;
}

PackURI PackURI::relsUri() const {
    if (uri_ == "/") {
        return PackURI("/_rels/.rels");
    }
    std::string base = baseURI();
    return PackURI(fmt::format("{}/_rels/{}.rels", base == "/" ? "" : base, filename()));
}

bool PackURI::operator==(const PackURI& other) const {
    // 部件名大小写不敏感
    return toLower(uri_) == toLower(other.uri_);
}

bool PackURI::operator<(const PackURI& other) const {
    return toLower(uri_) < toLower(other.uri_);
}

}} // namespace fastdocx::opc
