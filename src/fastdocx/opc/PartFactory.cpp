#include "fastdocx/opc/PartFactory.hpp"
#include "fastdocx/opc/ContentTypes.hpp"
#include "fastdocx/opc/XmlPart.hpp"
#include "fastdocx/parts/CorePropertiesPart.hpp"
#include "fastdocx/parts/FooterPart.hpp"
#include "fastdocx/parts/NumberingPart.hpp"
#include "fastdocx/parts/SettingsPart.hpp"
#include "fastdocx/parts/StylesPart.hpp"
#include <mutex>
#include <unordered_map>

namespace fastdocx {
namespace opc {

namespace {

std::mutex& registryMutex() {
    static std::mutex mutex;
    return mutex;
}

std::unordered_map<std::string, PartFactory::Loader>& registry() {
    static std::unordered_map<std::string, PartFactory::Loader> loaders = {
        {ct::kCoreProperties, &parts::CorePropertiesPart::load},
        {ct::kWmlFooter, &parts::FooterPart::load},
        {ct::kWmlNumbering, &parts::NumberingPart::load},
        {ct::kWmlSettings, &parts::SettingsPart::load},
        {ct::kWmlStyles, &parts::StylesPart::load},
    };
    return loaders;
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // anonymous namespace

std::unique_ptr<Part> PartFactory::create(const PackURI& partname, const std::string& content_type,
                                          const std::string& blob, Package* package) {
    Loader loader;
    {
        std::lock_guard<std::mutex> lock(registryMutex());
        auto it = registry().find(content_type);
        if (it != registry().end()) {
            loader = it->second;
        }
    }

    if (loader) {
        return loader(partname, content_type, blob, package);
    }
    if (endsWith(content_type, "+xml") || endsWith(content_type, "/xml")) {
        return XmlPart::load(partname, content_type, blob, package);
    }
    return std::make_unique<Part>(partname, content_type, blob, package);
}

void PartFactory::registerLoader(const std::string& content_type, Loader loader) {
    std::lock_guard<std::mutex> lock(registryMutex());
    registry()[content_type] = std::move(loader);
}

bool PartFactory::hasLoader(const std::string& content_type) {
    std::lock_guard<std::mutex> lock(registryMutex());
    return registry().count(content_type) != 0;
}

}} // namespace fastdocx::opc
