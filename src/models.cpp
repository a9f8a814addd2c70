#include "models.hpp"
#include "errors.hpp"

namespace wfmk {

std::string toString(Platform platform) {
    switch (platform) {
        case Platform::Pc:     return "pc";
        case Platform::Ps4:    return "ps4";
        case Platform::Switch: return "switch";
        case Platform::Xbox:   return "xbox";
    }
    return "pc";
}

Platform parsePlatform(const std::string& name) {
    if (name == "pc")     return Platform::Pc;
    if (name == "ps4")    return Platform::Ps4;
    if (name == "switch") return Platform::Switch;
    if (name == "xbox")   return Platform::Xbox;
    throw ConfigError("invalid platform '" + name +
                      "' (choose from pc, ps4, switch, xbox)");
}

std::string FetchRequest::cacheKey() const {
    const std::string suffix = "-" + toString(platform) + "-" + language;
    if (kind == Kind::Catalog) {
        return "all_items" + suffix;
    }
    return urlName + "-orders" + suffix;
}

std::string FetchRequest::describe() const {
    if (kind == Kind::Catalog) {
        return "all items";
    }
    return "orders for '" + urlName + "'";
}

} // namespace wfmk
