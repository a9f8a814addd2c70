#pragma once

#include <string>
#include <vector>

namespace wfmk {

/// Game distribution channel a query is scoped to.
enum class Platform { Pc, Ps4, Switch, Xbox };

/// Lower-case wire name ("pc", "ps4", ...).
std::string toString(Platform platform);

/// Parse a wire name. Throws ConfigError on an unknown platform.
Platform parsePlatform(const std::string& name);

/// Mirrors one entry of the /v1/items catalog.
struct Item {
    std::string id;
    std::string name;      // item_name, e.g. "Ember Prime Set"
    std::string urlName;   // url_name, e.g. "ember_prime_set"
};

/// Mirrors one entry of /v1/items/<url_name>/orders.
struct Order {
    std::string userName;
    std::string userStatus;   // "ingame", "online", "offline"
    std::string platform;
    std::string region;
    std::string orderType;    // "buy" or "sell"
    int         price    = 0; // platinum per unit
    int         quantity = 0;
};

using ItemList  = std::vector<Item>;
using OrderList = std::vector<Order>;

/// One remote call. Built once, never mutated.
struct FetchRequest {
    enum class Kind { Catalog, Orders };

    Kind        kind;
    std::string urlName;     // empty for Catalog
    Platform    platform;
    std::string language;

    /// Cache identity; distinct per platform and language.
    std::string cacheKey() const;

    /// Human readable label for log and error messages.
    std::string describe() const;
};

} // namespace wfmk
