#pragma once

#include "models.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace wfmk {

struct OrderFilter {
    bool        buyers = false;   // keep buy orders instead of sell orders
    std::string platform;
    std::string language;         // matched against Order::region
};

/// Orders of the requested side from users that are not offline and that
/// trade on the requested platform and region.
OrderList filterOrders(const OrderList& orders, const OrderFilter& filter);

/// Sellers cheapest first, buyers highest bid first; @p reverse flips it.
void sortByPrice(OrderList& orders, bool buyers, bool reverse);

/// One row of the summary table. Empty optionals print as "N/A".
struct PriceSummary {
    std::string        item;
    std::optional<int> min;
    std::optional<int> avg5;     // rounded mean of the first five prices
    std::optional<int> max;
    std::optional<int> stdev5;   // rounded sample stdev of the first five
    std::size_t        count = 0;
};

/// @p orders must already be filtered and sorted.
PriceSummary summarize(const std::string& item, const OrderList& orders);

/// Item | Min | Avg5 | Max | StDev5 | Count, rows sorted by item name.
void printSummaryTable(std::ostream& out, std::vector<PriceSummary> rows);

/// "--- <item> Sellers ---" followed by Username | Price | Count rows.
void printOrdersTable(std::ostream& out,
                      const std::string& item,
                      const OrderList& orders,
                      bool buyers,
                      std::size_t limit);

} // namespace wfmk
