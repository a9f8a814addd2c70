#include "report.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iterator>
#include <numeric>

namespace wfmk {

namespace {

constexpr std::size_t kTopOrders = 5;

// Rounds half to even.
int roundPrice(double value) {
    return static_cast<int>(std::nearbyint(value));
}

std::string cell(const std::optional<int>& value) {
    return value ? std::to_string(*value) : "N/A";
}

/// Borderless table: first column left-aligned, the rest right-aligned.
void printTable(std::ostream& out,
                const std::vector<std::string>& header,
                const std::vector<std::vector<std::string>>& rows) {
    std::vector<std::size_t> widths(header.size(), 0);
    for (std::size_t c = 0; c < header.size(); ++c) {
        widths[c] = header[c].size();
    }
    for (const auto& row : rows) {
        for (std::size_t c = 0; c < row.size() && c < widths.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    auto printRow = [&](const std::vector<std::string>& row) {
        for (std::size_t c = 0; c < widths.size(); ++c) {
            const std::string& text = c < row.size() ? row[c] : std::string();
            out << (c == 0 ? "" : "  ")
                << (c == 0 ? std::left : std::right)
                << std::setw(static_cast<int>(widths[c])) << text;
        }
        out << std::right << "\n";
    };

    printRow(header);
    for (const auto& row : rows) {
        printRow(row);
    }
}

} // namespace

OrderList filterOrders(const OrderList& orders, const OrderFilter& filter) {
    const std::string wanted = filter.buyers ? "buy" : "sell";

    OrderList kept;
    std::copy_if(orders.begin(), orders.end(), std::back_inserter(kept),
                 [&](const Order& o) {
                     return o.orderType == wanted &&
                            o.userStatus != "offline" &&
                            o.platform == filter.platform &&
                            o.region == filter.language;
                 });
    return kept;
}

void sortByPrice(OrderList& orders, bool buyers, bool reverse) {
    const bool descending = buyers != reverse;
    std::stable_sort(orders.begin(), orders.end(),
                     [descending](const Order& a, const Order& b) {
                         return descending ? a.price > b.price : a.price < b.price;
                     });
}

PriceSummary summarize(const std::string& item, const OrderList& orders) {
    PriceSummary summary;
    summary.item  = item;
    summary.count = orders.size();
    if (orders.empty()) {
        return summary;
    }

    std::vector<double> prices;
    prices.reserve(orders.size());
    for (const auto& o : orders) {
        prices.push_back(o.price);
    }

    const auto [lo, hi] = std::minmax_element(prices.begin(), prices.end());
    summary.min = roundPrice(*lo);
    summary.max = roundPrice(*hi);

    const std::size_t n = std::min(prices.size(), kTopOrders);
    const double mean = std::accumulate(prices.begin(), prices.begin() + n, 0.0) / n;
    summary.avg5 = roundPrice(mean);

    if (n > 1) {
        double sq = 0.0;
        for (std::size_t i = 0; i < n; ++i) {
            sq += (prices[i] - mean) * (prices[i] - mean);
        }
        summary.stdev5 = roundPrice(std::sqrt(sq / static_cast<double>(n - 1)));
    }
    return summary;
}

void printSummaryTable(std::ostream& out, std::vector<PriceSummary> rows) {
    std::stable_sort(rows.begin(), rows.end(),
                     [](const PriceSummary& a, const PriceSummary& b) {
                         return a.item < b.item;
                     });

    std::vector<std::vector<std::string>> cells;
    cells.reserve(rows.size());
    for (const auto& r : rows) {
        cells.push_back({r.item, cell(r.min), cell(r.avg5), cell(r.max),
                         cell(r.stdev5), std::to_string(r.count)});
    }
    printTable(out, {"Item", "Min", "Avg5", "Max", "StDev5", "Count"}, cells);
}

void printOrdersTable(std::ostream& out,
                      const std::string& item,
                      const OrderList& orders,
                      bool buyers,
                      std::size_t limit) {
    out << "--- " << item << " " << (buyers ? "Buyers" : "Sellers") << " ---\n";

    std::vector<std::vector<std::string>> cells;
    for (std::size_t i = 0; i < orders.size() && i < limit; ++i) {
        cells.push_back({orders[i].userName,
                         std::to_string(orders[i].price),
                         std::to_string(orders[i].quantity)});
    }
    printTable(out, {"Username", "Price", "Count"}, cells);
    out << "\n";
}

} // namespace wfmk
