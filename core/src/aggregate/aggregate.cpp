#include "labelsheet/aggregate.h"
#include "detail/string_utils.h"

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <map>
#include <string>
#include <vector>

namespace LabelSheet {
namespace {

// Cells above this saturate; counts are sums of spreadsheet integers.
constexpr double kMaxQuantity = static_cast<double>(std::numeric_limits<int32_t>::max());

struct Totals {
    int64_t carry_out = 0;
    int64_t dine_in   = 0;
};

} // namespace

int64_t ParseQuantity(std::string_view text) {
    const std::string s = detail::Trim(text);
    if (s.empty()) { return 0; }
    // strtod would accept hex; spreadsheets never mean hex here.
    if (s.find_first_of("xX") != std::string::npos) { return 0; }

    char* end          = nullptr;
    const double value = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size()) { return 0; }
    if (!std::isfinite(value) || value <= 0.0) { return 0; }
    if (value >= kMaxQuantity) { return static_cast<int64_t>(kMaxQuantity); }
    return static_cast<int64_t>(std::trunc(value));
}

std::vector<AggregatedOrder> AggregateOrders(const std::vector<CanonicalOrderRow>& rows) {
    std::map<std::string, Totals> groups;
    size_t dropped = 0;
    for (const CanonicalOrderRow& row : rows) {
        std::string name = detail::Trim(row.name);
        if (name.empty()) {
            ++dropped;
            continue;
        }
        Totals& t = groups[std::move(name)];
        t.carry_out += ParseQuantity(row.carry_out);
        t.dine_in += ParseQuantity(row.dine_in);
    }

    std::vector<AggregatedOrder> out;
    out.reserve(groups.size());
    for (const auto& [name, totals] : groups) {
        out.push_back(AggregatedOrder{name, totals.carry_out, totals.dine_in});
    }
    spdlog::debug("AggregateOrders: {} row(s) -> {} name(s), {} blank row(s) dropped",
                  rows.size(), out.size(), dropped);
    return out;
}

std::vector<DineInSummaryEntry> BuildDineInSummary(const std::vector<AggregatedOrder>& orders) {
    std::vector<DineInSummaryEntry> out;
    for (const AggregatedOrder& order : orders) {
        if (order.dine_in > 0) { out.push_back(DineInSummaryEntry{order.name, order.dine_in}); }
    }
    return out;
}

} // namespace LabelSheet
