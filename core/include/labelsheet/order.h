/// \file order.h
/// \brief Order records at each stage of the label pipeline.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace LabelSheet {

/// Raw tabular input as delivered by a file parser: one header row and any
/// number of string rows. Unknown columns are allowed and ignored later.
/// Rows shorter than the header read as empty strings for missing cells.
struct OrderTable {
    std::vector<std::string> columns;
    std::vector<std::vector<std::string>> rows;

    size_t NumRows() const { return rows.size(); }

    bool Empty() const { return rows.empty(); }

    /// Cell value, or "" when \p row is shorter than \p column.
    const std::string& Cell(size_t row, size_t column) const;
};

/// Row restricted to the three canonical fields, values still unparsed.
struct CanonicalOrderRow {
    std::string name;
    std::string carry_out;
    std::string dine_in;
};

/// Per-name totals after grouping. Names are trimmed, non-empty and unique.
struct AggregatedOrder {
    std::string name;
    int64_t carry_out = 0;
    int64_t dine_in   = 0;
};

/// One row of the dine-in summary table (count is always positive).
struct DineInSummaryEntry {
    std::string name;
    int64_t count = 0;
};

inline bool operator==(const AggregatedOrder& a, const AggregatedOrder& b) {
    return a.name == b.name && a.carry_out == b.carry_out && a.dine_in == b.dine_in;
}

inline bool operator==(const DineInSummaryEntry& a, const DineInSummaryEntry& b) {
    return a.name == b.name && a.count == b.count;
}

} // namespace LabelSheet
