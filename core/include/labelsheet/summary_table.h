/// \file summary_table.h
/// \brief Dine-in summary page: title plus a Name/Number table.

#pragma once

#include "document.h"
#include "layout.h"
#include "order.h"

#include <cstddef>
#include <string>
#include <vector>

namespace LabelSheet {

inline constexpr const char* kSummaryTitle          = "Dine-In Summary";
inline constexpr const char* kSummaryContinuedTitle = "Dine-In Summary (continued)";
inline constexpr const char* kSummaryEmptyMessage   = "No dine-in orders.";

/// Share of the printable width given to the Name column.
inline constexpr double kSummaryNameColumnShare = 0.7;

/// Style of the summary table: bold header on light grey, alternating
/// white/#f3f4f6 rows, grey box and grid, centered Number column.
TableStyle SummaryTableStyle();

/// Header row plus one row per entry, column widths split 70/30 of
/// \p available_width, anchored at (\p x, \p top).
TableItem BuildSummaryTable(const std::vector<DineInSummaryEntry>& entries, double x, double top,
                            double available_width);

/// Body rows that fit on one summary page below the title.
size_t SummaryRowsPerPage(const LabelGrid& grid);

/// Renders the summary on one page, or on continuation pages when the table
/// does not fit. Every page is opened and closed here.
/// \return Number of summary pages emitted (at least 1).
size_t RenderDineInSummary(DrawSurface& surface, const LabelGrid& grid,
                           const std::vector<DineInSummaryEntry>& entries);

} // namespace LabelSheet
