#include "labelsheet/summary_table.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

namespace LabelSheet {
namespace {

// Space between the title baseline and the top of the content.
constexpr double kTitleSpacing = 12.0;

double ContentTop(const LabelGrid& grid) {
    return grid.page_height - grid.margin_y - (kSummaryTitleFontSize + kTitleSpacing);
}

void DrawTitle(DrawSurface& surface, const LabelGrid& grid, const char* title) {
    TextItem item;
    item.x    = grid.margin_x;
    item.y    = grid.page_height - grid.margin_y;
    item.text = title;
    item.font = FontFace::Bold;
    item.size = kSummaryTitleFontSize;
    surface.DrawText(item);
}

} // namespace

TableStyle SummaryTableStyle() {
    TableStyle style;
    style.header_font  = FontFace::Bold;
    style.body_font    = FontFace::Regular;
    style.font_size    = kSummaryBodyFontSize;
    style.column_align = {TextAlign::Left, TextAlign::Center};
    return style;
}

TableItem BuildSummaryTable(const std::vector<DineInSummaryEntry>& entries, double x, double top,
                            double available_width) {
    TableItem table;
    table.x             = x;
    table.top           = top;
    table.column_widths = {available_width * kSummaryNameColumnShare,
                           available_width * (1.0 - kSummaryNameColumnShare)};
    table.style         = SummaryTableStyle();

    table.rows.reserve(entries.size() + 1);
    table.rows.push_back({"Name", "Number"});
    for (const DineInSummaryEntry& e : entries) {
        table.rows.push_back({e.name, std::to_string(e.count)});
    }
    return table;
}

size_t SummaryRowsPerPage(const LabelGrid& grid) {
    const double usable = ContentTop(grid) - grid.margin_y;
    const double rows   = std::floor(usable / SummaryTableStyle().RowHeight());
    // One row is the header; always leave room for at least one entry.
    if (rows < 2.0) { return 1; }
    return static_cast<size_t>(rows) - 1;
}

size_t RenderDineInSummary(DrawSurface& surface, const LabelGrid& grid,
                           const std::vector<DineInSummaryEntry>& entries) {
    const double top             = ContentTop(grid);
    const double available_width = grid.page_width - 2.0 * grid.margin_x;

    if (entries.empty()) {
        surface.BeginPage(PageKind::Summary);
        DrawTitle(surface, grid, kSummaryTitle);
        TextItem msg;
        msg.x    = grid.margin_x;
        msg.y    = top;
        msg.text = kSummaryEmptyMessage;
        msg.font = FontFace::Regular;
        msg.size = kSummaryBodyFontSize;
        surface.DrawText(msg);
        surface.EndPage();
        return 1;
    }

    const size_t per_page = SummaryRowsPerPage(grid);
    size_t pages          = 0;
    for (size_t offset = 0; offset < entries.size(); offset += per_page) {
        const size_t end = std::min(entries.size(), offset + per_page);
        const std::vector<DineInSummaryEntry> chunk(
            entries.begin() + static_cast<std::ptrdiff_t>(offset),
            entries.begin() + static_cast<std::ptrdiff_t>(end));

        surface.BeginPage(PageKind::Summary);
        DrawTitle(surface, grid, pages == 0 ? kSummaryTitle : kSummaryContinuedTitle);
        surface.DrawTable(BuildSummaryTable(chunk, grid.margin_x, top, available_width));
        surface.EndPage();
        ++pages;
    }

    spdlog::debug("RenderDineInSummary: {} entr(ies) on {} page(s)", entries.size(), pages);
    return pages;
}

} // namespace LabelSheet
