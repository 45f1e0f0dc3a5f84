#include "labelsheet/layout.h"
#include "labelsheet/error.h"

#include <spdlog/spdlog.h>

#include <string>
#include <vector>

namespace LabelSheet {
namespace {

constexpr double kFitTolerance = 1e-6;

// Baseline offsets of the pack summary body lines below the title.
constexpr double kDoublesLineGap = 6.0;
constexpr double kSinglesLineGap = 4.0;

void DrawCentered(DrawSurface& surface, double center_x, double y, const std::string& text,
                  FontFace font, double size) {
    TextItem item;
    item.x     = center_x;
    item.y     = y;
    item.text  = text;
    item.font  = font;
    item.size  = size;
    item.align = TextAlign::Center;
    surface.DrawText(item);
}

} // namespace

void LabelGrid::Validate() const {
    if (columns <= 0 || rows <= 0) {
        throw ConfigError("LabelGrid columns and rows must be positive");
    }
    if (cell_width <= 0.0 || cell_height <= 0.0) {
        throw ConfigError("LabelGrid cell size must be positive");
    }
    if (horizontal_gap < 0.0 || vertical_gap < 0.0) {
        throw ConfigError("LabelGrid gaps must be >= 0");
    }
    if (margin_x < 0.0 || margin_y < 0.0 || content_padding < 0.0) {
        throw ConfigError("LabelGrid margins and padding must be >= 0");
    }
    if (page_width <= 0.0 || page_height <= 0.0) {
        throw ConfigError("LabelGrid page size must be positive");
    }
    const double used_width  = margin_x + columns * cell_width + (columns - 1) * horizontal_gap;
    const double used_height = margin_y + rows * cell_height + (rows - 1) * vertical_gap;
    if (used_width > page_width + kFitTolerance) {
        throw ConfigError("LabelGrid columns do not fit the page width");
    }
    if (used_height > page_height + kFitTolerance) {
        throw ConfigError("LabelGrid rows do not fit the page height");
    }
}

GridSlot PlaceCard(const LabelGrid& grid, size_t index) {
    if (grid.columns <= 0 || grid.rows <= 0) {
        throw ConfigError("LabelGrid columns and rows must be positive");
    }
    const size_t cells   = grid.CellsPerPage();
    const size_t columns = static_cast<size_t>(grid.columns);

    GridSlot slot;
    slot.page            = index / cells;
    slot.position        = index % cells;
    slot.column          = static_cast<int>(slot.position % columns);
    slot.row             = static_cast<int>(slot.position / columns);
    slot.starts_new_page = index > 0 && slot.position == 0;
    return slot;
}

CellRect CellAt(const LabelGrid& grid, int column, int row) {
    CellRect cell;
    cell.left       = grid.margin_x + column * (grid.cell_width + grid.horizontal_gap);
    cell.top_offset = grid.margin_y + row * (grid.cell_height + grid.vertical_gap);
    cell.width      = grid.cell_width;
    cell.height     = grid.cell_height;
    cell.top        = grid.page_height - cell.top_offset;
    cell.bottom     = cell.top - cell.height;
    return cell;
}

void DrawLabelCard(DrawSurface& surface, const LabelGrid& grid, const CellRect& cell,
                   const LabelCard& card) {
    const double center_x = cell.CenterX();

    if (card.IsPackSummary()) {
        const double title_y   = cell.top - grid.content_padding - kTitleFontSize * 0.6;
        const double doubles_y = title_y - kBodyFontSize - kDoublesLineGap;
        const double singles_y = doubles_y - kBodyFontSize - kSinglesLineGap;

        DrawCentered(surface, center_x, title_y, card.name, FontFace::Bold, kTitleFontSize);
        DrawCentered(surface, center_x, doubles_y,
                     "Doubles: " + std::to_string(card.doubles.value_or(0)), FontFace::Regular,
                     kBodyFontSize);
        DrawCentered(surface, center_x, singles_y,
                     "Singles: " + std::to_string(card.singles.value_or(0)), FontFace::Regular,
                     kBodyFontSize);
        return;
    }

    if (!card.count.has_value()) {
        const double name_y = cell.bottom + cell.height / 2.0 - kTitleFontSize / 2.0;
        DrawCentered(surface, center_x, name_y, card.name, FontFace::Bold, kTitleFontSize);
        return;
    }

    const double name_y  = cell.top - grid.content_padding - kTitleFontSize;
    const double count_y = cell.bottom + cell.height / 2.0 - kCountFontSize * 0.5;
    DrawCentered(surface, center_x, name_y, card.name, FontFace::Bold, kTitleFontSize);
    DrawCentered(surface, center_x, count_y, std::to_string(*card.count), FontFace::Bold,
                 kCountFontSize);
}

size_t RenderLabelPages(DrawSurface& surface, const LabelGrid& grid,
                        const std::vector<LabelCard>& cards) {
    grid.Validate();
    if (cards.empty()) { return 0; }

    size_t pages = 0;
    for (size_t i = 0; i < cards.size(); ++i) {
        const GridSlot slot = PlaceCard(grid, i);
        if (i == 0 || slot.starts_new_page) {
            if (i > 0) { surface.EndPage(); }
            surface.BeginPage(PageKind::Labels);
            ++pages;
        }
        DrawLabelCard(surface, grid, CellAt(grid, slot.column, slot.row), cards[i]);
    }
    surface.EndPage();

    spdlog::debug("RenderLabelPages: {} card(s) on {} page(s)", cards.size(), pages);
    return pages;
}

size_t LabelPageCount(const LabelGrid& grid, size_t card_count) {
    if (grid.columns <= 0 || grid.rows <= 0) { return 0; }
    const size_t cells = grid.CellsPerPage();
    return (card_count + cells - 1) / cells;
}

} // namespace LabelSheet
