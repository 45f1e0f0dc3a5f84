/// \file layout.h
/// \brief Fixed label grid geometry and placement of label cards onto pages.

#pragma once

#include "document.h"
#include "label_card.h"

#include <cstddef>
#include <vector>

namespace LabelSheet {

/// Typography of the reference label sheet, in points.
inline constexpr double kTitleFontSize        = 12.0;
inline constexpr double kBodyFontSize         = 10.0;
inline constexpr double kCountFontSize        = 12.0;
inline constexpr double kSummaryTitleFontSize = 18.0;
inline constexpr double kSummaryBodyFontSize  = 11.0;

/// Geometry of a label sheet. Defaults describe a 3 x 10 sheet of
/// 2.625 x 1 in labels on US letter paper. All lengths are in points.
struct LabelGrid {
    int columns = 3;
    int rows    = 10;

    double cell_width      = 2.625 * kPointsPerInch;
    double cell_height     = 1.0 * kPointsPerInch;
    double horizontal_gap  = 0.1 * kPointsPerInch;
    double vertical_gap    = 0.0;
    double margin_x        = 0.2 * kPointsPerInch;
    double margin_y        = 0.4 * kPointsPerInch;
    double content_padding = 0.2 * kPointsPerInch;

    double page_width  = kLetterWidthPt;
    double page_height = kLetterHeightPt;

    size_t CellsPerPage() const { return static_cast<size_t>(columns) * static_cast<size_t>(rows); }

    /// Validate internal consistency; throws ConfigError on failure.
    void Validate() const;
};

/// Where the card at a given sequence index lands.
struct GridSlot {
    size_t page     = 0; ///< Zero-based page among label pages.
    size_t position = 0; ///< index mod CellsPerPage.
    int column      = 0;
    int row         = 0;

    /// True when this card opens a page after the first one.
    bool starts_new_page = false;
};

/// Cell rectangle in two frames: top-left-origin offsets and PDF space.
struct CellRect {
    double left       = 0.0;
    double top_offset = 0.0; ///< Distance from the top page edge to the cell top.
    double width      = 0.0;
    double height     = 0.0;

    double top    = 0.0; ///< PDF y of the cell top edge.
    double bottom = 0.0; ///< PDF y of the cell bottom edge.

    double CenterX() const { return left + width / 2.0; }
};

/// Grid position of card \p index.
/// \throws ConfigError if the grid has no columns or rows.
GridSlot PlaceCard(const LabelGrid& grid, size_t index);

/// Rectangle of the cell at (\p column, \p row).
CellRect CellAt(const LabelGrid& grid, int column, int row);

/// Draws one card inside \p cell. A page must be open on \p surface.
void DrawLabelCard(DrawSurface& surface, const LabelGrid& grid, const CellRect& cell,
                   const LabelCard& card);

/// Lays \p cards out left-to-right, top-to-bottom across as many pages as
/// needed and closes the last page. Draws nothing for an empty sequence.
/// \return Number of label pages emitted.
size_t RenderLabelPages(DrawSurface& surface, const LabelGrid& grid,
                        const std::vector<LabelCard>& cards);

/// Number of label pages \p card_count cards occupy.
size_t LabelPageCount(const LabelGrid& grid, size_t card_count);

} // namespace LabelSheet
