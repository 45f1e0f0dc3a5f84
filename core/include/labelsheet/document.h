/// \file document.h
/// \brief Page model and the drawing surface the layout engines render onto.
///
/// All coordinates are PDF user space: points, origin at the bottom-left of
/// the page, text positioned by its baseline.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace LabelSheet {

/// US letter, in points.
inline constexpr double kPointsPerInch   = 72.0;
inline constexpr double kLetterWidthPt  = 8.5 * kPointsPerInch;
inline constexpr double kLetterHeightPt = 11.0 * kPointsPerInch;

enum class FontFace : uint8_t {
    Regular = 0, ///< Helvetica
    Bold    = 1, ///< Helvetica-Bold
};

enum class TextAlign : uint8_t {
    Left   = 0, ///< x is the start of the line.
    Center = 1, ///< x is the horizontal center of the line.
};

/// RGB color, components in [0, 1].
struct Rgb {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;

    static Rgb FromHex(uint32_t hex);
};

bool operator==(const Rgb& a, const Rgb& b);

struct TextItem {
    double x = 0.0;
    double y = 0.0;
    std::string text;
    FontFace font   = FontFace::Regular;
    double size     = 10.0;
    TextAlign align = TextAlign::Left;
};

/// Styling intent for a grid table. Row 0 of a table is the header.
struct TableStyle {
    FontFace header_font = FontFace::Bold;
    FontFace body_font   = FontFace::Regular;
    double font_size     = 11.0;

    double pad_left   = 8.0;
    double pad_right  = 8.0;
    double pad_top    = 6.0;
    double pad_bottom = 6.0;

    Rgb header_background = Rgb{0.827, 0.827, 0.827}; // lightgrey
    std::vector<Rgb> row_backgrounds = {Rgb{1.0, 1.0, 1.0}, Rgb::FromHex(0xf3f4f6)};

    Rgb line_color          = Rgb{0.5, 0.5, 0.5}; // gray
    double box_width        = 1.0;
    double inner_grid_width = 0.5;

    std::vector<TextAlign> column_align; ///< Per column; missing entries are Left.

    /// Height of every row: 1.2 line leading plus vertical padding.
    double RowHeight() const { return font_size * 1.2 + pad_top + pad_bottom; }

    TextAlign AlignFor(size_t column) const {
        return column < column_align.size() ? column_align[column] : TextAlign::Left;
    }
};

struct TableItem {
    double x   = 0.0; ///< Left edge.
    double top = 0.0; ///< Top edge.
    std::vector<double> column_widths;
    std::vector<std::vector<std::string>> rows;
    TableStyle style;

    double Width() const;
    double Height() const { return style.RowHeight() * static_cast<double>(rows.size()); }
};

enum class PageKind : uint8_t {
    Labels  = 0,
    Summary = 1,
};

struct Page {
    PageKind kind = PageKind::Labels;
    std::vector<TextItem> texts;
    std::vector<TableItem> tables;
};

/// Ordered pages of one generated sheet.
struct Document {
    double page_width  = kLetterWidthPt;
    double page_height = kLetterHeightPt;
    std::vector<Page> pages;

    size_t NumPages() const { return pages.size(); }
    size_t CountPages(PageKind kind) const;
};

/// Target of the label and summary renderers.
class DrawSurface {
public:
    virtual ~DrawSurface() = default;

    virtual double PageWidth() const  = 0;
    virtual double PageHeight() const = 0;

    /// Starts a new page. Pages never nest.
    virtual void BeginPage(PageKind kind) = 0;
    virtual void DrawText(const TextItem& item) = 0;
    virtual void DrawTable(const TableItem& item) = 0;
    /// Finalizes the open page.
    virtual void EndPage() = 0;
};

/// DrawSurface that records every call into a Document.
class DocumentRecorder : public DrawSurface {
public:
    DocumentRecorder(double page_width, double page_height);

    double PageWidth() const override { return doc_.page_width; }
    double PageHeight() const override { return doc_.page_height; }

    /// \throws InternalError if a page is already open.
    void BeginPage(PageKind kind) override;
    /// \throws InternalError if no page is open.
    void DrawText(const TextItem& item) override;
    /// \throws InternalError if no page is open.
    void DrawTable(const TableItem& item) override;
    /// \throws InternalError if no page is open.
    void EndPage() override;

    bool PageOpen() const { return page_open_; }

    /// Hands over the recorded document. The recorder is empty afterwards.
    /// \throws InternalError if a page is still open.
    Document Finish();

private:
    Page& CurrentPage(const char* op);

    Document doc_;
    bool page_open_ = false;
};

} // namespace LabelSheet
