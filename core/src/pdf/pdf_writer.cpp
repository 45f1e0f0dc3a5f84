#include "labelsheet/pdf_writer.h"
#include "labelsheet/error.h"
#include "labelsheet/version.h"
#include "detail/win_ansi.h"

#include <hpdf.h>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

namespace LabelSheet {
namespace {

constexpr const char* kFontEncoding = "WinAnsiEncoding";

// Baseline of table text above the bottom padding, as a share of the font size.
constexpr double kTableDescentShare = 0.2;

constexpr HPDF_UINT32 kReadChunk = 4096;

struct HpdfErrorState {
    HPDF_STATUS error  = HPDF_OK;
    HPDF_STATUS detail = HPDF_OK;
};

void HpdfErrorHandler(HPDF_STATUS error_no, HPDF_STATUS detail_no, void* user_data) {
    auto* state = static_cast<HpdfErrorState*>(user_data);
    // End of the output stream is the normal way reading stops.
    if (error_no == HPDF_STREAM_EOF) { return; }
    if (state->error == HPDF_OK) {
        state->error  = error_no;
        state->detail = detail_no;
    }
}

std::string DescribeError(const HpdfErrorState& state) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "error_no=0x%04X, detail_no=%u",
                  static_cast<unsigned int>(state.error), static_cast<unsigned int>(state.detail));
    return buf;
}

HPDF_REAL R(double v) { return static_cast<HPDF_REAL>(v); }

} // namespace

struct PdfSurface::Impl {
    HpdfErrorState errors;
    HPDF_Doc pdf      = nullptr;
    HPDF_Font regular = nullptr;
    HPDF_Font bold    = nullptr;
    HPDF_Page page    = nullptr;
    bool page_open    = false;
    bool finished     = false;

    ~Impl() {
        if (pdf) { HPDF_Free(pdf); }
    }

    HPDF_Font FontFor(FontFace face) const { return face == FontFace::Bold ? bold : regular; }

    void Check(const char* what) const {
        if (errors.error != HPDF_OK) {
            throw InternalError(std::string("libharu failed in ") + what + ": " +
                                DescribeError(errors));
        }
    }

    void RequirePage(const char* what) const {
        if (finished) { throw InternalError(std::string(what) + " after Finish()"); }
        if (!page_open) { throw InternalError(std::string(what) + " without an open page"); }
    }

    void SetFill(const Rgb& c) { HPDF_Page_SetRGBFill(page, R(c.r), R(c.g), R(c.b)); }
    void SetStroke(const Rgb& c) { HPDF_Page_SetRGBStroke(page, R(c.r), R(c.g), R(c.b)); }

    void Text(double x, double y, const std::string& utf8, FontFace face, double size,
              TextAlign align) {
        const std::string encoded = detail::ToWinAnsi(utf8);
        HPDF_Page_BeginText(page);
        HPDF_Page_SetFontAndSize(page, FontFor(face), R(size));
        double start_x = x;
        if (align == TextAlign::Center) {
            start_x = x - HPDF_Page_TextWidth(page, encoded.c_str()) / 2.0;
        }
        HPDF_Page_TextOut(page, R(start_x), R(y), encoded.c_str());
        HPDF_Page_EndText(page);
    }

    void Table(const TableItem& table) {
        const TableStyle& style = table.style;
        const double row_h      = style.RowHeight();
        const double width      = table.Width();
        const size_t n_rows     = table.rows.size();
        if (n_rows == 0 || table.column_widths.empty()) { return; }

        // Row backgrounds.
        for (size_t r = 0; r < n_rows; ++r) {
            const double y_bottom = table.top - static_cast<double>(r + 1) * row_h;
            if (r == 0) {
                SetFill(style.header_background);
            } else if (!style.row_backgrounds.empty()) {
                SetFill(style.row_backgrounds[(r - 1) % style.row_backgrounds.size()]);
            } else {
                continue;
            }
            HPDF_Page_Rectangle(page, R(table.x), R(y_bottom), R(width), R(row_h));
            HPDF_Page_Fill(page);
        }

        // Cell text.
        HPDF_Page_SetRGBFill(page, 0, 0, 0);
        for (size_t r = 0; r < n_rows; ++r) {
            const FontFace face   = (r == 0) ? style.header_font : style.body_font;
            const double y_bottom = table.top - static_cast<double>(r + 1) * row_h;
            const double baseline =
                y_bottom + style.pad_bottom + style.font_size * kTableDescentShare;
            double cell_x = table.x;
            for (size_t c = 0; c < table.column_widths.size(); ++c) {
                const double cell_w = table.column_widths[c];
                if (c < table.rows[r].size()) {
                    if (style.AlignFor(c) == TextAlign::Center) {
                        Text(cell_x + cell_w / 2.0, baseline, table.rows[r][c], face,
                             style.font_size, TextAlign::Center);
                    } else {
                        Text(cell_x + style.pad_left, baseline, table.rows[r][c], face,
                             style.font_size, TextAlign::Left);
                    }
                }
                cell_x += cell_w;
            }
        }

        // Inner grid, then the outer box on top.
        const double bottom = table.top - static_cast<double>(n_rows) * row_h;
        SetStroke(style.line_color);
        HPDF_Page_SetLineWidth(page, R(style.inner_grid_width));
        for (size_t r = 1; r < n_rows; ++r) {
            const double y = table.top - static_cast<double>(r) * row_h;
            HPDF_Page_MoveTo(page, R(table.x), R(y));
            HPDF_Page_LineTo(page, R(table.x + width), R(y));
        }
        double x = table.x;
        for (size_t c = 0; c + 1 < table.column_widths.size(); ++c) {
            x += table.column_widths[c];
            HPDF_Page_MoveTo(page, R(x), R(table.top));
            HPDF_Page_LineTo(page, R(x), R(bottom));
        }
        if (n_rows > 1 || table.column_widths.size() > 1) { HPDF_Page_Stroke(page); }

        HPDF_Page_SetLineWidth(page, R(style.box_width));
        HPDF_Page_Rectangle(page, R(table.x), R(bottom), R(width), R(table.top - bottom));
        HPDF_Page_Stroke(page);
    }
};

PdfSurface::PdfSurface(double page_width, double page_height, const PdfWriteOptions& options)
    : page_width_(page_width), page_height_(page_height), impl_(std::make_unique<Impl>()) {
    impl_->pdf = HPDF_New(HpdfErrorHandler, &impl_->errors);
    if (!impl_->pdf) { throw InternalError("libharu could not create a PDF document"); }

    if (HPDF_SetCompressionMode(impl_->pdf, options.compress_streams ? HPDF_COMP_ALL
                                                                     : HPDF_COMP_NONE) !=
        HPDF_OK) {
        spdlog::warn("PdfSurface: compression unavailable ({}), writing uncompressed streams",
                     DescribeError(impl_->errors));
        HPDF_ResetError(impl_->pdf);
        impl_->errors = HpdfErrorState{};
    }

    HPDF_SetInfoAttr(impl_->pdf, HPDF_INFO_PRODUCER, "LabelSheet " LABELSHEET_VERSION_STRING);
    if (!options.title.empty()) {
        HPDF_SetInfoAttr(impl_->pdf, HPDF_INFO_TITLE, detail::ToWinAnsi(options.title).c_str());
    }

    impl_->regular = HPDF_GetFont(impl_->pdf, "Helvetica", kFontEncoding);
    impl_->bold    = HPDF_GetFont(impl_->pdf, "Helvetica-Bold", kFontEncoding);
    impl_->Check("font setup");
}

PdfSurface::~PdfSurface() = default;

void PdfSurface::BeginPage(PageKind /*kind*/) {
    if (impl_->finished) { throw InternalError("BeginPage after Finish()"); }
    if (impl_->page_open) { throw InternalError("BeginPage while a page is open"); }
    impl_->page = HPDF_AddPage(impl_->pdf);
    impl_->Check("BeginPage");
    HPDF_Page_SetWidth(impl_->page, R(page_width_));
    HPDF_Page_SetHeight(impl_->page, R(page_height_));
    impl_->page_open = true;
}

void PdfSurface::DrawText(const TextItem& item) {
    impl_->RequirePage("DrawText");
    HPDF_Page_SetRGBFill(impl_->page, 0, 0, 0);
    impl_->Text(item.x, item.y, item.text, item.font, item.size, item.align);
}

void PdfSurface::DrawTable(const TableItem& item) {
    impl_->RequirePage("DrawTable");
    impl_->Table(item);
}

void PdfSurface::EndPage() {
    impl_->RequirePage("EndPage");
    impl_->page_open = false;
    impl_->page      = nullptr;
    impl_->Check("page drawing");
}

double PdfSurface::TextWidth(FontFace font, const std::string& text, double size) const {
    const std::string encoded = detail::ToWinAnsi(text);
    const HPDF_TextWidth tw   = HPDF_Font_TextWidth(
        impl_->FontFor(font), reinterpret_cast<const HPDF_BYTE*>(encoded.data()),
        static_cast<HPDF_UINT>(encoded.size()));
    return static_cast<double>(tw.width) * size / 1000.0;
}

std::vector<uint8_t> PdfSurface::Finish() {
    if (impl_->finished) { throw InternalError("Finish() called twice"); }
    if (impl_->page_open) { throw InternalError("Finish() with a page still open"); }
    impl_->finished = true;

    HPDF_SaveToStream(impl_->pdf);
    impl_->Check("SaveToStream");

    const HPDF_UINT32 total = HPDF_GetStreamSize(impl_->pdf);
    std::vector<uint8_t> out;
    out.reserve(total);
    HPDF_ResetStream(impl_->pdf);
    while (out.size() < total) {
        HPDF_BYTE chunk[kReadChunk];
        HPDF_UINT32 n        = kReadChunk;
        const HPDF_STATUS rc = HPDF_ReadFromStream(impl_->pdf, chunk, &n);
        out.insert(out.end(), chunk, chunk + n);
        if (rc == HPDF_STREAM_EOF || n == 0) { break; }
        if (rc != HPDF_OK) { impl_->Check("ReadFromStream"); }
    }
    if (out.size() != total) {
        throw InternalError("libharu returned " + std::to_string(out.size()) + " of " +
                            std::to_string(total) + " PDF bytes");
    }
    return out;
}

std::vector<uint8_t> WritePdf(const Document& doc, const PdfWriteOptions& options) {
    PdfSurface surface(doc.page_width, doc.page_height, options);
    for (const Page& page : doc.pages) {
        surface.BeginPage(page.kind);
        for (const TableItem& table : page.tables) { surface.DrawTable(table); }
        for (const TextItem& text : page.texts) { surface.DrawText(text); }
        surface.EndPage();
    }
    std::vector<uint8_t> pdf = surface.Finish();
    spdlog::debug("WritePdf: {} page(s) -> {} byte(s)", doc.pages.size(), pdf.size());
    return pdf;
}

void SavePdf(const std::string& path, const std::vector<uint8_t>& pdf) {
    if (path.empty()) { throw InputError("SavePdf path is empty"); }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) { throw IOError("Failed to open PDF output: " + path); }
    out.write(reinterpret_cast<const char*>(pdf.data()), static_cast<std::streamsize>(pdf.size()));
    if (!out) { throw IOError("Failed to write PDF output: " + path); }
    spdlog::info("Saved PDF to {} ({} bytes)", path, pdf.size());
}

} // namespace LabelSheet
