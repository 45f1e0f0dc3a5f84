/// \file pdf_writer.h
/// \brief PDF output through libharu.

#pragma once

#include "document.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace LabelSheet {

struct PdfWriteOptions {
    bool compress_streams = true; ///< Flate-compress page content streams.
    std::string title;            ///< Optional /Title in the info dictionary.
};

/// DrawSurface that draws straight into a libharu document with the
/// standard Helvetica and Helvetica-Bold fonts (WinAnsi encoding).
class PdfSurface : public DrawSurface {
public:
    /// \throws InternalError if libharu cannot create the document.
    PdfSurface(double page_width, double page_height, const PdfWriteOptions& options = {});
    ~PdfSurface() override;

    PdfSurface(const PdfSurface&)            = delete;
    PdfSurface& operator=(const PdfSurface&) = delete;

    double PageWidth() const override { return page_width_; }
    double PageHeight() const override { return page_height_; }

    /// \throws InternalError if a page is already open.
    void BeginPage(PageKind kind) override;
    /// \throws InternalError if no page is open.
    void DrawText(const TextItem& item) override;
    /// \throws InternalError if no page is open.
    void DrawTable(const TableItem& item) override;
    /// \throws InternalError if no page is open or libharu reported an error.
    void EndPage() override;

    /// Advance width of UTF-8 \p text in points.
    double TextWidth(FontFace font, const std::string& text, double size) const;

    /// Serializes the document. The surface cannot be drawn on afterwards.
    /// \throws InternalError if a page is still open or libharu fails.
    std::vector<uint8_t> Finish();

private:
    struct Impl;

    double page_width_;
    double page_height_;
    std::unique_ptr<Impl> impl_;
};

/// Replays \p doc into a PdfSurface. Output is deterministic for identical input.
std::vector<uint8_t> WritePdf(const Document& doc, const PdfWriteOptions& options = {});

/// Writes \p pdf to \p path.
/// \throws IOError when the file cannot be written.
void SavePdf(const std::string& path, const std::vector<uint8_t>& pdf);

} // namespace LabelSheet
