#include <gtest/gtest.h>
#include "labelsheet/error.h"
#include "labelsheet/pdf_writer.h"
#include "detail/win_ansi.h"

#include <cstdint>
#include <string>
#include <vector>

using namespace LabelSheet;

static Document MakeDoc() {
    Document doc;
    Page labels;
    labels.kind = PageKind::Labels;
    labels.texts.push_back(TextItem{100.0, 736.8, "Bob", FontFace::Bold, 12.0, TextAlign::Center});
    doc.pages.push_back(labels);

    Page summary;
    summary.kind = PageKind::Summary;
    summary.texts.push_back(
        TextItem{14.4, 763.2, "Dine-In Summary", FontFace::Bold, 18.0, TextAlign::Left});
    TableItem table;
    table.x             = 14.4;
    table.top           = 733.2;
    table.column_widths = {400.0, 180.0};
    table.rows          = {{"Name", "Number"}, {"Alice", "2"}};
    summary.tables.push_back(table);
    doc.pages.push_back(summary);
    return doc;
}

static std::string AsString(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

TEST(PdfWriter, TextWidthUsesHelveticaMetrics) {
    PdfSurface surface(kLetterWidthPt, kLetterHeightPt);
    // B 722 + o 611 + b 611 in Helvetica-Bold.
    EXPECT_NEAR(surface.TextWidth(FontFace::Bold, "Bob", 12.0), 23.328, 1e-3);
    EXPECT_NEAR(surface.TextWidth(FontFace::Bold, "Bob", 24.0), 46.656, 1e-3);
    // W 944 + i 222 in Helvetica.
    EXPECT_NEAR(surface.TextWidth(FontFace::Regular, "Wi", 10.0), 11.66, 1e-3);
    EXPECT_NEAR(surface.TextWidth(FontFace::Regular, "", 12.0), 0.0, 1e-9);
}

TEST(PdfWriter, UncompressedOutputCarriesPagesFontsAndText) {
    PdfWriteOptions opts;
    opts.compress_streams = false;
    std::string pdf       = AsString(WritePdf(MakeDoc(), opts));

    EXPECT_EQ(pdf.rfind("%PDF-", 0), 0u);
    EXPECT_NE(pdf.find("%%EOF"), std::string::npos);
    EXPECT_NE(pdf.find("/Count 2"), std::string::npos);
    EXPECT_NE(pdf.find("/Helvetica-Bold"), std::string::npos);
    EXPECT_NE(pdf.find("/WinAnsiEncoding"), std::string::npos);
    EXPECT_NE(pdf.find("(Bob) Tj"), std::string::npos);
    EXPECT_NE(pdf.find("(Name) Tj"), std::string::npos);
    EXPECT_NE(pdf.find("(Alice) Tj"), std::string::npos);
    EXPECT_EQ(pdf.find("/FlateDecode"), std::string::npos);
}

TEST(PdfWriter, CompressedStreamsAreFlateEncoded) {
    std::string pdf = AsString(WritePdf(MakeDoc()));
    EXPECT_NE(pdf.find("/FlateDecode"), std::string::npos);
    EXPECT_EQ(pdf.find("(Bob) Tj"), std::string::npos);
}

TEST(PdfWriter, OutputIsDeterministic) {
    EXPECT_EQ(WritePdf(MakeDoc()), WritePdf(MakeDoc()));
}

TEST(PdfWriter, SurfaceRejectsMisuse) {
    PdfSurface surface(kLetterWidthPt, kLetterHeightPt);
    EXPECT_THROW(surface.DrawText(TextItem{}), InternalError);
    EXPECT_THROW(surface.EndPage(), InternalError);

    surface.BeginPage(PageKind::Labels);
    EXPECT_THROW(surface.BeginPage(PageKind::Labels), InternalError);
    EXPECT_THROW(surface.Finish(), InternalError);
    surface.EndPage();

    std::vector<uint8_t> pdf = surface.Finish();
    EXPECT_FALSE(pdf.empty());
    EXPECT_THROW(surface.BeginPage(PageKind::Labels), InternalError);
    EXPECT_THROW(surface.Finish(), InternalError);
}

TEST(PdfWriter, SaveToUnwritablePathThrows) {
    EXPECT_THROW(SavePdf("/nonexistent/dir/labels.pdf", {1, 2, 3}), IOError);
    EXPECT_THROW(SavePdf("", {1}), InputError);
}

TEST(WinAnsi, ConvertsUtf8) {
    EXPECT_EQ(detail::ToWinAnsi("Plain"), "Plain");
    EXPECT_EQ(detail::ToWinAnsi("Jos\xC3\xA9"), std::string("Jos\xE9"));
    EXPECT_EQ(detail::ToWinAnsi("\xE2\x82\xAC"), std::string("\x80"));
    EXPECT_EQ(detail::ToWinAnsi("\xE4\xB8\xAD"), "?");
    EXPECT_EQ(detail::ToWinAnsi("a\xFF"), "a?");
}
