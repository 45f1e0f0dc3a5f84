#include <gtest/gtest.h>
#include "labelsheet/document.h"
#include "labelsheet/error.h"

using namespace LabelSheet;

TEST(Document, RecorderCollectsPagesInOrder) {
    DocumentRecorder rec(kLetterWidthPt, kLetterHeightPt);
    rec.BeginPage(PageKind::Labels);
    rec.DrawText(TextItem{10.0, 20.0, "a", FontFace::Bold, 12.0, TextAlign::Center});
    rec.EndPage();
    rec.BeginPage(PageKind::Summary);
    rec.DrawTable(TableItem{});
    rec.EndPage();

    Document doc = rec.Finish();
    ASSERT_EQ(doc.NumPages(), 2u);
    EXPECT_EQ(doc.pages[0].kind, PageKind::Labels);
    EXPECT_EQ(doc.pages[0].texts.size(), 1u);
    EXPECT_EQ(doc.pages[1].kind, PageKind::Summary);
    EXPECT_EQ(doc.pages[1].tables.size(), 1u);
    EXPECT_EQ(doc.CountPages(PageKind::Labels), 1u);
    EXPECT_EQ(doc.CountPages(PageKind::Summary), 1u);
}

TEST(Document, DrawingWithoutOpenPageThrows) {
    DocumentRecorder rec(kLetterWidthPt, kLetterHeightPt);
    EXPECT_THROW(rec.DrawText(TextItem{}), InternalError);
    EXPECT_THROW(rec.EndPage(), InternalError);
}

TEST(Document, PagesDoNotNest) {
    DocumentRecorder rec(kLetterWidthPt, kLetterHeightPt);
    rec.BeginPage(PageKind::Labels);
    EXPECT_THROW(rec.BeginPage(PageKind::Summary), InternalError);
    EXPECT_THROW(rec.Finish(), InternalError);
}

TEST(Document, RejectsEmptyPageSize) {
    EXPECT_THROW(DocumentRecorder(0.0, 792.0), ConfigError);
}

TEST(Document, RgbFromHex) {
    Rgb c = Rgb::FromHex(0xff8000);
    EXPECT_DOUBLE_EQ(c.r, 1.0);
    EXPECT_NEAR(c.g, 128.0 / 255.0, 1e-12);
    EXPECT_DOUBLE_EQ(c.b, 0.0);
}
