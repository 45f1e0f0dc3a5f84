#include <gtest/gtest.h>
#include "labelsheet/error.h"
#include "labelsheet/layout.h"

#include <string>
#include <vector>

using namespace LabelSheet;

static std::vector<LabelCard> MakePrimaries(size_t n) {
    std::vector<LabelCard> cards;
    for (size_t i = 0; i < n; ++i) {
        cards.push_back(LabelCard::MakePrimary("N" + std::to_string(i), 1));
    }
    return cards;
}

TEST(Layout, DefaultGridIsReferenceSheet) {
    LabelGrid grid;
    EXPECT_EQ(grid.columns, 3);
    EXPECT_EQ(grid.rows, 10);
    EXPECT_EQ(grid.CellsPerPage(), 30u);
    EXPECT_DOUBLE_EQ(grid.cell_width, 189.0);
    EXPECT_DOUBLE_EQ(grid.cell_height, 72.0);
    EXPECT_DOUBLE_EQ(grid.page_width, 612.0);
    EXPECT_DOUBLE_EQ(grid.page_height, 792.0);
    EXPECT_NO_THROW(grid.Validate());
}

TEST(Layout, ValidateRejectsBadGrids) {
    LabelGrid grid;
    grid.columns = 0;
    EXPECT_THROW(grid.Validate(), ConfigError);

    grid         = LabelGrid{};
    grid.columns = 4;
    EXPECT_THROW(grid.Validate(), ConfigError);

    grid              = LabelGrid{};
    grid.vertical_gap = -1.0;
    EXPECT_THROW(grid.Validate(), ConfigError);

    grid      = LabelGrid{};
    grid.rows = 11;
    EXPECT_THROW(grid.Validate(), ConfigError);
}

TEST(Layout, PlacementFollowsRowMajorOrder) {
    LabelGrid grid;
    for (size_t i = 0; i < 95; ++i) {
        GridSlot slot = PlaceCard(grid, i);
        EXPECT_EQ(slot.position, i % 30);
        EXPECT_EQ(slot.column, static_cast<int>(i % 30 % 3));
        EXPECT_EQ(slot.row, static_cast<int>((i % 30) / 3));
        EXPECT_EQ(slot.page, i / 30);
        EXPECT_EQ(slot.starts_new_page, i > 0 && i % 30 == 0);
    }
}

TEST(Layout, CellGeometry) {
    LabelGrid grid;
    CellRect first = CellAt(grid, 0, 0);
    EXPECT_DOUBLE_EQ(first.left, 14.4);
    EXPECT_DOUBLE_EQ(first.top_offset, 28.8);
    EXPECT_DOUBLE_EQ(first.top, 763.2);
    EXPECT_DOUBLE_EQ(first.bottom, 691.2);

    CellRect last = CellAt(grid, 2, 9);
    EXPECT_NEAR(last.left, 406.8, 1e-9);
    EXPECT_NEAR(last.top_offset, 676.8, 1e-9);
    EXPECT_NEAR(last.bottom, 43.2, 1e-9);
}

TEST(Layout, PrimaryCardDrawsNameAboveCount) {
    LabelGrid grid;
    DocumentRecorder rec(grid.page_width, grid.page_height);
    rec.BeginPage(PageKind::Labels);
    DrawLabelCard(rec, grid, CellAt(grid, 0, 0), LabelCard::MakePrimary("Bob", 5));
    rec.EndPage();
    Document doc = rec.Finish();

    const std::vector<TextItem>& texts = doc.pages[0].texts;
    ASSERT_EQ(texts.size(), 2u);
    EXPECT_EQ(texts[0].text, "Bob");
    EXPECT_EQ(texts[0].font, FontFace::Bold);
    EXPECT_EQ(texts[0].align, TextAlign::Center);
    EXPECT_NEAR(texts[0].x, 108.9, 1e-9);
    EXPECT_NEAR(texts[0].y, 736.8, 1e-9);
    EXPECT_EQ(texts[1].text, "5");
    EXPECT_DOUBLE_EQ(texts[1].size, kCountFontSize);
    EXPECT_NEAR(texts[1].y, 721.2, 1e-9);
}

TEST(Layout, ContinuationCardCentersName) {
    LabelGrid grid;
    DocumentRecorder rec(grid.page_width, grid.page_height);
    rec.BeginPage(PageKind::Labels);
    DrawLabelCard(rec, grid, CellAt(grid, 0, 0), LabelCard::MakeContinuation("Bob"));
    rec.EndPage();
    Document doc = rec.Finish();

    ASSERT_EQ(doc.pages[0].texts.size(), 1u);
    EXPECT_NEAR(doc.pages[0].texts[0].y, 721.2, 1e-9);
}

TEST(Layout, PackSummaryCardShowsTotals) {
    LabelGrid grid;
    DocumentRecorder rec(grid.page_width, grid.page_height);
    rec.BeginPage(PageKind::Labels);
    DrawLabelCard(rec, grid, CellAt(grid, 0, 0), LabelCard::MakePackSummary(4, 1));
    rec.EndPage();
    Document doc = rec.Finish();

    const std::vector<TextItem>& texts = doc.pages[0].texts;
    ASSERT_EQ(texts.size(), 3u);
    EXPECT_EQ(texts[0].text, "Pack Summary");
    EXPECT_NEAR(texts[0].y, 741.6, 1e-9);
    EXPECT_EQ(texts[1].text, "Doubles: 4");
    EXPECT_EQ(texts[1].font, FontFace::Regular);
    EXPECT_NEAR(texts[1].y, 725.6, 1e-9);
    EXPECT_EQ(texts[2].text, "Singles: 1");
    EXPECT_NEAR(texts[2].y, 711.6, 1e-9);
}

TEST(Layout, EmptySequenceDrawsNoPages) {
    LabelGrid grid;
    DocumentRecorder rec(grid.page_width, grid.page_height);
    EXPECT_EQ(RenderLabelPages(rec, grid, {}), 0u);
    EXPECT_FALSE(rec.PageOpen());
    EXPECT_EQ(rec.Finish().NumPages(), 0u);
}

TEST(Layout, FullPageDoesNotOpenAnExtraPage) {
    LabelGrid grid;
    DocumentRecorder rec(grid.page_width, grid.page_height);
    EXPECT_EQ(RenderLabelPages(rec, grid, MakePrimaries(30)), 1u);
    EXPECT_FALSE(rec.PageOpen());
    Document doc = rec.Finish();
    ASSERT_EQ(doc.NumPages(), 1u);
    EXPECT_EQ(doc.pages[0].texts.size(), 60u);
}

TEST(Layout, OverflowStartsNewPage) {
    LabelGrid grid;
    DocumentRecorder rec(grid.page_width, grid.page_height);
    EXPECT_EQ(RenderLabelPages(rec, grid, MakePrimaries(31)), 2u);
    Document doc = rec.Finish();
    ASSERT_EQ(doc.NumPages(), 2u);
    EXPECT_EQ(doc.pages[1].kind, PageKind::Labels);
    ASSERT_EQ(doc.pages[1].texts.size(), 2u);
    EXPECT_EQ(doc.pages[1].texts[0].text, "N30");
    EXPECT_NEAR(doc.pages[1].texts[0].x, 108.9, 1e-9);
}

TEST(Layout, LabelPageCount) {
    LabelGrid grid;
    EXPECT_EQ(LabelPageCount(grid, 0), 0u);
    EXPECT_EQ(LabelPageCount(grid, 1), 1u);
    EXPECT_EQ(LabelPageCount(grid, 30), 1u);
    EXPECT_EQ(LabelPageCount(grid, 31), 2u);
    EXPECT_EQ(LabelPageCount(grid, 60), 2u);
}

TEST(Layout, ZeroColumnGridIsRejectedBeforeDividing) {
    LabelGrid grid;
    grid.columns = 0;
    DocumentRecorder rec(grid.page_width, grid.page_height);
    EXPECT_THROW(RenderLabelPages(rec, grid, MakePrimaries(3)), ConfigError);
    EXPECT_FALSE(rec.PageOpen());
    EXPECT_THROW(PlaceCard(grid, 0), ConfigError);
    EXPECT_EQ(LabelPageCount(grid, 5), 0u);
}
