#include <gtest/gtest.h>
#include "labelsheet/error.h"
#include "labelsheet/pipeline.h"
#include "labelsheet/summary_table.h"

#include <cstdio>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

using namespace LabelSheet;

static OrderTable MakeTable(std::vector<std::vector<std::string>> rows) {
    OrderTable table;
    table.columns = {"Name", "Carry-Out", "Dine In"};
    table.rows    = std::move(rows);
    return table;
}

TEST(Pipeline, CaseVariantsStaySeparate) {
    GenerateRequest req;
    req.table = MakeTable({{"Alice", "3", "2"}, {"alice", "1", "0"}});
    GenerateResult res = Generate(req);

    EXPECT_EQ(res.stats.aggregated_names, 2u);
    ASSERT_EQ(res.cards.size(), 4u);
    EXPECT_EQ(res.cards[0], LabelCard::MakePrimary("Alice", 3));
    EXPECT_EQ(res.cards[1], LabelCard::MakeContinuation("Alice"));
    EXPECT_EQ(res.cards[2], LabelCard::MakePrimary("alice", 1));
    EXPECT_EQ(res.cards[3], LabelCard::MakePackSummary(1, 2));
    EXPECT_EQ(res.stats.dine_in_entries, 1u);
}

TEST(Pipeline, OddCarryOutNeedsThreeLabels) {
    Document doc = AssembleDocument(MakeTable({{"Bob", "5", "0"}}));
    ASSERT_EQ(doc.NumPages(), 2u);
    const Page& labels = doc.pages[0];
    EXPECT_EQ(labels.kind, PageKind::Labels);
    // Primary (2 lines) + 2 continuations + pack summary (3 lines).
    ASSERT_EQ(labels.texts.size(), 7u);
    EXPECT_EQ(labels.texts[0].text, "Bob");
    EXPECT_EQ(labels.texts[1].text, "5");
    EXPECT_EQ(labels.texts[2].text, "Bob");
    EXPECT_EQ(labels.texts[3].text, "Bob");
    EXPECT_EQ(labels.texts[4].text, "Pack Summary");
    EXPECT_EQ(doc.pages[1].kind, PageKind::Summary);
}

TEST(Pipeline, NoCarryOutGivesOnlySummaryPage) {
    Document doc = AssembleDocument(MakeTable({{"Ann", "0", "2"}, {"Ben", "0", "0"}}));
    ASSERT_EQ(doc.NumPages(), 1u);
    EXPECT_EQ(doc.pages[0].kind, PageKind::Summary);
    ASSERT_EQ(doc.pages[0].tables.size(), 1u);
    const TableItem& table = doc.pages[0].tables[0];
    ASSERT_EQ(table.rows.size(), 2u);
    EXPECT_EQ(table.rows[1], (std::vector<std::string>{"Ann", "2"}));
}

TEST(Pipeline, MissingDineInColumnFailsWithoutOutput) {
    const std::filesystem::path out =
        std::filesystem::temp_directory_path() / "labelsheet_test_missing.pdf";
    std::filesystem::remove(out);

    GenerateRequest req;
    req.table.columns   = {"Name", "Carry Out"};
    req.table.rows      = {{"Alice", "1"}};
    req.output_pdf_path = out.string();
    try {
        Generate(req);
        FAIL() << "expected SchemaError";
    } catch (const SchemaError& e) {
        EXPECT_NE(std::string(e.what()).find("dine_in"), std::string::npos);
    }
    EXPECT_FALSE(std::filesystem::exists(out));
}

TEST(Pipeline, ThirtyOneSinglesSpanTwoPages) {
    std::vector<std::vector<std::string>> rows;
    for (int i = 0; i < 31; ++i) {
        char name[16];
        std::snprintf(name, sizeof(name), "Guest %02d", i);
        rows.push_back({name, "1", "0"});
    }
    GenerateRequest req;
    req.table          = MakeTable(rows);
    GenerateResult res = Generate(req);

    EXPECT_EQ(res.stats.label_cards, 32u);
    EXPECT_EQ(res.stats.label_pages, 2u);
    EXPECT_EQ(res.stats.summary_pages, 1u);
    EXPECT_EQ(res.stats.total_doubles, 0);
    EXPECT_EQ(res.stats.total_singles, 31);

    const Document& doc = res.document;
    ASSERT_EQ(doc.NumPages(), 3u);
    EXPECT_EQ(doc.pages[0].texts.size(), 60u);
    ASSERT_EQ(doc.pages[1].texts.size(), 5u);
    EXPECT_EQ(doc.pages[1].texts[0].text, "Guest 30");
    EXPECT_EQ(doc.pages[1].texts[2].text, "Pack Summary");
    EXPECT_EQ(doc.pages[1].texts[3].text, "Doubles: 0");
    EXPECT_EQ(doc.pages[1].texts[4].text, "Singles: 31");
    EXPECT_EQ(doc.pages[2].kind, PageKind::Summary);
    EXPECT_EQ(doc.pages[2].texts[1].text, kSummaryEmptyMessage);
}

TEST(Pipeline, EmptyAggregateStillYieldsSummaryPage) {
    Document doc = AssembleDocument(MakeTable({{"  ", "4", "4"}}));
    ASSERT_EQ(doc.NumPages(), 1u);
    EXPECT_EQ(doc.pages[0].texts[1].text, kSummaryEmptyMessage);
}

TEST(Pipeline, RepeatedRunsAreByteIdentical) {
    GenerateRequest req;
    req.table = MakeTable({{"Zed", "2", "1"}, {"Amy", "3", "0"}, {"Zed", "1", "1"}});
    GenerateResult a = Generate(req);
    GenerateResult b = Generate(req);
    EXPECT_EQ(a.cards, b.cards);
    EXPECT_EQ(a.pdf, b.pdf);
    EXPECT_EQ(a.cards.front().name, "Amy");
}

TEST(Pipeline, WritesPdfWhenPathGiven) {
    const std::filesystem::path out =
        std::filesystem::temp_directory_path() / "labelsheet_test_output.pdf";
    GenerateRequest req;
    req.table           = MakeTable({{"Alice", "2", "1"}});
    req.output_pdf_path = out.string();
    GenerateResult res  = Generate(req);

    ASSERT_TRUE(std::filesystem::exists(out));
    EXPECT_EQ(std::filesystem::file_size(out), res.pdf.size());
    std::filesystem::remove(out);
}

TEST(Pipeline, InvalidGridIsRejected) {
    LabelGrid grid;
    grid.rows = 0;
    EXPECT_THROW(AssembleDocument(MakeTable({{"Alice", "2", "1"}}), grid), ConfigError);
}

TEST(Pipeline, OversizedQuantityFailsWithInputError) {
    GenerateRequest req;
    req.table = MakeTable({{"Mallory", "2000000000", "0"}});
    EXPECT_THROW(Generate(req), InputError);
}
