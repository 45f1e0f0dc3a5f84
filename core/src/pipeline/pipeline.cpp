#include "labelsheet/pipeline.h"
#include "labelsheet/aggregate.h"
#include "labelsheet/error.h"
#include "labelsheet/pdf_writer.h"
#include "labelsheet/schema.h"
#include "labelsheet/summary_table.h"

#include <spdlog/spdlog.h>

#include <string>
#include <utility>
#include <vector>

namespace LabelSheet {
namespace {

struct Assembled {
    Document document;
    LabelSequence sequence;
    std::vector<AggregatedOrder> orders;
    std::vector<DineInSummaryEntry> summary;
    size_t label_pages   = 0;
    size_t summary_pages = 0;
};

Assembled AssembleInternal(const OrderTable& table, const LabelGrid& grid) {
    grid.Validate();

    Assembled out;
    const std::vector<CanonicalOrderRow> rows = NormalizeRows(table);
    out.orders                                = AggregateOrders(rows);
    out.sequence                              = SequenceLabelCards(out.orders);
    out.summary                               = BuildDineInSummary(out.orders);

    DocumentRecorder recorder(grid.page_width, grid.page_height);
    out.label_pages   = RenderLabelPages(recorder, grid, out.sequence.cards);
    out.summary_pages = RenderDineInSummary(recorder, grid, out.summary);
    out.document      = recorder.Finish();
    return out;
}

} // namespace

Document AssembleDocument(const OrderTable& table, const LabelGrid& grid) {
    return AssembleInternal(table, grid).document;
}

GenerateResult Generate(const GenerateRequest& request) {
    spdlog::info("Generate started: rows={}, columns={}", request.table.NumRows(),
                 request.table.columns.size());

    Assembled assembled = AssembleInternal(request.table, request.grid);

    GenerateResult result;
    result.stats.input_rows       = request.table.NumRows();
    result.stats.aggregated_names = assembled.orders.size();
    result.stats.label_cards      = assembled.sequence.cards.size();
    result.stats.label_pages      = assembled.label_pages;
    result.stats.summary_pages    = assembled.summary_pages;
    result.stats.total_doubles    = assembled.sequence.total_doubles;
    result.stats.total_singles    = assembled.sequence.total_singles;
    result.stats.dine_in_entries  = assembled.summary.size();

    PdfWriteOptions pdf_opts;
    pdf_opts.compress_streams = request.compress_streams;
    pdf_opts.title            = "Labels";
    result.pdf                = WritePdf(assembled.document, pdf_opts);

    result.cards    = std::move(assembled.sequence.cards);
    result.document = std::move(assembled.document);

    if (!request.output_pdf_path.empty()) { SavePdf(request.output_pdf_path, result.pdf); }

    spdlog::info("Generate completed: names={}, cards={}, label_pages={}, summary_pages={}, "
                 "doubles={}, singles={}, dine_in={}, pdf={} bytes",
                 result.stats.aggregated_names, result.stats.label_cards,
                 result.stats.label_pages, result.stats.summary_pages,
                 result.stats.total_doubles, result.stats.total_singles,
                 result.stats.dine_in_entries, result.pdf.size());
    return result;
}

} // namespace LabelSheet
