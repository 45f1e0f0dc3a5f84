/// \file pipeline.h
/// \brief Label sheet generation: orders in, label pages and summary out.

#pragma once

#include "document.h"
#include "label_card.h"
#include "layout.h"
#include "order.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace LabelSheet {

/// Builds the complete document for \p table: label pages followed by the
/// dine-in summary. Pure; holds no state between calls.
/// \throws SchemaError when the canonical columns cannot be resolved.
/// \throws ConfigError when \p grid is inconsistent.
Document AssembleDocument(const OrderTable& table, const LabelGrid& grid = {});

/// Request parameters for label sheet generation.
struct GenerateRequest {
    OrderTable table; ///< Parsed order rows.
    LabelGrid grid;   ///< Sheet geometry.

    bool compress_streams = true; ///< Flate-compress PDF page streams.
    std::string output_pdf_path;  ///< Output path for the PDF (empty = don't write).
};

/// Counters describing one generation run.
struct GenerateStats {
    size_t input_rows       = 0;
    size_t aggregated_names = 0;
    size_t label_cards      = 0;
    size_t label_pages      = 0;
    size_t summary_pages    = 0;
    int64_t total_doubles   = 0;
    int64_t total_singles   = 0;
    size_t dine_in_entries  = 0;
};

/// Result of label sheet generation.
struct GenerateResult {
    GenerateStats stats;
    std::vector<LabelCard> cards; ///< Label cards in grid order.
    Document document;
    std::vector<uint8_t> pdf;     ///< PDF file data.
};

/// Runs the whole pipeline and serializes the document to PDF.
/// Nothing is written when an error is raised.
GenerateResult Generate(const GenerateRequest& request);

} // namespace LabelSheet
