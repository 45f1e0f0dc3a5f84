#pragma once

#include "server_context.h"
#include "http_utils.h"
#include "../report_json.h"

#include "labelsheet/error.h"
#include "labelsheet/pipeline.h"
#include "labelsheet/table_io.h"

#include <spdlog/spdlog.h>

#include <optional>
#include <string>
#include <utility>

constexpr const char* kDefaultDownloadName = "labels.pdf";

/// Parses the uploaded order file, or fills \p res with a 400 and returns nullopt.
inline std::optional<LabelSheet::OrderTable> ReadUploadedTable(const httplib::Request& req,
                                                              httplib::Response& res) {
    if (!req.form.has_file("data_file")) {
        SetJsonResponse(res, ErrorJson("Please choose a file before uploading."), 400);
        return std::nullopt;
    }
    httplib::FormData upload = req.form.get_file("data_file");
    if (upload.filename.empty()) {
        SetJsonResponse(res, ErrorJson("Please choose a file before uploading."), 400);
        return std::nullopt;
    }
    if (!LabelSheet::IsSupportedInputFile(upload.filename)) {
        SetJsonResponse(res,
                        ErrorJson("File type not supported. Upload a .csv or .json file."), 400);
        return std::nullopt;
    }

    LabelSheet::OrderTable table;
    try {
        table = LabelSheet::ParseOrderTable(upload.filename, upload.content);
    } catch (const LabelSheet::Error& e) {
        SetJsonResponse(res, ErrorJson(std::string("Could not read file: ") + e.what()), 400);
        return std::nullopt;
    }
    if (table.Empty()) {
        SetJsonResponse(
            res, ErrorJson("The uploaded workbook does not contain any rows to print."), 400);
        return std::nullopt;
    }
    spdlog::info("Upload parsed: file={}, size={} bytes, rows={}", upload.filename,
                 upload.content.size(), table.NumRows());
    return table;
}

/// Parses the upload and runs the pipeline, or fills \p res with a 400.
inline std::optional<LabelSheet::GenerateResult> GenerateFromUpload(const httplib::Request& req,
                                                                   httplib::Response& res) {
    std::optional<LabelSheet::OrderTable> table = ReadUploadedTable(req, res);
    if (!table.has_value()) { return std::nullopt; }

    LabelSheet::GenerateRequest gen_req;
    gen_req.table = std::move(*table);
    try {
        return LabelSheet::Generate(gen_req);
    } catch (const LabelSheet::Error& e) {
        spdlog::warn("Label generation failed: {}", e.what());
        SetJsonResponse(res, ErrorJson(std::string("Failed to generate PDF: ") + e.what()), 400);
        return std::nullopt;
    }
}

inline void RegisterLabelRoutes(ServerContext& ctx) {
    // Upload an order file, download the label sheet
    ctx.server.Post("/api/labels", [](const httplib::Request& req, httplib::Response& res) {
        AddCorsHeaders(req, res);
        std::optional<LabelSheet::GenerateResult> result = GenerateFromUpload(req, res);
        if (!result.has_value()) { return; }
        SetBinaryResponse(res, result->pdf, "application/pdf", kDefaultDownloadName);
    });

    // Same upload, reporting the card sequence instead of the PDF
    ctx.server.Post("/api/labels/preview",
                    [](const httplib::Request& req, httplib::Response& res) {
                        AddCorsHeaders(req, res);
                        std::optional<LabelSheet::GenerateResult> result =
                            GenerateFromUpload(req, res);
                        if (!result.has_value()) { return; }
                        json j = {
                            {"stats", GenerateStatsToJson(result->stats)},
                            {"cards", LabelCardsToJson(result->cards)},
                        };
                        SetJsonResponse(res, j);
                    });
}
