#include "labelsheet/document.h"
#include "labelsheet/error.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <numeric>
#include <string>
#include <utility>

namespace LabelSheet {

Rgb Rgb::FromHex(uint32_t hex) {
    return Rgb{static_cast<double>((hex >> 16) & 0xff) / 255.0,
               static_cast<double>((hex >> 8) & 0xff) / 255.0,
               static_cast<double>(hex & 0xff) / 255.0};
}

bool operator==(const Rgb& a, const Rgb& b) { return a.r == b.r && a.g == b.g && a.b == b.b; }

double TableItem::Width() const {
    return std::accumulate(column_widths.begin(), column_widths.end(), 0.0);
}

size_t Document::CountPages(PageKind kind) const {
    return static_cast<size_t>(std::count_if(pages.begin(), pages.end(),
                                             [kind](const Page& p) { return p.kind == kind; }));
}

DocumentRecorder::DocumentRecorder(double page_width, double page_height) {
    if (page_width <= 0.0 || page_height <= 0.0) {
        throw ConfigError("DocumentRecorder page size must be positive");
    }
    doc_.page_width  = page_width;
    doc_.page_height = page_height;
}

void DocumentRecorder::BeginPage(PageKind kind) {
    if (page_open_) { throw InternalError("BeginPage called while a page is open"); }
    Page page;
    page.kind = kind;
    doc_.pages.push_back(std::move(page));
    page_open_ = true;
}

Page& DocumentRecorder::CurrentPage(const char* op) {
    if (!page_open_) { throw InternalError(std::string(op) + " called with no open page"); }
    return doc_.pages.back();
}

void DocumentRecorder::DrawText(const TextItem& item) {
    CurrentPage("DrawText").texts.push_back(item);
}

void DocumentRecorder::DrawTable(const TableItem& item) {
    CurrentPage("DrawTable").tables.push_back(item);
}

void DocumentRecorder::EndPage() {
    CurrentPage("EndPage");
    page_open_ = false;
}

Document DocumentRecorder::Finish() {
    if (page_open_) { throw InternalError("Finish called while a page is open"); }
    spdlog::debug("DocumentRecorder: finished {} page(s)", doc_.pages.size());
    Document out     = std::move(doc_);
    doc_             = Document{};
    doc_.page_width  = out.page_width;
    doc_.page_height = out.page_height;
    return out;
}

} // namespace LabelSheet
