#include "bindings.h"

#include "labelsheet/error.h"
#include "labelsheet/pipeline.h"

#include <string>
#include <utility>
#include <vector>

namespace py = pybind11;

namespace LabelSheet::pybind {

void BindPipeline(py::module_& m) {
    py::class_<GenerateStats>(m, "GenerateStats", "Counters of one generation run.")
        .def_readonly("input_rows", &GenerateStats::input_rows)
        .def_readonly("aggregated_names", &GenerateStats::aggregated_names)
        .def_readonly("label_cards", &GenerateStats::label_cards)
        .def_readonly("label_pages", &GenerateStats::label_pages)
        .def_readonly("summary_pages", &GenerateStats::summary_pages)
        .def_readonly("total_doubles", &GenerateStats::total_doubles)
        .def_readonly("total_singles", &GenerateStats::total_singles)
        .def_readonly("dine_in_entries", &GenerateStats::dine_in_entries);

    m.def(
        "generate_pdf",
        [](std::vector<std::string> columns, std::vector<std::vector<std::string>> rows,
           bool compress) {
            GenerateRequest request;
            request.table.columns = std::move(columns);
            request.table.rows    = std::move(rows);
            if (request.table.Empty()) {
                throw EmptyInputError("The order table does not contain any rows to print.");
            }
            request.compress_streams = compress;

            GenerateResult result = Generate(request);
            py::bytes pdf(reinterpret_cast<const char*>(result.pdf.data()), result.pdf.size());
            return py::make_tuple(pdf, result.stats);
        },
        py::arg("columns"), py::arg("rows"), py::arg("compress") = true,
        "Build the label sheet PDF. Returns (pdf_bytes, stats).");
}

} // namespace LabelSheet::pybind
