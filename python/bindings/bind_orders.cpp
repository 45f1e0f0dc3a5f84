#include "bindings.h"

#include "labelsheet/aggregate.h"
#include "labelsheet/label_card.h"
#include "labelsheet/order.h"
#include "labelsheet/schema.h"

#include <string>
#include <utility>
#include <vector>

namespace py = pybind11;

namespace LabelSheet::pybind {
namespace {

OrderTable MakeTable(std::vector<std::string> columns,
                     std::vector<std::vector<std::string>> rows) {
    OrderTable table;
    table.columns = std::move(columns);
    table.rows    = std::move(rows);
    return table;
}

} // namespace

void BindOrders(py::module_& m) {
    py::class_<AggregatedOrder>(m, "AggregatedOrder", "Per-name order totals.")
        .def(py::init<>(), "Create an empty order.")
        .def_readwrite("name", &AggregatedOrder::name, "Customer name.")
        .def_readwrite("carry_out", &AggregatedOrder::carry_out, "Carry-out total.")
        .def_readwrite("dine_in", &AggregatedOrder::dine_in, "Dine-in total.");

    py::enum_<LabelCardKind>(m, "LabelCardKind", "Label card variant.")
        .value("Primary", LabelCardKind::Primary)
        .value("Continuation", LabelCardKind::Continuation)
        .value("PackSummary", LabelCardKind::PackSummary);

    py::class_<LabelCard>(m, "LabelCard", "Content of one label cell.")
        .def_readonly("kind", &LabelCard::kind, "Card variant.")
        .def_readonly("name", &LabelCard::name, "Printed name.")
        .def_readonly("count", &LabelCard::count, "Carry-out total (primary cards only).")
        .def_readonly("doubles", &LabelCard::doubles, "Total doubles (pack summary only).")
        .def_readonly("singles", &LabelCard::singles, "Total singles (pack summary only).");

    m.def("required_label_count", &RequiredLabelCount, py::arg("carry_out"),
          "Physical labels needed for a carry-out count.");

    m.def(
        "aggregate_orders",
        [](std::vector<std::string> columns, std::vector<std::vector<std::string>> rows) {
            return AggregateOrders(NormalizeRows(MakeTable(std::move(columns), std::move(rows))));
        },
        py::arg("columns"), py::arg("rows"), "Normalize and aggregate raw order rows.");

    m.def(
        "sequence_label_cards",
        [](const std::vector<AggregatedOrder>& orders) { return SequenceLabelCards(orders).cards; },
        py::arg("orders"), "Expand aggregated orders into label cards.");
}

} // namespace LabelSheet::pybind
