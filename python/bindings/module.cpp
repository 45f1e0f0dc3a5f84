#include <pybind11/pybind11.h>

#include "bindings.h"

PYBIND11_MODULE(labelsheet, m) {
    m.doc() = "LabelSheet core bindings";

    LabelSheet::pybind::BindCommon(m);
    LabelSheet::pybind::BindOrders(m);
    LabelSheet::pybind::BindPipeline(m);
}
