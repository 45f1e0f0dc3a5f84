#pragma once

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace LabelSheet::pybind {

void BindCommon(pybind11::module_& m);
void BindOrders(pybind11::module_& m);
void BindPipeline(pybind11::module_& m);

} // namespace LabelSheet::pybind
