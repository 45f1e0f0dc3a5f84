#include "bindings.h"

#include "labelsheet/error.h"
#include "labelsheet/logging.h"
#include "labelsheet/version.h"

#include <string>

namespace py = pybind11;

namespace LabelSheet::pybind {

void BindCommon(py::module_& m) {
    m.attr("__version__") = LABELSHEET_VERSION_STRING;

    // Translators run most-recent first, so the subclass is registered last.
    auto& error_type = py::register_exception<Error>(m, "Error");
    py::register_exception<SchemaError>(m, "SchemaError", error_type.ptr());

    m.def(
        "init_logging",
        [](const std::string& level) { InitLogging(ParseLogLevel(level)); },
        py::arg("level") = "info", "Initialize logging with a level name.");
}

} // namespace LabelSheet::pybind
