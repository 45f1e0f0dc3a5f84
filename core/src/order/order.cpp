#include "labelsheet/order.h"

#include <string>

namespace LabelSheet {

const std::string& OrderTable::Cell(size_t row, size_t column) const {
    static const std::string kEmpty;
    const std::vector<std::string>& r = rows.at(row);
    if (column >= r.size()) { return kEmpty; }
    return r[column];
}

} // namespace LabelSheet
