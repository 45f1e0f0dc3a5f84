#include "labelsheet/schema.h"
#include "labelsheet/error.h"
#include "detail/string_utils.h"

#include <spdlog/spdlog.h>

#include <array>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace LabelSheet {

std::string NormalizeHeader(std::string_view header) {
    return detail::ToLowerAscii(detail::TrimView(header));
}

ColumnMapping ResolveColumns(const std::vector<std::string>& columns) {
    // Later duplicates of the same normalized header replace earlier ones.
    std::unordered_map<std::string, size_t> lookup;
    for (size_t i = 0; i < columns.size(); ++i) { lookup[NormalizeHeader(columns[i])] = i; }

    std::array<std::optional<size_t>, kCanonicalFields.size()> resolved{};
    for (const ColumnAlias& alias : kColumnAliases) {
        auto it = lookup.find(std::string(alias.alias));
        if (it == lookup.end()) { continue; }
        for (size_t f = 0; f < kCanonicalFields.size(); ++f) {
            if (kCanonicalFields[f] != alias.field) { continue; }
            if (!resolved[f].has_value()) {
                resolved[f] = it->second;
                spdlog::debug("ResolveColumns: '{}' -> {}", columns[it->second], alias.field);
            }
        }
    }

    std::vector<std::string> missing;
    for (size_t f = 0; f < kCanonicalFields.size(); ++f) {
        if (!resolved[f].has_value()) { missing.emplace_back(kCanonicalFields[f]); }
    }
    if (!missing.empty()) { throw SchemaError(std::move(missing)); }

    ColumnMapping mapping;
    mapping.name      = *resolved[0];
    mapping.carry_out = *resolved[1];
    mapping.dine_in   = *resolved[2];
    return mapping;
}

std::vector<CanonicalOrderRow> NormalizeRows(const OrderTable& table) {
    const ColumnMapping mapping = ResolveColumns(table.columns);

    std::vector<CanonicalOrderRow> out;
    out.reserve(table.NumRows());
    for (size_t r = 0; r < table.NumRows(); ++r) {
        CanonicalOrderRow row;
        row.name      = table.Cell(r, mapping.name);
        row.carry_out = table.Cell(r, mapping.carry_out);
        row.dine_in   = table.Cell(r, mapping.dine_in);
        out.push_back(std::move(row));
    }
    return out;
}

} // namespace LabelSheet
