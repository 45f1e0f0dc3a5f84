/// \file schema.h
/// \brief Maps aliased input column headers onto the canonical order schema.

#pragma once

#include "order.h"

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace LabelSheet {

/// Canonical field names, in the order they are reported when missing.
inline constexpr std::array<std::string_view, 3> kCanonicalFields = {"name", "carry_out",
                                                                     "dine_in"};

/// A header spelling accepted for a canonical field.
struct ColumnAlias {
    std::string_view alias; ///< Lower-cased, trimmed header spelling.
    std::string_view field; ///< Canonical field it maps to.
};

/// Accepted spellings, checked in this order. The first alias present in the
/// input wins for its field.
inline constexpr std::array<ColumnAlias, 8> kColumnAliases = {{
    {"name", "name"},
    {"customer", "name"},
    {"carry out", "carry_out"},
    {"carryout", "carry_out"},
    {"carry-out", "carry_out"},
    {"dine in", "dine_in"},
    {"dine-in", "dine_in"},
    {"dinein", "dine_in"},
}};

/// Column indices of the canonical fields within an OrderTable.
struct ColumnMapping {
    size_t name      = 0;
    size_t carry_out = 0;
    size_t dine_in   = 0;
};

/// Trims surrounding whitespace and lower-cases ASCII letters.
std::string NormalizeHeader(std::string_view header);

/// Resolves the canonical columns from \p columns.
/// \throws SchemaError listing every canonical field with no matching alias.
ColumnMapping ResolveColumns(const std::vector<std::string>& columns);

/// Projects every row of \p table onto the canonical fields.
/// \throws SchemaError when the headers cannot be resolved.
std::vector<CanonicalOrderRow> NormalizeRows(const OrderTable& table);

} // namespace LabelSheet
