/// \file aggregate.h
/// \brief Quantity coercion and per-name grouping of order rows.

#pragma once

#include "order.h"

#include <cstdint>
#include <string_view>
#include <vector>

namespace LabelSheet {

/// Parses a quantity cell. Unparsable or non-finite values read as 0,
/// fractional values truncate toward zero, negatives clamp to 0.
int64_t ParseQuantity(std::string_view text);

/// Trims names, drops rows with an empty name, sums quantities per exact
/// (case-sensitive) name and returns the groups sorted by name.
std::vector<AggregatedOrder> AggregateOrders(const std::vector<CanonicalOrderRow>& rows);

/// Names with a positive dine-in total, in aggregate order.
std::vector<DineInSummaryEntry> BuildDineInSummary(const std::vector<AggregatedOrder>& orders);

} // namespace LabelSheet
