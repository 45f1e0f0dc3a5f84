/// \file label_card.h
/// \brief Pack-splitting policy and the label card sequence built from it.

#pragma once

#include "order.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace LabelSheet {

/// Name printed on the trailing pack totals card.
inline constexpr const char* kPackSummaryTitle = "Pack Summary";

/// Upper bound on cards in one sequence (1000 full default pages).
inline constexpr int64_t kMaxLabelCards = 30000;

/// Variant of a label card.
enum class LabelCardKind : uint8_t {
    Primary      = 0, ///< Name with the full carry-out total.
    Continuation = 1, ///< Name only, fills the remaining labels of a name.
    PackSummary  = 2, ///< Aggregate doubles/singles over all names.
};

/// Content of one grid cell. Cards are created once by SequenceLabelCards and
/// consumed in order by the layout engine.
struct LabelCard {
    LabelCardKind kind = LabelCardKind::Primary;
    std::string name;
    std::optional<int64_t> count;   ///< Set on Primary cards only.
    std::optional<int64_t> doubles; ///< Set on PackSummary cards only.
    std::optional<int64_t> singles; ///< Set on PackSummary cards only.

    static LabelCard MakePrimary(std::string name, int64_t count);
    static LabelCard MakeContinuation(std::string name);
    static LabelCard MakePackSummary(int64_t doubles, int64_t singles);

    bool IsPackSummary() const { return kind == LabelCardKind::PackSummary; }
};

bool operator==(const LabelCard& a, const LabelCard& b);

/// Carry-out units split into two-item and one-item packs.
struct PackSplit {
    int64_t doubles = 0;
    int64_t singles = 0;

    int64_t Labels() const { return doubles + singles; }
};

/// doubles = n / 2, singles = n % 2. Non-positive counts split to zero.
PackSplit SplitPacks(int64_t carry_out);

/// Physical labels needed for \p carry_out units, i.e. ceil(carry_out / 2).
int64_t RequiredLabelCount(int64_t carry_out);

/// Ordered cards plus the pack totals they were built from.
struct LabelSequence {
    std::vector<LabelCard> cards;
    int64_t total_doubles = 0;
    int64_t total_singles = 0;

    bool Empty() const { return cards.empty(); }
};

/// Expands each order with carry-out into one Primary card followed by
/// RequiredLabelCount - 1 Continuation cards, then appends one PackSummary
/// card when any packs were counted.
/// \throws InputError if the sequence would exceed kMaxLabelCards cards.
LabelSequence SequenceLabelCards(const std::vector<AggregatedOrder>& orders);

} // namespace LabelSheet
