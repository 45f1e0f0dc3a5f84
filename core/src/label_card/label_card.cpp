#include "labelsheet/label_card.h"
#include "labelsheet/error.h"

#include <spdlog/spdlog.h>

#include <string>
#include <utility>
#include <vector>

namespace LabelSheet {

LabelCard LabelCard::MakePrimary(std::string name, int64_t count) {
    LabelCard card;
    card.kind  = LabelCardKind::Primary;
    card.name  = std::move(name);
    card.count = count;
    return card;
}

LabelCard LabelCard::MakeContinuation(std::string name) {
    LabelCard card;
    card.kind = LabelCardKind::Continuation;
    card.name = std::move(name);
    return card;
}

LabelCard LabelCard::MakePackSummary(int64_t doubles, int64_t singles) {
    LabelCard card;
    card.kind    = LabelCardKind::PackSummary;
    card.name    = kPackSummaryTitle;
    card.doubles = doubles;
    card.singles = singles;
    return card;
}

bool operator==(const LabelCard& a, const LabelCard& b) {
    return a.kind == b.kind && a.name == b.name && a.count == b.count &&
           a.doubles == b.doubles && a.singles == b.singles;
}

PackSplit SplitPacks(int64_t carry_out) {
    if (carry_out <= 0) { return PackSplit{}; }
    return PackSplit{carry_out / 2, carry_out % 2};
}

int64_t RequiredLabelCount(int64_t carry_out) { return SplitPacks(carry_out).Labels(); }

LabelSequence SequenceLabelCards(const std::vector<AggregatedOrder>& orders) {
    // Checked before anything is allocated; the pack summary card counts too.
    int64_t required = 0;
    for (const AggregatedOrder& order : orders) {
        required += RequiredLabelCount(order.carry_out);
        if (required + 1 > kMaxLabelCards) {
            throw InputError("Orders need more than " + std::to_string(kMaxLabelCards) +
                             " labels (reached at '" + order.name + "')");
        }
    }

    LabelSequence seq;
    seq.cards.reserve(static_cast<size_t>(required + 1));
    for (const AggregatedOrder& order : orders) {
        if (order.carry_out <= 0) { continue; }

        const PackSplit split = SplitPacks(order.carry_out);
        seq.total_doubles += split.doubles;
        seq.total_singles += split.singles;

        seq.cards.push_back(LabelCard::MakePrimary(order.name, order.carry_out));
        for (int64_t i = 1; i < split.Labels(); ++i) {
            seq.cards.push_back(LabelCard::MakeContinuation(order.name));
        }
    }

    if (seq.total_doubles > 0 || seq.total_singles > 0) {
        seq.cards.push_back(LabelCard::MakePackSummary(seq.total_doubles, seq.total_singles));
    }
    spdlog::debug("SequenceLabelCards: {} card(s), doubles={}, singles={}", seq.cards.size(),
                  seq.total_doubles, seq.total_singles);
    return seq;
}

} // namespace LabelSheet
