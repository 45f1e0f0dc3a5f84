#pragma once

#include "labelsheet/label_card.h"
#include "labelsheet/pipeline.h"

#include <nlohmann/json.hpp>

#include <vector>

inline const char* LabelCardKindToString(LabelSheet::LabelCardKind kind) {
    switch (kind) {
    case LabelSheet::LabelCardKind::Primary:
        return "primary";
    case LabelSheet::LabelCardKind::Continuation:
        return "continuation";
    case LabelSheet::LabelCardKind::PackSummary:
        return "pack_summary";
    }
    return "unknown";
}

inline nlohmann::json LabelCardToJson(const LabelSheet::LabelCard& card) {
    nlohmann::json j;
    j["kind"]  = LabelCardKindToString(card.kind);
    j["name"]  = card.name;
    j["count"] = card.count ? nlohmann::json(*card.count) : nlohmann::json(nullptr);
    if (card.IsPackSummary()) {
        j["doubles"] = card.doubles.value_or(0);
        j["singles"] = card.singles.value_or(0);
    }
    return j;
}

inline nlohmann::json LabelCardsToJson(const std::vector<LabelSheet::LabelCard>& cards) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& card : cards) { arr.push_back(LabelCardToJson(card)); }
    return arr;
}

inline nlohmann::json GenerateStatsToJson(const LabelSheet::GenerateStats& stats) {
    return nlohmann::json{
        {"input_rows", stats.input_rows},
        {"aggregated_names", stats.aggregated_names},
        {"label_cards", stats.label_cards},
        {"label_pages", stats.label_pages},
        {"summary_pages", stats.summary_pages},
        {"total_doubles", stats.total_doubles},
        {"total_singles", stats.total_singles},
        {"dine_in_entries", stats.dine_in_entries},
    };
}
