#ifndef TRACTORENGINE_TRACTORDETECTOR_HPP
#define TRACTORENGINE_TRACTORDETECTOR_HPP

#include <span>
#include <vector>
#include "Combo.hpp"
#include "Types.hpp"

namespace tractor::core
{
    // All same-common_id pairs sharing one tractor rank. Only the off-suit
    // trump-rank level can hold more than one pair.
    struct PairLevel
    {
        int tractor_rank{};
        std::vector<CardVec> pairs;
    };

    // Cards bucketed by tractor context: jokers, trump-rank cards, then one
    // bucket per suit. Empty buckets are dropped.
    auto GroupByTractorContext(std::span<Card const> cards, TrumpInfo const& trump) -> std::vector<CardVec>;

    // Pair levels of one context, ascending by tractor rank.
    auto CollectPairLevels(std::span<Card const> cards, TrumpInfo const& trump) -> std::vector<PairLevel>;

    // Maximal stretches of levels with consecutive tractor ranks (length 1 included).
    auto SplitIntoRuns(std::span<PairLevel const> levels) -> std::vector<std::span<PairLevel const>>;

    // Every tractor, sub-runs and the cross product of multi-pair levels included.
    auto FindAllTractors(std::span<Card const> cards, TrumpInfo const& trump) -> std::vector<Combo>;

    auto IsValidTractor(std::span<Card const> cards, TrumpInfo const& trump) -> bool;
}

#endif //TRACTORENGINE_TRACTORDETECTOR_HPP
