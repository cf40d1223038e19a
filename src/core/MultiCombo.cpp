#include "MultiCombo.hpp"

#include <algorithm>
#include <bitset>
#include <functional>
#include <ranges>
#include "Exception.hpp"
#include "TractorDetector.hpp"
#include "TrumpOrder.hpp"

namespace tractor::core
{
    static auto ComboOrder(Combo const& a, Combo const& b) -> bool
    {
        // Tractor > Pair > Single, then longer, then stronger
        auto const rank = [](ComboType t) { return t == ComboType::Tractor ? 2 : t == ComboType::Pair ? 1 : 0; };
        if (rank(a.type) != rank(b.type)) return rank(a.type) > rank(b.type);
        if (a.cards.size() != b.cards.size()) return a.cards.size() > b.cards.size();
        return a.value > b.value;
    }

    auto DecomposeCombos(std::span<Card const> cards, TrumpInfo const& trump) -> std::vector<Combo>
    {
        std::vector<Combo> out;
        std::bitset<constants::PhysicalCards> used{};

        auto const take = [&](ComboType t, CardVec picked)
        {
            for (Card const& c : picked) used.set(c.id);
            out.push_back(MakeCombo(t, std::move(picked), trump));
        };

        for (CardVec const& ctx_cards : GroupByTractorContext(cards, trump))
        {
            std::vector<PairLevel> levels = CollectPairLevels(ctx_cards, trump);

            // Peel one layer of maximal runs at a time; only multi-pair levels
            // survive past the first layer.
            for (;;)
            {
                bool took = false;
                for (std::span<PairLevel const> const run : SplitIntoRuns(levels))
                {
                    if (run.size() < 2) continue;
                    CardVec tractor;
                    for (PairLevel const& level : run)
                    {
                        tractor.insert(tractor.end(), level.pairs.back().begin(), level.pairs.back().end());
                    }
                    take(ComboType::Tractor, std::move(tractor));
                    took = true;
                }
                if (!took) break;

                for (PairLevel& level : levels)
                {
                    std::erase_if(level.pairs, [&](CardVec const& p) { return used.test(p.front().id); });
                }
                std::erase_if(levels, [](PairLevel const& l) { return l.pairs.empty(); });
            }

            for (PairLevel const& level : levels)
            {
                for (CardVec const& pair : level.pairs) take(ComboType::Pair, pair);
            }
        }

        for (Card const& c : cards)
        {
            if (!used.test(c.id)) take(ComboType::Single, CardVec{c});
        }

        std::ranges::sort(out, ComboOrder);
        return out;
    }

    auto SummarizeCombos(std::vector<Combo> combos, TrumpInfo const& trump) -> MultiCombo
    {
        MultiCombo mc;
        mc.is_trump = !combos.empty();
        bool first = true;
        for (Combo const& combo : combos)
        {
            mc.total_length += combo.cards.size();
            for (Card const& c : combo.cards)
            {
                mc.is_trump &= IsTrump(c, trump);
                if (first) mc.suit = EffectiveSuit(c, trump);
                first = false;
            }

            switch (combo.type)
            {
            case ComboType::Pair:
                ++mc.total_pairs;
                break;
            case ComboType::Tractor:
            {
                size_t const pairs = combo.cards.size() / 2;
                ++mc.tractors;
                mc.total_pairs += pairs;
                mc.total_tractor_pairs += pairs;
                mc.tractor_sizes.push_back(pairs);
                break;
            }
            default:
                break;
            }
        }
        std::ranges::sort(mc.tractor_sizes, std::greater{});
        mc.combos = std::move(combos);
        return mc;
    }

    auto AnalyzeComboStructure(std::span<Card const> cards, TrumpInfo const& trump) -> MultiCombo
    {
        return SummarizeCombos(DecomposeCombos(cards, trump), trump);
    }

    auto DetectLeadingMultiCombo(std::span<Card const> cards, TrumpInfo const& trump) -> std::optional<MultiCombo>
    {
        if (cards.size() < 2) return std::nullopt;

        std::optional<Suit> const suit = EffectiveSuit(cards.front(), trump);
        if (!suit) return std::nullopt;

        bool const one_suit = std::ranges::all_of(cards, [&](Card const& c)
        {
            return EffectiveSuit(c, trump) == suit;
        });
        if (!one_suit) return std::nullopt;

        MultiCombo mc = AnalyzeComboStructure(cards, trump);
        if (mc.combos.size() < 2) return std::nullopt;
        return mc;
    }

    auto AchievableTractorPairs(std::span<size_t const> tractor_sizes, size_t const max_pairs) -> size_t
    {
        // 0/1 knapsack where item i may be taken at any weight in [2, size_i]
        std::vector<size_t> best(max_pairs + 1, 0);
        for (size_t const size : tractor_sizes)
        {
            for (size_t cap = max_pairs; cap >= 2; --cap)
            {
                for (size_t t{2}; t <= std::min(size, cap); ++t)
                {
                    best[cap] = std::max(best[cap], best[cap - t] + t);
                }
            }
        }
        TRC_ASSERT(best[max_pairs] <= max_pairs, "Achievable tractor pairs exceed capacity");
        return best[max_pairs];
    }
}
