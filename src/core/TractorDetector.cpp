#include "TractorDetector.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include "TrumpOrder.hpp"

namespace tractor::core
{
    static auto ContextBucket(TractorContext const& ctx) -> size_t
    {
        switch (ctx.kind)
        {
        case TractorContextKind::Joker: return 0;
        case TractorContextKind::TrumpRank: return 1;
        case TractorContextKind::Suited: return 2 + static_cast<size_t>(*ctx.suit);
        }
        return 0;
    }

    auto GroupByTractorContext(std::span<Card const> cards, TrumpInfo const& trump) -> std::vector<CardVec>
    {
        std::array<CardVec, 2 + constants::SuitCount> buckets{};
        for (Card const& c : cards)
        {
            buckets[ContextBucket(GetTractorContext(c, trump))].push_back(c);
        }

        std::vector<CardVec> out;
        for (CardVec& b : buckets)
        {
            if (!b.empty()) out.push_back(std::move(b));
        }
        return out;
    }

    auto CollectPairLevels(std::span<Card const> cards, TrumpInfo const& trump) -> std::vector<PairLevel>
    {
        std::map<int, CardVec> by_rank;
        for (Card const& c : cards) by_rank[GetTractorRank(c, trump)].push_back(c);

        std::vector<PairLevel> levels;
        for (auto& [rank, level_cards] : by_rank)
        {
            PairLevel level{rank, {}};

            std::array<std::optional<size_t>, constants::LogicalCards> first{};
            for (size_t i{}; i < level_cards.size(); ++i)
            {
                std::optional<size_t>& slot = first[level_cards[i].common_id];
                if (!slot)
                {
                    slot = i;
                    continue;
                }
                if (level_cards[*slot].id == level_cards[i].id) continue;
                level.pairs.push_back(CardVec{level_cards[*slot], level_cards[i]});
                slot.reset();
            }

            if (!level.pairs.empty()) levels.push_back(std::move(level));
        }
        return levels;
    }

    auto SplitIntoRuns(std::span<PairLevel const> levels) -> std::vector<std::span<PairLevel const>>
    {
        std::vector<std::span<PairLevel const>> runs;
        size_t start{};
        for (size_t i{1}; i <= levels.size(); ++i)
        {
            bool const breaks = i == levels.size() ||
                                levels[i].tractor_rank - levels[i - 1].tractor_rank != 1;
            if (!breaks) continue;
            if (i > start) runs.push_back(levels.subspan(start, i - start));
            start = i;
        }
        return runs;
    }

    // Appends one tractor per choice of pair at every level in [lvl, run.end).
    static auto ExpandRun(std::span<PairLevel const> run,
                          size_t const lvl,
                          CardVec& acc,
                          TrumpInfo const& trump,
                          std::vector<Combo>& out) -> void
    {
        if (lvl == run.size())
        {
            out.push_back(MakeCombo(ComboType::Tractor, acc, trump));
            return;
        }
        for (CardVec const& pair : run[lvl].pairs)
        {
            acc.insert(acc.end(), pair.begin(), pair.end());
            ExpandRun(run, lvl + 1, acc, trump, out);
            acc.erase(acc.end() - static_cast<std::ptrdiff_t>(pair.size()), acc.end());
        }
    }

    auto FindAllTractors(std::span<Card const> cards, TrumpInfo const& trump) -> std::vector<Combo>
    {
        std::vector<Combo> out;
        for (CardVec const& ctx_cards : GroupByTractorContext(cards, trump))
        {
            std::vector<PairLevel> const levels = CollectPairLevels(ctx_cards, trump);
            for (std::span<PairLevel const> const run : SplitIntoRuns(levels))
            {
                for (size_t i{}; i < run.size(); ++i)
                {
                    for (size_t len{2}; i + len <= run.size(); ++len)
                    {
                        CardVec acc;
                        acc.reserve(len * 2);
                        ExpandRun(run.subspan(i, len), 0, acc, trump, out);
                    }
                }
            }
        }
        return out;
    }

    auto IsValidTractor(std::span<Card const> cards, TrumpInfo const& trump) -> bool
    {
        if (cards.size() < 4 || cards.size() % 2 != 0) return false;

        std::vector<Combo> const tractors = FindAllTractors(cards, trump);
        //every tractor is drawn from cards, so equal size means equal set
        return std::ranges::any_of(tractors, [&](Combo const& t) { return t.cards.size() == cards.size(); });
    }
}
