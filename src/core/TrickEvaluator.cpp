#include "TrickEvaluator.hpp"

#include <algorithm>
#include <format>
#include "Combo.hpp"
#include "Exception.hpp"
#include "MultiCombo.hpp"
#include "TrumpOrder.hpp"

namespace tractor::core
{
    static auto AllTrump(std::span<Card const> cards, TrumpInfo const& trump) -> bool
    {
        return std::ranges::all_of(cards, [&](Card const& c) { return IsTrump(c, trump); });
    }

    // Multi-combo leads fall only to an all-trump play that matches their pair
    // and tractor structure (at least as many tractors and pairs, and a longest
    // tractor no shorter than the lead's); between two such plays the strongest
    // component decides.
    static auto BeatsMultiCombo(std::span<Card const> proposed,
                                std::span<Card const> winning,
                                std::span<Card const> lead,
                                TrumpInfo const& trump) -> bool
    {
        if (!EffectiveSuit(lead.front(), trump)) return false;
        if (!AllTrump(proposed, trump)) return false;

        MultiCombo const lead_mc = AnalyzeComboStructure(lead, trump);
        MultiCombo const mine = AnalyzeComboStructure(proposed, trump);
        if (mine.total_pairs < lead_mc.total_pairs) return false;
        if (mine.tractors < lead_mc.tractors) return false;
        if (lead_mc.tractors != 0)
        {
            if (mine.total_tractor_pairs < lead_mc.total_tractor_pairs) return false;
            // tractor_sizes is descending
            if (mine.tractor_sizes.front() < lead_mc.tractor_sizes.front()) return false;
        }

        if (!AllTrump(winning, trump)) return true;

        MultiCombo const best = AnalyzeComboStructure(winning, trump);
        return mine.combos.front().value > best.combos.front().value;
    }

    auto CanBeat(std::span<Card const> proposed,
                 std::span<Card const> winning,
                 std::span<Card const> lead,
                 TrumpInfo const& trump) -> bool
    {
        if (lead.empty() || proposed.size() != lead.size() || winning.size() != lead.size())
        {
            TRC_THROW(error::Code::Precondition,
                      std::format("Cannot compare plays of {} and {} cards against a lead of {}",
                                  proposed.size(), winning.size(), lead.size()));
        }

        ComboType const lead_type = GetComboType(lead, trump);
        if (lead_type == ComboType::NotAStraightCombo) return BeatsMultiCombo(proposed, winning, lead, trump);

        if (GetComboType(proposed, trump) != lead_type) return false;

        bool const p_trump = AllTrump(proposed, trump);
        bool const w_trump = AllTrump(winning, trump);
        if (p_trump != w_trump) return p_trump;

        if (!p_trump && EffectiveSuit(proposed.front(), trump) != EffectiveSuit(winning.front(), trump))
            return false;

        return HighestStrength(proposed, trump) > HighestStrength(winning, trump);
    }

    auto ResolveWinner(Trick const& t, TrumpInfo const& trump) -> PlyrIdxT
    {
        TRC_ASSERT(!t.plays.empty(), "Cannot resolve the winner of an empty trick");

        std::span<Card const> const lead = t.Lead().cards;
        size_t best{};
        for (size_t i{1}; i < t.plays.size(); ++i)
        {
            if (CanBeat(t.plays[i].cards, t.plays[best].cards, lead, trump)) best = i;
        }
        return t.plays[best].player;
    }

    auto TrickPoints(Trick const& t) -> uint16_t
    {
        uint16_t points{};
        for (PlayRecord const& p : t.plays)
            for (Card const& c : p.cards) points = static_cast<uint16_t>(points + c.points);
        return points;
    }

    auto AppendPlay(Trick& t, PlayRecord play, TrumpInfo const& trump) -> void
    {
        if (t.plays.empty())
        {
            t.leader = play.player;
            t.winner = play.player;
        }
        else
        {
            auto const winning = std::ranges::find_if(t.plays, [&](PlayRecord const& p) { return p.player == t.winner; });
            TRC_ASSERT(winning != t.plays.end(), "Trick winner has no play in the trick");
            if (CanBeat(play.cards, winning->cards, t.Lead().cards, trump)) t.winner = play.player;
        }

        for (Card const& c : play.cards) t.points = static_cast<uint16_t>(t.points + c.points);
        t.plays.push_back(std::move(play));
    }
}
