#ifndef TRACTORENGINE_INVARIANTS_HPP
#define TRACTORENGINE_INVARIANTS_HPP

#include "../core/Exception.hpp"
#include "../core/State.hpp"
#include <array>
#include <bitset>
#include <format>

namespace tractor::core::debug
{
    // A second layer of checks on snapshots handed to the engine. The rules
    // assume a real double deck, so a state that could not come from one is
    // rejected here instead of being validated.
    inline auto CheckInvariants(GameSnapshot const& s) -> void
    {
#if TRC_ENABLE_TEST_HOOKS == false
        (void)s;
#else
    std::bitset<constants::PhysicalCards> seen{};
    std::array<uint8_t, constants::LogicalCards> copies{};

    // 1) Every physical card lives in at most one zone, at most two copies per logical card
    auto push_unique = [&](Card const& c)
    {
        TRC_ASSERT(c.deck < constants::DeckCount, std::format("Card with deck index {}", static_cast<int>(c.deck)));
        TRC_ASSERT(c.common_id < constants::LogicalCards, "Card outside the double deck");
        TRC_ASSERT(!seen.test(c.id), "Duplicate physical card across zones");
        seen.set(c.id);
        TRC_ASSERT(++copies[c.common_id] <= constants::DeckCount, "More copies of a logical card than decks");
    };

    for (CardVec const& h : s.hands) for (Card const& c : h) push_unique(c);
    for (Card const& c : s.kitty) push_unique(c);
    for (Trick const& t : s.tricks)
        for (PlayRecord const& p : t.plays) for (Card const& c : p.cards) push_unique(c);
    if (s.current_trick)
        for (PlayRecord const& p : s.current_trick->plays) for (Card const& c : p.cards) push_unique(c);

    // 2) Seats referenced by the snapshot exist
    TRC_ASSERT(s.round_starting_player < s.PlayerCount(), "Round starting player outside the table");

    // 3) Completed tricks hold one play per seat, every play as long as the lead
    auto check_trick = [&](Trick const& t, bool complete)
    {
        if (complete) TRC_ASSERT(t.plays.size() == s.PlayerCount(), "Completed trick missing plays");
        else TRC_ASSERT(t.plays.size() < s.PlayerCount(), "Current trick already complete");

        for (PlayRecord const& p : t.plays)
        {
            TRC_ASSERT(p.player < s.PlayerCount(), "Play by a seat outside the table");
            TRC_ASSERT(p.cards.size() == t.Lead().cards.size(), "Play length differs from the lead");
        }
    };

    for (Trick const& t : s.tricks) check_trick(t, true);
    if (s.current_trick) check_trick(*s.current_trick, false);

#endif // TRC_ENABLE_TEST_HOOKS == true
    }
}
#endif //TRACTORENGINE_INVARIANTS_HPP
