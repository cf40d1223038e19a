#include "PlayMemory.hpp"

#include <format>
#include "Exception.hpp"
#include "TrumpOrder.hpp"

namespace tractor::core
{
    static auto VoidSlot(std::optional<Suit> const group) -> size_t
    {
        return group ? static_cast<size_t>(*group) : constants::SuitCount;
    }

    PlayMemory::PlayMemory(size_t const n_players) :
        voids_(n_players)
    {
    }

    auto PlayMemory::Build(GameSnapshot const& s) -> PlayMemory
    {
        PlayMemory m{s.PlayerCount()};
        for (Trick const& t : s.tricks) m.Record(t, s.trump);
        if (s.current_trick) m.Record(*s.current_trick, s.trump);
        return m;
    }

    auto PlayMemory::IsVoid(PlyrIdxT const player, std::optional<Suit> const group) const -> bool
    {
        TRC_ASSERT(player < voids_.size(), std::format("Player P{} outside memory", static_cast<int>(player)));
        return voids_[player][VoidSlot(group)];
    }

    auto PlayMemory::Record(Trick const& t, TrumpInfo const& trump) -> void
    {
        if (t.plays.empty()) return;
        TRC_ASSERT(!t.Lead().cards.empty(), "Trick with an empty lead");

        // The lead's first card fixes the group the followers owed.
        std::optional<Suit> const lead_group = EffectiveSuit(t.Lead().cards.front(), trump);

        for (size_t i{}; i < t.plays.size(); ++i)
        {
            PlayRecord const& play = t.plays[i];
            TRC_ASSERT(play.player < voids_.size(),
                       std::format("Play by P{} outside the table", static_cast<int>(play.player)));

            for (Card const& c : play.cards)
            {
                played_.push_back(c);

                if (i == 0) continue;
                if (EffectiveSuit(c, trump) != lead_group)
                {
                    voids_[play.player][VoidSlot(lead_group)] = true;
                }
            }
        }
    }
}
