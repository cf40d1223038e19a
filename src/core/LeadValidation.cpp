#include "LeadValidation.hpp"

#include <format>
#include "Exception.hpp"
#include "Unbeatable.hpp"

namespace tractor::core
{
    auto CheckOpponentVoidStatus(Suit const suit, PlayMemory const& memory, PlyrIdxT const player) -> VoidStatus
    {
        VoidStatus status;
        size_t opponents{};
        for (PlyrIdxT p{}; p < memory.PlayerCount(); ++p)
        {
            if (p == player) continue;
            ++opponents;
            if (memory.IsVoid(p, suit)) status.void_players.push_back(p);
        }
        status.all_opponents_void = opponents != 0 && status.void_players.size() == opponents;
        return status;
    }

    auto VisibleKitty(GameSnapshot const& s, PlyrIdxT const player) -> std::span<Card const>
    {
        if (player == s.round_starting_player) return s.kitty;
        return {};
    }

    auto ValidateUnbeatableComponents(std::span<Combo const> components,
                                      Suit const suit,
                                      std::span<Card const> own_hand,
                                      PlayMemory const& memory,
                                      TrumpInfo const& trump,
                                      std::span<Card const> visible_kitty) -> UnbeatableStatus
    {
        UnseenPool const pool{suit, trump, memory.PlayedCards(), own_hand, visible_kitty};

        UnbeatableStatus status;
        for (Combo const& combo : components)
        {
            UnbeatableCheck check = pool.Check(combo);
            if (!check.is_unbeatable)
                status.beatable_components.push_back({combo, std::move(check.beaten_by)});
        }
        status.all_unbeatable = status.beatable_components.empty();
        return status;
    }

    auto ValidateLeadingMultiCombo(std::span<Combo const> components,
                                   std::optional<Suit> const suit,
                                   std::span<Card const> own_hand,
                                   PlyrIdxT const player,
                                   GameSnapshot const& s,
                                   PlayMemory const& memory) -> MultiComboValidation
    {
        MultiComboValidation v;

        if (!suit || suit == s.trump.trump_suit)
        {
            v.invalid_reasons.emplace_back("Leading multi-combos must be from a plain suit");
            return v;
        }
        TRC_ASSERT(player < s.PlayerCount(), "Leading player outside the table");

        v.void_status = CheckOpponentVoidStatus(*suit, memory, player);
        v.unbeatable_status = ValidateUnbeatableComponents(components, *suit, own_hand, memory, s.trump,
                                                           VisibleKitty(s, player));

        v.is_valid = v.void_status.all_opponents_void || v.unbeatable_status.all_unbeatable;
        if (v.is_valid) return v;

        v.invalid_reasons.push_back(std::format("{} of {} opponents void in {}",
                                                v.void_status.void_players.size(),
                                                memory.PlayerCount() - 1,
                                                error::suit_name(suit)));
        v.invalid_reasons.push_back(std::format("{} component(s) can be beaten",
                                                v.unbeatable_status.beatable_components.size()));
        return v;
    }

    auto ValidateLeadingMultiCombo(std::span<Combo const> components,
                                   std::optional<Suit> const suit,
                                   std::span<Card const> own_hand,
                                   PlyrIdxT const player,
                                   GameSnapshot const& s) -> MultiComboValidation
    {
        return ValidateLeadingMultiCombo(components, suit, own_hand, player, s, PlayMemory::Build(s));
    }
}
