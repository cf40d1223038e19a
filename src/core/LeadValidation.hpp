#ifndef TRACTORENGINE_LEADVALIDATION_HPP
#define TRACTORENGINE_LEADVALIDATION_HPP

#include <optional>
#include <span>
#include <string>
#include <vector>
#include "Combo.hpp"
#include "PlayMemory.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace tractor::core
{
    struct VoidStatus
    {
        bool all_opponents_void{false};
        std::vector<PlyrIdxT> void_players;
    };

    struct BeatableComponent
    {
        Combo combo;
        std::string beaten_by;
    };

    struct UnbeatableStatus
    {
        bool all_unbeatable{false};
        std::vector<BeatableComponent> beatable_components;
    };

    struct MultiComboValidation
    {
        bool is_valid{false};
        std::vector<std::string> invalid_reasons;
        VoidStatus void_status;
        UnbeatableStatus unbeatable_status;
    };

    auto CheckOpponentVoidStatus(Suit suit, PlayMemory const& memory, PlyrIdxT player) -> VoidStatus;

    // The kitty is only visible to the player who buried it.
    auto VisibleKitty(GameSnapshot const& s, PlyrIdxT player) -> std::span<Card const>;

    auto ValidateUnbeatableComponents(std::span<Combo const> components,
                                      Suit suit,
                                      std::span<Card const> own_hand,
                                      PlayMemory const& memory,
                                      TrumpInfo const& trump,
                                      std::span<Card const> visible_kitty) -> UnbeatableStatus;

    // suit == nullopt (trump) is never valid. Otherwise valid when every
    // opponent is void in suit or no component can be beaten.
    auto ValidateLeadingMultiCombo(std::span<Combo const> components,
                                   std::optional<Suit> suit,
                                   std::span<Card const> own_hand,
                                   PlyrIdxT player,
                                   GameSnapshot const& s,
                                   PlayMemory const& memory) -> MultiComboValidation;

    auto ValidateLeadingMultiCombo(std::span<Combo const> components,
                                   std::optional<Suit> suit,
                                   std::span<Card const> own_hand,
                                   PlyrIdxT player,
                                   GameSnapshot const& s) -> MultiComboValidation;
}

#endif //TRACTORENGINE_LEADVALIDATION_HPP
