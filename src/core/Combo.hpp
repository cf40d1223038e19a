#ifndef TRACTORENGINE_COMBO_HPP
#define TRACTORENGINE_COMBO_HPP

#include <span>
#include <variant>
#include <vector>
#include "Types.hpp"

namespace tractor::core
{
    enum class ComboType : uint8_t
    {
        Single,
        Pair,
        Tractor,
        NotAStraightCombo
    };

    struct SingleCombo
    {
        Card card;
    };

    struct PairCombo
    {
        Card first;
        Card second;
    };

    struct TractorCombo
    {
        CardVec cards;
    };

    // Several cards that are not one straight combo (multi-combo or trump throw).
    struct NotAStraightCombo {};

    using ComboClass = std::variant<SingleCombo, PairCombo, TractorCombo, NotAStraightCombo>;

    // One straight combo: type is never NotAStraightCombo.
    struct Combo
    {
        ComboType type{ComboType::Single};
        CardVec cards;
        // strength of the highest card
        int value{};
    };

    auto ToComboType(ComboClass const& cls) -> ComboType;
    auto ComboTypeName(ComboType t) -> char const*;

    auto ClassifyCombo(std::span<Card const> cards, TrumpInfo const& trump) -> ComboClass;
    auto GetComboType(std::span<Card const> cards, TrumpInfo const& trump) -> ComboType;

    // Every single, every same-common_id pair and every tractor in cards.
    auto IdentifyCombos(std::span<Card const> cards, TrumpInfo const& trump) -> std::vector<Combo>;

    // Disjoint same-common_id pairs.
    auto CountPairs(std::span<Card const> cards) -> size_t;

    auto HighestStrength(std::span<Card const> cards, TrumpInfo const& trump) -> int;
    auto MakeCombo(ComboType t, CardVec cards, TrumpInfo const& trump) -> Combo;
}

#endif //TRACTORENGINE_COMBO_HPP
