#include "Combo.hpp"

#include <algorithm>
#include <array>
#include <iterator>
#include <optional>
#include "Exception.hpp"
#include "TractorDetector.hpp"
#include "TrumpOrder.hpp"

namespace tractor::core
{
    auto ToComboType(ComboClass const& cls) -> ComboType
    {
        return std::visit([]<typename T0>(T0 const&) -> ComboType
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, SingleCombo>) return ComboType::Single;
            else if constexpr (std::is_same_v<T, PairCombo>) return ComboType::Pair;
            else if constexpr (std::is_same_v<T, TractorCombo>) return ComboType::Tractor;
            else return ComboType::NotAStraightCombo;
        }, cls);
    }

    auto ComboTypeName(ComboType const t) -> char const*
    {
        switch (t)
        {
        case ComboType::Single: return "Single";
        case ComboType::Pair: return "Pair";
        case ComboType::Tractor: return "Tractor";
        case ComboType::NotAStraightCombo: return "NotAStraightCombo";
        }
        return "?";
    }

    auto ClassifyCombo(std::span<Card const> cards, TrumpInfo const& trump) -> ComboClass
    {
        if (cards.size() == 1) return SingleCombo{cards[0]};

        if (cards.size() == 2 && IsIdentical(cards[0], cards[1]) && cards[0].id != cards[1].id)
            return PairCombo{cards[0], cards[1]};

        if (IsValidTractor(cards, trump))
            return TractorCombo{CardVec(cards.begin(), cards.end())};

        return NotAStraightCombo{};
    }

    auto GetComboType(std::span<Card const> cards, TrumpInfo const& trump) -> ComboType
    {
        return ToComboType(ClassifyCombo(cards, trump));
    }

    auto HighestStrength(std::span<Card const> cards, TrumpInfo const& trump) -> int
    {
        int best = 0;
        for (Card const& c : cards) best = std::max(best, CardStrength(c, trump));
        return best;
    }

    auto MakeCombo(ComboType const t, CardVec cards, TrumpInfo const& trump) -> Combo
    {
        TRC_ASSERT(t != ComboType::NotAStraightCombo, "Combo must be a straight combo");
        int const value = HighestStrength(cards, trump);
        return Combo{t, std::move(cards), value};
    }

    auto IdentifyCombos(std::span<Card const> cards, TrumpInfo const& trump) -> std::vector<Combo>
    {
        std::vector<Combo> out;

        for (Card const& c : cards) out.push_back(MakeCombo(ComboType::Single, CardVec{c}, trump));

        //first copy seen per common_id
        std::array<std::optional<size_t>, constants::LogicalCards> first{};
        for (size_t i{}; i < cards.size(); ++i)
        {
            std::optional<size_t>& slot = first[cards[i].common_id];
            if (!slot)
            {
                slot = i;
                continue;
            }
            if (cards[*slot].id == cards[i].id) continue;
            out.push_back(MakeCombo(ComboType::Pair, CardVec{cards[*slot], cards[i]}, trump));
            slot.reset();
        }

        std::vector<Combo> tractors = FindAllTractors(cards, trump);
        std::ranges::move(tractors, std::back_inserter(out));
        return out;
    }

    auto CountPairs(std::span<Card const> cards) -> size_t
    {
        std::array<uint8_t, constants::LogicalCards> counts{};
        for (Card const& c : cards) ++counts[c.common_id];

        size_t pairs{};
        for (uint8_t const n : counts) pairs += n / 2;
        return pairs;
    }
}
