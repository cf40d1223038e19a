#include "Unbeatable.hpp"

#include <algorithm>
#include <bitset>
#include <format>
#include "CardFormat.hpp"
#include "Deck.hpp"
#include "Exception.hpp"
#include "TractorDetector.hpp"
#include "TrumpOrder.hpp"

namespace tractor::core
{
    static auto DescribeCombo(Combo const& c) -> std::string
    {
        return std::format("{} {}", ComboTypeName(c.type), FormatCards(c.cards));
    }

    UnseenPool::UnseenPool(std::optional<Suit> const suit,
                           TrumpInfo const& trump,
                           std::span<Card const> played,
                           std::span<Card const> own_hand,
                           std::span<Card const> visible_kitty) :
        suit_(suit),
        trump_(trump)
    {
        // Trump multi-combos are not evaluated; the pool stays empty.
        if (IsTrumpGroup()) return;

        std::bitset<constants::PhysicalCards> seen{};
        for (std::span<Card const> const zone : {played, own_hand, visible_kitty})
        {
            for (Card const& c : zone) seen.set(c.id);
        }

        for (Card const& c : SuitCards(*suit_, trump_.trump_rank))
        {
            if (!seen.test(c.id)) unseen_.push_back(c);
        }

        for (Combo& c : IdentifyCombos(unseen_, trump_))
        {
            if (c.type == ComboType::Pair) unseen_pairs_.push_back(std::move(c));
        }
        unseen_tractors_ = FindAllTractors(unseen_, trump_);
    }

    auto UnseenPool::IsTrumpGroup() const -> bool
    {
        return !suit_ || suit_ == trump_.trump_suit;
    }

    auto UnseenPool::Check(Combo const& combo) const -> UnbeatableCheck
    {
        if (IsTrumpGroup()) return {false, "trump multi-combos are not evaluated"};

        for (Card const& c : combo.cards)
        {
            if (EffectiveSuit(c, trump_) != suit_)
            {
                TRC_THROW(error::Code::Precondition,
                          std::format("Component card {} is not of the pool suit", FormatCard(c)));
            }
        }

        switch (combo.type)
        {
        case ComboType::Single: return CheckSingle(combo);
        case ComboType::Pair: return CheckPair(combo);
        case ComboType::Tractor: return CheckTractor(combo);
        case ComboType::NotAStraightCombo: break;
        }
        TRC_THROW(error::Code::Precondition, "Unbeatable check needs a straight combo");
    }

    auto UnseenPool::CheckSingle(Combo const& combo) const -> UnbeatableCheck
    {
        int const top = HighestStrength(combo.cards, trump_);
        auto const it = std::ranges::find_if(unseen_, [&](Card const& u) { return CardStrength(u, trump_) > top; });
        if (it == unseen_.end()) return {true, {}};
        return {false, std::format("Single {}", FormatCard(*it))};
    }

    auto UnseenPool::CheckPair(Combo const& combo) const -> UnbeatableCheck
    {
        int const top = HighestStrength(combo.cards, trump_);
        auto const it = std::ranges::find_if(unseen_pairs_, [&](Combo const& p) { return p.value > top; });
        if (it == unseen_pairs_.end()) return {true, {}};
        return {false, DescribeCombo(*it)};
    }

    auto UnseenPool::CheckTractor(Combo const& combo) const -> UnbeatableCheck
    {
        int const top = HighestStrength(combo.cards, trump_);
        auto const it = std::ranges::find_if(unseen_tractors_, [&](Combo const& t)
        {
            return t.cards.size() == combo.cards.size() && t.value > top;
        });
        if (it == unseen_tractors_.end()) return {true, {}};
        return {false, DescribeCombo(*it)};
    }

    auto IsComboUnbeatable(Combo const& combo,
                           std::optional<Suit> const suit,
                           std::span<Card const> played,
                           std::span<Card const> own_hand,
                           TrumpInfo const& trump,
                           std::span<Card const> visible_kitty) -> bool
    {
        if (!suit || suit == trump.trump_suit) return false;
        return UnseenPool(suit, trump, played, own_hand, visible_kitty).Check(combo).is_unbeatable;
    }
}
