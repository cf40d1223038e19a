#include "TrumpOrder.hpp"

#include <format>
#include "CardFormat.hpp"
#include "Exception.hpp"

namespace tractor::core
{
    static auto SuitOffset(Suit const s, TrumpInfo const& trump) -> int
    {
        if (trump.trump_suit == s) return 1000;
        switch (s)
        {
        case Suit::Spades: return 0;
        case Suit::Hearts: return 100;
        case Suit::Clubs: return 200;
        case Suit::Diamonds: return 300;
        }
        return 400;
    }

    auto IsTrump(Card const& c, TrumpInfo const& trump) -> bool
    {
        if (c.IsJoker()) return true;
        if (c.rank == trump.trump_rank) return true;
        return trump.trump_suit.has_value() && c.suit == trump.trump_suit;
    }

    auto EffectiveSuit(Card const& c, TrumpInfo const& trump) -> std::optional<Suit>
    {
        if (IsTrump(c, trump)) return std::nullopt;
        return c.suit;
    }

    auto CardStrength(Card const& c, TrumpInfo const& trump) -> int
    {
        if (c.joker) return *c.joker == JokerType::Big ? 203 : 202;
        if (c.rank == trump.trump_rank) return c.suit == trump.trump_suit ? 201 : 200;
        if (trump.trump_suit && c.suit == trump.trump_suit) return 100 + RankValue(*c.rank);
        return RankValue(*c.rank);
    }

    auto CompareCards(Card const& a, Card const& b, TrumpInfo const& trump) -> int
    {
        std::optional<Suit> const sa = EffectiveSuit(a, trump);
        std::optional<Suit> const sb = EffectiveSuit(b, trump);

        if (sa && sb && *sa != *sb)
        {
            TRC_THROW(error::Code::Precondition,
                      std::format("Cannot compare {} and {}: different plain suits",
                                  FormatCard(a), FormatCard(b)));
        }

        int const x = CardStrength(a, trump);
        int const y = CardStrength(b, trump);
        return (x > y) - (x < y);
    }

    auto GetTractorRank(Card const& c, TrumpInfo const& trump) -> int
    {
        if (c.joker) return *c.joker == JokerType::Big ? BigJokerTractorRank : SmallJokerTractorRank;
        if (c.rank == trump.trump_rank)
            return c.suit == trump.trump_suit ? TrumpSuitRankTractorRank : OffSuitRankTractorRank;

        int adjusted = RankValue(*c.rank);
        //bridge over the trump rank
        if (adjusted < RankValue(trump.trump_rank)) ++adjusted;
        return adjusted + SuitOffset(*c.suit, trump);
    }

    auto GetTractorContext(Card const& c, TrumpInfo const& trump) -> TractorContext
    {
        if (c.IsJoker()) return {TractorContextKind::Joker, std::nullopt};
        if (c.rank == trump.trump_rank) return {TractorContextKind::TrumpRank, std::nullopt};
        return {TractorContextKind::Suited, c.suit};
    }
}
