#ifndef TRACTORENGINE_TRUMPORDER_HPP
#define TRACTORENGINE_TRUMPORDER_HPP

#include <optional>
#include "Types.hpp"

namespace tractor::core
{
    enum class TractorContextKind : uint8_t
    {
        Joker,
        TrumpRank,
        Suited
    };

    // Cards can only form a tractor with cards of the same context.
    struct TractorContext
    {
        TractorContextKind kind{TractorContextKind::Suited};
        std::optional<Suit> suit{};

        auto operator==(TractorContext const&) const -> bool = default;
    };

    inline constexpr int BigJokerTractorRank = 1020;
    inline constexpr int SmallJokerTractorRank = 1019;
    inline constexpr int TrumpSuitRankTractorRank = 1017;
    inline constexpr int OffSuitRankTractorRank = 1016;

    // 2..14, ace high
    inline auto RankValue(Rank const r) -> int { return static_cast<int>(r) + 2; }

    auto IsTrump(Card const& c, TrumpInfo const& trump) -> bool;

    // Suit the card follows as; nullopt is the trump group.
    auto EffectiveSuit(Card const& c, TrumpInfo const& trump) -> std::optional<Suit>;

    // Total order consistent with CompareCards. Plain suits share one scale,
    // so the value is only meaningful between cards CompareCards accepts.
    auto CardStrength(Card const& c, TrumpInfo const& trump) -> int;

    // -1, 0 or 1. Throws PreconditionError for two different plain suits.
    auto CompareCards(Card const& a, Card const& b, TrumpInfo const& trump) -> int;

    auto GetTractorRank(Card const& c, TrumpInfo const& trump) -> int;
    auto GetTractorContext(Card const& c, TrumpInfo const& trump) -> TractorContext;
}

#endif //TRACTORENGINE_TRUMPORDER_HPP
