#ifndef TRACTORENGINE_DECK_HPP
#define TRACTORENGINE_DECK_HPP

#include <random>
#include <vector>
#include "Types.hpp"

namespace tractor::core
{
    struct Deal
    {
        std::vector<CardVec> hands;
        CardVec kitty;
    };

    // Both copies of every logical card, ordered by id.
    auto BuildDoubleDeck() -> CardVec;

    // Every physical card of a plain suit, trump-rank cards excluded
    // (those belong to the trump group).
    auto SuitCards(Suit s, Rank trump_rank) -> CardVec;

    // Shuffles a double deck with the config seed and deals hand_size cards to
    // each player; kitty_size cards are left for the kitty.
    auto DealRound(Config const& cfg) -> Deal;
}

#endif //TRACTORENGINE_DECK_HPP
