#include "Deck.hpp"

#include <algorithm>
#include "Exception.hpp"

namespace tractor::core
{
    auto BuildDoubleDeck() -> CardVec
    {
        CardVec deck;
        deck.reserve(constants::PhysicalCards);
        for (size_t i{}; i < constants::SuitCount; ++i)
        {
            for (size_t j{}; j < constants::RanksPerSuit; ++j)
            {
                for (DeckIdT d{}; d < constants::DeckCount; ++d)
                {
                    deck.emplace_back(static_cast<Suit>(i), static_cast<Rank>(j), d);
                }
            }
        }
        for (JokerType const j : {JokerType::Small, JokerType::Big})
        {
            for (DeckIdT d{}; d < constants::DeckCount; ++d)
            {
                deck.emplace_back(j, d);
            }
        }
        return deck;
    }

    auto SuitCards(Suit const s, Rank const trump_rank) -> CardVec
    {
        CardVec out;
        out.reserve(constants::RanksPerSuit * constants::DeckCount);
        for (size_t j{}; j < constants::RanksPerSuit; ++j)
        {
            auto const r = static_cast<Rank>(j);
            if (r == trump_rank) continue;
            for (DeckIdT d{}; d < constants::DeckCount; ++d)
            {
                out.emplace_back(s, r, d);
            }
        }
        return out;
    }

    auto DealRound(Config const& cfg) -> Deal
    {
        TRC_ASSERT(cfg.n_players >= 2, "Less than 2 players while dealing");
        TRC_ASSERT(static_cast<size_t>(cfg.hand_size) * cfg.n_players + cfg.kitty_size == constants::PhysicalCards,
                   "Hands and kitty do not add up to the double deck");

        CardVec deck = BuildDoubleDeck();
        std::mt19937_64 rng{cfg.seed};
        std::ranges::shuffle(deck, rng);

        Deal deal;
        deal.hands.resize(cfg.n_players);
        //dealing order does not matter with a shuffled deck
        for (CardVec& hand : deal.hands)
        {
            while (hand.size() < cfg.hand_size)
            {
                hand.push_back(deck.back());
                deck.pop_back();
            }
        }
        deal.kitty = std::move(deck);
        return deal;
    }
}
