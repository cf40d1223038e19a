#include "CardFormat.hpp"

#include <array>
#include <format>

namespace tractor::core
{
    auto SuitLetter(Suit const s) -> std::string_view
    {
        switch (s)
        {
            case Suit::Clubs:    return "C";
            case Suit::Diamonds: return "D";
            case Suit::Hearts:   return "H";
            case Suit::Spades:   return "S";
        }
        return "?";
    }

    auto RankLetter(Rank const r) -> std::string_view
    {
        static constexpr std::array<std::string_view, constants::RanksPerSuit> map{
            "2","3","4","5","6","7","8","9","T","J","Q","K","A"
        };
        return map[static_cast<size_t>(r)];
    }

    auto FormatCard(Card const& c) -> std::string
    {
        if (c.joker) return *c.joker == JokerType::Big ? "BJ" : "SJ";
        return std::format("{}{}", RankLetter(*c.rank), SuitLetter(*c.suit));
    }

    auto FormatCards(std::span<Card const> cards) -> std::string
    {
        std::string body;
        for (size_t i{}; i < cards.size(); ++i)
        {
            body += (i ? "," : "");
            body += FormatCard(cards[i]);
        }
        return std::format("[{}]", body);
    }
}
