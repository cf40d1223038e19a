#ifndef TRACTORENGINE_CARDFORMAT_HPP
#define TRACTORENGINE_CARDFORMAT_HPP

#include <span>
#include <string>
#include <string_view>
#include "Types.hpp"

namespace tractor::core
{
    auto SuitLetter(Suit s) -> std::string_view;
    auto RankLetter(Rank r) -> std::string_view;

    // "TH", "AS", "SJ", "BJ"
    auto FormatCard(Card const& c) -> std::string;
    // "[TH,TH,JH]"
    auto FormatCards(std::span<Card const> cards) -> std::string;
}

#endif //TRACTORENGINE_CARDFORMAT_HPP
