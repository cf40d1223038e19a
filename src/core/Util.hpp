#ifndef TRACTORENGINE_UTIL_HPP
#define TRACTORENGINE_UTIL_HPP

#include <algorithm>
#include <bitset>
#include <span>
#include "Types.hpp"

namespace tractor::core::util
{
    class CardUniqueChecker
    {
    public:
        CardUniqueChecker():
            cards_(), contains_dup_(false) {}
        auto Add(Card const& c) -> void
        {
            contains_dup_ |= cards_.test(c.id);
            cards_.set(c.id);
        }
        [[nodiscard]]
        auto ContainsDup() const -> bool
        {
            return contains_dup_;
        }
    private:
        std::bitset<constants::PhysicalCards> cards_;
        bool contains_dup_;
    };

    inline auto ContainsCard(std::span<Card const> cards, Card const& c) -> bool
    {
        return std::ranges::any_of(cards, [&](Card const& x) { return x.id == c.id; });
    }

    inline auto ContainsAll(std::span<Card const> cards, std::span<Card const> subset) -> bool
    {
        return std::ranges::all_of(subset, [&](Card const& c) { return ContainsCard(cards, c); });
    }

    // Same physical cards, ignoring order.
    inline auto SameCardSet(std::span<Card const> a, std::span<Card const> b) -> bool
    {
        return a.size() == b.size() && ContainsAll(a, b) && ContainsAll(b, a);
    }

    inline auto Without(std::span<Card const> cards, std::span<Card const> removed) -> CardVec
    {
        CardVec out;
        out.reserve(cards.size());
        for (Card const& c : cards)
            if (!ContainsCard(removed, c)) out.push_back(c);
        return out;
    }
}

#endif //TRACTORENGINE_UTIL_HPP
