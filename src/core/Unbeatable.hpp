#ifndef TRACTORENGINE_UNBEATABLE_HPP
#define TRACTORENGINE_UNBEATABLE_HPP

#include <optional>
#include <span>
#include <string>
#include <vector>
#include "Combo.hpp"
#include "Types.hpp"

namespace tractor::core
{
    struct UnbeatableCheck
    {
        bool is_unbeatable{false};
        // the unseen combo that outranks it, empty when unbeatable
        std::string beaten_by;
    };

    // Cards of one suit that could still sit in an opponent's hand.
    // Built once per lead and shared by every component check.
    class UnseenPool
    {
    public:
        UnseenPool(std::optional<Suit> suit,
                   TrumpInfo const& trump,
                   std::span<Card const> played,
                   std::span<Card const> own_hand,
                   std::span<Card const> visible_kitty);

        [[nodiscard]]
        auto Check(Combo const& combo) const -> UnbeatableCheck;

        [[nodiscard]]
        auto Cards() const noexcept -> CardVec const& { return unseen_; }

    private:
        // nullopt or the declared trump suit
        auto IsTrumpGroup() const -> bool;
        auto CheckSingle(Combo const& combo) const -> UnbeatableCheck;
        auto CheckPair(Combo const& combo) const -> UnbeatableCheck;
        auto CheckTractor(Combo const& combo) const -> UnbeatableCheck;

        std::optional<Suit> suit_;
        TrumpInfo trump_;
        CardVec unseen_;
        std::vector<Combo> unseen_pairs_;
        std::vector<Combo> unseen_tractors_;
    };

    // The trump group (nullopt or the declared trump suit) is always reported beatable.
    auto IsComboUnbeatable(Combo const& combo,
                           std::optional<Suit> suit,
                           std::span<Card const> played,
                           std::span<Card const> own_hand,
                           TrumpInfo const& trump,
                           std::span<Card const> visible_kitty = {}) -> bool;
}

#endif //TRACTORENGINE_UNBEATABLE_HPP
