#ifndef TRACTORENGINE_PLAYMEMORY_HPP
#define TRACTORENGINE_PLAYMEMORY_HPP

#include <array>
#include <optional>
#include <vector>
#include "State.hpp"
#include "Types.hpp"

namespace tractor::core
{
    // What the table has revealed so far: every played card and every void a
    // follower has exposed. Rebuilt from trick history, never updated in place.
    class PlayMemory
    {
    public:
        static auto Build(GameSnapshot const& s) -> PlayMemory;

        // group == nullopt asks about the trump group
        [[nodiscard]]
        auto IsVoid(PlyrIdxT player, std::optional<Suit> group) const -> bool;

        [[nodiscard]]
        auto PlayedCards() const noexcept -> CardVec const& { return played_; }

        [[nodiscard]]
        auto PlayerCount() const noexcept -> size_t { return voids_.size(); }

    private:
        explicit PlayMemory(size_t n_players);

        auto Record(Trick const& t, TrumpInfo const& trump) -> void;

        CardVec played_;
        // per player: one flag per suit, trump last
        std::vector<std::array<bool, constants::SuitCount + 1>> voids_;
    };
}

#endif //TRACTORENGINE_PLAYMEMORY_HPP
