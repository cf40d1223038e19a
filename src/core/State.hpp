#ifndef TRACTORENGINE_STATE_HPP
#define TRACTORENGINE_STATE_HPP

#include <optional>
#include <vector>
#include "Types.hpp"

namespace tractor::core
{
    struct PlayRecord
    {
        PlyrIdxT player{};
        CardVec cards;
    };

    struct Trick
    {
        PlyrIdxT leader{};
        // plays[0] is the lead
        std::vector<PlayRecord> plays;
        PlyrIdxT winner{};
        uint16_t points{};
        bool is_final{false};

        [[nodiscard]]
        auto Lead() const -> PlayRecord const& { return plays.front(); }
    };

    // Read-only view of a round handed to the engine. The engine never mutates it.
    struct GameSnapshot
    {
        TrumpInfo trump{};

        std::vector<CardVec> hands;
        // nullopt or empty plays: the next play leads
        std::optional<Trick> current_trick{};
        std::vector<Trick> tricks;

        CardVec kitty;
        PlyrIdxT round_starting_player{};

        [[nodiscard]]
        auto PlayerCount() const noexcept -> size_t { return hands.size(); }

        [[nodiscard]]
        auto IsLeading() const noexcept -> bool { return !current_trick || current_trick->plays.empty(); }
    };

} // namespace tractor::core

#endif //TRACTORENGINE_STATE_HPP
