#ifndef TRACTORENGINE_TRICKEVALUATOR_HPP
#define TRACTORENGINE_TRICKEVALUATOR_HPP

#include <span>
#include "State.hpp"
#include "Types.hpp"

namespace tractor::core
{
    // Whether proposed takes the trick from winning. All three plays must have
    // the lead's length (PreconditionError otherwise).
    auto CanBeat(std::span<Card const> proposed,
                 std::span<Card const> winning,
                 std::span<Card const> lead,
                 TrumpInfo const& trump) -> bool;

    auto ResolveWinner(Trick const& t, TrumpInfo const& trump) -> PlyrIdxT;

    auto TrickPoints(Trick const& t) -> uint16_t;

    // Adds a play and keeps winner and points current.
    auto AppendPlay(Trick& t, PlayRecord play, TrumpInfo const& trump) -> void;
}

#endif //TRACTORENGINE_TRICKEVALUATOR_HPP
