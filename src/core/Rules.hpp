#ifndef TRACTORENGINE_RULES_HPP
#define TRACTORENGINE_RULES_HPP

#include <span>
#include "Exception.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace tractor::core
{
    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(GameSnapshot const& s,
                              PlyrIdxT player,
                              std::span<Card const> hand,
                              std::span<Card const> played) const -> CheckResult = 0;
    };
}

#endif //TRACTORENGINE_RULES_HPP
