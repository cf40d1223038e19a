#ifndef TRACTORENGINE_SHENGJIRULES_HPP
#define TRACTORENGINE_SHENGJIRULES_HPP

#include <optional>
#include "Combo.hpp"
#include "PlayMemory.hpp"
#include "Rules.hpp"

namespace tractor::core
{
    class ShengjiRules final : public Rules
    {
    public:
        explicit ShengjiRules(uint32_t n_players = constants::NumPlayers);
        explicit ShengjiRules(Config const& cfg);

        auto Validate(GameSnapshot const& s,
                      PlyrIdxT player,
                      std::span<Card const> hand,
                      std::span<Card const> played) const -> CheckResult override;

        // Same as Validate, reusing a memory built from s.
        auto Validate(GameSnapshot const& s,
                      PlayMemory const& memory,
                      PlyrIdxT player,
                      std::span<Card const> hand,
                      std::span<Card const> played) const -> CheckResult;

    private:
        auto ValidateLead(GameSnapshot const& s,
                          PlayMemory const& memory,
                          PlyrIdxT player,
                          std::span<Card const> hand,
                          std::span<Card const> played) const -> CheckResult;

        auto ValidateFollow(GameSnapshot const& s,
                            std::span<Card const> hand,
                            std::span<Card const> played) const -> CheckResult;

        uint32_t n_players_;
    };

    auto IsValidPlay(std::span<Card const> played,
                     std::span<Card const> hand,
                     PlyrIdxT player,
                     GameSnapshot const& s) -> bool;
}

#endif //TRACTORENGINE_SHENGJIRULES_HPP
