#ifndef TRACTORENGINE_AUDITLOGGER_HPP
#define TRACTORENGINE_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <span>
#include <string>

#include "../core/Exception.hpp"
#include "../core/State.hpp"
#include "../core/Types.hpp"

namespace tractor::core::debug
{
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        // Session header (seed, trump, player count)
        auto start(std::uint64_t seed, TrumpInfo const& trump, std::size_t n_players) -> void;

        // Hand sizes by seat and the kitty
        auto deal(GameSnapshot const& s) -> void;

        // One attempted play and the verdict of the rules
        auto play(PlyrIdxT actor,
                  std::span<Card const> cards,
                  error::ValidateResult const& verdict) -> void;

        // Completed trick: winner and points
        auto trick(Trick const& t) -> void;

        // Round footer: points won by each seat, last trick winner
        auto end(GameSnapshot const& s) -> void;

        // Manual flush
        auto flush() -> void;

    private:
        std::ofstream out_;
    };
}

#endif //TRACTORENGINE_AUDITLOGGER_HPP
