#include "AuditLogger.hpp"

#include <format>
#include <string_view>
#include <vector>

#include "../core/CardFormat.hpp"

using namespace tractor::core;

namespace
{

auto s_trump(TrumpInfo const& t) -> std::string
{
    return std::format("{}{}", RankLetter(t.trump_rank), t.trump_suit ? SuitLetter(*t.trump_suit) : "NT");
}

} // anonymous namespace

namespace tractor::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(std::uint64_t seed, TrumpInfo const& trump, std::size_t n_players) -> void
{
    out_ << std::format("Seed={}\n", seed);
    out_ << std::format("Trump={}\n", s_trump(trump));
    out_ << std::format("Players={}\n", n_players);
    out_.flush();
}

auto AuditLogger::deal(GameSnapshot const& s) -> void
{
    std::string body;

    for (std::size_t i{}; i < s.hands.size(); ++i)
    {
        body += std::format("{}{}:{}", (i ? "," : ""), i, s.hands[i].size());
    }

    out_ << std::format("Deal: handsizes=[{}] kitty={}\n", body, FormatCards(s.kitty));
}

auto AuditLogger::play(PlyrIdxT actor,
                       std::span<Card const> cards,
                       error::ValidateResult const& verdict) -> void
{
    out_ << std::format(
        "Play actor=P{} cards={} -> {}\n",
        static_cast<int>(actor),
        FormatCards(cards),
        verdict ? std::string("Legal") : error::describe(verdict.error())
    );
}

auto AuditLogger::trick(Trick const& t) -> void
{
    out_ << std::format(
        "Trick: leader=P{} winner=P{} points={}{}\n",
        static_cast<int>(t.leader),
        static_cast<int>(t.winner),
        t.points,
        (t.is_final ? " final" : "")
    );
}

auto AuditLogger::end(GameSnapshot const& s) -> void
{
    std::vector<unsigned> points(s.hands.size(), 0);
    int last = -1;

    for (Trick const& t : s.tricks)
    {
        if (t.winner < points.size()) points[t.winner] += t.points;
        last = static_cast<int>(t.winner);
    }

    std::string body;
    for (std::size_t i{}; i < points.size(); ++i)
    {
        body += std::format("{}{}:{}", (i ? "," : ""), i, points[i]);
    }

    out_ << std::format("Points=[{}]\n", body);
    out_ << std::format("LastTrick=P{}\n", last);
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace tractor::core::debug
