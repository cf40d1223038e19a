#include "ShengjiRules.hpp"

#include <algorithm>
#include <ranges>
#include "LeadValidation.hpp"
#include "MultiCombo.hpp"
#include "TrumpOrder.hpp"
#include "Util.hpp"

namespace
{
    inline auto Viol(tractor::core::error::RuleViolationCode code) -> tractor::core::error::RuleViolation
    {
        return tractor::core::error::RuleViolation{ .code = code };
    }

    inline auto U8(size_t const v) -> std::uint8_t
    {
        return static_cast<std::uint8_t>(std::min<size_t>(v, 255));
    }
}

namespace tractor::core
{
    static auto FilterGroup(std::span<Card const> cards, std::optional<Suit> const group, TrumpInfo const& trump)
        -> CardVec
    {
        return cards
            | std::views::filter([&](Card const& c) { return EffectiveSuit(c, trump) == group; })
            | std::ranges::to<CardVec>();
    }

    static auto LeadPairs(ComboType const t, size_t const lead_len) -> size_t
    {
        switch (t)
        {
        case ComboType::Pair: return 1;
        case ComboType::Tractor: return lead_len / 2;
        default: return 0;
        }
    }

    // Tractor-following priority for the relevant part of a follow. With at
    // least lead_len relevant cards this also keeps every held pair whole
    // while loose cards remain, so no separate broken-pair check is needed.
    static auto CheckPairPriority(std::span<Card const> played_relevant,
                                  std::span<Card const> relevant,
                                  ComboType const lead_type,
                                  size_t const lead_len) -> error::ValidateResult
    {
        using RVC = error::RuleViolationCode;

        size_t const n = played_relevant.size();
        size_t const required = std::min({LeadPairs(lead_type, lead_len), CountPairs(relevant), n / 2});
        size_t const played_pairs = CountPairs(played_relevant);

        if (played_pairs < required)
            return std::unexpected(Viol(RVC::Follow_PairsBeforeSingles).with_pairs(U8(required), U8(played_pairs)));
        return {};
    }

    ShengjiRules::ShengjiRules(uint32_t const n_players) :
        n_players_(n_players)
    {
    }

    ShengjiRules::ShengjiRules(Config const& cfg) :
        ShengjiRules(cfg.n_players)
    {
    }

    auto ShengjiRules::Validate(GameSnapshot const& s,
                                PlyrIdxT const player,
                                std::span<Card const> hand,
                                std::span<Card const> played) const -> CheckResult
    {
        return Validate(s, PlayMemory::Build(s), player, hand, played);
    }

    auto ShengjiRules::Validate(GameSnapshot const& s,
                                PlayMemory const& memory,
                                PlyrIdxT const player,
                                std::span<Card const> hand,
                                std::span<Card const> played) const -> CheckResult
    {
        using RVC = error::RuleViolationCode;

        if (player >= n_players_ || player >= s.PlayerCount())
            return std::unexpected(Viol(RVC::Play_UnknownPlayer).with_actor(player));

        if (played.empty())
            return std::unexpected(Viol(RVC::Play_Empty).with_actor(player));

        util::CardUniqueChecker checker{};
        for (Card const& c : played)
        {
            checker.Add(c);
            if (!util::ContainsCard(hand, c))
                return std::unexpected(Viol(RVC::Play_CardNotInHand).with_actor(player));
        }

        if (checker.ContainsDup())
            return std::unexpected(Viol(RVC::Play_DuplicateCards).with_actor(player));

        CheckResult r = s.IsLeading()
                            ? ValidateLead(s, memory, player, hand, played)
                            : ValidateFollow(s, hand, played);
        if (!r) r.error().with_actor(player);
        return r;
    }

    auto ShengjiRules::ValidateLead(GameSnapshot const& s,
                                    PlayMemory const& memory,
                                    PlyrIdxT const player,
                                    std::span<Card const> hand,
                                    std::span<Card const> played) const -> CheckResult
    {
        using RVC = error::RuleViolationCode;
        TrumpInfo const& trump = s.trump;

        if (GetComboType(played, trump) != ComboType::NotAStraightCombo) return {};

        if (std::optional<MultiCombo> const mc = DetectLeadingMultiCombo(played, trump))
        {
            MultiComboValidation v = ValidateLeadingMultiCombo(mc->combos, mc->suit, hand, player, s, memory);
            if (v.is_valid) return {};
            return std::unexpected(Viol(RVC::Lead_MultiComboBeatable)
                                   .with_suit(mc->suit)
                                   .with_attempted(U8(played.size()))
                                   .with_reasons(std::move(v.invalid_reasons)));
        }

        bool const all_trump = std::ranges::all_of(played, [&](Card const& c) { return IsTrump(c, trump); });
        if (!all_trump)
            return std::unexpected(Viol(RVC::Lead_MixedSuits).with_attempted(U8(played.size())));

        // trump-exhausting lead: distinct logical cards only
        if (CountPairs(played) != 0)
            return std::unexpected(Viol(RVC::Lead_DuplicateTrumpCard)
                                   .with_suit(std::nullopt)
                                   .with_attempted(U8(played.size())));
        return {};
    }

    auto ShengjiRules::ValidateFollow(GameSnapshot const& s,
                                      std::span<Card const> hand,
                                      std::span<Card const> played) const -> CheckResult
    {
        using RVC = error::RuleViolationCode;

        TrumpInfo const& trump = s.trump;
        CardVec const& lead = s.current_trick->Lead().cards;
        TRC_ASSERT(!lead.empty(), "Current trick has an empty lead");

        size_t const lead_len = lead.size();
        std::optional<Suit> const group = EffectiveSuit(lead.front(), trump);

        auto const context = [&](RVC code)
        {
            return Viol(code)
                   .with_suit(group)
                   .with_lead_length(U8(lead_len))
                   .with_attempted(U8(played.size()));
        };

        // Rule 1
        if (played.size() != lead_len)
            return std::unexpected(context(RVC::Follow_WrongLength));

        CardVec const relevant = FilterGroup(hand, group, trump);
        CardVec const played_relevant = FilterGroup(played, group, trump);
        ComboType const lead_type = GetComboType(lead, trump);

        auto const follows_suit = [&]() -> CheckResult
        {
            if (relevant.size() >= lead_len)
            {
                if (played_relevant.size() != played.size())
                    return std::unexpected(context(RVC::Follow_MustFollowSuit).with_relevant(U8(relevant.size())));
            }
            else if (played_relevant.size() != relevant.size())
            {
                return std::unexpected(context(RVC::Follow_MustPlayAllOfSuit).with_relevant(U8(relevant.size())));
            }
            return {};
        };

        if (lead_type == ComboType::NotAStraightCombo)
        {
            if (auto r = follows_suit(); !r) return r;

            // Exhaustion first: nothing of the group left after this play
            if (played_relevant.size() == relevant.size()) return {};

            // Anti-cheat: the played structure reaches what the lead asks for,
            // capped by what lead_len relevant cards could have shown.
            MultiCombo const lead_mc = AnalyzeComboStructure(lead, trump);
            MultiCombo const avail = AnalyzeComboStructure(relevant, trump);
            MultiCombo const mine = AnalyzeComboStructure(played_relevant, trump);

            size_t const half = lead_len / 2;
            size_t const req_pairs = std::min({lead_mc.total_pairs, avail.total_pairs, half});
            size_t const req_tractor_pairs = std::min(lead_mc.total_tractor_pairs,
                                                      AchievableTractorPairs(avail.tractor_sizes, half));

            if (mine.total_pairs < req_pairs)
                return std::unexpected(context(RVC::Follow_StructureUnderplayed)
                                       .with_pairs(U8(req_pairs), U8(mine.total_pairs)));

            if (mine.total_tractor_pairs < req_tractor_pairs)
                return std::unexpected(context(RVC::Follow_StructureUnderplayed)
                                       .with_tractor_pairs(U8(req_tractor_pairs), U8(mine.total_tractor_pairs)));
            return {};
        }

        // Rule 2
        if (relevant.size() >= lead_len)
        {
            std::vector<Combo> const combos = IdentifyCombos(relevant, trump);
            bool any_match = false;
            for (Combo const& c : combos)
            {
                if (c.type != lead_type || c.cards.size() != lead_len) continue;
                any_match = true;
                if (util::SameCardSet(c.cards, played)) return {};
            }
            if (any_match)
                return std::unexpected(context(RVC::Follow_MustPlayMatchingCombo).with_relevant(U8(relevant.size())));
        }

        if (auto r = follows_suit(); !r) return r;

        // Rules 3 and 4; rule 5 has nothing relevant to check
        if (relevant.empty()) return {};

        if (auto r = CheckPairPriority(played_relevant, relevant, lead_type, lead_len); !r)
        {
            r.error().with_suit(group).with_lead_length(U8(lead_len)).with_attempted(U8(played.size()));
            return r;
        }
        return {};
    }

    auto IsValidPlay(std::span<Card const> played,
                     std::span<Card const> hand,
                     PlyrIdxT const player,
                     GameSnapshot const& s) -> bool
    {
        return ShengjiRules{static_cast<uint32_t>(s.PlayerCount())}.Validate(s, player, hand, played).has_value();
    }
}
