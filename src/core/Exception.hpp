#ifndef TRACTORENGINE_EXCEPTION_HPP
#define TRACTORENGINE_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <source_location>
#include <stdexcept>
#include <format>
#include <string>
#include <string_view>
#include <utility>
#include "Types.hpp"

namespace tractor::core::error
{
    enum class Code : unsigned
    {
        Precondition, // incomparable cards or combos handed to the engine
        Assertion // internal or snapshot invariant failed
    };

    struct PreconditionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    // site defaults to the caller, so errors point at the TRC_ macro use.
    [[noreturn]]
    inline auto fail(Code c, std::string msg, std::source_location const& site = std::source_location::current())
        -> void
    {
        switch (c)
        {
        case Code::Precondition: throw PreconditionError(std::move(msg), c, site);
        case Code::Assertion: throw AssertionError(std::move(msg), c, site);
        }
        throw std::runtime_error(msg);
    }

#define TRC_THROW(code_enum, msg) ::tractor::core::error::fail((code_enum), (msg))
#define TRC_ASSERT(cond, msg) do { if(!(cond)) ::tractor::core::error::fail(::tractor::core::error::Code::Assertion, (msg)); } while(0)

    // Fine-grained reasons; grouped by play position.
    enum class RuleViolationCode : std::uint16_t
    {
        // Generic
        Play_Empty,
        Play_DuplicateCards,
        Play_CardNotInHand,
        Play_UnknownPlayer,

        // Lead
        Lead_MixedSuits,
        Lead_DuplicateTrumpCard,
        Lead_MultiComboBeatable,

        // Follow
        Follow_WrongLength,
        Follow_MustPlayMatchingCombo,
        Follow_MustFollowSuit,
        Follow_MustPlayAllOfSuit,
        Follow_PairsBeforeSingles,
        Follow_StructureUnderplayed
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<PlyrIdxT> actor{};

        // nullopt with has_suit == true means the trump group
        bool has_suit{false};
        std::optional<Suit> suit{};

        std::optional<std::uint8_t> lead_length{};
        std::optional<std::uint8_t> attempted_count{};
        std::optional<std::uint8_t> relevant_count{};

        std::optional<std::uint8_t> required_pairs{};
        std::optional<std::uint8_t> played_pairs{};
        std::optional<std::uint8_t> required_tractor_pairs{};
        std::optional<std::uint8_t> played_tractor_pairs{};

        std::vector<std::string> reasons{};

        auto with_actor(PlyrIdxT s) -> RuleViolation&
        {
            actor = s;
            return *this;
        }

        auto with_suit(std::optional<Suit> s) -> RuleViolation&
        {
            has_suit = true;
            suit = s;
            return *this;
        }

        auto with_lead_length(std::uint8_t v) -> RuleViolation&
        {
            lead_length = v;
            return *this;
        }

        auto with_attempted(std::uint8_t v) -> RuleViolation&
        {
            attempted_count = v;
            return *this;
        }

        auto with_relevant(std::uint8_t v) -> RuleViolation&
        {
            relevant_count = v;
            return *this;
        }

        auto with_pairs(std::uint8_t required, std::uint8_t played) -> RuleViolation&
        {
            required_pairs = required;
            played_pairs = played;
            return *this;
        }

        auto with_tractor_pairs(std::uint8_t required, std::uint8_t played) -> RuleViolation&
        {
            required_tractor_pairs = required;
            played_tractor_pairs = played;
            return *this;
        }

        auto with_reasons(std::vector<std::string> r) -> RuleViolation&
        {
            reasons = std::move(r);
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::Play_Empty: return "Play: empty card list";
        case E::Play_DuplicateCards: return "Play: duplicate cards in play";
        case E::Play_CardNotInHand: return "Play: card not in player's hand";
        case E::Play_UnknownPlayer: return "Play: player index out of range";

        case E::Lead_MixedSuits: return "Lead: cards span several suits";
        case E::Lead_DuplicateTrumpCard: return "Lead: trump lead repeats a logical card";
        case E::Lead_MultiComboBeatable: return "Lead: multi-combo component can be beaten";

        case E::Follow_WrongLength: return "Follow: length differs from lead";
        case E::Follow_MustPlayMatchingCombo: return "Follow: matching combo available but not played";
        case E::Follow_MustFollowSuit: return "Follow: must play cards of the led suit";
        case E::Follow_MustPlayAllOfSuit: return "Follow: must play every card of the led suit";
        case E::Follow_PairsBeforeSingles: return "Follow: pairs must be played before loose cards";
        case E::Follow_StructureUnderplayed: return "Follow: weaker structure than achievable";
        }
        return "Unknown";
    }

    inline auto suit_name(std::optional<Suit> s) -> std::string_view
    {
        if (!s) return "Trump";
        switch (*s)
        {
        case Suit::Hearts: return "Hearts";
        case Suit::Diamonds: return "Diamonds";
        case Suit::Clubs: return "Clubs";
        case Suit::Spades: return "Spades";
        }
        return "?";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Compact, reproducible message for logs/tests.
        auto s = std::format("{}", to_string(v.code));
        if (v.actor) s += std::format(" | actor=P{}", static_cast<int>(*v.actor));
        if (v.has_suit) s += std::format(" | suit={}", suit_name(v.suit));
        if (v.lead_length) s += std::format(" | lead={}", *v.lead_length);
        if (v.attempted_count) s += std::format(" | attempted={}", *v.attempted_count);
        if (v.relevant_count) s += std::format(" | relevant={}", *v.relevant_count);
        if (v.required_pairs) s += std::format(" | pairs={}/{}", *v.played_pairs, *v.required_pairs);
        if (v.required_tractor_pairs)
            s += std::format(" | tractorPairs={}/{}", *v.played_tractor_pairs, *v.required_tractor_pairs);
        for (std::string const& r : v.reasons) s += std::format(" | {}", r);
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

#endif //TRACTORENGINE_EXCEPTION_HPP
