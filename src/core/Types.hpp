#ifndef TRACTORENGINE_TYPES_HPP
#define TRACTORENGINE_TYPES_HPP

#define TRC_ENABLE_TEST_HOOKS true

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>
#include <random>

namespace tractor::core::constants
{
    inline constexpr size_t NumPlayers = 4;
    inline constexpr size_t DeckCount = 2;
    inline constexpr size_t KittySize = 8;
    inline constexpr size_t SuitCount = 4;
    inline constexpr size_t RanksPerSuit = 13;
    // 52 suited cards + small joker + big joker
    inline constexpr size_t LogicalCards = SuitCount * RanksPerSuit + 2;
    inline constexpr size_t PhysicalCards = LogicalCards * DeckCount;
}

namespace tractor::core
{
    enum class Suit : uint8_t
    {
        Hearts = 0,
        Diamonds,
        Clubs,
        Spades
    };

    enum class Rank : uint8_t
    {
        Two = 0,
        Three,
        Four,
        Five,
        Six,
        Seven,
        Eight,
        Nine,
        Ten,
        Jack,
        Queen,
        King,
        Ace
    };

    enum class JokerType : uint8_t
    {
        Small = 0,
        Big
    };

    using DeckIdT = uint8_t;
    using CommonIdT = uint8_t;
    using CardIdT = uint16_t;
    using PlyrIdxT = uint8_t;

    inline constexpr CommonIdT SmallJokerCommonId = constants::SuitCount * constants::RanksPerSuit;
    inline constexpr CommonIdT BigJokerCommonId = SmallJokerCommonId + 1;

    // One physical card of the double deck. common_id is shared by both copies,
    // id is unique per physical card.
    struct Card
    {
        Card() = delete;

        Card(Suit s, Rank r, DeckIdT d = 0) :
            suit(s), rank(r), deck(d),
            common_id(static_cast<CommonIdT>(static_cast<unsigned>(s) * constants::RanksPerSuit +
                                             static_cast<unsigned>(r))),
            id(static_cast<CardIdT>(common_id * constants::DeckCount + d)),
            points(r == Rank::Five ? 5 : (r == Rank::Ten || r == Rank::King) ? 10 : 0)
        {
        }

        explicit Card(JokerType j, DeckIdT d = 0) :
            joker(j), deck(d),
            common_id(j == JokerType::Big ? BigJokerCommonId : SmallJokerCommonId),
            id(static_cast<CardIdT>(common_id * constants::DeckCount + d)),
            points(0)
        {
        }

        std::optional<Suit> suit{};
        std::optional<Rank> rank{};
        std::optional<JokerType> joker{};
        DeckIdT deck{};

        CommonIdT common_id{};
        CardIdT id{};
        uint8_t points{};

        [[nodiscard]]
        auto IsJoker() const noexcept -> bool { return joker.has_value(); }
    };

    // Instance identity. Use IsIdentical for "same logical card".
    inline auto operator==(Card const& a, Card const& b) -> bool { return a.id == b.id; }

    inline auto IsIdentical(Card const& a, Card const& b) -> bool { return a.common_id == b.common_id; }

    using CardVec = std::vector<Card>;

    struct TrumpInfo
    {
        Rank trump_rank{Rank::Two};
        // nullopt while no suit has been declared
        std::optional<Suit> trump_suit{};
    };

    struct Config
    {
        uint32_t n_players{constants::NumPlayers};
        uint8_t  hand_size{25};
        uint8_t  kitty_size{constants::KittySize};
        uint64_t seed{std::random_device{}()};
    };
}

#endif //TRACTORENGINE_TYPES_HPP
