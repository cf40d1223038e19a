#include <gtest/gtest.h>

#include "../core/Exception.hpp"
#include "../core/PlayMemory.hpp"
#include "TestCards.hpp"

using namespace tractor::core;
using namespace tractor::test;

namespace
{
    TrumpInfo const kSpades2 = Trump(Rank::Two, Suit::Spades);

    auto MakeTrick(std::vector<PlayRecord> plays) -> Trick
    {
        Trick t{};
        t.leader = plays.front().player;
        t.winner = t.leader;
        t.plays = std::move(plays);
        return t;
    }
}

TEST(PlayMemory, FollowerOffSuitIsVoid)
{
    GameSnapshot s = Snapshot(kSpades2);
    s.tricks.push_back(MakeTrick({
        {0, {C(Rank::Three, Suit::Diamonds)}},
        {1, {C(Rank::Seven, Suit::Clubs)}},
        {2, {C(Rank::Two, Suit::Hearts)}},
        {3, {C(Rank::Four, Suit::Diamonds)}}}));

    PlayMemory const m = PlayMemory::Build(s);
    EXPECT_FALSE(m.IsVoid(0, Suit::Diamonds));
    EXPECT_TRUE(m.IsVoid(1, Suit::Diamonds));
    // the trump-rank two is trump, not a diamond
    EXPECT_TRUE(m.IsVoid(2, Suit::Diamonds));
    EXPECT_FALSE(m.IsVoid(3, Suit::Diamonds));

    EXPECT_FALSE(m.IsVoid(1, Suit::Clubs));
    EXPECT_FALSE(m.IsVoid(1, std::nullopt));
    EXPECT_EQ(m.PlayedCards().size(), 4u);
    EXPECT_EQ(m.PlayerCount(), 4u);
}

TEST(PlayMemory, TrumpLeadMarksTrumpVoid)
{
    GameSnapshot s = Snapshot(kSpades2);
    s.tricks.push_back(MakeTrick({
        {2, {BJ()}},
        {3, {C(Rank::Ace, Suit::Spades)}},
        {0, {C(Rank::Three, Suit::Clubs)}},
        {1, {C(Rank::Two, Suit::Diamonds)}}}));

    PlayMemory const m = PlayMemory::Build(s);
    EXPECT_TRUE(m.IsVoid(0, std::nullopt));
    EXPECT_FALSE(m.IsVoid(1, std::nullopt));
    EXPECT_FALSE(m.IsVoid(3, std::nullopt));
    EXPECT_FALSE(m.IsVoid(0, Suit::Clubs));
}

TEST(PlayMemory, CurrentTrickIsRecorded)
{
    GameSnapshot s = WithLead(Snapshot(kSpades2), 1,
                              {C(Rank::King, Suit::Hearts, 0), C(Rank::King, Suit::Hearts, 1)});
    s.current_trick->plays.push_back(PlayRecord{2, {C(Rank::Five, Suit::Clubs), C(Rank::Ten, Suit::Hearts)}});

    PlayMemory const m = PlayMemory::Build(s);
    ASSERT_EQ(m.PlayedCards().size(), 4u);
    EXPECT_EQ(m.PlayedCards()[3], C(Rank::Ten, Suit::Hearts));
    EXPECT_TRUE(m.IsVoid(2, Suit::Hearts));
    EXPECT_FALSE(m.IsVoid(1, Suit::Hearts));
}

TEST(PlayMemory, SeatOutsideTableThrows)
{
    PlayMemory const m = PlayMemory::Build(Snapshot(kSpades2));
    EXPECT_THROW((void)m.IsVoid(4, Suit::Hearts), error::AssertionError);
}

TEST(PlayMemory, EmptyLeadIsRejected)
{
    GameSnapshot const s = WithLead(Snapshot(kSpades2), 0, {});
    EXPECT_THROW((void)PlayMemory::Build(s), error::AssertionError);
}
