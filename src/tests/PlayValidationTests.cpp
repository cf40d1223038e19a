#include <gtest/gtest.h>

#include "../core/Exception.hpp"
#include "../core/ShengjiRules.hpp"
#include "../debug/Invariants.hpp"
#include "TestCards.hpp"

using namespace tractor::core;
using namespace tractor::test;
using RVC = tractor::core::error::RuleViolationCode;

namespace
{
    TrumpInfo const kHearts2 = Trump(Rank::Two, Suit::Hearts);

    auto Verdict(GameSnapshot const& s, PlyrIdxT seat, CardVec const& played) -> error::ValidateResult
    {
        return ShengjiRules{}.Validate(s, seat, s.hands[seat], played);
    }

    auto Leading(CardVec hand) -> GameSnapshot
    {
        return Snapshot(kHearts2, {std::move(hand), {}, {}, {}});
    }

    // seat 0 led, seat 1 to follow with hand
    auto Following(CardVec lead, CardVec hand, TrumpInfo trump = kHearts2) -> GameSnapshot
    {
        return WithLead(Snapshot(trump, {{}, std::move(hand), {}, {}}), 0, std::move(lead));
    }

    auto ExpectViolation(error::ValidateResult const& r, RVC code) -> void
    {
        ASSERT_FALSE(r.has_value());
        EXPECT_EQ(r.error().code, code) << error::describe(r.error());
    }
}

TEST(PlayValidation, RejectsMalformedPlays)
{
    GameSnapshot const s = Leading({C(Rank::Ace, Suit::Spades, 0), C(Rank::King, Suit::Spades, 0)});

    ExpectViolation(Verdict(s, 0, {}), RVC::Play_Empty);
    ExpectViolation(Verdict(s, 0, {C(Rank::Ace, Suit::Spades, 0), C(Rank::Ace, Suit::Spades, 0)}),
                    RVC::Play_DuplicateCards);
    ExpectViolation(Verdict(s, 0, {C(Rank::Ace, Suit::Spades, 1)}), RVC::Play_CardNotInHand);

    auto const r = ShengjiRules{}.Validate(s, 7, s.hands[0], CardVec{C(Rank::Ace, Suit::Spades, 0)});
    ExpectViolation(r, RVC::Play_UnknownPlayer);
    EXPECT_EQ(r.error().actor, std::optional<PlyrIdxT>{7});
}

TEST(PlayValidation, LeadStraightCombos)
{
    CardVec const hand = Join({PairOf(Rank::Five, Suit::Spades), PairOf(Rank::Six, Suit::Spades),
                               {C(Rank::Nine, Suit::Clubs)}});
    GameSnapshot const s = Leading(hand);

    EXPECT_TRUE(Verdict(s, 0, {C(Rank::Nine, Suit::Clubs)}));
    EXPECT_TRUE(Verdict(s, 0, PairOf(Rank::Six, Suit::Spades)));
    EXPECT_TRUE(Verdict(s, 0, Join({PairOf(Rank::Five, Suit::Spades), PairOf(Rank::Six, Suit::Spades)})));
}

TEST(PlayValidation, LeadTrumpExhausting)
{
    GameSnapshot const s = Leading({SJ(0), SJ(1), BJ(0), C(Rank::Two, Suit::Spades), C(Rank::Ace, Suit::Hearts)});

    EXPECT_TRUE(Verdict(s, 0, {SJ(0), BJ(0), C(Rank::Two, Suit::Spades)}));
    EXPECT_TRUE(Verdict(s, 0, {C(Rank::Ace, Suit::Hearts), C(Rank::Two, Suit::Spades)}));

    ExpectViolation(Verdict(s, 0, {SJ(0), SJ(1), BJ(0)}), RVC::Lead_DuplicateTrumpCard);
}

TEST(PlayValidation, LeadMixedSuits)
{
    GameSnapshot const s = Leading({C(Rank::Ace, Suit::Spades), C(Rank::Ace, Suit::Clubs), BJ()});

    ExpectViolation(Verdict(s, 0, {C(Rank::Ace, Suit::Spades), C(Rank::Ace, Suit::Clubs)}), RVC::Lead_MixedSuits);
    ExpectViolation(Verdict(s, 0, {BJ(), C(Rank::Ace, Suit::Spades)}), RVC::Lead_MixedSuits);
}

TEST(PlayValidation, LeadMultiComboNeedsUnbeatableComponents)
{
    GameSnapshot const s = Leading({C(Rank::Ace, Suit::Spades, 0), C(Rank::King, Suit::Spades, 0)});
    auto const r = Verdict(s, 0, {C(Rank::Ace, Suit::Spades, 0), C(Rank::King, Suit::Spades, 0)});
    ExpectViolation(r, RVC::Lead_MultiComboBeatable);
    EXPECT_FALSE(r.error().reasons.empty());

    // holding both aces leaves nothing above the king
    GameSnapshot const strong = Leading({C(Rank::Ace, Suit::Spades, 0), C(Rank::Ace, Suit::Spades, 1),
                                         C(Rank::King, Suit::Spades, 0)});
    EXPECT_TRUE(Verdict(strong, 0, {C(Rank::Ace, Suit::Spades, 0), C(Rank::King, Suit::Spades, 0)}));
}

TEST(PlayValidation, LeadMultiComboAfterHigherCardsFell)
{
    TrumpInfo const t = Trump(Rank::Two, Suit::Spades);
    GameSnapshot s = Snapshot(t, {
        {C(Rank::Ace, Suit::Diamonds, 0), C(Rank::King, Suit::Diamonds, 0), C(Rank::Three, Suit::Clubs)},
        {C(Rank::Four, Suit::Clubs)}, {C(Rank::Five, Suit::Clubs)}, {C(Rank::Six, Suit::Clubs)}});

    Trick done{};
    done.leader = 1;
    done.winner = 1;
    done.plays = {{1, {C(Rank::Ace, Suit::Diamonds, 1)}},
                  {2, {C(Rank::King, Suit::Diamonds, 1)}},
                  {3, {C(Rank::Three, Suit::Diamonds, 0)}},
                  {0, {C(Rank::Four, Suit::Diamonds, 0)}}};
    s.tricks.push_back(done);

    CardVec const lead{C(Rank::Ace, Suit::Diamonds, 0), C(Rank::King, Suit::Diamonds, 0)};
    EXPECT_TRUE(IsValidPlay(lead, s.hands[0], 0, s));

    s.tricks.clear();
    EXPECT_FALSE(IsValidPlay(lead, s.hands[0], 0, s));
}

TEST(PlayValidation, FollowWrongLength)
{
    GameSnapshot const s = Following(PairOf(Rank::Seven, Suit::Spades),
                                     {C(Rank::Nine, Suit::Spades), C(Rank::Ten, Suit::Spades)});
    auto const r = Verdict(s, 1, {C(Rank::Nine, Suit::Spades)});
    ExpectViolation(r, RVC::Follow_WrongLength);
    EXPECT_EQ(r.error().lead_length, std::optional<std::uint8_t>{2});
}

TEST(PlayValidation, FollowPairMustUseAvailablePair)
{
    CardVec const hand = Join({PairOf(Rank::Nine, Suit::Spades),
                               {C(Rank::Ten, Suit::Spades), C(Rank::Jack, Suit::Spades), C(Rank::King, Suit::Hearts)}});
    GameSnapshot const s = Following(PairOf(Rank::Seven, Suit::Spades), hand);

    ExpectViolation(Verdict(s, 1, {C(Rank::Ten, Suit::Spades), C(Rank::Jack, Suit::Spades)}),
                    RVC::Follow_MustPlayMatchingCombo);
    EXPECT_TRUE(Verdict(s, 1, PairOf(Rank::Nine, Suit::Spades)));
    EXPECT_TRUE(IsValidPlay(PairOf(Rank::Nine, Suit::Spades), hand, 1, s));
}

TEST(PlayValidation, FollowTrumpPairWithAnyTrumpPair)
{
    CardVec const hand = Join({PairOf(Rank::Two, Suit::Spades), {SJ(0), SJ(1), C(Rank::Three, Suit::Clubs)}});
    GameSnapshot const s = Following(PairOf(Rank::Five, Suit::Hearts), hand);

    EXPECT_TRUE(Verdict(s, 1, PairOf(Rank::Two, Suit::Spades)));
    EXPECT_TRUE(Verdict(s, 1, {SJ(0), SJ(1)}));
    ExpectViolation(Verdict(s, 1, {C(Rank::Two, Suit::Spades), SJ(0)}), RVC::Follow_MustPlayMatchingCombo);
}

TEST(PlayValidation, FollowSuitWhenAble)
{
    GameSnapshot const s = Following(PairOf(Rank::Seven, Suit::Spades),
                                     {C(Rank::Nine, Suit::Spades), C(Rank::Ten, Suit::Spades),
                                      C(Rank::King, Suit::Clubs)});

    ExpectViolation(Verdict(s, 1, {C(Rank::Nine, Suit::Spades), C(Rank::King, Suit::Clubs)}),
                    RVC::Follow_MustFollowSuit);
    EXPECT_TRUE(Verdict(s, 1, {C(Rank::Nine, Suit::Spades), C(Rank::Ten, Suit::Spades)}));
}

TEST(PlayValidation, FollowShortSuitPlaysAllOfIt)
{
    GameSnapshot const s = Following(PairOf(Rank::Seven, Suit::Spades),
                                     {C(Rank::Nine, Suit::Spades), C(Rank::King, Suit::Clubs),
                                      C(Rank::Queen, Suit::Clubs)});

    ExpectViolation(Verdict(s, 1, {C(Rank::King, Suit::Clubs), C(Rank::Queen, Suit::Clubs)}),
                    RVC::Follow_MustPlayAllOfSuit);
    EXPECT_TRUE(Verdict(s, 1, {C(Rank::Nine, Suit::Spades), C(Rank::Queen, Suit::Clubs)}));
}

TEST(PlayValidation, FollowVoidPlaysAnything)
{
    GameSnapshot const s = Following(PairOf(Rank::Seven, Suit::Spades),
                                     {C(Rank::King, Suit::Clubs), C(Rank::Three, Suit::Diamonds), BJ()});

    EXPECT_TRUE(Verdict(s, 1, {C(Rank::King, Suit::Clubs), C(Rank::Three, Suit::Diamonds)}));
    EXPECT_TRUE(Verdict(s, 1, {BJ(), C(Rank::Three, Suit::Diamonds)}));
}

TEST(PlayValidation, FollowTractorPairsBeforeSingles)
{
    CardVec const lead = Join({PairOf(Rank::Seven, Suit::Spades), PairOf(Rank::Eight, Suit::Spades)});
    CardVec const hand = Join({PairOf(Rank::Nine, Suit::Spades),
                               {C(Rank::Jack, Suit::Spades), C(Rank::Queen, Suit::Spades), C(Rank::Three, Suit::Spades)}});
    GameSnapshot const s = Following(lead, hand);

    auto const r = Verdict(s, 1, {C(Rank::Nine, Suit::Spades, 0), C(Rank::Jack, Suit::Spades),
                                  C(Rank::Queen, Suit::Spades), C(Rank::Three, Suit::Spades)});
    ExpectViolation(r, RVC::Follow_PairsBeforeSingles);
    EXPECT_EQ(r.error().required_pairs, std::optional<std::uint8_t>{1});
    EXPECT_EQ(r.error().played_pairs, std::optional<std::uint8_t>{0});

    EXPECT_TRUE(Verdict(s, 1, Join({PairOf(Rank::Nine, Suit::Spades),
                                    {C(Rank::Jack, Suit::Spades), C(Rank::Queen, Suit::Spades)}})));
}

TEST(PlayValidation, FollowTractorMayNotSplitHeldPairs)
{
    CardVec const lead = Join({PairOf(Rank::Seven, Suit::Spades), PairOf(Rank::Eight, Suit::Spades)});
    CardVec const hand = Join({PairOf(Rank::Nine, Suit::Spades), PairOf(Rank::Jack, Suit::Spades),
                               {C(Rank::Three, Suit::Spades)}});
    GameSnapshot const s = Following(lead, hand);

    // one pair kept, the jacks split for the loose three
    auto const r = Verdict(s, 1, {C(Rank::Nine, Suit::Spades, 0), C(Rank::Nine, Suit::Spades, 1),
                                  C(Rank::Jack, Suit::Spades, 0), C(Rank::Three, Suit::Spades)});
    ExpectViolation(r, RVC::Follow_PairsBeforeSingles);
    EXPECT_EQ(r.error().required_pairs, std::optional<std::uint8_t>{2});
    EXPECT_EQ(r.error().played_pairs, std::optional<std::uint8_t>{1});

    EXPECT_TRUE(Verdict(s, 1, Join({PairOf(Rank::Nine, Suit::Spades), PairOf(Rank::Jack, Suit::Spades)})));
}

TEST(PlayValidation, FollowShortTractorKeepsPairsWhole)
{
    CardVec const lead = Join({PairOf(Rank::Seven, Suit::Spades), PairOf(Rank::Eight, Suit::Spades)});
    CardVec const hand = Join({PairOf(Rank::Nine, Suit::Spades),
                               {C(Rank::Three, Suit::Spades), C(Rank::King, Suit::Clubs), C(Rank::Four, Suit::Clubs)}});
    GameSnapshot const s = Following(lead, hand);

    // three spades against four led: all of them, the pair intact
    EXPECT_TRUE(Verdict(s, 1, Join({PairOf(Rank::Nine, Suit::Spades),
                                    {C(Rank::Three, Suit::Spades), C(Rank::Four, Suit::Clubs)}})));
    ExpectViolation(Verdict(s, 1, {C(Rank::Nine, Suit::Spades, 0), C(Rank::Three, Suit::Spades),
                                   C(Rank::King, Suit::Clubs), C(Rank::Four, Suit::Clubs)}),
                    RVC::Follow_MustPlayAllOfSuit);
}

TEST(PlayValidation, MultiComboFollowExhaustion)
{
    CardVec const lead = Join({PairOf(Rank::Ace, Suit::Spades), {C(Rank::King, Suit::Spades, 0)}});
    CardVec const hand{C(Rank::Nine, Suit::Spades), C(Rank::Eight, Suit::Spades),
                       C(Rank::King, Suit::Clubs), C(Rank::Three, Suit::Clubs)};
    GameSnapshot const s = Following(lead, hand);

    EXPECT_TRUE(Verdict(s, 1, {C(Rank::Nine, Suit::Spades), C(Rank::Eight, Suit::Spades), C(Rank::Three, Suit::Clubs)}));
    ExpectViolation(Verdict(s, 1, {C(Rank::Nine, Suit::Spades), C(Rank::King, Suit::Clubs),
                                   C(Rank::Three, Suit::Clubs)}),
                    RVC::Follow_MustPlayAllOfSuit);
}

TEST(PlayValidation, MultiComboFollowMustShowPairs)
{
    CardVec const lead = Join({PairOf(Rank::Ace, Suit::Spades), {C(Rank::King, Suit::Spades, 0)}});
    CardVec const hand = Join({PairOf(Rank::Nine, Suit::Spades),
                               {C(Rank::Five, Suit::Spades), C(Rank::Four, Suit::Spades), C(Rank::Three, Suit::Spades)}});
    GameSnapshot const s = Following(lead, hand);

    auto const r = Verdict(s, 1, {C(Rank::Five, Suit::Spades), C(Rank::Four, Suit::Spades), C(Rank::Three, Suit::Spades)});
    ExpectViolation(r, RVC::Follow_StructureUnderplayed);
    EXPECT_EQ(r.error().required_pairs, std::optional<std::uint8_t>{1});

    EXPECT_TRUE(Verdict(s, 1, Join({PairOf(Rank::Nine, Suit::Spades), {C(Rank::Three, Suit::Spades)}})));
}

TEST(PlayValidation, MultiComboFollowMustShowTractors)
{
    CardVec const lead = Join({PairOf(Rank::Ace, Suit::Spades), PairOf(Rank::King, Suit::Spades),
                               {C(Rank::Three, Suit::Spades, 0)}});
    CardVec const hand = Join({PairOf(Rank::Nine, Suit::Spades), PairOf(Rank::Ten, Suit::Spades),
                               PairOf(Rank::Queen, Suit::Spades), {C(Rank::Four, Suit::Spades)}});
    GameSnapshot const s = Following(lead, hand);

    auto const r = Verdict(s, 1, Join({PairOf(Rank::Nine, Suit::Spades), PairOf(Rank::Queen, Suit::Spades),
                                       {C(Rank::Four, Suit::Spades)}}));
    ExpectViolation(r, RVC::Follow_StructureUnderplayed);
    EXPECT_EQ(r.error().required_tractor_pairs, std::optional<std::uint8_t>{2});
    EXPECT_EQ(r.error().played_tractor_pairs, std::optional<std::uint8_t>{0});

    EXPECT_TRUE(Verdict(s, 1, Join({PairOf(Rank::Nine, Suit::Spades), PairOf(Rank::Ten, Suit::Spades),
                                    {C(Rank::Four, Suit::Spades)}})));
}

TEST(PlayValidation, TrumpExhaustingLeadFollow)
{
    GameSnapshot const s = Following({SJ(0), BJ(0)},
                                     {C(Rank::Five, Suit::Hearts, 0), C(Rank::Five, Suit::Hearts, 1),
                                      C(Rank::Two, Suit::Clubs), C(Rank::Ace, Suit::Spades)});

    EXPECT_TRUE(Verdict(s, 1, {C(Rank::Five, Suit::Hearts, 0), C(Rank::Two, Suit::Clubs)}));
    ExpectViolation(Verdict(s, 1, {C(Rank::Five, Suit::Hearts, 0), C(Rank::Ace, Suit::Spades)}),
                    RVC::Follow_MustFollowSuit);
}

TEST(PlayValidation, ViolationContextNamesTheLedGroup)
{
    GameSnapshot const s = Following(PairOf(Rank::Five, Suit::Hearts),
                                     {C(Rank::Ace, Suit::Hearts), C(Rank::Three, Suit::Hearts),
                                      C(Rank::King, Suit::Clubs)});
    auto const r = Verdict(s, 1, {C(Rank::Ace, Suit::Hearts), C(Rank::King, Suit::Clubs)});
    ExpectViolation(r, RVC::Follow_MustFollowSuit);
    EXPECT_TRUE(r.error().has_suit);
    EXPECT_FALSE(r.error().suit.has_value());
    EXPECT_NE(error::describe(r.error()).find("suit=Trump"), std::string::npos);
}

TEST(SnapshotInvariants, FourCopiesOfOneCardAreRejected)
{
    GameSnapshot s = Snapshot(kHearts2);
    s.hands[0] = {C(Rank::Nine, Suit::Clubs, 0), C(Rank::Nine, Suit::Clubs, 1),
                  C(Rank::Nine, Suit::Clubs, 2), C(Rank::Nine, Suit::Clubs, 3)};
    EXPECT_THROW(debug::CheckInvariants(s), error::AssertionError);
}

TEST(SnapshotInvariants, CardInTwoZonesIsRejected)
{
    GameSnapshot s = Snapshot(kHearts2);
    s.hands[0] = {C(Rank::Nine, Suit::Clubs, 0)};
    s.kitty = {C(Rank::Nine, Suit::Clubs, 0)};
    EXPECT_THROW(debug::CheckInvariants(s), error::AssertionError);

    s.kitty = {C(Rank::Nine, Suit::Clubs, 1)};
    EXPECT_NO_THROW(debug::CheckInvariants(s));
}
