#include <gtest/gtest.h>
#include <memory>

#include "../core/GameState.hpp"
#include "../core/Exception.hpp"
#include "TestUtil.hpp"

using namespace tableturf::core;
using namespace tableturf::test;

namespace
{
    auto Board44() -> Board
    {
        return MakeBoard({
            "....",
            "....",
            ".ab.",
            "...."});
    }
} // namespace

TEST(GameState, Fresh_Deals_Both_Players)
{
    GameState const g = GameState::Fresh(constants::InitialTurns, std::make_unique<FirstRng>());
    EXPECT_EQ(g.GetBoard(), DefaultBoard());
    EXPECT_EQ(g.TurnsLeft(), 12u);
    for (PlayerNum const p : {PlayerNum::P1, PlayerNum::P2})
    {
        Player const& pl = g.PlayerAt(p);
        EXPECT_EQ(pl.Num(), p);
        EXPECT_EQ(pl.Special(), 0u);
        EXPECT_EQ(pl.OwnDeck().AvailableCount(), 11u);
        EXPECT_EQ(pl.CurrentHand().Cards(), (Hand::Indices{DeckIndex::D1, DeckIndex::D2, DeckIndex::D3, DeckIndex::D4}));
    }
    EXPECT_EQ(g.CheckWinner(), Outcome::Draw);
}

TEST(GameState, Construct_Checks_Arguments)
{
    EXPECT_THROW(GameState::Fresh(12, nullptr), error::AssertionError);
    EXPECT_THROW(GameState(Board44(), {MakePlayer(PlayerNum::P2), MakePlayer(PlayerNum::P1)}, 12,
                           std::make_unique<FirstRng>(), std::make_unique<ClassicRules>()),
                 error::AssertionError);
    EXPECT_THROW(GameState(Board44(), {MakePlayer(PlayerNum::P1), MakePlayer(PlayerNum::P2)}, 12,
                           std::make_unique<FirstRng>(), nullptr),
                 error::AssertionError);
}

TEST(GameState, Update_Pass_Pass)
{
    GameState g = MakeGame(Board44());
    Board const before = g.GetBoard();

    g.Update(Valid(g, PlayerNum::P1, Pass()), Valid(g, PlayerNum::P2, Pass()));

    EXPECT_EQ(g.GetBoard(), before);
    EXPECT_EQ(g.TurnsLeft(), 11u);
    EXPECT_EQ(g.PlayerAt(PlayerNum::P1).Special(), 1u);
    EXPECT_EQ(g.PlayerAt(PlayerNum::P2).Special(), 1u);
    EXPECT_EQ(g.PlayerAt(PlayerNum::P1).CurrentHand()[HandIndex::H1], DeckIndex::D5);
    EXPECT_EQ(g.PlayerAt(PlayerNum::P2).CurrentHand()[HandIndex::H1], DeckIndex::D5);
}

TEST(GameState, Update_Place_Pass)
{
    GameState g = MakeGame(Board44());

    g.Update(Valid(g, PlayerNum::P1, Place(HandIndex::H1, -2, -2)), Valid(g, PlayerNum::P2, Pass()));

    EXPECT_EQ(g.GetBoard(), MakeBoard({
        "aaA.",
        "aaaa",
        "aab.",
        "...."}));
    EXPECT_EQ(g.PlayerAt(PlayerNum::P1).Special(), 0u);
    EXPECT_EQ(g.PlayerAt(PlayerNum::P2).Special(), 1u);
    EXPECT_EQ(g.PlayerAt(PlayerNum::P1).CurrentHand()[HandIndex::H1], DeckIndex::D5);
    EXPECT_EQ(g.PlayerAt(PlayerNum::P2).CurrentHand()[HandIndex::H1], DeckIndex::D5);
}

TEST(GameState, Update_Pass_Place_Spends_Special)
{
    Board const b = MakeBoard({
        "....",
        "...a",
        ".B..",
        "...."});
    GameState g = MakeGame(b, MakePlayer(PlayerNum::P1), MakePlayer(PlayerNum::P2, 4));

    g.Update(Valid(g, PlayerNum::P1, Pass(HandIndex::H2)),
             Valid(g, PlayerNum::P2, Place(HandIndex::H1, -2, -2, true)));

    // a special placement covers the opponent's ink
    EXPECT_EQ(g.GetBoard(), MakeBoard({
        "bbB.",
        "bbbb",
        "bB..",
        "...."}));
    EXPECT_EQ(g.PlayerAt(PlayerNum::P1).Special(), 1u);
    EXPECT_EQ(g.PlayerAt(PlayerNum::P2).Special(), 1u);
    EXPECT_EQ(g.PlayerAt(PlayerNum::P1).CurrentHand()[HandIndex::H2], DeckIndex::D5);
    EXPECT_EQ(g.PlayerAt(PlayerNum::P1).CurrentHand()[HandIndex::H1], DeckIndex::D1);
    EXPECT_EQ(g.PlayerAt(PlayerNum::P2).CurrentHand()[HandIndex::H1], DeckIndex::D5);
    EXPECT_EQ(g.TurnsLeft(), 11u);
}

TEST(GameState, Update_Same_Priority_Makes_Walls)
{
    GameState g = MakeGame(Board44());

    g.Update(Valid(g, PlayerNum::P1, Place(HandIndex::H1, -2, -2)),
             Valid(g, PlayerNum::P2, Place(HandIndex::H1, -2, -2)));

    EXPECT_EQ(g.GetBoard(), MakeBoard({
        "###.",
        "####",
        "#ab.",
        "...."}));
    // overlaps grant nothing
    EXPECT_EQ(g.PlayerAt(PlayerNum::P1).Special(), 0u);
    EXPECT_EQ(g.PlayerAt(PlayerNum::P2).Special(), 0u);
}

TEST(GameState, Update_Offset_Overlap)
{
    GameState g = MakeGame(MakeBoard({
        ".....",
        ".....",
        "..b..",
        "a...."}));

    g.Update(Valid(g, PlayerNum::P1, Place(HandIndex::H1, -2, -2)),
             Valid(g, PlayerNum::P2, Place(HandIndex::H1, -1, -2)));

    EXPECT_EQ(g.GetBoard(), MakeBoard({
        "a#AB.",
        "a###b",
        "abb..",
        "a...."}));
}

TEST(GameState, Update_Lower_Priority_Wins_Overlap)
{
    BombFirstRng bomb;
    GameState g = MakeGame(Board44(), MakePlayer(PlayerNum::P1), MakePlayer(PlayerNum::P2, 0, bomb));
    ASSERT_EQ(g.PlayerAt(PlayerNum::P2).CardAt(HandIndex::H1).Priority(), 3u);

    g.Update(Valid(g, PlayerNum::P1, Place(HandIndex::H1, -2, -2)),
             Valid(g, PlayerNum::P2, Place(HandIndex::H1, -2, -3)));

    EXPECT_EQ(g.GetBoard(), MakeBoard({
        "aaB.",
        "abba",
        "aab.",
        "...."}));
}

TEST(GameState, Update_Lower_Priority_Wins_Overlap_For_P1)
{
    BombFirstRng bomb;
    GameState g = MakeGame(Board44(), MakePlayer(PlayerNum::P1, 0, bomb), MakePlayer(PlayerNum::P2));
    ASSERT_EQ(g.PlayerAt(PlayerNum::P1).CardAt(HandIndex::H1).Priority(), 3u);
    ASSERT_EQ(g.PlayerAt(PlayerNum::P2).CardAt(HandIndex::H1).Priority(), 8u);

    g.Update(Valid(g, PlayerNum::P1, Place(HandIndex::H1, -2, -3)),
             Valid(g, PlayerNum::P2, Place(HandIndex::H1, -2, -2)));

    EXPECT_EQ(g.GetBoard(), MakeBoard({
        "bbA.",
        "baab",
        "bab.",
        "...."}));
    EXPECT_EQ(g.PlayerAt(PlayerNum::P1).Special(), 0u);
    EXPECT_EQ(g.PlayerAt(PlayerNum::P2).Special(), 0u);
}

TEST(GameState, Update_Last_Turn_Activates_Specials)
{
    GameState g = MakeGame(MakeBoard({
        "...a",
        "....",
        "....",
        ".ab."}), 1);

    g.Update(Valid(g, PlayerNum::P1, Place(HandIndex::H1, -2, -2)),
             Valid(g, PlayerNum::P2, Place(HandIndex::H2, -2, -2)));

    EXPECT_EQ(g.GetBoard(), MakeBoard({
        "ba1a",
        "a2ba",
        "bbb.",
        ".ab."}));
    EXPECT_EQ(g.TurnsLeft(), 0u);
    EXPECT_EQ(g.PlayerAt(PlayerNum::P1).Special(), 1u);
    EXPECT_EQ(g.PlayerAt(PlayerNum::P2).Special(), 1u);
    EXPECT_EQ(g.PlayerAt(PlayerNum::P1).CurrentHand()[HandIndex::H1], DeckIndex::D5);
    EXPECT_EQ(g.PlayerAt(PlayerNum::P2).CurrentHand().Cards(),
              (Hand::Indices{DeckIndex::D1, DeckIndex::D5, DeckIndex::D3, DeckIndex::D4}));

    // the counter stays at zero
    g.Update(Valid(g, PlayerNum::P1, Pass()), Valid(g, PlayerNum::P2, Pass()));
    EXPECT_EQ(g.TurnsLeft(), 0u);
}

TEST(GameState, Update_Both_Specials)
{
    GameState g = MakeGame(MakeBoard({
            ".b.1",
            "....",
            ".a..",
            "..B."}),
        MakePlayer(PlayerNum::P1, 7), MakePlayer(PlayerNum::P2, 8), 5);

    g.Update(Valid(g, PlayerNum::P1, Place(HandIndex::H1, -2, -2, true)),
             Valid(g, PlayerNum::P2, Place(HandIndex::H2, -2, -2, true)));

    EXPECT_EQ(g.GetBoard(), MakeBoard({
        "ba11",
        "a2ba",
        "bbb.",
        "..B."}));
    EXPECT_EQ(g.TurnsLeft(), 4u);
    EXPECT_EQ(g.PlayerAt(PlayerNum::P1).Special(), 5u);
    EXPECT_EQ(g.PlayerAt(PlayerNum::P2).Special(), 6u);
    EXPECT_EQ(g.PlayerAt(PlayerNum::P1).CurrentHand()[HandIndex::H1], DeckIndex::D5);
    EXPECT_EQ(g.PlayerAt(PlayerNum::P2).CurrentHand()[HandIndex::H2], DeckIndex::D5);
}

TEST(GameState, Update_Special_Gauge_Counts_New_Activations)
{
    GameState g = MakeGame(MakeBoard({
        "A##1",
        "####",
        "A...",
        "...1"}));

    g.Update(Valid(g, PlayerNum::P1, Pass()), Valid(g, PlayerNum::P2, Pass()));

    // one from passing, one from the surrounded corner
    EXPECT_EQ(g.PlayerAt(PlayerNum::P1).Special(), 2u);
    EXPECT_EQ(g.PlayerAt(PlayerNum::P2).Special(), 1u);
    EXPECT_EQ(g.GetBoard().SpaceAt(0, 0), BoardSpace(SpecialSpace{.owner = PlayerNum::P1, .activated = true}));
    EXPECT_EQ(g.GetBoard().SpaceAt(0, 2), BoardSpace(SpecialSpace{.owner = PlayerNum::P1, .activated = false}));
}

TEST(GameState, Winner_And_Equality)
{
    GameState const a = MakeGame(MakeBoard({
        "..a.",
        "...b",
        ".A..",
        "...."}));
    GameState const b = MakeGame(MakeBoard({
        "..a.",
        "...b",
        ".A..",
        "...."}));
    EXPECT_EQ(a.CheckWinner(), Outcome::P1Win);
    EXPECT_TRUE(a == b);

    GameState const c = MakeGame(MakeBoard({
        "..a.",
        "...b",
        ".b..",
        "...."}));
    EXPECT_EQ(c.CheckWinner(), Outcome::P2Win);
    EXPECT_FALSE(a == c);
}

TEST(GameState, RedrawHand_Only_Touches_One_Player)
{
    GameState g = MakeGame(Board44());
    Player const p2 = g.PlayerAt(PlayerNum::P2);
    g.Update(Valid(g, PlayerNum::P1, Pass()), Valid(g, PlayerNum::P2, Pass()));
    ASSERT_EQ(g.PlayerAt(PlayerNum::P1).OwnDeck().AvailableCount(), 10u);

    g.RedrawHand(PlayerNum::P1);
    EXPECT_EQ(g.PlayerAt(PlayerNum::P1).OwnDeck().AvailableCount(), 11u);
    EXPECT_EQ(g.PlayerAt(PlayerNum::P1).CurrentHand().Cards(),
              (Hand::Indices{DeckIndex::D1, DeckIndex::D2, DeckIndex::D3, DeckIndex::D4}));
    EXPECT_NE(g.PlayerAt(PlayerNum::P2), p2);
    EXPECT_EQ(g.PlayerAt(PlayerNum::P2).CurrentHand()[HandIndex::H1], DeckIndex::D5);
}
