#include <gtest/gtest.h>
#include <limits>
#include <optional>
#include <vector>

#include "../core/ClassicRules.hpp"
#include "../core/Exception.hpp"
#include "TestUtil.hpp"

using namespace tableturf::core;
using namespace tableturf::test;
using RVC = tableturf::core::error::RuleViolationCode;

namespace
{
    // Empty when the input was accepted.
    auto Refusal(GameState const& game, PlayerNum const p, RawInput const& raw) -> std::optional<RVC>
    {
        auto const r = game.Validate(p, raw);
        if (r.has_value()) return std::nullopt;
        return r.error().code;
    }

    auto Pos(Board const& b, int32_t const x, int32_t const y) -> BoardPosition
    {
        return BoardPosition::Create(b, x, y).value();
    }
} // namespace

TEST(Validate, Pass_Is_Always_Valid)
{
    GameState const game = MakeGame(MakeBoard({"..", ".."}));
    for (HandIndex const h : {HandIndex::H1, HandIndex::H4})
    {
        ValidInput const v = Valid(game, PlayerNum::P2, Pass(h));
        EXPECT_TRUE(v.IsPass());
        EXPECT_EQ(v.HandIdx(), h);
        EXPECT_EQ(v.GetPlacement(), nullptr);
    }
}

TEST(Validate, Normal_Placement_Cells)
{
    Board const b = MakeBoard({
        "....",
        "....",
        ".a..",
        "...."});
    GameState const game = MakeGame(b);

    ValidInput const v = Valid(game, PlayerNum::P1, Place(HandIndex::H1, -2, -2));
    ASSERT_FALSE(v.IsPass());
    Placement const* p = v.GetPlacement();
    ASSERT_NE(p, nullptr);
    EXPECT_FALSE(p->SpecialActivated());

    // Splattershot, row-major
    std::vector<InkPlacement> const expected{
        {Pos(b, 0, 0), InkType::Normal}, {Pos(b, 1, 0), InkType::Normal}, {Pos(b, 2, 0), InkType::Special},
        {Pos(b, 0, 1), InkType::Normal}, {Pos(b, 1, 1), InkType::Normal}, {Pos(b, 2, 1), InkType::Normal},
        {Pos(b, 3, 1), InkType::Normal},
        {Pos(b, 0, 2), InkType::Normal},
    };
    ASSERT_EQ(p->InkSpaces().size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i)
    {
        EXPECT_EQ(p->InkSpaces()[i], expected[i]) << "cell " << i;
    }

    std::vector<BoardWrite> const writes = p->ToBoardSpaces(PlayerNum::P1);
    EXPECT_EQ(writes[2].second, BoardSpace(SpecialSpace{.owner = PlayerNum::P1, .activated = false}));
    EXPECT_EQ(writes[0].second, BoardSpace(InkSpace{.owner = PlayerNum::P1}));
}

TEST(Validate, Rotation_Moves_Cells)
{
    Board const b = MakeBoard({
        "...",
        "...",
        "..a"});
    BombFirstRng bomb;
    GameState const game = MakeGame(b, MakePlayer(PlayerNum::P1, 0, bomb), MakePlayer(PlayerNum::P2));

    ValidInput const v = Valid(game, PlayerNum::P1, Place(HandIndex::H1, -3, -3, false, Rotation::One));
    Placement const* p = v.GetPlacement();
    ASSERT_NE(p, nullptr);
    ASSERT_EQ(p->InkSpaces().size(), 3u);
    EXPECT_EQ(p->InkSpaces()[0], (InkPlacement{Pos(b, 0, 0), InkType::Special}));
    EXPECT_EQ(p->InkSpaces()[1], (InkPlacement{Pos(b, 1, 0), InkType::Normal}));
    EXPECT_EQ(p->InkSpaces()[2], (InkPlacement{Pos(b, 1, 1), InkType::Normal}));

    // unrotated, the bottom row of the card lands on the existing ink
    EXPECT_EQ(Refusal(game, PlayerNum::P1, Place(HandIndex::H1, -2, -2)), RVC::InkCollision);
}

TEST(Validate, Position_Errors)
{
    GameState const game = MakeGame(MakeBoard({"...", "...", "..a"}));

    EXPECT_EQ(Refusal(game, PlayerNum::P1, Place(HandIndex::H1, -8, -8)), RVC::Position_OutOfBounds);
    EXPECT_EQ(Refusal(game, PlayerNum::P1, Place(HandIndex::H1, 3, 0)), RVC::Position_OutOfBounds);
    EXPECT_EQ(Refusal(game, PlayerNum::P1, Place(HandIndex::H1, std::numeric_limits<int64_t>::max(), 0)),
              RVC::Position_Overflow);
    EXPECT_EQ(Refusal(game, PlayerNum::P1, Place(HandIndex::H1, int64_t{1} << 40, 0)), RVC::Position_Narrowing);

    auto const r = game.Validate(PlayerNum::P1, Place(HandIndex::H2, -8, -8));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().actor, PlayerNum::P1);
    EXPECT_EQ(r.error().hand, HandIndex::H2);
    ASSERT_TRUE(r.error().position.has_value());
    EXPECT_EQ(r.error().position->code, error::PositionErrorCode::OutOfBounds);
}

TEST(Validate, Normal_Collision_And_Adjacency)
{
    // own ink under the card
    GameState const covered = MakeGame(MakeBoard({
        "......",
        "......",
        "a.....",
        "......"}));
    EXPECT_EQ(Refusal(covered, PlayerNum::P1, Place(HandIndex::H1, -2, -2)), RVC::InkCollision);

    // a wall under the card
    GameState const walled = MakeGame(MakeBoard({
        "......",
        "......",
        ".a....",
        "#....."}));
    EXPECT_TRUE(walled.Validate(PlayerNum::P1, Place(HandIndex::H1, -2, -2)).has_value());
    EXPECT_EQ(Refusal(walled, PlayerNum::P1, Place(HandIndex::H1, -2, -1)), RVC::InkCollision);

    // ink too far away
    GameState const far = MakeGame(MakeBoard({
        "......",
        "......",
        "......",
        "......",
        "......",
        ".....a"}));
    EXPECT_EQ(Refusal(far, PlayerNum::P1, Place(HandIndex::H1, -2, -2)), RVC::InkNotAdjacentToInk);

    // only the opponent's ink is adjacent
    GameState const theirs = MakeGame(MakeBoard({
        "......",
        "......",
        ".b....",
        "......"}));
    EXPECT_EQ(Refusal(theirs, PlayerNum::P1, Place(HandIndex::H1, -2, -2)), RVC::InkNotAdjacentToInk);
    EXPECT_TRUE(theirs.Validate(PlayerNum::P2, Place(HandIndex::H1, -2, -2)).has_value());
}

TEST(Validate, Special_Meter)
{
    Board const b = MakeBoard({
        "b.....",
        "......",
        "....A.",
        "......"});
    GameState const broke = MakeGame(b, MakePlayer(PlayerNum::P1, 2), MakePlayer(PlayerNum::P2));
    auto const r = broke.Validate(PlayerNum::P1, Place(HandIndex::H1, -2, -2, true));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::InsufficientSpecial);
    EXPECT_EQ(r.error().special, 2u);
    EXPECT_EQ(r.error().required, 3u);

    // enough meter: covering opponent ink is allowed for a special placement
    GameState const rich = MakeGame(b, MakePlayer(PlayerNum::P1, 3), MakePlayer(PlayerNum::P2));
    ValidInput const v = Valid(rich, PlayerNum::P1, Place(HandIndex::H1, -2, -2, true));
    ASSERT_NE(v.GetPlacement(), nullptr);
    EXPECT_TRUE(v.GetPlacement()->SpecialActivated());
}

TEST(Validate, Special_Collision_And_Adjacency)
{
    Player const p1 = MakePlayer(PlayerNum::P1, 10);

    GameState const wall = MakeGame(MakeBoard({
        "......",
        "...#..",
        "....A.",
        "......"}), p1, MakePlayer(PlayerNum::P2));
    EXPECT_EQ(Refusal(wall, PlayerNum::P1, Place(HandIndex::H1, -2, -2, true)), RVC::SpecialCollision);

    GameState const own_special = MakeGame(MakeBoard({
        "A.....",
        "......",
        "....A.",
        "......"}), MakePlayer(PlayerNum::P1, 10), MakePlayer(PlayerNum::P2));
    EXPECT_EQ(Refusal(own_special, PlayerNum::P1, Place(HandIndex::H1, -2, -2, true)), RVC::SpecialCollision);

    // ink is not enough, a special space must touch the card
    GameState const ink_only = MakeGame(MakeBoard({
        "......",
        "......",
        "....a.",
        "......"}), MakePlayer(PlayerNum::P1, 10), MakePlayer(PlayerNum::P2));
    EXPECT_EQ(Refusal(ink_only, PlayerNum::P1, Place(HandIndex::H1, -2, -2, true)), RVC::SpecialNotAdjacentToSpecial);

    // the opponent's special does not count
    GameState const theirs = MakeGame(MakeBoard({
        "......",
        "......",
        "....B.",
        "......"}), MakePlayer(PlayerNum::P1, 10), MakePlayer(PlayerNum::P2));
    EXPECT_EQ(Refusal(theirs, PlayerNum::P1, Place(HandIndex::H1, -2, -2, true)), RVC::SpecialNotAdjacentToSpecial);
}

TEST(ClassicRules, ResolveOverlap_Mixed_Cells)
{
    Board const b = MakeBoard({"....", "...."});
    std::vector<Overlap> const overlap{
        {.pos = Pos(b, 0, 0), .p1 = InkType::Normal, .p2 = InkType::Normal},
        {.pos = Pos(b, 1, 0), .p1 = InkType::Special, .p2 = InkType::Normal},
        {.pos = Pos(b, 2, 0), .p1 = InkType::Normal, .p2 = InkType::Special},
        {.pos = Pos(b, 3, 0), .p1 = InkType::Special, .p2 = InkType::Special},
    };
    std::vector<BoardWrite> const out = ClassicRules::ResolveOverlap(
        overlap, InkSpace{.owner = PlayerNum::P2}, SpecialSpace{.owner = PlayerNum::P2, .activated = false});
    ASSERT_EQ(out.size(), 4u);
    EXPECT_EQ(out[0].second, BoardSpace(InkSpace{.owner = PlayerNum::P2}));
    EXPECT_EQ(out[1].second, BoardSpace(SpecialSpace{.owner = PlayerNum::P1, .activated = false}));
    EXPECT_EQ(out[2].second, BoardSpace(SpecialSpace{.owner = PlayerNum::P2, .activated = false}));
    EXPECT_EQ(out[3].second, BoardSpace(SpecialSpace{.owner = PlayerNum::P2, .activated = false}));

    std::vector<BoardWrite> const tie = ClassicRules::ResolveOverlap(overlap, WallSpace{}, WallSpace{});
    EXPECT_EQ(tie[0].second, BoardSpace(WallSpace{}));
    EXPECT_EQ(tie[1].second, BoardSpace(SpecialSpace{.owner = PlayerNum::P1, .activated = false}));
    EXPECT_EQ(tie[3].second, BoardSpace(WallSpace{}));
}

TEST(ClassicRules, Winner_By_Ink_Count)
{
    ClassicRules const rules;
    EXPECT_EQ(rules.Winner(MakeBoard({
        "..a.",
        "...b",
        ".A..",
        "...."})), Outcome::P1Win);
    EXPECT_EQ(rules.Winner(MakeBoard({
        "..a.",
        "...b",
        ".b..",
        "...."})), Outcome::P2Win);
    EXPECT_EQ(rules.Winner(MakeBoard({
        "aa2",
        "b1."})), Outcome::P1Win);
    EXPECT_EQ(rules.Winner(MakeBoard({
        "..a#",
        "#..b",
        "....",
        "...."})), Outcome::Draw);
}
