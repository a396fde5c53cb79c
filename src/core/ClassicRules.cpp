#include "ClassicRules.hpp"

#include "GameState.hpp"
#include <algorithm>
#include <ranges>
#include <type_traits>

namespace
{
    inline auto Viol(tableturf::core::error::RuleViolationCode code) -> tableturf::core::error::RuleViolation
    {
        return tableturf::core::error::RuleViolation{ .code = code };
    }
}

namespace tableturf::core
{
    static auto IsSpecialBlocker(BoardSpace const& s) -> bool
    {
        return std::holds_alternative<SpecialSpace>(s)
            || std::holds_alternative<WallSpace>(s)
            || std::holds_alternative<OutOfBoundsSpace>(s);
    }

auto ClassicRules::Validate(Board const& board, Player const& player, RawInput const& raw) const -> CheckResult
{
    using RVC = ::tableturf::core::error::RuleViolationCode;

    PlayerNum const actor = player.Num();

    return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
    {
        using T = std::decay_t<T0>;

        if constexpr (std::is_same_v<T, PassAction>)
        {
            return ValidInput{raw.hand_idx, std::nullopt};
        }
        else
        {
            Card const& card = player.CardAt(raw.hand_idx);
            Grid const grid = Rotated(card.Cells(), act.rotation);

            // row-major over the rotated template
            std::vector<InkPlacement> ink;
            for (size_t y = 0; y < constants::CardWidth; ++y)
            {
                for (size_t x = 0; x < constants::CardWidth; ++x)
                {
                    if (!grid[y][x]) continue;
                    auto const pos = board.AbsolutePosition(act.x, act.y, x, y);
                    if (!pos)
                        return std::unexpected(error::to_violation(pos.error())
                                               .with_actor(actor).with_hand(raw.hand_idx));
                    ink.emplace_back(*pos, *grid[y][x]);
                }
            }

            if (act.special_activated)
            {
                if (player.Special() < card.Special())
                    return std::unexpected(Viol(RVC::InsufficientSpecial)
                                           .with_actor(actor).with_hand(raw.hand_idx)
                                           .with_special(player.Special(), card.Special()));

                if (std::ranges::any_of(ink, [&](InkPlacement const& c) { return IsSpecialBlocker(board.SpaceAt(c.first)); }))
                    return std::unexpected(Viol(RVC::SpecialCollision)
                                           .with_actor(actor).with_hand(raw.hand_idx));

                if (std::ranges::none_of(ink, [&](InkPlacement const& c) { return board.AdjacentToSpecial(c.first, actor); }))
                    return std::unexpected(Viol(RVC::SpecialNotAdjacentToSpecial)
                                           .with_actor(actor).with_hand(raw.hand_idx));
            }
            else
            {
                if (std::ranges::any_of(ink, [&](InkPlacement const& c) { return !IsEmpty(board.SpaceAt(c.first)); }))
                    return std::unexpected(Viol(RVC::InkCollision)
                                           .with_actor(actor).with_hand(raw.hand_idx));

                if (std::ranges::none_of(ink, [&](InkPlacement const& c) { return board.AdjacentToInk(c.first, actor); }))
                    return std::unexpected(Viol(RVC::InkNotAdjacentToInk)
                                           .with_actor(actor).with_hand(raw.hand_idx));
            }

            return ValidInput{raw.hand_idx, Placement{std::move(ink), act.special_activated}};
        }
    }, raw.action);
}

auto ClassicRules::Apply(GameState& game, ValidInput const& in1, ValidInput const& in2) -> void
{
    Player& p1 = game.MutablePlayer(PlayerNum::P1);
    Player& p2 = game.MutablePlayer(PlayerNum::P2);

    if (in1.IsPass() && in2.IsPass())
    {
        p1.GainSpecial(1);
        p2.GainSpecial(1);
    }
    else if (in2.IsPass())
    {
        p2.GainSpecial(1);
        Place(game, in1, PlayerNum::P1);
    }
    else if (in1.IsPass())
    {
        p1.GainSpecial(1);
        Place(game, in2, PlayerNum::P2);
    }
    else
    {
        PlaceBoth(game, in1, in2);
    }

    p1.ReplaceCard(in1.HandIdx(), *game.rng_);
    UpdateSpecialGauge(game, PlayerNum::P1);
    p2.ReplaceCard(in2.HandIdx(), *game.rng_);
    UpdateSpecialGauge(game, PlayerNum::P2);
}

auto ClassicRules::Winner(Board const& board) const -> Outcome
{
    uint32_t const ink1 = board.CountInked(PlayerNum::P1);
    uint32_t const ink2 = board.CountInked(PlayerNum::P2);
    if (ink1 > ink2) return Outcome::P1Win;
    if (ink1 < ink2) return Outcome::P2Win;
    return Outcome::Draw;
}

auto ClassicRules::Place(GameState& game, ValidInput const& in, PlayerNum const p) -> void
{
    Placement const* placement = in.GetPlacement();
    TT_ASSERT(placement != nullptr, "Place called with a pass");

    if (placement->SpecialActivated())
    {
        game.MutablePlayer(p).SpendSpecial(in.HandIdx());
    }
    game.board_.SetInk(placement->ToBoardSpaces(p));
}

auto ClassicRules::PlaceBoth(GameState& game, ValidInput const& in1, ValidInput const& in2) -> void
{
    Placement const* place1 = in1.GetPlacement();
    Placement const* place2 = in2.GetPlacement();
    TT_ASSERT(place1 != nullptr && place2 != nullptr, "PlaceBoth called with a pass");

    Player& p1 = game.MutablePlayer(PlayerNum::P1);
    Player& p2 = game.MutablePlayer(PlayerNum::P2);
    uint32_t const priority1 = p1.CardAt(in1.HandIdx()).Priority();
    uint32_t const priority2 = p2.CardAt(in2.HandIdx()).Priority();
    if (place1->SpecialActivated()) p1.SpendSpecial(in1.HandIdx());
    if (place2->SpecialActivated()) p2.SpendSpecial(in2.HandIdx());

    std::span<InkPlacement const> const cells2 = place2->InkSpaces();
    std::vector<Overlap> overlap;
    for (auto const& [pos1, ink1] : place1->InkSpaces())
    {
        auto const it = std::ranges::find_if(cells2, [&](InkPlacement const& c) { return c.first == pos1; });
        if (it != cells2.end())
        {
            overlap.push_back(Overlap{.pos = pos1, .p1 = ink1, .p2 = it->second});
        }
    }

    game.board_.SetInk(place1->ToBoardSpaces(PlayerNum::P1));
    game.board_.SetInk(place2->ToBoardSpaces(PlayerNum::P2));
    if (overlap.empty()) return;

    // the lower priority card keeps contested cells, ties become walls
    std::vector<BoardWrite> resolved;
    if (priority1 > priority2)
    {
        resolved = ResolveOverlap(overlap,
                                  InkSpace{.owner = PlayerNum::P2},
                                  SpecialSpace{.owner = PlayerNum::P2, .activated = false});
    }
    else if (priority1 < priority2)
    {
        resolved = ResolveOverlap(overlap,
                                  InkSpace{.owner = PlayerNum::P1},
                                  SpecialSpace{.owner = PlayerNum::P1, .activated = false});
    }
    else
    {
        resolved = ResolveOverlap(overlap, WallSpace{}, WallSpace{});
    }
    game.board_.SetInk(resolved);
}

auto ClassicRules::ResolveOverlap(std::vector<Overlap> const& overlap,
                                  BoardSpace const& normal_collision,
                                  BoardSpace const& special_collision) -> std::vector<BoardWrite>
{
    std::vector<BoardWrite> out;
    out.reserve(overlap.size());
    for (Overlap const& o : overlap)
    {
        if (o.p1 == InkType::Normal && o.p2 == InkType::Normal)
            out.emplace_back(o.pos, normal_collision);
        else if (o.p1 == InkType::Special && o.p2 == InkType::Normal)
            out.emplace_back(o.pos, SpecialSpace{.owner = PlayerNum::P1, .activated = false});
        else if (o.p1 == InkType::Normal && o.p2 == InkType::Special)
            out.emplace_back(o.pos, SpecialSpace{.owner = PlayerNum::P2, .activated = false});
        else
            out.emplace_back(o.pos, special_collision);
    }
    return out;
}

auto ClassicRules::UpdateSpecialGauge(GameState& game, PlayerNum const p) -> void
{
    std::vector<BoardPosition> const surrounded = game.board_.SurroundedInactiveSpecials(p);
    for (BoardPosition const& pos : surrounded)
    {
        game.board_.SetSpace(pos, SpecialSpace{.owner = p, .activated = true});
    }
    game.MutablePlayer(p).GainSpecial(static_cast<uint32_t>(surrounded.size()));
}
}
