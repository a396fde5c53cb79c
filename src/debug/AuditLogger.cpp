#include "AuditLogger.hpp"

#include <format>
#include <string>
#include <type_traits>
#include <string_view>
#include <utility>
#include <variant>

using namespace tableturf::core;

namespace
{

auto s_rotation(Rotation const r) -> std::string_view
{
    switch (r)
    {
        case Rotation::Zero:  return "0";
        case Rotation::One:   return "90";
        case Rotation::Two:   return "180";
        case Rotation::Three: return "270";
    }
    return "?";
}

auto s_input(RawInput const& in) -> std::string
{
    int const slot = static_cast<int>(std::to_underlying(in.hand_idx)) + 1;
    return std::visit(
        [&]<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PlaceAction>)
            {
                return std::format("Place(H{} @{},{} rot={}{})", slot, act.x, act.y,
                                   s_rotation(act.rotation), act.special_activated ? " special" : "");
            }
            else
            {
                return std::format("Pass(H{})", slot);
            }
        },
        in.action
    );
}

// a/b ink, A/B special, 1/2 activated special, # wall
auto s_space(BoardSpace const& s) -> char
{
    if (auto const* ink = std::get_if<InkSpace>(&s))
    {
        return ink->owner == PlayerNum::P1 ? 'a' : 'b';
    }
    if (auto const* sp = std::get_if<SpecialSpace>(&s))
    {
        if (sp->activated)
        {
            return sp->owner == PlayerNum::P1 ? '1' : '2';
        }
        return sp->owner == PlayerNum::P1 ? 'A' : 'B';
    }
    if (std::holds_alternative<WallSpace>(s))
    {
        return '#';
    }
    return '.';
}

auto s_hand(Player const& p) -> std::string
{
    std::string body;
    for (DeckIndex const d : p.CurrentHand().Cards())
    {
        body += body.empty() ? "" : ",";
        body += p.OwnDeck().At(d).Name();
    }
    return body;
}

auto s_outcome(Outcome const o) -> std::string_view
{
    switch (o)
    {
        case Outcome::P1Win: return "P1";
        case Outcome::P2Win: return "P2";
        case Outcome::Draw:  return "Draw";
    }
    return "?";
}

} // anonymous namespace

namespace tableturf::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(GameState const& game, uint64_t seed) -> void
{
    out_ << std::format("Seed={}\n", seed);
    out_ << std::format("Turns={}\n", game.TurnsLeft());
    out_ << std::format("Board={}x{}\n", game.GetBoard().Width(), game.GetBoard().Height());
    out_ << std::format("P1 hand=[{}]\n", s_hand(game.PlayerAt(PlayerNum::P1)));
    out_ << std::format("P2 hand=[{}]\n", s_hand(game.PlayerAt(PlayerNum::P2)));
    out_.flush();
}

auto AuditLogger::turn(uint32_t turn_no, RawInput const& in1, RawInput const& in2) -> void
{
    out_ << std::format("Turn {} P1={} P2={}\n", turn_no, s_input(in1), s_input(in2));
}

auto AuditLogger::board(GameState const& game) -> void
{
    Board const& b = game.GetBoard();
    for (size_t y = 0; y < b.Height(); ++y)
    {
        std::string row;
        row.reserve(b.Width());
        for (size_t x = 0; x < b.Width(); ++x)
        {
            row += s_space(b.SpaceAt(static_cast<int32_t>(x), static_cast<int32_t>(y)));
        }
        out_ << "  " << row << '\n';
    }
    out_ << std::format("  special P1={} P2={} turns_left={}\n",
                        game.PlayerAt(PlayerNum::P1).Special(),
                        game.PlayerAt(PlayerNum::P2).Special(),
                        game.TurnsLeft());
}

auto AuditLogger::end(GameState const& game) -> void
{
    Board const& b = game.GetBoard();
    out_ << std::format("Ink P1={} P2={}\n", b.CountInked(PlayerNum::P1), b.CountInked(PlayerNum::P2));
    out_ << std::format("Winner={}\n", s_outcome(game.CheckWinner()));
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace tableturf::core::debug
