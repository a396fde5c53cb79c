#ifndef TABLETURF_CODEC_HPP
#define TABLETURF_CODEC_HPP

#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "core/Types.hpp"
#include "core/Actions.hpp"
#include "core/Board.hpp"
#include "core/Player.hpp"

#include "generated/flatbuffers/tableturf_net_generated.h"

namespace tableturf::net
{
    struct ParseError
    {
        std::string message;
    };

    enum class MatchOutcome : uint8_t
    {
        Win,
        Lose,
        Draw
    };

    // Value-side views of server responses, for clients and tests.
    struct CardView
    {
        std::string name;
        uint32_t priority{};
        uint32_t special{};
        core::Grid cells{};
        bool available{};
    };

    struct PlayerView
    {
        core::PlayerNum player_num{};
        uint32_t special{};
        std::array<core::DeckIndex, core::constants::HandSize> hand{};
        std::vector<CardView> deck;
    };

    struct RedrawView
    {
        PlayerView player;
    };

    struct GameStateView
    {
        core::Board board;
        PlayerView player;
    };

    struct GameEndView
    {
        MatchOutcome outcome{};
    };

    using ResponseView = std::variant<RedrawView, GameStateView, GameEndView>;

    auto ToFbHand(core::HandIndex h) noexcept -> gen::net::HandIndex;
    auto FromFbHand(gen::net::HandIndex h) noexcept -> core::HandIndex;
    auto ToFbRotation(core::Rotation r) noexcept -> gen::net::Rotation;
    auto FromFbRotation(gen::net::Rotation r) noexcept -> core::Rotation;
    auto ToFbPlayerNum(core::PlayerNum p) noexcept -> gen::net::PlayerNum;
    auto FromFbPlayerNum(gen::net::PlayerNum p) noexcept -> core::PlayerNum;
    auto ToFbOutcome(MatchOutcome o) noexcept -> gen::net::MatchOutcome;

    // Per-side outcome for the given player.
    auto OutcomeFor(core::Outcome o, core::PlayerNum p) noexcept -> MatchOutcome;

    // ----- Inbound (client -> server) -----

    // Redraw and rematch answers are bare JSON booleans.
    auto DecodeChoice(std::string_view text) -> std::expected<bool, ParseError>;
    auto DecodeRawInput(std::string_view text) -> std::expected<core::RawInput, ParseError>;

    // ----- Outbound (server -> client) -----

    auto EncodeRedraw(core::Player const& player) -> std::string;
    auto EncodeGameState(core::Board const& board, core::Player const& player) -> std::string;
    auto EncodeGameEnd(MatchOutcome outcome) -> std::string;

    // ----- Client side -----

    auto EncodeChoice(bool choice) -> std::string;
    auto EncodeRawInput(core::RawInput const& in) -> std::string;
    auto DecodeResponse(std::string_view text) -> std::expected<ResponseView, ParseError>;
}

#endif //TABLETURF_CODEC_HPP
