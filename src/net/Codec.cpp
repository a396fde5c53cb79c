//
// Codec.cpp
//
#include "Codec.hpp"

#include <algorithm>
#include <format>
#include <memory>
#include <utility>
#include <vector>

#include <flatbuffers/flatbuffers.h>
#include <flatbuffers/idl.h>

#include "core/Exception.hpp"
#include "net/SchemaText.hpp"

namespace tableturf::net
{
    auto ToFbHand(core::HandIndex h) noexcept -> gen::net::HandIndex
    {
        switch (h)
        {
        case core::HandIndex::H1: return gen::net::HandIndex::H1;
        case core::HandIndex::H2: return gen::net::HandIndex::H2;
        case core::HandIndex::H3: return gen::net::HandIndex::H3;
        case core::HandIndex::H4: return gen::net::HandIndex::H4;
        }
        return gen::net::HandIndex::H1;
    }

    auto FromFbHand(gen::net::HandIndex h) noexcept -> core::HandIndex
    {
        switch (h)
        {
        case gen::net::HandIndex::H1: return core::HandIndex::H1;
        case gen::net::HandIndex::H2: return core::HandIndex::H2;
        case gen::net::HandIndex::H3: return core::HandIndex::H3;
        case gen::net::HandIndex::H4: return core::HandIndex::H4;
        }
        return core::HandIndex::H1;
    }

    auto ToFbRotation(core::Rotation r) noexcept -> gen::net::Rotation
    {
        switch (r)
        {
        case core::Rotation::Zero: return gen::net::Rotation::Zero;
        case core::Rotation::One: return gen::net::Rotation::One;
        case core::Rotation::Two: return gen::net::Rotation::Two;
        case core::Rotation::Three: return gen::net::Rotation::Three;
        }
        return gen::net::Rotation::Zero;
    }

    auto FromFbRotation(gen::net::Rotation r) noexcept -> core::Rotation
    {
        switch (r)
        {
        case gen::net::Rotation::Zero: return core::Rotation::Zero;
        case gen::net::Rotation::One: return core::Rotation::One;
        case gen::net::Rotation::Two: return core::Rotation::Two;
        case gen::net::Rotation::Three: return core::Rotation::Three;
        }
        return core::Rotation::Zero;
    }

    auto ToFbPlayerNum(core::PlayerNum p) noexcept -> gen::net::PlayerNum
    {
        return p == core::PlayerNum::P1 ? gen::net::PlayerNum::P1 : gen::net::PlayerNum::P2;
    }

    auto FromFbPlayerNum(gen::net::PlayerNum p) noexcept -> core::PlayerNum
    {
        return p == gen::net::PlayerNum::P2 ? core::PlayerNum::P2 : core::PlayerNum::P1;
    }

    auto ToFbOutcome(MatchOutcome o) noexcept -> gen::net::MatchOutcome
    {
        switch (o)
        {
        case MatchOutcome::Win: return gen::net::MatchOutcome::Win;
        case MatchOutcome::Lose: return gen::net::MatchOutcome::Lose;
        case MatchOutcome::Draw: return gen::net::MatchOutcome::Draw;
        }
        return gen::net::MatchOutcome::Draw;
    }

    auto OutcomeFor(core::Outcome o, core::PlayerNum p) noexcept -> MatchOutcome
    {
        switch (o)
        {
        case core::Outcome::P1Win: return p == core::PlayerNum::P1 ? MatchOutcome::Win : MatchOutcome::Lose;
        case core::Outcome::P2Win: return p == core::PlayerNum::P2 ? MatchOutcome::Win : MatchOutcome::Lose;
        case core::Outcome::Draw: return MatchOutcome::Draw;
        }
        return MatchOutcome::Draw;
    }
}

namespace
{
    using namespace tableturf;

    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert(std::to_underlying(core::HandIndex::H4) == std::to_underlying(gen::net::HandIndex::H4));
    static_assert(std::to_underlying(core::Rotation::Three) == std::to_underlying(gen::net::Rotation::Three));
    static_assert(std::to_underlying(core::PlayerNum::P2) == std::to_underlying(gen::net::PlayerNum::P2));

    constexpr char const* EnvelopeRoot = "tableturf.gen.net.Envelope";
    constexpr char const* RawInputRoot = "tableturf.gen.net.RawInput";

    // The schema text is parsed once into its reflection form. Each codec call then loads
    // that binary into a parser of its own, as a parser holds the buffer it last built.
    auto SchemaBinary() -> std::vector<uint8_t> const&
    {
        static std::vector<uint8_t> const bfbs = []
        {
            flatbuffers::Parser schema;
            if (!schema.Parse(net::SchemaText))
            {
                TT_THROW(core::error::Code::Serialization, std::format("wire schema rejected: {}", schema.error_));
            }
            schema.Serialize();
            uint8_t const* data = schema.builder_.GetBufferPointer();
            return std::vector<uint8_t>(data, data + schema.builder_.GetSize());
        }();
        return bfbs;
    }

    // `root` is fully qualified, e.g. "tableturf.gen.net.Envelope".
    auto MakeParser(char const* root) -> std::unique_ptr<flatbuffers::Parser>
    {
        flatbuffers::IDLOptions opts;
        opts.strict_json = true;
        opts.output_default_scalars_in_json = true;
        opts.indent_step = -1;

        std::vector<uint8_t> const& bfbs = SchemaBinary();
        auto parser = std::make_unique<flatbuffers::Parser>(opts);
        if (!parser->Deserialize(bfbs.data(), bfbs.size()))
        {
            TT_THROW(core::error::Code::Serialization, "wire schema could not be loaded");
        }
        if (!parser->SetRootType(root))
        {
            TT_THROW(core::error::Code::Serialization, std::format("wire schema has no table {}", root));
        }
        return parser;
    }

    auto ToText(flatbuffers::FlatBufferBuilder const& fbb, char const* root) -> std::string
    {
        auto const parser = MakeParser(root);
        std::string json;
        if (char const* err = flatbuffers::GenText(*parser, fbb.GetBufferPointer(), &json))
        {
            TT_THROW(core::error::Code::Serialization, std::format("could not print {}: {}", root, err));
        }
        while (!json.empty() && (json.back() == '\n' || json.back() == ' ')) json.pop_back();
        return json;
    }

    // Parse text into parser->builder_, verified as a `Root` buffer.
    template <typename Root>
    auto ParseText(flatbuffers::Parser& parser, std::string_view text)
        -> std::expected<Root const*, net::ParseError>
    {
        std::string const src{text};
        if (!parser.Parse(src.c_str()))
        {
            return std::unexpected(net::ParseError{parser.error_});
        }
        flatbuffers::Verifier verifier(parser.builder_.GetBufferPointer(), parser.builder_.GetSize());
        if (!verifier.VerifyBuffer<Root>(nullptr))
        {
            return std::unexpected(net::ParseError{"buffer failed verification"});
        }
        return flatbuffers::GetRoot<Root>(parser.builder_.GetBufferPointer());
    }

    auto ToFbCell(core::CardSpace const& c) noexcept -> uint8_t
    {
        if (!c) return std::to_underlying(gen::net::CardCell::Blank);
        return std::to_underlying(*c == core::InkType::Special ? gen::net::CardCell::Special
                                                               : gen::net::CardCell::Normal);
    }

    auto ToFbSpace(core::BoardSpace const& s) -> gen::net::Space
    {
        using gen::net::SpaceKind;
        if (auto const* ink = std::get_if<core::InkSpace>(&s))
            return gen::net::Space(SpaceKind::Ink, net::ToFbPlayerNum(ink->owner), false);
        if (auto const* sp = std::get_if<core::SpecialSpace>(&s))
            return gen::net::Space(SpaceKind::Special, net::ToFbPlayerNum(sp->owner), sp->activated);
        if (std::holds_alternative<core::WallSpace>(s))
            return gen::net::Space(SpaceKind::Wall, gen::net::PlayerNum::P1, false);
        if (std::holds_alternative<core::OutOfBoundsSpace>(s))
            return gen::net::Space(SpaceKind::OutOfBounds, gen::net::PlayerNum::P1, false);
        return gen::net::Space(SpaceKind::Empty, gen::net::PlayerNum::P1, false);
    }

    auto BuildBoard(flatbuffers::FlatBufferBuilder& fbb, core::Board const& board)
        -> flatbuffers::Offset<gen::net::Board>
    {
        std::vector<gen::net::Space> spaces;
        spaces.reserve(board.Spaces().size());
        for (core::BoardSpace const& s : board.Spaces()) spaces.push_back(ToFbSpace(s));
        auto const vec = fbb.CreateVectorOfStructs(spaces);
        return gen::net::CreateBoard(fbb, static_cast<uint32_t>(board.Width()),
                                     static_cast<uint32_t>(board.Height()), vec);
    }

    auto BuildPlayer(flatbuffers::FlatBufferBuilder& fbb, core::Player const& p)
        -> flatbuffers::Offset<gen::net::Player>
    {
        std::vector<uint8_t> hand;
        for (core::DeckIndex const d : p.CurrentHand().Cards()) hand.push_back(std::to_underlying(d));
        auto const hand_vec = fbb.CreateVector(hand);

        core::Deck const& deck = p.OwnDeck();
        std::vector<flatbuffers::Offset<gen::net::DeckSlot>> slots;
        slots.reserve(core::constants::DeckSize);
        for (size_t i = 0; i < core::constants::DeckSize; ++i)
        {
            auto const d = static_cast<core::DeckIndex>(i);
            core::Card const& c = deck.At(d);

            std::vector<uint8_t> cells;
            cells.reserve(core::constants::CardWidth * core::constants::CardWidth);
            for (auto const& row : c.Cells())
                for (core::CardSpace const& cell : row) cells.push_back(ToFbCell(cell));

            auto const name = fbb.CreateString(c.Name());
            auto const cells_vec = fbb.CreateVector(cells);
            auto const card = gen::net::CreateCard(fbb, name, c.Priority(), c.Special(), cells_vec);
            slots.push_back(gen::net::CreateDeckSlot(fbb, card, deck.IsAvailable(d)));
        }
        auto const deck_vec = fbb.CreateVector(slots);

        return gen::net::CreatePlayer(fbb, net::ToFbPlayerNum(p.Num()), p.Special(), hand_vec, deck_vec);
    }

    auto ReadPlayer(gen::net::Player const* fb) -> std::expected<net::PlayerView, net::ParseError>
    {
        using net::ParseError;
        if (!fb) return std::unexpected(ParseError{"missing player"});

        net::PlayerView view{};
        view.player_num = net::FromFbPlayerNum(fb->player_num());
        view.special = fb->special();

        auto const* hand = fb->hand();
        if (!hand || hand->size() != core::constants::HandSize)
            return std::unexpected(ParseError{"hand must hold four cards"});
        for (flatbuffers::uoffset_t i = 0; i < hand->size(); ++i)
        {
            std::optional<core::DeckIndex> const d = core::ToDeckIndex(hand->Get(i));
            if (!d) return std::unexpected(ParseError{std::format("deck index {} out of range", hand->Get(i))});
            view.hand[i] = *d;
        }

        auto const* deck = fb->deck();
        if (!deck || deck->size() != core::constants::DeckSize)
            return std::unexpected(ParseError{"deck must hold fifteen cards"});
        for (auto const* slot : *deck)
        {
            auto const* card = slot ? slot->card() : nullptr;
            if (!card || !card->cells() || card->cells()->size() != core::constants::CardWidth * core::constants::CardWidth)
                return std::unexpected(ParseError{"malformed deck slot"});

            net::CardView cv{};
            cv.name = card->name() ? card->name()->str() : std::string{};
            cv.priority = card->priority();
            cv.special = card->special();
            cv.available = slot->available();
            for (size_t y = 0; y < core::constants::CardWidth; ++y)
            {
                for (size_t x = 0; x < core::constants::CardWidth; ++x)
                {
                    auto const cell = static_cast<gen::net::CardCell>(
                        card->cells()->Get(static_cast<flatbuffers::uoffset_t>(y * core::constants::CardWidth + x)));
                    if (cell == gen::net::CardCell::Normal) cv.cells[y][x] = core::InkType::Normal;
                    else if (cell == gen::net::CardCell::Special) cv.cells[y][x] = core::InkType::Special;
                }
            }
            view.deck.push_back(std::move(cv));
        }
        return view;
    }

    auto ReadBoard(gen::net::Board const* fb) -> std::expected<core::Board, net::ParseError>
    {
        using net::ParseError;
        if (!fb || !fb->spaces()) return std::unexpected(ParseError{"missing board"});

        size_t const w = fb->width();
        size_t const h = fb->height();
        if (w == 0 || h == 0 || w > core::constants::MaxBoardWidth || h > core::constants::MaxBoardHeight
            || fb->spaces()->size() != w * h)
        {
            return std::unexpected(ParseError{std::format("board of {}x{} does not match {} spaces",
                                                          w, h, fb->spaces()->size())});
        }

        core::Board::Rows rows(h, std::vector<core::BoardSpace>(w, core::EmptySpace{}));
        for (size_t i = 0; i < w * h; ++i)
        {
            gen::net::Space const* s = fb->spaces()->Get(static_cast<flatbuffers::uoffset_t>(i));
            core::PlayerNum const owner = net::FromFbPlayerNum(s->owner());
            core::BoardSpace& out = rows[i / w][i % w];
            switch (s->kind())
            {
            case gen::net::SpaceKind::Empty: out = core::EmptySpace{}; break;
            case gen::net::SpaceKind::Ink: out = core::InkSpace{.owner = owner}; break;
            case gen::net::SpaceKind::Special: out = core::SpecialSpace{.owner = owner, .activated = s->activated()}; break;
            case gen::net::SpaceKind::Wall: out = core::WallSpace{}; break;
            default: return std::unexpected(ParseError{"board holds an out-of-bounds space"});
            }
        }
        return core::Board{rows};
    }
}

namespace tableturf::net
{
    // ---------- Inbound ----------

    auto DecodeChoice(std::string_view text) -> std::expected<bool, ParseError>
    {
        auto const is_space = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
        while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
        while (!text.empty() && is_space(text.back())) text.remove_suffix(1);

        if (text == "true") return true;
        if (text == "false") return false;
        return std::unexpected(ParseError{std::format("expected a boolean, got '{}'", text)});
    }

    auto DecodeRawInput(std::string_view text) -> std::expected<core::RawInput, ParseError>
    {
        auto const parser = MakeParser(RawInputRoot);
        auto const parsed = ParseText<gen::net::RawInput>(*parser, text);
        if (!parsed) return std::unexpected(parsed.error());
        gen::net::RawInput const* in = *parsed;

        auto const hand = in->hand_idx();
        if (!hand.has_value()) return std::unexpected(ParseError{"missing hand_idx"});
        if (std::to_underlying(*hand) > std::to_underlying(gen::net::HandIndex::MAX))
            return std::unexpected(ParseError{"hand_idx out of range"});

        core::RawInput out{};
        out.hand_idx = FromFbHand(*hand);

        switch (in->action_type())
        {
        case gen::net::Action::Pass:
            if (!in->action_as_Pass()) return std::unexpected(ParseError{"missing pass body"});
            out.action = core::PassAction{};
            return out;
        case gen::net::Action::Place:
        {
            auto const* p = in->action_as_Place();
            if (!p) return std::unexpected(ParseError{"missing place body"});
            auto const x = p->x();
            auto const y = p->y();
            auto const special = p->special();
            auto const rotation = p->rotation();
            if (!x.has_value() || !y.has_value()) return std::unexpected(ParseError{"place is missing x or y"});
            if (!special.has_value()) return std::unexpected(ParseError{"place is missing special"});
            if (!rotation.has_value()) return std::unexpected(ParseError{"place is missing rotation"});
            if (std::to_underlying(*rotation) > std::to_underlying(gen::net::Rotation::MAX))
                return std::unexpected(ParseError{"rotation out of range"});
            out.action = core::PlaceAction{
                .x = *x,
                .y = *y,
                .special_activated = *special,
                .rotation = FromFbRotation(*rotation)
            };
            return out;
        }
        default:
            return std::unexpected(ParseError{"missing or unknown action"});
        }
    }

    // ---------- Outbound ----------

    auto EncodeRedraw(core::Player const& player) -> std::string
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const p = BuildPlayer(fbb, player);
        auto const msg = gen::net::CreateRedrawMsg(fbb, p);
        auto const env = gen::net::CreateEnvelope(fbb, gen::net::Response::RedrawMsg, msg.Union());
        fbb.Finish(env);
        return ToText(fbb, EnvelopeRoot);
    }

    auto EncodeGameState(core::Board const& board, core::Player const& player) -> std::string
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const b = BuildBoard(fbb, board);
        auto const p = BuildPlayer(fbb, player);
        auto const msg = gen::net::CreateGameStateMsg(fbb, b, p);
        auto const env = gen::net::CreateEnvelope(fbb, gen::net::Response::GameStateMsg, msg.Union());
        fbb.Finish(env);
        return ToText(fbb, EnvelopeRoot);
    }

    auto EncodeGameEnd(MatchOutcome outcome) -> std::string
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const msg = gen::net::CreateGameEndMsg(fbb, ToFbOutcome(outcome));
        auto const env = gen::net::CreateEnvelope(fbb, gen::net::Response::GameEndMsg, msg.Union());
        fbb.Finish(env);
        return ToText(fbb, EnvelopeRoot);
    }

    // ---------- Client side ----------

    auto EncodeChoice(bool choice) -> std::string
    {
        return choice ? "true" : "false";
    }

    auto EncodeRawInput(core::RawInput const& in) -> std::string
    {
        flatbuffers::FlatBufferBuilder fbb;
        flatbuffers::Offset<gen::net::RawInput> root;
        if (auto const* place = std::get_if<core::PlaceAction>(&in.action))
        {
            auto const p = gen::net::CreatePlace(fbb, place->x, place->y, place->special_activated,
                                                 ToFbRotation(place->rotation));
            root = gen::net::CreateRawInput(fbb, ToFbHand(in.hand_idx), gen::net::Action::Place, p.Union());
        }
        else
        {
            auto const p = gen::net::CreatePass(fbb);
            root = gen::net::CreateRawInput(fbb, ToFbHand(in.hand_idx), gen::net::Action::Pass, p.Union());
        }
        fbb.Finish(root);
        return ToText(fbb, RawInputRoot);
    }

    auto DecodeResponse(std::string_view text) -> std::expected<ResponseView, ParseError>
    {
        auto const parser = MakeParser(EnvelopeRoot);
        auto const parsed = ParseText<gen::net::Envelope>(*parser, text);
        if (!parsed) return std::unexpected(parsed.error());
        gen::net::Envelope const* env = *parsed;

        switch (env->response_type())
        {
        case gen::net::Response::RedrawMsg:
        {
            auto const* msg = env->response_as_RedrawMsg();
            if (!msg) return std::unexpected(ParseError{"missing redraw body"});
            auto player = ReadPlayer(msg->player());
            if (!player) return std::unexpected(player.error());
            return RedrawView{std::move(*player)};
        }
        case gen::net::Response::GameStateMsg:
        {
            auto const* msg = env->response_as_GameStateMsg();
            if (!msg) return std::unexpected(ParseError{"missing game state body"});
            auto board = ReadBoard(msg->board());
            if (!board) return std::unexpected(board.error());
            auto player = ReadPlayer(msg->player());
            if (!player) return std::unexpected(player.error());
            return GameStateView{std::move(*board), std::move(*player)};
        }
        case gen::net::Response::GameEndMsg:
        {
            auto const* msg = env->response_as_GameEndMsg();
            if (!msg) return std::unexpected(ParseError{"missing game end body"});
            switch (msg->outcome())
            {
            case gen::net::MatchOutcome::Win: return GameEndView{MatchOutcome::Win};
            case gen::net::MatchOutcome::Lose: return GameEndView{MatchOutcome::Lose};
            case gen::net::MatchOutcome::Draw: return GameEndView{MatchOutcome::Draw};
            }
            return std::unexpected(ParseError{"outcome out of range"});
        }
        default:
            return std::unexpected(ParseError{"missing or unknown response"});
        }
    }
}
