#ifndef TABLETURF_EXCEPTION_HPP
#define TABLETURF_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <source_location>
#include <stacktrace>
#include <stdexcept>
#include <string>
#include <utility>
#include "Types.hpp"

namespace tableturf::core::error
{
    enum class Code : unsigned
    {
        Construction, // malformed board or hand handed to a constructor
        Protocol, // match routing misuse
        Network, // transport failure
        Serialization, // FlatBuffers schema/build errors
        Assertion // internal assertion failed
    };

    struct ConstructionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ProtocolError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct NetworkError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    // `site` is the caller's location; the trace starts at the caller too.
    [[noreturn]]
    inline auto fail(Code c, std::string msg, std::source_location const& site = std::source_location::current())
        -> void
    {
        auto trace = std::stacktrace::current(1);
        switch (c)
        {
        case Code::Construction: throw ConstructionError(std::move(msg), c, site, std::move(trace));
        case Code::Protocol: throw ProtocolError(std::move(msg), c, site, std::move(trace));
        case Code::Network: throw NetworkError(std::move(msg), c, site, std::move(trace));
        case Code::Serialization: throw SerializationError(std::move(msg), c, site, std::move(trace));
        case Code::Assertion: throw AssertionError(std::move(msg), c, site, std::move(trace));
        }
        throw std::runtime_error(msg);
    }

#define TT_THROW(code_enum, msg) \
    ::tableturf::core::error::fail((code_enum), (msg), std::source_location::current())
#define TT_ASSERT(cond, msg) do { if(!(cond)) ::tableturf::core::error::fail(::tableturf::core::error::Code::Assertion, (msg), std::source_location::current()); } while(0)

    enum class Coordinate : uint8_t
    {
        X,
        Y
    };

    enum class PositionErrorCode : uint8_t
    {
        OutOfBounds, // coordinate outside [0, dimension)
        Overflow, // anchor + offset overflowed
        Narrowing // result does not fit the board coordinate type
    };

    struct PositionError
    {
        PositionErrorCode code{};
        Coordinate coordinate{};
        int64_t value{}; // offending coordinate, or the anchor on overflow
        int64_t offset{};
        size_t limit{}; // board dimension for OutOfBounds
    };

    inline auto describe(PositionError const& e) -> std::string
    {
        char const axis = e.coordinate == Coordinate::X ? 'x' : 'y';
        switch (e.code)
        {
        case PositionErrorCode::OutOfBounds:
            return std::format("{} coordinate {} exceeds board {} {}", axis, e.value,
                               e.coordinate == Coordinate::X ? "width" : "height", e.limit);
        case PositionErrorCode::Overflow:
            return std::format("final {} coordinate with base {} and offset {} overflowed", axis, e.value, e.offset);
        case PositionErrorCode::Narrowing:
            return std::format("final {} coordinate {} does not fit a board coordinate", axis, e.value);
        }
        return "unknown position error";
    }

    // Player-facing reasons a raw input is refused.
    enum class RuleViolationCode : std::uint16_t
    {
        InsufficientSpecial,

        Position_OutOfBounds,
        Position_Overflow,
        Position_Narrowing,

        // special placement
        SpecialCollision,
        SpecialNotAdjacentToSpecial,

        // normal placement
        InkCollision,
        InkNotAdjacentToInk
    };

    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<PlayerNum> actor{};
        std::optional<HandIndex> hand{};

        std::optional<uint32_t> special{};
        std::optional<uint32_t> required{};

        std::optional<PositionError> position{};

        auto with_actor(PlayerNum p) -> RuleViolation&
        {
            actor = p;
            return *this;
        }

        auto with_hand(HandIndex h) -> RuleViolation&
        {
            hand = h;
            return *this;
        }

        auto with_special(uint32_t have, uint32_t need) -> RuleViolation&
        {
            special = have;
            required = need;
            return *this;
        }

        auto with_position(PositionError const& e) -> RuleViolation&
        {
            position = e;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode const c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::InsufficientSpecial: return "Insufficient special";
        case E::Position_OutOfBounds: return "Position: out of bounds";
        case E::Position_Overflow: return "Position: overflow";
        case E::Position_Narrowing: return "Position: narrowing";
        case E::SpecialCollision: return "Special placement is overlapping walls or special spaces";
        case E::SpecialNotAdjacentToSpecial: return "Special placement not adjacent to a special square";
        case E::InkCollision: return "Ink placement not over empty tiles";
        case E::InkNotAdjacentToInk: return "Ink placement not adjacent to player's ink";
        }
        return "Unknown";
    }

    inline auto to_violation(PositionError const& e) -> RuleViolation
    {
        RuleViolationCode code = RuleViolationCode::Position_OutOfBounds;
        if (e.code == PositionErrorCode::Overflow) code = RuleViolationCode::Position_Overflow;
        if (e.code == PositionErrorCode::Narrowing) code = RuleViolationCode::Position_Narrowing;
        return RuleViolation{.code = code}.with_position(e);
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        auto s = std::format("{}", to_string(v.code));
        if (v.actor) s += std::format(" | actor=P{}", Idx(*v.actor) + 1);
        if (v.hand) s += std::format(" | hand=H{}", std::to_underlying(*v.hand) + 1);
        if (v.special) s += std::format(" | special={}", *v.special);
        if (v.required) s += std::format(" | required={}", *v.required);
        if (v.position) s += std::format(" | {}", describe(*v.position));
        return s;
    }
}

#endif //TABLETURF_EXCEPTION_HPP
