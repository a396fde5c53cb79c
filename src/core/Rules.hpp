#ifndef TABLETURF_RULES_HPP
#define TABLETURF_RULES_HPP

#include <expected>
#include "Actions.hpp"
#include "Board.hpp"
#include "Player.hpp"
#include "Types.hpp"
#include "Exception.hpp"

namespace tableturf::core
{
    //forward declaration
    class GameState;

    class Rules
    {
    public:
        using CheckResult = std::expected<ValidInput, error::RuleViolation>;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants. Never mutates.
        virtual auto Validate(Board const& board, Player const& player, RawInput const& raw) const -> CheckResult = 0;

        // Resolve one turn from both players' validated inputs.
        virtual auto Apply(GameState& game, ValidInput const& in1, ValidInput const& in2) -> void = 0;

        virtual auto Winner(Board const& board) const -> Outcome = 0;
    };
}

#endif //TABLETURF_RULES_HPP
