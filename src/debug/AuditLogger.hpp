#ifndef TABLETURF_AUDITLOGGER_HPP
#define TABLETURF_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/GameState.hpp"
#include "../core/Actions.hpp"
#include "../core/Types.hpp"

namespace tableturf::core::debug
{
    // Plain-text transcript of one game, for replaying self-play failures by eye.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        // Session header (seed, turns, board size, starting hands)
        auto start(GameState const& game, std::uint64_t seed) -> void;

        // Both inputs of one turn, before Update
        auto turn(std::uint32_t turn_no, RawInput const& in1, RawInput const& in2) -> void;

        // ASCII board plus meters
        auto board(GameState const& game) -> void;

        // Game end footer (ink counts and outcome)
        auto end(GameState const& game) -> void;

        // Manual flush
        auto flush() -> void;

    private:
        std::ofstream out_;
    };
}

#endif //TABLETURF_AUDITLOGGER_HPP
