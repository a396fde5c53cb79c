#ifndef TABLETURF_ACTIONS_HPP
#define TABLETURF_ACTIONS_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <variant>
#include <vector>
#include "Types.hpp"
#include "Board.hpp"

namespace tableturf::core
{
    // Untrusted input as it arrives from a client.
    struct PassAction
    {
        auto operator==(PassAction const&) const -> bool = default;
    };

    struct PlaceAction
    {
        // top-left corner of the card grid on the board
        int64_t x{};
        int64_t y{};
        bool special_activated{false};
        Rotation rotation{Rotation::Zero};

        auto operator==(PlaceAction const&) const -> bool = default;
    };

    using Action = std::variant<PassAction, PlaceAction>;

    struct RawInput
    {
        HandIndex hand_idx{HandIndex::H1};
        Action action{PassAction{}};

        auto operator==(RawInput const&) const -> bool = default;
    };

    class ClassicRules;

    using InkPlacement = std::pair<BoardPosition, InkType>;

    // Board-relative ink of a card that passed validation.
    class Placement
    {
    public:
        auto InkSpaces() const noexcept -> std::span<InkPlacement const> { return ink_spaces_; }
        auto SpecialActivated() const noexcept -> bool { return special_activated_; }
        auto ToBoardSpaces(PlayerNum owner) const -> std::vector<BoardWrite>;

        auto operator==(Placement const&) const -> bool = default;

        friend class ClassicRules;
    private:
        Placement(std::vector<InkPlacement> ink_spaces, bool special_activated) :
            ink_spaces_{std::move(ink_spaces)}, special_activated_{special_activated} {}

        std::vector<InkPlacement> ink_spaces_;
        bool special_activated_;
    };

    class ValidInput
    {
    public:
        auto HandIdx() const noexcept -> HandIndex { return hand_idx_; }
        auto IsPass() const noexcept -> bool { return !placement_.has_value(); }
        // nullptr for a pass
        auto GetPlacement() const noexcept -> Placement const* { return placement_ ? &*placement_ : nullptr; }

        auto operator==(ValidInput const&) const -> bool = default;

        friend class ClassicRules;
    private:
        ValidInput(HandIndex hand_idx, std::optional<Placement> placement) :
            hand_idx_{hand_idx}, placement_{std::move(placement)} {}

        HandIndex hand_idx_;
        std::optional<Placement> placement_;
    };

    inline auto Placement::ToBoardSpaces(PlayerNum const owner) const -> std::vector<BoardWrite>
    {
        std::vector<BoardWrite> out;
        out.reserve(ink_spaces_.size());
        for (auto const& [pos, ink] : ink_spaces_)
        {
            if (ink == InkType::Special) out.emplace_back(pos, SpecialSpace{.owner = owner, .activated = false});
            else out.emplace_back(pos, InkSpace{.owner = owner});
        }
        return out;
    }
}

#endif //TABLETURF_ACTIONS_HPP
