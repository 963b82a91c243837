//
// Actions.hpp
//

#ifndef UNOARBITER_ACTIONS_HPP
#define UNOARBITER_ACTIONS_HPP

#include "Types.hpp"

namespace uno::core
{
    enum class MoveKind : uint8_t
    {
        Play,
        Draw
    };

    struct Move
    {
        MoveKind kind{MoveKind::Draw};
        std::optional<std::string> card_id;
        std::optional<Color> color;
        std::string reasoning;
    };

    inline auto operator==(Move const& a, Move const& b) -> bool
    {
        return a.kind == b.kind && a.card_id == b.card_id && a.color == b.color && a.reasoning == b.reasoning;
    }

    inline auto to_string(MoveKind const k) -> std::string_view
    {
        return k == MoveKind::Play ? "play" : "draw";
    }

    // Feedback carried from a rejected attempt into the next proposer call.
    struct RetryContext
    {
        std::optional<std::string> last_validation_error;
        std::optional<Move> last_invalid_move;
    };

    enum class DecisionOutcome : uint8_t
    {
        Accepted,
        Fallback
    };
} // namespace uno::core

#endif //UNOARBITER_ACTIONS_HPP
