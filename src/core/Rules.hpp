//
// Rules.hpp
//

#ifndef UNOARBITER_RULES_HPP
#define UNOARBITER_RULES_HPP

#include "Actions.hpp"
#include "Types.hpp"
#include "Exception.hpp"

namespace uno::core
{
    //forward declaration
    class GameState;

    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(GameState const& game, Move const& m) const -> CheckResult = 0;

        // Mutate authoritative state. Only called with a move that passed Validate.
        virtual auto Apply(GameState& game, Move const& m) -> void = 0;
    };
}

#endif //UNOARBITER_RULES_HPP
