//
// ClassicRules.hpp
//

#ifndef UNOARBITER_CLASSICRULES_HPP
#define UNOARBITER_CLASSICRULES_HPP
#include "Rules.hpp"

namespace uno::core
{
    class ClassicRules final : public Rules
    {
    public:
        auto Validate(GameState const& game, Move const& m) const -> CheckResult override;
        auto Apply(GameState& game, Move const& m) -> void override;

        // Pure legality predicate. A null top card accepts anything.
        static auto CanPlay(Card const* top, Card const& candidate, bool last_player_drew) -> bool;
        static auto PendingDrawActive(Card const* top, bool last_player_drew) -> bool;
        // Why CanPlay said no: the unmet draw obligation first, then the color/number mismatch.
        static auto ExplainRejection(Card const* top, Card const& candidate,
                                     bool last_player_drew, uint32_t pending_draw) -> error::RuleViolation;
    };
}

#endif //UNOARBITER_CLASSICRULES_HPP
