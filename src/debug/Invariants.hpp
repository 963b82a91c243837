//
// Invariants.hpp
//

#ifndef UNOARBITER_INVARIANTS_HPP
#define UNOARBITER_INVARIANTS_HPP

#include "../core/Exception.hpp"
#include "../core/Game.hpp"
#include "../core/Util.hpp"
#include <string>

namespace uno::core::debug
{
    // A second layer of checks over the authoritative state. Throws AssertionError on a breach.
    inline auto CheckInvariants(GameState const& g) -> void
    {
#if UNO_ENABLE_TEST_HOOKS == false
        (void)g;
#else
        // 1) Direction is a unit step
        UNO_ASSERT(g.Direction() == 1 || g.Direction() == -1, "Direction is not +-1");

        // 2) A pending draw only sits on a draw card
        if (g.PendingDraw() > 0)
        {
            Card const* top = g.Top();
            UNO_ASSERT(top != nullptr && IsDrawAction(top->action), "Pending draw without a draw card on top");
        }

        // 3) Hand ids stay unique
        {
            util::CardUniqueChecker checker{};
            for (Card const& c : g.Hand()) checker.Add(c);
            UNO_ASSERT(!checker.ContainsDup(), "Duplicate card id in hand");
        }

        // 4) A retry context always explains itself
        if (g.Retry().has_value())
        {
            UNO_ASSERT(g.Retry()->last_validation_error.has_value(), "Retry context without an error");
        }
#endif // UNO_ENABLE_TEST_HOOKS == true
    }

    // Card conservation across one accepted transition.
    inline auto CheckTransition(GameState const& before, GameState const& after, Move const& m) -> void
    {
#if UNO_ENABLE_TEST_HOOKS == false
        (void)before; (void)after; (void)m;
#else
        CheckInvariants(after);
        UNO_ASSERT(!after.Retry().has_value(), "Retry context survived an accepted transition");

        if (m.kind == MoveKind::Draw)
        {
            UNO_ASSERT(after.HandSize() == before.HandSize(), "Draw changed the hand");
            UNO_ASSERT(after.DiscardSize() == before.DiscardSize(), "Draw changed the discard pile");
            UNO_ASSERT(after.LastPlayerDrew() && after.PendingDraw() == 0, "Draw did not settle the obligation");
            return;
        }

        UNO_ASSERT(after.HandSize() + 1 == before.HandSize(), "Play did not remove exactly one card");
        UNO_ASSERT(after.DiscardSize() == before.DiscardSize() + 1, "Play did not add exactly one discard");
        UNO_ASSERT(m.card_id.has_value() && after.Top() && util::SameId(after.Top()->id, *m.card_id),
                   "Played card is not on top");
        UNO_ASSERT(after.FindFromHand(*m.card_id).expired(), "Played card still in hand");
        UNO_ASSERT(!after.LastPlayerDrew(), "Play left last_player_drew set");
        UNO_ASSERT(!NeedsColorChoice(after.Top()->action) || IsPlayableColor(after.Top()->color),
                   "Wild played without binding a color");
#endif // UNO_ENABLE_TEST_HOOKS == true
    }
}
#endif //UNOARBITER_INVARIANTS_HPP
