//
// State.hpp
//

#ifndef UNOARBITER_STATE_HPP
#define UNOARBITER_STATE_HPP

#include "Types.hpp"
#include "Actions.hpp"

namespace uno::core
{
    // Immutable snapshot handed to proposers (owning copies, never aliases the live state)
    struct GameSnapshot
    {
        std::vector<Card> my_hand;
        // index 0 = top
        std::vector<Card> discard;
        int8_t direction{1};
        uint32_t pending_draw{};
        bool last_player_drew{false};
        std::vector<OpponentInfo> others;
        std::optional<RetryContext> retry;

        [[nodiscard]]
        auto Top() const noexcept -> Card const*
        {
            return discard.empty() ? nullptr : &discard.front();
        }
    };

} // namespace uno::core

#endif //UNOARBITER_STATE_HPP
