//
// Game.hpp
//

#ifndef UNOARBITER_GAME_HPP
#define UNOARBITER_GAME_HPP

#include <deque>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>
#include "Types.hpp"
#include "Actions.hpp"
#include "State.hpp"

namespace uno::core
{
    // Authoritative state of one decision request, from the acting player's point of view.
    // Supplied by the caller, mutated only through Rules::Apply.
    class GameState
    {
    public:
        GameState() = delete;
        // Throws StateError for a direction other than +-1, duplicate hand ids,
        // or a pending draw without a draw card on top.
        GameState(std::vector<Card> hand,
                  std::vector<Card> discard,
                  int8_t direction = 1,
                  uint32_t pending_draw = 0,
                  bool last_player_drew = false,
                  std::vector<OpponentInfo> others = {});

        // Deep copy: the copy owns its own cards.
        GameState(GameState const& other);
        auto operator=(GameState const& other) -> GameState&;
        GameState(GameState&&) noexcept = default;
        auto operator=(GameState&&) noexcept -> GameState& = default;

        auto SnapshotFor() const -> std::shared_ptr<GameSnapshot const>;

        auto Direction()      const noexcept -> int8_t   { return direction_; }
        auto PendingDraw()    const noexcept -> uint32_t { return pending_draw_; }
        auto LastPlayerDrew() const noexcept -> bool     { return last_player_drew_; }
        auto HandSize()       const noexcept -> size_t   { return hand_.size(); }
        auto DiscardSize()    const noexcept -> size_t   { return discard_.size(); }
        auto Others()         const noexcept -> std::vector<OpponentInfo> const& { return others_; }
        auto Retry()          const noexcept -> std::optional<RetryContext> const& { return retry_; }

        // nullptr on an empty discard pile
        auto Top() const noexcept -> Card const*;
        auto Hand() const -> std::vector<Card>;
        auto Discard() const -> std::vector<Card>;

        //returns empty if doesnt exist; ids are compared trimmed
        auto FindFromHand(std::string_view id) const -> CardWP;

        auto SetRetry(RetryContext ctx) -> void { retry_ = std::move(ctx); }
        auto ClearRetry() noexcept -> void { retry_.reset(); }

        //allows class to directly access private data on an instance
        friend class ClassicRules;

    private:
        // Moves the card out of the hand onto the top of the discard pile. Throws if absent.
        auto MoveHandToDiscard(std::string_view id) -> CardSP;
        auto Validate() const -> void;

    private:
        std::vector<CardSP> hand_;
        std::deque<CardSP> discard_; // front = top
        int8_t direction_{1};
        uint32_t pending_draw_{};
        bool last_player_drew_{false};
        std::vector<OpponentInfo> others_;
        std::optional<RetryContext> retry_;
    };
}
#endif //UNOARBITER_GAME_HPP
