//
// Arbiter.hpp
//

#ifndef UNOARBITER_ARBITER_HPP
#define UNOARBITER_ARBITER_HPP

#include <memory>
#include <string>
#include "Judge.hpp"
#include "Proposer.hpp"
#include "Rules.hpp"
#include "Types.hpp"

namespace uno::core
{
    class GameState;

    // Entry point of the engine: owns the rule set and the supervisor for a given config.
    // Holds no game state; every call works on the caller's GameState.
    class Arbiter
    {
    public:
        Arbiter() = delete;
        Arbiter(Config const& config, std::unique_ptr<Rules> rules);

        // One supervised decision. Mutates game with the chosen move.
        auto Decide(GameState& game, MoveProposer& proposer) const -> Decision;

        auto Check(GameState const& game, Move const& m) const -> Rules::CheckResult;
        // Throws InvalidActionError for a move that does not validate.
        auto Apply(GameState& game, Move const& m) const -> void;
        // Human-readable verdict: the rejection reason, or a confirmation for a valid move.
        auto Explain(GameState const& game, Move const& m) const -> std::string;

        auto Cfg() const noexcept -> Config const& { return cfg_; }

    private:
        Config cfg_;
        std::unique_ptr<Rules> rules_;
        Judge judge_;
    };
}
#endif //UNOARBITER_ARBITER_HPP
