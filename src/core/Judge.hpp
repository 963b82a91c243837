//
// Judge.hpp
//

#ifndef UNOARBITER_JUDGE_HPP
#define UNOARBITER_JUDGE_HPP

#include <string>
#include <variant>
#include <vector>
#include "Actions.hpp"
#include "Exception.hpp"
#include "Proposer.hpp"
#include "Types.hpp"

namespace uno::core
{
    class GameState;
    class Rules;

    // Tagged outcome of one proposer consultation.
    struct Accepted
    {
        Move move;
    };

    struct Rejected
    {
        Move move;
        error::RuleViolation violation;
        std::string reason;
    };

    struct ProposerFailed
    {
        ProposerFailure failure;
    };

    using AttemptVerdict = std::variant<Accepted, Rejected, ProposerFailed>;

    struct Decision
    {
        Move move{};
        DecisionOutcome outcome{DecisionOutcome::Fallback};
        std::vector<AttemptVerdict> attempts;
    };

    // The move returned once the attempt budget is spent. Never validated.
    auto FallbackMove() -> Move;

    auto DescribeVerdict(AttemptVerdict const& v) -> std::string;

    // Bounded retry supervisor: at most retry_budget proposer calls, then the fallback draw.
    class Judge
    {
    public:
        explicit Judge(Config const& cfg) : cfg_(cfg) {}

        // Applies the chosen move to game before returning. The fallback counts as an applied draw:
        // it sets lastPlayerDrew and clears the pending draw without passing through Validate.
        auto Decide(GameState& game, Rules& rules, MoveProposer& proposer) const -> Decision;

    private:
        auto Attempt(GameState const& game, MoveProposer& proposer) const -> Proposal;

        Config cfg_;
    };
}
#endif //UNOARBITER_JUDGE_HPP
