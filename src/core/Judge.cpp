//
// Judge.cpp
//
#include "Judge.hpp"
#include <format>
#include <print>
#include <type_traits>
#include <utility>
#include "Exception.hpp"
#include "Game.hpp"
#include "Rules.hpp"

namespace uno::core
{
    auto FallbackMove() -> Move
    {
        return Move{.kind = MoveKind::Draw, .card_id = std::nullopt, .color = std::nullopt,
                    .reasoning = "fallback after exhausted retries"};
    }

    auto DescribeVerdict(AttemptVerdict const& v) -> std::string
    {
        return std::visit([]<typename T0>(T0 const& verdict) -> std::string
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, Accepted>)
            {
                return std::format("Accepted {} {}", to_string(verdict.move.kind),
                                   verdict.move.card_id.value_or("-"));
            }
            else if constexpr (std::is_same_v<T, Rejected>)
            {
                return std::format("Rejected {} {} [{}]: {}", to_string(verdict.move.kind),
                                   verdict.move.card_id.value_or("-"),
                                   error::to_string(error::category(verdict.violation.code)), verdict.reason);
            }
            else
            {
                return std::format("ProposerFailure [{}]: {}", to_string(verdict.failure.code),
                                   verdict.failure.detail);
            }
        }, v);
    }

    auto Judge::Attempt(GameState const& game, MoveProposer& proposer) const -> Proposal
    {
        auto const deadline = std::chrono::steady_clock::now() + cfg_.attempt_timeout;
        // no exception from a proposer crosses the supervisor
        try
        {
            return proposer.Propose(game.SnapshotFor(), deadline);
        }
        catch (OmegaException<error::Code> const& e)
        {
            return std::unexpected(ProposerFailure{ProposerFailureCode::Transport, e.what()});
        }
        catch (std::exception const& e)
        {
            return std::unexpected(ProposerFailure{ProposerFailureCode::Transport, e.what()});
        }
        catch (...)
        {
            return std::unexpected(ProposerFailure{ProposerFailureCode::Transport, "unknown exception"});
        }
    }

    auto Judge::Decide(GameState& game, Rules& rules, MoveProposer& proposer) const -> Decision
    {
        Decision dec{};
        dec.attempts.reserve(cfg_.retry_budget);

        for (size_t attempt{}; attempt < cfg_.retry_budget; ++attempt)
        {
            Proposal const proposal = Attempt(game, proposer);

            if (!proposal.has_value())
            {
                ProposerFailure const& f = proposal.error();
                std::print("[Judge] attempt {}/{} proposer failure ({}): {}\n", attempt + 1, cfg_.retry_budget,
                           to_string(f.code), f.detail);
                game.SetRetry(RetryContext{
                    .last_validation_error = std::format("Proposer failure: {}", f.detail),
                    .last_invalid_move = std::nullopt});
                dec.attempts.emplace_back(ProposerFailed{f});
                continue;
            }

            Move const& move = *proposal;
            if (auto const ok = rules.Validate(game, move); !ok.has_value())
            {
                std::string reason = error::describe(ok.error());
                std::print("[Judge] attempt {}/{} rejected: {}\n", attempt + 1, cfg_.retry_budget, reason);
                game.SetRetry(RetryContext{.last_validation_error = reason, .last_invalid_move = move});
                dec.attempts.emplace_back(Rejected{move, ok.error(), std::move(reason)});
                continue;
            }

            rules.Apply(game, move);
            dec.attempts.emplace_back(Accepted{move});
            dec.move = move;
            dec.outcome = DecisionOutcome::Accepted;
            return dec;
        }

        std::print("[Judge] budget of {} exhausted, falling back to draw\n", cfg_.retry_budget);
        dec.move = FallbackMove();
        dec.outcome = DecisionOutcome::Fallback;
        rules.Apply(game, dec.move);
        return dec;
    }
}
