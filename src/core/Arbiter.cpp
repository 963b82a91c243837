//
// Arbiter.cpp
//
#include "Arbiter.hpp"
#include <utility>
#include "Exception.hpp"
#include "Game.hpp"

namespace uno::core
{
    Arbiter::Arbiter(Config const& config, std::unique_ptr<Rules> rules) :
        cfg_(config),
        rules_(std::move(rules)),
        judge_(cfg_)
    {
        UNO_ASSERT(rules_ != nullptr, "Arbiter constructed without rules");
    }

    auto Arbiter::Decide(GameState& game, MoveProposer& proposer) const -> Decision
    {
        return judge_.Decide(game, *rules_, proposer);
    }

    auto Arbiter::Check(GameState const& game, Move const& m) const -> Rules::CheckResult
    {
        return rules_->Validate(game, m);
    }

    auto Arbiter::Apply(GameState& game, Move const& m) const -> void
    {
        if (auto const ok = rules_->Validate(game, m); !ok.has_value())
            UNO_THROW(error::Code::InvalidAction, error::describe(ok.error()));
        rules_->Apply(game, m);
    }

    auto Arbiter::Explain(GameState const& game, Move const& m) const -> std::string
    {
        if (auto const ok = rules_->Validate(game, m); !ok.has_value())
            return error::describe(ok.error());
        return m.kind == MoveKind::Draw ? "Draw action is always valid" : "Move is valid";
    }
}
