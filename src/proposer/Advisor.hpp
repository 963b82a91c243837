//
// Advisor.hpp
//

#ifndef UNOARBITER_ADVISOR_HPP
#define UNOARBITER_ADVISOR_HPP

#include <chrono>
#include "../core/Game.hpp"
#include "../core/Proposer.hpp"
#include "../net/JsonCodec.hpp"

namespace uno::proposer
{
    // Best-effort strategic commentary. Read-only on the state, never throws,
    // and falls back to a neutral analysis (threat 5, nothing to keep).
    class Advisor
    {
    public:
        auto Analyze(core::GameState const& game,
                     core::MoveProposer& proposer,
                     std::chrono::steady_clock::time_point deadline) const noexcept -> net::GameAnalysis;
    };
}

#endif //UNOARBITER_ADVISOR_HPP
