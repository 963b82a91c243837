//
// FirstLegalProposer.hpp
//

#ifndef UNOARBITER_FIRSTLEGALPROPOSER_HPP
#define UNOARBITER_FIRSTLEGALPROPOSER_HPP

#include "../core/Proposer.hpp"
#include "../core/State.hpp"

namespace uno::proposer
{
    // Plays the first legal card in hand order, else draws. Wilds take the most common color in hand.
    // Stateless, so safe to share.
    class FirstLegalProposer final : public core::MoveProposer
    {
    public:
        auto Propose(std::shared_ptr<core::GameSnapshot const> snapshot,
                     std::chrono::steady_clock::time_point deadline) -> core::Proposal override;

        auto Consult(std::shared_ptr<core::GameSnapshot const> snapshot,
                     std::chrono::steady_clock::time_point deadline) -> core::Consultation override;

        static auto ChooseMove(core::GameSnapshot const& s) -> core::Move;
        static auto PreferredColor(std::vector<core::Card> const& hand) -> core::Color;
    };
}

#endif //UNOARBITER_FIRSTLEGALPROPOSER_HPP
