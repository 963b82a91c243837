//
// RandomProposer.cpp
//

#include "RandomProposer.hpp"
#include <array>
#include <format>
#include <optional>

namespace uno::proposer
{
    RandomProposer::RandomProposer(uint64_t rng_seed):
        rng_(static_cast<std::mt19937::result_type>(rng_seed)) {}

    auto RandomProposer::Propose(std::shared_ptr<core::GameSnapshot const> snapshot,
                                 std::chrono::steady_clock::time_point deadline) -> core::Proposal
    {
        (void)deadline;
        if (!snapshot)
            return std::unexpected(core::ProposerFailure{core::ProposerFailureCode::Malformed, "null snapshot"});

        std::lock_guard<std::mutex> lock(mtx_);
        std::vector<core::Card> const& hand = snapshot->my_hand;

        // last slot = draw
        size_t const choice = pick(hand.size() + 1);
        if (choice == hand.size())
            return core::Move{.kind = core::MoveKind::Draw, .reasoning = "random draw"};

        core::Card const& card = hand[choice];
        core::Move m{.kind = core::MoveKind::Play, .card_id = card.id, .reasoning = "random card"};
        if (core::NeedsColorChoice(card.action))
        {
            // the empty slot forgets the color on purpose
            static constexpr std::array<std::optional<core::Color>, 5> colors{
                core::Color::Red, core::Color::Blue, core::Color::Green, core::Color::Yellow, std::nullopt};
            m.color = colors[pick(colors.size())];
        }
        return m;
    }

    auto RandomProposer::Consult(std::shared_ptr<core::GameSnapshot const> snapshot,
                                 std::chrono::steady_clock::time_point deadline) -> core::Consultation
    {
        (void)deadline;
        if (!snapshot || snapshot->my_hand.empty())
            return std::string("Nothing to keep. Threat level: 5");

        std::lock_guard<std::mutex> lock(mtx_);
        core::Card const& keep = snapshot->my_hand[pick(snapshot->my_hand.size())];
        return std::format("Keep {} for later. Threat level: {}", keep.id, pick(10) + 1);
    }
}
