//
// FirstLegalProposer.cpp
//

#include "FirstLegalProposer.hpp"
#include <algorithm>
#include <array>
#include <format>
#include <iterator>
#include <limits>
#include <utility>

#include <nlohmann/json.hpp>

#include "../core/ClassicRules.hpp"
#include "../net/JsonCodec.hpp"

namespace uno::proposer
{
    auto FirstLegalProposer::PreferredColor(std::vector<core::Card> const& hand) -> core::Color
    {
        std::array<size_t, 4> counts{};
        for (core::Card const& c : hand)
        {
            if (core::IsPlayableColor(c.color)) ++counts[std::to_underlying(*c.color)];
        }
        // ties go to the earlier color (red first)
        auto const best = std::ranges::max_element(counts);
        return static_cast<core::Color>(std::distance(counts.begin(), best));
    }

    auto FirstLegalProposer::ChooseMove(core::GameSnapshot const& s) -> core::Move
    {
        core::Card const* top = s.Top();
        auto const it = std::ranges::find_if(s.my_hand, [&](core::Card const& c)
        {
            return core::ClassicRules::CanPlay(top, c, s.last_player_drew);
        });

        if (it == s.my_hand.end())
            return core::Move{.kind = core::MoveKind::Draw, .reasoning = "no playable card, drawing"};

        core::Move m{.kind = core::MoveKind::Play, .card_id = it->id,
                     .reasoning = std::format("first legal card {}", it->id)};
        if (core::NeedsColorChoice(it->action))
            m.color = PreferredColor(s.my_hand);
        return m;
    }

    auto FirstLegalProposer::Propose(std::shared_ptr<core::GameSnapshot const> snapshot,
                                     std::chrono::steady_clock::time_point deadline) -> core::Proposal
    {
        (void)deadline;
        if (!snapshot)
            return std::unexpected(core::ProposerFailure{core::ProposerFailureCode::Malformed, "null snapshot"});
        return ChooseMove(*snapshot);
    }

    auto FirstLegalProposer::Consult(std::shared_ptr<core::GameSnapshot const> snapshot,
                                     std::chrono::steady_clock::time_point deadline) -> core::Consultation
    {
        (void)deadline;
        if (!snapshot)
            return std::unexpected(core::ProposerFailure{core::ProposerFailureCode::Malformed, "null snapshot"});

        uint32_t fewest{std::numeric_limits<uint32_t>::max()};
        for (core::OpponentInfo const& o : snapshot->others) fewest = std::min(fewest, o.card_count);
        // the closer an opponent is to going out, the higher the threat
        int const threat = snapshot->others.empty() ? 5 : static_cast<int>(11 - std::clamp<uint32_t>(fewest, 1, 10));

        nlohmann::json keep = nlohmann::json::array();
        for (core::Card const& c : snapshot->my_hand)
        {
            if (core::NeedsColorChoice(c.action)) keep.push_back(c.id);
        }
        nlohmann::json const out{{"best_cards_to_keep", std::move(keep)},
                                 {"opponent_threat_level", threat},
                                 {"strategic_notes", "Hold wild cards, shed matching colors first."}};
        return net::Dump(out);
    }
}
