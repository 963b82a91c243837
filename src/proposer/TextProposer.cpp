//
// TextProposer.cpp
//

#include "TextProposer.hpp"
#include <utility>

#include "../net/PromptContext.hpp"
#include "../net/ResponseParser.hpp"

namespace uno::proposer
{
    TextProposer::TextProposer(TextSource move_source, TextSource analysis_source):
        move_source_(std::move(move_source)),
        analysis_source_(std::move(analysis_source))
    {
    }

    auto TextProposer::Propose(std::shared_ptr<core::GameSnapshot const> snapshot,
                               std::chrono::steady_clock::time_point deadline) -> core::Proposal
    {
        if (!snapshot || !move_source_)
            return std::unexpected(core::ProposerFailure{core::ProposerFailureCode::Unavailable, "no text source"});

        core::Consultation const raw = move_source_(net::RenderContext(*snapshot), deadline);
        if (!raw) return std::unexpected(raw.error());

        auto move = net::ParseMove(*raw);
        if (!move)
            return std::unexpected(core::ProposerFailure{core::ProposerFailureCode::Malformed, move.error().message});
        return *move;
    }

    auto TextProposer::Consult(std::shared_ptr<core::GameSnapshot const> snapshot,
                               std::chrono::steady_clock::time_point deadline) -> core::Consultation
    {
        if (!snapshot || !analysis_source_)
            return MoveProposer::Consult(std::move(snapshot), deadline);
        return analysis_source_(net::RenderContext(*snapshot), deadline);
    }
}
