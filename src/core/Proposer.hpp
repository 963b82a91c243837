//
// Proposer.hpp
//

#ifndef UNOARBITER_PROPOSER_HPP
#define UNOARBITER_PROPOSER_HPP

#include <chrono>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

#include "Actions.hpp"
#include "State.hpp"

namespace uno::core
{
    enum class ProposerFailureCode : uint8_t
    {
        Timeout,
        Transport,
        Malformed,
        Unavailable
    };

    struct ProposerFailure
    {
        ProposerFailureCode code{ProposerFailureCode::Unavailable};
        std::string detail;
    };

    inline auto to_string(ProposerFailureCode const c) -> std::string_view
    {
        switch (c)
        {
        case ProposerFailureCode::Timeout: return "timeout";
        case ProposerFailureCode::Transport: return "transport";
        case ProposerFailureCode::Malformed: return "malformed";
        case ProposerFailureCode::Unavailable: return "unavailable";
        }
        return "?";
    }

    using Proposal = std::expected<Move, ProposerFailure>;
    using Consultation = std::expected<std::string, ProposerFailure>;

    // Untrusted source of candidate moves. Output is always re-validated by the caller.
    // Implementations may be shared between concurrent requests and must synchronise themselves.
    class MoveProposer
    {
    public:
        virtual ~MoveProposer() = default;

        // The deadline is advisory: an implementation that overruns it still gets its answer validated.
        virtual auto Propose(std::shared_ptr<GameSnapshot const> snapshot,
                             std::chrono::steady_clock::time_point deadline) -> Proposal = 0;

        // Free-form strategic commentary, used only by the advisor.
        virtual auto Consult(std::shared_ptr<GameSnapshot const> snapshot,
                             std::chrono::steady_clock::time_point deadline) -> Consultation
        {
            (void)snapshot;
            (void)deadline;
            return std::unexpected(ProposerFailure{ProposerFailureCode::Unavailable, "analysis not supported"});
        }
    };
}
#endif //UNOARBITER_PROPOSER_HPP
