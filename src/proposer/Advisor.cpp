//
// Advisor.cpp
//

#include "Advisor.hpp"
#include <format>
#include <print>

#include "../core/Exception.hpp"
#include "../net/ResponseParser.hpp"

namespace uno::proposer
{
    static auto Neutral(std::string detail) -> net::GameAnalysis
    {
        std::print("[Advisor] analysis unavailable: {}\n", detail);
        return net::GameAnalysis{.keep = {}, .threat = 5, .notes = std::format("Analysis error: {}", detail)};
    }

    auto Advisor::Analyze(core::GameState const& game,
                          core::MoveProposer& proposer,
                          std::chrono::steady_clock::time_point deadline) const noexcept -> net::GameAnalysis
    {
        try
        {
            core::Consultation const text = proposer.Consult(game.SnapshotFor(), deadline);
            if (!text)
                return Neutral(std::format("{}: {}", core::to_string(text.error().code), text.error().detail));
            return net::ParseAnalysis(*text);
        }
        catch (core::OmegaException<core::error::Code> const& e)
        {
            return Neutral(e.what());
        }
        catch (std::exception const& e)
        {
            return Neutral(e.what());
        }
        catch (...)
        {
            return Neutral("unknown exception");
        }
    }
}
