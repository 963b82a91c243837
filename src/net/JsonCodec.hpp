//
// JsonCodec.hpp
//

#ifndef UNOARBITER_JSONCODEC_HPP
#define UNOARBITER_JSONCODEC_HPP

#include <expected>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../core/Actions.hpp"
#include "../core/Game.hpp"
#include "../core/Judge.hpp"
#include "../core/Types.hpp"
#include "ParseError.hpp"

namespace uno::net
{
    // Decoded body of POST /move, /analysis and /validate
    struct DecisionRequest
    {
        std::optional<core::GameState> state;
        std::string provider;
        std::optional<std::string> model;
        std::optional<std::string> base_url;
        std::optional<core::Move> move; // only for /validate
    };

    struct GameAnalysis
    {
        std::vector<std::string> keep;
        int threat{5};
        std::string notes;
    };

    // Card ids may arrive as numbers; they are carried as their decimal string.
    auto IdFromJson(nlohmann::json const& j) -> std::optional<std::string>;

    auto CardFromJson(nlohmann::json const& j, std::string fallback_id) -> std::expected<core::Card, ParseError>;
    auto CardToJson(core::Card const& c) -> nlohmann::json;

    // Missing fields default to a draw with "no reasoning provided".
    // Unknown colors are dropped (left for validation to refuse); unknown actions are an error.
    auto MoveFromJson(nlohmann::json const& j) -> std::expected<core::Move, ParseError>;
    auto MoveToJson(core::Move const& m) -> nlohmann::json;

    auto GameStateFromJson(nlohmann::json const& game_state,
                           nlohmann::json const* player_cards = nullptr)
        -> std::expected<core::GameState, ParseError>;
    auto GameStateToJson(core::GameState const& g) -> nlohmann::json;

    auto ParseDecisionRequest(std::string const& body, bool require_move = false)
        -> std::expected<DecisionRequest, ParseError>;

    auto AnalysisToJson(GameAnalysis const& a) -> nlohmann::json;
    auto VerdictToJson(core::AttemptVerdict const& v) -> nlohmann::json;

    // Compact text; invalid UTF-8 from a proposer is replaced with U+FFFD instead of throwing.
    auto Dump(nlohmann::json const& j) -> std::string;
}

#endif //UNOARBITER_JSONCODEC_HPP
