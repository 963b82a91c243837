//
// JsonCodec.cpp
//
#include "JsonCodec.hpp"

#include <algorithm>
#include <format>
#include <type_traits>
#include <utility>

#include "../core/Exception.hpp"
#include "../core/Util.hpp"

using nlohmann::json;

namespace
{
    auto OptString(json const& j, char const* key) -> std::optional<std::string>
    {
        auto const it = j.find(key);
        if (it == j.end() || it->is_null()) return std::nullopt;
        if (!it->is_string()) return std::nullopt;
        return it->get<std::string>();
    }

    auto CardsFromJson(json const& arr, char const* what) -> std::expected<std::vector<uno::core::Card>, uno::net::ParseError>
    {
        std::vector<uno::core::Card> out;
        if (arr.is_null()) return out;
        if (!arr.is_array())
            return std::unexpected(uno::net::ParseError{std::format("{} must be an array", what)});

        out.reserve(arr.size());
        for (size_t i{}; i < arr.size(); ++i)
        {
            auto card = uno::net::CardFromJson(arr[i], std::format("card_{}", i));
            if (!card) return std::unexpected(card.error());
            out.push_back(std::move(*card));
        }
        return out;
    }
}

namespace uno::net
{
    auto IdFromJson(json const& j) -> std::optional<std::string>
    {
        if (j.is_string()) return util::NormalizeId(j.get<std::string>());
        if (j.is_number_integer()) return std::to_string(j.get<long long>());
        if (j.is_number_unsigned()) return std::to_string(j.get<unsigned long long>());
        return std::nullopt;
    }

    auto CardFromJson(json const& j, std::string fallback_id) -> std::expected<core::Card, ParseError>
    {
        if (!j.is_object())
            return std::unexpected(ParseError{"card must be an object"});

        core::Card c{};
        auto const id_it = j.find("id");
        std::optional<std::string> id = (id_it != j.end()) ? IdFromJson(*id_it) : std::nullopt;
        c.id = id.value_or(std::move(fallback_id));

        if (auto const color = OptString(j, "color"))
        {
            c.color = util::ColorFromString(*color);
            if (!c.color)
                return std::unexpected(ParseError{std::format("card {}: unknown color '{}'", c.id, *color)});
        }

        if (auto const it = j.find("digit"); it != j.end() && !it->is_null())
        {
            long long d{-1};
            if (it->is_number_integer()) d = it->get<long long>();
            else if (it->is_string())
            {
                std::string const s(util::Trim(it->get<std::string>()));
                if (s.size() == 1 && s[0] >= '0' && s[0] <= '9') d = s[0] - '0';
            }
            if (d < 0 || d > core::constants::MaxDigit)
                return std::unexpected(ParseError{std::format("card {}: digit must be 0-9", c.id)});
            c.digit = static_cast<uint8_t>(d);
        }

        if (auto const action = OptString(j, "action"); action && !util::Trim(*action).empty())
        {
            c.action = util::ActionFromString(*action);
            if (!c.action)
                return std::unexpected(ParseError{std::format("card {}: unknown action '{}'", c.id, *action)});
        }
        return c;
    }

    auto CardToJson(core::Card const& c) -> json
    {
        json j;
        j["id"] = c.id;
        j["color"] = c.color ? json(std::string(core::to_string(*c.color))) : json(nullptr);
        j["digit"] = c.digit ? json(static_cast<int>(*c.digit)) : json(nullptr);
        j["action"] = c.action ? json(std::string(core::to_string(*c.action))) : json(nullptr);
        return j;
    }

    auto MoveFromJson(json const& j) -> std::expected<core::Move, ParseError>
    {
        if (!j.is_object())
            return std::unexpected(ParseError{"move must be a JSON object"});

        core::Move m{};
        std::string const action = util::Lower(util::Trim(OptString(j, "action").value_or("draw")));
        if (action == "play") m.kind = core::MoveKind::Play;
        else if (action == "draw") m.kind = core::MoveKind::Draw;
        else return std::unexpected(ParseError{std::format("unknown action '{}'", action)});

        if (auto const it = j.find("card_id"); it != j.end())
            m.card_id = IdFromJson(*it);

        if (auto const color = OptString(j, "color"))
            m.color = util::ColorFromString(*color);

        std::optional<std::string> reasoning = OptString(j, "reasoning");
        if (!reasoning || reasoning->empty()) reasoning = OptString(j, "resoning");
        m.reasoning = (reasoning && !reasoning->empty()) ? *reasoning : "no reasoning provided";
        return m;
    }

    auto MoveToJson(core::Move const& m) -> json
    {
        json j;
        j["action"] = std::string(core::to_string(m.kind));
        j["card_id"] = m.card_id ? json(*m.card_id) : json(nullptr);
        j["color"] = m.color ? json(std::string(core::to_string(*m.color))) : json(nullptr);
        j["reasoning"] = m.reasoning;
        return j;
    }

    auto GameStateFromJson(json const& game_state, json const* player_cards)
        -> std::expected<core::GameState, ParseError>
    {
        if (!game_state.is_object())
            return std::unexpected(ParseError{"gameState must be an object"});

        try
        {
            json const* hand_json = nullptr;
            if (player_cards && player_cards->is_array() && !player_cards->empty())
            {
                hand_json = player_cards;
            }
            else if (auto const cp = game_state.find("currentPlayer"); cp != game_state.end() && cp->is_object())
            {
                if (auto const cards = cp->find("cards"); cards != cp->end()) hand_json = &*cards;
            }

            auto hand = hand_json ? CardsFromJson(*hand_json, "currentPlayer.cards")
                                  : std::expected<std::vector<core::Card>, ParseError>{};
            if (!hand) return std::unexpected(hand.error());

            json const empty = json::array();
            auto const ts = game_state.find("tableStack");
            auto discard = CardsFromJson(ts != game_state.end() ? *ts : empty, "tableStack");
            if (!discard) return std::unexpected(discard.error());

            std::vector<core::OpponentInfo> others;
            if (auto const op = game_state.find("otherPlayers"); op != game_state.end() && !op->is_null())
            {
                if (!op->is_array())
                    return std::unexpected(ParseError{"otherPlayers must be an array"});
                for (json const& p : *op)
                {
                    if (!p.is_object())
                        return std::unexpected(ParseError{"otherPlayers entries must be objects"});
                    core::OpponentInfo info{};
                    info.name = OptString(p, "name").value_or("Unknown");
                    if (auto const cards = p.find("cards"); cards != p.end())
                    {
                        if (cards->is_array()) info.card_count = static_cast<uint32_t>(cards->size());
                        else if (cards->is_number_unsigned() || cards->is_number_integer())
                            info.card_count = static_cast<uint32_t>(std::max<long long>(0, cards->get<long long>()));
                    }
                    others.push_back(std::move(info));
                }
            }

            int const direction = game_state.value("direction", 1);
            long long const sum_drawing = game_state.value("sumDrawing", 0LL);
            if (sum_drawing < 0)
                return std::unexpected(ParseError{"sumDrawing must be non-negative"});
            bool const last_drew = game_state.value("lastPlayerDrew", false);

            core::GameState state(std::move(*hand), std::move(*discard),
                                  static_cast<int8_t>(direction == 1 || direction == -1 ? direction : 0),
                                  static_cast<uint32_t>(sum_drawing), last_drew, std::move(others));

            std::optional<std::string> last_error = OptString(game_state, "lastValidationError");
            if (last_error)
            {
                core::RetryContext ctx{.last_validation_error = std::move(last_error), .last_invalid_move = std::nullopt};
                if (auto const lim = game_state.find("lastInvalidMove"); lim != game_state.end() && lim->is_object())
                {
                    if (auto mv = MoveFromJson(*lim)) ctx.last_invalid_move = std::move(*mv);
                }
                state.SetRetry(std::move(ctx));
            }
            return state;
        }
        catch (json::exception const& e)
        {
            return std::unexpected(ParseError{std::format("gameState: {}", e.what())});
        }
        catch (core::error::StateError const& e)
        {
            return std::unexpected(ParseError{e.what()});
        }
    }

    auto GameStateToJson(core::GameState const& g) -> json
    {
        json j;
        json hand = json::array();
        for (core::Card const& c : g.Hand()) hand.push_back(CardToJson(c));
        j["currentPlayer"] = json{{"cards", std::move(hand)}};

        json stack = json::array();
        for (core::Card const& c : g.Discard()) stack.push_back(CardToJson(c));
        j["tableStack"] = std::move(stack);

        json others = json::array();
        for (core::OpponentInfo const& o : g.Others())
            others.push_back(json{{"name", o.name}, {"cards", o.card_count}});
        j["otherPlayers"] = std::move(others);

        j["direction"] = static_cast<int>(g.Direction());
        j["sumDrawing"] = g.PendingDraw();
        j["lastPlayerDrew"] = g.LastPlayerDrew();
        if (auto const& r = g.Retry(); r && r->last_validation_error)
        {
            j["lastValidationError"] = *r->last_validation_error;
            if (r->last_invalid_move) j["lastInvalidMove"] = MoveToJson(*r->last_invalid_move);
        }
        return j;
    }

    auto ParseDecisionRequest(std::string const& body, bool const require_move)
        -> std::expected<DecisionRequest, ParseError>
    {
        json const j = json::parse(body, nullptr, /*allow_exceptions*/ false);
        if (j.is_discarded() || !j.is_object())
            return std::unexpected(ParseError{"request body must be a JSON object"});

        auto const gs = j.find("gameState");
        if (gs == j.end())
            return std::unexpected(ParseError{"gameState is required"});

        auto const pc = j.find("playerCards");
        auto state = GameStateFromJson(*gs, pc != j.end() ? &*pc : nullptr);
        if (!state) return std::unexpected(state.error());

        DecisionRequest req{};
        req.state = std::move(*state);
        req.provider = OptString(j, "provider").value_or("");
        req.model = OptString(j, "model");
        if (req.model && req.model->empty()) req.model.reset();
        req.base_url = OptString(j, "baseUrl");
        if (req.base_url && req.base_url->empty()) req.base_url.reset();

        if (require_move)
        {
            auto const mv = j.find("move");
            if (mv == j.end())
                return std::unexpected(ParseError{"move is required"});
            auto move = MoveFromJson(*mv);
            if (!move) return std::unexpected(move.error());
            req.move = std::move(*move);
        }
        return req;
    }

    auto AnalysisToJson(GameAnalysis const& a) -> json
    {
        return json{{"best_cards_to_keep", a.keep},
                    {"opponent_threat_level", a.threat},
                    {"strategic_notes", a.notes}};
    }

    auto VerdictToJson(core::AttemptVerdict const& v) -> json
    {
        return std::visit([]<typename T0>(T0 const& verdict) -> json
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, core::Accepted>)
            {
                return json{{"result", "accepted"}, {"move", MoveToJson(verdict.move)}};
            }
            else if constexpr (std::is_same_v<T, core::Rejected>)
            {
                return json{{"result", "rejected"},
                            {"move", MoveToJson(verdict.move)},
                            {"category", std::string(core::error::to_string(core::error::category(verdict.violation.code)))},
                            {"reason", verdict.reason}};
            }
            else
            {
                return json{{"result", "proposer_error"},
                            {"code", std::string(core::to_string(verdict.failure.code))},
                            {"detail", verdict.failure.detail}};
            }
        }, v);
    }

    auto Dump(json const& j) -> std::string
    {
        return j.dump(-1, ' ', false, json::error_handler_t::replace);
    }
}
