#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "../net/JsonCodec.hpp"

using namespace uno::core;
using namespace uno::net;
using nlohmann::json;

namespace
{
    auto sample_state() -> json
    {
        return json::parse(R"({
            "currentPlayer": {"name": "Ann", "cards": [
                {"id": "c1", "color": "red", "digit": 4},
                {"id": 2, "color": "black", "action": "wild"}
            ]},
            "tableStack": [
                {"id": "t0", "color": "blue", "action": "draw_two"},
                {"id": "t1", "color": "blue", "digit": 3}
            ],
            "otherPlayers": [{"name": "Bob", "cards": 3}, {"name": "Eve", "cards": [{}, {}]}],
            "direction": -1,
            "sumDrawing": 2,
            "lastPlayerDrew": false
        })");
    }
}

TEST(JsonCodec, ReadsGameState)
{
    auto const g = GameStateFromJson(sample_state());
    ASSERT_TRUE(g.has_value()) << g.error().message;
    EXPECT_EQ(g->HandSize(), 2u);
    EXPECT_FALSE(g->FindFromHand("2").expired());
    EXPECT_EQ(g->Top()->id, "t0");
    EXPECT_EQ(g->Direction(), -1);
    EXPECT_EQ(g->PendingDraw(), 2u);
    ASSERT_EQ(g->Others().size(), 2u);
    EXPECT_EQ(g->Others()[0].card_count, 3u);
    EXPECT_EQ(g->Others()[1].card_count, 2u);
}

TEST(JsonCodec, PlayerCardsOverrideHand)
{
    json const cards = json::parse(R"([{"id": "p1", "color": "green", "digit": 1}])");
    auto const g = GameStateFromJson(sample_state(), &cards);
    ASSERT_TRUE(g.has_value());
    EXPECT_EQ(g->HandSize(), 1u);
    EXPECT_FALSE(g->FindFromHand("p1").expired());
}

TEST(JsonCodec, CarriesRetryContext)
{
    json s = sample_state();
    s["lastValidationError"] = "Card with ID x not found in player's hand";
    s["lastInvalidMove"] = {{"action", "play"}, {"card_id", "x"}};
    auto const g = GameStateFromJson(s);
    ASSERT_TRUE(g.has_value());
    ASSERT_TRUE(g->Retry().has_value());
    EXPECT_EQ(g->Retry()->last_invalid_move->card_id, "x");

    json const back = GameStateToJson(*g);
    EXPECT_EQ(back["lastValidationError"], "Card with ID x not found in player's hand");
    EXPECT_EQ(back["lastInvalidMove"]["card_id"], "x");
}

TEST(JsonCodec, RejectsMalformedInput)
{
    json bad_direction = sample_state();
    bad_direction["direction"] = 2;
    EXPECT_FALSE(GameStateFromJson(bad_direction).has_value());

    json bad_color = sample_state();
    bad_color["tableStack"][0]["color"] = "purple";
    EXPECT_FALSE(GameStateFromJson(bad_color).has_value());

    json bad_digit = sample_state();
    bad_digit["currentPlayer"]["cards"][0]["digit"] = 12;
    EXPECT_FALSE(GameStateFromJson(bad_digit).has_value());

    json orphan_pending = sample_state();
    orphan_pending["tableStack"] = json::array();
    EXPECT_FALSE(GameStateFromJson(orphan_pending).has_value());

    EXPECT_FALSE(GameStateFromJson(json::array()).has_value());
}

TEST(JsonCodec, ParsesDecisionRequest)
{
    json body{{"gameState", sample_state()}, {"provider", "random"}, {"model", ""}};
    auto const req = ParseDecisionRequest(body.dump());
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->provider, "random");
    EXPECT_FALSE(req->model.has_value());
    EXPECT_FALSE(req->move.has_value());

    EXPECT_FALSE(ParseDecisionRequest("not json").has_value());
    EXPECT_FALSE(ParseDecisionRequest(R"({"provider": "random"})").has_value());
    EXPECT_FALSE(ParseDecisionRequest(body.dump(), /*require_move*/ true).has_value());

    body["move"] = {{"action", "play"}, {"card_id", "c1"}};
    auto const with_move = ParseDecisionRequest(body.dump(), true);
    ASSERT_TRUE(with_move.has_value());
    EXPECT_EQ(with_move->move->kind, MoveKind::Play);
}

TEST(JsonCodec, WritesMovesAndVerdicts)
{
    Move const m{.kind = MoveKind::Play, .card_id = "w", .color = Color::Yellow, .reasoning = "why not"};
    json const j = MoveToJson(m);
    EXPECT_EQ(j["action"], "play");
    EXPECT_EQ(j["card_id"], "w");
    EXPECT_EQ(j["color"], "yellow");
    EXPECT_TRUE(MoveToJson(Move{}).at("card_id").is_null());

    error::RuleViolation v{.code = error::RuleViolationCode::Play_CardNotInHand};
    json const rej = VerdictToJson(Rejected{m, v, "nope"});
    EXPECT_EQ(rej["result"], "rejected");
    EXPECT_EQ(rej["category"], "HandMismatch");

    json const fail = VerdictToJson(ProposerFailed{ProposerFailure{ProposerFailureCode::Timeout, "slow"}});
    EXPECT_EQ(fail["code"], "timeout");
}

TEST(JsonCodec, AnalysisFieldNames)
{
    json const j = AnalysisToJson(GameAnalysis{.keep = {"c1"}, .threat = 3, .notes = "n"});
    EXPECT_EQ(j["best_cards_to_keep"], json::array({"c1"}));
    EXPECT_EQ(j["opponent_threat_level"], 3);
    EXPECT_EQ(j["strategic_notes"], "n");
}
