#include <gtest/gtest.h>

#include <chrono>
#include <set>

#include <nlohmann/json.hpp>

#include "../core/ClassicRules.hpp"
#include "../core/Game.hpp"
#include "../net/PromptContext.hpp"
#include "../proposer/Advisor.hpp"
#include "../proposer/FirstLegalProposer.hpp"
#include "../proposer/RandomProposer.hpp"
#include "../proposer/TextProposer.hpp"
#include "TestUtil.hpp"

using namespace uno::core;
using namespace uno::proposer;
using namespace uno::test;
using namespace std::chrono_literals;

namespace
{
    auto later() -> std::chrono::steady_clock::time_point
    {
        return std::chrono::steady_clock::now() + 1s;
    }

    auto state() -> GameState
    {
        return GameState({Num("b1", Color::Blue, 1), Num("g7", Color::Green, 7), Wild("w"), Num("g2", Color::Green, 2)},
                         {Num("top", Color::Red, 7)}, 1, 0, false, {OpponentInfo{"Bob", 2}, OpponentInfo{"Eve", 6}});
    }
}

TEST(PromptContext, FormatsCardsAndOpponents)
{
    EXPECT_EQ(uno::net::FormatCard(Num("a", Color::Red, 7)), "red 7");
    EXPECT_EQ(uno::net::FormatCard(Act("b", Color::Yellow, CardAction::DrawTwo)), "yellow draw_two");
    EXPECT_EQ(uno::net::FormatCard(Card{"c", std::nullopt, std::nullopt, std::nullopt}), "Unknown card");
    EXPECT_EQ(uno::net::FormatCards({}), "No cards");
    EXPECT_EQ(uno::net::FormatOthers({OpponentInfo{"Bob", 3}}), "Bob (3 cards)");
}

TEST(PromptContext, IncludesPreviousError)
{
    GameState g = state();
    EXPECT_EQ(uno::net::RenderContext(*g.SnapshotFor()).find("PREVIOUS ERROR"), std::string::npos);

    g.SetRetry(RetryContext{.last_validation_error = "Card with ID x not found in player's hand",
                            .last_invalid_move = Play("x")});
    std::string const ctx = uno::net::RenderContext(*g.SnapshotFor());
    EXPECT_NE(ctx.find("PREVIOUS ERROR: Card with ID x not found in player's hand"), std::string::npos);
    EXPECT_NE(ctx.find("Invalid move was: "), std::string::npos);
    EXPECT_NE(ctx.find("Top card on table: red 7"), std::string::npos);
}

TEST(PromptContext, InvalidUtf8InRejectedMoveIsReplaced)
{
    GameState g = state();
    Move bad = Play("x");
    bad.reasoning = "\xFF\xFE because";
    g.SetRetry(RetryContext{.last_validation_error = "Card with ID x not found in player's hand",
                            .last_invalid_move = bad});

    std::string const ctx = uno::net::RenderContext(*g.SnapshotFor());
    EXPECT_NE(ctx.find("Invalid move was: "), std::string::npos);
    EXPECT_NE(ctx.find("\xEF\xBF\xBD"), std::string::npos);
    EXPECT_NE(ctx.find(" because"), std::string::npos);
}

TEST(FirstLegalProposer, PicksFirstPlayableInHandOrder)
{
    GameState const g = state();
    Move const m = FirstLegalProposer::ChooseMove(*g.SnapshotFor());
    EXPECT_EQ(m.kind, MoveKind::Play);
    EXPECT_EQ(m.card_id, "g7");
}

TEST(FirstLegalProposer, WildGetsMostCommonColor)
{
    GameState const g({Wild("w"), Num("g1", Color::Green, 1), Num("g2", Color::Green, 2), Num("b3", Color::Blue, 3)},
                      {Num("top", Color::Red, 9)});
    Move const m = FirstLegalProposer::ChooseMove(*g.SnapshotFor());
    EXPECT_EQ(m.card_id, "w");
    EXPECT_EQ(m.color, Color::Green);
}

TEST(FirstLegalProposer, DrawsWhenNothingFits)
{
    GameState const g({Num("b1", Color::Blue, 1)}, {Act("t", Color::Red, CardAction::DrawTwo)}, 1, 2);
    EXPECT_EQ(FirstLegalProposer::ChooseMove(*g.SnapshotFor()).kind, MoveKind::Draw);
}

TEST(FirstLegalProposer, ConsultIsStructuredAnalysis)
{
    FirstLegalProposer p;
    auto const text = p.Consult(state().SnapshotFor(), later());
    ASSERT_TRUE(text.has_value());
    nlohmann::json const j = nlohmann::json::parse(*text);
    EXPECT_EQ(j["opponent_threat_level"], 9);
    EXPECT_EQ(j["best_cards_to_keep"], nlohmann::json::array({"w"}));
}

TEST(RandomProposer, SameSeedSameMoves)
{
    RandomProposer a(77), b(77);
    auto const s = state().SnapshotFor();
    std::set<std::string> seen;
    for (int i = 0; i < 40; ++i)
    {
        Proposal const ma = a.Propose(s, later());
        Proposal const mb = b.Propose(s, later());
        ASSERT_TRUE(ma.has_value());
        ASSERT_TRUE(mb.has_value());
        EXPECT_EQ(*ma, *mb);
        seen.insert(ma->card_id.value_or("draw"));
    }
    // covers the hand and the draw slot
    EXPECT_GE(seen.size(), 3u);
}

TEST(TextProposer, ParsesSourceOutput)
{
    std::string captured;
    TextProposer p([&captured](std::string const& ctx, auto) -> Consultation
    {
        captured = ctx;
        return std::string(R"(```json
{"action": "play", "card_id": "g7", "reasoning": "sevens"}
```)");
    });

    Proposal const m = p.Propose(state().SnapshotFor(), later());
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->card_id, "g7");
    EXPECT_NE(captured.find("CURRENT GAME STATE"), std::string::npos);
}

TEST(TextProposer, UnparseableOutputIsMalformed)
{
    TextProposer p([](std::string const&, auto) -> Consultation { return std::string("no idea"); });
    Proposal const m = p.Propose(state().SnapshotFor(), later());
    ASSERT_FALSE(m.has_value());
    EXPECT_EQ(m.error().code, ProposerFailureCode::Malformed);
}

TEST(TextProposer, WithoutAnalysisSourceConsultIsUnavailable)
{
    TextProposer p([](std::string const&, auto) -> Consultation { return std::string("{}"); });
    Consultation const c = p.Consult(state().SnapshotFor(), later());
    ASSERT_FALSE(c.has_value());
    EXPECT_EQ(c.error().code, ProposerFailureCode::Unavailable);
}

TEST(Advisor, ParsesConsultation)
{
    RandomProposer p(5);
    GameState const g({Num("card_1", Color::Red, 1), Num("card_2", Color::Blue, 2)}, {Num("t", Color::Red, 4)});
    uno::net::GameAnalysis const a = Advisor{}.Analyze(g, p, later());
    ASSERT_EQ(a.keep.size(), 1u);
    EXPECT_GE(a.threat, 1);
    EXPECT_LE(a.threat, 10);
}

TEST(Advisor, FallsBackToNeutral)
{
    GameState const g = state();

    ThrowingProposer thrower;
    uno::net::GameAnalysis const a = Advisor{}.Analyze(g, thrower, later());
    EXPECT_TRUE(a.keep.empty());
    EXPECT_EQ(a.threat, 5);
    EXPECT_EQ(a.notes, "Analysis error: connection reset");

    ScriptedProposer no_analysis({Draw()});
    uno::net::GameAnalysis const b = Advisor{}.Analyze(g, no_analysis, later());
    EXPECT_EQ(b.threat, 5);
    EXPECT_EQ(b.notes, "Analysis error: unavailable: analysis not supported");
}

TEST(Advisor, NonStandardThrowGivesNeutral)
{
    OddThrowProposer p;
    uno::net::GameAnalysis const a = Advisor{}.Analyze(state(), p, later());
    EXPECT_TRUE(a.keep.empty());
    EXPECT_EQ(a.threat, 5);
    EXPECT_EQ(a.notes, "Analysis error: unknown exception");
}

TEST(Advisor, LeavesStateUntouched)
{
    GameState const g = state();
    FirstLegalProposer p;
    (void)Advisor{}.Analyze(g, p, later());
    EXPECT_EQ(g.HandSize(), 4u);
    EXPECT_EQ(g.DiscardSize(), 1u);
    EXPECT_FALSE(g.Retry().has_value());
}
