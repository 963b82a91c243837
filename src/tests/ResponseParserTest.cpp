#include <gtest/gtest.h>

#include <string>

#include <nlohmann/json.hpp>

#include "../net/JsonCodec.hpp"
#include "../net/ResponseParser.hpp"

using namespace uno::core;
using namespace uno::net;

TEST(ResponseParser, StripsThinkTags)
{
    EXPECT_EQ(StripThinkTags("<think>hmm</think> {\"a\":1}"), "hmm {\"a\":1}");
    EXPECT_EQ(StripThinkTags("  plain  "), "plain");
}

TEST(ResponseParser, PrefersFencedJson)
{
    std::string const raw = "Thinking {not json}\n```json\n{\"action\": \"draw\"}\n```\ntrailing";
    auto const obj = ExtractJsonObject(raw);
    ASSERT_TRUE(obj.has_value());
    EXPECT_EQ(*obj, "{\"action\": \"draw\"}");
}

TEST(ResponseParser, BalancedBracesRespectStrings)
{
    std::string const raw = R"(I pick {"action": "play", "card_id": "c1", "reasoning": "a } in text"} done)";
    auto const obj = ExtractJsonObject(raw);
    ASSERT_TRUE(obj.has_value());
    EXPECT_EQ(*obj, R"({"action": "play", "card_id": "c1", "reasoning": "a } in text"})");
}

TEST(ResponseParser, ParsesPlayMove)
{
    auto const m = ParseMove(R"(<think>green matches</think>{"action":"play","card_id":"card_3","color":"Green","reasoning":"match"})");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->kind, MoveKind::Play);
    EXPECT_EQ(m->card_id, "card_3");
    EXPECT_EQ(m->color, Color::Green);
    EXPECT_EQ(m->reasoning, "match");
}

TEST(ResponseParser, NumericIdsAndMisspelledReasoning)
{
    auto const m = ParseMove(R"({"action":"play","card_id":17,"resoning":"typo"})");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->card_id, "17");
    EXPECT_EQ(m->reasoning, "typo");
}

TEST(ResponseParser, MissingFieldsDefaultToDraw)
{
    auto const m = ParseMove("{}");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->kind, MoveKind::Draw);
    EXPECT_EQ(m->reasoning, "no reasoning provided");
}

TEST(ResponseParser, UnknownColorIsDroppedNotFatal)
{
    auto const m = ParseMove(R"({"action":"play","card_id":"w","color":"purple"})");
    ASSERT_TRUE(m.has_value());
    EXPECT_FALSE(m->color.has_value());
}

TEST(ResponseParser, FailuresAreValues)
{
    EXPECT_FALSE(ParseMove("I would play the red seven").has_value());
    EXPECT_FALSE(ParseMove("{\"action\": ").has_value());
    EXPECT_FALSE(ParseMove(R"({"action":"pass"})").has_value());
}

TEST(ResponseParser, StructuredAnalysis)
{
    GameAnalysis const a = ParseAnalysis(
        R"(```json
{"best_cards_to_keep": ["card_1", 7], "opponent_threat_level": 8, "strategic_notes": "hold the wild"}
```)");
    EXPECT_EQ(a.keep, (std::vector<std::string>{"card_1", "7"}));
    EXPECT_EQ(a.threat, 8);
    EXPECT_EQ(a.notes, "hold the wild");
}

TEST(ResponseParser, StructuredAnalysisClampsThreat)
{
    GameAnalysis const a = ParseAnalysis(R"({"opponent_threat_level": 42})");
    EXPECT_EQ(a.threat, 5);
    EXPECT_EQ(a.notes, "No strategic notes provided");
}

TEST(ResponseParser, HeuristicAnalysis)
{
    GameAnalysis const a = ParseAnalysis("You should keep card_4 and hold card_9. Threat level: 7");
    EXPECT_EQ(a.keep, (std::vector<std::string>{"card_4", "card_9"}));
    EXPECT_EQ(a.threat, 7);
    EXPECT_EQ(a.notes, "You should keep card_4 and hold card_9. Threat level: 7");
}

TEST(ResponseParser, HeuristicAnalysisDefaultsAndTruncates)
{
    std::string const long_text(400, 'x');
    GameAnalysis const a = ParseAnalysis(long_text);
    EXPECT_TRUE(a.keep.empty());
    EXPECT_EQ(a.threat, 5);
    EXPECT_EQ(a.notes.size(), MaxNotesLength + 3);
    EXPECT_TRUE(a.notes.ends_with("..."));
}

TEST(ResponseParser, TruncationKeepsUtf8Whole)
{
    // two-byte character starting at the last kept byte
    std::string const text = std::string(MaxNotesLength - 1, 'a') + "\xC3\xA9 tail";
    GameAnalysis const a = ParseAnalysis(text);
    EXPECT_EQ(a.notes, std::string(MaxNotesLength - 1, 'a') + "...");

    std::string const fits = std::string(MaxNotesLength - 2, 'a') + "\xC3\xA9 tail";
    EXPECT_EQ(ParseAnalysis(fits).notes, std::string(MaxNotesLength - 2, 'a') + "\xC3\xA9...");

    nlohmann::json const j = AnalysisToJson(a);
    EXPECT_NO_THROW((void)j.dump());
}
