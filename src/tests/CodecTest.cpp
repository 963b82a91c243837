#include <gtest/gtest.h>

#include <variant>
#include <vector>

#include "../net/codec.hpp"
#include "TestUtil.hpp"

using namespace uno::core;
using namespace uno::net;
using namespace uno::test;

namespace
{
    auto decode(flatbuffers::DetachedBuffer const& buf) -> Inbound
    {
        std::vector<std::uint8_t> const bytes = ToBytes(buf);
        auto r = DecodeEnvelope(AsBytes(bytes));
        EXPECT_TRUE(r.has_value()) << (r.has_value() ? "" : r.error().message);
        return r.value_or(Inbound{ViolationMsg{}});
    }
}

TEST(Codec, HelloCarriesProviderAndModel)
{
    Inbound const in = decode(BuildHello("bridge", "first-legal"));
    auto const* h = std::get_if<HelloMsg>(&in);
    ASSERT_NE(h, nullptr);
    EXPECT_EQ(h->provider, "bridge");
    EXPECT_EQ(h->model, "first-legal");
}

TEST(Codec, HelloWithoutProviderIsRejected)
{
    std::vector<std::uint8_t> const bytes = ToBytes(BuildHello("", "m"));
    EXPECT_FALSE(DecodeEnvelope(AsBytes(bytes)).has_value());
}

TEST(Codec, RequestCarriesFullView)
{
    GameSnapshot s{};
    s.my_hand = {Num("c1", Color::Red, 4), Wild("w")};
    s.discard = {Act("t", Color::Blue, CardAction::DrawTwo), Num("u", Color::Blue, 2)};
    s.direction = -1;
    s.pending_draw = 2;
    s.last_player_drew = false;
    s.others = {OpponentInfo{"Bob", 3}};
    s.retry = RetryContext{.last_validation_error = "Move does not follow UNO rules",
                           .last_invalid_move = Play("w", Color::Black)};

    Inbound const in = decode(BuildProposalRequest(s, RequestKind::Move, 9, "ctx"));
    auto const* r = std::get_if<RequestMsg>(&in);
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->msg_id, 9u);
    EXPECT_EQ(r->kind, RequestKind::Move);
    EXPECT_EQ(r->context, "ctx");

    GameSnapshot const& v = r->view;
    ASSERT_EQ(v.my_hand.size(), 2u);
    EXPECT_EQ(v.my_hand[0].digit, 4);
    EXPECT_FALSE(v.my_hand[0].action.has_value());
    EXPECT_EQ(v.my_hand[1].color, Color::Black);
    EXPECT_EQ(v.my_hand[1].action, CardAction::Wild);
    EXPECT_FALSE(v.my_hand[1].digit.has_value());
    ASSERT_NE(v.Top(), nullptr);
    EXPECT_EQ(v.Top()->id, "t");
    EXPECT_EQ(v.direction, -1);
    EXPECT_EQ(v.pending_draw, 2u);
    ASSERT_EQ(v.others.size(), 1u);
    EXPECT_EQ(v.others[0].name, "Bob");
    ASSERT_TRUE(v.retry.has_value());
    EXPECT_EQ(v.retry->last_invalid_move->color, Color::Black);
}

TEST(Codec, RepliesKeepTheirShape)
{
    Inbound const mv = decode(BuildReply_Move(3, Play("c1")));
    auto const* m = std::get_if<ReplyMsg>(&mv);
    ASSERT_NE(m, nullptr);
    EXPECT_EQ(m->msg_id, 3u);
    ASSERT_TRUE(std::holds_alternative<Move>(m->body));
    EXPECT_EQ(std::get<Move>(m->body), Play("c1"));

    Inbound const tx = decode(BuildReply_Text(4, "{\"action\":\"draw\"}"));
    auto const* t = std::get_if<ReplyMsg>(&tx);
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(std::get<std::string>(t->body), "{\"action\":\"draw\"}");

    Inbound const fl = decode(BuildReply_Failure(5, ProposerFailure{ProposerFailureCode::Timeout, "slow"}));
    auto const* f = std::get_if<ReplyMsg>(&fl);
    ASSERT_NE(f, nullptr);
    auto const& failure = std::get<ProposerFailure>(f->body);
    EXPECT_EQ(failure.code, ProposerFailureCode::Timeout);
    EXPECT_EQ(failure.detail, "slow");
}

TEST(Codec, ViolationRoundTrip)
{
    Inbound const in = decode(BuildViolation(7, ProtocolViolationCode, "expected Hello"));
    auto const* v = std::get_if<ViolationMsg>(&in);
    ASSERT_NE(v, nullptr);
    EXPECT_EQ(v->code, ProtocolViolationCode);
    EXPECT_EQ(v->text, "expected Hello");
}

TEST(Codec, VerifierRejectsGarbage)
{
    std::vector<std::uint8_t> garbage{0xde, 0xad, 0xbe, 0xef, 0x01, 0x02};
    EXPECT_FALSE(DecodeEnvelope(AsBytes(garbage)).has_value());

    std::vector<std::uint8_t> truncated = ToBytes(BuildHello("bridge", "m"));
    truncated.resize(truncated.size() / 2);
    EXPECT_FALSE(DecodeEnvelope(AsBytes(truncated)).has_value());

    std::vector<std::uint8_t> const empty;
    EXPECT_FALSE(DecodeEnvelope(AsBytes(empty)).has_value());
}

TEST(Codec, EnumMappingIsStable)
{
    for (Color c : {Color::Red, Color::Blue, Color::Green, Color::Yellow, Color::Black})
        EXPECT_EQ(FromFbColor(ToFbColor(c)), c);
    for (CardAction a : {CardAction::Skip, CardAction::Reverse, CardAction::DrawTwo, CardAction::DrawFour,
                         CardAction::Wild})
        EXPECT_EQ(FromFbAction(ToFbAction(a)), a);
}
