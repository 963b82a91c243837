#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <variant>
#include <vector>

#include "../net/RemoteProposer.hpp"
#include "../net/codec.hpp"
#include "TestUtil.hpp"

using namespace uno::core;
using namespace uno::net;
using namespace uno::test;
using namespace std::chrono_literals;

namespace
{
    auto snapshot() -> std::shared_ptr<GameSnapshot const>
    {
        auto s = std::make_shared<GameSnapshot>();
        s->my_hand = {Num("c1", Color::Red, 4)};
        s->discard = {Num("t", Color::Red, 9)};
        return s;
    }

    // Bridge stand-in: decodes each request and answers through `reply` on its own thread.
    struct FakeBridge
    {
        using Responder = std::function<std::vector<flatbuffers::DetachedBuffer>(RequestMsg const&)>;

        explicit FakeBridge(Responder r) : reply(std::move(r))
        {
            chan = std::make_shared<BridgeChannel>([this](std::span<std::uint8_t const> bytes) -> bool
            {
                auto decoded = DecodeEnvelope(AsBytes(bytes));
                if (!decoded) return false;
                auto const* req = std::get_if<RequestMsg>(&decoded.value());
                if (!req) return false;
                last_context = req->context;
                ++requests;
                std::vector<flatbuffers::DetachedBuffer> answers = reply(*req);
                std::vector<std::vector<std::uint8_t>> frames;
                for (auto const& a : answers) frames.push_back(ToBytes(a));
                workers.emplace_back([c = chan, frames = std::move(frames)]() mutable
                {
                    for (auto& f : frames) c->Enqueue(std::move(f));
                });
                return true;
            });
        }

        ~FakeBridge()
        {
            for (std::thread& t : workers) t.join();
        }

        Responder reply;
        std::shared_ptr<BridgeChannel> chan;
        std::vector<std::thread> workers;
        std::atomic<int> requests{0};
        std::string last_context;
    };
}

TEST(RemoteProposer, StructuredMoveReply)
{
    FakeBridge bridge([](RequestMsg const& r)
    {
        std::vector<flatbuffers::DetachedBuffer> out;
        out.push_back(BuildReply_Move(r.msg_id, Play("c1")));
        return out;
    });
    RemoteProposer p(bridge.chan);

    Proposal const m = p.Propose(snapshot(), std::chrono::steady_clock::now() + 2s);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(*m, Play("c1"));
    EXPECT_NE(bridge.last_context.find("CURRENT GAME STATE"), std::string::npos);
}

TEST(RemoteProposer, TextReplyIsParsed)
{
    FakeBridge bridge([](RequestMsg const& r)
    {
        std::vector<flatbuffers::DetachedBuffer> out;
        out.push_back(BuildReply_Text(r.msg_id, "sure: {\"action\": \"draw\", \"reasoning\": \"nothing fits\"}"));
        return out;
    });
    RemoteProposer p(bridge.chan);

    Proposal const m = p.Propose(snapshot(), std::chrono::steady_clock::now() + 2s);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->kind, MoveKind::Draw);
    EXPECT_EQ(m->reasoning, "nothing fits");
}

TEST(RemoteProposer, UnparseableTextIsMalformed)
{
    FakeBridge bridge([](RequestMsg const& r)
    {
        std::vector<flatbuffers::DetachedBuffer> out;
        out.push_back(BuildReply_Text(r.msg_id, "play the red four"));
        return out;
    });
    RemoteProposer p(bridge.chan);

    Proposal const m = p.Propose(snapshot(), std::chrono::steady_clock::now() + 2s);
    ASSERT_FALSE(m.has_value());
    EXPECT_EQ(m.error().code, ProposerFailureCode::Malformed);
}

TEST(RemoteProposer, StaleRepliesAreSkipped)
{
    FakeBridge bridge([](RequestMsg const& r)
    {
        std::vector<flatbuffers::DetachedBuffer> out;
        out.push_back(BuildReply_Move(r.msg_id + 100, Play("old")));
        out.push_back(BuildViolation(r.msg_id, ProtocolViolationCode, "noise"));
        out.push_back(BuildReply_Move(r.msg_id, Play("c1")));
        return out;
    });
    RemoteProposer p(bridge.chan);

    Proposal const m = p.Propose(snapshot(), std::chrono::steady_clock::now() + 2s);
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->card_id, "c1");
}

TEST(RemoteProposer, SilentBridgeTimesOut)
{
    FakeBridge bridge([](RequestMsg const&) { return std::vector<flatbuffers::DetachedBuffer>{}; });
    RemoteProposer p(bridge.chan);

    auto const start = std::chrono::steady_clock::now();
    Proposal const m = p.Propose(snapshot(), start + 100ms);
    ASSERT_FALSE(m.has_value());
    EXPECT_EQ(m.error().code, ProposerFailureCode::Timeout);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 100ms);
}

TEST(RemoteProposer, ClosedChannelIsTransportFailure)
{
    FakeBridge bridge([](RequestMsg const&) { return std::vector<flatbuffers::DetachedBuffer>{}; });
    RemoteProposer p(bridge.chan);
    bridge.chan->Close();

    Proposal const m = p.Propose(snapshot(), std::chrono::steady_clock::now() + 2s);
    ASSERT_FALSE(m.has_value());
    EXPECT_EQ(m.error().code, ProposerFailureCode::Transport);
    EXPECT_EQ(bridge.requests.load(), 0);
}

TEST(RemoteProposer, BridgeFailureIsForwarded)
{
    FakeBridge bridge([](RequestMsg const& r)
    {
        std::vector<flatbuffers::DetachedBuffer> out;
        out.push_back(BuildReply_Failure(r.msg_id, ProposerFailure{ProposerFailureCode::Unavailable, "model down"}));
        return out;
    });
    RemoteProposer p(bridge.chan);

    Proposal const m = p.Propose(snapshot(), std::chrono::steady_clock::now() + 2s);
    ASSERT_FALSE(m.has_value());
    EXPECT_EQ(m.error().detail, "model down");
}

TEST(RemoteProposer, ConsultReturnsText)
{
    FakeBridge bridge([](RequestMsg const& r)
    {
        std::vector<flatbuffers::DetachedBuffer> out;
        EXPECT_EQ(r.kind, RequestKind::Analysis);
        out.push_back(BuildReply_Text(r.msg_id, "Threat level: 9"));
        return out;
    });
    RemoteProposer p(bridge.chan);

    Consultation const c = p.Consult(snapshot(), std::chrono::steady_clock::now() + 2s);
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(*c, "Threat level: 9");
}
