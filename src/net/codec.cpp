//
// codec.cpp
//
#include "codec.hpp"

#include <utility>
#include <vector>

namespace fbn = uno::gen::net;

namespace
{
    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert(static_cast<int>(uno::core::Color::Black) == static_cast<int>(fbn::Color::Black));
    static_assert(static_cast<int>(uno::core::CardAction::Wild) == static_cast<int>(fbn::CardAction::Wild));
    static_assert(static_cast<int>(uno::core::MoveKind::Draw) == static_cast<int>(fbn::MoveKind::Draw));
    static_assert(static_cast<int>(uno::core::ProposerFailureCode::Unavailable) ==
                  static_cast<int>(fbn::FailureCode::Unavailable));

    auto Str(flatbuffers::String const* s) -> std::string
    {
        return s ? s->str() : std::string{};
    }
}

namespace uno::net
{
    auto ToFbColor(core::Color c) noexcept -> fbn::Color
    {
        switch (c)
        {
        case core::Color::Red: return fbn::Color::Red;
        case core::Color::Blue: return fbn::Color::Blue;
        case core::Color::Green: return fbn::Color::Green;
        case core::Color::Yellow: return fbn::Color::Yellow;
        case core::Color::Black: return fbn::Color::Black;
        }
        return fbn::Color::Black;
    }

    auto FromFbColor(fbn::Color c) noexcept -> core::Color
    {
        switch (c)
        {
        case fbn::Color::Red: return core::Color::Red;
        case fbn::Color::Blue: return core::Color::Blue;
        case fbn::Color::Green: return core::Color::Green;
        case fbn::Color::Yellow: return core::Color::Yellow;
        case fbn::Color::Black: return core::Color::Black;
        }
        return core::Color::Black;
    }

    auto ToFbAction(core::CardAction a) noexcept -> fbn::CardAction
    {
        switch (a)
        {
        case core::CardAction::Skip: return fbn::CardAction::Skip;
        case core::CardAction::Reverse: return fbn::CardAction::Reverse;
        case core::CardAction::DrawTwo: return fbn::CardAction::DrawTwo;
        case core::CardAction::DrawFour: return fbn::CardAction::DrawFour;
        case core::CardAction::Wild: return fbn::CardAction::Wild;
        }
        return fbn::CardAction::Skip;
    }

    auto FromFbAction(fbn::CardAction a) noexcept -> core::CardAction
    {
        switch (a)
        {
        case fbn::CardAction::Skip: return core::CardAction::Skip;
        case fbn::CardAction::Reverse: return core::CardAction::Reverse;
        case fbn::CardAction::DrawTwo: return core::CardAction::DrawTwo;
        case fbn::CardAction::DrawFour: return core::CardAction::DrawFour;
        case fbn::CardAction::Wild: return core::CardAction::Wild;
        }
        return core::CardAction::Skip;
    }

    static auto ToFbCard(flatbuffers::FlatBufferBuilder& fbb, core::Card const& c)
        -> flatbuffers::Offset<fbn::Card>
    {
        auto const id = fbb.CreateString(c.id);
        flatbuffers::Optional<fbn::Color> color = flatbuffers::nullopt;
        if (c.color) color = ToFbColor(*c.color);
        flatbuffers::Optional<uint8_t> digit = flatbuffers::nullopt;
        if (c.digit) digit = *c.digit;
        flatbuffers::Optional<fbn::CardAction> action = flatbuffers::nullopt;
        if (c.action) action = ToFbAction(*c.action);
        return fbn::CreateCard(fbb, id, color, digit, action);
    }

    static auto FromFbCard(fbn::Card const* c) -> core::Card
    {
        core::Card out{};
        out.id = Str(c->id());
        if (c->color().has_value()) out.color = FromFbColor(c->color().value());
        if (c->digit().has_value()) out.digit = c->digit().value();
        if (c->action().has_value()) out.action = FromFbAction(c->action().value());
        return out;
    }

    static auto ToFbMove(flatbuffers::FlatBufferBuilder& fbb, core::Move const& m)
        -> flatbuffers::Offset<fbn::Move>
    {
        flatbuffers::Offset<flatbuffers::String> card_id{};
        if (m.card_id) card_id = fbb.CreateString(*m.card_id);
        auto const reasoning = fbb.CreateString(m.reasoning);
        flatbuffers::Optional<fbn::Color> color = flatbuffers::nullopt;
        if (m.color) color = ToFbColor(*m.color);
        return fbn::CreateMove(fbb,
                               m.kind == core::MoveKind::Play ? fbn::MoveKind::Play : fbn::MoveKind::Draw,
                               card_id, color, reasoning);
    }

    static auto FromFbMove(fbn::Move const* m) -> core::Move
    {
        core::Move out{};
        out.kind = (m->kind() == fbn::MoveKind::Play) ? core::MoveKind::Play : core::MoveKind::Draw;
        if (m->card_id()) out.card_id = m->card_id()->str();
        if (m->color().has_value()) out.color = FromFbColor(m->color().value());
        out.reasoning = Str(m->reasoning());
        return out;
    }

    template <class Range>
    static auto ToFbCards(flatbuffers::FlatBufferBuilder& fbb, Range const& cards)
    {
        std::vector<flatbuffers::Offset<fbn::Card>> vec;
        vec.reserve(cards.size());
        for (core::Card const& c : cards) vec.push_back(ToFbCard(fbb, c));
        return fbb.CreateVector(vec);
    }

    static auto FromFbCards(flatbuffers::Vector<flatbuffers::Offset<fbn::Card>> const* v) -> std::vector<core::Card>
    {
        std::vector<core::Card> out;
        if (!v) return out;
        out.reserve(v->size());
        for (flatbuffers::uoffset_t i = 0; i < v->size(); ++i) out.push_back(FromFbCard(v->Get(i)));
        return out;
    }

    static auto Finish(flatbuffers::FlatBufferBuilder& fbb, fbn::Message type, flatbuffers::Offset<void> msg)
        -> flatbuffers::DetachedBuffer
    {
        auto const env = fbn::CreateEnvelope(fbb, type, msg);
        fbb.Finish(env);
        return fbb.Release();
    }

    // ---------- Bridge -> server ----------

    auto BuildHello(std::string const& provider, std::string const& model) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const h = fbn::CreateHelloDirect(fbb, provider.c_str(), model.c_str());
        return Finish(fbb, fbn::Message::Hello, h.Union());
    }

    auto BuildReply_Move(std::uint64_t msg_id, core::Move const& m) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const mv = ToFbMove(fbb, m);
        fbn::ProposalReplyBuilder rb(fbb);
        rb.add_msg_id(msg_id);
        rb.add_move(mv);
        auto const r = rb.Finish();
        return Finish(fbb, fbn::Message::ProposalReply, r.Union());
    }

    auto BuildReply_Text(std::uint64_t msg_id, std::string const& raw) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const txt = fbb.CreateString(raw);
        fbn::ProposalReplyBuilder rb(fbb);
        rb.add_msg_id(msg_id);
        rb.add_raw_text(txt);
        auto const r = rb.Finish();
        return Finish(fbb, fbn::Message::ProposalReply, r.Union());
    }

    auto BuildReply_Failure(std::uint64_t msg_id, core::ProposerFailure const& f) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const detail = fbb.CreateString(f.detail);
        fbn::ProposalReplyBuilder rb(fbb);
        rb.add_msg_id(msg_id);
        rb.add_failure(static_cast<fbn::FailureCode>(f.code));
        rb.add_failure_detail(detail);
        auto const r = rb.Finish();
        return Finish(fbb, fbn::Message::ProposalReply, r.Union());
    }

    // ---------- Server -> bridge ----------

    auto BuildProposalRequest(core::GameSnapshot const& s,
                              RequestKind kind,
                              std::uint64_t msg_id,
                              std::string const& context) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        auto const hand = ToFbCards(fbb, s.my_hand);
        auto const discard = ToFbCards(fbb, s.discard);

        std::vector<flatbuffers::Offset<fbn::Opponent>> opp;
        opp.reserve(s.others.size());
        for (core::OpponentInfo const& o : s.others)
            opp.push_back(fbn::CreateOpponentDirect(fbb, o.name.c_str(), o.card_count));
        auto const opp_vec = fbb.CreateVector(opp);

        flatbuffers::Offset<fbn::RetryInfo> retry{};
        if (s.retry)
        {
            flatbuffers::Offset<flatbuffers::String> err{};
            if (s.retry->last_validation_error) err = fbb.CreateString(*s.retry->last_validation_error);
            flatbuffers::Offset<fbn::Move> mv{};
            if (s.retry->last_invalid_move) mv = ToFbMove(fbb, *s.retry->last_invalid_move);
            retry = fbn::CreateRetryInfo(fbb, err, mv);
        }

        auto const view = fbn::CreateGameView(
            fbb,
            /*schema_version*/ 1,
            /*my_hand*/ hand,
            /*discard*/ discard,
            /*direction*/ s.direction,
            /*pending_draw*/ s.pending_draw,
            /*last_player_drew*/ s.last_player_drew,
            /*others*/ opp_vec,
            /*retry*/ retry);

        auto const ctx = fbb.CreateString(context);
        auto const req = fbn::CreateProposalRequest(
            fbb, msg_id,
            kind == RequestKind::Move ? fbn::RequestKind::ProposeMove : fbn::RequestKind::Analyze,
            view, ctx);
        return Finish(fbb, fbn::Message::ProposalRequest, req.Union());
    }

    auto BuildViolation(std::uint64_t msg_id, std::int16_t code, std::string const& text)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const vio = fbn::CreateViolationDirect(fbb, msg_id, code, text.c_str());
        return Finish(fbb, fbn::Message::Violation, vio.Union());
    }

    // ---------- Decode ----------

    static auto DecodeView(fbn::GameView const* v) -> core::GameSnapshot
    {
        core::GameSnapshot s{};
        s.my_hand = FromFbCards(v->my_hand());
        s.discard = FromFbCards(v->discard());
        s.direction = v->direction();
        s.pending_draw = v->pending_draw();
        s.last_player_drew = v->last_player_drew();
        if (auto const* others = v->others())
        {
            for (flatbuffers::uoffset_t i = 0; i < others->size(); ++i)
            {
                fbn::Opponent const* o = others->Get(i);
                s.others.push_back(core::OpponentInfo{Str(o->name()), o->card_count()});
            }
        }
        if (fbn::RetryInfo const* r = v->retry())
        {
            core::RetryContext ctx{};
            if (r->last_validation_error()) ctx.last_validation_error = r->last_validation_error()->str();
            if (r->last_invalid_move()) ctx.last_invalid_move = FromFbMove(r->last_invalid_move());
            s.retry = std::move(ctx);
        }
        return s;
    }

    auto DecodeEnvelope(std::span<std::byte const> bytes) -> std::expected<Inbound, ParseError>
    {
        auto const* data = reinterpret_cast<uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fbn::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(ParseError{"Envelope failed verification"});

        fbn::Envelope const* env = fbn::GetEnvelope(data);
        switch (env->message_type())
        {
        case fbn::Message::Hello:
        {
            fbn::Hello const* h = env->message_as_Hello();
            if (!h->provider() || h->provider()->size() == 0)
                return std::unexpected(ParseError{"Hello without provider"});
            return HelloMsg{h->provider()->str(), Str(h->model())};
        }
        case fbn::Message::ProposalRequest:
        {
            fbn::ProposalRequest const* r = env->message_as_ProposalRequest();
            if (!r->view())
                return std::unexpected(ParseError{"ProposalRequest without view"});
            RequestMsg out{};
            out.msg_id = r->msg_id();
            out.kind = (r->kind() == fbn::RequestKind::Analyze) ? RequestKind::Analysis : RequestKind::Move;
            out.view = DecodeView(r->view());
            out.context = Str(r->context());
            return out;
        }
        case fbn::Message::ProposalReply:
        {
            fbn::ProposalReply const* r = env->message_as_ProposalReply();
            ReplyMsg out{};
            out.msg_id = r->msg_id();
            if (r->failure().has_value())
            {
                out.body = core::ProposerFailure{static_cast<core::ProposerFailureCode>(r->failure().value()),
                                                 Str(r->failure_detail())};
            }
            else if (r->move())
            {
                out.body = FromFbMove(r->move());
            }
            else if (r->raw_text())
            {
                out.body = r->raw_text()->str();
            }
            else
            {
                return std::unexpected(ParseError{"ProposalReply carries neither move, text nor failure"});
            }
            return out;
        }
        case fbn::Message::Violation:
        {
            fbn::Violation const* v = env->message_as_Violation();
            return ViolationMsg{v->msg_id(), v->code(), Str(v->text())};
        }
        case fbn::Message::NONE:
            break;
        }
        return std::unexpected(ParseError{"Envelope without message"});
    }
}
