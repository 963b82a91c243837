//
// RemoteProposer.cpp
//

#include "RemoteProposer.hpp"

#include <format>
#include <print>
#include <type_traits>
#include <variant>
#include <utility>

#include "PromptContext.hpp"
#include "ResponseParser.hpp"

namespace uno::net
{
    using core::ProposerFailure;
    using core::ProposerFailureCode;

    RemoteProposer::RemoteProposer(std::shared_ptr<BridgeChannel> chan)
        : chan_{std::move(chan)}
    {
    }

    auto RemoteProposer::RoundTrip(core::GameSnapshot const& s,
                                   RequestKind kind,
                                   std::chrono::steady_clock::time_point deadline)
        -> std::expected<ReplyBody, ProposerFailure>
    {
        std::lock_guard<std::mutex> lock(call_mtx_);

        if (!chan_)
            return std::unexpected(ProposerFailure{ProposerFailureCode::Unavailable, "bridge not connected"});

        std::uint64_t const msg_id = ++next_msg_id_;
        std::vector<std::uint8_t> const frame = ToBytes(BuildProposalRequest(s, kind, msg_id, RenderContext(s)));
        if (!chan_->Send(frame))
            return std::unexpected(ProposerFailure{ProposerFailureCode::Transport, "bridge send failed"});

        std::vector<uint8_t> in;
        while (chan_->WaitPopUntil(in, deadline))
        {
            auto const decoded = DecodeEnvelope(AsBytes(in));
            if (!decoded.has_value())
            {
                std::print("[Bridge] dropping undecodable frame: {}\n", decoded.error().message);
                continue;
            }
            auto const* reply = std::get_if<ReplyMsg>(&decoded.value());
            if (!reply)
            {
                std::print("[Bridge] dropping non-reply frame\n");
                continue;
            }
            if (reply->msg_id != msg_id)
            {
                // answer to a request that already timed out
                std::print("[Bridge] dropping stale reply {} (waiting for {})\n", reply->msg_id, msg_id);
                continue;
            }
            return reply->body;
        }

        if (!chan_->IsOpen())
            return std::unexpected(ProposerFailure{ProposerFailureCode::Transport, "bridge disconnected"});
        return std::unexpected(ProposerFailure{ProposerFailureCode::Timeout,
                                               std::format("no reply to request {} before deadline", msg_id)});
    }

    auto RemoteProposer::Propose(std::shared_ptr<core::GameSnapshot const> snapshot,
                                 std::chrono::steady_clock::time_point deadline) -> core::Proposal
    {
        if (!snapshot)
            return std::unexpected(ProposerFailure{ProposerFailureCode::Malformed, "null snapshot"});

        auto body = RoundTrip(*snapshot, RequestKind::Move, deadline);
        if (!body) return std::unexpected(body.error());

        return std::visit([]<typename T0>(T0 const& b) -> core::Proposal
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, core::Move>)
            {
                return b;
            }
            else if constexpr (std::is_same_v<T, std::string>)
            {
                auto move = ParseMove(b);
                if (!move)
                    return std::unexpected(ProposerFailure{ProposerFailureCode::Malformed, move.error().message});
                return *move;
            }
            else
            {
                return std::unexpected(b);
            }
        }, *body);
    }

    auto RemoteProposer::Consult(std::shared_ptr<core::GameSnapshot const> snapshot,
                                 std::chrono::steady_clock::time_point deadline) -> core::Consultation
    {
        if (!snapshot)
            return std::unexpected(ProposerFailure{ProposerFailureCode::Malformed, "null snapshot"});

        auto body = RoundTrip(*snapshot, RequestKind::Analysis, deadline);
        if (!body) return std::unexpected(body.error());

        if (auto const* text = std::get_if<std::string>(&*body)) return *text;
        if (auto const* f = std::get_if<ProposerFailure>(&*body)) return std::unexpected(*f);
        return std::unexpected(ProposerFailure{ProposerFailureCode::Malformed, "analysis reply carried a move"});
    }
}
