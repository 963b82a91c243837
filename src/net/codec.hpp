#ifndef UNOARBITER_CODEC_HPP
#define UNOARBITER_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <span>
#include <variant>
#include <vector>
#include <string>
#include <expected>
#include <flatbuffers/flatbuffers.h>

#include "../core/Types.hpp"
#include "../core/Actions.hpp"
#include "../core/State.hpp"
#include "../core/Proposer.hpp"
#include "ParseError.hpp"

#include "generated/flatbuffers/uno_net_generated.h"

namespace uno::net
{
    enum class RequestKind : uint8_t
    {
        Move,
        Analysis
    };

    // ----- Decoded inbound messages -----
    struct HelloMsg
    {
        std::string provider;
        std::string model;
    };

    struct RequestMsg
    {
        std::uint64_t msg_id{};
        RequestKind kind{RequestKind::Move};
        core::GameSnapshot view{};
        std::string context;
    };

    // A structured move, free text to be parsed, or the bridge's own failure
    using ReplyBody = std::variant<core::Move, std::string, core::ProposerFailure>;

    struct ReplyMsg
    {
        std::uint64_t msg_id{};
        ReplyBody body;
    };

    struct ViolationMsg
    {
        std::uint64_t msg_id{};
        std::int16_t code{};
        std::string text;
    };

    using Inbound = std::variant<HelloMsg, RequestMsg, ReplyMsg, ViolationMsg>;

    // Code carried by a Violation that is not a rule violation
    inline constexpr std::int16_t ProtocolViolationCode = -1;

    auto ToFbColor(core::Color c) noexcept -> uno::gen::net::Color;
    auto FromFbColor(uno::gen::net::Color c) noexcept -> core::Color;
    auto ToFbAction(core::CardAction a) noexcept -> uno::gen::net::CardAction;
    auto FromFbAction(uno::gen::net::CardAction a) noexcept -> core::CardAction;

    // --- Outbound builders (bridge -> server) ---
    auto BuildHello(std::string const& provider, std::string const& model) -> flatbuffers::DetachedBuffer;

    auto BuildReply_Move(std::uint64_t msg_id, core::Move const& m) -> flatbuffers::DetachedBuffer;
    auto BuildReply_Text(std::uint64_t msg_id, std::string const& raw) -> flatbuffers::DetachedBuffer;
    auto BuildReply_Failure(std::uint64_t msg_id, core::ProposerFailure const& f) -> flatbuffers::DetachedBuffer;

    // --- Outbound builders (server -> bridge) ---
    auto BuildProposalRequest(core::GameSnapshot const& s,
                              RequestKind kind,
                              std::uint64_t msg_id,
                              std::string const& context) -> flatbuffers::DetachedBuffer;

    auto BuildViolation(std::uint64_t msg_id, std::int16_t code, std::string const& text)
        -> flatbuffers::DetachedBuffer;

    // --- Inbound decode, verified before use ---
    auto DecodeEnvelope(std::span<std::byte const> bytes) -> std::expected<Inbound, ParseError>;

    inline auto ToBytes(flatbuffers::DetachedBuffer const& buf) -> std::vector<std::uint8_t>
    {
        return std::vector<std::uint8_t>(buf.data(), buf.data() + buf.size());
    }

    inline auto AsBytes(std::span<std::uint8_t const> u8) -> std::span<std::byte const>
    {
        return std::span<std::byte const>{reinterpret_cast<std::byte const*>(u8.data()), u8.size()};
    }
} // namespace uno::net


#endif //UNOARBITER_CODEC_HPP
