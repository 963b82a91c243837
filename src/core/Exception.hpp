//
// Exception.hpp
//

#ifndef UNOARBITER_EXCEPTION_HPP
#define UNOARBITER_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <stdexcept>
#include <format>
#include <utility>
#include "Types.hpp"
#include "Actions.hpp"

namespace uno::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Rules, // rules engine misuse (not a proposer's invalid move)
        State, // game state malformed or invariant broken
        InvalidAction, // caller supplied a request that cannot be served
        Timeout, // deadline exceeded for IO
        Network, // transport failure
        Serialization, // FlatBuffers/JSON verification or build errors
        Proposer, // proposer implementation misbehaved
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidActionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct TimeoutError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct NetworkError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ProposerError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::InvalidAction: throw InvalidActionError(std::move(msg), c, loc);
        case Code::Timeout: throw TimeoutError(std::move(msg), c, loc);
        case Code::Network: throw NetworkError(std::move(msg), c, loc);
        case Code::Serialization: throw SerializationError(std::move(msg), c, loc);
        case Code::Proposer: throw ProposerError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define UNO_THROW(code_enum, msg) ::uno::core::error::fail((code_enum), (msg))
#define UNO_ASSERT(cond, msg) do { if(!(cond)) ::uno::core::error::fail(::uno::core::error::Code::Assertion, (msg)); } while(0)

    // Fine-grained reasons a proposed move is refused.
    enum class RuleViolationCode : std::uint16_t
    {
        // Hand lookup
        Play_MissingCardId,
        Play_CardNotInHand,

        // Legality
        Play_PendingDrawUnmet,
        Play_ColorOrNumberMismatch,
        Play_NotPlayable,

        // Wild color binding
        Play_ColorRequired,

        // Safety net
        Internal_Unreachable
    };

    // Coarse taxonomy surfaced to callers and logs.
    enum class ViolationCategory : std::uint8_t
    {
        RuleViolation,
        HandMismatch,
        ColorRequired
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<std::string> card_id{};
        std::optional<std::uint32_t> pending_draw{};

        // Top card details, rendered in mismatch messages
        std::optional<Color> top_color{};
        std::optional<std::uint8_t> top_digit{};

        // Color the proposer picked for a wild (may be black)
        std::optional<Color> chosen_color{};

        auto with_card(std::string id) -> RuleViolation&
        {
            card_id = std::move(id);
            return *this;
        }

        auto with_pending(std::uint32_t n) -> RuleViolation&
        {
            pending_draw = n;
            return *this;
        }

        auto with_top(Card const& top) -> RuleViolation&
        {
            top_color = top.color;
            top_digit = top.digit;
            return *this;
        }

        auto with_chosen(std::optional<Color> c) -> RuleViolation&
        {
            chosen_color = c;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::Play_MissingCardId: return "Play: missing card id";
        case E::Play_CardNotInHand: return "Play: card not in hand";
        case E::Play_PendingDrawUnmet: return "Play: pending draw not answered";
        case E::Play_ColorOrNumberMismatch: return "Play: color/number mismatch";
        case E::Play_NotPlayable: return "Play: not playable";
        case E::Play_ColorRequired: return "Play: color choice required";
        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto category(RuleViolationCode c) -> ViolationCategory
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::Play_MissingCardId:
        case E::Play_CardNotInHand: return ViolationCategory::HandMismatch;
        case E::Play_ColorRequired: return ViolationCategory::ColorRequired;
        case E::Play_PendingDrawUnmet:
        case E::Play_ColorOrNumberMismatch:
        case E::Play_NotPlayable:
        case E::Internal_Unreachable: return ViolationCategory::RuleViolation;
        }
        return ViolationCategory::RuleViolation;
    }

    inline auto to_string(ViolationCategory c) -> std::string_view
    {
        switch (c)
        {
        case ViolationCategory::RuleViolation: return "RuleViolation";
        case ViolationCategory::HandMismatch: return "HandMismatch";
        case ViolationCategory::ColorRequired: return "ColorRequired";
        }
        return "Unknown";
    }

    // The sentence fed back to the proposer; specific enough to self-correct on.
    inline auto describe(RuleViolation const& v) -> std::string
    {
        using E = RuleViolationCode;
        switch (v.code)
        {
        case E::Play_MissingCardId:
            return "Card ID is required for play action";
        case E::Play_CardNotInHand:
            return std::format("Card with ID {} not found in player's hand", v.card_id.value_or("<none>"));
        case E::Play_PendingDrawUnmet:
            return std::format("Must play a draw card or draw {} cards due to pending draw", v.pending_draw.value_or(0));
        case E::Play_ColorOrNumberMismatch:
            return std::format("Card must match color ({}) or number ({}) of top card",
                               v.top_color ? to_string(*v.top_color) : std::string_view{"none"},
                               v.top_digit ? std::to_string(*v.top_digit) : std::string{"none"});
        case E::Play_NotPlayable:
            return "Move does not follow UNO rules";
        case E::Play_ColorRequired:
            return std::format("Invalid color '{}' for wild card. Must be red, blue, green, or yellow",
                               v.chosen_color ? to_string(*v.chosen_color) : std::string_view{"none"});
        case E::Internal_Unreachable:
            return "Internal: unreachable";
        }
        return "Unknown";
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

#endif //UNOARBITER_EXCEPTION_HPP
