//
// ClassicRules.cpp
//

#include "ClassicRules.hpp"

#include <format>
#include "Game.hpp"
#include "Util.hpp"

namespace
{
    inline auto Viol(uno::core::error::RuleViolationCode code) -> uno::core::error::RuleViolation
    {
        return uno::core::error::RuleViolation{ .code = code };
    }
}

namespace uno::core
{
    auto ClassicRules::PendingDrawActive(Card const* top, bool const last_player_drew) -> bool
    {
        return top && IsDrawAction(top->action) && !last_player_drew;
    }

    auto ClassicRules::CanPlay(Card const* top, Card const& candidate, bool const last_player_drew) -> bool
    {
        if (!top) return true;

        bool const pending = PendingDrawActive(top, last_player_drew);

        if (!pending && candidate.action == CardAction::Wild) return true;
        if (candidate.action == CardAction::DrawFour) return true;
        // an unbound wild on top lets anything through
        if (top->color == Color::Black && !pending) return true;
        if (pending) return IsDrawAction(candidate.action);

        if (candidate.color == top->color) return true;
        return candidate.digit.has_value() && top->digit.has_value() && *candidate.digit == *top->digit;
    }

    auto ClassicRules::ExplainRejection(Card const* top, Card const& candidate,
                                        bool const last_player_drew, uint32_t const pending_draw)
        -> error::RuleViolation
    {
        using RVC = error::RuleViolationCode;
        (void)candidate;

        if (!top)
            return Viol(RVC::Internal_Unreachable);

        if (PendingDrawActive(top, last_player_drew))
            return Viol(RVC::Play_PendingDrawUnmet).with_pending(pending_draw);

        if (top->color == Color::Black)
            return Viol(RVC::Play_NotPlayable);

        return Viol(RVC::Play_ColorOrNumberMismatch).with_top(*top);
    }

    auto ClassicRules::Validate(GameState const& game, Move const& m) const -> CheckResult
    {
        using RVC = error::RuleViolationCode;

        if (m.kind == MoveKind::Draw)
            return {};

        if (!m.card_id || util::Trim(*m.card_id).empty())
            return std::unexpected(Viol(RVC::Play_MissingCardId));

        CCardSP const card = game.FindFromHand(*m.card_id).lock();
        if (!card)
            return std::unexpected(Viol(RVC::Play_CardNotInHand).with_card(util::NormalizeId(*m.card_id)));

        // checked ahead of legality: a colorless wild is refused even where it could be played
        if (NeedsColorChoice(card->action) && !IsPlayableColor(m.color))
            return std::unexpected(Viol(RVC::Play_ColorRequired).with_card(card->id).with_chosen(m.color));

        Card const* top = game.Top();
        if (!CanPlay(top, *card, game.last_player_drew_))
            return std::unexpected(ExplainRejection(top, *card, game.last_player_drew_, game.pending_draw_)
                                   .with_card(card->id));

        return {};
    }

    auto ClassicRules::Apply(GameState& game, Move const& m) -> void
    {
        if (m.kind == MoveKind::Draw)
        {
            game.last_player_drew_ = true;
            game.pending_draw_ = 0;
            game.ClearRetry();
            return;
        }

        if (!m.card_id)
            UNO_THROW(error::Code::Rules, "Apply(play) without a card id");

        CardSP const card = game.MoveHandToDiscard(*m.card_id);
        game.last_player_drew_ = false;

        if (NeedsColorChoice(card->action))
        {
            if (!IsPlayableColor(m.color))
                UNO_THROW(error::Code::Rules,
                          std::format("Apply({}) without a playable color", to_string(*card->action)));
            card->color = m.color;
        }

        switch (card->action.value_or(CardAction::Skip))
        {
        case CardAction::Reverse:
            game.direction_ = static_cast<int8_t>(-game.direction_);
            break;
        case CardAction::DrawTwo:
            game.pending_draw_ += constants::DrawTwoPenalty;
            break;
        case CardAction::DrawFour:
            game.pending_draw_ += constants::DrawFourPenalty;
            break;
        case CardAction::Skip:
        case CardAction::Wild:
            break;
        }

        // a served obligation does not survive a non-draw card on top
        if (!IsDrawAction(card->action))
            game.pending_draw_ = 0;

        game.ClearRetry();
    }
}
