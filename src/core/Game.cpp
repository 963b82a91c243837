//
// Game.cpp
//
#include "Game.hpp"
#include <algorithm>
#include <format>
#include <iterator>
#include <ranges>
#include <utility>

#include "Exception.hpp"
#include "Util.hpp"

namespace uno::core
{
    //helpers for ownership
    template <typename Range>
    static auto Materialize(Range const& src) -> std::vector<Card>
    {
        std::vector<Card> out;
        out.reserve(std::ranges::size(src));
        std::ranges::transform(src, std::back_inserter(out), [](CardSP const& c) { return *c; });
        return out;
    }

    GameState::GameState(std::vector<Card> hand,
                         std::vector<Card> discard,
                         int8_t const direction,
                         uint32_t const pending_draw,
                         bool const last_player_drew,
                         std::vector<OpponentInfo> others) :
        direction_(direction),
        pending_draw_(pending_draw),
        last_player_drew_(last_player_drew),
        others_(std::move(others))
    {
        hand_.reserve(hand.size());
        for (Card& c : hand) hand_.push_back(std::make_shared<Card>(std::move(c)));
        for (Card& c : discard) discard_.push_back(std::make_shared<Card>(std::move(c)));
        Validate();
    }

    GameState::GameState(GameState const& other) :
        direction_(other.direction_),
        pending_draw_(other.pending_draw_),
        last_player_drew_(other.last_player_drew_),
        others_(other.others_),
        retry_(other.retry_)
    {
        for (CardSP const& c : other.hand_) hand_.push_back(std::make_shared<Card>(*c));
        for (CardSP const& c : other.discard_) discard_.push_back(std::make_shared<Card>(*c));
    }

    auto GameState::operator=(GameState const& other) -> GameState&
    {
        if (this != &other)
        {
            GameState tmp(other);
            *this = std::move(tmp);
        }
        return *this;
    }

    auto GameState::Validate() const -> void
    {
        if (direction_ != 1 && direction_ != -1)
            UNO_THROW(error::Code::State, std::format("Direction must be 1 or -1, got {}", static_cast<int>(direction_)));

        util::CardUniqueChecker checker{};
        for (CardSP const& c : hand_) checker.Add(*c);
        if (checker.ContainsDup())
            UNO_THROW(error::Code::State, "Duplicate card ids in hand");

        if (pending_draw_ > 0)
        {
            Card const* top = Top();
            if (!top || !IsDrawAction(top->action))
                UNO_THROW(error::Code::State,
                          std::format("Pending draw of {} without a draw card on top", pending_draw_));
        }
    }

    auto GameState::Top() const noexcept -> Card const*
    {
        return discard_.empty() ? nullptr : discard_.front().get();
    }

    auto GameState::Hand() const -> std::vector<Card>
    {
        return Materialize(hand_);
    }

    auto GameState::Discard() const -> std::vector<Card>
    {
        return Materialize(discard_);
    }

    auto GameState::SnapshotFor() const -> std::shared_ptr<GameSnapshot const>
    {
        std::shared_ptr<GameSnapshot> snap = std::make_shared<GameSnapshot>();
        snap->my_hand = Materialize(hand_);
        snap->discard = Materialize(discard_);
        snap->direction = direction_;
        snap->pending_draw = pending_draw_;
        snap->last_player_drew = last_player_drew_;
        snap->others = others_;
        snap->retry = retry_;
        return snap;
    }

    auto GameState::FindFromHand(std::string_view const id) const -> CardWP
    {
        auto const it = std::ranges::find_if(hand_,
                                             [id](CardSP const& csp) { return util::SameId(csp->id, id); });
        return (it != std::cend(hand_)) ? CardWP{*it} : CardWP{};
    }

    auto GameState::MoveHandToDiscard(std::string_view const id) -> CardSP
    {
        auto const it = std::ranges::find_if(hand_,
                                             [id](CardSP const& csp) { return util::SameId(csp->id, id); });
        if (it == std::end(hand_))
            UNO_THROW(error::Code::State, std::format("Card {} not in hand", id));

        CardSP card = std::move(*it);
        hand_.erase(it);
        discard_.push_front(card);
        return card;
    }
}
