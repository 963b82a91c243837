#include "AuditLogger.hpp"

#include <format>
#include <string_view>
#include <vector>

using namespace uno::core;

namespace
{

auto s_color(std::optional<Color> const c) -> std::string_view
{
    if (!c) return "-";
    switch (*c)
    {
        case Color::Red:    return "R";
        case Color::Blue:   return "B";
        case Color::Green:  return "G";
        case Color::Yellow: return "Y";
        case Color::Black:  return "K";
    }
    return "?";
}

auto s_face(Card const& c) -> std::string
{
    if (c.digit) return std::to_string(*c.digit);
    if (!c.action) return "?";
    switch (*c.action)
    {
        case CardAction::Skip:     return "S";
        case CardAction::Reverse:  return "R";
        case CardAction::DrawTwo:  return "+2";
        case CardAction::DrawFour: return "+4";
        case CardAction::Wild:     return "W";
    }
    return "?";
}

auto s_card(Card const& c) -> std::string
{
    return std::format("{}{}#{}", s_color(c.color), s_face(c), c.id);
}

auto s_move(Move const& m) -> std::string
{
    if (m.kind == MoveKind::Draw) return "Draw";
    return std::format("Play({}{})", m.card_id.value_or("?"),
                       m.color ? std::format(",{}", to_string(*m.color)) : std::string{});
}

auto serialize_hand(std::vector<Card> const& hand) -> std::string
{
    std::string serial;
    for (size_t i{}; i < hand.size(); ++i)
    {
        serial += (i ? "," : "");
        serial += s_card(hand[i]);
    }
    return serial;
}

} // anonymous namespace

namespace uno::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(GameState const& game, std::string const& provider) -> void
{
    Card const* top = game.Top();
    out_ << std::format("Request provider={}\n", provider);
    out_ << std::format("Hand=[{}]\n", serialize_hand(game.Hand()));
    out_ << std::format("Top={} dir={} pending={} drew={}\n",
                        top ? s_card(*top) : std::string("--"),
                        static_cast<int>(game.Direction()),
                        game.PendingDraw(),
                        game.LastPlayerDrew() ? 1 : 0);
}

auto AuditLogger::attempt(std::size_t index, AttemptVerdict const& v) -> void
{
    out_ << std::format("Attempt {}: {}\n", index, DescribeVerdict(v));
}

auto AuditLogger::decision(Decision const& d) -> void
{
    out_ << std::format("Decision: {} outcome={} attempts={}\n",
                        s_move(d.move),
                        d.outcome == DecisionOutcome::Accepted ? "Accepted" : "Fallback",
                        d.attempts.size());
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace uno::core::debug
