//
// PromptContext.cpp
//
#include "PromptContext.hpp"

#include <format>
#include "JsonCodec.hpp"

namespace uno::net
{
    auto FormatCard(core::Card const& c) -> std::string
    {
        std::string out;
        auto const append = [&out](std::string_view part)
        {
            if (!out.empty()) out += ' ';
            out += part;
        };
        if (c.color) append(core::to_string(*c.color));
        if (c.digit) append(std::to_string(*c.digit));
        if (c.action) append(core::to_string(*c.action));
        return out.empty() ? "Unknown card" : out;
    }

    auto FormatCards(std::vector<core::Card> const& cards) -> std::string
    {
        if (cards.empty()) return "No cards";
        std::string out;
        for (size_t i{}; i < cards.size(); ++i)
        {
            out += std::format("{}{}: {}", (i ? ", " : ""), cards[i].id, FormatCard(cards[i]));
        }
        return out;
    }

    auto FormatOthers(std::vector<core::OpponentInfo> const& others) -> std::string
    {
        if (others.empty()) return "No other players";
        std::string out;
        for (size_t i{}; i < others.size(); ++i)
        {
            out += std::format("{}{} ({} cards)", (i ? "; " : ""), others[i].name, others[i].card_count);
        }
        return out;
    }

    auto RenderContext(core::GameSnapshot const& s) -> std::string
    {
        core::Card const* top = s.Top();
        std::string ctx = std::format(
            "CURRENT GAME STATE:\n"
            "- Your cards: {}\n"
            "- Top card on table: {}\n"
            "- Game direction: {}\n"
            "- Cards to draw if you must draw: {}\n"
            "- Last player drew: {}\n"
            "- Other players: {}\n"
            "\n"
            "RULES:\n"
            "- Match the color or number of the top card\n"
            "- wild and draw_four need a chosen color: red, blue, green or yellow\n"
            "- With a draw pending and no draw since, play a draw card or draw\n"
            "- Answer with a JSON object: {{\"action\": \"play\"|\"draw\", \"card_id\": ..., \"color\": ..., \"reasoning\": ...}}\n",
            FormatCards(s.my_hand),
            top ? FormatCard(*top) : std::string("No card played yet"),
            s.direction == 1 ? "clockwise" : "counter-clockwise",
            s.pending_draw,
            s.last_player_drew,
            FormatOthers(s.others));

        if (s.retry && s.retry->last_validation_error)
        {
            ctx += std::format("\nPREVIOUS ERROR: {}", *s.retry->last_validation_error);
            if (s.retry->last_invalid_move)
                ctx += std::format("\nInvalid move was: {}", Dump(MoveToJson(*s.retry->last_invalid_move)));
            ctx += '\n';
        }
        return ctx;
    }
}
