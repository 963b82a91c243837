//
// Util.hpp
//

#ifndef UNOARBITER_UTIL_HPP
#define UNOARBITER_UTIL_HPP

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <unordered_set>
#include "Types.hpp"

namespace uno::core::util
{
    inline auto Trim(std::string_view s) -> std::string_view
    {
        auto const is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
        while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
        while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
        return s;
    }

    inline auto Lower(std::string_view s) -> std::string
    {
        std::string out(s);
        std::ranges::transform(out, out.begin(),
                               [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        return out;
    }

    // Card ids arrive as strings or numbers; both sides are compared in trimmed string form.
    inline auto NormalizeId(std::string_view id) -> std::string
    {
        return std::string(Trim(id));
    }

    inline auto SameId(std::string_view a, std::string_view b) -> bool
    {
        return Trim(a) == Trim(b);
    }

    // "black" is kept so that validation can reject it explicitly.
    inline auto ColorFromString(std::string_view s) -> std::optional<Color>
    {
        std::string const l = Lower(Trim(s));
        if (l == "red") return Color::Red;
        if (l == "blue") return Color::Blue;
        if (l == "green") return Color::Green;
        if (l == "yellow") return Color::Yellow;
        if (l == "black") return Color::Black;
        return std::nullopt;
    }

    inline auto ActionFromString(std::string_view s) -> std::optional<CardAction>
    {
        std::string l = Lower(Trim(s));
        std::ranges::replace(l, ' ', '_');
        std::ranges::replace(l, '-', '_');
        if (l == "skip") return CardAction::Skip;
        if (l == "reverse") return CardAction::Reverse;
        if (l == "draw_two" || l == "drawtwo" || l == "+2") return CardAction::DrawTwo;
        if (l == "draw_four" || l == "drawfour" || l == "wild_draw_four" || l == "+4") return CardAction::DrawFour;
        if (l == "wild") return CardAction::Wild;
        return std::nullopt;
    }

    class CardUniqueChecker
    {
    public:
        CardUniqueChecker():
            contains_dup_(false) {}
        auto Add(Card const& c) -> void
        {
            contains_dup_ |= !ids_.insert(NormalizeId(c.id)).second;
        }
        [[nodiscard]]
        auto ContainsDup() const -> bool
        {
            return contains_dup_;
        }
    private:
        std::unordered_set<std::string> ids_;
        bool contains_dup_;
    };
}

#endif //UNOARBITER_UTIL_HPP
