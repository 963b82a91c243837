//
// Types.hpp
//

#ifndef UNOARBITER_TYPES_HPP
#define UNOARBITER_TYPES_HPP

#define UNO_ENABLE_TEST_HOOKS true

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <chrono>
#include <random>

namespace uno::core::constants
{
    inline constexpr std::size_t DefaultRetryBudget = 3;
    inline constexpr std::uint8_t MaxDigit = 9;
    inline constexpr std::uint32_t DrawTwoPenalty = 2;
    inline constexpr std::uint32_t DrawFourPenalty = 4;
}

namespace uno::core
{
    enum class Color : uint8_t
    {
        Red = 0,
        Blue,
        Green,
        Yellow,
        Black
    };

    enum class CardAction : uint8_t
    {
        Skip = 0,
        Reverse,
        DrawTwo,
        DrawFour,
        Wild
    };

    // A card carries a digit or an action (neither for malformed input).
    // Wild and DrawFour stay Black until a color is bound on the discard pile.
    struct Card
    {
        std::string id;
        std::optional<Color> color;
        std::optional<uint8_t> digit;
        std::optional<CardAction> action;
    };
    using CardSP = std::shared_ptr<Card>;
    using CCardSP = std::shared_ptr<Card const>;
    using CardWP = std::weak_ptr<Card>;

    struct OpponentInfo
    {
        std::string name;
        uint32_t card_count{};
    };

    struct Config
    {
        std::size_t retry_budget{constants::DefaultRetryBudget};
        // Handed to the proposer as the per-attempt deadline; the judge itself never cuts an attempt short.
        std::chrono::milliseconds attempt_timeout{std::chrono::seconds(15ULL)};
        uint64_t seed{std::random_device{}()};
    };

    [[nodiscard]]
    inline auto IsDrawAction(std::optional<CardAction> const a) noexcept -> bool
    {
        return a == CardAction::DrawTwo || a == CardAction::DrawFour;
    }

    [[nodiscard]]
    inline auto NeedsColorChoice(std::optional<CardAction> const a) noexcept -> bool
    {
        return a == CardAction::Wild || a == CardAction::DrawFour;
    }

    [[nodiscard]]
    inline auto IsPlayableColor(std::optional<Color> const c) noexcept -> bool
    {
        return c.has_value() && *c != Color::Black;
    }

    inline auto to_string(Color const c) -> std::string_view
    {
        switch (c)
        {
        case Color::Red: return "red";
        case Color::Blue: return "blue";
        case Color::Green: return "green";
        case Color::Yellow: return "yellow";
        case Color::Black: return "black";
        }
        return "?";
    }

    inline auto to_string(CardAction const a) -> std::string_view
    {
        switch (a)
        {
        case CardAction::Skip: return "skip";
        case CardAction::Reverse: return "reverse";
        case CardAction::DrawTwo: return "draw_two";
        case CardAction::DrawFour: return "draw_four";
        case CardAction::Wild: return "wild";
        }
        return "?";
    }
}

#endif //UNOARBITER_TYPES_HPP
