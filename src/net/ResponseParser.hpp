//
// ResponseParser.hpp
//

#ifndef UNOARBITER_RESPONSEPARSER_HPP
#define UNOARBITER_RESPONSEPARSER_HPP

#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "../core/Actions.hpp"
#include "JsonCodec.hpp"
#include "ParseError.hpp"

namespace uno::net
{
    inline constexpr std::size_t MaxNotesLength = 300;

    // Removes <think> and </think> markers, keeping the text between them.
    auto StripThinkTags(std::string_view raw) -> std::string;

    // First balanced {...} inside a ```json fence, else the first balanced {...} anywhere.
    auto ExtractJsonObject(std::string_view text) -> std::optional<std::string>;

    // Free text from a proposer to a candidate move. Pure; never consults game state.
    auto ParseMove(std::string_view raw) -> std::expected<core::Move, ParseError>;

    // Structured object when present, heuristics otherwise. Never fails.
    auto ParseAnalysis(std::string_view raw) -> GameAnalysis;
}

#endif //UNOARBITER_RESPONSEPARSER_HPP
