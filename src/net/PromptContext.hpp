//
// PromptContext.hpp
//

#ifndef UNOARBITER_PROMPTCONTEXT_HPP
#define UNOARBITER_PROMPTCONTEXT_HPP

#include <string>
#include <vector>
#include "../core/State.hpp"
#include "../core/Types.hpp"

namespace uno::net
{
    // "red 7", "yellow draw_two", "black wild"
    auto FormatCard(core::Card const& c) -> std::string;
    // "c1: red 7, c2: blue skip"
    auto FormatCards(std::vector<core::Card> const& cards) -> std::string;
    // "Bob (3 cards); Eve (5 cards)"
    auto FormatOthers(std::vector<core::OpponentInfo> const& others) -> std::string;

    // Text shipped with each remote request. Carries the previous rejection, if any.
    auto RenderContext(core::GameSnapshot const& s) -> std::string;
}

#endif //UNOARBITER_PROMPTCONTEXT_HPP
