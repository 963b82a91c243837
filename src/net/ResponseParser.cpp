//
// ResponseParser.cpp
//
#include "ResponseParser.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <format>
#include <regex>

#include "../core/Util.hpp"

using nlohmann::json;

namespace
{
    auto EraseAll(std::string& s, std::string_view needle) -> void
    {
        for (auto pos = s.find(needle); pos != std::string::npos; pos = s.find(needle, pos))
            s.erase(pos, needle.size());
    }

    // Index one past the brace closing the object opened at `open`, string literals respected.
    auto MatchBrace(std::string_view text, std::size_t const open) -> std::optional<std::size_t>
    {
        int depth{};
        bool in_string{false};
        bool escaped{false};
        for (std::size_t i = open; i < text.size(); ++i)
        {
            char const ch = text[i];
            if (in_string)
            {
                if (escaped) escaped = false;
                else if (ch == '\\') escaped = true;
                else if (ch == '"') in_string = false;
                continue;
            }
            if (ch == '"') in_string = true;
            else if (ch == '{') ++depth;
            else if (ch == '}' && --depth == 0) return i + 1;
        }
        return std::nullopt;
    }

    auto ObjectAt(std::string_view text, std::size_t const open) -> std::optional<std::string>
    {
        auto const end = MatchBrace(text, open);
        if (!end) return std::nullopt;
        return std::string(text.substr(open, *end - open));
    }

    auto FencedObject(std::string_view text) -> std::optional<std::string>
    {
        constexpr std::string_view fence = "```";
        for (auto pos = text.find(fence); pos != std::string_view::npos; pos = text.find(fence, pos + fence.size()))
        {
            std::size_t i = pos + fence.size();
            if (uno::core::util::Lower(text.substr(i, 4)) == "json") i += 4;
            while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
            if (i < text.size() && text[i] == '{')
            {
                if (auto obj = ObjectAt(text, i)) return obj;
            }
        }
        return std::nullopt;
    }

    auto ClampThreat(long long const t) -> int
    {
        return (t < 1 || t > 10) ? 5 : static_cast<int>(t);
    }

    auto Truncate(std::string notes) -> std::string
    {
        if (notes.size() > uno::net::MaxNotesLength)
        {
            // never split a UTF-8 sequence: back up over continuation bytes
            size_t cut = uno::net::MaxNotesLength;
            while (cut > 0 && (static_cast<unsigned char>(notes[cut]) & 0xC0) == 0x80) --cut;
            notes.resize(cut);
            notes += "...";
        }
        return notes;
    }

    auto StructuredAnalysis(json const& j) -> std::optional<uno::net::GameAnalysis>
    {
        if (!j.is_object()) return std::nullopt;
        if (!j.contains("best_cards_to_keep") && !j.contains("opponent_threat_level") && !j.contains("strategic_notes"))
            return std::nullopt;

        uno::net::GameAnalysis a{};
        if (auto const it = j.find("best_cards_to_keep"); it != j.end() && it->is_array())
        {
            for (json const& id : *it)
            {
                if (auto s = uno::net::IdFromJson(id)) a.keep.push_back(std::move(*s));
            }
        }
        if (auto const it = j.find("opponent_threat_level"); it != j.end() && it->is_number())
            a.threat = ClampThreat(it->get<long long>());
        if (auto const it = j.find("strategic_notes"); it != j.end() && it->is_string())
            a.notes = Truncate(it->get<std::string>());
        else
            a.notes = "No strategic notes provided";
        return a;
    }
}

namespace uno::net
{
    auto StripThinkTags(std::string_view raw) -> std::string
    {
        std::string s(raw);
        EraseAll(s, "<think>");
        EraseAll(s, "</think>");
        return std::string(core::util::Trim(s));
    }

    auto ExtractJsonObject(std::string_view text) -> std::optional<std::string>
    {
        if (auto fenced = FencedObject(text)) return fenced;
        for (auto pos = text.find('{'); pos != std::string_view::npos; pos = text.find('{', pos + 1))
        {
            if (auto obj = ObjectAt(text, pos)) return obj;
        }
        return std::nullopt;
    }

    auto ParseMove(std::string_view raw) -> std::expected<core::Move, ParseError>
    {
        std::string const text = StripThinkTags(raw);
        std::optional<std::string> const obj = ExtractJsonObject(text);
        if (!obj)
            return std::unexpected(ParseError{"no JSON object in proposer response"});

        json const j = json::parse(*obj, nullptr, /*allow_exceptions*/ false);
        if (j.is_discarded())
            return std::unexpected(ParseError{std::format("invalid JSON in proposer response: {}", *obj)});

        return MoveFromJson(j);
    }

    auto ParseAnalysis(std::string_view raw) -> GameAnalysis
    {
        std::string const text = StripThinkTags(raw);

        if (std::optional<std::string> const obj = ExtractJsonObject(text))
        {
            json const j = json::parse(*obj, nullptr, /*allow_exceptions*/ false);
            if (!j.is_discarded())
            {
                if (auto a = StructuredAnalysis(j)) return *a;
            }
        }

        GameAnalysis a{};
        auto const flags = std::regex::ECMAScript | std::regex::icase;
        static std::array<std::regex, 5> const patterns{
            std::regex(R"(keep\s+(card_?\d+))", flags),
            std::regex(R"(save\s+(card_?\d+))", flags),
            std::regex(R"(hold\s+(card_?\d+))", flags),
            std::regex(R"(card_(\d+))", flags),
            std::regex(R"(card(\d+))", flags),
        };
        for (std::regex const& re : patterns)
        {
            for (std::sregex_iterator it(text.begin(), text.end(), re), end; it != end; ++it)
            {
                std::string m = (*it)[1].str();
                std::string id = core::util::Lower(m).starts_with("card") ? m : std::format("card_{}", m);
                if (std::ranges::find(a.keep, id) == a.keep.end()) a.keep.push_back(std::move(id));
            }
        }

        static std::regex const threat_re(R"(threat\s*level[:\s]*(\d+))", flags);
        if (std::smatch m; std::regex_search(text, m, threat_re))
        {
            std::string const digits = m[1].str();
            long long t{};
            auto const [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), t);
            a.threat = (ec == std::errc{}) ? ClampThreat(t) : 5;
        }

        a.notes = Truncate(text);
        return a;
    }
}
