//
// AuditLogger.hpp
//

#ifndef UNOARBITER_AUDITLOGGER_HPP
#define UNOARBITER_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Game.hpp"
#include "../core/Judge.hpp"
#include "../core/Actions.hpp"
#include "../core/Types.hpp"

namespace uno::core::debug
{
    // Plain-text decision transcripts, one block per request. Not thread-safe; callers serialise.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        auto IsOpen() const -> bool { return out_.is_open(); }

        // Request header: provider, hand, top card, direction, pending draw
        auto start(GameState const& game, std::string const& provider) -> void;

        // One line per tagged attempt outcome (1-based index)
        auto attempt(std::size_t index, AttemptVerdict const& v) -> void;

        // Final move, how it was reached, attempts used
        auto decision(Decision const& d) -> void;

        // Manual flush
        auto flush() -> void;

    private:
        std::ofstream out_;
    };
}

#endif //UNOARBITER_AUDITLOGGER_HPP
