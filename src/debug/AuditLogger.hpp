//
// AuditLogger.hpp
//

#ifndef LTCG_AUDITLOGGER_HPP
#define LTCG_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Commands.hpp"
#include "../core/Events.hpp"
#include "../core/State.hpp"
#include "../core/Types.hpp"

namespace ltcg::core::debug
{
    // Plain-text duel transcript: header, one block per submitted command, footer.
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

        // Session header (seed, first player, deck and hand sizes)
        auto start(GameState const& s) -> void;

        // Per command: turn/phase context, the acting seat and the command
        auto command(GameState const& before, Seat actor, Command const& c) -> void;

        // Events the command produced, derived follow-ups included; empty = rejected
        auto events(EventList const& events) -> void;

        // Game end footer (winner and reason, or "none" if cut short)
        auto end(GameState const& s) -> void;

        // Manual flush
        auto flush() -> void;

    private:
        std::ofstream out_;
    };
}

#endif //LTCG_AUDITLOGGER_HPP
