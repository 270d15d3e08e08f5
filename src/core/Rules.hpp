//
// Rules.hpp
//

#ifndef LTCG_RULES_HPP
#define LTCG_RULES_HPP

#include <vector>

#include "Commands.hpp"
#include "Events.hpp"
#include "Exception.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace ltcg::core
{
    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(GameState const& s, Seat seat, Command const& c) const -> CheckResult = 0;

        // Events for a command Validate accepted. Never empty for an accepted command.
        virtual auto Emit(GameState const& s, Seat seat, Command const& c) const -> EventList = 0;

        // State-based follow-ups for a state that just absorbed `batch`.
        virtual auto Derive(GameState const& s, EventList const& batch) const -> EventList = 0;

        // Superset of the legal commands; LegalMoves filters it through Validate.
        virtual auto Candidates(GameState const& s, Seat seat) const -> std::vector<Command> = 0;
    };

    class DuelRules final : public Rules
    {
    public:
        auto Validate(GameState const& s, Seat seat, Command const& c) const -> CheckResult override;
        auto Emit(GameState const& s, Seat seat, Command const& c) const -> EventList override;
        auto Derive(GameState const& s, EventList const& batch) const -> EventList override;
        auto Candidates(GameState const& s, Seat seat) const -> std::vector<Command> override;
    };
}

#endif //LTCG_RULES_HPP
