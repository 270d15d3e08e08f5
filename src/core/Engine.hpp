//
// Engine.hpp
//

#ifndef LTCG_ENGINE_HPP
#define LTCG_ENGINE_HPP

#include <vector>

#include "Commands.hpp"
#include "Events.hpp"
#include "Rules.hpp"
#include "State.hpp"

namespace ltcg::core
{
    // Events a command produces, or {} when `rules` rejects it. Rejections are printed
    // unless log_rejections is off.
    auto Decide(Rules const& rules, GameState const& s, Seat seat, Command const& c,
                bool log_rejections = true) -> EventList;
    auto Decide(GameState const& s, Seat seat, Command const& c, bool log_rejections = true) -> EventList;

    // Exactly the candidates Decide accepts, without duplicates. Empty once the game is over.
    auto LegalMoves(Rules const& rules, GameState const& s, Seat seat) -> std::vector<Command>;
    auto LegalMoves(GameState const& s, Seat seat) -> std::vector<Command>;

    struct Settled
    {
        GameState state;
        EventList events; // the input events followed by every derived event
    };

    // Folds events, then folds state-based follow-ups until none are produced.
    auto Settle(Rules const& rules, GameState const& s, EventList const& events) -> Settled;
    auto Settle(GameState const& s, EventList const& events) -> Settled;

    auto Mask(GameState const& s, Seat seat) -> PlayerView;
    // Host-perspective view with both hands reduced to counts.
    auto SpectatorView(GameState const& s) -> PlayerView;
} // namespace ltcg::core

#endif //LTCG_ENGINE_HPP
