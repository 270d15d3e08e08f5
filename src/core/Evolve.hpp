//
// Evolve.hpp
//

#ifndef LTCG_EVOLVE_HPP
#define LTCG_EVOLVE_HPP

#include "Events.hpp"
#include "State.hpp"

namespace ltcg::core
{
    // Applies one event to a state owned by the caller. Events referring to cards that
    // are not where the event says are applied to wherever the card currently is.
    auto ApplyEvent(GameState& s, Event const& e) -> void;

    // Folds events into a copy of s; the input is never modified.
    auto Evolve(GameState const& s, EventList const& events) -> GameState;
} // namespace ltcg::core

#endif //LTCG_EVOLVE_HPP
