//
// Operations.hpp
//

#ifndef LTCG_OPERATIONS_HPP
#define LTCG_OPERATIONS_HPP

#include <span>

#include "Cards.hpp"
#include "Events.hpp"
#include "State.hpp"

namespace ltcg::core
{
    // Value of an amount source against the current state.
    auto ResolveAmount(GameState const& s, Amount const& amount, Seat activating,
                       std::span<CardId const> targets) -> std::int32_t;

    // Events produced by one action. Knows nothing about triggers or chains beyond
    // reading the current chain for negate. Unresolvable targets are skipped.
    auto ExecuteAction(GameState const& s, EffectAction const& action, Seat activating,
                       CardId const& source, std::span<CardId const> targets) -> EventList;

    // Runs every action of an effect in order, folding between actions so later actions
    // see the results of earlier ones. Stat boosts of a continuous effect are skipped; the
    // lingering layer owns them.
    auto ExecuteEffect(GameState const& s, EffectDefinition const& effect, Seat activating,
                       CardId const& source, std::span<CardId const> targets) -> EventList;
} // namespace ltcg::core

#endif //LTCG_OPERATIONS_HPP
