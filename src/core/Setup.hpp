//
// Setup.hpp
//

#ifndef LTCG_SETUP_HPP
#define LTCG_SETUP_HPP

#include <vector>

#include "Cards.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace ltcg::core
{
    // Throws error::ConfigError for zero slot counts, zero thresholds or non-positive LP.
    auto Validate(EngineConfig const& config) -> void;

    // Assigns "h:<i>:<def>" / "a:<i>:<def>" instance ids in deck-list order, shuffles both
    // decks from config.seed and deals the opening hands. Turn 1 starts in the draw phase.
    // Throws error::RegistryError for a deck entry the registry does not know.
    auto CreateInitialState(EngineConfig const& config,
                            RegistryCSP registry,
                            std::vector<DefinitionId> const& host_deck,
                            std::vector<DefinitionId> const& away_deck,
                            Seat first_player = Seat::Host) -> GameState;
} // namespace ltcg::core

#endif //LTCG_SETUP_HPP
