//
// Player.hpp
//

#ifndef LTCG_PLAYER_HPP
#define LTCG_PLAYER_HPP

#include <span>

#include "Commands.hpp"
#include "State.hpp"

namespace ltcg::core
{
    class Player
    {
    public:
        virtual ~Player() = default;

        // Called by whatever drives the duel (self-play loop, local adapter).
        // `legal` is never empty while the game is running.
        virtual auto Play(PlayerView const& view, std::span<Command const> legal) -> Command = 0;
    };
}
#endif //LTCG_PLAYER_HPP
