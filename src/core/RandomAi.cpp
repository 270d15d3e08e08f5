//
// RandomAi.cpp
//

#include "RandomAi.hpp"

#include <vector>

#include "Exception.hpp"

namespace ltcg::core
{
    namespace
    {
        auto IsFlow(Command const& c) -> bool
        {
            if (auto const* r = std::get_if<ChainResponseCmd>(&c))
            {
                return r->pass;
            }
            return std::holds_alternative<AdvancePhaseCmd>(c) || std::holds_alternative<EndTurnCmd>(c);
        }
    }

    RandomAI::RandomAI(std::uint64_t const rng_seed) :
        rng_(static_cast<std::mt19937::result_type>(rng_seed)) {}

    // Plays a random card action three times out of four, otherwise moves the game on.
    // Surrenders only when nothing else is legal.
    auto RandomAI::Play(PlayerView const& view, std::span<Command const> legal) -> Command
    {
        (void)view;
        LTCG_ASSERT(!legal.empty(), "RandomAI asked to play with no legal commands");

        std::vector<Command> plays;
        std::vector<Command> flow;
        for (Command const& c : legal)
        {
            if (std::holds_alternative<SurrenderCmd>(c))
                continue;
            (IsFlow(c) ? flow : plays).push_back(c);
        }

        if (plays.empty() && flow.empty())
        {
            return SurrenderCmd{};
        }

        bool const play_card = !plays.empty() && (flow.empty() || std::bernoulli_distribution{0.75}(rng_));
        std::vector<Command> const& from = play_card ? plays : flow;
        return from[pick(from)];
    }
}
