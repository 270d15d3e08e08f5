//
// Setup.cpp
//

#include "Setup.hpp"

#include <algorithm>
#include <format>
#include <random>

#include "Exception.hpp"

namespace ltcg::core
{
    namespace
    {
        auto BuildDeck(GameState& s, std::vector<DefinitionId> const& list, std::string_view prefix) -> CardIds
        {
            CardIds deck;
            deck.reserve(list.size());
            for (std::size_t i{}; i < list.size(); ++i)
            {
                if (!s.registry->Contains(list[i]))
                {
                    LTCG_THROW(error::Code::Registry, std::format("Deck entry '{}' is not a known card", list[i]));
                }
                CardId id = std::format("{}:{}:{}", prefix, i, list[i]);
                s.instance_to_definition.emplace(id, list[i]);
                deck.push_back(std::move(id));
            }
            return deck;
        }

        auto Deal(SeatState& ss, std::uint32_t const count) -> void
        {
            std::size_t const n = std::min<std::size_t>(count, ss.deck.size());
            ss.hand.assign(ss.deck.begin(), ss.deck.begin() + static_cast<std::ptrdiff_t>(n));
            ss.deck.erase(ss.deck.begin(), ss.deck.begin() + static_cast<std::ptrdiff_t>(n));
        }
    }

    auto Validate(EngineConfig const& config) -> void
    {
        if (config.starting_lp <= 0)
        {
            LTCG_THROW(error::Code::Config, std::format("starting_lp must be positive (got {})", config.starting_lp));
        }
        if (config.max_board_slots == 0 || config.max_spell_trap_slots == 0)
        {
            LTCG_THROW(error::Code::Config, "Board and spell/trap zones need at least one slot");
        }
        if (config.breakdown_threshold == 0 || config.max_breakdowns_to_win == 0)
        {
            LTCG_THROW(error::Code::Config, "Breakdown thresholds must be at least 1");
        }
        if (config.tribute_level_threshold == 0)
        {
            LTCG_THROW(error::Code::Config, "tribute_level_threshold must be at least 1");
        }
    }

    auto CreateInitialState(EngineConfig const& config,
                            RegistryCSP registry,
                            std::vector<DefinitionId> const& host_deck,
                            std::vector<DefinitionId> const& away_deck,
                            Seat const first_player) -> GameState
    {
        Validate(config);
        if (!registry)
        {
            LTCG_THROW(error::Code::Registry, "No card registry supplied");
        }

        GameState s;
        s.config = config;
        s.registry = std::move(registry);
        s.current_turn_player = first_player;

        std::mt19937_64 rng{config.seed};
        SeatState& host = s.Of(Seat::Host);
        SeatState& away = s.Of(Seat::Away);

        host.deck = BuildDeck(s, host_deck, "h");
        away.deck = BuildDeck(s, away_deck, "a");
        std::ranges::shuffle(host.deck, rng);
        std::ranges::shuffle(away.deck, rng);

        for (SeatState* ss : {&host, &away})
        {
            ss->life_points = config.starting_lp;
            Deal(*ss, config.starting_hand_size);
        }
        return s;
    }
} // namespace ltcg::core
