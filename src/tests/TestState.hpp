//
// TestState.hpp
//

#ifndef LTCG_TEST_STATE_HPP
#define LTCG_TEST_STATE_HPP

#include <format>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../core/DemoCatalog.hpp"
#include "../core/Engine.hpp"
#include "../core/Rules.hpp"
#include "../core/State.hpp"

namespace ltcg::test
{
    using namespace ltcg::core;

    // Empty duel at turn 2 with the host to move; zones are filled by the Add* helpers.
    inline auto MakeState(Phase const phase = Phase::Main, std::uint32_t const turn = 2) -> GameState
    {
        GameState s;
        s.registry = demo::Registry();
        s.turn_number = turn;
        s.current_phase = phase;
        s.current_turn_player = Seat::Host;
        return s;
    }

    inline auto WithExtraCards(GameState s, std::vector<CardDefinition> const& extra) -> GameState
    {
        std::vector<CardDefinition> defs = demo::Cards();
        defs.insert(defs.end(), extra.begin(), extra.end());
        s.registry = std::make_shared<CardRegistry const>(std::move(defs));
        return s;
    }

    inline auto NewId(GameState& s, Seat const seat, DefinitionId const& def) -> CardId
    {
        CardId id = std::format("{}:{}:{}", seat == Seat::Host ? "h" : "a", s.instance_to_definition.size(), def);
        s.instance_to_definition.emplace(id, def);
        return id;
    }

    inline auto AddToHand(GameState& s, Seat const seat, DefinitionId const& def) -> CardId
    {
        CardId id = NewId(s, seat, def);
        s.Of(seat).hand.push_back(id);
        return id;
    }

    inline auto AddToDeck(GameState& s, Seat const seat, DefinitionId const& def) -> CardId
    {
        CardId id = NewId(s, seat, def);
        s.Of(seat).deck.push_back(id);
        return id;
    }

    inline auto AddToGraveyard(GameState& s, Seat const seat, DefinitionId const& def) -> CardId
    {
        CardId id = NewId(s, seat, def);
        s.Of(seat).graveyard.push_back(id);
        return id;
    }

    // A monster that has been on the field since last turn and may attack.
    inline auto AddMonster(GameState& s, Seat const seat, DefinitionId const& def,
                           Position const pos = Position::Attack, bool const face_down = false) -> CardId
    {
        CardId id = NewId(s, seat, def);
        s.Of(seat).board.push_back(BoardCard{
            .card_id = id,
            .definition_id = def,
            .position = pos,
            .face_down = face_down,
            .can_attack = true,
            .turn_summoned = s.turn_number > 0 ? s.turn_number - 1 : 0,
        });
        return id;
    }

    inline auto AddSetCard(GameState& s, Seat const seat, DefinitionId const& def) -> CardId
    {
        CardId id = NewId(s, seat, def);
        s.Of(seat).spell_trap_zone.push_back(SpellTrapCard{.card_id = id, .definition_id = def});
        return id;
    }

    inline auto Board(GameState const& s, Seat const seat, CardId const& id) -> BoardCard const*
    {
        for (BoardCard const& c : s.Of(seat).board)
        {
            if (c.card_id == id)
            {
                return &c;
            }
        }
        return nullptr;
    }

    // Reason the default rules give for rejecting c, nullopt when it is legal.
    inline auto RejectionOf(GameState const& s, Seat const seat, Command const& c)
        -> std::optional<error::RuleViolationCode>
    {
        DuelRules const rules;
        auto const r = rules.Validate(s, seat, c);
        if (r.has_value())
        {
            return std::nullopt;
        }
        return r.error().code;
    }

    // Decide + Settle; an empty event list means the command was rejected.
    inline auto Play(GameState const& s, Seat const seat, Command const& c) -> Settled
    {
        EventList const events = Decide(s, seat, c, false);
        if (events.empty())
        {
            return Settled{s, {}};
        }
        return Settle(s, events);
    }
}

#endif //LTCG_TEST_STATE_HPP
