//
// Engine.cpp
//

#include "Engine.hpp"

#include <algorithm>
#include <print>

#include "Evolve.hpp"

namespace ltcg::core
{
    namespace
    {
        auto DefaultRules() -> DuelRules const&
        {
            static DuelRules const rules{};
            return rules;
        }

        auto RedactedBoard(BoardCard c) -> BoardCard
        {
            c.definition_id = std::string{constants::HiddenDefinition};
            c.vice_counters = 0;
            c.temporary_boosts = {};
            c.equipped_cards.clear();
            return c;
        }

        auto RedactedSpellTrap(SpellTrapCard c) -> SpellTrapCard
        {
            c.definition_id = std::string{constants::HiddenDefinition};
            return c;
        }

        struct Reveal
        {
            GameState const& s;
            PlayerView& v;

            auto operator()(CardId const& id) const -> void
            {
                auto const it = s.instance_to_definition.find(id);
                if (it != s.instance_to_definition.end())
                {
                    v.instance_definitions.insert(*it);
                }
            }

            auto operator()(CardIds const& ids) const -> void
            {
                for (CardId const& id : ids)
                {
                    (*this)(id);
                }
            }
        };
    }

    auto Decide(Rules const& rules, GameState const& s, Seat const seat, Command const& c,
                bool const log_rejections) -> EventList
    {
        if (auto const ok = rules.Validate(s, seat, c); !ok.has_value())
        {
            if (log_rejections)
            {
                std::print("[ltcg] rejected {} from {}: {}\n", CommandName(c), to_string(seat),
                           error::describe(ok.error()));
            }
            return {};
        }
        EventList events = rules.Emit(s, seat, c);
        LTCG_ASSERT(!events.empty(), std::format("Accepted {} produced no events", CommandName(c)));
        return events;
    }

    auto Decide(GameState const& s, Seat const seat, Command const& c, bool const log_rejections) -> EventList
    {
        return Decide(DefaultRules(), s, seat, c, log_rejections);
    }

    auto LegalMoves(Rules const& rules, GameState const& s, Seat const seat) -> std::vector<Command>
    {
        std::vector<Command> out;
        if (s.game_over)
        {
            return out;
        }
        for (Command& c : rules.Candidates(s, seat))
        {
            if (rules.Validate(s, seat, c).has_value() && !std::ranges::contains(out, c))
            {
                out.push_back(std::move(c));
            }
        }
        return out;
    }

    auto LegalMoves(GameState const& s, Seat const seat) -> std::vector<Command>
    {
        return LegalMoves(DefaultRules(), s, seat);
    }

    auto Settle(Rules const& rules, GameState const& s, EventList const& events) -> Settled
    {
        Settled out{Evolve(s, events), events};
        EventList batch = events;
        for (std::size_t pass{}; pass < constants::MaxDerivePasses; ++pass)
        {
            EventList derived = rules.Derive(out.state, batch);
            if (derived.empty())
            {
                break;
            }
            out.state = Evolve(out.state, derived);
            out.events.insert(out.events.end(), derived.begin(), derived.end());
            batch = std::move(derived);
        }
        return out;
    }

    auto Settle(GameState const& s, EventList const& events) -> Settled
    {
        return Settle(DefaultRules(), s, events);
    }

    auto Mask(GameState const& s, Seat const seat) -> PlayerView
    {
        SeatState const& me = s.Of(seat);
        SeatState const& opp = s.Of(Opponent(seat));

        PlayerView v;
        Reveal const reveal{s, v};
        v.my_seat = seat;

        v.hand = me.hand;
        v.hand_count = static_cast<std::uint32_t>(me.hand.size());
        v.board = me.board;
        v.spell_trap_zone = me.spell_trap_zone;
        v.field_spell = me.field_spell;
        v.graveyard = me.graveyard;
        v.banished = me.banished;
        v.life_points = me.life_points;
        v.deck_count = static_cast<std::uint32_t>(me.deck.size());
        v.breakdowns_caused = me.breakdowns_caused;

        reveal(me.hand);
        reveal(me.graveyard);
        reveal(me.banished);
        for (BoardCard const& c : me.board)
        {
            reveal(c.card_id);
            reveal(c.equipped_cards);
        }
        for (SpellTrapCard const& c : me.spell_trap_zone)
        {
            reveal(c.card_id);
        }
        if (me.field_spell)
        {
            reveal(me.field_spell->card_id);
        }

        v.opponent_hand_count = static_cast<std::uint32_t>(opp.hand.size());
        for (BoardCard const& c : opp.board)
        {
            if (c.face_down)
            {
                v.opponent_board.push_back(RedactedBoard(c));
                continue;
            }
            v.opponent_board.push_back(c);
            reveal(c.card_id);
            reveal(c.equipped_cards);
        }
        for (SpellTrapCard const& c : opp.spell_trap_zone)
        {
            if (c.face_down)
            {
                v.opponent_spell_trap_zone.push_back(RedactedSpellTrap(c));
                continue;
            }
            v.opponent_spell_trap_zone.push_back(c);
            reveal(c.card_id);
        }
        if (opp.field_spell)
        {
            v.opponent_field_spell = opp.field_spell;
            reveal(opp.field_spell->card_id);
        }
        v.opponent_graveyard = opp.graveyard;
        v.opponent_banished = opp.banished;
        v.opponent_life_points = opp.life_points;
        v.opponent_deck_count = static_cast<std::uint32_t>(opp.deck.size());
        v.opponent_breakdowns_caused = opp.breakdowns_caused;
        reveal(opp.graveyard);
        reveal(opp.banished);

        v.current_turn_player = s.current_turn_player;
        v.current_priority_player = s.current_priority_player;
        v.turn_number = s.turn_number;
        v.current_phase = s.current_phase;
        v.current_chain = s.current_chain;
        for (ChainLink const& link : s.current_chain)
        {
            reveal(link.card_id);
        }
        v.normal_summoned_this_turn = me.normal_summoned_this_turn;
        v.max_board_slots = s.config.max_board_slots;
        v.max_spell_trap_slots = s.config.max_spell_trap_slots;
        v.game_over = s.game_over;
        v.winner = s.winner;
        v.win_reason = s.win_reason;

        if (me.top_deck_view && me.top_deck_view->viewed_at_turn + 1 >= s.turn_number)
        {
            v.top_deck_view = me.top_deck_view->card_ids;
            reveal(me.top_deck_view->card_ids);
        }
        return v;
    }

    auto SpectatorView(GameState const& s) -> PlayerView
    {
        PlayerView v = Mask(s, Seat::Host);
        for (CardId const& id : v.hand)
        {
            v.instance_definitions.erase(id);
        }
        v.hand.clear();
        v.top_deck_view.reset();
        SeatState const& host = s.Of(Seat::Host);
        if (host.top_deck_view)
        {
            for (CardId const& id : host.top_deck_view->card_ids)
            {
                if (std::ranges::contains(host.deck, id))
                {
                    v.instance_definitions.erase(id);
                }
            }
        }
        return v;
    }
} // namespace ltcg::core
