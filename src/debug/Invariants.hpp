//
// Invariants.hpp
//

#ifndef LTCG_INVARIANTS_HPP
#define LTCG_INVARIANTS_HPP

#include <algorithm>
#include <format>
#include <string>
#include <unordered_set>
#include <vector>

#include "../core/State.hpp"
#include "../core/Types.hpp"

namespace ltcg::core::debug
{
    // A second layer of checks over a settled state. Returns one message per broken
    // invariant; an empty result means the state is consistent.
    inline auto CheckInvariants(GameState const& s) -> std::vector<std::string>
    {
        std::vector<std::string> broken;
#if LTCG_ENABLE_TEST_HOOKS == false
        (void)s;
#else
        // 1) Every instance lives in exactly one zone
        {
            std::unordered_set<CardId> seen;
            auto push_unique = [&](CardId const& id)
            {
                if (!seen.insert(id).second)
                    broken.push_back(std::format("card {} is in more than one zone", id));
            };

            for (SeatState const& ss : s.seats)
            {
                for (CardId const& id : ss.hand) push_unique(id);
                for (CardId const& id : ss.deck) push_unique(id);
                for (CardId const& id : ss.graveyard) push_unique(id);
                for (CardId const& id : ss.banished) push_unique(id);
                for (BoardCard const& c : ss.board) push_unique(c.card_id);
                for (SpellTrapCard const& c : ss.spell_trap_zone) push_unique(c.card_id);
                if (ss.field_spell) push_unique(ss.field_spell->card_id);
            }

            if (seen.size() != s.instance_to_definition.size())
                broken.push_back(std::format("{} cards in zones but {} instances dealt",
                                             seen.size(), s.instance_to_definition.size()));
        }

        // 2) Zone capacities and settled vice counters
        for (SeatState const& ss : s.seats)
        {
            if (ss.board.size() > s.config.max_board_slots)
                broken.push_back("board over capacity");
            if (ss.spell_trap_zone.size() > s.config.max_spell_trap_slots)
                broken.push_back("spell/trap zone over capacity");
            if (ss.field_spell && !ss.field_spell->is_field_spell)
                broken.push_back("non-field card in the field slot");

            for (BoardCard const& c : ss.board)
            {
                if (!s.game_over && c.vice_counters >= s.config.breakdown_threshold)
                    broken.push_back(std::format("{} survived with {} vice counters", c.card_id, c.vice_counters));
                if (c.face_down && c.position != Position::Defense)
                    broken.push_back(std::format("{} is face-down in attack position", c.card_id));
            }
        }

        // 3) Life points and the terminal flag agree
        bool const lp_out = s.Of(Seat::Host).life_points <= 0 || s.Of(Seat::Away).life_points <= 0;
        if (lp_out && !s.game_over)
            broken.push_back("a seat is at 0 LP but the game is running");
        if (s.game_over != s.winner.has_value() || s.game_over != s.win_reason.has_value())
            broken.push_back("game_over disagrees with winner/win_reason");

        // 4) Priority exists exactly while a chain is open
        if (s.ChainOpen() != s.current_priority_player.has_value())
            broken.push_back("priority holder without a chain (or chain without one)");
        for (std::uint32_t const idx : s.negated_links)
        {
            if (idx >= s.current_chain.size())
                broken.push_back(std::format("negated link {} beyond chain of {}", idx, s.current_chain.size()));
        }

        // 5) Lingering boosts need a face-up source on the field and a target on a board
        if (!s.game_over)
        {
            auto face_up_source = [&](CardId const& id)
            {
                for (SeatState const& ss : s.seats)
                {
                    for (BoardCard const& c : ss.board)
                        if (c.card_id == id) return !c.face_down;
                    for (SpellTrapCard const& c : ss.spell_trap_zone)
                        if (c.card_id == id) return !c.face_down;
                    if (ss.field_spell && ss.field_spell->card_id == id) return !ss.field_spell->face_down;
                }
                return false;
            };
            auto on_board = [&](CardId const& id)
            {
                return std::ranges::any_of(s.seats, [&](SeatState const& ss)
                {
                    return std::ranges::contains(ss.board, id, &BoardCard::card_id);
                });
            };
            for (LingeringEffect const& l : s.lingering_effects)
            {
                if (!face_up_source(l.source))
                    broken.push_back(std::format("lingering boost from {} outlived its source", l.source));
                if (!on_board(l.target))
                    broken.push_back(std::format("lingering boost on {} which is off the board", l.target));
            }
        }
#endif // LTCG_ENABLE_TEST_HOOKS == true
        return broken;
    }
}
#endif //LTCG_INVARIANTS_HPP
