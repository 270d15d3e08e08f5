//
// ViceRules.cpp
//

#include "RuleModules.hpp"

#include <algorithm>
#include <array>

#include "Evolve.hpp"
#include "Operations.hpp"
#include "Queries.hpp"

namespace ltcg::core::rules
{
    namespace
    {
        auto Append(EventList& out, EventList more) -> void
        {
            out.insert(out.end(), std::make_move_iterator(more.begin()), std::make_move_iterator(more.end()));
        }

        auto ChangesVice(EventList const& batch) -> bool
        {
            return std::ranges::any_of(batch, [](Event const& e)
            {
                return Holds<ViceCounterAdded>(e) || Holds<ViceCounterRemoved>(e);
            });
        }

        // Card id and the effect type it fires for a summon-like event.
        auto SummonTrigger(Event const& e) -> std::optional<std::pair<CardId, EffectType>>
        {
            if (auto const* ev = std::get_if<MonsterSummoned>(&e))
                return std::pair{ev->card_id, EffectType::OnSummon};
            if (auto const* ev = std::get_if<SpecialSummoned>(&e))
                return std::pair{ev->card_id, EffectType::OnSummon};
            if (auto const* ev = std::get_if<FlipSummoned>(&e))
                return std::pair{ev->card_id, EffectType::Flip};
            if (auto const* ev = std::get_if<RitualSummoned>(&e))
                return std::pair{ev->card_id, EffectType::OnSummon};
            return std::nullopt;
        }
    }

    auto BreakdownEvents(GameState const& s) -> EventList
    {
        EventList out;
        for (Seat const seat : std::array{Seat::Host, Seat::Away})
        {
            for (BoardCard const& c : s.Of(seat).board)
            {
                if (c.vice_counters < s.config.breakdown_threshold)
                {
                    continue;
                }
                out.emplace_back(BreakdownTriggered{seat, c.card_id});
                out.emplace_back(CardDestroyed{c.card_id, DestroyReason::Breakdown});
                out.emplace_back(CardSentToGraveyard{c.card_id, ZoneKind::Board, seat});
            }
        }
        return out;
    }

    auto HandLimitEvents(GameState const& s) -> EventList
    {
        Seat const seat = s.current_turn_player;
        CardIds const& hand = s.Of(seat).hand;
        EventList out;
        for (std::size_t i = hand.size(); i > s.config.max_hand_size; --i)
        {
            out.emplace_back(CardSentToGraveyard{hand[i - 1], ZoneKind::Hand, seat});
        }
        return out;
    }

    auto SummonTriggerEvents(GameState const& s, EventList const& batch) -> EventList
    {
        GameState now = s;
        EventList out;
        for (Event const& e : batch)
        {
            auto const trigger = SummonTrigger(e);
            if (!trigger)
            {
                continue;
            }
            auto const& [card_id, type] = *trigger;
            auto const loc = query::FindOnAnyBoard(now, card_id);
            CardDefinition const* def = query::DefinitionOf(now, card_id);
            if (!loc || def == nullptr)
            {
                continue;
            }

            for (std::size_t i{}; i < def->effects.size(); ++i)
            {
                EffectDefinition const& eff = def->effects[i];
                if (eff.type != type || !query::EffectUsable(now, card_id, eff))
                {
                    continue;
                }

                // triggers pick the first admissible targets; too few means the effect fizzles
                std::size_t const need = eff.target_count.value_or(0);
                CardIds targets = query::TargetCandidates(now, loc->seat, eff.target_filter.value_or(TargetFilter{}));
                if (targets.size() < need)
                {
                    continue;
                }
                targets.resize(need);

                EventList step{EffectActivated{loc->seat, card_id, static_cast<std::uint32_t>(i), targets}};
                now = Evolve(now, step);
                EventList actions = ExecuteEffect(now, eff, loc->seat, card_id, targets);
                now = Evolve(now, actions);

                Append(out, std::move(step));
                Append(out, std::move(actions));
            }
        }
        return out;
    }

    auto DeriveStateBased(GameState const& s, EventList const& batch) -> EventList
    {
        if (s.game_over)
        {
            return {};
        }

        SeatState const& host = s.Of(Seat::Host);
        SeatState const& away = s.Of(Seat::Away);
        if (host.life_points <= 0)
        {
            return {GameEnded{Seat::Away, WinReason::LpZero}};
        }
        if (away.life_points <= 0)
        {
            return {GameEnded{Seat::Host, WinReason::LpZero}};
        }

        GameState now = s;
        EventList out;

        if (now.current_phase == Phase::BreakdownCheck || ChangesVice(batch))
        {
            EventList breakdowns = BreakdownEvents(now);
            now = Evolve(now, breakdowns);
            Append(out, std::move(breakdowns));
            if (now.game_over)
            {
                return out;
            }
        }

        if (now.current_phase == Phase::End)
        {
            EventList discards = HandLimitEvents(now);
            now = Evolve(now, discards);
            Append(out, std::move(discards));
        }

        EventList triggers = SummonTriggerEvents(now, batch);
        now = Evolve(now, triggers);
        Append(out, std::move(triggers));

        EventList orphans = OrphanedEquipEvents(now);
        now = Evolve(now, orphans);
        Append(out, std::move(orphans));

        Append(out, ContinuousEvents(now));
        return out;
    }
} // namespace ltcg::core::rules
