//
// PhaseRules.cpp
//

#include "RuleModules.hpp"

#include <set>
#include <utility>

#include "Evolve.hpp"
#include "Queries.hpp"

namespace
{
    inline auto Viol(ltcg::core::error::RuleViolationCode code) -> ltcg::core::error::RuleViolation
    {
        return ltcg::core::error::RuleViolation{.code = code};
    }
}

namespace ltcg::core::rules
{
    using RVC = error::RuleViolationCode;

    namespace
    {
        auto Append(EventList& out, EventList more) -> void
        {
            out.insert(out.end(), std::make_move_iterator(more.begin()), std::make_move_iterator(more.end()));
        }

        // Appends `more` to `out` and folds it into `s`.
        auto Step(GameState& s, EventList& out, EventList more) -> void
        {
            s = Evolve(s, more);
            Append(out, std::move(more));
        }
    }

    auto TurnHandover(GameState const& s) -> EventList
    {
        EventList out{TurnEnded{s.current_turn_player}};

        std::set<std::pair<CardId, CardId>> seen;
        for (TemporaryModifier const& m : s.temporary_modifiers)
        {
            if (!m.expires_on_turn || *m.expires_on_turn > s.turn_number + 1)
            {
                continue;
            }
            if (seen.emplace(m.card_id, m.source).second)
            {
                out.emplace_back(ModifierExpired{m.card_id, m.source});
            }
        }

        out.emplace_back(TurnStarted{Opponent(s.current_turn_player), s.turn_number + 1});
        return out;
    }

    auto CheckAdvancePhase(GameState const&, Seat, AdvancePhaseCmd const&) -> ValidateResult
    {
        return {};
    }

    auto EmitAdvancePhase(GameState const& s, Seat, AdvancePhaseCmd const&) -> EventList
    {
        if (s.current_phase == Phase::End)
        {
            return TurnHandover(s);
        }

        Seat const seat = s.current_turn_player;
        Phase const from = s.current_phase;
        Phase to = NextPhase(from);
        if (to == Phase::Combat && query::HasRestriction(s, seat, Restriction::DisableBattlePhase))
        {
            to = NextPhase(to);
        }

        EventList out{PhaseChanged{from, to}};
        if (from == Phase::Draw && !query::HasRestriction(s, seat, Restriction::DisableDrawPhase))
        {
            CardIds const& deck = s.Of(seat).deck;
            if (deck.empty())
            {
                out.emplace_back(DeckOut{seat});
            }
            else
            {
                out.emplace_back(CardDrawn{seat, deck.front()});
            }
        }
        return out;
    }

    auto CheckEndTurn(GameState const& s, Seat const seat, EndTurnCmd const&) -> ValidateResult
    {
        if (s.current_phase != Phase::Main2 && s.current_phase != Phase::End)
            return std::unexpected(Viol(RVC::WrongPhase_EndTurnNotAllowed).with_phase(s.current_phase).with_actor(seat));

        return {};
    }

    auto EmitEndTurn(GameState const& s, Seat const seat, EndTurnCmd const&) -> EventList
    {
        if (s.current_phase == Phase::End)
        {
            return EmitAdvancePhase(s, seat, AdvancePhaseCmd{});
        }

        GameState now = s;
        EventList out;

        Step(now, out, {PhaseChanged{Phase::Main2, Phase::BreakdownCheck}});
        Step(now, out, BreakdownEvents(now));
        if (now.game_over)
        {
            return out;
        }

        Step(now, out, {PhaseChanged{Phase::BreakdownCheck, Phase::End}});
        Step(now, out, HandLimitEvents(now));
        Append(out, TurnHandover(now));
        return out;
    }

    auto EmitSurrender(GameState const&, Seat const seat, SurrenderCmd const&) -> EventList
    {
        return {GameEnded{Opponent(seat), WinReason::Surrender}};
    }
} // namespace ltcg::core::rules
