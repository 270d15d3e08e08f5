//
// LegalMoves.cpp
//

#include "RuleModules.hpp"

#include "Queries.hpp"

namespace ltcg::core::rules
{
    namespace
    {
        auto HandCandidates(GameState const& s, Seat const seat, std::vector<Command>& out) -> void
        {
            SeatState const& ss = s.Of(seat);
            for (CardId const& id : ss.hand)
            {
                CardDefinition const* def = query::DefinitionOf(s, id);
                if (def == nullptr)
                {
                    continue;
                }

                if (def->type == CardType::Monster)
                {
                    std::vector<CardIds> tribute_lists;
                    if (TributesRequired(s, *def) > 0)
                    {
                        for (BoardCard const& b : ss.board)
                        {
                            tribute_lists.push_back({b.card_id});
                        }
                    }
                    else
                    {
                        tribute_lists.emplace_back();
                    }

                    for (Position const pos : {Position::Attack, Position::Defense})
                    {
                        for (CardIds const& tributes : tribute_lists)
                        {
                            out.emplace_back(SummonCmd{id, pos, tributes});
                        }
                    }
                    out.emplace_back(SetMonsterCmd{id});
                    continue;
                }

                out.emplace_back(SetSpellTrapCmd{id});
                if (def->type == CardType::Spell)
                {
                    for (std::uint32_t i{}; i < ActivationCount(*def); ++i)
                    {
                        for (CardIds& targets : ActivationTargetChoices(s, seat, *def, i))
                        {
                            out.emplace_back(ActivateSpellCmd{id, std::move(targets), i});
                        }
                    }
                }
            }
        }

        auto BoardCandidates(GameState const& s, Seat const seat, std::vector<Command>& out) -> void
        {
            SeatState const& opp = s.Of(Opponent(seat));
            for (BoardCard const& c : s.Of(seat).board)
            {
                out.emplace_back(FlipSummonCmd{c.card_id});
                out.emplace_back(ChangePositionCmd{c.card_id});

                if (CardDefinition const* def = query::DefinitionOf(s, c.card_id))
                {
                    for (std::size_t i{}; i < def->effects.size(); ++i)
                    {
                        for (CardIds& targets : EffectTargetChoices(s, seat, def->effects[i]))
                        {
                            out.emplace_back(ActivateEffectCmd{c.card_id, static_cast<std::uint32_t>(i), std::move(targets)});
                        }
                    }
                }

                out.emplace_back(DeclareAttackCmd{c.card_id, ""});
                for (BoardCard const& t : opp.board)
                {
                    out.emplace_back(DeclareAttackCmd{c.card_id, t.card_id});
                }
            }
        }

        auto ZoneCandidates(GameState const& s, Seat const seat, std::vector<Command>& out) -> void
        {
            for (SpellTrapCard const& c : s.Of(seat).spell_trap_zone)
            {
                CardDefinition const* def = query::DefinitionOf(s, c.card_id);
                if (def == nullptr)
                {
                    continue;
                }
                for (std::uint32_t i{}; i < ActivationCount(*def); ++i)
                {
                    for (CardIds const& targets : ActivationTargetChoices(s, seat, *def, i))
                    {
                        if (def->type == CardType::Spell)
                        {
                            out.emplace_back(ActivateSpellCmd{c.card_id, targets, i});
                        }
                        else
                        {
                            out.emplace_back(ActivateTrapCmd{c.card_id, targets, i});
                        }
                        out.emplace_back(ChainResponseCmd{c.card_id, targets, false, i});
                    }
                }
            }
        }
    }

    auto CandidateCommands(GameState const& s, Seat const seat) -> std::vector<Command>
    {
        std::vector<Command> out;
        out.emplace_back(SurrenderCmd{});
        out.emplace_back(AdvancePhaseCmd{});
        out.emplace_back(EndTurnCmd{});
        out.emplace_back(ChainResponseCmd{});

        HandCandidates(s, seat, out);
        BoardCandidates(s, seat, out);
        ZoneCandidates(s, seat, out);
        return out;
    }
} // namespace ltcg::core::rules
