//
// RuleModules.hpp
//

#ifndef LTCG_RULE_MODULES_HPP
#define LTCG_RULE_MODULES_HPP

#include <span>
#include <vector>

#include "Cards.hpp"
#include "Commands.hpp"
#include "Events.hpp"
#include "Exception.hpp"
#include "State.hpp"

// Per-domain validators and emitters behind DuelRules. Each Check* is the single
// source of truth for its command: Decide and LegalMoves both go through it.
// Emit* assumes the matching Check* passed.
namespace ltcg::core::rules
{
    using error::ValidateResult;

    // ---------- Summoning (SummonRules.cpp) ----------
    auto TributesRequired(GameState const& s, CardDefinition const& def) -> std::uint32_t;

    auto CheckSummon(GameState const& s, Seat seat, SummonCmd const& c) -> ValidateResult;
    auto EmitSummon(GameState const& s, Seat seat, SummonCmd const& c) -> EventList;
    auto CheckSetMonster(GameState const& s, Seat seat, SetMonsterCmd const& c) -> ValidateResult;
    auto EmitSetMonster(GameState const& s, Seat seat, SetMonsterCmd const& c) -> EventList;
    auto CheckFlipSummon(GameState const& s, Seat seat, FlipSummonCmd const& c) -> ValidateResult;
    auto EmitFlipSummon(GameState const& s, Seat seat, FlipSummonCmd const& c) -> EventList;
    auto CheckChangePosition(GameState const& s, Seat seat, ChangePositionCmd const& c) -> ValidateResult;
    auto EmitChangePosition(GameState const& s, Seat seat, ChangePositionCmd const& c) -> EventList;

    // ---------- Combat (CombatRules.cpp) ----------
    auto CheckDeclareAttack(GameState const& s, Seat seat, DeclareAttackCmd const& c) -> ValidateResult;
    auto EmitDeclareAttack(GameState const& s, Seat seat, DeclareAttackCmd const& c) -> EventList;

    // ---------- Spells, traps and monster effects (SpellTrapRules.cpp) ----------
    // Activation choices a spell or trap offers: one per effect, a single one when it has
    // none. Ritual spells always offer one.
    auto ActivationCount(CardDefinition const& def) -> std::uint32_t;
    // The effect a spell or trap runs when activated with effect_index, if any.
    auto ActivationEffect(CardDefinition const& def, std::uint32_t effect_index) -> EffectDefinition const*;
    auto ActivationTargetsOk(GameState const& s, Seat seat, CardDefinition const& def, std::uint32_t effect_index,
                             std::span<CardId const> targets) -> bool;
    auto ActivationTargetChoices(GameState const& s, Seat seat, CardDefinition const& def,
                                 std::uint32_t effect_index) -> std::vector<CardIds>;
    // targets[0] is a monster in hand; the rest are face-up own monsters in board order
    // whose levels add up to at least its level.
    auto CheckRitualTargets(GameState const& s, Seat seat, std::span<CardId const> targets) -> ValidateResult;
    auto RitualTargetChoices(GameState const& s, Seat seat) -> std::vector<CardIds>;
    auto EffectTargetChoices(GameState const& s, Seat seat, EffectDefinition const& eff) -> std::vector<CardIds>;

    // Link or immediate resolution of a spell/trap: equip, effect (unless negated),
    // then the trip to the graveyard for cards that do not stay on the field.
    auto ResolveCardEffect(GameState const& s, Seat seat, CardId const& card_id, std::uint32_t effect_index,
                           std::span<CardId const> targets, bool negated) -> EventList;

    // CHAIN_STARTED (when none is open), CHAIN_LINK_ADDED and the activation event.
    auto ChainActivation(GameState const& s, Seat seat, CardId const& card_id, std::uint32_t effect_index,
                         CardIds const& targets) -> EventList;

    auto CostEvents(GameState const& s, Seat seat, CardId const& card_id, CostDefinition const& cost) -> EventList;

    auto CheckSetSpellTrap(GameState const& s, Seat seat, SetSpellTrapCmd const& c) -> ValidateResult;
    auto EmitSetSpellTrap(GameState const& s, Seat seat, SetSpellTrapCmd const& c) -> EventList;
    auto CheckActivateSpell(GameState const& s, Seat seat, ActivateSpellCmd const& c) -> ValidateResult;
    auto EmitActivateSpell(GameState const& s, Seat seat, ActivateSpellCmd const& c) -> EventList;
    auto CheckActivateTrap(GameState const& s, Seat seat, ActivateTrapCmd const& c) -> ValidateResult;
    auto EmitActivateTrap(GameState const& s, Seat seat, ActivateTrapCmd const& c) -> EventList;
    auto CheckActivateEffect(GameState const& s, Seat seat, ActivateEffectCmd const& c) -> ValidateResult;
    auto EmitActivateEffect(GameState const& s, Seat seat, ActivateEffectCmd const& c) -> EventList;

    // ---------- Chain (ChainRules.cpp) ----------
    auto CheckChainResponse(GameState const& s, Seat seat, ChainResponseCmd const& c) -> ValidateResult;
    auto EmitChainResponse(GameState const& s, Seat seat, ChainResponseCmd const& c) -> EventList;
    // Pops and resolves the top link of s.
    auto ResolveTopLink(GameState const& s) -> EventList;

    // ---------- Phases (PhaseRules.cpp) ----------
    auto CheckAdvancePhase(GameState const& s, Seat seat, AdvancePhaseCmd const& c) -> ValidateResult;
    auto EmitAdvancePhase(GameState const& s, Seat seat, AdvancePhaseCmd const& c) -> EventList;
    auto CheckEndTurn(GameState const& s, Seat seat, EndTurnCmd const& c) -> ValidateResult;
    auto EmitEndTurn(GameState const& s, Seat seat, EndTurnCmd const& c) -> EventList;
    auto EmitSurrender(GameState const& s, Seat seat, SurrenderCmd const& c) -> EventList;
    // TURN_ENDED, expiring modifiers, TURN_STARTED for the other seat.
    auto TurnHandover(GameState const& s) -> EventList;

    // ---------- Vice and state-based actions (ViceRules.cpp) ----------
    auto BreakdownEvents(GameState const& s) -> EventList;
    auto HandLimitEvents(GameState const& s) -> EventList;
    auto SummonTriggerEvents(GameState const& s, EventList const& batch) -> EventList;
    auto DeriveStateBased(GameState const& s, EventList const& batch) -> EventList;

    // ---------- Lingering stat effects (ContinuousRules.cpp) ----------
    // Every stat change face-up continuous sources currently call for.
    auto DesiredLingering(GameState const& s) -> std::vector<LingeringEffect>;
    // Removals for entries no longer called for, then applications for missing ones.
    auto ContinuousEvents(GameState const& s) -> EventList;
    // Face-up equip spells no monster carries any more.
    auto OrphanedEquipEvents(GameState const& s) -> EventList;

    // ---------- Candidates (LegalMoves.cpp) ----------
    auto CandidateCommands(GameState const& s, Seat seat) -> std::vector<Command>;
} // namespace ltcg::core::rules

#endif //LTCG_RULE_MODULES_HPP
