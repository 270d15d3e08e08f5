//
// Queries.hpp
//

#ifndef LTCG_QUERIES_HPP
#define LTCG_QUERIES_HPP

#include <optional>
#include <span>
#include <string>
#include <vector>

#include "Cards.hpp"
#include "State.hpp"
#include "Types.hpp"

// Read-only lookups over a GameState shared by the rules modules, the
// interpreter and the projection code.
namespace ltcg::core::query
{
    struct Location
    {
        Seat seat{};
        ZoneKind zone{};
        std::size_t index{};
    };

    // Definition for an instance id; falls back to treating the id as a definition id.
    auto DefinitionOf(GameState const& s, std::string_view card_id) -> CardDefinition const*;
    auto DefinitionIdOf(GameState const& s, std::string_view card_id) -> DefinitionId;

    auto FindBoardCard(GameState const& s, Seat seat, std::string_view card_id) -> BoardCard const*;
    auto FindSpellTrap(GameState const& s, Seat seat, std::string_view card_id) -> SpellTrapCard const*;

    // Board lookup searching host then away.
    auto FindOnAnyBoard(GameState const& s, std::string_view card_id) -> std::optional<Location>;

    // Searches hand, graveyard, banished, board, spell/trap zone, field (host then away).
    // Decks are skipped unless include_deck is set.
    auto Locate(GameState const& s, std::string_view card_id, bool include_deck = false)
        -> std::optional<Location>;

    auto InHand(GameState const& s, Seat seat, std::string_view card_id) -> bool;

    auto EffectiveAttack(GameState const& s, BoardCard const& c) -> std::int32_t;
    auto EffectiveDefense(GameState const& s, BoardCard const& c) -> std::int32_t;

    auto HasRestriction(GameState const& s, Seat seat, Restriction r) -> bool;
    auto FaceUpMonsterCount(GameState const& s, Seat seat) -> std::size_t;

    // OPT keys per instance, HOPT keys per definition.
    auto OptKey(std::string_view card_id, EffectDefinition const& eff) -> std::string;
    auto HoptKey(GameState const& s, std::string_view card_id, EffectDefinition const& eff) -> std::string;
    auto EffectUsable(GameState const& s, std::string_view card_id, EffectDefinition const& eff) -> bool;

    // Every card id a filter admits from seat's perspective. Face-down cards are never
    // candidates. Without a zone the board is searched.
    auto TargetCandidates(GameState const& s, Seat seat, TargetFilter const& filter) -> CardIds;

    // Exact-count target validation shared by Decide and LegalMoves. Targets are distinct and
    // listed in the order TargetCandidates yields them, matching what Combinations offers.
    auto TargetsSatisfy(GameState const& s, Seat seat, EffectDefinition const& eff,
                        std::span<CardId const> targets) -> bool;

    // Every distinct combination of exactly `count` ids in candidate order.
    auto Combinations(CardIds const& candidates, std::size_t count) -> std::vector<CardIds>;

    auto CanPayCost(GameState const& s, Seat seat, std::string_view card_id,
                    CostDefinition const& cost) -> bool;

    // pay_lp amount after the seat's active cost modifiers.
    auto AdjustedLpCost(GameState const& s, Seat seat, CardType type, std::int32_t base) -> std::int32_t;
} // namespace ltcg::core::query

#endif //LTCG_QUERIES_HPP
