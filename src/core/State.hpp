//
// State.hpp
//

#ifndef LTCG_STATE_HPP
#define LTCG_STATE_HPP

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "Cards.hpp"
#include "Types.hpp"

namespace ltcg::core
{
    struct StatBoosts
    {
        std::int32_t attack{};
        std::int32_t defense{};
        auto operator==(StatBoosts const&) const -> bool = default;
    };

    struct BoardCard
    {
        CardId card_id;
        DefinitionId definition_id;
        Position position{Position::Attack};
        bool face_down{false};
        bool can_attack{false};
        bool has_attacked_this_turn{false};
        bool changed_position_this_turn{false};
        std::uint32_t vice_counters{};
        StatBoosts temporary_boosts{};
        CardIds equipped_cards;
        std::uint32_t turn_summoned{};
        auto operator==(BoardCard const&) const -> bool = default;
    };

    struct SpellTrapCard
    {
        CardId card_id;
        DefinitionId definition_id;
        bool face_down{true};
        bool activated{false};
        bool is_field_spell{false};
        auto operator==(SpellTrapCard const&) const -> bool = default;
    };

    struct ChainLink
    {
        CardId card_id;
        std::uint32_t effect_index{};
        Seat activating_seat{};
        CardIds targets;
        auto operator==(ChainLink const&) const -> bool = default;
    };

    struct TemporaryModifier
    {
        CardId card_id;
        StatField field{};
        std::int32_t amount{};
        Expiry expires{};
        CardId source;
        std::optional<std::uint32_t> expires_on_turn{};
        auto operator==(TemporaryModifier const&) const -> bool = default;
    };

    struct CostModifier
    {
        Seat seat{};
        CostCardType card_type{};
        CostOperation operation{};
        std::int32_t amount{};
        CardId source;
        std::uint32_t expires_on_turn{};
        auto operator==(CostModifier const&) const -> bool = default;
    };

    struct TurnRestriction
    {
        Seat seat{};
        Restriction restriction{};
        CardId source;
        std::uint32_t expires_on_turn{};
        auto operator==(TurnRestriction const&) const -> bool = default;
    };

    struct TopDeckView
    {
        CardIds card_ids;
        CardId source;
        std::uint32_t viewed_at_turn{};
        auto operator==(TopDeckView const&) const -> bool = default;
    };

    // Stat change held in place by a face-up source (equip, field spell, continuous card).
    // Reconciled after every batch; it goes away with its source or its target.
    struct LingeringEffect
    {
        CardId source;
        Seat source_seat{};
        CardId target;
        StatField field{};
        std::int32_t amount{};
        auto operator==(LingeringEffect const&) const -> bool = default;
    };

    struct SeatState
    {
        CardIds hand;
        std::vector<BoardCard> board;
        std::vector<SpellTrapCard> spell_trap_zone;
        std::optional<SpellTrapCard> field_spell{};
        CardIds deck; // top = index 0
        CardIds graveyard;
        CardIds banished;
        std::int32_t life_points{constants::StartingLp};
        std::uint32_t breakdowns_caused{};
        bool normal_summoned_this_turn{false};
        std::optional<TopDeckView> top_deck_view{};
        auto operator==(SeatState const&) const -> bool = default;
    };

    // Immutable duel snapshot. Folding events copies it; nothing edits a published state.
    struct GameState
    {
        EngineConfig config{};
        RegistryCSP registry{};
        std::map<CardId, DefinitionId> instance_to_definition;

        std::array<SeatState, 2> seats{};

        Seat current_turn_player{Seat::Host};
        std::uint32_t turn_number{1};
        Phase current_phase{Phase::Draw};

        std::vector<ChainLink> current_chain;
        std::vector<std::uint32_t> negated_links;
        std::optional<Seat> current_priority_player{};
        std::optional<Seat> current_chain_passer{};

        std::vector<TemporaryModifier> temporary_modifiers;
        std::vector<LingeringEffect> lingering_effects;
        std::vector<CostModifier> cost_modifiers;
        std::vector<TurnRestriction> turn_restrictions;
        std::vector<std::string> opt_used_this_turn;
        std::vector<std::string> hopt_used_effects;

        bool game_over{false};
        std::optional<Seat> winner{};
        std::optional<WinReason> win_reason{};

        auto Of(Seat const s) -> SeatState& { return seats[static_cast<std::size_t>(s)]; }
        auto Of(Seat const s) const -> SeatState const& { return seats[static_cast<std::size_t>(s)]; }
        auto ChainOpen() const noexcept -> bool { return !current_chain.empty(); }
    };

    // Seat-scoped projection handed to the boundary.
    struct PlayerView
    {
        Seat my_seat{};
        std::map<CardId, DefinitionId> instance_definitions;

        CardIds hand;
        std::uint32_t hand_count{};
        std::vector<BoardCard> board;
        std::vector<SpellTrapCard> spell_trap_zone;
        std::optional<SpellTrapCard> field_spell{};
        CardIds graveyard;
        CardIds banished;
        std::int32_t life_points{};
        std::uint32_t deck_count{};
        std::uint32_t breakdowns_caused{};

        std::uint32_t opponent_hand_count{};
        std::vector<BoardCard> opponent_board;
        std::vector<SpellTrapCard> opponent_spell_trap_zone;
        std::optional<SpellTrapCard> opponent_field_spell{};
        CardIds opponent_graveyard;
        CardIds opponent_banished;
        std::int32_t opponent_life_points{};
        std::uint32_t opponent_deck_count{};
        std::uint32_t opponent_breakdowns_caused{};

        Seat current_turn_player{};
        std::optional<Seat> current_priority_player{};
        std::uint32_t turn_number{};
        Phase current_phase{};
        std::vector<ChainLink> current_chain;
        bool normal_summoned_this_turn{false};
        std::uint32_t max_board_slots{};
        std::uint32_t max_spell_trap_slots{};
        bool game_over{false};
        std::optional<Seat> winner{};
        std::optional<WinReason> win_reason{};
        std::optional<CardIds> top_deck_view{};
    };
} // namespace ltcg::core

#endif //LTCG_STATE_HPP
