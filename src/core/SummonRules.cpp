//
// SummonRules.cpp
//

#include "RuleModules.hpp"

#include <algorithm>

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
        // Shared by SUMMON and SET_MONSTER: phase, hand, card type and the normal-summon flag.
        auto CheckNormalSummonBase(GameState const& s, Seat const seat, CardId const& id) -> ValidateResult
        {
            if (!IsMainPhase(s.current_phase))
                return std::unexpected(Viol(RVC::WrongPhase_MainRequired).with_phase(s.current_phase).with_actor(seat));

            if (!query::InHand(s, seat, id))
                return std::unexpected(Viol(RVC::Card_NotInHand).with_card(id).with_actor(seat));

            CardDefinition const* def = query::DefinitionOf(s, id);
            if (def == nullptr)
                return std::unexpected(Viol(RVC::Card_UnknownDefinition).with_card(id));

            if (def->type != CardType::Monster)
                return std::unexpected(Viol(RVC::Card_WrongType).with_card(id));

            if (s.Of(seat).normal_summoned_this_turn)
                return std::unexpected(Viol(RVC::Summon_AlreadyNormalSummoned).with_actor(seat));

            return {};
        }

        auto OwnBoardCard(GameState const& s, Seat const seat, CardId const& id) -> std::expected<BoardCard const*, error::RuleViolation>
        {
            if (!IsMainPhase(s.current_phase))
                return std::unexpected(Viol(RVC::WrongPhase_MainRequired).with_phase(s.current_phase).with_actor(seat));

            BoardCard const* card = query::FindBoardCard(s, seat, id);
            if (card == nullptr)
                return std::unexpected(Viol(RVC::Card_NotOnBoard).with_card(id).with_actor(seat));

            return card;
        }
    }

    auto TributesRequired(GameState const& s, CardDefinition const& def) -> std::uint32_t
    {
        return def.level >= s.config.tribute_level_threshold ? 1u : 0u;
    }

    auto CheckSummon(GameState const& s, Seat const seat, SummonCmd const& c) -> ValidateResult
    {
        if (auto base = CheckNormalSummonBase(s, seat, c.card_id); !base)
            return base;

        CardDefinition const& def = *query::DefinitionOf(s, c.card_id);
        std::uint32_t const required = TributesRequired(s, def);
        auto const attempted = static_cast<std::uint32_t>(c.tribute_card_ids.size());

        if (attempted != required)
            return std::unexpected(Viol(RVC::Summon_TributeCountMismatch)
                                   .with_card(c.card_id)
                                   .with_expected(required)
                                   .with_attempted(attempted));

        for (std::size_t i{}; i < c.tribute_card_ids.size(); ++i)
        {
            CardId const& t = c.tribute_card_ids[i];
            BoardCard const* tribute = query::FindBoardCard(s, seat, t);
            bool const duplicate = std::ranges::count(c.tribute_card_ids, t) > 1;
            if (tribute == nullptr || tribute->face_down || duplicate)
                return std::unexpected(Viol(RVC::Summon_TributeInvalid).with_card(t).with_actor(seat));
        }

        auto const board = static_cast<std::uint32_t>(s.Of(seat).board.size());
        if (board - required >= s.config.max_board_slots)
            return std::unexpected(Viol(RVC::Zone_BoardFull).with_actor(seat).with_capacity(s.config.max_board_slots));

        return {};
    }

    auto EmitSummon(GameState const&, Seat const seat, SummonCmd const& c) -> EventList
    {
        EventList out;
        for (CardId const& t : c.tribute_card_ids)
        {
            out.emplace_back(CardSentToGraveyard{t, ZoneKind::Board, seat});
        }
        out.emplace_back(MonsterSummoned{seat, c.card_id, c.position, c.tribute_card_ids});
        return out;
    }

    auto CheckSetMonster(GameState const& s, Seat const seat, SetMonsterCmd const& c) -> ValidateResult
    {
        if (auto base = CheckNormalSummonBase(s, seat, c.card_id); !base)
            return base;

        if (s.Of(seat).board.size() >= s.config.max_board_slots)
            return std::unexpected(Viol(RVC::Zone_BoardFull).with_actor(seat).with_capacity(s.config.max_board_slots));

        return {};
    }

    auto EmitSetMonster(GameState const&, Seat const seat, SetMonsterCmd const& c) -> EventList
    {
        return {MonsterSet{seat, c.card_id}};
    }

    auto CheckFlipSummon(GameState const& s, Seat const seat, FlipSummonCmd const& c) -> ValidateResult
    {
        auto const card = OwnBoardCard(s, seat, c.card_id);
        if (!card)
            return std::unexpected(card.error());

        if (!(*card)->face_down)
            return std::unexpected(Viol(RVC::Summon_FaceDownRequired).with_card(c.card_id));

        if ((*card)->turn_summoned >= s.turn_number)
            return std::unexpected(Viol(RVC::Summon_SameTurn).with_card(c.card_id));

        return {};
    }

    auto EmitFlipSummon(GameState const&, Seat const seat, FlipSummonCmd const& c) -> EventList
    {
        return {FlipSummoned{seat, c.card_id, Position::Attack}};
    }

    auto CheckChangePosition(GameState const& s, Seat const seat, ChangePositionCmd const& c) -> ValidateResult
    {
        auto const card = OwnBoardCard(s, seat, c.card_id);
        if (!card)
            return std::unexpected(card.error());

        if ((*card)->face_down)
            return std::unexpected(Viol(RVC::Position_FaceUpRequired).with_card(c.card_id));

        if ((*card)->changed_position_this_turn)
            return std::unexpected(Viol(RVC::Position_AlreadyChanged).with_card(c.card_id));

        if ((*card)->turn_summoned >= s.turn_number)
            return std::unexpected(Viol(RVC::Summon_SameTurn).with_card(c.card_id));

        return {};
    }

    auto EmitChangePosition(GameState const& s, Seat const seat, ChangePositionCmd const& c) -> EventList
    {
        BoardCard const& card = *query::FindBoardCard(s, seat, c.card_id);
        Position const to = card.position == Position::Attack ? Position::Defense : Position::Attack;
        return {PositionChanged{c.card_id, card.position, to}};
    }
} // namespace ltcg::core::rules
