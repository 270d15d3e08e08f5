//
// codec.cpp
//
#include "codec.hpp"

#include <format>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace wire = ::ltcg::gen::net;

namespace ltcg::core::net
{
    auto ToFbSeat(Seat const s) noexcept -> wire::Seat
    {
        switch (s)
        {
        case Seat::Host: return wire::Seat::Host;
        case Seat::Away: return wire::Seat::Away;
        }
        return wire::Seat::Host;
    }

    auto FromFbSeat(wire::Seat const s) noexcept -> Seat
    {
        switch (s)
        {
        case wire::Seat::Host: return Seat::Host;
        case wire::Seat::Away: return Seat::Away;
        }
        return Seat::Host;
    }

    auto ToFbPhase(Phase const p) noexcept -> wire::Phase
    {
        switch (p)
        {
        case Phase::Draw: return wire::Phase::Draw;
        case Phase::Standby: return wire::Phase::Standby;
        case Phase::Main: return wire::Phase::Main;
        case Phase::Combat: return wire::Phase::Combat;
        case Phase::Main2: return wire::Phase::Main2;
        case Phase::BreakdownCheck: return wire::Phase::BreakdownCheck;
        case Phase::End: return wire::Phase::End;
        }
        return wire::Phase::Draw;
    }

    auto FromFbPhase(wire::Phase const p) noexcept -> Phase
    {
        switch (p)
        {
        case wire::Phase::Draw: return Phase::Draw;
        case wire::Phase::Standby: return Phase::Standby;
        case wire::Phase::Main: return Phase::Main;
        case wire::Phase::Combat: return Phase::Combat;
        case wire::Phase::Main2: return Phase::Main2;
        case wire::Phase::BreakdownCheck: return Phase::BreakdownCheck;
        case wire::Phase::End: return Phase::End;
        }
        return Phase::Draw;
    }

    auto ToFbPosition(Position const p) noexcept -> wire::Position
    {
        switch (p)
        {
        case Position::Attack: return wire::Position::Attack;
        case Position::Defense: return wire::Position::Defense;
        }
        return wire::Position::Attack;
    }

    auto FromFbPosition(wire::Position const p) noexcept -> Position
    {
        switch (p)
        {
        case wire::Position::Attack: return Position::Attack;
        case wire::Position::Defense: return Position::Defense;
        }
        return Position::Attack;
    }

    auto ToFbWinReason(WinReason const r) noexcept -> wire::WinReason
    {
        switch (r)
        {
        case WinReason::LpZero: return wire::WinReason::LpZero;
        case WinReason::DeckOut: return wire::WinReason::DeckOut;
        case WinReason::Breakdown: return wire::WinReason::Breakdown;
        case WinReason::Surrender: return wire::WinReason::Surrender;
        }
        return wire::WinReason::LpZero;
    }

    auto FromFbWinReason(wire::WinReason const r) noexcept -> WinReason
    {
        switch (r)
        {
        case wire::WinReason::LpZero: return WinReason::LpZero;
        case wire::WinReason::DeckOut: return WinReason::DeckOut;
        case wire::WinReason::Breakdown: return WinReason::Breakdown;
        case wire::WinReason::Surrender: return WinReason::Surrender;
        }
        return WinReason::LpZero;
    }
}

namespace
{
    using namespace ltcg::core;
    using net::ParseError;

    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert((int)Seat::Away == (int)wire::Seat::Away);
    static_assert((int)Phase::BreakdownCheck == (int)wire::Phase::BreakdownCheck);
    static_assert(static_cast<std::size_t>(wire::EventType::MAX) + 1 == std::variant_size_v<Event>);

    using StringVec = flatbuffers::Vector<flatbuffers::Offset<flatbuffers::String>>;

    auto Str(flatbuffers::String const* s) -> std::string
    {
        return s ? s->str() : std::string{};
    }

    auto Ids(StringVec const* v) -> CardIds
    {
        CardIds out;
        if (v)
        {
            out.reserve(v->size());
            for (flatbuffers::String const* s : *v)
            {
                out.push_back(s->str());
            }
        }
        return out;
    }

    template <typename E>
    constexpr auto Tag(E const e) noexcept -> std::uint8_t
    {
        return static_cast<std::uint8_t>(e);
    }

    // Verified root of the expected message kind.
    auto Open(std::span<std::byte const> bytes, wire::Message const kind)
        -> std::expected<wire::Envelope const*, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        auto const* data = reinterpret_cast<std::uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!wire::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(ParseError{"envelope failed verification"});

        auto const* env = wire::GetEnvelope(data);
        if (env->message_type() != kind)
        {
            return std::unexpected(ParseError{
                std::format("expected {} but got {}", wire::EnumNameMessage(kind),
                            wire::EnumNameMessage(env->message_type()))
            });
        }
        return env;
    }

    auto Finish(flatbuffers::FlatBufferBuilder& fbb, wire::Message const kind, flatbuffers::Offset<void> msg)
        -> flatbuffers::DetachedBuffer
    {
        auto const env = wire::CreateEnvelope(fbb, kind, msg);
        fbb.Finish(env);
        return fbb.Release();
    }

    // ---------- Commands ----------

    auto EncodeCommand(flatbuffers::FlatBufferBuilder& fbb, Command const& c)
        -> std::pair<wire::Command, flatbuffers::Offset<void>>
    {
        return std::visit([&](auto const& cmd) -> std::pair<wire::Command, flatbuffers::Offset<void>>
        {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, SummonCmd>)
            {
                auto const id = fbb.CreateString(cmd.card_id);
                auto const tributes = fbb.CreateVectorOfStrings(cmd.tribute_card_ids);
                return {wire::Command::Summon,
                        wire::CreateSummon(fbb, id, net::ToFbPosition(cmd.position), tributes).Union()};
            }
            else if constexpr (std::is_same_v<T, SetMonsterCmd>)
            {
                auto const id = fbb.CreateString(cmd.card_id);
                return {wire::Command::SetMonster, wire::CreateSetMonster(fbb, id).Union()};
            }
            else if constexpr (std::is_same_v<T, FlipSummonCmd>)
            {
                auto const id = fbb.CreateString(cmd.card_id);
                return {wire::Command::FlipSummon, wire::CreateFlipSummon(fbb, id).Union()};
            }
            else if constexpr (std::is_same_v<T, ChangePositionCmd>)
            {
                auto const id = fbb.CreateString(cmd.card_id);
                return {wire::Command::ChangePosition, wire::CreateChangePosition(fbb, id).Union()};
            }
            else if constexpr (std::is_same_v<T, SetSpellTrapCmd>)
            {
                auto const id = fbb.CreateString(cmd.card_id);
                return {wire::Command::SetSpellTrap, wire::CreateSetSpellTrap(fbb, id).Union()};
            }
            else if constexpr (std::is_same_v<T, ActivateSpellCmd>)
            {
                auto const id = fbb.CreateString(cmd.card_id);
                auto const targets = fbb.CreateVectorOfStrings(cmd.targets);
                return {wire::Command::ActivateSpell, wire::CreateActivateSpell(fbb, id, targets, cmd.effect_index).Union()};
            }
            else if constexpr (std::is_same_v<T, ActivateTrapCmd>)
            {
                auto const id = fbb.CreateString(cmd.card_id);
                auto const targets = fbb.CreateVectorOfStrings(cmd.targets);
                return {wire::Command::ActivateTrap, wire::CreateActivateTrap(fbb, id, targets, cmd.effect_index).Union()};
            }
            else if constexpr (std::is_same_v<T, ActivateEffectCmd>)
            {
                auto const id = fbb.CreateString(cmd.card_id);
                auto const targets = fbb.CreateVectorOfStrings(cmd.targets);
                return {wire::Command::ActivateEffect,
                        wire::CreateActivateEffect(fbb, id, cmd.effect_index, targets).Union()};
            }
            else if constexpr (std::is_same_v<T, DeclareAttackCmd>)
            {
                auto const attacker = fbb.CreateString(cmd.attacker_id);
                auto const target = fbb.CreateString(cmd.target_id);
                return {wire::Command::DeclareAttack, wire::CreateDeclareAttack(fbb, attacker, target).Union()};
            }
            else if constexpr (std::is_same_v<T, AdvancePhaseCmd>)
            {
                return {wire::Command::AdvancePhase, wire::CreateAdvancePhase(fbb).Union()};
            }
            else if constexpr (std::is_same_v<T, EndTurnCmd>)
            {
                return {wire::Command::EndTurn, wire::CreateEndTurn(fbb).Union()};
            }
            else if constexpr (std::is_same_v<T, ChainResponseCmd>)
            {
                flatbuffers::Offset<flatbuffers::String> id{};
                if (cmd.card_id)
                {
                    id = fbb.CreateString(*cmd.card_id);
                }
                auto const targets = fbb.CreateVectorOfStrings(cmd.targets);
                return {wire::Command::ChainResponse, wire::CreateChainResponse(fbb, id, targets, cmd.pass,
                                                                                 cmd.effect_index).Union()};
            }
            else if constexpr (std::is_same_v<T, SurrenderCmd>)
            {
                return {wire::Command::Surrender, wire::CreateSurrender(fbb).Union()};
            }
            else
            {
                static_assert([] { return false; }(), "Unhandled command type");
            }
        }, c);
    }

    auto DecodeCommand(wire::SubmitCommand const& sc) -> std::expected<Command, ParseError>
    {
        switch (sc.command_type())
        {
        case wire::Command::Summon:
        {
            auto const* m = sc.command_as_Summon();
            return SummonCmd{Str(m->card_id()), net::FromFbPosition(m->position()), Ids(m->tributes())};
        }
        case wire::Command::SetMonster:
            return SetMonsterCmd{Str(sc.command_as_SetMonster()->card_id())};
        case wire::Command::FlipSummon:
            return FlipSummonCmd{Str(sc.command_as_FlipSummon()->card_id())};
        case wire::Command::ChangePosition:
            return ChangePositionCmd{Str(sc.command_as_ChangePosition()->card_id())};
        case wire::Command::SetSpellTrap:
            return SetSpellTrapCmd{Str(sc.command_as_SetSpellTrap()->card_id())};
        case wire::Command::ActivateSpell:
        {
            auto const* m = sc.command_as_ActivateSpell();
            return ActivateSpellCmd{Str(m->card_id()), Ids(m->targets()), m->effect_index()};
        }
        case wire::Command::ActivateTrap:
        {
            auto const* m = sc.command_as_ActivateTrap();
            return ActivateTrapCmd{Str(m->card_id()), Ids(m->targets()), m->effect_index()};
        }
        case wire::Command::ActivateEffect:
        {
            auto const* m = sc.command_as_ActivateEffect();
            return ActivateEffectCmd{Str(m->card_id()), m->effect_index(), Ids(m->targets())};
        }
        case wire::Command::DeclareAttack:
        {
            auto const* m = sc.command_as_DeclareAttack();
            return DeclareAttackCmd{Str(m->attacker_id()), Str(m->target_id())};
        }
        case wire::Command::AdvancePhase:
            return AdvancePhaseCmd{};
        case wire::Command::EndTurn:
            return EndTurnCmd{};
        case wire::Command::ChainResponse:
        {
            auto const* m = sc.command_as_ChainResponse();
            ChainResponseCmd out;
            if (m->card_id())
            {
                out.card_id = m->card_id()->str();
            }
            out.targets = Ids(m->targets());
            out.pass = m->pass();
            out.effect_index = m->effect_index();
            return out;
        }
        case wire::Command::Surrender:
            return SurrenderCmd{};
        default:
            return std::unexpected(ParseError{"unknown command variant"});
        }
    }

    // ---------- Events ----------

    // Flat view of one event; mirrors wire::EventRecord.
    struct Fields
    {
        Seat seat{};
        CardId card_id;
        CardId other_id;
        CardIds card_ids;
        std::int32_t amount{};
        std::uint32_t count{};
        bool flag{false};
        std::uint8_t tag_a{};
        std::uint8_t tag_b{};
    };

    auto ToFields(Event const& e) -> Fields
    {
        return std::visit([](auto const& ev) -> Fields
        {
            using T = std::decay_t<decltype(ev)>;
            Fields f;

            if constexpr (std::is_same_v<T, GameStarted>)
            {
                f.seat = ev.going_first;
            }
            else if constexpr (std::is_same_v<T, GameEnded>)
            {
                f.seat = ev.winner;
                f.tag_a = Tag(ev.reason);
            }
            else if constexpr (std::is_same_v<T, TurnStarted>)
            {
                f.seat = ev.seat;
                f.count = ev.turn_number;
            }
            else if constexpr (std::is_same_v<T, TurnEnded> || std::is_same_v<T, DeckOut>
                || std::is_same_v<T, ChainPassed>)
            {
                f.seat = ev.seat;
            }
            else if constexpr (std::is_same_v<T, PhaseChanged>)
            {
                f.tag_a = Tag(ev.from);
                f.tag_b = Tag(ev.to);
            }
            else if constexpr (std::is_same_v<T, CardDrawn> || std::is_same_v<T, MonsterSet>
                || std::is_same_v<T, SpellTrapSet> || std::is_same_v<T, BreakdownTriggered>)
            {
                f.seat = ev.seat;
                f.card_id = ev.card_id;
            }
            else if constexpr (std::is_same_v<T, MonsterSummoned>)
            {
                f.seat = ev.seat;
                f.card_id = ev.card_id;
                f.tag_a = Tag(ev.position);
                f.card_ids = ev.tributes;
            }
            else if constexpr (std::is_same_v<T, FlipSummoned>)
            {
                f.seat = ev.seat;
                f.card_id = ev.card_id;
                f.tag_a = Tag(ev.position);
            }
            else if constexpr (std::is_same_v<T, SpecialSummoned>)
            {
                f.seat = ev.seat;
                f.card_id = ev.card_id;
                f.tag_a = Tag(ev.from);
                f.tag_b = Tag(ev.position);
            }
            else if constexpr (std::is_same_v<T, SpellActivated> || std::is_same_v<T, TrapActivated>)
            {
                f.seat = ev.seat;
                f.card_id = ev.card_id;
                f.card_ids = ev.targets;
            }
            else if constexpr (std::is_same_v<T, EffectActivated>)
            {
                f.seat = ev.seat;
                f.card_id = ev.card_id;
                f.count = ev.effect_index;
                f.card_ids = ev.targets;
            }
            else if constexpr (std::is_same_v<T, AttackDeclared>)
            {
                f.seat = ev.seat;
                f.card_id = ev.attacker_id;
                f.other_id = ev.target_id;
            }
            else if constexpr (std::is_same_v<T, DamageDealt>)
            {
                f.seat = ev.seat;
                f.amount = ev.amount;
                f.flag = ev.is_battle;
            }
            else if constexpr (std::is_same_v<T, BattleResolved>)
            {
                f.card_id = ev.attacker_id;
                f.other_id = ev.defender_id;
                f.tag_a = Tag(ev.result);
            }
            else if constexpr (std::is_same_v<T, CardDestroyed>)
            {
                f.card_id = ev.card_id;
                f.tag_a = Tag(ev.reason);
            }
            else if constexpr (std::is_same_v<T, CardBanished> || std::is_same_v<T, CardReturnedToHand>
                || std::is_same_v<T, CardSentToGraveyard>)
            {
                f.seat = ev.owner;
                f.card_id = ev.card_id;
                f.tag_a = Tag(ev.from);
            }
            else if constexpr (std::is_same_v<T, ViceCounterAdded> || std::is_same_v<T, ViceCounterRemoved>)
            {
                f.card_id = ev.card_id;
                f.count = ev.new_count;
            }
            else if constexpr (std::is_same_v<T, PositionChanged>)
            {
                f.card_id = ev.card_id;
                f.tag_a = Tag(ev.from);
                f.tag_b = Tag(ev.to);
            }
            else if constexpr (std::is_same_v<T, ModifierApplied>)
            {
                f.card_id = ev.card_id;
                f.other_id = ev.source;
                f.amount = ev.amount;
                f.tag_a = Tag(ev.field);
                f.tag_b = Tag(ev.expires);
            }
            else if constexpr (std::is_same_v<T, ModifierExpired>)
            {
                f.card_id = ev.card_id;
                f.other_id = ev.source;
            }
            else if constexpr (std::is_same_v<T, ChainStarted> || std::is_same_v<T, ChainResolved>)
            {
            }
            else if constexpr (std::is_same_v<T, ChainLinkAdded>)
            {
                f.seat = ev.seat;
                f.card_id = ev.card_id;
                f.count = ev.effect_index;
                f.card_ids = ev.targets;
            }
            else if constexpr (std::is_same_v<T, ChainLinkNegated>)
            {
                f.count = ev.index;
            }
            else if constexpr (std::is_same_v<T, ChainLinkResolved>)
            {
                f.count = ev.index;
                f.card_id = ev.card_id;
                f.flag = ev.negated;
            }
            else if constexpr (std::is_same_v<T, CostPaid>)
            {
                f.seat = ev.seat;
                f.card_id = ev.card_id;
                f.tag_a = Tag(ev.cost_type);
                f.amount = ev.amount;
            }
            else if constexpr (std::is_same_v<T, CostModifierApplied>)
            {
                f.seat = ev.seat;
                f.tag_a = Tag(ev.card_type);
                f.tag_b = Tag(ev.operation);
                f.amount = ev.amount;
                f.other_id = ev.source;
                f.count = ev.expires_on_turn;
            }
            else if constexpr (std::is_same_v<T, TurnRestrictionApplied>)
            {
                f.seat = ev.seat;
                f.tag_a = Tag(ev.restriction);
                f.other_id = ev.source;
                f.count = ev.expires_on_turn;
            }
            else if constexpr (std::is_same_v<T, TopCardsViewed> || std::is_same_v<T, TopCardsRearranged>)
            {
                f.seat = ev.seat;
                f.card_ids = ev.card_ids;
                f.other_id = ev.source;
            }
            else if constexpr (std::is_same_v<T, SpellEquipped>)
            {
                f.seat = ev.seat;
                f.card_id = ev.card_id;
                f.other_id = ev.target_id;
            }
            else if constexpr (std::is_same_v<T, RitualSummoned>)
            {
                f.seat = ev.seat;
                f.card_id = ev.card_id;
                f.other_id = ev.ritual_spell_id;
                f.card_ids = ev.tributes;
            }
            else if constexpr (std::is_same_v<T, EquipDestroyed>)
            {
                f.seat = ev.owner;
                f.card_id = ev.card_id;
            }
            else if constexpr (std::is_same_v<T, ContinuousEffectApplied>)
            {
                f.seat = ev.source_seat;
                f.card_id = ev.target;
                f.other_id = ev.source;
                f.amount = ev.amount;
                f.tag_a = Tag(ev.field);
            }
            else if constexpr (std::is_same_v<T, ContinuousEffectRemoved>)
            {
                f.card_id = ev.target;
                f.other_id = ev.source;
                f.amount = ev.amount;
                f.tag_a = Tag(ev.field);
            }
            else
            {
                static_assert([] { return false; }(), "Unhandled event type");
            }
            return f;
        }, e);
    }

    auto FromFields(wire::EventType const type, Fields f) -> std::expected<Event, ParseError>
    {
        using W = wire::EventType;
        switch (type)
        {
        case W::GameStarted: return GameStarted{f.seat};
        case W::GameEnded: return GameEnded{f.seat, static_cast<WinReason>(f.tag_a)};
        case W::TurnStarted: return TurnStarted{f.seat, f.count};
        case W::TurnEnded: return TurnEnded{f.seat};
        case W::PhaseChanged: return PhaseChanged{static_cast<Phase>(f.tag_a), static_cast<Phase>(f.tag_b)};
        case W::CardDrawn: return CardDrawn{f.seat, std::move(f.card_id)};
        case W::DeckOut: return DeckOut{f.seat};
        case W::MonsterSummoned:
            return MonsterSummoned{f.seat, std::move(f.card_id), static_cast<Position>(f.tag_a), std::move(f.card_ids)};
        case W::MonsterSet: return MonsterSet{f.seat, std::move(f.card_id)};
        case W::FlipSummoned: return FlipSummoned{f.seat, std::move(f.card_id), static_cast<Position>(f.tag_a)};
        case W::SpecialSummoned:
            return SpecialSummoned{f.seat, std::move(f.card_id), static_cast<ZoneKind>(f.tag_a),
                                   static_cast<Position>(f.tag_b)};
        case W::SpellTrapSet: return SpellTrapSet{f.seat, std::move(f.card_id)};
        case W::SpellActivated: return SpellActivated{f.seat, std::move(f.card_id), std::move(f.card_ids)};
        case W::TrapActivated: return TrapActivated{f.seat, std::move(f.card_id), std::move(f.card_ids)};
        case W::EffectActivated:
            return EffectActivated{f.seat, std::move(f.card_id), f.count, std::move(f.card_ids)};
        case W::AttackDeclared: return AttackDeclared{f.seat, std::move(f.card_id), std::move(f.other_id)};
        case W::DamageDealt: return DamageDealt{f.seat, f.amount, f.flag};
        case W::BattleResolved:
            return BattleResolved{std::move(f.card_id), std::move(f.other_id), static_cast<BattleResult>(f.tag_a)};
        case W::CardDestroyed: return CardDestroyed{std::move(f.card_id), static_cast<DestroyReason>(f.tag_a)};
        case W::CardBanished: return CardBanished{std::move(f.card_id), static_cast<ZoneKind>(f.tag_a), f.seat};
        case W::CardReturnedToHand:
            return CardReturnedToHand{std::move(f.card_id), static_cast<ZoneKind>(f.tag_a), f.seat};
        case W::CardSentToGraveyard:
            return CardSentToGraveyard{std::move(f.card_id), static_cast<ZoneKind>(f.tag_a), f.seat};
        case W::ViceCounterAdded: return ViceCounterAdded{std::move(f.card_id), f.count};
        case W::ViceCounterRemoved: return ViceCounterRemoved{std::move(f.card_id), f.count};
        case W::BreakdownTriggered: return BreakdownTriggered{f.seat, std::move(f.card_id)};
        case W::PositionChanged:
            return PositionChanged{std::move(f.card_id), static_cast<Position>(f.tag_a), static_cast<Position>(f.tag_b)};
        case W::ModifierApplied:
            return ModifierApplied{std::move(f.card_id), static_cast<StatField>(f.tag_a), f.amount,
                                   std::move(f.other_id), static_cast<Expiry>(f.tag_b)};
        case W::ModifierExpired: return ModifierExpired{std::move(f.card_id), std::move(f.other_id)};
        case W::ChainStarted: return ChainStarted{};
        case W::ChainLinkAdded:
            return ChainLinkAdded{std::move(f.card_id), f.seat, f.count, std::move(f.card_ids)};
        case W::ChainLinkNegated: return ChainLinkNegated{f.count};
        case W::ChainLinkResolved: return ChainLinkResolved{f.count, std::move(f.card_id), f.flag};
        case W::ChainPassed: return ChainPassed{f.seat};
        case W::ChainResolved: return ChainResolved{};
        case W::CostPaid: return CostPaid{f.seat, std::move(f.card_id), static_cast<CostType>(f.tag_a), f.amount};
        case W::CostModifierApplied:
            return CostModifierApplied{f.seat, static_cast<CostCardType>(f.tag_a), static_cast<CostOperation>(f.tag_b),
                                       f.amount, std::move(f.other_id), f.count};
        case W::TurnRestrictionApplied:
            return TurnRestrictionApplied{f.seat, static_cast<Restriction>(f.tag_a), std::move(f.other_id), f.count};
        case W::TopCardsViewed: return TopCardsViewed{f.seat, std::move(f.card_ids), std::move(f.other_id)};
        case W::TopCardsRearranged: return TopCardsRearranged{f.seat, std::move(f.card_ids), std::move(f.other_id)};
        case W::SpellEquipped: return SpellEquipped{f.seat, std::move(f.card_id), std::move(f.other_id)};
        case W::RitualSummoned:
            return RitualSummoned{f.seat, std::move(f.card_id), std::move(f.other_id), std::move(f.card_ids)};
        case W::EquipDestroyed: return EquipDestroyed{std::move(f.card_id), f.seat};
        case W::ContinuousEffectApplied:
            return ContinuousEffectApplied{std::move(f.other_id), f.seat, std::move(f.card_id),
                                           static_cast<StatField>(f.tag_a), f.amount};
        case W::ContinuousEffectRemoved:
            return ContinuousEffectRemoved{std::move(f.other_id), std::move(f.card_id),
                                           static_cast<StatField>(f.tag_a), f.amount};
        }
        return std::unexpected(ParseError{"unknown event type"});
    }

    // ---------- View pieces ----------

    auto BuildBoard(flatbuffers::FlatBufferBuilder& fbb, std::vector<BoardCard> const& cards)
        -> flatbuffers::Offset<flatbuffers::Vector<flatbuffers::Offset<wire::BoardCard>>>
    {
        std::vector<flatbuffers::Offset<wire::BoardCard>> vec;
        vec.reserve(cards.size());
        for (BoardCard const& c : cards)
        {
            auto const id = fbb.CreateString(c.card_id);
            auto const def = fbb.CreateString(c.definition_id);
            auto const equips = fbb.CreateVectorOfStrings(c.equipped_cards);

            wire::BoardCardBuilder b(fbb);
            b.add_card_id(id);
            b.add_definition_id(def);
            b.add_position(net::ToFbPosition(c.position));
            b.add_face_down(c.face_down);
            b.add_can_attack(c.can_attack);
            b.add_has_attacked_this_turn(c.has_attacked_this_turn);
            b.add_changed_position_this_turn(c.changed_position_this_turn);
            b.add_vice_counters(c.vice_counters);
            b.add_attack_boost(c.temporary_boosts.attack);
            b.add_defense_boost(c.temporary_boosts.defense);
            b.add_equipped_cards(equips);
            b.add_turn_summoned(c.turn_summoned);
            vec.push_back(b.Finish());
        }
        return fbb.CreateVector(vec);
    }

    auto BuildSpellTrap(flatbuffers::FlatBufferBuilder& fbb, SpellTrapCard const& c)
        -> flatbuffers::Offset<wire::SpellTrapCard>
    {
        auto const id = fbb.CreateString(c.card_id);
        auto const def = fbb.CreateString(c.definition_id);
        return wire::CreateSpellTrapCard(fbb, id, def, c.face_down, c.activated, c.is_field_spell);
    }

    auto BuildSpellTraps(flatbuffers::FlatBufferBuilder& fbb, std::vector<SpellTrapCard> const& cards)
        -> flatbuffers::Offset<flatbuffers::Vector<flatbuffers::Offset<wire::SpellTrapCard>>>
    {
        std::vector<flatbuffers::Offset<wire::SpellTrapCard>> vec;
        vec.reserve(cards.size());
        for (SpellTrapCard const& c : cards)
        {
            vec.push_back(BuildSpellTrap(fbb, c));
        }
        return fbb.CreateVector(vec);
    }

    auto BuildFieldSpell(flatbuffers::FlatBufferBuilder& fbb, std::optional<SpellTrapCard> const& c)
        -> flatbuffers::Offset<wire::SpellTrapCard>
    {
        return c ? BuildSpellTrap(fbb, *c) : flatbuffers::Offset<wire::SpellTrapCard>{};
    }

    auto ReadBoard(flatbuffers::Vector<flatbuffers::Offset<wire::BoardCard>> const* v) -> std::vector<BoardCard>
    {
        std::vector<BoardCard> out;
        if (!v) return out;
        out.reserve(v->size());
        for (wire::BoardCard const* b : *v)
        {
            BoardCard c;
            c.card_id = Str(b->card_id());
            c.definition_id = Str(b->definition_id());
            c.position = net::FromFbPosition(b->position());
            c.face_down = b->face_down();
            c.can_attack = b->can_attack();
            c.has_attacked_this_turn = b->has_attacked_this_turn();
            c.changed_position_this_turn = b->changed_position_this_turn();
            c.vice_counters = b->vice_counters();
            c.temporary_boosts = {b->attack_boost(), b->defense_boost()};
            c.equipped_cards = Ids(b->equipped_cards());
            c.turn_summoned = b->turn_summoned();
            out.push_back(std::move(c));
        }
        return out;
    }

    auto ReadSpellTrap(wire::SpellTrapCard const& s) -> SpellTrapCard
    {
        return SpellTrapCard{
            .card_id = Str(s.card_id()),
            .definition_id = Str(s.definition_id()),
            .face_down = s.face_down(),
            .activated = s.activated(),
            .is_field_spell = s.is_field_spell(),
        };
    }

    auto ReadSpellTraps(flatbuffers::Vector<flatbuffers::Offset<wire::SpellTrapCard>> const* v)
        -> std::vector<SpellTrapCard>
    {
        std::vector<SpellTrapCard> out;
        if (!v) return out;
        out.reserve(v->size());
        for (wire::SpellTrapCard const* s : *v)
        {
            out.push_back(ReadSpellTrap(*s));
        }
        return out;
    }

    auto ReadFieldSpell(wire::SpellTrapCard const* s) -> std::optional<SpellTrapCard>
    {
        if (!s) return std::nullopt;
        return ReadSpellTrap(*s);
    }

    auto MatchErrorCodeFrom(std::string_view const name) -> std::optional<MatchErrorCode>
    {
        for (MatchErrorCode const c : {MatchErrorCode::SeatMismatch, MatchErrorCode::VersionConflict,
                                       MatchErrorCode::GameOver, MatchErrorCode::IllegalCommand})
        {
            if (to_string(c) == name) return c;
        }
        return std::nullopt;
    }
} // anonymous

namespace ltcg::core::net
{
    // ---------- Submit (client → server) ----------

    auto BuildSubmit(std::uint64_t const expected_version, Seat const seat, Command const& c)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const [type, cmd] = EncodeCommand(fbb, c);
        auto const sub = wire::CreateSubmitCommand(fbb, expected_version, ToFbSeat(seat), type, cmd);
        return Finish(fbb, wire::Message::SubmitCommand, sub.Union());
    }

    // ---------- Events (server → client) ----------

    auto BuildEventBatch(std::uint64_t const version, std::span<VersionedEvent const> events)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        std::vector<flatbuffers::Offset<wire::EventRecord>> recs;
        recs.reserve(events.size());
        for (VersionedEvent const& ve : events)
        {
            Fields const f = ToFields(ve.event);
            auto const name = fbb.CreateString(EventName(ve.event));
            auto const card = fbb.CreateString(f.card_id);
            auto const other = fbb.CreateString(f.other_id);
            auto const ids = fbb.CreateVectorOfStrings(f.card_ids);

            recs.push_back(wire::CreateEventRecord(
                fbb,
                /*version*/ ve.version,
                /*type*/ static_cast<wire::EventType>(ve.event.index()),
                /*name*/ name,
                /*seat*/ ToFbSeat(f.seat),
                /*card_id*/ card,
                /*other_id*/ other,
                /*card_ids*/ ids,
                /*amount*/ f.amount,
                /*count*/ f.count,
                /*flag*/ f.flag,
                /*tag_a*/ f.tag_a,
                /*tag_b*/ f.tag_b
            ));
        }

        auto const batch = wire::CreateEventBatch(fbb, version, fbb.CreateVector(recs));
        return Finish(fbb, wire::Message::EventBatch, batch.Union());
    }

    // ---------- Player view (server → client) ----------

    auto BuildPlayerView(VersionedView const& vv) -> flatbuffers::DetachedBuffer
    {
        PlayerView const& v = vv.view;
        flatbuffers::FlatBufferBuilder fbb;

        std::vector<flatbuffers::Offset<wire::InstanceDefinition>> defs;
        defs.reserve(v.instance_definitions.size());
        for (auto const& [card, def] : v.instance_definitions)
        {
            auto const c = fbb.CreateString(card);
            auto const d = fbb.CreateString(def);
            defs.push_back(wire::CreateInstanceDefinition(fbb, c, d));
        }
        auto const defs_vec = fbb.CreateVector(defs);

        auto const hand = fbb.CreateVectorOfStrings(v.hand);
        auto const board = BuildBoard(fbb, v.board);
        auto const zone = BuildSpellTraps(fbb, v.spell_trap_zone);
        auto const field = BuildFieldSpell(fbb, v.field_spell);
        auto const grave = fbb.CreateVectorOfStrings(v.graveyard);
        auto const banished = fbb.CreateVectorOfStrings(v.banished);

        auto const opp_board = BuildBoard(fbb, v.opponent_board);
        auto const opp_zone = BuildSpellTraps(fbb, v.opponent_spell_trap_zone);
        auto const opp_field = BuildFieldSpell(fbb, v.opponent_field_spell);
        auto const opp_grave = fbb.CreateVectorOfStrings(v.opponent_graveyard);
        auto const opp_banished = fbb.CreateVectorOfStrings(v.opponent_banished);

        std::vector<flatbuffers::Offset<wire::ChainLink>> links;
        links.reserve(v.current_chain.size());
        for (ChainLink const& l : v.current_chain)
        {
            auto const id = fbb.CreateString(l.card_id);
            auto const targets = fbb.CreateVectorOfStrings(l.targets);
            links.push_back(wire::CreateChainLink(fbb, id, l.effect_index, ToFbSeat(l.activating_seat), targets));
        }
        auto const chain = fbb.CreateVector(links);

        flatbuffers::Offset<StringVec> top{};
        if (v.top_deck_view)
        {
            top = fbb.CreateVectorOfStrings(*v.top_deck_view);
        }

        wire::PlayerViewMsgBuilder b(fbb);
        b.add_version(vv.version);
        b.add_my_seat(ToFbSeat(v.my_seat));
        b.add_instance_definitions(defs_vec);

        b.add_hand(hand);
        b.add_hand_count(v.hand_count);
        b.add_board(board);
        b.add_spell_trap_zone(zone);
        b.add_field_spell(field);
        b.add_graveyard(grave);
        b.add_banished(banished);
        b.add_life_points(v.life_points);
        b.add_deck_count(v.deck_count);
        b.add_breakdowns_caused(v.breakdowns_caused);

        b.add_opponent_hand_count(v.opponent_hand_count);
        b.add_opponent_board(opp_board);
        b.add_opponent_spell_trap_zone(opp_zone);
        b.add_opponent_field_spell(opp_field);
        b.add_opponent_graveyard(opp_grave);
        b.add_opponent_banished(opp_banished);
        b.add_opponent_life_points(v.opponent_life_points);
        b.add_opponent_deck_count(v.opponent_deck_count);
        b.add_opponent_breakdowns_caused(v.opponent_breakdowns_caused);

        b.add_current_turn_player(ToFbSeat(v.current_turn_player));
        b.add_has_priority_player(v.current_priority_player.has_value());
        b.add_current_priority_player(ToFbSeat(v.current_priority_player.value_or(Seat::Host)));
        b.add_turn_number(v.turn_number);
        b.add_current_phase(ToFbPhase(v.current_phase));
        b.add_current_chain(chain);
        b.add_normal_summoned_this_turn(v.normal_summoned_this_turn);
        b.add_max_board_slots(v.max_board_slots);
        b.add_max_spell_trap_slots(v.max_spell_trap_slots);
        b.add_game_over(v.game_over);
        b.add_has_winner(v.winner.has_value());
        b.add_winner(ToFbSeat(v.winner.value_or(Seat::Host)));
        b.add_win_reason(ToFbWinReason(v.win_reason.value_or(WinReason::LpZero)));
        b.add_has_top_deck_view(v.top_deck_view.has_value());
        if (v.top_deck_view)
        {
            b.add_top_deck_view(top);
        }
        auto const msg = b.Finish();

        return Finish(fbb, wire::Message::PlayerViewMsg, msg.Union());
    }

    // ---------- Rejection (server → client) ----------

    auto BuildRejection(MatchError const& e, std::uint64_t const version) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const code = fbb.CreateString(to_string(e.code));
        auto const txt = fbb.CreateString(e.message);
        auto const rej = wire::CreateRejection(fbb, version, code, e.status, txt);
        return Finish(fbb, wire::Message::Rejection, rej.Union());
    }

    // ---------- Decode ----------

    auto DecodeSubmit(std::span<std::byte const> bytes) -> std::expected<DecodedSubmit, ParseError>
    {
        auto const env = Open(bytes, wire::Message::SubmitCommand);
        if (!env)
            return std::unexpected(env.error());

        auto const* sc = (*env)->message_as_SubmitCommand();
        auto cmd = DecodeCommand(*sc);
        if (!cmd)
            return std::unexpected(cmd.error());

        return DecodedSubmit{
            .expected_version = sc->expected_version(),
            .seat = FromFbSeat(sc->seat()),
            .command = std::move(*cmd),
        };
    }

    auto DecodeEventBatch(std::span<std::byte const> bytes) -> std::expected<DecodedBatch, ParseError>
    {
        auto const env = Open(bytes, wire::Message::EventBatch);
        if (!env)
            return std::unexpected(env.error());

        auto const* batch = (*env)->message_as_EventBatch();
        DecodedBatch out{.version = batch->version()};

        if (auto const* v = batch->events())
        {
            out.events.reserve(v->size());
            for (wire::EventRecord const* r : *v)
            {
                Fields f{
                    .seat = FromFbSeat(r->seat()),
                    .card_id = Str(r->card_id()),
                    .other_id = Str(r->other_id()),
                    .card_ids = Ids(r->card_ids()),
                    .amount = r->amount(),
                    .count = r->count(),
                    .flag = r->flag(),
                    .tag_a = r->tag_a(),
                    .tag_b = r->tag_b(),
                };
                auto ev = FromFields(r->type(), std::move(f));
                if (!ev)
                    return std::unexpected(ev.error());
                out.events.push_back(VersionedEvent{r->version(), std::move(*ev)});
            }
        }
        return out;
    }

    auto DecodePlayerView(std::span<std::byte const> bytes) -> std::expected<VersionedView, ParseError>
    {
        auto const env = Open(bytes, wire::Message::PlayerViewMsg);
        if (!env)
            return std::unexpected(env.error());

        auto const* m = (*env)->message_as_PlayerViewMsg();
        VersionedView out{.version = m->version()};
        PlayerView& v = out.view;

        v.my_seat = FromFbSeat(m->my_seat());
        if (auto const* defs = m->instance_definitions())
        {
            for (wire::InstanceDefinition const* d : *defs)
            {
                v.instance_definitions.emplace(Str(d->card_id()), Str(d->definition_id()));
            }
        }

        v.hand = Ids(m->hand());
        v.hand_count = m->hand_count();
        v.board = ReadBoard(m->board());
        v.spell_trap_zone = ReadSpellTraps(m->spell_trap_zone());
        v.field_spell = ReadFieldSpell(m->field_spell());
        v.graveyard = Ids(m->graveyard());
        v.banished = Ids(m->banished());
        v.life_points = m->life_points();
        v.deck_count = m->deck_count();
        v.breakdowns_caused = m->breakdowns_caused();

        v.opponent_hand_count = m->opponent_hand_count();
        v.opponent_board = ReadBoard(m->opponent_board());
        v.opponent_spell_trap_zone = ReadSpellTraps(m->opponent_spell_trap_zone());
        v.opponent_field_spell = ReadFieldSpell(m->opponent_field_spell());
        v.opponent_graveyard = Ids(m->opponent_graveyard());
        v.opponent_banished = Ids(m->opponent_banished());
        v.opponent_life_points = m->opponent_life_points();
        v.opponent_deck_count = m->opponent_deck_count();
        v.opponent_breakdowns_caused = m->opponent_breakdowns_caused();

        v.current_turn_player = FromFbSeat(m->current_turn_player());
        if (m->has_priority_player())
        {
            v.current_priority_player = FromFbSeat(m->current_priority_player());
        }
        v.turn_number = m->turn_number();
        v.current_phase = FromFbPhase(m->current_phase());
        if (auto const* chain = m->current_chain())
        {
            for (wire::ChainLink const* l : *chain)
            {
                v.current_chain.push_back(ChainLink{
                    .card_id = Str(l->card_id()),
                    .effect_index = l->effect_index(),
                    .activating_seat = FromFbSeat(l->activating_seat()),
                    .targets = Ids(l->targets()),
                });
            }
        }
        v.normal_summoned_this_turn = m->normal_summoned_this_turn();
        v.max_board_slots = m->max_board_slots();
        v.max_spell_trap_slots = m->max_spell_trap_slots();
        v.game_over = m->game_over();
        if (m->has_winner())
        {
            v.winner = FromFbSeat(m->winner());
            v.win_reason = FromFbWinReason(m->win_reason());
        }
        if (m->has_top_deck_view())
        {
            v.top_deck_view = Ids(m->top_deck_view());
        }
        return out;
    }

    auto DecodeRejection(std::span<std::byte const> bytes) -> std::expected<DecodedRejection, ParseError>
    {
        auto const env = Open(bytes, wire::Message::Rejection);
        if (!env)
            return std::unexpected(env.error());

        auto const* r = (*env)->message_as_Rejection();
        auto const code = MatchErrorCodeFrom(Str(r->code()));
        if (!code)
            return std::unexpected(ParseError{std::format("unknown rejection code '{}'", Str(r->code()))});

        return DecodedRejection{
            .version = r->version(),
            .error = MatchError{*code, r->status(), Str(r->message())},
        };
    }
} // namespace ltcg::core::net
