//
// Exception.hpp
//

#ifndef LTCG_EXCEPTION_HPP
#define LTCG_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "Types.hpp"

namespace ltcg::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Rules, // rules engine misuse (not an illegal command)
        State, // state handed to the engine is inconsistent
        Config, // engine or server configuration rejected
        Registry, // card definition lookup failed during setup
        Network, // transport failure
        Serialization, // FlatBuffers verification/build errors
        Assertion // internal assertion failed
    };

    inline auto to_string(Code const c) -> std::string_view
    {
        switch (c)
        {
        case Code::Unknown: return "unknown";
        case Code::Rules: return "rules";
        case Code::State: return "state";
        case Code::Config: return "config";
        case Code::Registry: return "registry";
        case Code::Network: return "network";
        case Code::Serialization: return "serialization";
        case Code::Assertion: return "assertion";
        }
        return "?";
    }

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ConfigError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RegistryError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct NetworkError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::Config: throw ConfigError(std::move(msg), c, loc);
        case Code::Registry: throw RegistryError(std::move(msg), c, loc);
        case Code::Network: throw NetworkError(std::move(msg), c, loc);
        case Code::Serialization: throw SerializationError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define LTCG_THROW(code_enum, msg) ::ltcg::core::error::fail((code_enum), (msg))
#define LTCG_ASSERT(cond, msg) do { if(!(cond)) ::ltcg::core::error::fail(::ltcg::core::error::Code::Assertion, (msg)); } while(0)

    // Fine-grained reasons; grouped by command type.
    enum class RuleViolationCode : std::uint16_t
    {
        // Generic/flow
        GameOver,
        WrongPhase_MainRequired,
        WrongPhase_CombatRequired,
        WrongPhase_EndTurnNotAllowed,
        WrongActor_TurnPlayerRequired,
        WrongActor_PriorityRequired,
        ChainOpen_OnlyResponses,
        Effects_Disabled,

        // Cards & zones
        Card_NotInHand,
        Card_NotOnBoard,
        Card_NotInSpellTrapZone,
        Card_WrongType,
        Card_UnknownDefinition,
        Zone_BoardFull,
        Zone_SpellTrapFull,

        // Summoning
        Summon_AlreadyNormalSummoned,
        Summon_TributeCountMismatch,
        Summon_TributeInvalid,
        Summon_FaceDownRequired,
        Summon_SameTurn,
        Position_FaceUpRequired,
        Position_AlreadyChanged,

        // Spells, traps and effects
        Activate_FaceDownRequired,
        Activate_HandOnlyOnOwnTurn,
        Activate_NoSuchEffect,
        Activate_WrongEffectType,
        Activate_OncePerTurnUsed,
        Activate_CostUnpayable,
        Activate_TargetsInvalid,
        Activate_NoValidTargets,
        Ritual_MonsterInvalid,
        Ritual_TributesInvalid,
        Ritual_LevelTooLow,

        // Combat
        Attack_FirstTurn,
        Attack_Restricted,
        Attack_AttackerInvalid,
        Attack_AlreadyAttacked,
        Attack_CannotAttack,
        Attack_TargetInvalid,
        Attack_DirectNotAllowed,

        // Chain
        Chain_NotOpen,
        Chain_ResponseInvalid,

        // Safety net
        Internal_Unreachable
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<Phase> phase{};
        std::optional<Seat> actor{};
        std::optional<Seat> turn_player{};
        std::optional<CardId> card{};

        std::optional<std::uint32_t> expected_count{};
        std::optional<std::uint32_t> attempted_count{};
        std::optional<std::uint32_t> capacity{};

        auto with_phase(Phase p) -> RuleViolation&
        {
            phase = p;
            return *this;
        }

        auto with_actor(Seat s) -> RuleViolation&
        {
            actor = s;
            return *this;
        }

        auto with_turn_player(Seat s) -> RuleViolation&
        {
            turn_player = s;
            return *this;
        }

        auto with_card(CardId id) -> RuleViolation&
        {
            card = std::move(id);
            return *this;
        }

        auto with_expected(std::uint32_t v) -> RuleViolation&
        {
            expected_count = v;
            return *this;
        }

        auto with_attempted(std::uint32_t v) -> RuleViolation&
        {
            attempted_count = v;
            return *this;
        }

        auto with_capacity(std::uint32_t v) -> RuleViolation&
        {
            capacity = v;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::GameOver: return "Game is over";
        case E::WrongPhase_MainRequired: return "Wrong phase (main required)";
        case E::WrongPhase_CombatRequired: return "Wrong phase (combat required)";
        case E::WrongPhase_EndTurnNotAllowed: return "Wrong phase (end turn only from main2/end)";
        case E::WrongActor_TurnPlayerRequired: return "Wrong actor (turn player required)";
        case E::WrongActor_PriorityRequired: return "Wrong actor (priority holder required)";
        case E::ChainOpen_OnlyResponses: return "Chain open: only chain responses allowed";
        case E::Effects_Disabled: return "Effects disabled by restriction";

        case E::Card_NotInHand: return "Card: not in hand";
        case E::Card_NotOnBoard: return "Card: not on own board";
        case E::Card_NotInSpellTrapZone: return "Card: not in own spell/trap zone";
        case E::Card_WrongType: return "Card: wrong card type for command";
        case E::Card_UnknownDefinition: return "Card: unknown definition";
        case E::Zone_BoardFull: return "Zone: board full";
        case E::Zone_SpellTrapFull: return "Zone: spell/trap zone full";

        case E::Summon_AlreadyNormalSummoned: return "Summon: normal summon already used";
        case E::Summon_TributeCountMismatch: return "Summon: wrong number of tributes";
        case E::Summon_TributeInvalid: return "Summon: tribute not a face-up own monster";
        case E::Summon_FaceDownRequired: return "Flip: card is not face-down";
        case E::Summon_SameTurn: return "Summon: card placed this turn";
        case E::Position_FaceUpRequired: return "Position: card is face-down";
        case E::Position_AlreadyChanged: return "Position: already changed this turn";

        case E::Activate_FaceDownRequired: return "Activate: card must be set";
        case E::Activate_HandOnlyOnOwnTurn: return "Activate: hand activation only in own main phase";
        case E::Activate_NoSuchEffect: return "Activate: effect index out of range";
        case E::Activate_WrongEffectType: return "Activate: effect cannot be activated this way";
        case E::Activate_OncePerTurnUsed: return "Activate: once-per-turn already used";
        case E::Activate_CostUnpayable: return "Activate: cost cannot be paid";
        case E::Activate_TargetsInvalid: return "Activate: targets do not satisfy filter";
        case E::Activate_NoValidTargets: return "Activate: not enough valid targets";
        case E::Ritual_MonsterInvalid: return "Ritual: first target not a monster in hand";
        case E::Ritual_TributesInvalid: return "Ritual: tributes not distinct face-up own monsters in board order";
        case E::Ritual_LevelTooLow: return "Ritual: tribute levels below the monster's level";

        case E::Attack_FirstTurn: return "Attack: not allowed on the first turn";
        case E::Attack_Restricted: return "Attack: attacks disabled by restriction";
        case E::Attack_AttackerInvalid: return "Attack: attacker not a face-up own monster";
        case E::Attack_AlreadyAttacked: return "Attack: attacker already attacked";
        case E::Attack_CannotAttack: return "Attack: attacker cannot attack this turn";
        case E::Attack_TargetInvalid: return "Attack: target not on opponent board";
        case E::Attack_DirectNotAllowed: return "Attack: direct attack with face-up defenders";

        case E::Chain_NotOpen: return "Chain: no chain open";
        case E::Chain_ResponseInvalid: return "Chain: response card cannot join chain";

        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        auto s = std::format("{}", to_string(v.code));
        if (v.phase) s += std::format(" | phase={}", to_string(*v.phase));
        if (v.actor) s += std::format(" | actor={}", to_string(*v.actor));
        if (v.turn_player) s += std::format(" | turn={}", to_string(*v.turn_player));
        if (v.card) s += std::format(" | card={}", *v.card);
        if (v.expected_count) s += std::format(" | expected={}", *v.expected_count);
        if (v.attempted_count) s += std::format(" | attempted={}", *v.attempted_count);
        if (v.capacity) s += std::format(" | cap={}", *v.capacity);
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;

    inline auto violation(RuleViolationCode c) -> std::unexpected<RuleViolation>
    {
        return std::unexpected(RuleViolation{.code = c});
    }

    inline auto violation(RuleViolation v) -> std::unexpected<RuleViolation>
    {
        return std::unexpected(std::move(v));
    }
}

#endif //LTCG_EXCEPTION_HPP
