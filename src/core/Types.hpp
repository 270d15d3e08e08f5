//
// Types.hpp
//

#ifndef LTCG_TYPES_HPP
#define LTCG_TYPES_HPP

#define LTCG_ENABLE_TEST_HOOKS true

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ltcg::core::constants
{
    inline constexpr std::int32_t StartingLp = 8000;
    inline constexpr std::uint32_t MaxHandSize = 7;
    inline constexpr std::uint32_t MaxBoardSlots = 3;
    inline constexpr std::uint32_t MaxSpellTrapSlots = 3;
    inline constexpr std::uint32_t StartingHandSize = 5;
    inline constexpr std::uint32_t BreakdownThreshold = 3;
    inline constexpr std::uint32_t MaxBreakdownsToWin = 3;
    inline constexpr std::uint32_t TributeLevelThreshold = 7;

    // marker used by player views for redacted card definitions
    inline constexpr std::string_view HiddenDefinition = "hidden";
    // discard count meaning "the whole hand"
    inline constexpr std::uint32_t DiscardAll = 99;
    // upper bound on state-based derivation passes per command
    inline constexpr std::size_t MaxDerivePasses = 16;
}

namespace ltcg::core
{
    using CardId = std::string;
    using DefinitionId = std::string;
    using CardIds = std::vector<CardId>;

    enum class Seat : std::uint8_t
    {
        Host = 0,
        Away
    };

    enum class Phase : std::uint8_t
    {
        Draw = 0,
        Standby,
        Main,
        Combat,
        Main2,
        BreakdownCheck,
        End
    };

    enum class Position : std::uint8_t
    {
        Attack = 0,
        Defense
    };

    enum class CardType : std::uint8_t
    {
        Monster = 0,
        Spell,
        Trap
    };

    enum class SpellType : std::uint8_t
    {
        Normal = 0,
        Continuous,
        Equip,
        Field,
        QuickPlay,
        Ritual
    };

    enum class TrapType : std::uint8_t
    {
        Normal = 0,
        Continuous,
        Counter
    };

    enum class Rarity : std::uint8_t
    {
        Common = 0,
        Uncommon,
        Rare,
        Epic,
        Legendary
    };

    enum class WinReason : std::uint8_t
    {
        LpZero = 0,
        DeckOut,
        Breakdown,
        Surrender
    };

    enum class ZoneKind : std::uint8_t
    {
        Hand = 0,
        Board,
        SpellTrapZone,
        Field,
        Graveyard,
        Banished,
        Deck
    };

    enum class Owner : std::uint8_t
    {
        Self = 0,
        Opponent,
        Any
    };

    enum class Restriction : std::uint8_t
    {
        DisableAttacks = 0,
        DisableBattlePhase,
        DisableDrawPhase,
        DisableEffects
    };

    enum class StatField : std::uint8_t
    {
        Attack = 0,
        Defense
    };

    enum class Expiry : std::uint8_t
    {
        EndOfTurn = 0,
        EndOfNextTurn,
        Permanent
    };

    struct EngineConfig
    {
        std::int32_t starting_lp{constants::StartingLp};
        std::uint32_t max_hand_size{constants::MaxHandSize};
        std::uint32_t max_board_slots{constants::MaxBoardSlots};
        std::uint32_t max_spell_trap_slots{constants::MaxSpellTrapSlots};
        std::uint32_t starting_hand_size{constants::StartingHandSize};
        std::uint32_t breakdown_threshold{constants::BreakdownThreshold};
        std::uint32_t max_breakdowns_to_win{constants::MaxBreakdownsToWin};
        std::uint32_t tribute_level_threshold{constants::TributeLevelThreshold};
        std::uint64_t seed{0x17C6'D0E1ULL};
    };

    inline constexpr auto Opponent(Seat const s) noexcept -> Seat
    {
        return s == Seat::Host ? Seat::Away : Seat::Host;
    }

    // Cyclic successor; End wraps to Draw of the next turn.
    inline constexpr auto NextPhase(Phase const p) noexcept -> Phase
    {
        switch (p)
        {
        case Phase::Draw: return Phase::Standby;
        case Phase::Standby: return Phase::Main;
        case Phase::Main: return Phase::Combat;
        case Phase::Combat: return Phase::Main2;
        case Phase::Main2: return Phase::BreakdownCheck;
        case Phase::BreakdownCheck: return Phase::End;
        case Phase::End: return Phase::Draw;
        }
        return Phase::Draw;
    }

    inline constexpr auto IsMainPhase(Phase const p) noexcept -> bool
    {
        return p == Phase::Main || p == Phase::Main2;
    }

    inline auto to_string(Seat const s) -> std::string_view
    {
        return s == Seat::Host ? "host" : "away";
    }

    inline auto to_string(Phase const p) -> std::string_view
    {
        switch (p)
        {
        case Phase::Draw: return "draw";
        case Phase::Standby: return "standby";
        case Phase::Main: return "main";
        case Phase::Combat: return "combat";
        case Phase::Main2: return "main2";
        case Phase::BreakdownCheck: return "breakdown_check";
        case Phase::End: return "end";
        }
        return "?";
    }

    inline auto to_string(Position const p) -> std::string_view
    {
        return p == Position::Attack ? "attack" : "defense";
    }

    inline auto to_string(WinReason const r) -> std::string_view
    {
        switch (r)
        {
        case WinReason::LpZero: return "lp_zero";
        case WinReason::DeckOut: return "deck_out";
        case WinReason::Breakdown: return "breakdown";
        case WinReason::Surrender: return "surrender";
        }
        return "?";
    }

    inline auto to_string(ZoneKind const z) -> std::string_view
    {
        switch (z)
        {
        case ZoneKind::Hand: return "hand";
        case ZoneKind::Board: return "board";
        case ZoneKind::SpellTrapZone: return "spell_trap_zone";
        case ZoneKind::Field: return "field";
        case ZoneKind::Graveyard: return "graveyard";
        case ZoneKind::Banished: return "banished";
        case ZoneKind::Deck: return "deck";
        }
        return "?";
    }

    inline auto to_string(Restriction const r) -> std::string_view
    {
        switch (r)
        {
        case Restriction::DisableAttacks: return "disable_attacks";
        case Restriction::DisableBattlePhase: return "disable_battle_phase";
        case Restriction::DisableDrawPhase: return "disable_draw_phase";
        case Restriction::DisableEffects: return "disable_effects";
        }
        return "?";
    }

    inline auto to_string(Expiry const e) -> std::string_view
    {
        switch (e)
        {
        case Expiry::EndOfTurn: return "end_of_turn";
        case Expiry::EndOfNextTurn: return "end_of_next_turn";
        case Expiry::Permanent: return "permanent";
        }
        return "?";
    }
}

#endif //LTCG_TYPES_HPP
