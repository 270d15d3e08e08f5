#include <gtest/gtest.h>
#include <array>
#include <cstddef>
#include <memory>
#include <vector>

#include "../core/Match.hpp"
#include "../core/RandomAi.hpp"
#include "../core/Setup.hpp"
#include "../net/codec.hpp"
#include "TestState.hpp"

using namespace ltcg::core;
using ltcg::core::net::AsBytes;

namespace
{
    struct Seeds
    {
        std::uint64_t duel_seed;
        std::uint64_t host_seed;
        std::uint64_t away_seed;
    };

    auto make_match(std::uint64_t const seed) -> Match
    {
        EngineConfig cfg;
        cfg.seed = seed;
        GameState initial = CreateInitialState(cfg, demo::Registry(), demo::Deck(20), demo::Deck(20));
        return Match("codec", "h", "a", Duel(std::move(initial), std::make_unique<DuelRules>(), false));
    }

    auto participant(Seat const seat) -> std::string_view
    {
        return seat == Seat::Host ? "h" : "a";
    }

    // Plays random legal commands through the match; returns every submitted command.
    auto drive(Match& m, Seeds const& seeds, int const steps) -> std::vector<std::pair<Seat, Command>>
    {
        RandomAI host{seeds.host_seed};
        RandomAI away{seeds.away_seed};
        std::vector<std::pair<Seat, Command>> played;
        for (int i{}; i < steps && !m.GetDuel().Over(); ++i)
        {
            Seat const seat = m.GetDuel().ActingSeat();
            std::vector<Command> const legal = m.GetDuel().LegalMoves(seat);
            Command const c = (seat == Seat::Host ? host : away).Play(m.GetDuel().View(seat), legal);
            auto const r = m.Submit(participant(seat), seat, c, m.Version());
            EXPECT_TRUE(r.has_value()) << Describe(c);
            played.emplace_back(seat, c);
        }
        return played;
    }

    auto expect_same_board(std::vector<BoardCard> const& a, std::vector<BoardCard> const& b) -> void
    {
        ASSERT_EQ(a.size(), b.size());
        for (std::size_t i{}; i < a.size(); ++i)
        {
            EXPECT_EQ(a[i], b[i]) << a[i].card_id;
        }
    }

    constexpr std::array<Seeds, 2> Scenarios{{
        {0xA11CE5EEDULL, 0xBEEF'0001ULL, 0xBEEF'0002ULL},
        {0xF00D'F00DULL, 0xDEAD'1234ULL, 0xBADC'0DE0ULL},
    }};
}

TEST(Codec_RandomAI, SubmitRoundTripsEveryPlayedCommand)
{
    for (Seeds const& seeds : Scenarios)
    {
        Match m = make_match(seeds.duel_seed);
        std::uint64_t version{};
        for (auto const& [seat, c] : drive(m, seeds, 250))
        {
            flatbuffers::DetachedBuffer const buf = net::BuildSubmit(version, seat, c);
            auto const decoded = net::DecodeSubmit(AsBytes(buf));
            ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
            EXPECT_EQ(decoded->expected_version, version);
            EXPECT_EQ(decoded->seat, seat);
            EXPECT_EQ(decoded->command, c) << Describe(c);
            ++version;
        }
    }
}

TEST(Codec_RandomAI, EventBatchFromLiveDuelIsLossless)
{
    for (Seeds const& seeds : Scenarios)
    {
        Match m = make_match(seeds.duel_seed);
        drive(m, seeds, 300);

        std::vector<VersionedEvent> const log = m.EventsSince(0);
        ASSERT_FALSE(log.empty());

        flatbuffers::DetachedBuffer const buf = net::BuildEventBatch(m.Version(), log);
        auto const decoded = net::DecodeEventBatch(AsBytes(buf));
        ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
        EXPECT_EQ(decoded->version, m.Version());
        ASSERT_EQ(decoded->events.size(), log.size());
        for (std::size_t i{}; i < log.size(); ++i)
        {
            EXPECT_EQ(decoded->events[i].version, log[i].version);
            EXPECT_TRUE(decoded->events[i].event == log[i].event) << Describe(log[i].event);
        }
    }
}

TEST(Codec_RandomAI, PlayerViewKeepsWhatTheSeatCanSee)
{
    Seeds const seeds = Scenarios.front();
    Match m = make_match(seeds.duel_seed);
    drive(m, seeds, 120);

    for (Seat const seat : {Seat::Host, Seat::Away})
    {
        VersionedView const vv = m.View(seat);
        flatbuffers::DetachedBuffer const buf = net::BuildPlayerView(vv);
        auto const decoded = net::DecodePlayerView(AsBytes(buf));
        ASSERT_TRUE(decoded.has_value()) << decoded.error().message;

        PlayerView const& want = vv.view;
        PlayerView const& got = decoded->view;
        EXPECT_EQ(decoded->version, vv.version);
        EXPECT_EQ(got.my_seat, want.my_seat);
        EXPECT_EQ(got.instance_definitions, want.instance_definitions);
        EXPECT_EQ(got.hand, want.hand);
        EXPECT_EQ(got.hand_count, want.hand_count);
        expect_same_board(got.board, want.board);
        expect_same_board(got.opponent_board, want.opponent_board);
        EXPECT_EQ(got.spell_trap_zone, want.spell_trap_zone);
        EXPECT_EQ(got.opponent_spell_trap_zone, want.opponent_spell_trap_zone);
        EXPECT_EQ(got.field_spell, want.field_spell);
        EXPECT_EQ(got.opponent_field_spell, want.opponent_field_spell);
        EXPECT_EQ(got.graveyard, want.graveyard);
        EXPECT_EQ(got.opponent_graveyard, want.opponent_graveyard);
        EXPECT_EQ(got.life_points, want.life_points);
        EXPECT_EQ(got.opponent_life_points, want.opponent_life_points);
        EXPECT_EQ(got.deck_count, want.deck_count);
        EXPECT_EQ(got.opponent_hand_count, want.opponent_hand_count);
        EXPECT_EQ(got.current_turn_player, want.current_turn_player);
        EXPECT_EQ(got.current_priority_player, want.current_priority_player);
        EXPECT_EQ(got.turn_number, want.turn_number);
        EXPECT_EQ(got.current_phase, want.current_phase);
        EXPECT_EQ(got.current_chain, want.current_chain);
        EXPECT_EQ(got.game_over, want.game_over);
        EXPECT_EQ(got.winner, want.winner);
    }
}

TEST(Codec_RandomAI, RejectionRoundTrip)
{
    Match m = make_match(1);
    auto const r = m.Submit("a", Seat::Away, AdvancePhaseCmd{}, 0);
    ASSERT_FALSE(r.has_value());

    flatbuffers::DetachedBuffer const buf = net::BuildRejection(r.error(), m.Version());
    auto const decoded = net::DecodeRejection(AsBytes(buf));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_EQ(decoded->version, 0u);
    EXPECT_EQ(decoded->error.code, MatchErrorCode::IllegalCommand);
    EXPECT_EQ(decoded->error.status, 422);
    EXPECT_EQ(decoded->error.message, r.error().message);
}

TEST(Codec_RandomAI, GarbageAndWrongKindsAreParseErrors)
{
    std::vector<std::byte> const junk(64, std::byte{0x5A});
    EXPECT_FALSE(net::DecodeSubmit(junk).has_value());
    EXPECT_FALSE(net::DecodeEventBatch(std::span<std::byte const>{}).has_value());

    flatbuffers::DetachedBuffer const submit = net::BuildSubmit(0, Seat::Host, SurrenderCmd{});
    auto const as_view = net::DecodePlayerView(AsBytes(submit));
    ASSERT_FALSE(as_view.has_value());
    EXPECT_FALSE(as_view.error().message.empty());
    EXPECT_FALSE(net::DecodeRejection(AsBytes(submit)).has_value());
    EXPECT_TRUE(net::DecodeSubmit(AsBytes(submit)).has_value());
}
