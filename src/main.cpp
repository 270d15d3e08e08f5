//
// main.cpp
//

#include <array>
#include <charconv>
#include <cstdint>
#include <cstring>
#include <format>
#include <map>
#include <memory>
#include <optional>
#include <print>
#include <string>
#include <string_view>
#include <span>
#include <vector>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/DemoCatalog.hpp"
#include "core/Duel.hpp"
#include "core/Exception.hpp"
#include "core/Match.hpp"
#include "core/Setup.hpp"
#include "debug/AuditLogger.hpp"
#include "net/codec.hpp"

namespace
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using Hdl      = websocketpp::connection_hdl;

    struct ServerConfig
    {
        std::uint16_t port{9002};
        std::uint64_t seed{123456789ULL};
        std::int32_t starting_lp{ltcg::core::constants::StartingLp};
        std::uint32_t starting_hand{ltcg::core::constants::StartingHandSize};
        std::uint32_t deck_size{40};
        std::uint64_t turn_timeout_ms{60000};
        std::string transcript{};
    };

    auto ParseArgs(int argc, char** argv) -> ServerConfig
    {
        ServerConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string_view const arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            if (arg == "--port")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.port = static_cast<std::uint16_t>(v); }
            }
            else if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.seed = v; }
            }
            else if (arg == "--lp")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.starting_lp = static_cast<std::int32_t>(v); }
            }
            else if (arg == "--hand")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.starting_hand = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--deck")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.deck_size = static_cast<std::uint32_t>(v); }
            }
            else if (arg == "--timeout_ms")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.turn_timeout_ms = v; }
            }
            else if (arg == "--transcript")
            {
                if (i + 1 < argc) { cfg.transcript = argv[++i]; }
            }
            else
            {
                std::print("[ltcgd] ignoring unknown flag {}\n", arg);
            }
        }
        return cfg;
    }

    auto SendBuffer(WsServer& ep, Hdl const& hdl, flatbuffers::DetachedBuffer const& buf) -> void
    {
        websocketpp::lib::error_code ec;
        ep.send(hdl, buf.data(), buf.size(), websocketpp::frame::opcode::binary, ec);
        if (ec)
        {
            std::print("[ltcgd] send failed: {}\n", ec.message());
        }
    }

    struct SeatSlot
    {
        Hdl hdl{};
        bool connected{false};
    };

    constexpr std::array<std::string_view, 2> Participants{"seat-host", "seat-away"};

    auto ParticipantOf(ltcg::core::Seat const s) -> std::string
    {
        return std::string{Participants[static_cast<std::size_t>(s)]};
    }
}

int main(int argc, char** argv)
{
    using namespace ltcg;
    using namespace ltcg::core;

    ServerConfig const sc = ParseArgs(argc, argv);

    std::print("[ltcgd] starting on port {} (seed {}, deck {}, lp {})\n",
               sc.port, sc.seed, sc.deck_size, sc.starting_lp);

    std::optional<Match> match;
    try
    {
        EngineConfig cfg;
        cfg.seed = sc.seed;
        cfg.starting_lp = sc.starting_lp;
        cfg.starting_hand_size = sc.starting_hand;
        Validate(cfg);

        std::vector<DefinitionId> const deck = demo::Deck(sc.deck_size);
        GameState initial = CreateInitialState(cfg, demo::Registry(), deck, deck);
        match.emplace(std::format("duel-{}", sc.seed), ParticipantOf(Seat::Host), ParticipantOf(Seat::Away),
                      Duel(std::move(initial), std::make_unique<DuelRules>()));
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print("{}", e);
        return 1;
    }

    std::optional<debug::AuditLogger> audit;
    if (!sc.transcript.empty())
    {
        audit.emplace(sc.transcript);
        audit->start(match->GetDuel().State());
    }

    WsServer ep;
    ep.clear_access_channels(websocketpp::log::alevel::all);
    ep.clear_error_channels(websocketpp::log::elevel::all);

    ep.init_asio();
    ep.set_reuse_addr(true);

    std::array<SeatSlot, 2> seats{};
    std::map<Hdl, Seat, std::owner_less<Hdl>> hdl_to_seat;
    WsServer::timer_ptr idle_timer;

    auto broadcast_views = [&]
    {
        for (Seat const s : {Seat::Host, Seat::Away})
        {
            SeatSlot const& slot = seats[static_cast<std::size_t>(s)];
            if (slot.connected)
            {
                SendBuffer(ep, slot.hdl, net::BuildPlayerView(match->View(s)));
            }
        }
    };

    // The host never acts for a seat; an idle timer only reports who is holding the duel up.
    auto arm_idle_timer = [&]
    {
        if (idle_timer)
        {
            idle_timer->cancel();
        }
        if (sc.turn_timeout_ms == 0 || match->GetDuel().Over())
        {
            return;
        }
        Seat const waiting_on = match->GetDuel().ActingSeat();
        std::uint64_t const version = match->Version();
        idle_timer = ep.set_timer(static_cast<long>(sc.turn_timeout_ms),
                                  [&, waiting_on, version](websocketpp::lib::error_code const& ec)
        {
            if (ec || match->Version() != version)
            {
                return;
            }
            std::print("[ltcgd] still waiting on {} at version {}\n", to_string(waiting_on), version);
        });
    };

    ep.set_open_handler([&](Hdl hdl)
    {
        std::optional<Seat> seat;
        for (Seat const s : {Seat::Host, Seat::Away})
        {
            if (!seats[static_cast<std::size_t>(s)].connected)
            {
                seat = s;
                break;
            }
        }
        if (!seat)
        {
            websocketpp::lib::error_code ec;
            ep.close(hdl, websocketpp::close::status::try_again_later, "All seats occupied", ec);
            return;
        }

        hdl_to_seat[hdl] = *seat;
        seats[static_cast<std::size_t>(*seat)] = SeatSlot{hdl, true};

        std::print("[ltcgd] client connected -> {}\n", to_string(*seat));

        std::string const hello = std::format("SeatAssigned {} {}", to_string(*seat), match->Id());
        websocketpp::lib::error_code ec;
        ep.send(hdl, hello, websocketpp::frame::opcode::text, ec);

        SendBuffer(ep, hdl, net::BuildPlayerView(match->View(*seat)));
        if (seats[0].connected && seats[1].connected)
        {
            arm_idle_timer();
        }
    });

    ep.set_close_handler([&](Hdl hdl)
    {
        auto it = hdl_to_seat.find(hdl);
        if (it != hdl_to_seat.end())
        {
            Seat const seat = it->second;
            hdl_to_seat.erase(it);
            seats[static_cast<std::size_t>(seat)].connected = false;
            std::print("[ltcgd] {} disconnected\n", to_string(seat));
        }
    });

    ep.set_message_handler([&](Hdl hdl, WsServer::message_ptr msg)
    {
        auto it = hdl_to_seat.find(hdl);
        if (it == hdl_to_seat.end())
        {
            return;
        }
        Seat const conn_seat = it->second;

        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            return;
        }

        std::string const& payload = msg->get_payload();
        std::span<std::byte const> const bytes{
            reinterpret_cast<std::byte const*>(payload.data()), payload.size()
        };

        auto const decoded = net::DecodeSubmit(bytes);
        if (!decoded)
        {
            std::print("[ltcgd] {}: parse error: {}\n", to_string(conn_seat), decoded.error().message);
            websocketpp::lib::error_code ec;
            ep.send(hdl, std::format("ParseError {}", decoded.error().message), websocketpp::frame::opcode::text, ec);
            return;
        }

        std::shared_ptr<GameState const> const before = match->GetDuel().Snapshot();

        // The connection decides the participant; the message only claims a seat.
        auto const result = match->Submit(ParticipantOf(conn_seat), decoded->seat, decoded->command,
                                          decoded->expected_version);
        if (!result)
        {
            std::print("[ltcgd] {} rejected ({}): {}\n", to_string(conn_seat),
                       to_string(result.error().code), result.error().message);
            SendBuffer(ep, hdl, net::BuildRejection(result.error(), match->Version()));
            return;
        }

        if (audit)
        {
            EventList events;
            events.reserve(result->events.size());
            for (VersionedEvent const& ve : result->events)
            {
                events.push_back(ve.event);
            }
            audit->command(*before, decoded->seat, decoded->command);
            audit->events(events);
        }

        auto const batch = net::BuildEventBatch(result->version, result->events);
        for (SeatSlot const& slot : seats)
        {
            if (slot.connected)
            {
                SendBuffer(ep, slot.hdl, batch);
            }
        }
        broadcast_views();

        if (match->GetDuel().Over())
        {
            GameState const& s = match->GetDuel().State();
            std::print("[ltcgd] duel over: {} wins by {}\n",
                       to_string(s.winner.value_or(Seat::Host)), to_string(s.win_reason.value_or(WinReason::LpZero)));
            if (audit)
            {
                audit->end(s);
            }
            if (idle_timer)
            {
                idle_timer->cancel();
            }
            websocketpp::lib::error_code ec;
            ep.stop_listening(ec);
            return;
        }
        arm_idle_timer();
    });

    ep.listen(sc.port);
    ep.start_accept();
    ep.run();

    if (audit)
    {
        audit->flush();
    }
    std::print("[ltcgd] shut down\n");
    return 0;
}
