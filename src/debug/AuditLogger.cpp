//
// AuditLogger.cpp
//

#include "AuditLogger.hpp"

#include <format>
#include <string_view>

using namespace ltcg::core;

namespace
{

auto serialize_board(SeatState const& ss) -> std::string
{
    std::string serial;
    for (std::size_t i{}; i < ss.board.size(); ++i)
    {
        BoardCard const& c = ss.board[i];
        serial += std::format("{}{}{}{}",
                              (i ? "," : ""),
                              c.card_id,
                              (c.face_down ? "(fd)" : (c.position == Position::Attack ? "(atk)" : "(def)")),
                              (c.vice_counters ? std::format("v{}", c.vice_counters) : std::string{}));
    }
    return serial;
}

} // anonymous namespace

namespace ltcg::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(GameState const& s) -> void
{
    out_ << std::format("Seed={}\n", s.config.seed);
    out_ << std::format("First={}\n", to_string(s.current_turn_player));
    out_ << std::format("Decks={}/{} Hands={}/{} LP={}\n",
                        s.Of(Seat::Host).deck.size(), s.Of(Seat::Away).deck.size(),
                        s.Of(Seat::Host).hand.size(), s.Of(Seat::Away).hand.size(),
                        s.config.starting_lp);
    out_.flush();
}

auto AuditLogger::command(GameState const& before, Seat const actor, Command const& c) -> void
{
    out_ << std::format(
        "Turn {} phase={} actor={} lp={}/{} chain={} board=[{}|{}]\n",
        before.turn_number,
        to_string(before.current_phase),
        to_string(actor),
        before.Of(Seat::Host).life_points,
        before.Of(Seat::Away).life_points,
        before.current_chain.size(),
        serialize_board(before.Of(Seat::Host)),
        serialize_board(before.Of(Seat::Away))
    );

    out_ << std::format("Command: {}\n", Describe(c));
}

auto AuditLogger::events(EventList const& events) -> void
{
    if (events.empty())
    {
        out_ << "Outcome: Rejected\n";
        return;
    }
    for (Event const& e : events)
    {
        out_ << std::format("  {}\n", Describe(e));
    }
}

auto AuditLogger::end(GameState const& s) -> void
{
    if (s.game_over && s.winner && s.win_reason)
    {
        out_ << std::format("Winner={} Reason={} Turn={}\n",
                            to_string(*s.winner), to_string(*s.win_reason), s.turn_number);
    }
    else
    {
        out_ << std::format("Winner=none Turn={}\n", s.turn_number);
    }
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace ltcg::core::debug
