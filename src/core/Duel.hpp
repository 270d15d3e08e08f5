//
// Duel.hpp
//

#ifndef LTCG_DUEL_HPP
#define LTCG_DUEL_HPP

#include <memory>
#include <span>
#include <vector>

#include "Commands.hpp"
#include "Events.hpp"
#include "Exception.hpp"
#include "Rules.hpp"
#include "State.hpp"

namespace ltcg::core
{
    // Owns the snapshot history of one duel. Every accepted command appends a new
    // immutable state; earlier snapshots stay valid for replay and audit.
    class Duel
    {
    public:
        Duel() = delete;
        Duel(GameState initial, std::unique_ptr<Rules> rules, bool log_rejections = true);

        // Command events followed by derived events; {} when the command is rejected.
        auto Submit(Seat seat, Command const& c) -> EventList;
        auto Check(Seat seat, Command const& c) const -> error::ValidateResult;

        auto State() const noexcept -> GameState const& { return *history_.back(); }
        auto Snapshot() const noexcept -> std::shared_ptr<GameState const> { return history_.back(); }
        auto History() const noexcept -> std::span<std::shared_ptr<GameState const> const> { return history_; }

        auto LegalMoves(Seat seat) const -> std::vector<Command>;
        auto View(Seat seat) const -> PlayerView;
        auto Over() const noexcept -> bool { return State().game_over; }

        // Priority holder while a chain is open, otherwise the turn player.
        auto ActingSeat() const noexcept -> Seat;

    private:
        std::unique_ptr<Rules> rules_;
        std::vector<std::shared_ptr<GameState const>> history_;
        bool log_rejections_;
    };
} // namespace ltcg::core

#endif //LTCG_DUEL_HPP
