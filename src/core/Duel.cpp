//
// Duel.cpp
//

#include "Duel.hpp"

#include <utility>

#include "Engine.hpp"

namespace ltcg::core
{
    Duel::Duel(GameState initial, std::unique_ptr<Rules> rules, bool const log_rejections) :
        rules_(std::move(rules)),
        log_rejections_(log_rejections)
    {
        LTCG_ASSERT(rules_ != nullptr, "Duel constructed without rules");
        LTCG_ASSERT(initial.registry != nullptr, "Duel constructed without a card registry");
        history_.push_back(std::make_shared<GameState const>(std::move(initial)));
    }

    auto Duel::Submit(Seat const seat, Command const& c) -> EventList
    {
        EventList const events = Decide(*rules_, State(), seat, c, log_rejections_);
        if (events.empty())
        {
            return {};
        }
        Settled settled = Settle(*rules_, State(), events);
        history_.push_back(std::make_shared<GameState const>(std::move(settled.state)));
        return std::move(settled.events);
    }

    auto Duel::Check(Seat const seat, Command const& c) const -> error::ValidateResult
    {
        return rules_->Validate(State(), seat, c);
    }

    auto Duel::LegalMoves(Seat const seat) const -> std::vector<Command>
    {
        return core::LegalMoves(*rules_, State(), seat);
    }

    auto Duel::View(Seat const seat) const -> PlayerView
    {
        return Mask(State(), seat);
    }

    auto Duel::ActingSeat() const noexcept -> Seat
    {
        GameState const& s = State();
        if (s.ChainOpen() && s.current_priority_player)
        {
            return *s.current_priority_player;
        }
        return s.current_turn_player;
    }
} // namespace ltcg::core
