//
// Match.cpp
//

#include "Match.hpp"

#include <algorithm>
#include <format>
#include <utility>

#include "Engine.hpp"

namespace ltcg::core
{
    Match::Match(std::string match_id, std::string host_participant, std::string away_participant, Duel duel) :
        id_(std::move(match_id)),
        host_(std::move(host_participant)),
        away_(std::move(away_participant)),
        duel_(std::move(duel))
    {
        LTCG_ASSERT(host_ != away_, "A match needs two distinct participants");
    }

    auto Match::SeatOf(std::string_view const participant) const -> std::optional<Seat>
    {
        if (participant == host_) return Seat::Host;
        if (participant == away_) return Seat::Away;
        return std::nullopt;
    }

    auto Match::Submit(std::string_view const participant, Seat const seat, Command const& c,
                       std::uint64_t const expected_version) -> std::expected<SubmitResult, MatchError>
    {
        if (SeatOf(participant) != seat)
        {
            return std::unexpected(MatchError{
                MatchErrorCode::SeatMismatch, 422,
                std::format("participant '{}' does not hold seat {} in match {}", participant, to_string(seat), id_)
            });
        }
        if (expected_version != version_)
        {
            return std::unexpected(MatchError{
                MatchErrorCode::VersionConflict, 409,
                std::format("expected version {} but match {} is at {}", expected_version, id_, version_)
            });
        }
        if (duel_.Over())
        {
            return std::unexpected(MatchError{
                MatchErrorCode::GameOver, 409, std::format("match {} is over", id_)
            });
        }
        if (auto const ok = duel_.Check(seat, c); !ok.has_value())
        {
            return std::unexpected(MatchError{
                MatchErrorCode::IllegalCommand, 422, error::describe(ok.error())
            });
        }

        EventList events = duel_.Submit(seat, c);
        LTCG_ASSERT(!events.empty(), "Checked command produced no events");

        SubmitResult out;
        out.events.reserve(events.size());
        for (Event& e : events)
        {
            log_.push_back(VersionedEvent{++version_, std::move(e)});
            out.events.push_back(log_.back());
        }
        out.version = version_;
        return out;
    }

    auto Match::EventsSince(std::uint64_t const version) const -> std::vector<VersionedEvent>
    {
        auto const first = std::ranges::upper_bound(log_, version, {}, &VersionedEvent::version);
        return {first, log_.end()};
    }

    auto Match::View(Seat const seat) const -> VersionedView
    {
        return {duel_.View(seat), version_};
    }

    auto Match::Spectate() const -> VersionedView
    {
        return {SpectatorView(duel_.State()), version_};
    }
} // namespace ltcg::core
