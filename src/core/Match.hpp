//
// Match.hpp
//

#ifndef LTCG_MATCH_HPP
#define LTCG_MATCH_HPP

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Duel.hpp"

namespace ltcg::core
{
    enum class MatchErrorCode : std::uint8_t
    {
        SeatMismatch,
        VersionConflict,
        GameOver,
        IllegalCommand
    };

    inline auto to_string(MatchErrorCode const c) -> std::string_view
    {
        switch (c)
        {
        case MatchErrorCode::SeatMismatch: return "seat_mismatch";
        case MatchErrorCode::VersionConflict: return "version_conflict";
        case MatchErrorCode::GameOver: return "game_over";
        case MatchErrorCode::IllegalCommand: return "illegal_command";
        }
        return "?";
    }

    // Boundary failure; status follows HTTP conventions (422 / 409).
    struct MatchError
    {
        MatchErrorCode code{};
        std::uint16_t status{};
        std::string message;
    };

    struct VersionedEvent
    {
        std::uint64_t version{};
        Event event;
    };

    struct SubmitResult
    {
        std::vector<VersionedEvent> events;
        std::uint64_t version{};
    };

    struct VersionedView
    {
        PlayerView view;
        std::uint64_t version{};
    };

    // Serializes submissions for one duel: participant/seat binding, optimistic
    // versioning and a version-stamped event log. Version 0 is the initial state.
    class Match
    {
    public:
        Match(std::string match_id, std::string host_participant, std::string away_participant, Duel duel);

        auto Submit(std::string_view participant, Seat seat, Command const& c, std::uint64_t expected_version)
            -> std::expected<SubmitResult, MatchError>;

        // Events with version strictly greater than `version`.
        auto EventsSince(std::uint64_t version) const -> std::vector<VersionedEvent>;
        auto View(Seat seat) const -> VersionedView;
        auto Spectate() const -> VersionedView;

        auto SeatOf(std::string_view participant) const -> std::optional<Seat>;
        auto Version() const noexcept -> std::uint64_t { return version_; }
        auto Id() const noexcept -> std::string const& { return id_; }
        auto GetDuel() const noexcept -> Duel const& { return duel_; }

    private:
        std::string id_;
        std::string host_;
        std::string away_;
        Duel duel_;
        std::vector<VersionedEvent> log_;
        std::uint64_t version_{};
    };
} // namespace ltcg::core

#endif //LTCG_MATCH_HPP
