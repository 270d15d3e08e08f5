//
// codec.hpp
//

#ifndef LTCG_CODEC_HPP
#define LTCG_CODEC_HPP

#include <cstddef>   // std::byte
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>
#include <flatbuffers/flatbuffers.h>

#include "../core/Commands.hpp"
#include "../core/Events.hpp"
#include "../core/Match.hpp"
#include "../core/State.hpp"
#include "../core/Types.hpp"

#include "generated/ltcg_net_generated.h"

namespace ltcg::core::net
{
    struct ParseError
    {
        std::string message;
    };

    // What a client submission decodes into
    struct DecodedSubmit
    {
        std::uint64_t expected_version{};
        Seat seat{};
        Command command{};
    };

    struct DecodedBatch
    {
        std::uint64_t version{};
        std::vector<VersionedEvent> events;
    };

    struct DecodedRejection
    {
        std::uint64_t version{};
        MatchError error;
    };

    auto ToFbSeat(Seat s) noexcept -> ltcg::gen::net::Seat;
    auto ToFbPhase(Phase p) noexcept -> ltcg::gen::net::Phase;
    auto ToFbPosition(Position p) noexcept -> ltcg::gen::net::Position;
    auto ToFbWinReason(WinReason r) noexcept -> ltcg::gen::net::WinReason;

    auto FromFbSeat(ltcg::gen::net::Seat s) noexcept -> Seat;
    auto FromFbPhase(ltcg::gen::net::Phase p) noexcept -> Phase;
    auto FromFbPosition(ltcg::gen::net::Position p) noexcept -> Position;
    auto FromFbWinReason(ltcg::gen::net::WinReason r) noexcept -> WinReason;

    // --- Outbound builders ---

    // client -> server
    auto BuildSubmit(std::uint64_t expected_version, Seat seat, Command const& c)
        -> flatbuffers::DetachedBuffer;

    // server -> client
    auto BuildEventBatch(std::uint64_t version, std::span<VersionedEvent const> events)
        -> flatbuffers::DetachedBuffer;

    auto BuildPlayerView(VersionedView const& v)
        -> flatbuffers::DetachedBuffer;

    auto BuildRejection(MatchError const& e, std::uint64_t version)
        -> flatbuffers::DetachedBuffer;

    // --- Inbound decode (verified envelope -> core values) ---

    auto DecodeSubmit(std::span<std::byte const> bytes)
        -> std::expected<DecodedSubmit, ParseError>;

    auto DecodeEventBatch(std::span<std::byte const> bytes)
        -> std::expected<DecodedBatch, ParseError>;

    auto DecodePlayerView(std::span<std::byte const> bytes)
        -> std::expected<VersionedView, ParseError>;

    auto DecodeRejection(std::span<std::byte const> bytes)
        -> std::expected<DecodedRejection, ParseError>;

    inline auto AsBytes(flatbuffers::DetachedBuffer const& buf) -> std::span<std::byte const>
    {
        return {reinterpret_cast<std::byte const*>(buf.data()), buf.size()};
    }
} // namespace ltcg::core::net

#endif //LTCG_CODEC_HPP
