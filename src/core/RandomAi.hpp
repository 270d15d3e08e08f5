//
// RandomAi.hpp
//

#ifndef LTCG_RANDOMAI_HPP
#define LTCG_RANDOMAI_HPP

#include <cstdint>
#include <random>

#include "Player.hpp"

namespace ltcg::core
{
    class RandomAI final : public Player
    {
    public:
        explicit RandomAI(std::uint64_t rng_seed);

        auto Play(PlayerView const& view, std::span<Command const> legal) -> Command override;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> std::size_t
        {
            return std::uniform_int_distribution<std::size_t>{0, v.size() - 1}(rng_);
        }

    private:
        std::mt19937 rng_;
    };
}

#endif //LTCG_RANDOMAI_HPP
