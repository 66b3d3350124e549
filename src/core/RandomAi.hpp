//
// Created by Malik T on 18/08/2025.
//

#ifndef MANORGAME_RANDOMAI_HPP
#define MANORGAME_RANDOMAI_HPP

#include <random>
#include "Actions.hpp"
#include "RoomCatalog.hpp"
#include "Types.hpp"
#include "Visibility.hpp"

namespace manor::core
{
    // Plays any role by picking uniformly among the moves its own view allows.
    class RandomAI
    {
    public:
        explicit RandomAI(std::uint64_t rng_seed);

        // nullopt when the view asks nothing of `me` right now.
        auto Play(SessionView const& view, PlyrIdxT me, RoomCatalog const& catalog, Config const& cfg)
            -> std::optional<PlayerAction>;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> std::size_t
        {
            return std::uniform_int_distribution<std::size_t>{0, v.size() - 1}(rng_);
        }

        auto RoomMove(SessionView const& view, PlayerView const& self) -> std::optional<PlayerAction>;
        auto PowerMove(SessionView const& view, PlyrIdxT me, RoomCatalog const& catalog, Config const& cfg)
            -> std::optional<PlayerAction>;
        auto TargetFor(PowerKind power, RoomCatalog const& catalog, Config const& cfg) -> PowerTarget;

    private:
        std::mt19937 rng_;
    };
}

#endif //MANORGAME_RANDOMAI_HPP
