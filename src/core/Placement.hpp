//
// Created by Malik T on 04/11/2025.
//

#ifndef MANORGAME_PLACEMENT_HPP
#define MANORGAME_PLACEMENT_HPP

#include <random>
#include "State.hpp"

namespace manor::core
{
    enum class Pickup : std::uint8_t
    {
        Objective,
        Crystal,
        RevivalItem
    };

    // Rooms a killer currently stands in (eliminated killers do not count).
    auto KillerRooms(SessionState const& state) -> std::vector<RoomIdxT>;

    // Candidate rooms for placing a new pickup of the given kind:
    //  - never a killer's current room
    //  - objective/crystal: not locked, no objective, no crystal
    //  - revival item: no objective, no crystal, no revival item
    auto AvailableRooms(SessionState const& state, Pickup kind) -> std::vector<RoomIdxT>;

    // Uniform pick among AvailableRooms; nullopt when every room is excluded.
    auto PickAvailableRoom(SessionState const& state, Pickup kind, std::mt19937_64& rng) -> std::optional<RoomIdxT>;

    // Drops the revival item into a fresh room, or marks it pending when none qualifies.
    auto PlaceRevivalItem(SessionState& state, std::mt19937_64& rng) -> std::optional<RoomIdxT>;
}

#endif //MANORGAME_PLACEMENT_HPP
