//
// Created by Malik T on 05/11/2025.
//

#ifndef MANORGAME_OBJECTIVES_HPP
#define MANORGAME_OBJECTIVES_HPP

#include <random>
#include "State.hpp"

namespace manor::core::objectives
{
    enum class EnterResult : std::uint8_t
    {
        NoObjective,
        ClassMismatch,
        Completed
    };

    // One objective per survivor (their class), shuffled; places the first one.
    auto Build(SessionState& state, std::mt19937_64& rng) -> void;

    // Objective that is (or should be) on the board, if any remain.
    auto Active(SessionState const& state) -> std::optional<Objective>;

    auto AllCompleted(SessionState const& state) -> bool;

    // Places the active objective if it is not on the board yet, never in `exclude`.
    // Leaves placement_pending set when no room is available.
    auto PlaceNext(SessionState& state, std::mt19937_64& rng, std::optional<RoomIdxT> exclude = std::nullopt)
        -> std::optional<RoomIdxT>;

    // A survivor of class `cls` searched `room`. On a match the objective is completed
    // and the next one placed right away in another room.
    auto OnSurvivorEnter(SessionState& state, RoomIdxT room, PlayerClass cls, std::mt19937_64& rng) -> EnterResult;

    // Moves the active objective to another available room; stays put when none is free.
    auto Relocate(SessionState& state, std::mt19937_64& rng) -> std::optional<RoomIdxT>;

    auto SpawnCrystal(SessionState& state, std::mt19937_64& rng) -> std::optional<RoomIdxT>;

    // True when the crystal was in `room`; the crystal is consumed.
    auto TryClaimCrystal(SessionState& state, RoomIdxT room) -> bool;
}

#endif //MANORGAME_OBJECTIVES_HPP
