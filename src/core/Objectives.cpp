//
// Created by Malik T on 05/11/2025.
//
#include "Objectives.hpp"

#include <algorithm>
#include "Exception.hpp"
#include "Placement.hpp"

namespace manor::core::objectives
{
    auto Build(SessionState& state, std::mt19937_64& rng) -> void
    {
        ObjectiveState& obj = state.objectives;
        obj = ObjectiveState{};
        for (std::size_t i{}; i < state.players.size(); ++i)
        {
            PlayerState const& p = state.players[i];
            if (p.role != Role::Survivor) continue;
            obj.queue.push_back(Objective{p.player_class, static_cast<PlyrIdxT>(i)});
        }
        std::ranges::shuffle(obj.queue, rng);
        obj.placement_pending = !obj.queue.empty();
        PlaceNext(state, rng);
    }

    auto Active(SessionState const& state) -> std::optional<Objective>
    {
        ObjectiveState const& obj = state.objectives;
        if (obj.completed.size() >= obj.queue.size()) return std::nullopt;
        return obj.queue[obj.completed.size()];
    }

    auto AllCompleted(SessionState const& state) -> bool
    {
        return state.objectives.completed.size() >= state.objectives.queue.size();
    }

    auto PlaceNext(SessionState& state, std::mt19937_64& rng, std::optional<RoomIdxT> const exclude)
        -> std::optional<RoomIdxT>
    {
        ObjectiveState& obj = state.objectives;
        auto const next = Active(state);
        if (!next || obj.active_room)
        {
            obj.placement_pending = false;
            return obj.active_room;
        }

        std::vector<RoomIdxT> candidates = AvailableRooms(state, Pickup::Objective);
        if (exclude) std::erase(candidates, *exclude);
        if (candidates.empty())
        {
            obj.placement_pending = true;
            return std::nullopt;
        }
        std::uniform_int_distribution<std::size_t> dist(0, candidates.size() - 1);
        auto const room = std::optional<RoomIdxT>{candidates[dist(rng)]};

        RoomState& r = state.rooms[*room];
        r.has_quest = true;
        r.required_class = next->required_class;
        obj.active_room = room;
        obj.placement_pending = false;
        return room;
    }

    auto OnSurvivorEnter(SessionState& state, RoomIdxT const room, PlayerClass const cls, std::mt19937_64& rng)
        -> EnterResult
    {
        ObjectiveState& obj = state.objectives;
        RoomState& r = state.rooms[room];
        if (!r.has_quest) return EnterResult::NoObjective;

        MNR_ASSERT(obj.active_room == room, "Objective marker outside the active room");
        MNR_ASSERT(r.required_class.has_value(), "Objective marker without a class");
        if (*r.required_class != cls) return EnterResult::ClassMismatch;

        obj.completed.push_back(*r.required_class);
        r.has_quest = false;
        r.required_class.reset();
        obj.active_room.reset();
        state.rooms_visited_since_objective.clear();

        obj.placement_pending = Active(state).has_value();
        PlaceNext(state, rng, room);
        return EnterResult::Completed;
    }

    auto Relocate(SessionState& state, std::mt19937_64& rng) -> std::optional<RoomIdxT>
    {
        ObjectiveState& obj = state.objectives;
        if (!obj.active_room) return std::nullopt;

        RoomIdxT const from = *obj.active_room;
        RoomState& old_room = state.rooms[from];
        PlayerClass const cls = *old_room.required_class;

        // take the marker off the board so the old room is a candidate only by exclusion
        old_room.has_quest = false;
        old_room.required_class.reset();

        std::vector<RoomIdxT> candidates = AvailableRooms(state, Pickup::Objective);
        std::erase(candidates, from);

        RoomIdxT to = from;
        if (!candidates.empty())
        {
            std::uniform_int_distribution<std::size_t> dist(0, candidates.size() - 1);
            to = candidates[dist(rng)];
        }

        state.rooms[to].has_quest = true;
        state.rooms[to].required_class = cls;
        obj.active_room = to;
        if (to == from) return std::nullopt;
        return to;
    }

    auto SpawnCrystal(SessionState& state, std::mt19937_64& rng) -> std::optional<RoomIdxT>
    {
        ObjectiveState& obj = state.objectives;
        if (obj.crystal_spawned) return obj.crystal_room;

        auto const room = PickAvailableRoom(state, Pickup::Crystal, rng);
        if (!room) return std::nullopt;

        state.rooms[*room].has_crystal = true;
        obj.crystal_spawned = true;
        obj.crystal_room = room;
        return room;
    }

    auto TryClaimCrystal(SessionState& state, RoomIdxT const room) -> bool
    {
        RoomState& r = state.rooms[room];
        if (!r.has_crystal) return false;
        r.has_crystal = false;
        state.objectives.crystal_room.reset();
        state.objectives.crystal_claimed = true;
        return true;
    }
}
