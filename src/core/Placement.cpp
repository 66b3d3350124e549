//
// Created by Malik T on 04/11/2025.
//
#include "Placement.hpp"

#include <algorithm>

namespace manor::core
{
    auto KillerRooms(SessionState const& state) -> std::vector<RoomIdxT>
    {
        std::vector<RoomIdxT> out;
        for (PlayerState const& p : state.players)
        {
            if (p.role == Role::Killer && !p.eliminated && p.current_room)
                out.push_back(*p.current_room);
        }
        return out;
    }

    auto AvailableRooms(SessionState const& state, Pickup const kind) -> std::vector<RoomIdxT>
    {
        std::vector<RoomIdxT> const killers = KillerRooms(state);
        std::vector<RoomIdxT> out;
        for (std::size_t i{}; i < state.rooms.size(); ++i)
        {
            RoomState const& r = state.rooms[i];
            auto const idx = static_cast<RoomIdxT>(i);

            if (std::ranges::find(killers, idx) != std::cend(killers)) continue;
            if (r.has_quest || r.has_crystal) continue;

            switch (kind)
            {
            case Pickup::Objective:
            case Pickup::Crystal:
                if (r.locked) continue;
                break;
            case Pickup::RevivalItem:
                if (r.has_revival_item) continue;
                break;
            }
            out.push_back(idx);
        }
        return out;
    }

    auto PickAvailableRoom(SessionState const& state, Pickup const kind, std::mt19937_64& rng)
        -> std::optional<RoomIdxT>
    {
        std::vector<RoomIdxT> const rooms = AvailableRooms(state, kind);
        if (rooms.empty()) return std::nullopt;
        std::uniform_int_distribution<std::size_t> dist(0, rooms.size() - 1);
        return rooms[dist(rng)];
    }

    auto PlaceRevivalItem(SessionState& state, std::mt19937_64& rng) -> std::optional<RoomIdxT>
    {
        auto const room = PickAvailableRoom(state, Pickup::RevivalItem, rng);
        if (!room)
        {
            state.revival_item_pending = true;
            return std::nullopt;
        }
        state.rooms[*room].has_revival_item = true;
        state.revival_item_pending = false;
        return room;
    }
}
