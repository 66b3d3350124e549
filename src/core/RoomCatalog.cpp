//
// Created by Malik T on 03/11/2025.
//
#include "RoomCatalog.hpp"

#include <algorithm>
#include <limits>
#include <ranges>
#include <fmt/format.h>
#include "Exception.hpp"

namespace manor::core
{
    RoomCatalog::RoomCatalog(std::vector<FloorDef> floors)
    {
        using error::Code;
        if (floors.empty())
            MNR_THROW(Code::State, "Room catalog has no floors");

        for (FloorDef& f : floors)
        {
            if (f.rooms.empty())
                MNR_THROW(Code::State, fmt::format("Floor '{}' has no rooms", f.name));

            auto const floor_idx = static_cast<FloorIdxT>(floors_.size());
            by_floor_.emplace_back();
            for (std::string& r : f.rooms)
            {
                if (Find(r).has_value())
                    MNR_THROW(Code::State, fmt::format("Duplicate room name '{}'", r));
                if (rooms_.size() >= std::numeric_limits<RoomIdxT>::max())
                    MNR_THROW(Code::State, "Too many rooms in catalog");

                by_floor_.back().push_back(static_cast<RoomIdxT>(rooms_.size()));
                rooms_.push_back(RoomInfo{std::move(r), floor_idx});
            }
            floors_.push_back(std::move(f.name));
        }
    }

    auto RoomCatalog::Reference() -> RoomCatalog const&
    {
        static RoomCatalog const catalog{{
            {"basement", {"Cave", "Wine Cellar", "Boiler Room", "Storage"}},
            {"ground_floor", {"Kitchen", "Living Room", "Dining Room", "Hallway"}},
            {"upper_floor", {"Master Bedroom", "Guest Room", "Bathroom", "Attic"}}
        }};
        return catalog;
    }

    auto RoomCatalog::FloorOf(RoomIdxT const room) const -> FloorIdxT
    {
        MNR_ASSERT(IsRoom(room), "FloorOf on unknown room");
        return rooms_[room].floor;
    }

    auto RoomCatalog::NameOf(RoomIdxT const room) const -> std::string const&
    {
        MNR_ASSERT(IsRoom(room), "NameOf on unknown room");
        return rooms_[room].name;
    }

    auto RoomCatalog::FloorName(FloorIdxT const floor) const -> std::string const&
    {
        MNR_ASSERT(IsFloor(floor), "FloorName on unknown floor");
        return floors_[floor];
    }

    auto RoomCatalog::RoomsOnFloor(FloorIdxT const floor) const -> std::span<RoomIdxT const>
    {
        MNR_ASSERT(IsFloor(floor), "RoomsOnFloor on unknown floor");
        return by_floor_[floor];
    }

    auto RoomCatalog::Find(std::string_view const name) const -> std::optional<RoomIdxT>
    {
        auto const it = std::ranges::find_if(rooms_, [name](RoomInfo const& r) { return r.name == name; });
        if (it == std::cend(rooms_)) return std::nullopt;
        return static_cast<RoomIdxT>(std::distance(std::cbegin(rooms_), it));
    }

    auto RoomCatalog::FindFloor(std::string_view const name) const -> std::optional<FloorIdxT>
    {
        auto const it = std::ranges::find(floors_, name);
        if (it == std::cend(floors_)) return std::nullopt;
        return static_cast<FloorIdxT>(std::distance(std::cbegin(floors_), it));
    }
}
