//
// Created by Malik T on 03/11/2025.
//

#ifndef MANORGAME_ROOMCATALOG_HPP
#define MANORGAME_ROOMCATALOG_HPP

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "Types.hpp"

namespace manor::core
{
    struct FloorDef
    {
        std::string name;
        std::vector<std::string> rooms;
    };

    struct RoomInfo
    {
        std::string name;
        FloorIdxT floor{};
    };

    // Static topology, shared read-only by every session.
    class RoomCatalog
    {
    public:
        RoomCatalog() = delete;
        // Throws StateError on an empty catalog, an empty floor or a duplicate room name.
        explicit RoomCatalog(std::vector<FloorDef> floors);

        // basement / ground floor / upper floor, four rooms each
        static auto Reference() -> RoomCatalog const&;

        auto AllRooms() const noexcept -> std::span<RoomInfo const> { return rooms_; }
        auto RoomCount() const noexcept -> std::size_t { return rooms_.size(); }
        auto FloorCount() const noexcept -> std::size_t { return floors_.size(); }

        auto FloorOf(RoomIdxT room) const -> FloorIdxT;
        auto NameOf(RoomIdxT room) const -> std::string const&;
        auto FloorName(FloorIdxT floor) const -> std::string const&;
        auto RoomsOnFloor(FloorIdxT floor) const -> std::span<RoomIdxT const>;

        auto Find(std::string_view name) const -> std::optional<RoomIdxT>;
        auto FindFloor(std::string_view name) const -> std::optional<FloorIdxT>;

        auto IsRoom(RoomIdxT room) const noexcept -> bool { return room < rooms_.size(); }
        auto IsFloor(FloorIdxT floor) const noexcept -> bool { return floor < floors_.size(); }

    private:
        std::vector<std::string> floors_;
        std::vector<RoomInfo> rooms_;
        std::vector<std::vector<RoomIdxT>> by_floor_;
    };
}

#endif //MANORGAME_ROOMCATALOG_HPP
