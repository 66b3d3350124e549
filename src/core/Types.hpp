//
// Created by Malik T on 03/11/2025.
//

#ifndef MANORGAME_TYPES_HPP
#define MANORGAME_TYPES_HPP

#define MNR_ENABLE_TEST_HOOKS true

#include <cstdint>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>
#include <array>
#include <random>
#include <string>
#include <string_view>

namespace manor::core::constants
{
    inline constexpr std::size_t MaxPlayers = 8;
    inline constexpr std::size_t PowerDrawCount = 3;
    inline constexpr std::uint8_t PoisonRoomTurns = 3;
    inline constexpr std::uint8_t PoisonPlayerTurns = 10;
    inline constexpr std::uint32_t GoldPerSearch = 1;
    inline constexpr std::uint8_t BarricadeRooms = 2;
    inline constexpr std::uint8_t DecoyRooms = 2;
    inline constexpr std::size_t SessionCodeLength = 4;
}

namespace manor::core
{
    using PlyrIdxT = std::uint8_t;
    using RoomIdxT = std::uint8_t;
    using FloorIdxT = std::uint8_t;

    enum class Role : std::uint8_t
    {
        Survivor = 0,
        Killer
    };

    // Avatar selector. Survivor objectives are keyed on it.
    enum class PlayerClass : std::uint8_t
    {
        Archer = 0,
        Assassin,
        Barbarian,
        Bard,
        Elf,
        Warrior,
        Mage,
        OrcBerserker,
        OrcShaman,
        OrcKing
    };

    inline constexpr std::size_t PlayerClassCount = 10;

    enum class Phase : std::uint8_t
    {
        Waiting = 0,
        SurvivorSelection,
        KillerPowerSelection,
        KillerSelection,
        Processing,
        RageSecondSelection,
        GameOver
    };

    enum class Winner : std::uint8_t
    {
        Survivors = 0,
        Killers
    };

    struct Config
    {
        std::uint64_t seed{std::random_device{}()};
        std::size_t   max_players{constants::MaxPlayers};
        std::size_t   power_draw_count{constants::PowerDrawCount};
        // when set, a killer is not offered a power it has already been offered this game
        bool          exclude_seen_powers{false};
        std::uint8_t  poison_room_turns{constants::PoisonRoomTurns};
        std::uint8_t  poison_player_turns{constants::PoisonPlayerTurns};
        std::uint32_t gold_per_search{constants::GoldPerSearch};
        std::uint8_t  barricade_rooms{constants::BarricadeRooms};
        std::uint8_t  decoy_rooms{constants::DecoyRooms};
        bool          conspiracy_mode{false};
    };

    struct PlayerProfile
    {
        std::string name;
        PlayerClass player_class{PlayerClass::Archer};
        Role        role{Role::Survivor};
    };

    inline auto to_string(Role r) -> std::string_view
    {
        return r == Role::Survivor ? "survivor" : "killer";
    }

    inline auto to_string(Phase p) -> std::string_view
    {
        switch (p)
        {
        case Phase::Waiting: return "waiting";
        case Phase::SurvivorSelection: return "survivor_selection";
        case Phase::KillerPowerSelection: return "killer_power_selection";
        case Phase::KillerSelection: return "killer_selection";
        case Phase::Processing: return "processing";
        case Phase::RageSecondSelection: return "rage_second_selection";
        case Phase::GameOver: return "game_over";
        }
        return "unknown";
    }

    inline auto to_string(PlayerClass c) -> std::string_view
    {
        static constexpr std::array<std::string_view, PlayerClassCount> names{
            "Archer", "Assassin", "Barbarian", "Bard", "Elf", "Warrior", "Mage",
            "Orc Berserker", "Orc Shaman", "Orc King"
        };
        return names[static_cast<std::size_t>(c)];
    }
}

#endif //MANORGAME_TYPES_HPP
