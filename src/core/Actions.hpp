//
// Created by Malik T on 03/11/2025.
//

#ifndef MANORGAME_ACTIONS_HPP
#define MANORGAME_ACTIONS_HPP

#include <variant>
#include "Types.hpp"

namespace manor::core
{
    enum class PowerKind : std::uint8_t
    {
        Reveal = 0,
        RelocateOnMiss,
        FreezeTrap,
        Poison,
        Locate,
        Barricade,
        SecondChance,
        Decoy
    };

    inline constexpr std::size_t PowerKindCount = 8;

    // Targeting payload of a power; which fields matter depends on the power's targeting kind.
    struct PowerTarget
    {
        std::vector<RoomIdxT> rooms;
        std::optional<FloorIdxT> floor;

        auto operator==(PowerTarget const&) const -> bool = default;
    };

    struct SelectRoomAction      { RoomIdxT room{}; };
    struct SelectPowerAction     { PowerKind power{}; };
    struct PowerTargetAction     { PowerTarget target; };
    struct UseRevivalItemAction  { PlyrIdxT target{}; };

    using PlayerAction = std::variant<
      SelectRoomAction, SelectPowerAction, PowerTargetAction, UseRevivalItemAction>;

    enum class ActionOutcome : std::uint8_t
    {
        Invalid,
        Applied,
        PhaseAdvanced,
        TurnResolved,
        GameEnded
    };
} // namespace manor::core

#endif //MANORGAME_ACTIONS_HPP
