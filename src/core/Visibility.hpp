//
// Created by Malik T on 06/11/2025.
//

#ifndef MANORGAME_VISIBILITY_HPP
#define MANORGAME_VISIBILITY_HPP

#include "State.hpp"

namespace manor::core
{
    struct PlayerView
    {
        PlyrIdxT index{};
        std::string name;
        PlayerClass player_class{};
        Role role{};
        bool is_host{false};
        bool eliminated{false};
        std::optional<RoomIdxT> current_room{};
        bool carries_revival_item{false};
        std::optional<std::uint32_t> gold{};
        std::optional<std::uint8_t> poison_countdown{};
        bool immobilized_next_turn{false};

        auto operator==(PlayerView const&) const -> bool = default;
    };

    struct RoomView
    {
        RoomIdxT index{};
        bool locked{false};
        bool trapped{false};
        bool trap_triggered{false};
        bool highlighted{false};
        std::uint8_t poison_turns_remaining{0};
        bool has_mimic{false};
        bool has_quest{false};
        std::optional<PlayerClass> required_class{};
        bool has_crystal{false};
        bool has_revival_item{false};
        std::vector<PlyrIdxT> eliminated_here;

        auto operator==(RoomView const&) const -> bool = default;
    };

    struct PendingView
    {
        PlyrIdxT player{};
        RoomIdxT room{};

        auto operator==(PendingView const&) const -> bool = default;
    };

    struct PowerSelectionView
    {
        PlyrIdxT player{};
        std::vector<PowerKind> options;
        std::optional<PowerKind> selected{};
        std::optional<PowerTarget> target{};
        bool complete{false};

        auto operator==(PowerSelectionView const&) const -> bool = default;
    };

    struct ActiveEffectView
    {
        PowerKind kind{};
        std::vector<PlyrIdxT> used_by;
        std::vector<RoomIdxT> rooms;
        std::vector<FloorIdxT> floors;
        bool relocate_objective{false};

        auto operator==(ActiveEffectView const&) const -> bool = default;
    };

    struct EventView
    {
        std::uint32_t turn{};
        EventKind kind{};
        std::string message;

        auto operator==(EventView const&) const -> bool = default;
    };

    // Snapshot handed to one audience. Built fresh, shares nothing with the session.
    struct SessionView
    {
        std::string code;
        // unset = unfiltered lobby / debug view
        std::optional<Role> viewer{};
        Phase phase{Phase::Waiting};
        std::uint32_t turn{0};
        bool started{false};
        std::optional<Winner> winner{};
        PlyrIdxT host{0};

        std::vector<PlayerView> players;
        std::vector<RoomView> rooms;
        std::vector<PendingView> pending_actions;
        std::vector<PowerSelectionView> power_selections;
        std::vector<ActiveEffectView> active_effects;
        std::vector<PlyrIdxT> second_chance_pending;

        std::uint8_t objectives_total{0};
        std::uint8_t objectives_completed{0};
        bool crystal_spawned{false};

        std::vector<EventView> events;

        auto operator==(SessionView const&) const -> bool = default;
    };

    // Role-filtered view. Before the game starts there is nothing secret and the
    // full lobby state is returned.
    auto Filter(SessionState const& state, Role viewer) -> SessionView;

    // Unfiltered view (lobby, debugging, tests).
    auto FullView(SessionState const& state) -> SessionView;
}

#endif //MANORGAME_VISIBILITY_HPP
