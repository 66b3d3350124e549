//
// Created by Malik T on 03/11/2025.
//

#ifndef MANORGAME_STATE_HPP
#define MANORGAME_STATE_HPP

#include <map>
#include <set>
#include <string>
#include "Types.hpp"
#include "Actions.hpp"

namespace manor::core
{
    struct PlayerState
    {
        std::string name;
        PlayerClass player_class{PlayerClass::Archer};
        Role role{Role::Survivor};
        bool is_host{false};
        bool eliminated{false};
        std::optional<RoomIdxT> current_room{};
        bool carries_revival_item{false};
        std::uint32_t gold{0};
        // 0 = not poisoned, otherwise turns left before elimination
        std::uint8_t poison_countdown{0};
        bool immobilized_next_turn{false};
    };

    struct RoomState
    {
        bool locked{false};
        // armed (killer-visible) and triggered (survivor-visible) are never both set
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
    };

    struct PendingAction
    {
        RoomIdxT room{};
        // immobilized survivor staying put; no search this turn
        bool passed{false};
        // hazards the selection set off when it was recorded
        bool hit_trap{false};
        bool hit_decoy{false};
    };

    struct PowerSelection
    {
        std::vector<PowerKind> options;
        std::optional<PowerKind> selected{};
        std::optional<PowerTarget> target{};
        bool complete{false};
    };

    struct ActiveEffect
    {
        std::vector<PlyrIdxT> used_by;
        std::vector<RoomIdxT> rooms;
        std::vector<FloorIdxT> floors;
        bool relocate_objective{false};
    };

    struct Objective
    {
        PlayerClass required_class{};
        PlyrIdxT owner{};
    };

    struct ObjectiveState
    {
        std::vector<Objective> queue;
        std::vector<PlayerClass> completed;
        std::optional<RoomIdxT> active_room{};
        // the next queued objective could not be placed yet
        bool placement_pending{false};
        bool crystal_spawned{false};
        std::optional<RoomIdxT> crystal_room{};
        bool crystal_claimed{false};
    };

    // Scratch state of one resolution; survives a second-chance suspension.
    struct ResolutionState
    {
        bool objective_obtained{false};
        std::set<RoomIdxT> lock_set;
        std::vector<PlyrIdxT> second_chance_pending;
        std::map<PlyrIdxT, RoomIdxT> second_selections;
    };

    enum class EventKind : std::uint8_t
    {
        PlayerJoined,
        RoleChanged,
        GameStarted,
        GameReset,
        PhaseChange,
        NewTurn,
        PowerUsed,
        SoundClue,
        ObjectivePlaced,
        ObjectiveFound,
        SearchNoObjective,
        ObjectiveRelocated,
        RevivalItemFound,
        RevivalItemRespawn,
        Revival,
        Elimination,
        RoomLocked,
        Poisoned,
        PoisonDeath,
        DecoyTriggered,
        CrystalSpawned,
        CrystalClaimed,
        SecondChance,
        GameOver
    };

    struct GameEvent
    {
        std::uint32_t turn{};
        EventKind kind{};
        std::string message;
        // unset = everybody
        std::optional<Role> for_role{};
    };

    // Authoritative, mutable state of one session. Plain data; the rules live elsewhere.
    struct SessionState
    {
        std::string code;
        PlyrIdxT host{0};
        Phase phase{Phase::Waiting};
        std::uint32_t turn{0};
        bool started{false};
        std::optional<Winner> winner{};
        std::vector<GameEvent> events;

        std::vector<PlayerState> players;
        std::vector<RoomState> rooms;

        std::map<PlyrIdxT, PendingAction> pending_actions;
        std::map<PlyrIdxT, PowerSelection> power_selections;
        std::map<PowerKind, ActiveEffect> active_effects;
        std::map<PlyrIdxT, std::set<PowerKind>> seen_powers;

        ObjectiveState objectives;
        bool revival_item_pending{false};
        std::vector<RoomIdxT> rooms_visited_since_objective;

        ResolutionState resolution;
    };
} // namespace manor::core

#endif //MANORGAME_STATE_HPP
