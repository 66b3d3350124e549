//
// Created by Malik T on 06/11/2025.
//
#include "Visibility.hpp"

namespace manor::core
{
    namespace
    {
        auto BuildView(SessionState const& state, std::optional<Role> const viewer) -> SessionView
        {
            bool const full = !viewer.has_value();
            bool const killer_view = full || *viewer == Role::Killer;
            bool const survivor_view = full || *viewer == Role::Survivor;
            auto same_role = [&](Role const r) { return full || *viewer == r; };

            SessionView v;
            v.code = state.code;
            v.viewer = viewer;
            v.phase = state.phase;
            v.turn = state.turn;
            v.started = state.started;
            v.winner = state.winner;
            v.host = state.host;

            v.players.reserve(state.players.size());
            for (std::size_t i{}; i < state.players.size(); ++i)
            {
                PlayerState const& p = state.players[i];
                bool const own_side = same_role(p.role);

                PlayerView pv;
                pv.index = static_cast<PlyrIdxT>(i);
                pv.name = p.name;
                pv.player_class = p.player_class;
                pv.role = p.role;
                pv.is_host = p.is_host;
                pv.eliminated = p.eliminated;
                pv.carries_revival_item = p.carries_revival_item;
                if (own_side || p.eliminated) pv.current_room = p.current_room;
                if (own_side)
                {
                    pv.gold = p.gold;
                    pv.poison_countdown = p.poison_countdown;
                    pv.immobilized_next_turn = p.immobilized_next_turn;
                }
                v.players.push_back(std::move(pv));
            }

            v.rooms.reserve(state.rooms.size());
            for (std::size_t i{}; i < state.rooms.size(); ++i)
            {
                RoomState const& r = state.rooms[i];
                RoomView rv;
                rv.index = static_cast<RoomIdxT>(i);
                rv.locked = r.locked;
                rv.has_quest = r.has_quest;
                rv.required_class = r.required_class;
                rv.has_crystal = r.has_crystal;
                rv.has_revival_item = r.has_revival_item;
                rv.eliminated_here = r.eliminated_here;
                if (killer_view)
                {
                    rv.trapped = r.trapped;
                    rv.highlighted = r.highlighted;
                    rv.has_mimic = r.has_mimic;
                    rv.poison_turns_remaining = r.poison_turns_remaining;
                }
                if (survivor_view)
                {
                    rv.trap_triggered = r.trap_triggered;
                }
                v.rooms.push_back(std::move(rv));
            }

            for (auto const& [player, pending] : state.pending_actions)
            {
                if (same_role(state.players[player].role))
                    v.pending_actions.push_back(PendingView{player, pending.room});
            }

            if (killer_view)
            {
                for (auto const& [player, sel] : state.power_selections)
                {
                    v.power_selections.push_back(PowerSelectionView{
                        player, sel.options, sel.selected, sel.target, sel.complete});
                }
                for (auto const& [kind, eff] : state.active_effects)
                {
                    v.active_effects.push_back(ActiveEffectView{
                        kind, eff.used_by, eff.rooms, eff.floors, eff.relocate_objective});
                }
                v.second_chance_pending = state.resolution.second_chance_pending;
            }

            v.objectives_total = static_cast<std::uint8_t>(state.objectives.queue.size());
            v.objectives_completed = static_cast<std::uint8_t>(state.objectives.completed.size());
            v.crystal_spawned = state.objectives.crystal_spawned;

            for (GameEvent const& e : state.events)
            {
                if (e.for_role && !same_role(*e.for_role)) continue;
                v.events.push_back(EventView{e.turn, e.kind, e.message});
            }
            return v;
        }
    }

    auto Filter(SessionState const& state, Role const viewer) -> SessionView
    {
        if (!state.started) return BuildView(state, std::nullopt);
        return BuildView(state, viewer);
    }

    auto FullView(SessionState const& state) -> SessionView
    {
        return BuildView(state, std::nullopt);
    }
}
