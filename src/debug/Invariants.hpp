//
// Created by Malik T on 19/08/2025.
//

#ifndef MANORGAME_INVARIANTS_HPP
#define MANORGAME_INVARIANTS_HPP

#include <algorithm>
#include <ranges>
#include <set>

#include "../core/Session.hpp"
#include "../core/Exception.hpp"

namespace manor::core::debug
{
    // A second layer of checks over the whole session. Throws AssertionError on the first
    // broken invariant.
    inline auto CheckInvariants(Session const& session) -> void
    {
#if MNR_ENABLE_TEST_HOOKS == false
        (void)session;
#else
    SessionState const& s = session.State();
    RoomCatalog const& catalog = session.Catalog();

    MNR_ASSERT(s.rooms.size() == catalog.RoomCount(), "Room state out of sync with catalog");

    // 1) Objective bookkeeping
    MNR_ASSERT(s.objectives.completed.size() <= s.objectives.queue.size(), "More objectives completed than queued");

    std::size_t quests = 0, crystals = 0, items = 0;
    for (std::size_t i{}; i < s.rooms.size(); ++i)
    {
        RoomState const& r = s.rooms[i];
        quests += r.has_quest;
        crystals += r.has_crystal;
        items += r.has_revival_item;

        // 2) Single pickup per room, a sprung trap is still armed
        MNR_ASSERT(!(r.has_quest && r.has_crystal), "Objective and crystal share a room");
        MNR_ASSERT(!r.trap_triggered || r.trapped, "Trap sprung in an unarmed room");
        if (r.trap_triggered)
            MNR_ASSERT(s.phase == Phase::SurvivorSelection, "Sprung trap outlived survivor selection");
        MNR_ASSERT(r.has_quest == r.required_class.has_value(), "Objective marker without class");
        if (r.has_quest)
            MNR_ASSERT(s.objectives.active_room == static_cast<RoomIdxT>(i), "Objective outside the active room");

        for (PlyrIdxT const p : r.eliminated_here)
        {
            MNR_ASSERT(p < s.players.size(), "Unknown player in eliminated_here");
            MNR_ASSERT(s.players[p].eliminated, "Living player listed as eliminated");
        }
    }
    MNR_ASSERT(quests <= 1, "More than one active objective");
    MNR_ASSERT(crystals <= 1, "More than one crystal");

    items += static_cast<std::size_t>(std::ranges::count_if(s.players, [](PlayerState const& p)
    {
        return p.carries_revival_item;
    }));
    MNR_ASSERT(items <= 1, "More than one revival item");

    // 3) Players
    for (PlayerState const& p : s.players)
    {
        if (p.role == Role::Killer)
        {
            MNR_ASSERT(p.gold == 0, "Killer holds gold");
            MNR_ASSERT(!p.eliminated, "Killer eliminated");
        }
        if (p.eliminated)
        {
            MNR_ASSERT(p.gold == 0, "Eliminated player holds gold");
            MNR_ASSERT(p.poison_countdown == 0, "Eliminated player still poisoned");
            MNR_ASSERT(!p.carries_revival_item, "Eliminated player carries the revival item");
        }
    }

    // 4) Phase gates
    if (!s.started)
    {
        MNR_ASSERT(s.phase == Phase::Waiting && s.turn == 0, "Lobby outside waiting phase");
        return;
    }
    MNR_ASSERT(s.turn >= 1, "Started session with turn 0");
    MNR_ASSERT(s.phase != Phase::Waiting && s.phase != Phase::Processing, "Observable phase is transient");
    MNR_ASSERT((s.phase == Phase::GameOver) == s.winner.has_value(), "Winner set outside game over");

    if (s.phase == Phase::KillerSelection)
    {
        for (auto const& [k, sel] : s.power_selections)
            MNR_ASSERT(sel.complete, "Killer selection with an incomplete power");
    }
    if (s.phase == Phase::RageSecondSelection)
        MNR_ASSERT(!s.resolution.second_chance_pending.empty(), "Second-chance phase without a grant");

    for (auto const& [p, pending] : s.pending_actions)
    {
        MNR_ASSERT(p < s.players.size(), "Pending action of unknown player");
        MNR_ASSERT(catalog.IsRoom(pending.room), "Pending action on unknown room");
    }
#endif
    }
}

#endif //MANORGAME_INVARIANTS_HPP
