//
// Created by Malik T on 19/08/2025.
//

#ifndef MANORGAME_INSPECTOR_HPP
#define MANORGAME_INSPECTOR_HPP

#include <random>

#include "../core/Types.hpp"
#include "../core/Session.hpp"

namespace manor::core::debug
{
    // Friend-level access to a session for tests and scenario setup.
    struct Inspector
    {
        static inline auto Mutable(Session& s) -> SessionState& { return s.state_; }

        static inline auto Rng(Session& s) -> std::mt19937_64& { return s.rng_; }

        static inline auto Cfg(Session& s) -> Config& { return s.cfg_; }

        // Moves the active objective marker; for deterministic scenarios.
        static inline auto PutObjective(Session& s, RoomIdxT room) -> void
        {
            SessionState& st = s.state_;
            MNR_ASSERT(st.objectives.active_room.has_value(), "No active objective to move");
            RoomState& from = st.rooms[*st.objectives.active_room];
            PlayerClass const cls = *from.required_class;
            from.has_quest = false;
            from.required_class.reset();
            st.rooms[room].has_quest = true;
            st.rooms[room].required_class = cls;
            st.objectives.active_room = room;
        }

        // Moves (or places) the revival item.
        static inline auto PutRevivalItem(Session& s, RoomIdxT room) -> void
        {
            SessionState& st = s.state_;
            for (RoomState& r : st.rooms) r.has_revival_item = false;
            for (PlayerState& p : st.players) p.carries_revival_item = false;
            st.rooms[room].has_revival_item = true;
            st.revival_item_pending = false;
        }
    };
}

#endif //MANORGAME_INSPECTOR_HPP
