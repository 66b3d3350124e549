#include "AuditLogger.hpp"

#include <string_view>
#include <vector>
#include <fmt/format.h>

#include "../core/Powers.hpp"

using namespace manor::core;

namespace
{

auto s_room(RoomCatalog const& c, std::optional<RoomIdxT> const r) -> std::string
{
    return r ? c.NameOf(*r) : std::string("--");
}

auto s_rooms(RoomCatalog const& c, std::vector<RoomIdxT> const& rooms) -> std::string
{
    std::string body;
    for (std::size_t i{}; i < rooms.size(); ++i)
    {
        body += (i ? "," : "");
        body += c.NameOf(rooms[i]);
    }
    return body;
}

auto s_action(RoomCatalog const& c, PlayerAction const& a) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, SelectRoomAction>)
            {
                return c.IsRoom(act.room)
                    ? fmt::format("Room({})", c.NameOf(act.room))
                    : fmt::format("Room(#{})", static_cast<int>(act.room));
            }
            else if constexpr (std::is_same_v<T, SelectPowerAction>)
            {
                return fmt::format("Power({})", to_string(act.power));
            }
            else if constexpr (std::is_same_v<T, PowerTargetAction>)
            {
                for (RoomIdxT const r : act.target.rooms)
                {
                    if (!c.IsRoom(r)) return std::string("Target[?]");
                }
                if (act.target.floor)
                    return fmt::format("Target[floor={}]", static_cast<int>(*act.target.floor));
                return fmt::format("Target[{}]", s_rooms(c, act.target.rooms));
            }
            else
            {
                return fmt::format("Revive(P{})", static_cast<int>(act.target));
            }
        },
        a
    );
}

auto s_outcome(ActionOutcome const m) -> std::string_view
{
    switch (m)
    {
    case ActionOutcome::Invalid:       return "Invalid";
    case ActionOutcome::Applied:       return "Applied";
    case ActionOutcome::PhaseAdvanced: return "PhaseAdvanced";
    case ActionOutcome::TurnResolved:  return "TurnResolved";
    case ActionOutcome::GameEnded:     return "GameEnded";
    }
    return "?";
}

} // anonymous namespace

namespace manor::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(Session const& session, std::uint64_t seed) -> void
{
    out_ << fmt::format("Code={}\n", session.Code());
    out_ << fmt::format("Seed={}\n", seed);
    out_ << fmt::format("Players={}\n", session.PlayerCount());
    for (std::size_t i{}; i < session.PlayerCount(); ++i)
    {
        PlayerState const& p = session.State().players[i];
        out_ << fmt::format("  P{} {} {} {}\n", i, p.name, to_string(p.role), to_string(p.player_class));
    }
    out_.flush();
}

auto AuditLogger::action(Session const& session, PlyrIdxT actor, PlayerAction const& a) -> void
{
    out_ << fmt::format(
        "Turn={} phase={} actor=P{} action={}\n",
        session.Turn(),
        to_string(session.PhaseNow()),
        static_cast<int>(actor),
        s_action(session.Catalog(), a)
    );
}

auto AuditLogger::outcome(ActionOutcome m) -> void
{
    out_ << fmt::format("Outcome: {}\n", s_outcome(m));
}

auto AuditLogger::turn(Session const& session) -> void
{
    SessionState const& st = session.State();
    std::string body;
    for (std::size_t i{}; i < st.players.size(); ++i)
    {
        PlayerState const& p = st.players[i];
        body += fmt::format("{}P{}:{}{}:g{}",
                            (i ? "," : ""), i,
                            s_room(session.Catalog(), p.current_room),
                            p.eliminated ? "(x)" : "",
                            p.gold);
    }

    std::vector<RoomIdxT> locked;
    for (std::size_t i{}; i < st.rooms.size(); ++i)
    {
        if (st.rooms[i].locked) locked.push_back(static_cast<RoomIdxT>(i));
    }

    out_ << fmt::format("Resolved: players=[{}] locked=[{}] objectives={}/{}\n",
                        body, s_rooms(session.Catalog(), locked),
                        st.objectives.completed.size(), st.objectives.queue.size());
}

auto AuditLogger::end(Session const& session) -> void
{
    SessionState const& st = session.State();
    std::string_view const winner = !st.winner ? "none"
        : (*st.winner == Winner::Survivors ? "survivors" : "killers");

    out_ << fmt::format("Winner={} turns={} events={}\n", winner, st.turn, st.events.size());
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace manor::core::debug
