//
// Created by Malik T on 04/11/2025.
//

#ifndef MANORGAME_OUTBOUND_HPP
#define MANORGAME_OUTBOUND_HPP

#include <variant>
#include "Types.hpp"
#include "Actions.hpp"
#include "State.hpp"
#include "Exception.hpp"

namespace manor::core
{
    struct AudienceAll {};
    struct AudienceRole { Role role{}; };
    struct AudiencePlayer { PlyrIdxT player{}; };

    using Audience = std::variant<AudienceAll, AudienceRole, AudiencePlayer>;

    enum class NoticeKind : std::uint8_t
    {
        Event = 0,
        PhaseChange,
        NewTurn,
        GameStarted,
        GameOver,
        GameReset,
        PlayerActed,
        PlayerJoined,
        PlayerDisconnected,
        RoleChanged,
        PowerActionRequired,
        Trapped,
        TurnSkipped,
        ObjectiveFound,
        SecondChanceGranted
    };

    struct Notice
    {
        NoticeKind kind{};
        std::string text;
        std::optional<Phase> phase{};
        std::optional<PowerKind> power{};
    };

    // Marker: every recipient gets the session view filtered for its own role.
    struct StateUpdate {};

    struct Violation { error::RuleViolation violation; };
    struct Rejection { error::LobbyError error; };

    using Message = std::variant<Notice, StateUpdate, Violation, Rejection>;

    struct Broadcast
    {
        Audience audience;
        Message message;
    };

    // Append-only sink for the events and messages one session operation produces.
    class Outbox
    {
    public:
        Outbox(SessionState& state, std::vector<Broadcast>& out) : state_(state), out_(out) {}

        // Logs a game event and tells its audience about it.
        auto Event(EventKind kind, std::string message, std::optional<Role> for_role = std::nullopt) -> void;
        auto Notify(Audience audience, Notice notice) -> void;
        auto Notify(Audience audience, NoticeKind kind, std::string text) -> void;
        auto Reject(PlyrIdxT player, error::RuleViolation const& v) -> void;
        auto Reject(PlyrIdxT player, error::LobbyError const& e) -> void;
        auto StateChanged() -> void;
        auto StateChangedFor(PlyrIdxT player) -> void;

    private:
        SessionState& state_;
        std::vector<Broadcast>& out_;
    };
}

#endif //MANORGAME_OUTBOUND_HPP
