//
// Created by Malik T on 06/11/2025.
//

#ifndef MANORGAME_TURNRESOLVER_HPP
#define MANORGAME_TURNRESOLVER_HPP

#include <span>
#include "Rules.hpp"
#include "Outbound.hpp"

namespace manor::core
{
    class TurnResolver final : public Rules
    {
    public:
        auto Validate(Session const& session, PlyrIdxT actor, PlayerAction const& a) const -> CheckResult override;
        auto Apply(Session& session, PlyrIdxT actor, PlayerAction const& a) -> void override;
        auto Advance(Session& session) -> ActionOutcome override;
        auto Begin(Session& session) -> void override;

    private:
        auto ValidateRoom(Session const& s, PlyrIdxT actor, RoomIdxT room) const -> CheckResult;
        auto ValidatePower(Session const& s, PlyrIdxT actor, PowerKind power) const -> CheckResult;
        auto ValidateTarget(Session const& s, PlyrIdxT actor, PowerTarget const& target) const -> CheckResult;
        auto ValidateRevive(Session const& s, PlyrIdxT actor, PlyrIdxT target) const -> CheckResult;

        auto ApplyRoom(Session& s, PlyrIdxT actor, RoomIdxT room) -> void;
        auto Revive(Session& s, PlyrIdxT carrier, PlyrIdxT target) -> void;

        // Phase edges
        auto EnterPowerSelection(Session& s) -> void;
        auto EnterKillerSelection(Session& s) -> void;

        // Resolution, split where a second-chance window may suspend it.
        auto Resolve(Session& s) -> ActionOutcome;
        auto ResumeAfterSecondChance(Session& s) -> ActionOutcome;
        auto FinishResolution(Session& s) -> ActionOutcome;

        auto PlacePendingPickups(Session& s) -> void;
        auto UpdateLocks(Session& s) -> void;
        auto ResolveSurvivors(Session& s) -> void;
        auto ResolveKillers(Session& s, std::span<std::pair<PlyrIdxT, RoomIdxT> const> moves, bool grant) -> void;
        auto LockEliminationRooms(Session& s) -> void;
        auto ApplyRelocation(Session& s) -> void;
        auto CheckVictory(Session& s) -> bool;
        auto TickPoison(Session& s) -> void;
        auto NextTurn(Session& s) -> void;

        // `seal` adds the room to this resolution's lock set
        auto Eliminate(Session& s, PlyrIdxT victim, RoomIdxT room, bool seal) -> void;
        auto EndGame(Session& s, Winner w) -> void;
        auto EnterPhase(Session& s, Phase p) -> void;
    };

    auto AliveCount(SessionState const& state, Role role) -> std::size_t;
}

#endif //MANORGAME_TURNRESOLVER_HPP
