//
// Created by Malik T on 03/11/2025.
//

#ifndef MANORGAME_EXCEPTION_HPP
#define MANORGAME_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <stdexcept>
#include <utility>
#include <fmt/format.h>
#include "Types.hpp"

namespace manor::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Rules, // turn resolver misuse (not user invalid move)
        State, // session state misuse (not user invalid move)
        InvalidAction, // user/remote proposed action cannot be applied
        Network, // transport failure
        Serialization, // FlatBuffers verification/build errors
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidActionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct NetworkError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::InvalidAction: throw InvalidActionError(std::move(msg), c, loc);
        case Code::Network: throw NetworkError(std::move(msg), c, loc);
        case Code::Serialization: throw SerializationError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define MNR_THROW(code_enum, msg) ::manor::core::error::fail((code_enum), (msg))
#define MNR_ASSERT(cond, msg) do { if(!(cond)) ::manor::core::error::fail(::manor::core::error::Code::Assertion, (msg)); } while(0)

    // Fine-grained reasons; grouped by action type.
    enum class RuleViolationCode : std::uint16_t
    {
        // Generic/flow
        UnknownPlayer,
        GameNotStarted,
        GameAlreadyOver,
        WrongPhase_SurvivorSelectionRequired,
        WrongPhase_KillerSelectionRequired,
        WrongPhase_PowerSelectionRequired,
        WrongRole_SurvivorRequired,
        WrongRole_KillerRequired,
        ActorEliminated,
        AlreadyActed,

        // Room selection
        Room_Unknown,
        Room_Locked,
        Room_Immobilized,
        Room_SecondChanceNotGranted,

        // Power selection
        Power_NotOffered,
        Power_AlreadyComplete,
        Power_NoneSelected,
        Power_TargetNotRequired,
        Target_WrongCount,
        Target_UnknownRoom,
        Target_DuplicateRoom,
        Target_NotOnePerFloor,
        Target_UnknownFloor,
        Target_FloorRequired,

        // Revival item
        Revive_NotCarrying,
        Revive_TargetUnknown,
        Revive_TargetNotEliminated,
        Revive_TargetNotInRoom,

        // Safety net
        Internal_Unreachable
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<Phase> phase{};
        std::optional<PlyrIdxT> actor{};
        std::optional<RoomIdxT> room{};
        std::optional<PlyrIdxT> target{};

        // Small integers useful in error messages
        std::optional<std::uint8_t> expected_count{};
        std::optional<std::uint8_t> attempted_count{};

        // Quick helpers to build enriched violations (fluent style).
        auto with_phase(Phase p) -> RuleViolation&
        {
            phase = p;
            return *this;
        }

        auto with_actor(PlyrIdxT s) -> RuleViolation&
        {
            actor = s;
            return *this;
        }

        auto with_room(RoomIdxT r) -> RuleViolation&
        {
            room = r;
            return *this;
        }

        auto with_target(PlyrIdxT t) -> RuleViolation&
        {
            target = t;
            return *this;
        }

        auto with_expected(std::uint8_t v) -> RuleViolation&
        {
            expected_count = v;
            return *this;
        }

        auto with_attempted(std::uint8_t v) -> RuleViolation&
        {
            attempted_count = v;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        // Flow
        case E::UnknownPlayer: return "Unknown player";
        case E::GameNotStarted: return "Game has not started";
        case E::GameAlreadyOver: return "Game is over";
        case E::WrongPhase_SurvivorSelectionRequired: return "Wrong phase (survivor selection required)";
        case E::WrongPhase_KillerSelectionRequired: return "Wrong phase (killer selection required)";
        case E::WrongPhase_PowerSelectionRequired: return "Wrong phase (power selection required)";
        case E::WrongRole_SurvivorRequired: return "Wrong role (survivor required)";
        case E::WrongRole_KillerRequired: return "Wrong role (killer required)";
        case E::ActorEliminated: return "Eliminated players cannot act";
        case E::AlreadyActed: return "Already acted this phase";

        // Room
        case E::Room_Unknown: return "Room: unknown room";
        case E::Room_Locked: return "Room: room is locked";
        case E::Room_Immobilized: return "Room: immobilized, select your current room to pass";
        case E::Room_SecondChanceNotGranted: return "Room: no second chance granted";

        // Power
        case E::Power_NotOffered: return "Power: not among the offered powers";
        case E::Power_AlreadyComplete: return "Power: selection already complete";
        case E::Power_NoneSelected: return "Power: no power selected";
        case E::Power_TargetNotRequired: return "Power: selected power takes no target";
        case E::Target_WrongCount: return "Target: wrong number of rooms";
        case E::Target_UnknownRoom: return "Target: unknown room";
        case E::Target_DuplicateRoom: return "Target: duplicate room";
        case E::Target_NotOnePerFloor: return "Target: exactly one room per floor required";
        case E::Target_UnknownFloor: return "Target: unknown floor";
        case E::Target_FloorRequired: return "Target: a floor is required";

        // Revival
        case E::Revive_NotCarrying: return "Revive: not carrying the revival item";
        case E::Revive_TargetUnknown: return "Revive: unknown target";
        case E::Revive_TargetNotEliminated: return "Revive: target is not eliminated";
        case E::Revive_TargetNotInRoom: return "Revive: target is not in your room";

        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        auto s = fmt::format("{}", to_string(v.code));
        if (v.phase) s += fmt::format(" | phase={}", to_string(*v.phase));
        if (v.actor) s += fmt::format(" | actor=P{}", static_cast<int>(*v.actor));
        if (v.room) s += fmt::format(" | room={}", static_cast<int>(*v.room));
        if (v.target) s += fmt::format(" | target=P{}", static_cast<int>(*v.target));
        if (v.expected_count) s += fmt::format(" | expected={}", *v.expected_count);
        if (v.attempted_count) s += fmt::format(" | attempted={}", *v.attempted_count);
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;

    // Lobby / lifecycle rejections surfaced to the requester.
    enum class LobbyErrorCode : std::uint8_t
    {
        SessionNotFound,
        AlreadyStarted,
        SessionFull,
        EmptyName,
        UnknownPlayer,
        NoSurvivor,
        NoKiller,
        DuplicateSurvivorClass
    };

    struct LobbyError
    {
        LobbyErrorCode code{};
        std::string reason;
    };

    inline auto to_string(LobbyErrorCode c) -> std::string_view
    {
        using E = LobbyErrorCode;
        switch (c)
        {
        case E::SessionNotFound: return "Session not found";
        case E::AlreadyStarted: return "Game already started";
        case E::SessionFull: return "Game is full";
        case E::EmptyName: return "Player name is empty";
        case E::UnknownPlayer: return "Player not found";
        case E::NoSurvivor: return "At least one survivor is required";
        case E::NoKiller: return "At least one killer is required";
        case E::DuplicateSurvivorClass: return "Two survivors share a class";
        }
        return "Unknown";
    }

    inline auto lobby_error(LobbyErrorCode c) -> LobbyError
    {
        return LobbyError{c, std::string{to_string(c)}};
    }

    template <typename T>
    using LobbyResult = std::expected<T, LobbyError>;
}

#endif //MANORGAME_EXCEPTION_HPP
