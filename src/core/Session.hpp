//
// Created by Malik T on 06/11/2025.
//

#ifndef MANORGAME_SESSION_HPP
#define MANORGAME_SESSION_HPP

#include <random>
#include <span>
#include <string>
#include "Types.hpp"
#include "Actions.hpp"
#include "Exception.hpp"
#include "Outbound.hpp"
#include "RoomCatalog.hpp"
#include "Rules.hpp"
#include "State.hpp"
#include "Visibility.hpp"

namespace manor::core::debug {struct Inspector;}
namespace manor::core
{
    // One game session: roster, lobby lifecycle and the turn machine. Not thread-safe;
    // a SessionActor owns it and is the only caller.
    class Session
    {
    public:
        Session() = delete;
        Session(std::string code,
                Config const& config,
                PlayerProfile host,
                RoomCatalog const& catalog = RoomCatalog::Reference(),
                std::unique_ptr<Rules> rules = nullptr);

        // Lobby
        auto Join(PlayerProfile profile) -> error::LobbyResult<PlyrIdxT>;
        auto ChangeRole(PlyrIdxT player, Role role, std::optional<PlayerClass> player_class = std::nullopt)
            -> error::LobbyResult<void>;
        auto Start() -> error::LobbyResult<void>;
        // Back to the lobby; the roster is kept.
        auto Reset() -> void;

        // Play. Invalid actions leave the state untouched and notify the actor only.
        auto Submit(PlyrIdxT actor, PlayerAction const& action) -> ActionOutcome;

        // Connection lifecycle as reported by the transport.
        auto OnConnect(PlyrIdxT player) -> void;
        auto OnDisconnect(PlyrIdxT player) -> void;

        // Queues a lobby rejection for `player`.
        auto Reject(PlyrIdxT player, error::LobbyError const& e) -> void;

        auto ViewFor(Role role) const -> SessionView { return Filter(state_, role); }
        auto FullView() const -> SessionView { return core::FullView(state_); }
        auto DrainOutbox() -> std::vector<Broadcast>;

        auto State() const noexcept       -> SessionState const& { return state_; }
        auto Catalog() const noexcept     -> RoomCatalog const&  { return *catalog_; }
        auto Cfg() const noexcept         -> Config const&       { return cfg_; }
        auto Code() const noexcept        -> std::string const&  { return state_.code; }
        auto PhaseNow() const noexcept    -> Phase               { return state_.phase; }
        auto Turn() const noexcept        -> std::uint32_t       { return state_.turn; }
        auto PlayerCount() const noexcept -> std::size_t         { return state_.players.size(); }
        auto RoleOf(PlyrIdxT player) const -> Role;

        //allows class to directly access private data on an instance
        friend class TurnResolver;
        friend struct debug::Inspector;

    private:
        auto Out() -> Outbox { return Outbox{state_, outbox_}; }
        // Survivor/killer split for conspiracy mode, or the roles players picked.
        auto AssignRoles() -> std::vector<Role>;
        auto ClearGame() -> void;

    private:
        Config cfg_;
        RoomCatalog const* catalog_;
        std::unique_ptr<Rules> rules_;
        std::mt19937_64 rng_;

        // Authoritative state
        SessionState state_;
        std::vector<Broadcast> outbox_;
    };

    // Survivors/killers for a conspiracy game of `players` people.
    auto ConspiracySplit(std::size_t players) -> std::pair<std::size_t, std::size_t>;
}

#endif //MANORGAME_SESSION_HPP
