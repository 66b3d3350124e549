//
// Created by Malik T on 06/11/2025.
//
#include "Session.hpp"

#include <algorithm>
#include <set>
#include <utility>
#include <fmt/format.h>
#include "TurnResolver.hpp"

namespace manor::core
{
    auto ConspiracySplit(std::size_t const players) -> std::pair<std::size_t, std::size_t>
    {
        switch (players)
        {
        case 3: return {2, 1};
        case 4: return {2, 2};
        case 5: return {3, 2};
        case 6: return {4, 2};
        case 7: return {4, 3};
        case 8: return {5, 3};
        default: break;
        }
        return {std::max<std::size_t>(1, players - 1), 1};
    }

    Session::Session(std::string code,
                     Config const& config,
                     PlayerProfile host,
                     RoomCatalog const& catalog,
                     std::unique_ptr<Rules> rules) :
        cfg_(config),
        catalog_(&catalog),
        rules_(rules ? std::move(rules) : std::make_unique<TurnResolver>()),
        rng_{cfg_.seed}
    {
        if (host.name.empty())
            MNR_THROW(error::Code::State, "Session host needs a name");
        MNR_ASSERT(cfg_.max_players >= 1 && cfg_.max_players <= constants::MaxPlayers,
                   "max_players out of range");

        state_.code = std::move(code);
        state_.rooms.resize(catalog_->RoomCount());
        state_.host = 0;
        state_.players.push_back(PlayerState{
            .name = std::move(host.name),
            .player_class = host.player_class,
            .role = host.role,
            .is_host = true});
    }

    auto Session::Join(PlayerProfile profile) -> error::LobbyResult<PlyrIdxT>
    {
        using error::LobbyErrorCode;
        if (state_.started)
            return std::unexpected(error::lobby_error(LobbyErrorCode::AlreadyStarted));
        if (state_.players.size() >= cfg_.max_players)
            return std::unexpected(error::lobby_error(LobbyErrorCode::SessionFull));
        if (profile.name.empty())
            return std::unexpected(error::lobby_error(LobbyErrorCode::EmptyName));

        auto const idx = static_cast<PlyrIdxT>(state_.players.size());
        state_.players.push_back(PlayerState{
            .name = std::move(profile.name),
            .player_class = profile.player_class,
            .role = profile.role});

        PlayerState const& p = state_.players.back();
        Out().Event(EventKind::PlayerJoined,
                    fmt::format("{} joined as {} ({})", p.name, to_string(p.role), to_string(p.player_class)));
        Out().StateChanged();
        return idx;
    }

    auto Session::ChangeRole(PlyrIdxT const player, Role const role, std::optional<PlayerClass> const player_class)
        -> error::LobbyResult<void>
    {
        using error::LobbyErrorCode;
        if (state_.started)
            return std::unexpected(error::lobby_error(LobbyErrorCode::AlreadyStarted));
        if (player >= state_.players.size())
            return std::unexpected(error::lobby_error(LobbyErrorCode::UnknownPlayer));

        PlayerState& p = state_.players[player];
        p.role = role;
        if (player_class) p.player_class = *player_class;

        Out().Event(EventKind::RoleChanged,
                    fmt::format("{} is now a {} ({})", p.name, to_string(p.role), to_string(p.player_class)));
        Out().StateChanged();
        return {};
    }

    auto Session::AssignRoles() -> std::vector<Role>
    {
        std::vector<Role> roles;
        roles.reserve(state_.players.size());
        if (!cfg_.conspiracy_mode)
        {
            for (PlayerState const& p : state_.players) roles.push_back(p.role);
            return roles;
        }

        auto const [survivors, killers] = ConspiracySplit(state_.players.size());
        std::vector<std::size_t> order(state_.players.size());
        for (std::size_t i{}; i < order.size(); ++i) order[i] = i;
        std::ranges::shuffle(order, rng_);

        roles.assign(state_.players.size(), Role::Survivor);
        for (std::size_t i{}; i < std::min(killers, order.size()); ++i)
            roles[order[i]] = Role::Killer;
        return roles;
    }

    auto Session::Start() -> error::LobbyResult<void>
    {
        using error::LobbyErrorCode;
        if (state_.started)
            return std::unexpected(error::lobby_error(LobbyErrorCode::AlreadyStarted));

        std::vector<Role> const roles = AssignRoles();
        std::size_t const killers = static_cast<std::size_t>(std::ranges::count(roles, Role::Killer));
        if (killers == roles.size())
            return std::unexpected(error::lobby_error(LobbyErrorCode::NoSurvivor));
        if (killers == 0)
            return std::unexpected(error::lobby_error(LobbyErrorCode::NoKiller));

        std::set<PlayerClass> classes;
        for (std::size_t i{}; i < roles.size(); ++i)
        {
            if (roles[i] != Role::Survivor) continue;
            if (!classes.insert(state_.players[i].player_class).second)
                return std::unexpected(error::lobby_error(LobbyErrorCode::DuplicateSurvivorClass));
        }

        for (std::size_t i{}; i < roles.size(); ++i) state_.players[i].role = roles[i];
        ClearGame();
        rules_->Begin(*this);
        Out().StateChanged();
        return {};
    }

    auto Session::ClearGame() -> void
    {
        for (PlayerState& p : state_.players)
        {
            p.eliminated = false;
            p.current_room.reset();
            p.carries_revival_item = false;
            p.gold = 0;
            p.poison_countdown = 0;
            p.immobilized_next_turn = false;
        }
        state_.rooms.assign(catalog_->RoomCount(), RoomState{});
        state_.pending_actions.clear();
        state_.power_selections.clear();
        state_.active_effects.clear();
        state_.seen_powers.clear();
        state_.objectives = ObjectiveState{};
        state_.revival_item_pending = false;
        state_.rooms_visited_since_objective.clear();
        state_.resolution = ResolutionState{};
        state_.events.clear();
        state_.winner.reset();
        state_.started = false;
        state_.turn = 0;
        state_.phase = Phase::Waiting;
    }

    auto Session::Reset() -> void
    {
        ClearGame();
        Out().Notify(AudienceAll{}, Notice{
            .kind = NoticeKind::GameReset, .text = "The game was reset", .phase = Phase::Waiting});
        Out().StateChanged();
    }

    auto Session::Submit(PlyrIdxT const actor, PlayerAction const& action) -> ActionOutcome
    {
        auto const ok = rules_->Validate(*this, actor, action);
        if (!ok)
        {
            Out().Reject(actor, ok.error());
            return ActionOutcome::Invalid;
        }

        rules_->Apply(*this, actor, action);
        ActionOutcome const outcome = rules_->Advance(*this);
        Out().StateChanged();
        return outcome;
    }

    auto Session::OnConnect(PlyrIdxT const player) -> void
    {
        if (player >= state_.players.size()) return;
        Out().StateChangedFor(player);
    }

    auto Session::OnDisconnect(PlyrIdxT const player) -> void
    {
        if (player >= state_.players.size()) return;
        Out().Notify(AudienceAll{}, NoticeKind::PlayerDisconnected,
                     fmt::format("{} disconnected", state_.players[player].name));
    }

    auto Session::Reject(PlyrIdxT const player, error::LobbyError const& e) -> void
    {
        Out().Reject(player, e);
    }

    auto Session::DrainOutbox() -> std::vector<Broadcast>
    {
        return std::exchange(outbox_, {});
    }

    auto Session::RoleOf(PlyrIdxT const player) const -> Role
    {
        MNR_ASSERT(player < state_.players.size(), "RoleOf on unknown player");
        return state_.players[player].role;
    }
}
