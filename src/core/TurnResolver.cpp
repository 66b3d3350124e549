//
// Created by Malik T on 06/11/2025.
//

#include "TurnResolver.hpp"

#include <algorithm>
#include <ranges>
#include <fmt/format.h>
#include "Objectives.hpp"
#include "Placement.hpp"
#include "Powers.hpp"
#include "Session.hpp"

namespace
{
    inline auto Viol(manor::core::error::RuleViolationCode code) -> manor::core::error::RuleViolation
    {
        return manor::core::error::RuleViolation{ .code = code };
    }
}

namespace manor::core
{
    auto AliveCount(SessionState const& state, Role const role) -> std::size_t
    {
        return static_cast<std::size_t>(std::ranges::count_if(state.players, [role](PlayerState const& p)
        {
            return p.role == role && !p.eliminated;
        }));
    }

    static auto AllActed(SessionState const& st, Role const role) -> bool
    {
        for (std::size_t i{}; i < st.players.size(); ++i)
        {
            PlayerState const& p = st.players[i];
            if (p.role != role || p.eliminated) continue;
            if (!st.pending_actions.contains(static_cast<PlyrIdxT>(i))) return false;
        }
        return true;
    }

    static auto Contains(std::span<PlyrIdxT const> v, PlyrIdxT const x) -> bool
    {
        return std::ranges::find(v, x) != std::cend(v);
    }

auto TurnResolver::Validate(Session const& s, PlyrIdxT const actor, PlayerAction const& a) const -> CheckResult
{
    using RVC = error::RuleViolationCode;
    SessionState const& st = s.state_;

    if (actor >= st.players.size())
        return std::unexpected(Viol(RVC::UnknownPlayer).with_actor(actor));
    if (!st.started)
        return std::unexpected(Viol(RVC::GameNotStarted).with_phase(st.phase).with_actor(actor));
    if (st.phase == Phase::GameOver)
        return std::unexpected(Viol(RVC::GameAlreadyOver).with_phase(st.phase).with_actor(actor));
    if (st.players[actor].eliminated)
        return std::unexpected(Viol(RVC::ActorEliminated).with_phase(st.phase).with_actor(actor));

    return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
    {
        using T = std::decay_t<T0>;

        if constexpr (std::is_same_v<T, SelectRoomAction>)
        {
            return ValidateRoom(s, actor, act.room);
        }
        else if constexpr (std::is_same_v<T, SelectPowerAction>)
        {
            return ValidatePower(s, actor, act.power);
        }
        else if constexpr (std::is_same_v<T, PowerTargetAction>)
        {
            return ValidateTarget(s, actor, act.target);
        }
        else
        {
            static_assert(std::is_same_v<T, UseRevivalItemAction>, "Unhandled action type");
            return ValidateRevive(s, actor, act.target);
        }
    }, a);
}

    auto TurnResolver::ValidateRoom(Session const& s, PlyrIdxT const actor, RoomIdxT const room) const -> CheckResult
    {
        using RVC = error::RuleViolationCode;
        SessionState const& st = s.state_;
        PlayerState const& p = st.players[actor];

        if (p.role == Role::Survivor)
        {
            if (st.phase != Phase::SurvivorSelection)
                return std::unexpected(Viol(RVC::WrongPhase_SurvivorSelectionRequired)
                                       .with_phase(st.phase).with_actor(actor));
            if (st.pending_actions.contains(actor))
                return std::unexpected(Viol(RVC::AlreadyActed).with_phase(st.phase).with_actor(actor));
            if (!s.Catalog().IsRoom(room))
                return std::unexpected(Viol(RVC::Room_Unknown).with_actor(actor).with_room(room));

            // an immobilized survivor may only pass, even out of a locked room
            if (p.immobilized_next_turn && p.current_room)
            {
                if (room != *p.current_room)
                    return std::unexpected(Viol(RVC::Room_Immobilized).with_actor(actor).with_room(room));
                return {};
            }
            if (st.rooms[room].locked)
                return std::unexpected(Viol(RVC::Room_Locked).with_actor(actor).with_room(room));
            return {};
        }

        if (st.phase == Phase::RageSecondSelection)
        {
            if (!Contains(st.resolution.second_chance_pending, actor))
                return std::unexpected(Viol(RVC::Room_SecondChanceNotGranted).with_phase(st.phase).with_actor(actor));
            if (st.resolution.second_selections.contains(actor))
                return std::unexpected(Viol(RVC::AlreadyActed).with_phase(st.phase).with_actor(actor));
        }
        else
        {
            if (st.phase != Phase::KillerSelection)
                return std::unexpected(Viol(RVC::WrongPhase_KillerSelectionRequired)
                                       .with_phase(st.phase).with_actor(actor));
            if (st.pending_actions.contains(actor))
                return std::unexpected(Viol(RVC::AlreadyActed).with_phase(st.phase).with_actor(actor));
        }

        if (!s.Catalog().IsRoom(room))
            return std::unexpected(Viol(RVC::Room_Unknown).with_actor(actor).with_room(room));
        if (st.rooms[room].locked)
            return std::unexpected(Viol(RVC::Room_Locked).with_actor(actor).with_room(room));
        return {};
    }

    auto TurnResolver::ValidatePower(Session const& s, PlyrIdxT const actor, PowerKind const power) const -> CheckResult
    {
        using RVC = error::RuleViolationCode;
        SessionState const& st = s.state_;

        if (st.players[actor].role != Role::Killer)
            return std::unexpected(Viol(RVC::WrongRole_KillerRequired).with_actor(actor));
        if (st.phase != Phase::KillerPowerSelection)
            return std::unexpected(Viol(RVC::WrongPhase_PowerSelectionRequired).with_phase(st.phase).with_actor(actor));

        auto const it = st.power_selections.find(actor);
        if (it == std::cend(st.power_selections))
            return std::unexpected(Viol(RVC::Power_NotOffered).with_actor(actor));
        PowerSelection const& sel = it->second;

        if (sel.complete)
            return std::unexpected(Viol(RVC::Power_AlreadyComplete).with_actor(actor));
        if (sel.selected)
            return std::unexpected(Viol(RVC::AlreadyActed).with_phase(st.phase).with_actor(actor));
        if (std::ranges::find(sel.options, power) == std::cend(sel.options))
            return std::unexpected(Viol(RVC::Power_NotOffered).with_actor(actor));
        return {};
    }

    auto TurnResolver::ValidateTarget(Session const& s, PlyrIdxT const actor, PowerTarget const& target) const
        -> CheckResult
    {
        using RVC = error::RuleViolationCode;
        SessionState const& st = s.state_;

        if (st.players[actor].role != Role::Killer)
            return std::unexpected(Viol(RVC::WrongRole_KillerRequired).with_actor(actor));
        if (st.phase != Phase::KillerPowerSelection)
            return std::unexpected(Viol(RVC::WrongPhase_PowerSelectionRequired).with_phase(st.phase).with_actor(actor));

        auto const it = st.power_selections.find(actor);
        if (it == std::cend(st.power_selections) || !it->second.selected)
            return std::unexpected(Viol(RVC::Power_NoneSelected).with_actor(actor));
        PowerSelection const& sel = it->second;
        if (sel.complete)
            return std::unexpected(Viol(RVC::Power_AlreadyComplete).with_actor(actor));

        PowerEffect const& effect = PowerCatalog::Instance().Get(*sel.selected);
        if (!effect.RequiresTargeting())
            return std::unexpected(Viol(RVC::Power_TargetNotRequired).with_actor(actor));

        if (auto ok = effect.ValidateTarget(s.Catalog(), s.Cfg(), target); !ok)
        {
            error::RuleViolation v = ok.error();
            v.with_actor(actor).with_phase(st.phase);
            return std::unexpected(v);
        }
        return {};
    }

    auto TurnResolver::ValidateRevive(Session const& s, PlyrIdxT const actor, PlyrIdxT const target) const
        -> CheckResult
    {
        using RVC = error::RuleViolationCode;
        SessionState const& st = s.state_;
        PlayerState const& p = st.players[actor];

        if (p.role != Role::Survivor)
            return std::unexpected(Viol(RVC::WrongRole_SurvivorRequired).with_actor(actor));
        if (!p.carries_revival_item)
            return std::unexpected(Viol(RVC::Revive_NotCarrying).with_actor(actor));
        if (target >= st.players.size())
            return std::unexpected(Viol(RVC::Revive_TargetUnknown).with_actor(actor).with_target(target));
        if (!st.players[target].eliminated)
            return std::unexpected(Viol(RVC::Revive_TargetNotEliminated).with_actor(actor).with_target(target));
        if (!p.current_room || !Contains(st.rooms[*p.current_room].eliminated_here, target))
            return std::unexpected(Viol(RVC::Revive_TargetNotInRoom).with_actor(actor).with_target(target));
        return {};
    }

auto TurnResolver::Apply(Session& s, PlyrIdxT const actor, PlayerAction const& a) -> void
{
    SessionState& st = s.state_;
    Outbox out = s.Out();

    std::visit([&]<typename T0>(T0 const& act) -> void
    {
        using T = std::decay_t<T0>;

        if constexpr (std::is_same_v<T, SelectRoomAction>)
        {
            ApplyRoom(s, actor, act.room);
        }
        else if constexpr (std::is_same_v<T, SelectPowerAction>)
        {
            PowerSelection& sel = st.power_selections.at(actor);
            PowerEffect const& effect = PowerCatalog::Instance().Get(act.power);
            sel.selected = act.power;
            if (effect.RequiresTargeting())
            {
                out.Notify(AudiencePlayer{actor}, Notice{
                    .kind = NoticeKind::PowerActionRequired,
                    .text = fmt::format("Choose a target for {}", effect.Def().name),
                    .phase = st.phase,
                    .power = act.power});
            }
            else
            {
                sel.target = PowerTarget{};
                sel.complete = true;
            }
            out.Notify(AudienceRole{Role::Killer}, NoticeKind::PlayerActed,
                       fmt::format("{} chose a power", st.players[actor].name));
        }
        else if constexpr (std::is_same_v<T, PowerTargetAction>)
        {
            PowerSelection& sel = st.power_selections.at(actor);
            sel.target = act.target;
            sel.complete = true;
            out.Notify(AudienceRole{Role::Killer}, NoticeKind::PlayerActed,
                       fmt::format("{} is ready", st.players[actor].name));
        }
        else if constexpr (std::is_same_v<T, UseRevivalItemAction>)
        {
            Revive(s, actor, act.target);
        }
    }, a);
}

    auto TurnResolver::ApplyRoom(Session& s, PlyrIdxT const actor, RoomIdxT const room) -> void
    {
        SessionState& st = s.state_;
        Outbox out = s.Out();
        PlayerState& p = st.players[actor];

        if (p.role == Role::Killer)
        {
            if (st.phase == Phase::RageSecondSelection)
            {
                st.resolution.second_selections[actor] = room;
                out.Notify(AudienceRole{Role::Killer}, NoticeKind::PlayerActed,
                           fmt::format("{} made a second choice", p.name));
                return;
            }
            st.pending_actions[actor] = PendingAction{.room = room};
            out.Notify(AudienceAll{}, NoticeKind::PlayerActed, fmt::format("{} made a choice", p.name));
            return;
        }

        PendingAction pending{.room = room};
        if (p.immobilized_next_turn && p.current_room && room == *p.current_room)
        {
            p.immobilized_next_turn = false;
            pending.passed = true;
            st.pending_actions[actor] = pending;
            out.Notify(AudiencePlayer{actor}, NoticeKind::TurnSkipped,
                       fmt::format("You are frozen and stay in {} this turn", s.Catalog().NameOf(room)));
            out.Notify(AudienceAll{}, NoticeKind::PlayerActed, fmt::format("{} made a choice", p.name));
            return;
        }

        auto& visited = st.rooms_visited_since_objective;
        if (std::ranges::find(visited, room) == std::cend(visited)) visited.push_back(room);

        // armed traps and decoys stay armed until the power phase clears them all
        RoomState& r = st.rooms[room];
        if (r.trapped)
        {
            r.trap_triggered = true;
            p.immobilized_next_turn = true;
            pending.hit_trap = true;
            out.Notify(AudiencePlayer{actor}, NoticeKind::Trapped,
                       fmt::format("A trap snaps shut in {}: you will be frozen next turn", s.Catalog().NameOf(room)));
        }
        if (r.has_mimic) pending.hit_decoy = true;
        st.pending_actions[actor] = pending;
        out.Notify(AudienceAll{}, NoticeKind::PlayerActed, fmt::format("{} made a choice", p.name));
    }

    auto TurnResolver::Revive(Session& s, PlyrIdxT const carrier, PlyrIdxT const target) -> void
    {
        SessionState& st = s.state_;
        Outbox out = s.Out();
        PlayerState& c = st.players[carrier];
        PlayerState& t = st.players[target];
        MNR_ASSERT(c.current_room.has_value(), "Revival carrier has no room");

        RoomIdxT const room = *c.current_room;
        std::erase(st.rooms[room].eliminated_here, target);
        t.eliminated = false;
        t.current_room = room;
        t.poison_countdown = 0;
        t.immobilized_next_turn = false;
        c.carries_revival_item = false;

        out.Event(EventKind::Revival, fmt::format("{} revived {} in {}", c.name, t.name, s.Catalog().NameOf(room)));
        if (PlaceRevivalItem(st, s.rng_))
            out.Event(EventKind::RevivalItemRespawn, "The revival item reappeared somewhere in the manor");
    }

auto TurnResolver::Advance(Session& s) -> ActionOutcome
{
    SessionState& st = s.state_;
    switch (st.phase)
    {
    case Phase::SurvivorSelection:
        if (!AllActed(st, Role::Survivor)) return ActionOutcome::Applied;
        EnterPowerSelection(s);
        return ActionOutcome::PhaseAdvanced;

    case Phase::KillerPowerSelection:
        if (!std::ranges::all_of(st.power_selections, [](auto const& kv) { return kv.second.complete; }))
            return ActionOutcome::Applied;
        EnterKillerSelection(s);
        return ActionOutcome::PhaseAdvanced;

    case Phase::KillerSelection:
        if (!AllActed(st, Role::Killer)) return ActionOutcome::Applied;
        return Resolve(s);

    case Phase::RageSecondSelection:
        for (PlyrIdxT const k : st.resolution.second_chance_pending)
        {
            if (!st.resolution.second_selections.contains(k)) return ActionOutcome::Applied;
        }
        return ResumeAfterSecondChance(s);

    case Phase::Waiting:
    case Phase::Processing:
    case Phase::GameOver:
        break;
    }
    return ActionOutcome::Applied;
}

    auto TurnResolver::Begin(Session& s) -> void
    {
        SessionState& st = s.state_;
        Outbox out = s.Out();

        st.started = true;
        st.turn = 1;
        objectives::Build(st, s.rng_);
        PlaceRevivalItem(st, s.rng_);

        out.Event(EventKind::GameStarted, "The game has started");
        out.Notify(AudienceAll{}, NoticeKind::GameStarted, "The game has started");
        EnterPhase(s, Phase::SurvivorSelection);
    }

    auto TurnResolver::EnterPhase(Session& s, Phase const p) -> void
    {
        s.state_.phase = p;
        s.Out().Notify(AudienceAll{}, Notice{
            .kind = NoticeKind::PhaseChange,
            .text = fmt::format("Phase: {}", to_string(p)),
            .phase = p});
    }

    auto TurnResolver::EnterPowerSelection(Session& s) -> void
    {
        SessionState& st = s.state_;

        // previous turn's traps and decoys expire, sprung or not
        for (RoomState& r : st.rooms)
        {
            r.trapped = false;
            r.trap_triggered = false;
            r.has_mimic = false;
        }
        st.active_effects.clear();
        st.power_selections.clear();

        PowerCatalog const& powers = PowerCatalog::Instance();
        for (std::size_t i{}; i < st.players.size(); ++i)
        {
            PlayerState const& p = st.players[i];
            if (p.role != Role::Killer || p.eliminated) continue;
            auto const k = static_cast<PlyrIdxT>(i);
            st.power_selections[k].options = powers.Draw(s.cfg_, st.seen_powers[k], s.rng_);
        }
        EnterPhase(s, Phase::KillerPowerSelection);
    }

    auto TurnResolver::EnterKillerSelection(Session& s) -> void
    {
        SessionState& st = s.state_;
        Outbox out = s.Out();
        PowerContext ctx{st, s.Catalog(), s.cfg_, s.rng_, out};
        PowerCatalog const& powers = PowerCatalog::Instance();

        // map order == killer insertion order
        for (auto const& [killer, sel] : st.power_selections)
        {
            MNR_ASSERT(sel.complete && sel.selected.has_value(), "Applying an incomplete power selection");
            ActiveEffect& record = st.active_effects[*sel.selected];
            record.used_by.push_back(killer);
            powers.Get(*sel.selected).Apply(ctx, killer, sel.target.value_or(PowerTarget{}), record);
        }
        EnterPhase(s, Phase::KillerSelection);
    }

    auto TurnResolver::Resolve(Session& s) -> ActionOutcome
    {
        SessionState& st = s.state_;
        st.phase = Phase::Processing;
        st.resolution = ResolutionState{};

        PlacePendingPickups(s);
        UpdateLocks(s);
        for (RoomState& r : st.rooms) r.highlighted = false;
        ResolveSurvivors(s);

        std::vector<std::pair<PlyrIdxT, RoomIdxT>> moves;
        for (auto const& [idx, pending] : st.pending_actions)
        {
            if (st.players[idx].role == Role::Killer) moves.emplace_back(idx, pending.room);
        }
        ResolveKillers(s, moves, true);
        LockEliminationRooms(s);

        if (!st.resolution.second_chance_pending.empty())
        {
            if (AliveCount(st, Role::Survivor) > 0)
            {
                EnterPhase(s, Phase::RageSecondSelection);
                for (PlyrIdxT const k : st.resolution.second_chance_pending)
                {
                    s.Out().Notify(AudiencePlayer{k}, Notice{
                        .kind = NoticeKind::SecondChanceGranted,
                        .text = "Rage: choose one more room this turn",
                        .phase = Phase::RageSecondSelection,
                        .power = PowerKind::SecondChance});
                }
                return ActionOutcome::PhaseAdvanced;
            }
            st.resolution.second_chance_pending.clear();
        }
        return FinishResolution(s);
    }

    auto TurnResolver::ResumeAfterSecondChance(Session& s) -> ActionOutcome
    {
        SessionState& st = s.state_;
        st.phase = Phase::Processing;

        std::vector<std::pair<PlyrIdxT, RoomIdxT>> moves;
        for (PlyrIdxT const k : st.resolution.second_chance_pending)
            moves.emplace_back(k, st.resolution.second_selections.at(k));

        ResolveKillers(s, moves, false);
        LockEliminationRooms(s);
        st.resolution.second_chance_pending.clear();
        st.resolution.second_selections.clear();
        return FinishResolution(s);
    }

    auto TurnResolver::FinishResolution(Session& s) -> ActionOutcome
    {
        ApplyRelocation(s);
        if (CheckVictory(s)) return ActionOutcome::GameEnded;

        TickPoison(s);
        if (AliveCount(s.state_, Role::Survivor) == 0)
        {
            EndGame(s, Winner::Killers);
            return ActionOutcome::GameEnded;
        }

        NextTurn(s);
        return ActionOutcome::TurnResolved;
    }

    auto TurnResolver::PlacePendingPickups(Session& s) -> void
    {
        SessionState& st = s.state_;
        Outbox out = s.Out();

        if (st.objectives.placement_pending && objectives::PlaceNext(st, s.rng_))
            out.Event(EventKind::ObjectivePlaced, "A new objective has appeared in the manor", Role::Survivor);

        if (st.revival_item_pending && PlaceRevivalItem(st, s.rng_))
            out.Event(EventKind::RevivalItemRespawn, "The revival item reappeared somewhere in the manor");
    }

    auto TurnResolver::UpdateLocks(Session& s) -> void
    {
        SessionState& st = s.state_;
        Outbox out = s.Out();

        std::vector<RoomIdxT> barricaded;
        if (auto const it = st.active_effects.find(PowerKind::Barricade); it != std::cend(st.active_effects))
            barricaded = it->second.rooms;

        for (std::size_t i{}; i < st.rooms.size(); ++i)
        {
            auto const idx = static_cast<RoomIdxT>(i);
            bool const lock = std::ranges::find(barricaded, idx) != std::cend(barricaded);
            if (lock)
                out.Event(EventKind::RoomLocked, fmt::format("{} has been barricaded", s.Catalog().NameOf(idx)));
            st.rooms[i].locked = lock;
        }
    }

    auto TurnResolver::ResolveSurvivors(Session& s) -> void
    {
        SessionState& st = s.state_;
        Outbox out = s.Out();
        RoomCatalog const& catalog = s.Catalog();

        for (auto const& [idx, pending] : st.pending_actions)
        {
            PlayerState& p = st.players[idx];
            if (p.role != Role::Survivor || p.eliminated) continue;

            RoomIdxT const room = pending.room;
            std::string const& room_name = catalog.NameOf(room);
            p.current_room = room;
            if (pending.passed) continue;

            if (pending.hit_decoy)
            {
                p.gold = 0;
                out.Event(EventKind::DecoyTriggered,
                          fmt::format("{} was fooled by a decoy in {} and lost all gold", p.name, room_name),
                          Role::Survivor);
                out.Event(EventKind::DecoyTriggered, fmt::format("A decoy was triggered in {}", room_name),
                          Role::Killer);
            }

            if (st.rooms[room].poison_turns_remaining > 0 && p.poison_countdown == 0)
            {
                p.poison_countdown = s.cfg_.poison_player_turns;
                out.Event(EventKind::Poisoned,
                          fmt::format("{} breathed poison in {}: {} turns left", p.name, room_name,
                                      static_cast<int>(p.poison_countdown)),
                          Role::Survivor);
            }

            switch (objectives::OnSurvivorEnter(st, room, p.player_class, s.rng_))
            {
            case objectives::EnterResult::Completed:
                st.resolution.objective_obtained = true;
                out.Event(EventKind::ObjectiveFound,
                          fmt::format("{} completed an objective ({}/{})", p.name,
                                      st.objectives.completed.size(), st.objectives.queue.size()));
                out.Notify(AudiencePlayer{idx}, NoticeKind::ObjectiveFound,
                           fmt::format("You completed the {} objective in {}",
                                       to_string(st.objectives.completed.back()), room_name));
                break;
            case objectives::EnterResult::ClassMismatch:
                out.Event(EventKind::SearchNoObjective,
                          fmt::format("{} found the objective in {} but it needs a {}", p.name, room_name,
                                      to_string(*st.rooms[room].required_class)),
                          Role::Survivor);
                break;
            case objectives::EnterResult::NoObjective:
                out.Event(EventKind::SearchNoObjective,
                          fmt::format("{} searched {} and found nothing", p.name, room_name),
                          Role::Survivor);
                break;
            }

            if (objectives::TryClaimCrystal(st, room))
                out.Event(EventKind::CrystalClaimed, fmt::format("{} reached the crystal", p.name));

            if (!pending.hit_trap && !pending.hit_decoy)
                p.gold += s.cfg_.gold_per_search;

            RoomState& r = st.rooms[room];
            if (r.has_revival_item && !p.carries_revival_item)
            {
                r.has_revival_item = false;
                p.carries_revival_item = true;
                out.Event(EventKind::RevivalItemFound, fmt::format("{} picked up the revival item", p.name));
            }

            if (p.carries_revival_item)
            {
                auto const victim = std::ranges::find_if(r.eliminated_here, [&st](PlyrIdxT const v)
                {
                    return st.players[v].eliminated;
                });
                if (victim != std::cend(r.eliminated_here))
                    Revive(s, idx, *victim);
            }
        }
    }

    auto TurnResolver::ResolveKillers(Session& s, std::span<std::pair<PlyrIdxT, RoomIdxT> const> moves,
                                      bool const grant) -> void
    {
        SessionState& st = s.state_;
        Outbox out = s.Out();

        std::vector<PlyrIdxT> enraged;
        if (auto const it = st.active_effects.find(PowerKind::SecondChance); it != std::cend(st.active_effects))
            enraged = it->second.used_by;

        for (auto const& [killer, room] : moves)
        {
            PlayerState& k = st.players[killer];
            k.current_room = room;

            bool caught = false;
            for (std::size_t i{}; i < st.players.size(); ++i)
            {
                PlayerState const& v = st.players[i];
                if (v.role != Role::Survivor || v.eliminated || v.current_room != room) continue;
                Eliminate(s, static_cast<PlyrIdxT>(i), room, true);
                out.Event(EventKind::Elimination,
                          fmt::format("{} was caught by {} in {}", v.name, k.name, s.Catalog().NameOf(room)));
                caught = true;
            }

            if (caught && grant && Contains(enraged, killer))
            {
                st.resolution.second_chance_pending.push_back(killer);
                out.Event(EventKind::SecondChance, fmt::format("{} gets a second search", k.name), Role::Killer);
            }
        }
    }

    auto TurnResolver::Eliminate(Session& s, PlyrIdxT const victim, RoomIdxT const room, bool const seal) -> void
    {
        SessionState& st = s.state_;
        PlayerState& v = st.players[victim];

        v.eliminated = true;
        v.gold = 0;
        v.poison_countdown = 0;
        v.immobilized_next_turn = false;
        v.current_room = room;
        st.rooms[room].eliminated_here.push_back(victim);
        if (seal) st.resolution.lock_set.insert(room);

        if (v.carries_revival_item)
        {
            v.carries_revival_item = false;
            if (PlaceRevivalItem(st, s.rng_))
                s.Out().Event(EventKind::RevivalItemRespawn, "The revival item reappeared somewhere in the manor");
        }
    }

    auto TurnResolver::LockEliminationRooms(Session& s) -> void
    {
        SessionState& st = s.state_;
        for (RoomIdxT const room : st.resolution.lock_set)
        {
            if (st.rooms[room].locked) continue;
            st.rooms[room].locked = true;
            s.Out().Event(EventKind::RoomLocked, fmt::format("{} is sealed until next turn", s.Catalog().NameOf(room)));
        }
    }

    auto TurnResolver::ApplyRelocation(Session& s) -> void
    {
        SessionState& st = s.state_;
        auto const it = st.active_effects.find(PowerKind::RelocateOnMiss);
        if (it == std::cend(st.active_effects) || !it->second.relocate_objective) return;
        if (st.resolution.objective_obtained) return;

        if (objectives::Relocate(st, s.rng_))
            s.Out().Event(EventKind::ObjectiveRelocated, "The manor shook: the objective has moved");
    }

    auto TurnResolver::CheckVictory(Session& s) -> bool
    {
        SessionState& st = s.state_;

        if (AliveCount(st, Role::Survivor) == 0)
        {
            EndGame(s, Winner::Killers);
            return true;
        }
        if (st.objectives.crystal_claimed)
        {
            EndGame(s, Winner::Survivors);
            return true;
        }
        if (objectives::AllCompleted(st) && !st.objectives.crystal_spawned)
        {
            if (auto const room = objectives::SpawnCrystal(st, s.rng_))
                s.Out().Event(EventKind::CrystalSpawned,
                              fmt::format("The crystal has appeared in {}", s.Catalog().NameOf(*room)));
        }
        return false;
    }

    auto TurnResolver::TickPoison(Session& s) -> void
    {
        SessionState& st = s.state_;

        for (RoomState& r : st.rooms)
        {
            if (r.poison_turns_remaining > 0) --r.poison_turns_remaining;
        }

        for (std::size_t i{}; i < st.players.size(); ++i)
        {
            PlayerState& p = st.players[i];
            if (p.eliminated || p.poison_countdown == 0) continue;
            if (--p.poison_countdown > 0) continue;

            MNR_ASSERT(p.current_room.has_value(), "Poisoned player without a room");
            Eliminate(s, static_cast<PlyrIdxT>(i), *p.current_room, false);
            s.Out().Event(EventKind::PoisonDeath, fmt::format("{} succumbed to poison", p.name));
        }
    }

    auto TurnResolver::EndGame(Session& s, Winner const w) -> void
    {
        SessionState& st = s.state_;
        Outbox out = s.Out();

        st.winner = w;
        if (w == Winner::Survivors)
        {
            out.Event(EventKind::GameOver, "You escaped with the crystal. Survivors win!", Role::Survivor);
            out.Event(EventKind::GameOver, "The survivors escaped. Killers lose.", Role::Killer);
        }
        else
        {
            out.Event(EventKind::GameOver, "Everyone has been caught. Killers win.", Role::Survivor);
            out.Event(EventKind::GameOver, "Nobody escaped. Killers win!", Role::Killer);
        }
        out.Notify(AudienceAll{}, Notice{
            .kind = NoticeKind::GameOver,
            .text = w == Winner::Survivors ? "Game over: survivors win" : "Game over: killers win",
            .phase = Phase::GameOver});
        EnterPhase(s, Phase::GameOver);
    }

    auto TurnResolver::NextTurn(Session& s) -> void
    {
        SessionState& st = s.state_;

        ++st.turn;
        st.pending_actions.clear();
        st.power_selections.clear();
        st.active_effects.clear();
        st.resolution = ResolutionState{};

        s.Out().Event(EventKind::NewTurn, fmt::format("Turn {} begins", st.turn));
        s.Out().Notify(AudienceAll{}, NoticeKind::NewTurn, fmt::format("Turn {}", st.turn));
        EnterPhase(s, Phase::SurvivorSelection);
    }
}
