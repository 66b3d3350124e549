//
// Codec.cpp
//
#include "codec.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include "generated/flatbuffers/manor_net_generated.h"

namespace fb = manor::gen::net;

namespace
{
    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert((int)manor::core::Role::Killer == (int)fb::Role::Killer);
    static_assert((int)manor::core::PlayerClass::OrcKing == (int)fb::PlayerClass::OrcKing);
    static_assert((int)manor::core::Phase::GameOver == (int)fb::Phase::GameOver);
    static_assert((int)manor::core::PowerKind::Decoy == (int)fb::PowerKind::Decoy);
    static_assert((int)manor::core::NoticeKind::SecondChanceGranted == (int)fb::NoticeKind::SecondChanceGranted);

    // Range-checked cast of a wire enum onto its core twin.
    template <typename Core, typename Wire>
    auto FromWire(Wire const w, std::size_t const count) -> std::optional<Core>
    {
        auto const raw = static_cast<std::size_t>(w);
        if (raw >= count) return std::nullopt;
        return static_cast<Core>(raw);
    }

    template <typename T>
    auto OptionalIndex(std::int16_t const v) -> std::optional<T>
    {
        if (v < 0) return std::nullopt;
        return static_cast<T>(v);
    }

    auto Str(flatbuffers::String const* s) -> std::string
    {
        return s ? s->str() : std::string{};
    }

    auto Bytes(flatbuffers::Vector<std::uint8_t> const* v) -> std::vector<std::uint8_t>
    {
        if (!v) return {};
        return {v->begin(), v->end()};
    }

    auto Finish(flatbuffers::FlatBufferBuilder& fbb, std::uint64_t const msg_id, fb::Message const type,
                flatbuffers::Offset<void> const body) -> flatbuffers::DetachedBuffer
    {
        auto const env = fb::CreateEnvelope(fbb, msg_id, type, body);
        fbb.Finish(env);
        return fbb.Release();
    }

    auto BuildProfile(flatbuffers::FlatBufferBuilder& fbb, manor::core::PlayerProfile const& p)
        -> flatbuffers::Offset<fb::Profile>
    {
        auto const name = fbb.CreateString(p.name);
        return fb::CreateProfile(fbb, name, manor::core::net::ToFbClass(p.player_class),
                                 manor::core::net::ToFbRole(p.role));
    }

    auto DecodeProfile(fb::Profile const* p)
        -> std::expected<manor::core::PlayerProfile, manor::core::net::ParseError>
    {
        using manor::core::net::ParseError;
        if (!p) return std::unexpected(ParseError{"missing profile"});

        auto const cls = FromWire<manor::core::PlayerClass>(p->player_class(), manor::core::PlayerClassCount);
        if (!cls) return std::unexpected(ParseError{"unknown player class"});
        auto const role = FromWire<manor::core::Role>(p->role(), 2);
        if (!role) return std::unexpected(ParseError{"unknown role"});

        return manor::core::PlayerProfile{Str(p->name()), *cls, *role};
    }
} // anonymous

namespace manor::core::net
{
    auto ToFbRole(Role const r) noexcept -> fb::Role
    {
        return r == Role::Survivor ? fb::Role::Survivor : fb::Role::Killer;
    }

    auto ToFbPhase(Phase const p) noexcept -> fb::Phase
    {
        switch (p)
        {
        case Phase::Waiting: return fb::Phase::Waiting;
        case Phase::SurvivorSelection: return fb::Phase::SurvivorSelection;
        case Phase::KillerPowerSelection: return fb::Phase::KillerPowerSelection;
        case Phase::KillerSelection: return fb::Phase::KillerSelection;
        case Phase::Processing: return fb::Phase::Processing;
        case Phase::RageSecondSelection: return fb::Phase::RageSecondSelection;
        case Phase::GameOver: return fb::Phase::GameOver;
        }
        return fb::Phase::Waiting;
    }

    auto ToFbClass(PlayerClass const c) noexcept -> fb::PlayerClass
    {
        return static_cast<fb::PlayerClass>(static_cast<std::uint8_t>(c));
    }

    auto ToFbPower(PowerKind const k) noexcept -> fb::PowerKind
    {
        return static_cast<fb::PowerKind>(static_cast<std::uint8_t>(k));
    }

    static auto ToFbWinner(std::optional<Winner> const w) noexcept -> fb::Winner
    {
        if (!w) return fb::Winner::Undecided;
        return *w == Winner::Survivors ? fb::Winner::Survivors : fb::Winner::Killers;
    }

    // ---------- Server → client ----------

    auto BuildWelcome(std::string_view const code, PlyrIdxT const player, std::string_view const token,
                      std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const c = fbb.CreateString(code.data(), code.size());
        auto const t = fbb.CreateString(token.data(), token.size());
        auto const w = fb::CreateWelcome(fbb, c, player, t);
        return Finish(fbb, msg_id, fb::Message::Welcome, w.Union());
    }

    auto BuildStateUpdate(SessionView const& view, RoomCatalog const& catalog, std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        // Floors
        std::vector<flatbuffers::Offset<flatbuffers::String>> floor_names;
        floor_names.reserve(catalog.FloorCount());
        for (std::size_t f{}; f < catalog.FloorCount(); ++f)
            floor_names.push_back(fbb.CreateString(catalog.FloorName(static_cast<FloorIdxT>(f))));
        auto const floors_vec = fbb.CreateVector(floor_names);

        // Players
        std::vector<flatbuffers::Offset<fb::PlayerView>> players;
        players.reserve(view.players.size());
        for (PlayerView const& p : view.players)
        {
            auto const name = fbb.CreateString(p.name);
            players.push_back(fb::CreatePlayerView(
                fbb,
                /*index*/ p.index,
                /*name*/ name,
                /*player_class*/ ToFbClass(p.player_class),
                /*role*/ ToFbRole(p.role),
                /*is_host*/ p.is_host,
                /*eliminated*/ p.eliminated,
                /*current_room*/ p.current_room ? static_cast<std::int16_t>(*p.current_room) : std::int16_t{-1},
                /*carries_revival_item*/ p.carries_revival_item,
                /*gold*/ p.gold ? static_cast<std::int64_t>(*p.gold) : std::int64_t{-1},
                /*poison_countdown*/ p.poison_countdown ? static_cast<std::int16_t>(*p.poison_countdown)
                                                        : std::int16_t{-1},
                /*immobilized_next_turn*/ p.immobilized_next_turn));
        }
        auto const players_vec = fbb.CreateVector(players);

        // Rooms
        std::vector<flatbuffers::Offset<fb::RoomView>> rooms;
        rooms.reserve(view.rooms.size());
        for (RoomView const& r : view.rooms)
        {
            MNR_ASSERT(catalog.IsRoom(r.index), "View room outside the catalog");
            auto const name = fbb.CreateString(catalog.NameOf(r.index));
            auto const elim = fbb.CreateVector(r.eliminated_here);
            rooms.push_back(fb::CreateRoomView(
                fbb,
                /*index*/ r.index,
                /*name*/ name,
                /*floor*/ catalog.FloorOf(r.index),
                /*locked*/ r.locked,
                /*trapped*/ r.trapped,
                /*trap_triggered*/ r.trap_triggered,
                /*highlighted*/ r.highlighted,
                /*poison_turns_remaining*/ r.poison_turns_remaining,
                /*has_mimic*/ r.has_mimic,
                /*has_quest*/ r.has_quest,
                /*required_class*/ r.required_class ? static_cast<std::int16_t>(*r.required_class)
                                                    : std::int16_t{-1},
                /*has_crystal*/ r.has_crystal,
                /*has_revival_item*/ r.has_revival_item,
                /*eliminated_here*/ elim));
        }
        auto const rooms_vec = fbb.CreateVector(rooms);

        // Pending actions
        std::vector<flatbuffers::Offset<fb::PendingView>> pending;
        pending.reserve(view.pending_actions.size());
        for (PendingView const& p : view.pending_actions)
            pending.push_back(fb::CreatePendingView(fbb, p.player, p.room));
        auto const pending_vec = fbb.CreateVector(pending);

        // Power selections
        std::vector<flatbuffers::Offset<fb::PowerSelectionView>> selections;
        selections.reserve(view.power_selections.size());
        for (PowerSelectionView const& s : view.power_selections)
        {
            std::vector<std::uint8_t> opts;
            opts.reserve(s.options.size());
            for (PowerKind const k : s.options) opts.push_back(static_cast<std::uint8_t>(k));
            auto const opts_vec = fbb.CreateVector(opts);

            std::vector<std::uint8_t> target_rooms;
            std::int16_t target_floor = -1;
            if (s.target)
            {
                target_rooms = s.target->rooms;
                if (s.target->floor) target_floor = static_cast<std::int16_t>(*s.target->floor);
            }
            auto const target_vec = fbb.CreateVector(target_rooms);

            selections.push_back(fb::CreatePowerSelectionView(
                fbb,
                /*player*/ s.player,
                /*options*/ opts_vec,
                /*selected*/ s.selected ? static_cast<std::int16_t>(*s.selected) : std::int16_t{-1},
                /*target_rooms*/ target_vec,
                /*target_floor*/ target_floor,
                /*complete*/ s.complete));
        }
        auto const selections_vec = fbb.CreateVector(selections);

        // Active effects
        std::vector<flatbuffers::Offset<fb::ActiveEffectView>> effects;
        effects.reserve(view.active_effects.size());
        for (ActiveEffectView const& e : view.active_effects)
        {
            auto const used_by = fbb.CreateVector(e.used_by);
            auto const e_rooms = fbb.CreateVector(e.rooms);
            auto const e_floors = fbb.CreateVector(e.floors);
            effects.push_back(fb::CreateActiveEffectView(
                fbb, ToFbPower(e.kind), used_by, e_rooms, e_floors, e.relocate_objective));
        }
        auto const effects_vec = fbb.CreateVector(effects);

        auto const second_chance_vec = fbb.CreateVector(view.second_chance_pending);

        // Events
        std::vector<flatbuffers::Offset<fb::EventView>> events;
        events.reserve(view.events.size());
        for (EventView const& e : view.events)
        {
            auto const msg = fbb.CreateString(e.message);
            events.push_back(fb::CreateEventView(fbb, e.turn, static_cast<std::uint8_t>(e.kind), msg));
        }
        auto const events_vec = fbb.CreateVector(events);

        auto const code = fbb.CreateString(view.code);

        auto const sv = fb::CreateSessionView(
            fbb,
            /*schema_version*/ SchemaVersion,
            /*code*/ code,
            /*filtered*/ view.viewer.has_value(),
            /*viewer*/ ToFbRole(view.viewer.value_or(Role::Survivor)),
            /*phase*/ ToFbPhase(view.phase),
            /*turn*/ view.turn,
            /*started*/ view.started,
            /*winner*/ ToFbWinner(view.winner),
            /*host*/ view.host,
            /*floors*/ floors_vec,
            /*players*/ players_vec,
            /*rooms*/ rooms_vec,
            /*pending_actions*/ pending_vec,
            /*power_selections*/ selections_vec,
            /*active_effects*/ effects_vec,
            /*second_chance_pending*/ second_chance_vec,
            /*objectives_total*/ view.objectives_total,
            /*objectives_completed*/ view.objectives_completed,
            /*crystal_spawned*/ view.crystal_spawned,
            /*events*/ events_vec);

        auto const su = fb::CreateStateUpdate(fbb, sv);
        return Finish(fbb, msg_id, fb::Message::StateUpdate, su.Union());
    }

    auto BuildNotice(Notice const& n, std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const txt = fbb.CreateString(n.text);
        auto const no = fb::CreateNotice(
            fbb,
            static_cast<fb::NoticeKind>(static_cast<std::uint8_t>(n.kind)),
            txt,
            n.phase ? static_cast<std::int16_t>(*n.phase) : std::int16_t{-1},
            n.power ? static_cast<std::int16_t>(*n.power) : std::int16_t{-1});
        return Finish(fbb, msg_id, fb::Message::Notice, no.Union());
    }

    auto BuildViolation(error::RuleViolation const& v, std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const txt = fbb.CreateString(error::describe(v));
        auto const vio = fb::CreateViolation(fbb, static_cast<std::int16_t>(v.code), txt);
        return Finish(fbb, msg_id, fb::Message::Violation, vio.Union());
    }

    auto BuildRejected(error::LobbyError const& e, std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const txt = fbb.CreateString(e.reason);
        auto const rej = fb::CreateRejected(fbb, static_cast<std::uint8_t>(e.code), txt);
        return Finish(fbb, msg_id, fb::Message::Rejected, rej.Union());
    }

    // ---------- Client → server ----------

    auto BuildCreateSession(PlayerProfile const& host, bool const conspiracy_mode, std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const prof = BuildProfile(fbb, host);
        auto const cs = fb::CreateCreateSession(fbb, prof, conspiracy_mode);
        return Finish(fbb, msg_id, fb::Message::CreateSession, cs.Union());
    }

    auto BuildJoinSession(std::string_view const code, PlayerProfile const& profile, std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const c = fbb.CreateString(code.data(), code.size());
        auto const prof = BuildProfile(fbb, profile);
        auto const js = fb::CreateJoinSession(fbb, c, prof);
        return Finish(fbb, msg_id, fb::Message::JoinSession, js.Union());
    }

    auto BuildAttach(std::string_view const code, PlyrIdxT const player, std::string_view const token,
                     std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const c = fbb.CreateString(code.data(), code.size());
        auto const t = fbb.CreateString(token.data(), token.size());
        auto const at = fb::CreateAttach(fbb, c, player, t);
        return Finish(fbb, msg_id, fb::Message::Attach, at.Union());
    }

    auto BuildStartGame(std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const sg = fb::CreateStartGame(fbb);
        return Finish(fbb, msg_id, fb::Message::StartGame, sg.Union());
    }

    auto BuildResetGame(std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const rg = fb::CreateResetGame(fbb);
        return Finish(fbb, msg_id, fb::Message::ResetGame, rg.Union());
    }

    auto BuildChangeRole(Role const role, std::optional<PlayerClass> const player_class, std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const cr = fb::CreateChangeRole(
            fbb, ToFbRole(role),
            player_class ? static_cast<std::int16_t>(*player_class) : std::int16_t{-1});
        return Finish(fbb, msg_id, fb::Message::ChangeRole, cr.Union());
    }

    auto BuildAction(PlayerAction const& action, std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        return std::visit([&]<typename T0>(T0 const& act) -> flatbuffers::DetachedBuffer
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, SelectRoomAction>)
            {
                auto const m = fb::CreateSelectRoom(fbb, act.room);
                return Finish(fbb, msg_id, fb::Message::SelectRoom, m.Union());
            }
            else if constexpr (std::is_same_v<T, SelectPowerAction>)
            {
                auto const m = fb::CreateSelectPower(fbb, ToFbPower(act.power));
                return Finish(fbb, msg_id, fb::Message::SelectPower, m.Union());
            }
            else if constexpr (std::is_same_v<T, PowerTargetAction>)
            {
                auto const rooms = fbb.CreateVector(act.target.rooms);
                auto const m = fb::CreatePowerAction(
                    fbb, rooms,
                    act.target.floor ? static_cast<std::int16_t>(*act.target.floor) : std::int16_t{-1});
                return Finish(fbb, msg_id, fb::Message::PowerAction, m.Union());
            }
            else
            {
                auto const m = fb::CreateUseRevivalItem(fbb, act.target);
                return Finish(fbb, msg_id, fb::Message::UseRevivalItem, m.Union());
            }
        }, action);
    }

    // ---------- Decode ----------

    static auto VerifiedEnvelope(std::span<std::byte const> const bytes)
        -> std::expected<fb::Envelope const*, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        auto const* data = reinterpret_cast<std::uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(data, bytes.size());
        if (!fb::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(ParseError{"envelope failed verification"});

        auto const* env = fb::GetEnvelope(data);
        if (!env || env->message_type() == fb::Message::NONE)
            return std::unexpected(ParseError{"empty envelope"});
        return env;
    }

    auto DecodeClientMessage(std::span<std::byte const> const bytes) -> std::expected<DecodedRequest, ParseError>
    {
        auto const env = VerifiedEnvelope(bytes);
        if (!env) return std::unexpected(env.error());

        DecodedRequest out{};
        out.msg_id = (*env)->msg_id();

        switch ((*env)->message_type())
        {
        case fb::Message::CreateSession:
        {
            auto const* m = (*env)->message_as_CreateSession();
            auto profile = DecodeProfile(m->profile());
            if (!profile) return std::unexpected(profile.error());
            out.request = CreateSessionReq{std::move(*profile), m->conspiracy_mode()};
            return out;
        }
        case fb::Message::JoinSession:
        {
            auto const* m = (*env)->message_as_JoinSession();
            auto profile = DecodeProfile(m->profile());
            if (!profile) return std::unexpected(profile.error());
            out.request = JoinSessionReq{Str(m->code()), std::move(*profile)};
            return out;
        }
        case fb::Message::Attach:
        {
            auto const* m = (*env)->message_as_Attach();
            out.request = AttachReq{Str(m->code()), m->player(), Str(m->token())};
            return out;
        }
        case fb::Message::StartGame:
            out.request = StartGameReq{};
            return out;
        case fb::Message::ResetGame:
            out.request = ResetGameReq{};
            return out;
        case fb::Message::ChangeRole:
        {
            auto const* m = (*env)->message_as_ChangeRole();
            auto const role = FromWire<Role>(m->role(), 2);
            if (!role) return std::unexpected(ParseError{"unknown role"});
            ChangeRoleReq req{*role, std::nullopt};
            if (m->player_class() >= 0)
            {
                auto const cls = FromWire<PlayerClass>(m->player_class(), PlayerClassCount);
                if (!cls) return std::unexpected(ParseError{"unknown player class"});
                req.player_class = cls;
            }
            out.request = req;
            return out;
        }
        case fb::Message::SelectRoom:
            out.request = GameActionReq{SelectRoomAction{(*env)->message_as_SelectRoom()->room()}};
            return out;
        case fb::Message::SelectPower:
        {
            auto const power = FromWire<PowerKind>((*env)->message_as_SelectPower()->power(), PowerKindCount);
            if (!power) return std::unexpected(ParseError{"unknown power"});
            out.request = GameActionReq{SelectPowerAction{*power}};
            return out;
        }
        case fb::Message::PowerAction:
        {
            auto const* m = (*env)->message_as_PowerAction();
            PowerTarget target{Bytes(m->rooms()), OptionalIndex<FloorIdxT>(m->floor())};
            out.request = GameActionReq{PowerTargetAction{std::move(target)}};
            return out;
        }
        case fb::Message::UseRevivalItem:
            out.request = GameActionReq{UseRevivalItemAction{(*env)->message_as_UseRevivalItem()->target()}};
            return out;
        default:
            return std::unexpected(ParseError{"not a client message"});
        }
    }

    static auto DecodeView(fb::SessionView const* v) -> std::expected<SessionView, ParseError>
    {
        if (!v) return std::unexpected(ParseError{"missing view"});
        if (v->schema_version() != SchemaVersion) return std::unexpected(ParseError{"schema version mismatch"});

        SessionView out{};
        out.code = Str(v->code());
        if (v->filtered())
        {
            auto const role = FromWire<Role>(v->viewer(), 2);
            if (!role) return std::unexpected(ParseError{"unknown viewer role"});
            out.viewer = role;
        }
        auto const phase = FromWire<Phase>(v->phase(), static_cast<std::size_t>(Phase::GameOver) + 1);
        if (!phase) return std::unexpected(ParseError{"unknown phase"});
        out.phase = *phase;
        out.turn = v->turn();
        out.started = v->started();
        if (v->winner() == fb::Winner::Survivors) out.winner = Winner::Survivors;
        if (v->winner() == fb::Winner::Killers) out.winner = Winner::Killers;
        out.host = v->host();

        if (auto const* ps = v->players())
        {
            for (auto const* p : *ps)
            {
                auto const cls = FromWire<PlayerClass>(p->player_class(), PlayerClassCount);
                auto const role = FromWire<Role>(p->role(), 2);
                if (!cls || !role) return std::unexpected(ParseError{"bad player"});

                PlayerView pv{};
                pv.index = p->index();
                pv.name = Str(p->name());
                pv.player_class = *cls;
                pv.role = *role;
                pv.is_host = p->is_host();
                pv.eliminated = p->eliminated();
                pv.current_room = OptionalIndex<RoomIdxT>(p->current_room());
                pv.carries_revival_item = p->carries_revival_item();
                if (p->gold() >= 0) pv.gold = static_cast<std::uint32_t>(p->gold());
                pv.poison_countdown = OptionalIndex<std::uint8_t>(p->poison_countdown());
                pv.immobilized_next_turn = p->immobilized_next_turn();
                out.players.push_back(std::move(pv));
            }
        }

        if (auto const* rs = v->rooms())
        {
            for (auto const* r : *rs)
            {
                RoomView rv{};
                rv.index = r->index();
                rv.locked = r->locked();
                rv.trapped = r->trapped();
                rv.trap_triggered = r->trap_triggered();
                rv.highlighted = r->highlighted();
                rv.poison_turns_remaining = r->poison_turns_remaining();
                rv.has_mimic = r->has_mimic();
                rv.has_quest = r->has_quest();
                if (r->required_class() >= 0)
                {
                    auto const cls = FromWire<PlayerClass>(r->required_class(), PlayerClassCount);
                    if (!cls) return std::unexpected(ParseError{"bad required class"});
                    rv.required_class = cls;
                }
                rv.has_crystal = r->has_crystal();
                rv.has_revival_item = r->has_revival_item();
                rv.eliminated_here = Bytes(r->eliminated_here());
                out.rooms.push_back(std::move(rv));
            }
        }

        if (auto const* pa = v->pending_actions())
        {
            for (auto const* p : *pa) out.pending_actions.push_back(PendingView{p->player(), p->room()});
        }

        if (auto const* sels = v->power_selections())
        {
            for (auto const* s : *sels)
            {
                PowerSelectionView sv{};
                sv.player = s->player();
                if (auto const* opts = s->options())
                {
                    for (auto const o : *opts)
                    {
                        auto const k = FromWire<PowerKind>(o, PowerKindCount);
                        if (!k) return std::unexpected(ParseError{"bad power option"});
                        sv.options.push_back(*k);
                    }
                }
                if (s->selected() >= 0)
                {
                    auto const k = FromWire<PowerKind>(s->selected(), PowerKindCount);
                    if (!k) return std::unexpected(ParseError{"bad selected power"});
                    sv.selected = k;
                }
                auto target_rooms = Bytes(s->target_rooms());
                auto const target_floor = OptionalIndex<FloorIdxT>(s->target_floor());
                if (!target_rooms.empty() || target_floor)
                    sv.target = PowerTarget{std::move(target_rooms), target_floor};
                sv.complete = s->complete();
                out.power_selections.push_back(std::move(sv));
            }
        }

        if (auto const* effs = v->active_effects())
        {
            for (auto const* e : *effs)
            {
                auto const k = FromWire<PowerKind>(e->kind(), PowerKindCount);
                if (!k) return std::unexpected(ParseError{"bad effect kind"});
                out.active_effects.push_back(ActiveEffectView{
                    *k, Bytes(e->used_by()), Bytes(e->rooms()), Bytes(e->floors()), e->relocate_objective()});
            }
        }

        out.second_chance_pending = Bytes(v->second_chance_pending());
        out.objectives_total = v->objectives_total();
        out.objectives_completed = v->objectives_completed();
        out.crystal_spawned = v->crystal_spawned();

        if (auto const* evs = v->events())
        {
            for (auto const* e : *evs)
            {
                auto const kind = FromWire<EventKind>(e->kind(), static_cast<std::size_t>(EventKind::GameOver) + 1);
                if (!kind) return std::unexpected(ParseError{"unknown event kind"});
                out.events.push_back(EventView{e->turn(), *kind, Str(e->message())});
            }
        }
        return out;
    }

    auto DecodeServerMessage(std::span<std::byte const> const bytes)
        -> std::expected<DecodedServerMessage, ParseError>
    {
        auto const env = VerifiedEnvelope(bytes);
        if (!env) return std::unexpected(env.error());

        DecodedServerMessage out{};
        out.msg_id = (*env)->msg_id();

        switch ((*env)->message_type())
        {
        case fb::Message::Welcome:
        {
            auto const* m = (*env)->message_as_Welcome();
            out.message = WelcomeMsg{Str(m->code()), m->player(), Str(m->token())};
            return out;
        }
        case fb::Message::StateUpdate:
        {
            auto view = DecodeView((*env)->message_as_StateUpdate()->view());
            if (!view) return std::unexpected(view.error());
            out.message = std::move(*view);
            return out;
        }
        case fb::Message::Notice:
        {
            auto const* m = (*env)->message_as_Notice();
            auto const kind = FromWire<NoticeKind>(m->kind(),
                                                   static_cast<std::size_t>(NoticeKind::SecondChanceGranted) + 1);
            if (!kind) return std::unexpected(ParseError{"unknown notice kind"});
            Notice n{.kind = *kind, .text = Str(m->text())};
            if (m->phase() >= 0) n.phase = FromWire<Phase>(m->phase(), static_cast<std::size_t>(Phase::GameOver) + 1);
            if (m->power() >= 0) n.power = FromWire<PowerKind>(m->power(), PowerKindCount);
            out.message = std::move(n);
            return out;
        }
        case fb::Message::Violation:
        {
            auto const* m = (*env)->message_as_Violation();
            auto const code = FromWire<error::RuleViolationCode>(
                m->code(), static_cast<std::size_t>(error::RuleViolationCode::Internal_Unreachable) + 1);
            if (!code) return std::unexpected(ParseError{"unknown violation code"});
            out.message = ViolationMsg{*code, Str(m->reason())};
            return out;
        }
        case fb::Message::Rejected:
        {
            auto const* m = (*env)->message_as_Rejected();
            auto const code = FromWire<error::LobbyErrorCode>(
                m->code(), static_cast<std::size_t>(error::LobbyErrorCode::DuplicateSurvivorClass) + 1);
            if (!code) return std::unexpected(ParseError{"unknown rejection code"});
            out.message = RejectedMsg{*code, Str(m->reason())};
            return out;
        }
        default:
            return std::unexpected(ParseError{"not a server message"});
        }
    }
}
