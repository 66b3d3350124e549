//
// Created by Malik T on 05/11/2025.
//
#include "Powers.hpp"

#include <algorithm>
#include <ranges>
#include <fmt/format.h>

namespace
{
    using manor::core::error::RuleViolation;
    using manor::core::error::RuleViolationCode;

    inline auto Viol(RuleViolationCode code) -> RuleViolation
    {
        return RuleViolation{.code = code};
    }
}

namespace manor::core
{
    auto PowerEffect::ValidateTarget(RoomCatalog const& catalog, Config const& cfg, PowerTarget const& target) const
        -> error::ValidateResult
    {
        using RVC = error::RuleViolationCode;
        auto const attempted = static_cast<std::uint8_t>(target.rooms.size());

        auto rooms_known_and_distinct = [&]() -> error::ValidateResult
        {
            std::set<RoomIdxT> seen;
            for (RoomIdxT const r : target.rooms)
            {
                if (!catalog.IsRoom(r))
                    return std::unexpected(Viol(RVC::Target_UnknownRoom).with_room(r));
                if (!seen.insert(r).second)
                    return std::unexpected(Viol(RVC::Target_DuplicateRoom).with_room(r));
            }
            return {};
        };

        switch (def_.targeting)
        {
        case TargetingKind::None:
            return std::unexpected(Viol(RVC::Power_TargetNotRequired));

        case TargetingKind::SingleRoom:
            if (target.rooms.size() != 1)
                return std::unexpected(Viol(RVC::Target_WrongCount).with_expected(1).with_attempted(attempted));
            return rooms_known_and_distinct();

        case TargetingKind::RoomSet:
        {
            std::uint8_t const max = MaxRooms(cfg);
            if (target.rooms.empty() || target.rooms.size() > max)
                return std::unexpected(Viol(RVC::Target_WrongCount).with_expected(max).with_attempted(attempted));
            return rooms_known_and_distinct();
        }

        case TargetingKind::OnePerFloor:
        {
            auto const floors = static_cast<std::uint8_t>(catalog.FloorCount());
            if (target.rooms.size() != floors)
                return std::unexpected(Viol(RVC::Target_WrongCount).with_expected(floors).with_attempted(attempted));
            if (auto ok = rooms_known_and_distinct(); !ok) return ok;

            std::set<FloorIdxT> covered;
            for (RoomIdxT const r : target.rooms)
            {
                if (!covered.insert(catalog.FloorOf(r)).second)
                    return std::unexpected(Viol(RVC::Target_NotOnePerFloor).with_room(r));
            }
            return {};
        }

        case TargetingKind::OneFloor:
            if (!target.floor)
                return std::unexpected(Viol(RVC::Target_FloorRequired));
            if (!catalog.IsFloor(*target.floor))
                return std::unexpected(Viol(RVC::Target_UnknownFloor));
            return {};
        }
        return std::unexpected(Viol(RVC::Internal_Unreachable));
    }

    namespace
    {
        auto KillerName(PowerContext const& ctx, PlyrIdxT const killer) -> std::string const&
        {
            return ctx.state.players[killer].name;
        }

        auto AppendRooms(ActiveEffect& effect, std::span<RoomIdxT const> rooms) -> void
        {
            for (RoomIdxT const r : rooms)
            {
                if (std::ranges::find(effect.rooms, r) == std::cend(effect.rooms))
                    effect.rooms.push_back(r);
            }
        }

        // Highlights half the rooms not visited since the last objective, one floor at a time.
        class RevealEffect final : public PowerEffect
        {
        public:
            RevealEffect() : PowerEffect({PowerKind::Reveal, "vision", "Reveal", TargetingKind::None}) {}

            auto Apply(PowerContext& ctx, PlyrIdxT const killer, PowerTarget const&, ActiveEffect& effect) const
                -> void override
            {
                SessionState& st = ctx.state;
                auto const& visited = st.rooms_visited_since_objective;

                std::size_t unvisited = 0;
                std::vector<std::vector<RoomIdxT>> per_floor(ctx.catalog.FloorCount());
                for (std::size_t f{}; f < per_floor.size(); ++f)
                {
                    for (RoomIdxT const r : ctx.catalog.RoomsOnFloor(static_cast<FloorIdxT>(f)))
                    {
                        if (std::ranges::find(visited, r) == std::cend(visited))
                            per_floor[f].push_back(r);
                    }
                    unvisited += per_floor[f].size();
                    std::ranges::shuffle(per_floor[f], ctx.rng);
                }
                std::size_t const wanted = unvisited / 2;

                std::vector<FloorIdxT> order(per_floor.size());
                for (std::size_t f{}; f < order.size(); ++f) order[f] = static_cast<FloorIdxT>(f);

                std::vector<RoomIdxT> picked;
                bool progress = true;
                while (picked.size() < wanted && progress)
                {
                    progress = false;
                    std::ranges::shuffle(order, ctx.rng);
                    for (FloorIdxT const f : order)
                    {
                        if (picked.size() >= wanted) break;
                        if (per_floor[f].empty()) continue;
                        picked.push_back(per_floor[f].back());
                        per_floor[f].pop_back();
                        progress = true;
                    }
                }

                for (RoomIdxT const r : picked) st.rooms[r].highlighted = true;
                AppendRooms(effect, picked);
                ctx.out.Event(EventKind::PowerUsed,
                              fmt::format("{} used Reveal: {} rooms highlighted", KillerName(ctx, killer), picked.size()),
                              Role::Killer);
            }
        };

        class RelocateOnMissEffect final : public PowerEffect
        {
        public:
            RelocateOnMissEffect() : PowerEffect({PowerKind::RelocateOnMiss, "secousse", "Relocate on miss",
                                                  TargetingKind::None}) {}

            auto Apply(PowerContext& ctx, PlyrIdxT const killer, PowerTarget const&, ActiveEffect& effect) const
                -> void override
            {
                effect.relocate_objective = true;
                ctx.out.Event(EventKind::PowerUsed,
                              fmt::format("{} shook the manor: the objective moves unless it is found this turn",
                                          KillerName(ctx, killer)),
                              Role::Killer);
            }
        };

        class FreezeTrapEffect final : public PowerEffect
        {
        public:
            FreezeTrapEffect() : PowerEffect({PowerKind::FreezeTrap, "piege", "Freeze trap",
                                              TargetingKind::OnePerFloor}) {}

            auto Apply(PowerContext& ctx, PlyrIdxT const killer, PowerTarget const& target, ActiveEffect& effect) const
                -> void override
            {
                for (RoomIdxT const r : target.rooms)
                {
                    ctx.state.rooms[r].trapped = true;
                    ctx.state.rooms[r].trap_triggered = false;
                }
                AppendRooms(effect, target.rooms);
                ctx.out.Event(EventKind::PowerUsed,
                              fmt::format("{} set {} traps", KillerName(ctx, killer), target.rooms.size()),
                              Role::Killer);
            }
        };

        class PoisonEffect final : public PowerEffect
        {
        public:
            PoisonEffect() : PowerEffect({PowerKind::Poison, "poison", "Poison", TargetingKind::SingleRoom}) {}

            auto Apply(PowerContext& ctx, PlyrIdxT const killer, PowerTarget const& target, ActiveEffect& effect) const
                -> void override
            {
                RoomIdxT const r = target.rooms.front();
                ctx.state.rooms[r].poison_turns_remaining = ctx.cfg.poison_room_turns;
                AppendRooms(effect, target.rooms);
                ctx.out.Event(EventKind::PowerUsed,
                              fmt::format("{} poisoned {}", KillerName(ctx, killer), ctx.catalog.NameOf(r)),
                              Role::Killer);
            }
        };

        // Tells killers whether a survivor's pending choice lies on the chosen floor.
        class LocateEffect final : public PowerEffect
        {
        public:
            LocateEffect() : PowerEffect({PowerKind::Locate, "traque", "Locate", TargetingKind::OneFloor}) {}

            auto Apply(PowerContext& ctx, PlyrIdxT const killer, PowerTarget const& target, ActiveEffect& effect) const
                -> void override
            {
                FloorIdxT const floor = *target.floor;
                effect.floors.push_back(floor);

                bool noise = false;
                for (auto const& [player, pending] : ctx.state.pending_actions)
                {
                    PlayerState const& p = ctx.state.players[player];
                    if (p.role == Role::Survivor && !p.eliminated && ctx.catalog.FloorOf(pending.room) == floor)
                    {
                        noise = true;
                        break;
                    }
                }

                std::string const& floor_name = ctx.catalog.FloorName(floor);
                ctx.out.Event(EventKind::SoundClue,
                              noise
                                  ? fmt::format("{} hears noise on {}", KillerName(ctx, killer), floor_name)
                                  : fmt::format("{} hears silence on {}", KillerName(ctx, killer), floor_name),
                              Role::Killer);
            }
        };

        class BarricadeEffect final : public PowerEffect
        {
        public:
            BarricadeEffect() : PowerEffect({PowerKind::Barricade, "barricade", "Barricade", TargetingKind::RoomSet}) {}

            auto MaxRooms(Config const& cfg) const -> std::uint8_t override { return cfg.barricade_rooms; }

            auto Apply(PowerContext& ctx, PlyrIdxT const killer, PowerTarget const& target, ActiveEffect& effect) const
                -> void override
            {
                AppendRooms(effect, target.rooms);
                ctx.out.Event(EventKind::PowerUsed,
                              fmt::format("{} barricaded {} rooms", KillerName(ctx, killer), target.rooms.size()),
                              Role::Killer);
            }
        };

        class SecondChanceEffect final : public PowerEffect
        {
        public:
            SecondChanceEffect() : PowerEffect({PowerKind::SecondChance, "rage", "Second chance",
                                                TargetingKind::None}) {}

            auto Apply(PowerContext& ctx, PlyrIdxT const killer, PowerTarget const&, ActiveEffect&) const
                -> void override
            {
                ctx.out.Event(EventKind::PowerUsed,
                              fmt::format("{} is enraged: a catch earns another search", KillerName(ctx, killer)),
                              Role::Killer);
            }
        };

        class DecoyEffect final : public PowerEffect
        {
        public:
            DecoyEffect() : PowerEffect({PowerKind::Decoy, "mimic", "Decoy", TargetingKind::RoomSet}) {}

            auto MaxRooms(Config const& cfg) const -> std::uint8_t override { return cfg.decoy_rooms; }

            auto Apply(PowerContext& ctx, PlyrIdxT const killer, PowerTarget const& target, ActiveEffect& effect) const
                -> void override
            {
                for (RoomIdxT const r : target.rooms) ctx.state.rooms[r].has_mimic = true;
                AppendRooms(effect, target.rooms);
                ctx.out.Event(EventKind::PowerUsed,
                              fmt::format("{} hid {} decoys", KillerName(ctx, killer), target.rooms.size()),
                              Role::Killer);
            }
        };
    }

    PowerCatalog::PowerCatalog()
    {
        // ordered by PowerKind
        effects_.push_back(std::make_unique<RevealEffect>());
        effects_.push_back(std::make_unique<RelocateOnMissEffect>());
        effects_.push_back(std::make_unique<FreezeTrapEffect>());
        effects_.push_back(std::make_unique<PoisonEffect>());
        effects_.push_back(std::make_unique<LocateEffect>());
        effects_.push_back(std::make_unique<BarricadeEffect>());
        effects_.push_back(std::make_unique<SecondChanceEffect>());
        effects_.push_back(std::make_unique<DecoyEffect>());
        MNR_ASSERT(effects_.size() == PowerKindCount, "Power catalog out of sync with PowerKind");
    }

    auto PowerCatalog::Instance() -> PowerCatalog const&
    {
        static PowerCatalog const catalog;
        return catalog;
    }

    auto PowerCatalog::Get(PowerKind const kind) const -> PowerEffect const&
    {
        auto const idx = static_cast<std::size_t>(kind);
        MNR_ASSERT(idx < effects_.size(), "Unknown power kind");
        return *effects_[idx];
    }

    auto PowerCatalog::FindByKey(std::string_view const key) const -> std::optional<PowerKind>
    {
        for (auto const& e : effects_)
        {
            if (e->Def().key == key) return e->Def().kind;
        }
        return std::nullopt;
    }

    auto PowerCatalog::Draw(Config const& cfg, std::set<PowerKind>& seen, std::mt19937_64& rng) const
        -> std::vector<PowerKind>
    {
        std::size_t const count = std::min(cfg.power_draw_count, effects_.size());

        std::vector<PowerKind> pool;
        for (auto const& e : effects_)
        {
            if (cfg.exclude_seen_powers && seen.contains(e->Def().kind)) continue;
            pool.push_back(e->Def().kind);
        }
        if (pool.size() < count)
        {
            seen.clear();
            pool.clear();
            for (auto const& e : effects_) pool.push_back(e->Def().kind);
        }

        std::ranges::shuffle(pool, rng);
        pool.resize(count);
        seen.insert(std::cbegin(pool), std::cend(pool));
        return pool;
    }

    auto to_string(PowerKind const k) -> std::string_view
    {
        return PowerCatalog::Instance().Get(k).Def().name;
    }
}
