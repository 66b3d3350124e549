//
// Created by Malik T on 05/11/2025.
//

#ifndef MANORGAME_POWERS_HPP
#define MANORGAME_POWERS_HPP

#include <array>
#include <random>
#include <set>
#include <span>
#include "Actions.hpp"
#include "Exception.hpp"
#include "Outbound.hpp"
#include "RoomCatalog.hpp"
#include "State.hpp"

namespace manor::core
{
    enum class TargetingKind : std::uint8_t
    {
        None,
        SingleRoom,
        RoomSet,     // 1..N distinct rooms
        OnePerFloor, // exactly one room on every floor
        OneFloor
    };

    struct PowerDef
    {
        PowerKind kind{};
        std::string_view key;
        std::string_view name;
        TargetingKind targeting{TargetingKind::None};
    };

    // Everything an effect may touch while being applied.
    struct PowerContext
    {
        SessionState& state;
        RoomCatalog const& catalog;
        Config const& cfg;
        std::mt19937_64& rng;
        Outbox& out;
    };

    class PowerEffect
    {
    public:
        explicit PowerEffect(PowerDef const def) : def_(def) {}
        virtual ~PowerEffect() = default;

        auto Def() const noexcept -> PowerDef const& { return def_; }
        auto RequiresTargeting() const noexcept -> bool { return def_.targeting != TargetingKind::None; }

        // Upper bound for RoomSet targeting.
        virtual auto MaxRooms(Config const&) const -> std::uint8_t { return 1; }

        // Shape check of a targeting payload against the catalog.
        auto ValidateTarget(RoomCatalog const& catalog, Config const& cfg, PowerTarget const& target) const
            -> error::ValidateResult;

        // Applied once per killer, in killer insertion order, at the end of power selection.
        // `effect` is the accumulated record for this power kind.
        virtual auto Apply(PowerContext& ctx, PlyrIdxT killer, PowerTarget const& target, ActiveEffect& effect) const
            -> void = 0;

    private:
        PowerDef def_;
    };

    class PowerCatalog
    {
    public:
        static auto Instance() -> PowerCatalog const&;

        auto All() const noexcept -> std::span<std::unique_ptr<PowerEffect> const> { return effects_; }
        auto Get(PowerKind kind) const -> PowerEffect const&;
        auto FindByKey(std::string_view key) const -> std::optional<PowerKind>;

        // Draws distinct powers uniformly. With exclude_seen_powers the killer's `seen`
        // set is skipped and then extended; it is forgotten when too few powers remain.
        auto Draw(Config const& cfg, std::set<PowerKind>& seen, std::mt19937_64& rng) const
            -> std::vector<PowerKind>;

    private:
        PowerCatalog();
        std::vector<std::unique_ptr<PowerEffect>> effects_;
    };

    auto to_string(PowerKind k) -> std::string_view;
}

#endif //MANORGAME_POWERS_HPP
