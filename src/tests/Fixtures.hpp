//
// Created by Malik T on 10/11/2025.
//

#ifndef MANORGAME_FIXTURES_HPP
#define MANORGAME_FIXTURES_HPP

#include <gtest/gtest.h>
#include <memory>
#include <optional>
#include <vector>

#include "../core/Powers.hpp"
#include "../core/Session.hpp"
#include "../debug/Inspector.hpp"

namespace manor::test
{
    using namespace manor::core;
    using manor::core::debug::Inspector;

    inline constexpr std::uint64_t Seed = 20251108ull;

    // Pickups parked out of the way of the rooms scenarios walk through.
    inline constexpr RoomIdxT ObjectiveRoom = 0;
    inline constexpr RoomIdxT ItemRoom = 11;

    inline auto MakeConfig() -> Config
    {
        Config cfg{};
        cfg.seed = Seed;
        return cfg;
    }

    inline auto Survivor(std::string name, PlayerClass cls) -> PlayerProfile
    {
        return PlayerProfile{std::move(name), cls, Role::Survivor};
    }

    inline auto Killer(std::string name) -> PlayerProfile
    {
        return PlayerProfile{std::move(name), PlayerClass::OrcKing, Role::Killer};
    }

    inline auto MakeLobby(PlayerProfile host, std::vector<PlayerProfile> const& others, Config const& cfg = MakeConfig())
        -> std::unique_ptr<Session>
    {
        auto s = std::make_unique<Session>("TEST", cfg, std::move(host));
        for (PlayerProfile const& p : others)
        {
            auto const joined = s->Join(p);
            EXPECT_TRUE(joined.has_value()) << "join failed for " << p.name;
        }
        (void)s->DrainOutbox();
        return s;
    }

    // Starts the lobby and parks the objective and the revival item.
    inline auto StartQuiet(std::unique_ptr<Session> s) -> std::unique_ptr<Session>
    {
        auto const started = s->Start();
        EXPECT_TRUE(started.has_value());
        Inspector::PutObjective(*s, ObjectiveRoom);
        Inspector::PutRevivalItem(*s, ItemRoom);
        (void)s->DrainOutbox();
        return s;
    }

    // Ana (Archer, 0) against Kai (1).
    inline auto StartedDuel(Config const& cfg = MakeConfig()) -> std::unique_ptr<Session>
    {
        return StartQuiet(MakeLobby(Survivor("Ana", PlayerClass::Archer), {Killer("Kai")}, cfg));
    }

    // Ana (Archer, 0) and Bo (Bard, 1) against Kai (2).
    inline auto StartedTrio(Config const& cfg = MakeConfig()) -> std::unique_ptr<Session>
    {
        return StartQuiet(MakeLobby(Survivor("Ana", PlayerClass::Archer),
                                    {Survivor("Bo", PlayerClass::Bard), Killer("Kai")}, cfg));
    }

    // Offers exactly `power` to `killer` and plays it through to completion.
    inline auto UsePower(Session& s, PlyrIdxT killer, PowerKind power, PowerTarget const& target = {})
        -> ActionOutcome
    {
        Inspector::Mutable(s).power_selections[killer].options = {power};
        ActionOutcome out = s.Submit(killer, SelectPowerAction{power});
        if (PowerCatalog::Instance().Get(power).RequiresTargeting())
            out = s.Submit(killer, PowerTargetAction{target});
        return out;
    }

    // The last rule violation queued for delivery, if any; drains the outbox.
    inline auto LastViolation(Session& s) -> std::optional<error::RuleViolation>
    {
        std::optional<error::RuleViolation> last;
        for (Broadcast const& b : s.DrainOutbox())
        {
            if (auto const* v = std::get_if<Violation>(&b.message)) last = v->violation;
        }
        return last;
    }

    inline auto CountRooms(Session const& s, bool RoomState::* flag) -> std::size_t
    {
        std::size_t n = 0;
        for (RoomState const& r : s.State().rooms) n += (r.*flag) ? 1u : 0u;
        return n;
    }
}

#endif //MANORGAME_FIXTURES_HPP
