#include <gtest/gtest.h>
#include <array>
#include <filesystem>
#include <fmt/format.h>

#include "../core/Session.hpp"
#include "../core/RandomAi.hpp"
#include "../debug/AuditLogger.hpp"
#include "../debug/Invariants.hpp"

using namespace manor::core;

namespace
{
// Every survivor class is distinct; killers take the orc classes.
auto make_session(std::uint64_t seed, std::size_t survivors, std::size_t killers) -> std::unique_ptr<Session>
{
    static constexpr std::array<PlayerClass, 7> survivor_classes{
        PlayerClass::Archer, PlayerClass::Assassin, PlayerClass::Barbarian, PlayerClass::Bard,
        PlayerClass::Elf, PlayerClass::Warrior, PlayerClass::Mage
    };

    Config cfg{};
    cfg.seed = seed;
    cfg.exclude_seen_powers = (seed % 2) == 0;

    auto s = std::make_unique<Session>(fmt::format("S{}", seed % 1000), cfg,
                                       PlayerProfile{"s0", survivor_classes[0], Role::Survivor});
    for (std::size_t i = 1; i < survivors; ++i)
        (void)s->Join(PlayerProfile{fmt::format("s{}", i), survivor_classes[i], Role::Survivor});
    for (std::size_t i = 0; i < killers; ++i)
        (void)s->Join(PlayerProfile{fmt::format("k{}", i), PlayerClass::OrcBerserker, Role::Killer});
    return s;
}

auto make_players(std::uint64_t seed, std::size_t n) -> std::vector<RandomAI>
{
    std::vector<RandomAI> ps;
    ps.reserve(n);
    for (std::size_t i{}; i < n; ++i)
    {
        ps.emplace_back(seed + static_cast<std::uint64_t>(i + 1));
    }
    return ps;
}

// Plays one game to the end. Returns false when nobody can move any more.
auto play(Session& s, std::vector<RandomAI>& ais, debug::AuditLogger& log) -> bool
{
    constexpr int max_rounds = 5000;
    for (int round = 0; round < max_rounds; ++round)
    {
        bool moved = false;
        for (std::size_t i{}; i < ais.size(); ++i)
        {
            if (s.PhaseNow() == Phase::GameOver) return true;

            auto const me = static_cast<PlyrIdxT>(i);
            SessionView const view = s.ViewFor(s.RoleOf(me));
            std::optional<PlayerAction> const action = ais[i].Play(view, me, s.Catalog(), s.Cfg());
            if (!action) continue;

            log.action(s, me, *action);
            ActionOutcome const out = s.Submit(me, *action);
            log.outcome(out);
            (void)s.DrainOutbox();
            debug::CheckInvariants(s);

            if (out == ActionOutcome::Invalid) continue;
            moved = true;
            if (out == ActionOutcome::TurnResolved || out == ActionOutcome::GameEnded) log.turn(s);
        }
        if (s.PhaseNow() == Phase::GameOver) return true;
        if (!moved) return false;
    }
    return false;
}

auto run(std::uint64_t seed, std::size_t survivors, std::size_t killers, std::string const& tag) -> void
{
    namespace fs = std::filesystem;
    fs::create_directories("_artifacts");
    std::string const path = fmt::format("_artifacts/{}_{}.log", tag, seed);

    auto s = make_session(seed, survivors, killers);
    auto ais = make_players(seed, survivors + killers);
    {
        debug::AuditLogger log(path);
        ASSERT_TRUE(s->Start().has_value());
        log.start(*s, seed);
        (void)s->DrainOutbox();
        debug::CheckInvariants(*s);

        ASSERT_TRUE(play(*s, ais, log)) << "seed " << seed << " stalled at turn " << s->Turn();
        log.end(*s);
    }

    EXPECT_EQ(s->PhaseNow(), Phase::GameOver);
    EXPECT_TRUE(s->State().winner.has_value());
    ASSERT_TRUE(fs::exists(path));
    ASSERT_GT(fs::file_size(path), 0u);
}

} // anonymous namespace

TEST(SelfPlay, Transcripts_And_End)
{
    try
    {
        for (std::uint64_t seed : {111ull, 222ull, 333ull})
        {
            run(seed, 2, 1, "game");
        }
    }
    catch (OmegaException<error::Code> const& e)
    {
        ADD_FAILURE() << e.to_str();
    }
}

TEST(SelfPlay, FullHouse_Transcripts_And_End)
{
    try
    {
        for (std::uint64_t seed : {1ull, 23ull, 44ull, 111ull})
        {
            run(seed, 5, 3, "game8p");
        }
    }
    catch (OmegaException<error::Code> const& e)
    {
        ADD_FAILURE() << e.to_str();
    }
}

TEST(SelfPlay, ResetAndReplay)
{
    std::filesystem::create_directories("_artifacts");
    auto s = make_session(77, 3, 2);
    auto ais = make_players(77, 5);
    debug::AuditLogger log("_artifacts/replay_77.log");

    ASSERT_TRUE(s->Start().has_value());
    ASSERT_TRUE(play(*s, ais, log));
    std::string const first_winner = s->State().winner == Winner::Survivors ? "survivors" : "killers";

    s->Reset();
    debug::CheckInvariants(*s);
    ASSERT_TRUE(s->Start().has_value());
    ASSERT_TRUE(play(*s, ais, log)) << "after a " << first_winner << " win";
    log.end(*s);
}
