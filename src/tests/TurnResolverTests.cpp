#include <gtest/gtest.h>
#include <algorithm>
#include <array>

#include "Fixtures.hpp"
#include "../core/Objectives.hpp"
#include "../debug/Invariants.hpp"

using namespace manor::core;
using namespace manor::test;

namespace
{
    // Both survivors and the killer pick, with a Reveal in between.
    auto PlayTurn(Session& s, std::vector<std::pair<PlyrIdxT, RoomIdxT>> const& survivors,
                  PlyrIdxT killer, RoomIdxT killer_room) -> ActionOutcome
    {
        for (auto const& [p, room] : survivors)
            EXPECT_NE(s.Submit(p, SelectRoomAction{room}), ActionOutcome::Invalid) << "P" << int(p);
        EXPECT_EQ(s.PhaseNow(), Phase::KillerPowerSelection);
        EXPECT_EQ(UsePower(s, killer, PowerKind::Reveal), ActionOutcome::PhaseAdvanced);
        return s.Submit(killer, SelectRoomAction{killer_room});
    }
}

TEST(TurnResolver, Start_PlacesOneObjectivePerSurvivorAndOneItem)
{
    auto s = MakeLobby(Survivor("Ana", PlayerClass::Archer), {Killer("Kai")});
    ASSERT_TRUE(s->Start().has_value());

    SessionState const& st = s->State();
    EXPECT_EQ(st.objectives.queue.size(), 1u);
    EXPECT_EQ(st.phase, Phase::SurvivorSelection);
    EXPECT_EQ(st.turn, 1u);
    EXPECT_EQ(CountRooms(*s, &RoomState::has_quest), 1u);
    EXPECT_EQ(CountRooms(*s, &RoomState::has_revival_item), 1u);
    debug::CheckInvariants(*s);
}

TEST(TurnResolver, PhaseWaitsForEverySurvivor)
{
    auto s = StartedTrio();
    EXPECT_EQ(s->Submit(0, SelectRoomAction{4}), ActionOutcome::Applied);
    EXPECT_EQ(s->PhaseNow(), Phase::SurvivorSelection);
    EXPECT_EQ(s->Submit(1, SelectRoomAction{8}), ActionOutcome::PhaseAdvanced);
    EXPECT_EQ(s->PhaseNow(), Phase::KillerPowerSelection);
    EXPECT_EQ(s->State().power_selections.at(2).options.size(), s->Cfg().power_draw_count);
}

TEST(TurnResolver, KillerSelectionWaitsForCompletePowers)
{
    auto s = StartedTrio();
    ASSERT_NE(s->Submit(0, SelectRoomAction{4}), ActionOutcome::Invalid);
    ASSERT_NE(s->Submit(1, SelectRoomAction{8}), ActionOutcome::Invalid);

    Inspector::Mutable(*s).power_selections[2].options = {PowerKind::Poison};
    EXPECT_EQ(s->Submit(2, SelectPowerAction{PowerKind::Poison}), ActionOutcome::Applied);
    EXPECT_EQ(s->PhaseNow(), Phase::KillerPowerSelection);

    // a room before the power is done is out of phase
    EXPECT_EQ(s->Submit(2, SelectRoomAction{5}), ActionOutcome::Invalid);
    EXPECT_EQ(LastViolation(*s)->code, error::RuleViolationCode::WrongPhase_KillerSelectionRequired);

    EXPECT_EQ(s->Submit(2, PowerTargetAction{PowerTarget{{5}, std::nullopt}}), ActionOutcome::PhaseAdvanced);
    EXPECT_EQ(s->PhaseNow(), Phase::KillerSelection);
    EXPECT_EQ(s->State().rooms[5].poison_turns_remaining, s->Cfg().poison_room_turns);
}

TEST(TurnResolver, MatchingSurvivorCompletesObjective_NextOneIsPlaced)
{
    auto s = StartedTrio();
    auto const active = objectives::Active(s->State());
    ASSERT_TRUE(active.has_value());
    PlyrIdxT const owner = active->owner;
    PlyrIdxT const other = owner == 0 ? 1 : 0;

    // keeps the next objective out of the other survivor's room
    Inspector::Mutable(*s).players[2].current_room = 8;

    EXPECT_EQ(s->Submit(owner, SelectRoomAction{ObjectiveRoom}), ActionOutcome::Applied);
    EXPECT_EQ(s->PhaseNow(), Phase::SurvivorSelection);
    EXPECT_EQ(PlayTurn(*s, {{other, 8}}, 2, 10), ActionOutcome::TurnResolved);

    SessionState const& st = s->State();
    ASSERT_EQ(st.objectives.completed.size(), 1u);
    EXPECT_EQ(st.objectives.completed.front(), active->required_class);
    EXPECT_EQ(CountRooms(*s, &RoomState::has_quest), 1u);
    ASSERT_TRUE(st.objectives.active_room.has_value());
    EXPECT_EQ(st.rooms[*st.objectives.active_room].required_class, st.players[other].player_class);
    EXPECT_FALSE(st.objectives.crystal_spawned);
    debug::CheckInvariants(*s);
}

TEST(TurnResolver, WrongClassLeavesObjectiveInPlace)
{
    auto s = StartedTrio();
    PlyrIdxT const owner = objectives::Active(s->State())->owner;
    PlyrIdxT const other = owner == 0 ? 1 : 0;

    EXPECT_EQ(PlayTurn(*s, {{other, ObjectiveRoom}, {owner, 8}}, 2, 10), ActionOutcome::TurnResolved);
    EXPECT_TRUE(s->State().objectives.completed.empty());
    EXPECT_TRUE(s->State().rooms[ObjectiveRoom].has_quest);
}

TEST(TurnResolver, KillerCatchesSurvivor_RoomSealedNextTurn)
{
    auto s = StartedTrio();
    EXPECT_EQ(PlayTurn(*s, {{0, 5}, {1, 8}}, 2, 5), ActionOutcome::TurnResolved);

    SessionState const& st = s->State();
    EXPECT_TRUE(st.players[0].eliminated);
    EXPECT_EQ(st.players[0].gold, 0u);
    EXPECT_EQ(st.players[1].gold, s->Cfg().gold_per_search);
    EXPECT_TRUE(st.rooms[5].locked);
    EXPECT_EQ(st.rooms[5].eliminated_here, std::vector<PlyrIdxT>{0});
    EXPECT_EQ(st.turn, 2u);
    EXPECT_EQ(st.phase, Phase::SurvivorSelection);

    EXPECT_EQ(s->Submit(1, SelectRoomAction{5}), ActionOutcome::Invalid);
    EXPECT_EQ(LastViolation(*s)->code, error::RuleViolationCode::Room_Locked);

    EXPECT_EQ(s->Submit(0, SelectRoomAction{6}), ActionOutcome::Invalid);
    EXPECT_EQ(LastViolation(*s)->code, error::RuleViolationCode::ActorEliminated);
    debug::CheckInvariants(*s);
}

TEST(TurnResolver, LastSurvivorCaught_KillersWin)
{
    auto s = StartedDuel();
    EXPECT_EQ(PlayTurn(*s, {{0, 6}}, 1, 6), ActionOutcome::GameEnded);

    EXPECT_EQ(s->PhaseNow(), Phase::GameOver);
    ASSERT_TRUE(s->State().winner.has_value());
    EXPECT_EQ(*s->State().winner, Winner::Killers);

    EXPECT_EQ(s->Submit(1, SelectRoomAction{2}), ActionOutcome::Invalid);
    EXPECT_EQ(LastViolation(*s)->code, error::RuleViolationCode::GameAlreadyOver);
    debug::CheckInvariants(*s);
}

TEST(TurnResolver, FreezeTrap_ImmobilizesAndFlipsVisibility)
{
    auto s = StartedTrio();

    ASSERT_NE(s->Submit(0, SelectRoomAction{4}), ActionOutcome::Invalid);
    ASSERT_NE(s->Submit(1, SelectRoomAction{8}), ActionOutcome::Invalid);
    ASSERT_EQ(UsePower(*s, 2, PowerKind::FreezeTrap, PowerTarget{{1, 5, 9}, std::nullopt}),
              ActionOutcome::PhaseAdvanced);
    EXPECT_TRUE(s->State().rooms[5].trapped);
    EXPECT_FALSE(s->ViewFor(Role::Survivor).rooms[5].trapped);
    EXPECT_TRUE(s->ViewFor(Role::Killer).rooms[5].trapped);
    ASSERT_EQ(s->Submit(2, SelectRoomAction{10}), ActionOutcome::TurnResolved);

    // armed traps survive into the next survivor selection
    EXPECT_TRUE(s->State().rooms[5].trapped);

    EXPECT_EQ(s->Submit(0, SelectRoomAction{5}), ActionOutcome::Applied);
    {
        SessionState const& st = s->State();
        EXPECT_TRUE(st.rooms[5].trapped);
        EXPECT_TRUE(st.rooms[5].trap_triggered);
        EXPECT_TRUE(st.players[0].immobilized_next_turn);

        SessionView const sv = s->ViewFor(Role::Survivor);
        SessionView const kv = s->ViewFor(Role::Killer);
        EXPECT_TRUE(sv.rooms[5].trap_triggered);
        EXPECT_FALSE(sv.rooms[1].trap_triggered);
        EXPECT_FALSE(kv.rooms[5].trap_triggered);
    }
    debug::CheckInvariants(*s);

    ASSERT_EQ(s->Submit(1, SelectRoomAction{8}), ActionOutcome::PhaseAdvanced);
    for (RoomIdxT const r : {1, 5, 9})
    {
        EXPECT_FALSE(s->State().rooms[r].trapped);
        EXPECT_FALSE(s->State().rooms[r].trap_triggered);
    }
    ASSERT_EQ(UsePower(*s, 2, PowerKind::Reveal), ActionOutcome::PhaseAdvanced);
    ASSERT_EQ(s->Submit(2, SelectRoomAction{10}), ActionOutcome::TurnResolved);

    // the trap cost the search reward
    EXPECT_EQ(s->State().players[0].gold, s->Cfg().gold_per_search);

    EXPECT_EQ(s->Submit(0, SelectRoomAction{6}), ActionOutcome::Invalid);
    EXPECT_EQ(LastViolation(*s)->code, error::RuleViolationCode::Room_Immobilized);
    EXPECT_FALSE(s->State().pending_actions.contains(0));

    EXPECT_EQ(s->Submit(0, SelectRoomAction{5}), ActionOutcome::Applied);
    ASSERT_TRUE(s->State().pending_actions.contains(0));
    EXPECT_TRUE(s->State().pending_actions.at(0).passed);
    EXPECT_FALSE(s->State().players[0].immobilized_next_turn);
}

TEST(TurnResolver, KillersCannotReadASurvivorsPickFromTheirTraps)
{
    auto s = StartedTrio();

    ASSERT_NE(s->Submit(0, SelectRoomAction{4}), ActionOutcome::Invalid);
    ASSERT_NE(s->Submit(1, SelectRoomAction{8}), ActionOutcome::Invalid);
    ASSERT_EQ(UsePower(*s, 2, PowerKind::FreezeTrap, PowerTarget{{1, 5, 9}, std::nullopt}),
              ActionOutcome::PhaseAdvanced);
    ASSERT_EQ(s->Submit(2, SelectRoomAction{10}), ActionOutcome::TurnResolved);

    SessionView const before = s->ViewFor(Role::Killer);
    ASSERT_EQ(s->Submit(0, SelectRoomAction{5}), ActionOutcome::Applied);
    SessionView const after = s->ViewFor(Role::Killer);
    for (RoomIdxT const r : {1, 5, 9})
    {
        EXPECT_TRUE(after.rooms[r].trapped) << "room " << int(r);
        EXPECT_EQ(after.rooms[r], before.rooms[r]) << "room " << int(r);
    }

    // a second survivor walking into the same trap is caught too
    ASSERT_EQ(s->Submit(1, SelectRoomAction{5}), ActionOutcome::PhaseAdvanced);
    EXPECT_TRUE(s->State().players[0].immobilized_next_turn);
    EXPECT_TRUE(s->State().players[1].immobilized_next_turn);
}

TEST(TurnResolver, KillersCannotReadASurvivorsPickFromTheirDecoys)
{
    auto s = StartedTrio();

    ASSERT_NE(s->Submit(0, SelectRoomAction{4}), ActionOutcome::Invalid);
    ASSERT_NE(s->Submit(1, SelectRoomAction{8}), ActionOutcome::Invalid);
    ASSERT_EQ(UsePower(*s, 2, PowerKind::Decoy, PowerTarget{{5, 6}, std::nullopt}), ActionOutcome::PhaseAdvanced);
    ASSERT_EQ(s->Submit(2, SelectRoomAction{10}), ActionOutcome::TurnResolved);

    ASSERT_EQ(s->Submit(0, SelectRoomAction{5}), ActionOutcome::Applied);
    SessionView const kv = s->ViewFor(Role::Killer);
    EXPECT_TRUE(kv.rooms[5].has_mimic);
    EXPECT_TRUE(kv.rooms[6].has_mimic);
    debug::CheckInvariants(*s);

    ASSERT_EQ(s->Submit(1, SelectRoomAction{8}), ActionOutcome::PhaseAdvanced);
    EXPECT_FALSE(s->State().rooms[5].has_mimic);
    EXPECT_FALSE(s->State().rooms[6].has_mimic);
    EXPECT_TRUE(s->State().pending_actions.at(0).hit_decoy);
}

TEST(TurnResolver, Reveal_HighlightsHalfTheRoomsNobodyVisited)
{
    auto s = StartedTrio();
    Inspector::Mutable(*s).rooms_visited_since_objective = {0, 1, 2, 3, 4, 5, 6, 7};

    // this turn's picks count as visited already: 9, 10 and 11 are left
    ASSERT_NE(s->Submit(0, SelectRoomAction{4}), ActionOutcome::Invalid);
    ASSERT_NE(s->Submit(1, SelectRoomAction{8}), ActionOutcome::Invalid);
    ASSERT_EQ(UsePower(*s, 2, PowerKind::Reveal), ActionOutcome::PhaseAdvanced);

    SessionView const kv = s->ViewFor(Role::Killer);
    std::vector<RoomIdxT> lit;
    for (RoomView const& r : kv.rooms)
        if (r.highlighted) lit.push_back(r.index);
    ASSERT_EQ(lit.size(), 1u);
    EXPECT_TRUE(lit.front() >= 9 && lit.front() <= 11) << "room " << int(lit.front());
    EXPECT_EQ(CountRooms(*s, &RoomState::highlighted), 1u);

    for (RoomView const& r : s->ViewFor(Role::Survivor).rooms) EXPECT_FALSE(r.highlighted);

    // highlights last until resolution
    ASSERT_EQ(s->Submit(2, SelectRoomAction{10}), ActionOutcome::TurnResolved);
    EXPECT_EQ(CountRooms(*s, &RoomState::highlighted), 0u);
}

TEST(TurnResolver, Reveal_SpreadsHighlightsAcrossFloors)
{
    RoomCatalog const& catalog = RoomCatalog::Reference();
    for (std::uint64_t seed : {3ull, 17ull, 99ull})
    {
        Config cfg = MakeConfig();
        cfg.seed = seed;
        auto s = StartedTrio(cfg);

        ASSERT_NE(s->Submit(0, SelectRoomAction{1}), ActionOutcome::Invalid);
        ASSERT_NE(s->Submit(1, SelectRoomAction{5}), ActionOutcome::Invalid);
        ASSERT_EQ(UsePower(*s, 2, PowerKind::Reveal), ActionOutcome::PhaseAdvanced);

        // 10 unvisited rooms, 5 highlights, one floor at a time
        std::array<std::size_t, 3> per_floor{};
        std::size_t total = 0;
        for (std::size_t i{}; i < s->State().rooms.size(); ++i)
        {
            if (!s->State().rooms[i].highlighted) continue;
            auto const r = static_cast<RoomIdxT>(i);
            EXPECT_NE(r, RoomIdxT{1});
            EXPECT_NE(r, RoomIdxT{5});
            ++per_floor[catalog.FloorOf(r)];
            ++total;
        }
        EXPECT_EQ(total, 5u) << "seed " << seed;
        for (std::size_t const n : per_floor)
        {
            EXPECT_GE(n, 1u) << "seed " << seed;
            EXPECT_LE(n, 2u) << "seed " << seed;
        }
    }
}

TEST(TurnResolver, CompletingAnObjectiveForgetsVisitedRooms)
{
    auto s = StartedTrio();
    PlyrIdxT const owner = objectives::Active(s->State())->owner;
    PlyrIdxT const other = owner == 0 ? 1 : 0;
    Inspector::Mutable(*s).rooms_visited_since_objective = {6, 7};

    ASSERT_NE(s->Submit(other, SelectRoomAction{9}), ActionOutcome::Invalid);
    EXPECT_NE(std::ranges::find(s->State().rooms_visited_since_objective, RoomIdxT{9}),
              std::cend(s->State().rooms_visited_since_objective));

    EXPECT_EQ(PlayTurn(*s, {{owner, ObjectiveRoom}}, 2, 10), ActionOutcome::TurnResolved);
    ASSERT_EQ(s->State().objectives.completed.size(), 1u);
    EXPECT_TRUE(s->State().rooms_visited_since_objective.empty());
}

TEST(TurnResolver, NextObjectiveNeverReusesTheRoomJustCleared)
{
    for (std::uint64_t seed : {1ull, 2ull, 5ull, 8ull, 13ull})
    {
        Config cfg = MakeConfig();
        cfg.seed = seed;
        auto s = StartedTrio(cfg);
        PlyrIdxT const owner = objectives::Active(s->State())->owner;
        PlyrIdxT const other = owner == 0 ? 1 : 0;

        // both survivors search the objective room: the second one must not find the next objective there
        EXPECT_EQ(PlayTurn(*s, {{owner, ObjectiveRoom}, {other, ObjectiveRoom}}, 2, 10), ActionOutcome::TurnResolved);
        SessionState const& st = s->State();
        EXPECT_EQ(st.objectives.completed.size(), 1u) << "seed " << seed;
        ASSERT_TRUE(st.objectives.active_room.has_value());
        EXPECT_NE(*st.objectives.active_room, ObjectiveRoom) << "seed " << seed;
    }
}

TEST(TurnResolver, AllObjectivesDone_CrystalSpawns_ThenSurvivorsWin)
{
    auto s = StartedDuel();
    EXPECT_EQ(PlayTurn(*s, {{0, ObjectiveRoom}}, 1, 10), ActionOutcome::TurnResolved);

    SessionState const& st = s->State();
    EXPECT_TRUE(objectives::AllCompleted(st));
    ASSERT_TRUE(st.objectives.crystal_spawned);
    ASSERT_TRUE(st.objectives.crystal_room.has_value());
    RoomIdxT const crystal = *st.objectives.crystal_room;
    EXPECT_NE(crystal, 10);
    EXPECT_TRUE(st.rooms[crystal].has_crystal);
    EXPECT_FALSE(st.winner.has_value());
    EXPECT_EQ(st.phase, Phase::SurvivorSelection);

    EXPECT_EQ(PlayTurn(*s, {{0, crystal}}, 1, 10), ActionOutcome::GameEnded);
    EXPECT_EQ(s->State().winner, Winner::Survivors);
    EXPECT_FALSE(s->State().players[1].eliminated);
    debug::CheckInvariants(*s);
}

TEST(TurnResolver, Poison_CountsDownToElimination_RoomStaysOpen)
{
    Config cfg = MakeConfig();
    cfg.poison_player_turns = 2;
    auto s = StartedTrio(cfg);

    ASSERT_NE(s->Submit(0, SelectRoomAction{4}), ActionOutcome::Invalid);
    ASSERT_NE(s->Submit(1, SelectRoomAction{8}), ActionOutcome::Invalid);
    ASSERT_EQ(UsePower(*s, 2, PowerKind::Poison, PowerTarget{{4}, std::nullopt}), ActionOutcome::PhaseAdvanced);
    ASSERT_EQ(s->Submit(2, SelectRoomAction{10}), ActionOutcome::TurnResolved);

    EXPECT_EQ(s->State().players[0].poison_countdown, 1u);
    EXPECT_EQ(s->State().rooms[4].poison_turns_remaining, cfg.poison_room_turns - 1);
    EXPECT_FALSE(s->ViewFor(Role::Killer).players[0].poison_countdown.has_value());

    EXPECT_EQ(PlayTurn(*s, {{0, 6}, {1, 8}}, 2, 10), ActionOutcome::TurnResolved);
    SessionState const& st = s->State();
    EXPECT_TRUE(st.players[0].eliminated);
    EXPECT_FALSE(st.rooms[6].locked);
    EXPECT_EQ(st.rooms[6].eliminated_here, std::vector<PlyrIdxT>{0});
    EXPECT_TRUE(std::ranges::any_of(st.events, [](GameEvent const& e) { return e.kind == EventKind::PoisonDeath; }));
    debug::CheckInvariants(*s);
}

TEST(TurnResolver, SecondChance_BatchedRageSelection)
{
    auto s = StartQuiet(MakeLobby(Survivor("Ana", PlayerClass::Archer),
                                  {Survivor("Bo", PlayerClass::Bard), Killer("Kai"), Killer("Rex")}));

    ASSERT_NE(s->Submit(0, SelectRoomAction{1}), ActionOutcome::Invalid);
    ASSERT_NE(s->Submit(1, SelectRoomAction{2}), ActionOutcome::Invalid);
    ASSERT_EQ(UsePower(*s, 2, PowerKind::SecondChance), ActionOutcome::Applied);
    ASSERT_EQ(UsePower(*s, 3, PowerKind::Reveal), ActionOutcome::PhaseAdvanced);

    ASSERT_EQ(s->Submit(2, SelectRoomAction{1}), ActionOutcome::Applied);
    ASSERT_EQ(s->Submit(3, SelectRoomAction{9}), ActionOutcome::PhaseAdvanced);
    ASSERT_EQ(s->PhaseNow(), Phase::RageSecondSelection);
    EXPECT_TRUE(s->State().players[0].eliminated);
    EXPECT_EQ(s->State().resolution.second_chance_pending, std::vector<PlyrIdxT>{2});
    debug::CheckInvariants(*s);

    EXPECT_EQ(s->Submit(3, SelectRoomAction{2}), ActionOutcome::Invalid);
    EXPECT_EQ(LastViolation(*s)->code, error::RuleViolationCode::Room_SecondChanceNotGranted);

    // the room of the first catch is sealed
    EXPECT_EQ(s->Submit(2, SelectRoomAction{1}), ActionOutcome::Invalid);
    EXPECT_EQ(LastViolation(*s)->code, error::RuleViolationCode::Room_Locked);

    EXPECT_EQ(s->Submit(2, SelectRoomAction{2}), ActionOutcome::GameEnded);
    EXPECT_TRUE(s->State().players[1].eliminated);
    EXPECT_EQ(s->State().winner, Winner::Killers);
}

TEST(TurnResolver, SecondChance_SkippedWhenNobodyIsLeft)
{
    auto s = StartedDuel();
    ASSERT_NE(s->Submit(0, SelectRoomAction{3}), ActionOutcome::Invalid);
    ASSERT_EQ(UsePower(*s, 1, PowerKind::SecondChance), ActionOutcome::PhaseAdvanced);
    EXPECT_EQ(s->Submit(1, SelectRoomAction{3}), ActionOutcome::GameEnded);
    EXPECT_EQ(s->PhaseNow(), Phase::GameOver);
}

TEST(TurnResolver, Barricade_LocksRoomsForOneTurn)
{
    auto s = StartedTrio();
    ASSERT_NE(s->Submit(0, SelectRoomAction{6}), ActionOutcome::Invalid);
    ASSERT_NE(s->Submit(1, SelectRoomAction{8}), ActionOutcome::Invalid);

    Inspector::Mutable(*s).power_selections[2].options = {PowerKind::Barricade};
    ASSERT_EQ(s->Submit(2, SelectPowerAction{PowerKind::Barricade}), ActionOutcome::Applied);
    EXPECT_EQ(s->Submit(2, PowerTargetAction{PowerTarget{{6, 7, 9}, std::nullopt}}), ActionOutcome::Invalid);
    EXPECT_EQ(LastViolation(*s)->code, error::RuleViolationCode::Target_WrongCount);
    ASSERT_EQ(s->Submit(2, PowerTargetAction{PowerTarget{{6, 7}, std::nullopt}}), ActionOutcome::PhaseAdvanced);
    ASSERT_EQ(s->Submit(2, SelectRoomAction{10}), ActionOutcome::TurnResolved);

    // Ana had already committed to room 6 and still searched it
    EXPECT_EQ(s->State().players[0].current_room, RoomIdxT{6});
    EXPECT_TRUE(s->State().rooms[6].locked);
    EXPECT_TRUE(s->State().rooms[7].locked);

    EXPECT_EQ(s->Submit(1, SelectRoomAction{7}), ActionOutcome::Invalid);
    EXPECT_EQ(LastViolation(*s)->code, error::RuleViolationCode::Room_Locked);

    EXPECT_EQ(PlayTurn(*s, {{0, 4}, {1, 8}}, 2, 10), ActionOutcome::TurnResolved);
    EXPECT_FALSE(s->State().rooms[6].locked);
    EXPECT_FALSE(s->State().rooms[7].locked);
}

TEST(TurnResolver, Decoy_WipesGoldOfTheSurvivorWhoFindsIt)
{
    auto s = StartedTrio();
    Inspector::Mutable(*s).players[0].gold = 5;

    ASSERT_NE(s->Submit(0, SelectRoomAction{4}), ActionOutcome::Invalid);
    ASSERT_NE(s->Submit(1, SelectRoomAction{8}), ActionOutcome::Invalid);
    ASSERT_EQ(UsePower(*s, 2, PowerKind::Decoy, PowerTarget{{7}, std::nullopt}), ActionOutcome::PhaseAdvanced);
    ASSERT_EQ(s->Submit(2, SelectRoomAction{10}), ActionOutcome::TurnResolved);
    EXPECT_EQ(s->State().players[0].gold, 5u + s->Cfg().gold_per_search);

    EXPECT_TRUE(s->ViewFor(Role::Killer).rooms[7].has_mimic);
    EXPECT_FALSE(s->ViewFor(Role::Survivor).rooms[7].has_mimic);

    EXPECT_EQ(PlayTurn(*s, {{0, 7}, {1, 8}}, 2, 10), ActionOutcome::TurnResolved);
    EXPECT_EQ(s->State().players[0].gold, 0u);
    EXPECT_FALSE(s->State().rooms[7].has_mimic);
}

TEST(TurnResolver, RelocateOnMiss_MovesUnfoundObjective)
{
    auto s = StartedTrio();
    ASSERT_NE(s->Submit(0, SelectRoomAction{5}), ActionOutcome::Invalid);
    ASSERT_NE(s->Submit(1, SelectRoomAction{8}), ActionOutcome::Invalid);
    ASSERT_EQ(UsePower(*s, 2, PowerKind::RelocateOnMiss), ActionOutcome::PhaseAdvanced);
    ASSERT_EQ(s->Submit(2, SelectRoomAction{10}), ActionOutcome::TurnResolved);

    SessionState const& st = s->State();
    EXPECT_FALSE(st.rooms[ObjectiveRoom].has_quest);
    ASSERT_TRUE(st.objectives.active_room.has_value());
    EXPECT_NE(*st.objectives.active_room, ObjectiveRoom);
    EXPECT_NE(*st.objectives.active_room, 10);
    EXPECT_EQ(CountRooms(*s, &RoomState::has_quest), 1u);
    debug::CheckInvariants(*s);
}

TEST(TurnResolver, Locate_ReportsNoiseToKillersOnly)
{
    auto s = StartedTrio();
    ASSERT_NE(s->Submit(0, SelectRoomAction{4}), ActionOutcome::Invalid);
    ASSERT_NE(s->Submit(1, SelectRoomAction{5}), ActionOutcome::Invalid);
    ASSERT_EQ(UsePower(*s, 2, PowerKind::Locate, PowerTarget{{}, FloorIdxT{1}}), ActionOutcome::PhaseAdvanced);

    auto is_clue = [](EventView const& e) { return e.kind == EventKind::SoundClue; };
    SessionView const kv = s->ViewFor(Role::Killer);
    auto const clue = std::ranges::find_if(kv.events, is_clue);
    ASSERT_NE(clue, kv.events.end());
    EXPECT_NE(clue->message.find("noise"), std::string::npos);
    EXPECT_TRUE(std::ranges::none_of(s->ViewFor(Role::Survivor).events, is_clue));
}

TEST(TurnResolver, CarrierRevivesTeammateInTheSameRoom)
{
    auto s = StartedTrio();
    SessionState& st = Inspector::Mutable(*s);
    st.players[1].eliminated = true;
    st.players[1].current_room = 5;
    st.rooms[5].eliminated_here.push_back(1);
    st.players[0].current_room = 5;
    for (RoomState& r : st.rooms) r.has_revival_item = false;
    st.players[0].carries_revival_item = true;

    EXPECT_EQ(s->Submit(0, UseRevivalItemAction{2}), ActionOutcome::Invalid);
    EXPECT_EQ(LastViolation(*s)->code, error::RuleViolationCode::Revive_TargetNotEliminated);

    EXPECT_EQ(s->Submit(0, UseRevivalItemAction{1}), ActionOutcome::Applied);
    EXPECT_FALSE(s->State().players[1].eliminated);
    EXPECT_TRUE(s->State().rooms[5].eliminated_here.empty());
    EXPECT_FALSE(s->State().players[0].carries_revival_item);
    EXPECT_EQ(CountRooms(*s, &RoomState::has_revival_item), 1u);
    debug::CheckInvariants(*s);

    EXPECT_EQ(s->Submit(0, UseRevivalItemAction{1}), ActionOutcome::Invalid);
    EXPECT_EQ(LastViolation(*s)->code, error::RuleViolationCode::Revive_NotCarrying);
}

TEST(TurnResolver, SearchingWithTheItemRevivesAutomatically)
{
    auto s = StartedTrio();
    SessionState& st = Inspector::Mutable(*s);
    st.players[1].eliminated = true;
    st.players[1].current_room = 6;
    st.rooms[6].eliminated_here.push_back(1);

    // Ana picks the item up in turn 1 and walks into Bo's room in turn 2
    EXPECT_EQ(s->Submit(0, SelectRoomAction{ItemRoom}), ActionOutcome::PhaseAdvanced);
    ASSERT_EQ(UsePower(*s, 2, PowerKind::Reveal), ActionOutcome::PhaseAdvanced);
    ASSERT_EQ(s->Submit(2, SelectRoomAction{10}), ActionOutcome::TurnResolved);
    EXPECT_TRUE(s->State().players[0].carries_revival_item);

    EXPECT_EQ(PlayTurn(*s, {{0, 6}}, 2, 10), ActionOutcome::TurnResolved);
    EXPECT_FALSE(s->State().players[1].eliminated);
    EXPECT_EQ(s->State().players[1].current_room, RoomIdxT{6});
    EXPECT_FALSE(s->State().players[0].carries_revival_item);
    debug::CheckInvariants(*s);
}

TEST(TurnResolver, RejectedActionsLeaveStateUntouched)
{
    auto s = StartedTrio();
    SessionView const before = s->FullView();

    EXPECT_EQ(s->Submit(2, SelectRoomAction{4}), ActionOutcome::Invalid);
    EXPECT_EQ(s->Submit(0, SelectPowerAction{PowerKind::Poison}), ActionOutcome::Invalid);
    EXPECT_EQ(s->Submit(0, SelectRoomAction{200}), ActionOutcome::Invalid);
    EXPECT_EQ(s->Submit(9, SelectRoomAction{4}), ActionOutcome::Invalid);
    EXPECT_EQ(s->FullView(), before);

    std::vector<Broadcast> const out = s->DrainOutbox();
    ASSERT_EQ(out.size(), 4u);
    for (Broadcast const& b : out)
    {
        EXPECT_TRUE(std::holds_alternative<AudiencePlayer>(b.audience));
        EXPECT_TRUE(std::holds_alternative<Violation>(b.message));
    }

    ASSERT_NE(s->Submit(0, SelectRoomAction{4}), ActionOutcome::Invalid);
    EXPECT_EQ(s->Submit(0, SelectRoomAction{5}), ActionOutcome::Invalid);
    EXPECT_EQ(LastViolation(*s)->code, error::RuleViolationCode::AlreadyActed);
    EXPECT_EQ(s->State().pending_actions.at(0).room, 4);
}
