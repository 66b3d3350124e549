#include <gtest/gtest.h>
#include <algorithm>

#include "Fixtures.hpp"
#include "../debug/Invariants.hpp"

using namespace manor::core;
using namespace manor::test;
using error::LobbyErrorCode;

TEST(SessionLobby, HostIsPlayerZero)
{
    auto s = MakeLobby(Survivor("Ana", PlayerClass::Archer), {});
    EXPECT_EQ(s->PlayerCount(), 1u);
    EXPECT_TRUE(s->State().players[0].is_host);
    EXPECT_EQ(s->State().host, 0);
    EXPECT_EQ(s->PhaseNow(), Phase::Waiting);
    EXPECT_FALSE(s->State().started);
}

TEST(SessionLobby, HostNeedsAName)
{
    EXPECT_THROW(Session("NONAME", MakeConfig(), Survivor("", PlayerClass::Archer)), error::StateError);
}

TEST(SessionLobby, JoinRejectsEmptyNameAndFullSession)
{
    Config cfg = MakeConfig();
    cfg.max_players = 3;
    auto s = MakeLobby(Survivor("Ana", PlayerClass::Archer), {Killer("Kai")}, cfg);

    auto const empty = s->Join(Survivor("", PlayerClass::Bard));
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code, LobbyErrorCode::EmptyName);

    auto const third = s->Join(Survivor("Bo", PlayerClass::Bard));
    ASSERT_TRUE(third.has_value());
    EXPECT_EQ(*third, 2);

    auto const fourth = s->Join(Survivor("Cy", PlayerClass::Elf));
    ASSERT_FALSE(fourth.has_value());
    EXPECT_EQ(fourth.error().code, LobbyErrorCode::SessionFull);
    EXPECT_EQ(s->PlayerCount(), 3u);
}

TEST(SessionLobby, JoinAfterStartIsRejected)
{
    auto s = StartedDuel();
    auto const late = s->Join(Survivor("Bo", PlayerClass::Bard));
    ASSERT_FALSE(late.has_value());
    EXPECT_EQ(late.error().code, LobbyErrorCode::AlreadyStarted);
}

TEST(SessionLobby, StartChecksComposition)
{
    auto lonely = MakeLobby(Survivor("Ana", PlayerClass::Archer), {Survivor("Bo", PlayerClass::Bard)});
    EXPECT_EQ(lonely->Start().error().code, LobbyErrorCode::NoKiller);
    EXPECT_EQ(lonely->PhaseNow(), Phase::Waiting);

    auto hunters = MakeLobby(Killer("Kai"), {Killer("Rex")});
    EXPECT_EQ(hunters->Start().error().code, LobbyErrorCode::NoSurvivor);

    auto twins = MakeLobby(Survivor("Ana", PlayerClass::Elf), {Survivor("Bo", PlayerClass::Elf), Killer("Kai")});
    EXPECT_EQ(twins->Start().error().code, LobbyErrorCode::DuplicateSurvivorClass);
    EXPECT_FALSE(twins->State().started);

    auto ok = MakeLobby(Survivor("Ana", PlayerClass::Elf), {Survivor("Bo", PlayerClass::Mage), Killer("Kai")});
    ASSERT_TRUE(ok->Start().has_value());
    EXPECT_EQ(ok->Start().error().code, LobbyErrorCode::AlreadyStarted);
}

TEST(SessionLobby, ChangeRoleBeforeStartOnly)
{
    auto s = MakeLobby(Survivor("Ana", PlayerClass::Archer), {Survivor("Bo", PlayerClass::Bard)});
    ASSERT_TRUE(s->ChangeRole(1, Role::Killer, PlayerClass::OrcShaman).has_value());
    EXPECT_EQ(s->RoleOf(1), Role::Killer);
    EXPECT_EQ(s->State().players[1].player_class, PlayerClass::OrcShaman);

    EXPECT_EQ(s->ChangeRole(7, Role::Killer).error().code, LobbyErrorCode::UnknownPlayer);

    ASSERT_TRUE(s->Start().has_value());
    EXPECT_EQ(s->ChangeRole(0, Role::Killer).error().code, LobbyErrorCode::AlreadyStarted);
}

TEST(SessionLobby, ResetKeepsRosterAndClearsTheGame)
{
    auto s = StartedTrio();
    ASSERT_NE(s->Submit(0, SelectRoomAction{4}), ActionOutcome::Invalid);
    Inspector::Mutable(*s).players[1].gold = 4;

    s->Reset();
    SessionState const& st = s->State();
    EXPECT_EQ(st.phase, Phase::Waiting);
    EXPECT_EQ(st.turn, 0u);
    EXPECT_FALSE(st.started);
    EXPECT_EQ(st.players.size(), 3u);
    EXPECT_EQ(st.players[1].gold, 0u);
    EXPECT_TRUE(st.pending_actions.empty());
    EXPECT_TRUE(st.objectives.queue.empty());
    EXPECT_EQ(CountRooms(*s, &RoomState::has_quest), 0u);
    EXPECT_EQ(CountRooms(*s, &RoomState::has_revival_item), 0u);
    debug::CheckInvariants(*s);

    std::vector<Broadcast> const out = s->DrainOutbox();
    EXPECT_TRUE(std::ranges::any_of(out, [](Broadcast const& b)
    {
        auto const* n = std::get_if<Notice>(&b.message);
        return n && n->kind == NoticeKind::GameReset;
    }));

    // the same roster can play again
    ASSERT_TRUE(s->Start().has_value());
    EXPECT_EQ(s->Turn(), 1u);
}

TEST(SessionLobby, ConspiracySplitTable)
{
    EXPECT_EQ(ConspiracySplit(2), std::make_pair(std::size_t{1}, std::size_t{1}));
    EXPECT_EQ(ConspiracySplit(3), std::make_pair(std::size_t{2}, std::size_t{1}));
    EXPECT_EQ(ConspiracySplit(4), std::make_pair(std::size_t{2}, std::size_t{2}));
    EXPECT_EQ(ConspiracySplit(5), std::make_pair(std::size_t{3}, std::size_t{2}));
    EXPECT_EQ(ConspiracySplit(6), std::make_pair(std::size_t{4}, std::size_t{2}));
    EXPECT_EQ(ConspiracySplit(7), std::make_pair(std::size_t{4}, std::size_t{3}));
    EXPECT_EQ(ConspiracySplit(8), std::make_pair(std::size_t{5}, std::size_t{3}));
}

TEST(SessionLobby, ConspiracyModeReassignsRoles)
{
    Config cfg = MakeConfig();
    cfg.conspiracy_mode = true;

    // everybody asked to be a survivor; the split decides
    auto s = MakeLobby(Survivor("Ana", PlayerClass::Archer),
                       {Survivor("Bo", PlayerClass::Bard), Survivor("Cy", PlayerClass::Elf),
                        Survivor("Di", PlayerClass::Mage), Survivor("Ed", PlayerClass::Warrior)}, cfg);
    ASSERT_TRUE(s->Start().has_value());

    auto const& players = s->State().players;
    auto const killers = std::ranges::count_if(players, [](PlayerState const& p) { return p.role == Role::Killer; });
    EXPECT_EQ(killers, 2);
    EXPECT_EQ(s->State().objectives.queue.size(), 3u);
    debug::CheckInvariants(*s);
}

TEST(SessionLobby, EveryMutationQueuesAStateUpdate)
{
    auto s = MakeLobby(Survivor("Ana", PlayerClass::Archer), {});
    ASSERT_TRUE(s->Join(Killer("Kai")).has_value());

    std::vector<Broadcast> const out = s->DrainOutbox();
    ASSERT_FALSE(out.empty());
    EXPECT_TRUE(std::holds_alternative<StateUpdate>(out.back().message));
    EXPECT_TRUE(std::holds_alternative<AudienceAll>(out.back().audience));
    EXPECT_TRUE(s->DrainOutbox().empty());

    s->OnConnect(1);
    std::vector<Broadcast> const hello = s->DrainOutbox();
    ASSERT_EQ(hello.size(), 1u);
    auto const* to = std::get_if<AudiencePlayer>(&hello.front().audience);
    ASSERT_NE(to, nullptr);
    EXPECT_EQ(to->player, 1);
}
