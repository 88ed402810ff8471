#include "../include/game/game_controller.hpp"
#include "../include/room/room_code.hpp"
#include "test_support.hpp"
#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace room;
using namespace std::chrono_literals;
using testing_support::countOf;
using testing_support::FakeTransport;
using testing_support::lastOf;
using testing_support::ManualScheduler;
using testing_support::ScriptedRandom;

class GameControllerTest : public ::testing::Test {
protected:
  void SetUp() override {
    transport.connect(kAlice);
    transport.connect(kBob);
    transport.connect(kCarol);
  }

  std::string createAndJoin() {
    std::string code = controller.createRoom(kAlice, "Alice");
    EXPECT_EQ(controller.joinRoom(kBob, code, "Bob"), Verdict::APPLIED);
    return code;
  }

  // Alice creates, Bob joins, game starts with `first` holding the turn.
  std::string startedRoom(network::ConnectionId first) {
    std::string code = createAndJoin();
    rules_random.push(first == kAlice ? 0 : 1);
    EXPECT_EQ(controller.startGame(kAlice, code), Verdict::APPLIED);
    transport.clearInboxes();
    return code;
  }

  void drop(network::ConnectionId id) {
    transport.disconnect(id);
    controller.onDisconnect(id);
  }

  static constexpr network::ConnectionId kAlice = 1;
  static constexpr network::ConnectionId kBob = 2;
  static constexpr network::ConnectionId kCarol = 3;

  PlayerId alice = PlayerId::fromConnection(kAlice);
  PlayerId bob = PlayerId::fromConnection(kBob);

  MersenneRandom code_random{2024};
  ScriptedRandom rules_random;
  RoomRegistry rooms{code_random};
  session::SessionIndex sessions;
  FakeTransport transport;
  ManualScheduler scheduler;
  session::DisconnectReaper reaper{rooms, transport, transport, scheduler};
  game::GameController controller{rooms,     sessions,  rules_random,
                                  transport, scheduler, reaper};
};

TEST_F(GameControllerTest, CreateRoomRepliesWithCode) {
  std::string code = controller.createRoom(kAlice, "Alice");

  EXPECT_TRUE(RoomCodeGenerator::isValidCode(code));
  auto inbox = transport.inbox(kAlice);
  ASSERT_EQ(inbox.size(), 1u);
  const auto *created = std::get_if<RoomCreated>(&inbox[0]);
  ASSERT_NE(created, nullptr);
  EXPECT_EQ(created->room_code, code);

  auto state = rooms.getRoom(code);
  ASSERT_TRUE(state.has_value());
  ASSERT_EQ(state->players.size(), 1u);
  EXPECT_EQ(state->players[0].name, "Alice");
  EXPECT_TRUE(state->players[0].is_host);

  EXPECT_EQ(*sessions.lookupSession(kAlice), code);
  EXPECT_EQ(transport.group(code).count(kAlice), 1u);
}

TEST_F(GameControllerTest, JoinUnknownRoomReportsNotFound) {
  EXPECT_EQ(controller.joinRoom(kBob, "ZZZZZZ", "Bob"), Verdict::REJECTED);

  auto inbox = transport.inbox(kBob);
  ASSERT_EQ(inbox.size(), 1u);
  const auto *error = std::get_if<ErrorNotice>(&inbox[0]);
  ASSERT_NE(error, nullptr);
  EXPECT_EQ(error->code, ErrorCode::ROOM_NOT_FOUND);
  EXPECT_FALSE(sessions.lookupSession(kBob).has_value());
}

TEST_F(GameControllerTest, JoinNotifiesJoinerAndHostSeparately) {
  std::string code = controller.createRoom(kAlice, "Alice");
  transport.clearInboxes();

  EXPECT_EQ(controller.joinRoom(kBob, code, "Bob"), Verdict::APPLIED);

  auto bobInbox = transport.inbox(kBob);
  ASSERT_EQ(bobInbox.size(), 1u);
  const auto *joined = std::get_if<JoinedRoom>(&bobInbox[0]);
  ASSERT_NE(joined, nullptr);
  EXPECT_EQ(joined->room_code, code);
  ASSERT_EQ(joined->players.size(), 2u);
  EXPECT_EQ(joined->players[0].name, "Alice");
  EXPECT_EQ(joined->players[1].name, "Bob");

  auto aliceInbox = transport.inbox(kAlice);
  ASSERT_EQ(aliceInbox.size(), 1u);
  const auto *announced = std::get_if<PlayerJoined>(&aliceInbox[0]);
  ASSERT_NE(announced, nullptr);
  EXPECT_EQ(announced->player_name, "Bob");
  EXPECT_EQ(announced->players.size(), 2u);

  EXPECT_EQ(*sessions.lookupSession(kBob), code);
  EXPECT_EQ(transport.group(code).size(), 2u);
}

TEST_F(GameControllerTest, JoinFullRoomFailsWithoutMutation) {
  std::string code = createAndJoin();
  transport.clearInboxes();

  EXPECT_EQ(controller.joinRoom(kCarol, code, "Carol"), Verdict::REJECTED);

  auto inbox = transport.inbox(kCarol);
  ASSERT_EQ(inbox.size(), 1u);
  EXPECT_EQ(std::get<ErrorNotice>(inbox[0]).code, ErrorCode::ROOM_FULL);
  EXPECT_TRUE(transport.inbox(kAlice).empty());
  EXPECT_TRUE(transport.inbox(kBob).empty());
  EXPECT_EQ(rooms.getRoom(code)->players.size(), 2u);
  EXPECT_FALSE(sessions.lookupSession(kCarol).has_value());
  EXPECT_EQ(transport.group(code).count(kCarol), 0u);
}

TEST_F(GameControllerTest, StartGameBroadcastsToWholeRoom) {
  std::string code = createAndJoin();
  transport.clearInboxes();
  rules_random.push(1);

  EXPECT_EQ(controller.startGame(kAlice, code), Verdict::APPLIED);

  for (auto id : {kAlice, kBob}) {
    auto inbox = transport.inbox(id);
    ASSERT_EQ(inbox.size(), 1u);
    const auto *started = std::get_if<GameStarted>(&inbox[0]);
    ASSERT_NE(started, nullptr);
    EXPECT_EQ(started->current_turn, bob);
    ASSERT_EQ(started->scores.size(), 2u);
    EXPECT_EQ(started->scores.at(alice), 0u);
    EXPECT_EQ(started->scores.at(bob), 0u);
  }
}

TEST_F(GameControllerTest, GuestCannotStartGame) {
  std::string code = createAndJoin();
  transport.clearInboxes();

  EXPECT_EQ(controller.startGame(kBob, code), Verdict::IGNORED);
  EXPECT_EQ(controller.startGame(kCarol, code), Verdict::IGNORED);
  EXPECT_EQ(transport.totalDelivered(), 0u);
  EXPECT_FALSE(rooms.getRoom(code)->game_started);
}

TEST_F(GameControllerTest, StartedRoomRejectsLateJoin) {
  std::string code = startedRoom(kAlice);
  // Free a seat by hand to reach the started check.
  rooms.withRoom(code, [](RoomState &state) { state.players.pop_back(); });

  EXPECT_EQ(controller.joinRoom(kCarol, code, "Carol"), Verdict::REJECTED);
  auto inbox = transport.inbox(kCarol);
  ASSERT_EQ(inbox.size(), 1u);
  EXPECT_EQ(std::get<ErrorNotice>(inbox[0]).code, ErrorCode::GAME_STARTED);
}

TEST_F(GameControllerTest, OutOfTurnSpinHasNoEffect) {
  std::string code = startedRoom(kAlice);
  auto before = rooms.getRoom(code);

  EXPECT_EQ(controller.spinBottle(kBob, code), Verdict::IGNORED);
  EXPECT_EQ(controller.completeChallenge(kBob, code), Verdict::IGNORED);
  EXPECT_EQ(controller.skipChallenge(kBob, code), Verdict::IGNORED);
  EXPECT_EQ(controller.selectChallenge(kBob, code, "truth", "?"),
            Verdict::IGNORED);

  EXPECT_EQ(transport.totalDelivered(), 0u);
  EXPECT_EQ(scheduler.pending(), 0u);
  auto after = rooms.getRoom(code);
  EXPECT_EQ(*after->current_turn, *before->current_turn);
  EXPECT_EQ(after->scores, before->scores);
  EXPECT_FALSE(after->current_challenge.has_value());
}

TEST_F(GameControllerTest, TurnOperationsOnUnknownRoomAreSilent) {
  EXPECT_EQ(controller.startGame(kAlice, "ZZZZZZ"), Verdict::IGNORED);
  EXPECT_EQ(controller.spinBottle(kAlice, "ZZZZZZ"), Verdict::IGNORED);
  EXPECT_EQ(controller.selectChallenge(kAlice, "ZZZZZZ", "dare", "x"),
            Verdict::IGNORED);
  EXPECT_EQ(controller.completeChallenge(kAlice, "ZZZZZZ"), Verdict::IGNORED);
  EXPECT_EQ(controller.skipChallenge(kAlice, "ZZZZZZ"), Verdict::IGNORED);
  EXPECT_EQ(transport.totalDelivered(), 0u);
}

TEST_F(GameControllerTest, SpinBroadcastsRotationAndWinner) {
  std::string code = startedRoom(kAlice);
  rules_random.push(10);
  rules_random.push(1);

  EXPECT_EQ(controller.spinBottle(kAlice, code), Verdict::APPLIED);

  for (auto id : {kAlice, kBob}) {
    auto inbox = transport.inbox(id);
    ASSERT_EQ(inbox.size(), 1u);
    const auto *spun = std::get_if<BottleSpun>(&inbox[0]);
    ASSERT_NE(spun, nullptr);
    EXPECT_EQ(spun->rotation, 1450u);
    EXPECT_EQ(spun->winner, bob);
  }
  EXPECT_EQ(*rooms.getRoom(code)->current_turn, bob);
}

TEST_F(GameControllerTest, CompleteChallengeScoresAndDelaysTurnNotice) {
  std::string code = startedRoom(kAlice);
  controller.selectChallenge(kAlice, code, "truth", "Biggest fear?");
  auto selected = transport.inbox(kBob);
  ASSERT_NE(lastOf<ChallengeSelected>(selected), nullptr);
  transport.clearInboxes();

  EXPECT_EQ(controller.completeChallenge(kAlice, code), Verdict::APPLIED);

  // Immediate: completion with scores, turn already moved in state.
  for (auto id : {kAlice, kBob}) {
    auto inbox = transport.inbox(id);
    ASSERT_EQ(inbox.size(), 1u);
    const auto *completed = std::get_if<ChallengeCompleted>(&inbox[0]);
    ASSERT_NE(completed, nullptr);
    EXPECT_EQ(completed->player_id, alice);
    EXPECT_EQ(completed->player_name, "Alice");
    EXPECT_EQ(completed->scores.at(alice), 1u);
    EXPECT_EQ(completed->scores.at(bob), 0u);
  }
  auto state = rooms.getRoom(code);
  EXPECT_EQ(*state->current_turn, bob);
  EXPECT_FALSE(state->current_challenge.has_value());

  scheduler.advance(1999ms);
  auto early = transport.inbox(kBob);
  EXPECT_EQ(countOf<TurnChanged>(early), 0u);

  scheduler.advance(1ms);
  for (auto id : {kAlice, kBob}) {
    auto inbox = transport.inbox(id);
    ASSERT_EQ(countOf<TurnChanged>(inbox), 1u);
    EXPECT_EQ(lastOf<TurnChanged>(inbox)->current_turn, bob);
  }
}

TEST_F(GameControllerTest, SkipChallengeKeepsScoresAndDelaysTurnNotice) {
  std::string code = startedRoom(kBob);

  EXPECT_EQ(controller.skipChallenge(kBob, code), Verdict::APPLIED);

  auto inbox = transport.inbox(kAlice);
  ASSERT_EQ(inbox.size(), 1u);
  const auto *skipped = std::get_if<ChallengeSkipped>(&inbox[0]);
  ASSERT_NE(skipped, nullptr);
  EXPECT_EQ(skipped->player_id, bob);
  EXPECT_EQ(skipped->player_name, "Bob");

  auto state = rooms.getRoom(code);
  EXPECT_EQ(*state->current_turn, alice);
  EXPECT_EQ(state->scores.at(alice), 0u);
  EXPECT_EQ(state->scores.at(bob), 0u);

  scheduler.advance(2000ms);
  auto later = transport.inbox(kBob);
  ASSERT_EQ(countOf<TurnChanged>(later), 1u);
  EXPECT_EQ(lastOf<TurnChanged>(later)->current_turn, alice);
}

TEST_F(GameControllerTest, TurnNoticeSkippedWhenRoomIsGone) {
  std::string code = startedRoom(kAlice);
  controller.completeChallenge(kAlice, code);
  transport.clearInboxes();
  ASSERT_TRUE(rooms.deleteRoom(code));

  scheduler.advance(2000ms);
  EXPECT_EQ(transport.totalDelivered(), 0u);
  EXPECT_EQ(scheduler.pending(), 0u);
}

TEST_F(GameControllerTest, DisconnectNotifiesRemainingPlayer) {
  std::string code = startedRoom(kAlice);

  drop(kBob);

  auto inbox = transport.inbox(kAlice);
  ASSERT_EQ(inbox.size(), 1u);
  const auto *gone = std::get_if<PlayerDisconnected>(&inbox[0]);
  ASSERT_NE(gone, nullptr);
  EXPECT_EQ(gone->player_name, "Bob");
  EXPECT_TRUE(transport.inbox(kBob).empty());
  EXPECT_FALSE(sessions.lookupSession(kBob).has_value());

  // Alice is still here: the room survives the grace period.
  scheduler.advance(30000ms);
  EXPECT_TRUE(rooms.contains(code));
}

TEST_F(GameControllerTest, AbandonedRoomIsReapedAfterGracePeriod) {
  std::string code = startedRoom(kAlice);

  drop(kAlice);
  drop(kBob);

  scheduler.advance(29999ms);
  EXPECT_TRUE(rooms.contains(code));

  scheduler.advance(1ms);
  EXPECT_FALSE(rooms.contains(code));
  EXPECT_FALSE(rooms.getRoom(code).has_value());
}

TEST_F(GameControllerTest, RoomRegainingConnectionIsKept) {
  std::string code = createAndJoin();

  drop(kAlice);
  drop(kBob);
  scheduler.advance(10000ms);
  transport.connect(kBob); // liveness restored inside the window

  scheduler.advance(30000ms);
  EXPECT_TRUE(rooms.contains(code));
}

TEST_F(GameControllerTest, UnstartedRoomIsKeptWhileHostConnected) {
  std::string code = controller.createRoom(kAlice, "Alice");
  controller.joinRoom(kBob, code, "Bob");

  drop(kBob);
  scheduler.advance(60000ms);

  EXPECT_TRUE(rooms.contains(code));
  EXPECT_FALSE(rooms.getRoom(code)->game_started);
}

TEST_F(GameControllerTest, EveryRoomAConnectionEnteredIsReaped) {
  std::string first = controller.createRoom(kAlice, "Alice");
  std::string second = controller.createRoom(kAlice, "Alice");
  ASSERT_NE(first, second);
  EXPECT_EQ(*sessions.lookupSession(kAlice), second);

  drop(kAlice);
  EXPECT_EQ(scheduler.pending(), 2u);

  scheduler.advance(30000ms);
  EXPECT_FALSE(rooms.contains(first));
  EXPECT_FALSE(rooms.contains(second));
  EXPECT_EQ(rooms.size(), 0u);
}

TEST_F(GameControllerTest, EarlierRoomKeptWhileItsOtherPlayerStays) {
  std::string shared = createAndJoin();
  std::string solo = controller.createRoom(kAlice, "Alice");
  transport.clearInboxes();

  drop(kAlice);

  // Bob still sits in the first room and hears that Alice left it.
  auto inbox = transport.inbox(kBob);
  const auto *gone = lastOf<PlayerDisconnected>(inbox);
  ASSERT_NE(gone, nullptr);
  EXPECT_EQ(gone->player_name, "Alice");

  scheduler.advance(30000ms);
  EXPECT_TRUE(rooms.contains(shared));
  EXPECT_FALSE(rooms.contains(solo));
}

TEST_F(GameControllerTest, UnboundDisconnectDoesNothing) {
  drop(kCarol);
  EXPECT_EQ(transport.totalDelivered(), 0u);
  EXPECT_EQ(scheduler.pending(), 0u);
}

TEST_F(GameControllerTest, ReaperTokenCanCancelCheck) {
  std::string code = controller.createRoom(kAlice, "Alice");
  transport.disconnect(kAlice);
  sessions.unbindSession(kAlice);

  auto token = reaper.onDisconnect(kAlice, code);
  token.cancel();
  scheduler.advance(30000ms);

  EXPECT_TRUE(rooms.contains(code));
  EXPECT_TRUE(reaper.reapIfAbandoned(code));
  EXPECT_FALSE(rooms.contains(code));
}

TEST_F(GameControllerTest, DispatchesDecodedMessages) {
  network::ClientMessage create{network::ClientMessageType::CREATE_ROOM,
                                "", "Alice", "", ""};
  controller.onMessage(kAlice, create);
  auto inbox = transport.inbox(kAlice);
  const auto *created = lastOf<RoomCreated>(inbox);
  ASSERT_NE(created, nullptr);

  network::ClientMessage join{network::ClientMessageType::JOIN_ROOM,
                              created->room_code, "Bob", "", ""};
  controller.onMessage(kBob, join);
  rules_random.push(0);
  controller.onMessage(kAlice, {network::ClientMessageType::START_GAME,
                                created->room_code, "", "", ""});
  controller.onMessage(kAlice, {network::ClientMessageType::SELECT_CHALLENGE,
                                created->room_code, "", "dare", "Jump"});

  auto state = rooms.getRoom(created->room_code);
  ASSERT_TRUE(state.has_value());
  EXPECT_TRUE(state->game_started);
  ASSERT_TRUE(state->current_challenge.has_value());
  EXPECT_EQ(state->current_challenge->text, "Jump");
  EXPECT_EQ(state->current_challenge->owner_id, alice);
}

TEST_F(GameControllerTest, RacingCompletesScoreExactlyOnce) {
  std::string code = startedRoom(kAlice);

  std::vector<std::thread> threads;
  std::atomic<int> applied{0};
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&]() {
      if (controller.completeChallenge(kAlice, code) == Verdict::APPLIED) {
        ++applied;
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  EXPECT_EQ(applied.load(), 1);
  auto state = rooms.getRoom(code);
  EXPECT_EQ(state->scores.at(alice), 1u);
  EXPECT_EQ(*state->current_turn, bob);
}
