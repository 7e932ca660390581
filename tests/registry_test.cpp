#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include "registry.hpp"

using namespace MS;
using namespace std::chrono_literals;

namespace {

Client make(const std::string& name, const std::string& addr = "10.0.0.1") {
  return newClient(name, addr, 1, 64);
}

} // anon

TEST(Registry, CreateSeatsHostAndLinksIt) {
  Registry reg(10ms);
  ASSERT_EQ(reg.registerClient(make("alice")), Registry::RegisterResult::Registered);

  Game created;
  ASSERT_EQ(reg.createGame("alice", GameInit{"g1", "arena", 2, ""}, &created),
            Registry::CreateResult::Created);
  EXPECT_EQ(created.host, "alice");

  auto games = reg.listGames();
  ASSERT_EQ(games.size(), 1u);
  EXPECT_EQ(games[0].name, "g1");
  EXPECT_TRUE(games[0].hasParticipant("alice"));
  EXPECT_EQ(reg.findClient("alice")->in_game, std::optional<std::string>("g1"));
}

TEST(Registry, CreateRejectsTakenNameWithoutMutation) {
  Registry reg(10ms);
  reg.registerClient(make("alice"));
  reg.registerClient(make("bob"));
  ASSERT_EQ(reg.createGame("alice", GameInit{"g1", "arena", 2, ""}), Registry::CreateResult::Created);
  EXPECT_EQ(reg.createGame("bob", GameInit{"g1", "other", 8, ""}), Registry::CreateResult::NameTaken);
  EXPECT_EQ(reg.findGame("g1")->host, "alice");
  EXPECT_FALSE(reg.findClient("bob")->in_game.has_value());
}

TEST(Registry, CreateRejectsHostAlreadyInGame) {
  Registry reg(10ms);
  reg.registerClient(make("alice"));
  ASSERT_EQ(reg.createGame("alice", GameInit{"g1", "arena", 2, ""}), Registry::CreateResult::Created);
  EXPECT_EQ(reg.createGame("alice", GameInit{"g2", "arena", 2, ""}), Registry::CreateResult::AlreadyInGame);
  EXPECT_EQ(reg.gameCount(), 1u);
}

TEST(Registry, ConcurrentCreateSameNameHasOneWinner) {
  constexpr int kThreads = 16;
  Registry reg(10ms);
  for (int i = 0; i < kThreads; ++i) reg.registerClient(make("p" + std::to_string(i)));

  std::atomic<int> created{0}, taken{0};
  std::vector<std::thread> ts;
  for (int i = 0; i < kThreads; ++i) {
    ts.emplace_back([&, i]{
      auto r = reg.createGame("p" + std::to_string(i), GameInit{"same", "arena", 4, ""});
      if (r == Registry::CreateResult::Created) ++created;
      else if (r == Registry::CreateResult::NameTaken) ++taken;
    });
  }
  for (auto& t : ts) t.join();

  EXPECT_EQ(created.load(), 1);
  EXPECT_EQ(taken.load(), kThreads - 1);
  EXPECT_EQ(reg.gameCount(), 1u);

  // exactly one client is linked, and it is the host
  const std::string host = reg.findGame("same")->host;
  int linked = 0;
  for (int i = 0; i < kThreads; ++i) {
    auto c = reg.findClient("p" + std::to_string(i));
    if (c->in_game) { ++linked; EXPECT_EQ(c->name, host); }
  }
  EXPECT_EQ(linked, 1);
}

TEST(Registry, RemoveGame) {
  Registry reg(10ms);
  reg.registerClient(make("alice"));
  reg.createGame("alice", GameInit{"g1", "arena", 2, ""});
  reg.removeGame("g1");
  reg.removeGame("g1");
  EXPECT_TRUE(reg.listGames().empty());
}

TEST(Registry, DuplicateRegistrationWaitsForRemoval) {
  Registry reg(5ms);
  ASSERT_EQ(reg.registerClient(make("alice", "10.0.0.1")), Registry::RegisterResult::Registered);

  std::atomic<bool> done{false};
  Registry::RegisterResult result{};
  std::thread second([&]{
    result = reg.registerClient(make("alice", "10.0.0.2"));
    done = true;
  });

  std::this_thread::sleep_for(50ms);
  EXPECT_FALSE(done.load());
  EXPECT_EQ(reg.findClient("alice")->address, "10.0.0.1");

  EXPECT_TRUE(reg.removeClient("alice"));
  second.join();
  EXPECT_EQ(result, Registry::RegisterResult::Registered);
  EXPECT_EQ(reg.findClient("alice")->address, "10.0.0.2");
  EXPECT_EQ(reg.clientCount(), 1u);
}

TEST(Registry, CancelledWaiterDoesNotRegister) {
  Registry reg(1000ms);
  reg.registerClient(make("alice", "10.0.0.1"));

  std::atomic<bool> cancelled{false};
  Registry::RegisterResult result = Registry::RegisterResult::Registered;
  std::thread waiter([&]{
    result = reg.registerClient(make("alice", "10.0.0.9"), [&]{ return cancelled.load(); });
  });

  std::this_thread::sleep_for(20ms);
  cancelled = true;
  reg.wakeWaiters();
  waiter.join();

  EXPECT_EQ(result, Registry::RegisterResult::Cancelled);
  EXPECT_EQ(reg.findClient("alice")->address, "10.0.0.1");

  // a later removal must not resurrect the abandoned registration
  reg.removeClient("alice");
  EXPECT_EQ(reg.clientCount(), 0u);
}

TEST(Registry, RegisterDropsStaleGameLink) {
  Registry reg(10ms);
  Client c = make("alice");
  c.in_game = "ghost";
  reg.registerClient(c);
  EXPECT_FALSE(reg.findClient("alice")->in_game.has_value());
}

TEST(Registry, RemoveUnknownClient) {
  Registry reg(10ms);
  EXPECT_FALSE(reg.removeClient("nobody"));
}

TEST(Registry, ParticipantAddressesFiltersAndProjects) {
  Registry reg(10ms);
  reg.registerClient(make("alice", "10.0.0.1"));
  reg.registerClient(make("bob", "10.0.0.2"));
  reg.registerClient(make("carol", "10.0.0.3"));

  auto addrs = reg.participantAddresses({"alice", "carol", "nobody"});
  ASSERT_EQ(addrs.size(), 2u);
  EXPECT_EQ(addrs.at("alice"), "10.0.0.1");
  EXPECT_EQ(addrs.at("carol"), "10.0.0.3");
}

TEST(Registry, TransactCommitsBothTables) {
  Registry reg(10ms);
  reg.registerClient(make("alice"));
  reg.registerClient(make("bob"));
  reg.createGame("alice", GameInit{"g1", "arena", 4, ""});

  reg.transact([](Registry::Tables& t) {
    t.games.at("g1") = addParticipant("bob", false, t.games.at("g1"));
    t.clients.at("bob").in_game = "g1";
  });

  EXPECT_TRUE(reg.findGame("g1")->hasParticipant("bob"));
  EXPECT_EQ(reg.findClient("bob")->in_game, std::optional<std::string>("g1"));
}

TEST(Registry, RemoveGameUnlinksParticipants) {
  Registry reg(10ms);
  reg.registerClient(make("alice"));
  reg.registerClient(make("bob"));
  reg.registerClient(make("carol"));
  reg.createGame("alice", GameInit{"g1", "arena", 4, ""});
  reg.createGame("carol", GameInit{"g2", "arena", 4, ""});
  reg.transact([](Registry::Tables& t) {
    t.games.at("g1") = addParticipant("bob", false, t.games.at("g1"));
    t.clients.at("bob").in_game = "g1";
  });

  reg.removeGame("g1");
  EXPECT_FALSE(reg.findGame("g1").has_value());
  EXPECT_FALSE(reg.findClient("alice")->in_game.has_value());
  EXPECT_FALSE(reg.findClient("bob")->in_game.has_value());
  EXPECT_EQ(reg.findClient("carol")->in_game, std::optional<std::string>("g2"));

  EXPECT_EQ(reg.createGame("alice", GameInit{"g3", "arena", 2, ""}), Registry::CreateResult::Created);
}

TEST(Registry, DeadConnectionNeverRegisters) {
  Registry reg(10ms);
  EXPECT_EQ(reg.registerClient(make("alice"), []{ return true; }), Registry::RegisterResult::Cancelled);
  EXPECT_FALSE(reg.findClient("alice").has_value());
}

TEST(Registry, RemoveClientChecksConnection) {
  Registry reg(10ms);
  reg.registerClient(newClient("alice", "10.0.0.1", 7, 8));
  EXPECT_FALSE(reg.removeClient("alice", 8));
  EXPECT_TRUE(reg.findClient("alice").has_value());
  EXPECT_TRUE(reg.removeClient("alice", 7));
  EXPECT_FALSE(reg.findClient("alice").has_value());
}
