#include "coordinator.hpp"

namespace MS {

using Tables = Registry::Tables;

bool Coordinator::reject_(const Client& who, ErrorCode code, const char* text, const std::string& what) {
  who.send(Outbound::error(code, text));
  log_.error(who.name, what + ": " + text);
  return false;
}

Registry::RegisterResult Coordinator::login(const Client& client, const Registry::CancelFn& cancelled) {
  if (reg_.findClient(client.name)) {
    log_.info(EventType::System, client.name, "name in use; waiting for previous session to end");
  }
  auto r = reg_.registerClient(client, cancelled);
  if (r == Registry::RegisterResult::Cancelled) {
    log_.info(EventType::System, client.name, "login abandoned while waiting");
    return r;
  }
  log_.info(EventType::ClientLogin, client.name, "login from " + client.address);
  client.send(Outbound::message(text::kLoggedIn));
  return r;
}

void Coordinator::unregisterClient(const std::string& name, ConnectionId conn) {
  auto c = reg_.findClient(name);
  if (!c) return;
  if (conn != 0 && c->conn != conn) return;
  if (c->in_game) leave_(*c, *c->in_game, false);
  if (reg_.removeClient(name, conn)) {
    log_.info(EventType::ClientLogout, name, "disconnected");
  }
}

std::vector<Game> Coordinator::listGames(const Client& who) {
  auto games = reg_.listGames();
  who.send(Outbound::gameList(games));
  return games;
}

bool Coordinator::createGame(const Client& who, const GameInit& init) {
  std::string err;
  if (!validGameInit(init, err)) {
    who.send(Outbound::error(ErrorCode::InvalidRequest, err));
    log_.error(who.name, "create rejected: " + err);
    return false;
  }

  switch (reg_.createGame(who.name, init)) {
    case Registry::CreateResult::Created:
      break;
    case Registry::CreateResult::NameTaken:
      return reject_(who, ErrorCode::NameTaken, text::kNameTaken, "create " + init.name);
    case Registry::CreateResult::AlreadyInGame:
      return reject_(who, ErrorCode::AlreadyInGame, text::kAlreadyInGame, "create " + init.name);
    case Registry::CreateResult::UnknownClient:
      throw InvariantError("createGame: requester has no session: " + who.name);
  }

  log_.info(EventType::CreateGame, who.name, "create " + init.name + " map=" + init.map +
            " max=" + std::to_string(init.max_players));
  who.send(Outbound::message(text::kGameCreated));
  return true;
}

bool Coordinator::join(const Client& who, const std::string& name) {
  // Cheap rejection on a snapshot; the transaction below re-checks both.
  auto snap = reg_.findGame(name);
  if (!snap) return reject_(who, ErrorCode::GameNotFound, text::kGameNotFound, "join " + name);
  if (snap->full()) return reject_(who, ErrorCode::GameFull, text::kGameFull, "join " + name);

  enum class Outcome { Joined, NotFound, Full, AlreadyInGame };
  auto outcome = reg_.transact([&](Tables& t) {
    auto git = t.games.find(name);
    if (git == t.games.end()) return Outcome::NotFound;
    if (git->second.full()) return Outcome::Full;

    auto cit = t.clients.find(who.name);
    if (cit == t.clients.end()) throw InvariantError("join: requester has no session: " + who.name);
    if (cit->second.in_game) return Outcome::AlreadyInGame;

    git->second = addParticipant(who.name, false, std::move(git->second));
    cit->second.in_game = name;
    return Outcome::Joined;
  });

  switch (outcome) {
    case Outcome::NotFound:
      return reject_(who, ErrorCode::GameNotFound, text::kGameNotFound, "join " + name);
    case Outcome::Full:
      return reject_(who, ErrorCode::GameFull, text::kGameFull, "join " + name);
    case Outcome::AlreadyInGame:
      return reject_(who, ErrorCode::AlreadyInGame, text::kAlreadyInGame, "join " + name);
    case Outcome::Joined:
      break;
  }

  log_.info(EventType::JoinGame, who.name, "join " + name);
  who.send(Outbound::message(text::kJoined));
  return true;
}

Coordinator::LeaveResult Coordinator::leave(const Client& who, const std::string& name) {
  return leave_(who, name, true);
}

Coordinator::LeaveResult Coordinator::leave_(const Client& who, const std::string& name, bool reply) {
  struct Plan {
    LeaveResult result;
    std::vector<Client> notify;  ///< participants other than the host
  };

  Plan plan = reg_.transact([&](Tables& t) -> Plan {
    auto git = t.games.find(name);
    if (git == t.games.end()) return {LeaveResult::NotFound, {}};
    Game& g = git->second;
    if (!g.hasParticipant(who.name)) return {LeaveResult::NotMember, {}};

    if (g.host != who.name) {
      auto cit = t.clients.find(who.name);
      if (cit == t.clients.end()) throw InvariantError("leave: participant has no session: " + who.name);
      if (cit->second.in_game == name) cit->second.in_game.reset();
      g = removeParticipant(who.name, std::move(g));
      return {LeaveResult::Left, {}};
    }

    // Resolve every participant before touching anything.
    std::vector<Client> targets;
    std::vector<Client*> linked;
    for (const auto& kv : g.participants) {
      auto cit = t.clients.find(kv.first);
      if (cit == t.clients.end()) throw InvariantError("leave: participant has no session: " + kv.first);
      linked.push_back(&cit->second);
      if (kv.first != who.name) targets.push_back(cit->second);
    }
    for (Client* c : linked) {
      if (c->in_game == name) c->in_game.reset();
    }
    t.games.erase(git);
    return {LeaveResult::Closed, std::move(targets)};
  });

  switch (plan.result) {
    case LeaveResult::NotFound:
      if (reply) reject_(who, ErrorCode::GameNotFound, text::kGameNotFound, "leave " + name);
      break;
    case LeaveResult::NotMember:
      if (reply) reject_(who, ErrorCode::NotInGame, text::kNotInThatGame, "leave " + name);
      break;
    case LeaveResult::Left:
      log_.info(EventType::LeaveGame, who.name, "leave " + name);
      if (reply) who.send(Outbound::message(text::kLeft));
      break;
    case LeaveResult::Closed:
      for (const auto& c : plan.notify) c.send(Outbound::closedByHost());
      log_.info(EventType::CloseGame, who.name, "host left; closed " + name + ", notified " +
                std::to_string(plan.notify.size()));
      if (reply) who.send(Outbound::message(text::kClosed));
      break;
  }
  return plan.result;
}

bool Coordinator::updatePlayer(const Client& who, const PlayerConfig& cfg) {
  auto game = reg_.transact([&](Tables& t) -> std::optional<std::string> {
    auto cit = t.clients.find(who.name);
    if (cit == t.clients.end() || !cit->second.in_game) return std::nullopt;
    auto git = t.games.find(*cit->second.in_game);
    if (git == t.games.end()) return std::nullopt;
    git->second = MS::updatePlayer(who.name, cfg, std::move(git->second));
    return git->first;
  });
  if (!game) return reject_(who, ErrorCode::NotInGame, text::kNotInGame, "update player");

  log_.info(EventType::UpdatePlayer, who.name, *game + " civ=" + cfg.civilization +
            " team=" + std::to_string(cfg.team) + (cfg.ready ? " ready" : " not-ready"));
  who.send(Outbound::message(text::kPlayerUpdated));
  return true;
}

bool Coordinator::updateGame(const Client& who, const GameConfig& cfg) {
  enum class Outcome { Updated, NotInGame, NotHost, Invalid };
  std::string game;
  auto outcome = reg_.transact([&](Tables& t) {
    auto cit = t.clients.find(who.name);
    if (cit == t.clients.end() || !cit->second.in_game) return Outcome::NotInGame;
    auto git = t.games.find(*cit->second.in_game);
    if (git == t.games.end()) return Outcome::NotInGame;
    if (git->second.host != who.name) return Outcome::NotHost;
    if (cfg.max_players < 1 ||
        static_cast<size_t>(cfg.max_players) < git->second.participants.size()) return Outcome::Invalid;
    git->second = MS::updateGame(cfg, std::move(git->second));
    game = git->first;
    return Outcome::Updated;
  });

  switch (outcome) {
    case Outcome::NotInGame:
      return reject_(who, ErrorCode::NotInGame, text::kNotInGame, "update game");
    case Outcome::NotHost:
      return reject_(who, ErrorCode::NotHost, text::kNotHost, "update game");
    case Outcome::Invalid:
      return reject_(who, ErrorCode::InvalidRequest, "maxPlayers below current player count",
                     "update game");
    case Outcome::Updated:
      break;
  }

  log_.info(EventType::UpdateGame, who.name, game + " map=" + cfg.map + " mode=" + cfg.mode +
            " max=" + std::to_string(cfg.max_players));
  who.send(Outbound::message(text::kGameUpdated));
  return true;
}

bool Coordinator::startGame(const Client& who) {
  auto me = reg_.findClient(who.name);
  if (!me || !me->in_game) return reject_(who, ErrorCode::NotInGame, text::kNotInGame, "start");
  auto game = reg_.findGame(*me->in_game);
  if (!game) return reject_(who, ErrorCode::NotInGame, text::kNotInGame, "start");
  if (game->host != who.name) return reject_(who, ErrorCode::NotHost, text::kNotHost, "start " + game->name);

  std::vector<std::string> names;
  for (const auto& kv : game->participants) names.push_back(kv.first);
  auto addrs = reg_.participantAddresses(names);

  const size_t n = broadcast(game->name, Outbound::gameStarted(std::move(addrs)));
  log_.info(EventType::StartGame, who.name, "start " + game->name + " players=" + std::to_string(n));
  return true;
}

bool Coordinator::chat(const Client& who, const std::string& line) {
  if (line.empty()) {
    who.send(Outbound::error(ErrorCode::InvalidRequest, "empty chat line"));
    return false;
  }
  auto me = reg_.findClient(who.name);
  if (!me || !me->in_game) return reject_(who, ErrorCode::NotInGame, text::kNotInGame, "chat");
  broadcast(*me->in_game, Outbound::chat(who.name, line));
  log_.info(EventType::Chat, who.name, *me->in_game + ": " + line);
  return true;
}

size_t Coordinator::broadcast(const std::string& game, const Outbound& msg) {
  auto targets = reg_.read([&](const Tables& t) {
    std::vector<Client> out;
    auto git = t.games.find(game);
    if (git == t.games.end()) return out;
    for (const auto& kv : git->second.participants) {
      auto cit = t.clients.find(kv.first);
      if (cit == t.clients.end()) throw InvariantError("broadcast: participant has no session: " + kv.first);
      out.push_back(cit->second);
    }
    return out;
  });
  for (const auto& c : targets) c.send(msg);
  return targets.size();
}

const char* leaveResultName(Coordinator::LeaveResult r) {
  switch (r) {
    case Coordinator::LeaveResult::NotFound:  return "not-found";
    case Coordinator::LeaveResult::NotMember: return "not-member";
    case Coordinator::LeaveResult::Left:      return "left";
    case Coordinator::LeaveResult::Closed:    return "closed";
  }
  return "unknown";
}

} // namespace MS
