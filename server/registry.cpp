#include "registry.hpp"

namespace MS {

std::vector<Game> Registry::listGames() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<Game> out;
  out.reserve(tables_.games.size());
  for (const auto& kv : tables_.games) out.push_back(kv.second);
  return out;
}

std::optional<Game> Registry::findGame(const std::string& name) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = tables_.games.find(name);
  if (it == tables_.games.end()) return std::nullopt;
  return it->second;
}

std::optional<Client> Registry::findClient(const std::string& name) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = tables_.clients.find(name);
  if (it == tables_.clients.end()) return std::nullopt;
  return it->second;
}

Registry::CreateResult Registry::createGame(const std::string& requester, const GameInit& init, Game* created) {
  std::lock_guard<std::mutex> lk(mu_);
  if (tables_.games.count(init.name)) return CreateResult::NameTaken;

  auto cit = tables_.clients.find(requester);
  if (cit == tables_.clients.end()) return CreateResult::UnknownClient;
  if (cit->second.in_game) return CreateResult::AlreadyInGame;

  Game g = newGame(init, requester);
  cit->second.in_game = g.name;
  if (created) *created = g;
  tables_.games.emplace(g.name, std::move(g));
  return CreateResult::Created;
}

void Registry::removeGame(const std::string& name) {
  std::lock_guard<std::mutex> lk(mu_);
  auto git = tables_.games.find(name);
  if (git == tables_.games.end()) return;
  for (const auto& kv : git->second.participants) {
    auto cit = tables_.clients.find(kv.first);
    if (cit != tables_.clients.end() && cit->second.in_game == name) cit->second.in_game.reset();
  }
  tables_.games.erase(git);
}

Registry::RegisterResult Registry::registerClient(const Client& client, const CancelFn& cancelled) {
  std::unique_lock<std::mutex> lk(mu_);
  while (tables_.clients.count(client.name)) {
    if (cancelled && cancelled()) return RegisterResult::Cancelled;
    freed_.wait_for(lk, register_poll_);
  }
  // A connection that died before (or while) waiting never registers.
  if (cancelled && cancelled()) return RegisterResult::Cancelled;

  Client c = client;
  c.in_game.reset();
  tables_.clients.emplace(c.name, std::move(c));
  return RegisterResult::Registered;
}

bool Registry::removeClient(const std::string& name, ConnectionId conn) {
  bool removed = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = tables_.clients.find(name);
    if (it != tables_.clients.end() && (conn == 0 || it->second.conn == conn)) {
      tables_.clients.erase(it);
      removed = true;
    }
  }
  if (removed) freed_.notify_all();
  return removed;
}

void Registry::wakeWaiters() {
  freed_.notify_all();
}

AddressMap Registry::participantAddresses(const std::vector<std::string>& names) const {
  std::lock_guard<std::mutex> lk(mu_);
  AddressMap out;
  for (const auto& n : names) {
    auto it = tables_.clients.find(n);
    if (it != tables_.clients.end()) out.emplace(n, it->second.address);
  }
  return out;
}

size_t Registry::gameCount() const {
  std::lock_guard<std::mutex> lk(mu_);
  return tables_.games.size();
}

size_t Registry::clientCount() const {
  std::lock_guard<std::mutex> lk(mu_);
  return tables_.clients.size();
}

} // namespace MS
