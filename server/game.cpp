#include "game.hpp"

namespace MS {

Participant newParticipant(const std::string& name, bool host) {
  Participant p;
  p.name = name;
  p.host = host;
  return p;
}

Game newGame(const GameInit& init, const std::string& host) {
  Game g;
  g.name = init.name;
  g.map  = init.map;
  if (!init.mode.empty()) g.mode = init.mode;
  g.max_players = init.max_players;
  g.host = host;
  return addParticipant(host, true, std::move(g));
}

Game addParticipant(const std::string& name, bool host, Game game) {
  game.participants[name] = newParticipant(name, host);
  return game;
}

Game removeParticipant(const std::string& name, Game game) {
  game.participants.erase(name);
  return game;
}

Game updatePlayer(const std::string& name, const PlayerConfig& cfg, Game game) {
  auto it = game.participants.find(name);
  if (it == game.participants.end()) return game;
  auto& p = it->second;
  p.civilization = cfg.civilization;
  p.team  = cfg.team;
  p.ready = cfg.ready;
  return game;
}

Game updateGame(const GameConfig& cfg, Game game) {
  game.map  = cfg.map;
  game.mode = cfg.mode.empty() ? std::string(kDefaultMode) : cfg.mode;
  game.max_players = cfg.max_players;
  return game;
}

bool validGameInit(const GameInit& init, std::string& err_out) {
  if (init.name.empty()) { err_out = "missing game name"; return false; }
  if (init.max_players < 1) { err_out = "maxPlayers must be at least 1"; return false; }
  return true;
}

} // namespace MS
