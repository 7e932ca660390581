#pragma once
#include <map>
#include <string>
#include <cstdint>

namespace MS {

/** Civilization a participant gets until they pick one. */
inline constexpr const char* kDefaultCivilization = "random";
/** Mode a lobby gets when the create request names none. */
inline constexpr const char* kDefaultMode = "default";

/** A player's per-lobby mutable state. */
struct Participant {
  std::string name;                           ///< player name (registry key)
  std::string civilization = kDefaultCivilization;
  int32_t     team  = 0;
  bool        ready = false;
  bool        host  = false;
};

/**
 * @brief One open, joinable lobby.
 *
 * Invariants kept by the coordinator:
 *  - participants.size() <= max_players
 *  - participants contains host while the lobby is open
 */
struct Game {
  std::string name;        ///< unique among open games
  std::string map;
  std::string mode = kDefaultMode;
  int32_t     max_players = 0;
  std::string host;
  std::map<std::string, Participant> participants; ///< by player name

  bool full() const { return participants.size() >= static_cast<size_t>(max_players); }
  bool hasParticipant(const std::string& player) const { return participants.count(player) > 0; }
};

/** Inbound create-game request. */
struct GameInit {
  std::string name;
  std::string map;
  int32_t     max_players = 0;
  std::string mode;        ///< empty -> kDefaultMode
};

/** Inbound update-player request (target is the requester's current game). */
struct PlayerConfig {
  std::string civilization;
  int32_t     team  = 0;
  bool        ready = false;
};

/** Inbound update-game request (host only). */
struct GameConfig {
  std::string map;
  std::string mode;
  int32_t     max_players = 0;
};

/** A fresh lobby hosted by @p host, with the host seated. */
Game newGame(const GameInit& init, const std::string& host);

/** Fresh participant with default civilization/team, not ready. */
Participant newParticipant(const std::string& name, bool host);

/** Insert (or overwrite) @p name as participant. */
Game addParticipant(const std::string& name, bool host, Game game);

/** Drop @p name from the participant set; no-op when absent. */
Game removeParticipant(const std::string& name, Game game);

/**
 * Replace civilization/team/ready of participant @p name.
 * A name that is not a participant leaves the game unchanged.
 */
Game updatePlayer(const std::string& name, const PlayerConfig& cfg, Game game);

/** Replace map, mode and capacity. */
Game updateGame(const GameConfig& cfg, Game game);

/** True when a create request carries a usable name and capacity. */
bool validGameInit(const GameInit& init, std::string& err_out);

} // namespace MS
