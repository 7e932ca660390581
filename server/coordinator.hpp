#pragma once
#include <string>
#include <vector>
#include "client.hpp"
#include "game.hpp"
#include "logger.hpp"
#include "outbound.hpp"
#include "registry.hpp"

namespace MS {

/**
 * @brief Protocol-level lobby actions.
 *
 * Each action is a composition of atomic Registry steps followed by
 * notifications posted to the affected clients' mailboxes. Replies and
 * rejections always go to the requester's own mailbox. Thread-safe; one
 * instance is shared by every session handler.
 */
class Coordinator {
public:
  Coordinator(Registry& reg, Logger& log) : reg_(reg), log_(log) {}

  /** Register a freshly connected client (may block, see Registry::registerClient). */
  Registry::RegisterResult login(const Client& client, const Registry::CancelFn& cancelled = {});

  /**
   * Disconnect: leave the current game (closing it if hosting), then drop the
   * client entry. Idempotent. A non-zero @p conn restricts this to the
   * session that arrived on that connection.
   */
  void unregisterClient(const std::string& name, ConnectionId conn = 0);

  /** Reply with, and return, a snapshot of open games. */
  std::vector<Game> listGames(const Client& who);

  /** Open a lobby hosted by @p who. */
  bool createGame(const Client& who, const GameInit& init);

  /** Seat @p who in game @p name as a regular participant. */
  bool join(const Client& who, const std::string& name);

  enum class LeaveResult { NotFound, NotMember, Left, Closed };

  /** Leave game @p name; a leaving host closes it for everyone. */
  LeaveResult leave(const Client& who, const std::string& name);

  /** Update the requester's own participant entry in their current game. */
  bool updatePlayer(const Client& who, const PlayerConfig& cfg);

  /** Host only: replace map/mode/capacity of the host's game. */
  bool updateGame(const Client& who, const GameConfig& cfg);

  /** Host only: tell every participant where the others are. */
  bool startGame(const Client& who);

  /** Relay a chat line to everyone in the sender's game. */
  bool chat(const Client& who, const std::string& line);

  /**
   * Post @p msg to every current participant of @p game.
   * Returns the number of mailboxes posted to (0 if the game is gone).
   */
  size_t broadcast(const std::string& game, const Outbound& msg);

private:
  LeaveResult leave_(const Client& who, const std::string& name, bool reply);
  bool reject_(const Client& who, ErrorCode code, const char* text, const std::string& what);

  Registry& reg_;
  Logger& log_;
};

const char* leaveResultName(Coordinator::LeaveResult r);

} // namespace MS
