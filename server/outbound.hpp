#pragma once
#include <map>
#include <string>
#include <vector>
#include "game.hpp"

namespace MS {

/** Distinguishing codes for user-facing rejections. */
enum class ErrorCode : int32_t {
  None = 0,
  NameTaken = 1,
  GameFull,
  GameNotFound,
  NotInGame,
  AlreadyInGame,
  NotHost,
  InvalidRequest,
};

/** Player name -> network address, as sent in a game-started event. */
using AddressMap = std::map<std::string, std::string>;

/**
 * @brief One message queued for a client.
 *        Only the fields relevant to @ref kind are populated.
 */
struct Outbound {
  enum class Kind { GameList, Message, Error, ClosedByHost, GameStarted, Chat };

  Kind kind = Kind::Message;
  ErrorCode code = ErrorCode::None;   ///< Error
  std::string text;                   ///< Message / Error / Chat body
  std::string from;                   ///< Chat sender
  std::vector<Game> games;            ///< GameList
  AddressMap addresses;               ///< GameStarted

  static Outbound gameList(std::vector<Game> games);
  static Outbound message(std::string text);
  static Outbound error(ErrorCode code, std::string text);
  static Outbound closedByHost();
  static Outbound gameStarted(AddressMap addresses);
  static Outbound chat(std::string from, std::string text);
};

/** Reply texts shared by the coordinator, the REPL and tests. */
namespace text {
inline constexpr const char* kNameTaken     = "Game name is taken.";
inline constexpr const char* kGameFull      = "Game is full.";
inline constexpr const char* kGameNotFound  = "Game does not exist.";
inline constexpr const char* kNotInGame     = "Not in a game.";
inline constexpr const char* kNotInThatGame = "Not in that game.";
inline constexpr const char* kAlreadyInGame = "Already in a game.";
inline constexpr const char* kNotHost       = "Only the host can do that.";
inline constexpr const char* kGameCreated   = "Game created.";
inline constexpr const char* kJoined        = "Joined Game.";
inline constexpr const char* kLeft          = "Left Game.";
inline constexpr const char* kClosed        = "Game closed.";
inline constexpr const char* kPlayerUpdated = "Player updated.";
inline constexpr const char* kGameUpdated   = "Game updated.";
inline constexpr const char* kLoggedIn      = "Logged in.";
} // namespace text

/** One-line human-readable rendering (REPL output, logs). */
std::string describe(const Outbound& m);

const char* errorCodeName(ErrorCode c);

} // namespace MS
