#include "outbound.hpp"
#include <sstream>

namespace MS {

Outbound Outbound::gameList(std::vector<Game> games) {
  Outbound m;
  m.kind = Kind::GameList;
  m.games = std::move(games);
  return m;
}

Outbound Outbound::message(std::string text) {
  Outbound m;
  m.kind = Kind::Message;
  m.text = std::move(text);
  return m;
}

Outbound Outbound::error(ErrorCode code, std::string text) {
  Outbound m;
  m.kind = Kind::Error;
  m.code = code;
  m.text = std::move(text);
  return m;
}

Outbound Outbound::closedByHost() {
  Outbound m;
  m.kind = Kind::ClosedByHost;
  return m;
}

Outbound Outbound::gameStarted(AddressMap addresses) {
  Outbound m;
  m.kind = Kind::GameStarted;
  m.addresses = std::move(addresses);
  return m;
}

Outbound Outbound::chat(std::string from, std::string text) {
  Outbound m;
  m.kind = Kind::Chat;
  m.from = std::move(from);
  m.text = std::move(text);
  return m;
}

std::string describe(const Outbound& m) {
  std::ostringstream os;
  switch (m.kind) {
    case Outbound::Kind::GameList:
      os << "games(" << m.games.size() << ")";
      for (const auto& g : m.games) {
        os << " [" << g.name << " map=" << g.map << " mode=" << g.mode
           << " host=" << g.host << " " << g.participants.size() << "/" << g.max_players << "]";
      }
      break;
    case Outbound::Kind::Message:
      os << "msg: " << m.text;
      break;
    case Outbound::Kind::Error:
      os << "error(" << errorCodeName(m.code) << "): " << m.text;
      break;
    case Outbound::Kind::ClosedByHost:
      os << "game closed by host";
      break;
    case Outbound::Kind::GameStarted:
      os << "game started:";
      for (const auto& kv : m.addresses) os << " " << kv.first << "@" << kv.second;
      break;
    case Outbound::Kind::Chat:
      os << "<" << m.from << "> " << m.text;
      break;
  }
  return os.str();
}

const char* errorCodeName(ErrorCode c) {
  switch (c) {
    case ErrorCode::None:           return "none";
    case ErrorCode::NameTaken:      return "name-taken";
    case ErrorCode::GameFull:       return "game-full";
    case ErrorCode::GameNotFound:   return "game-not-found";
    case ErrorCode::NotInGame:      return "not-in-game";
    case ErrorCode::AlreadyInGame:  return "already-in-game";
    case ErrorCode::NotHost:        return "not-host";
    case ErrorCode::InvalidRequest: return "invalid-request";
  }
  return "unknown";
}

} // namespace MS
