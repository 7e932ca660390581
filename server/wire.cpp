#include "wire.hpp"
#include <initializer_list>

namespace MS {

namespace proto = ::ms::v1;

proto::ErrorCode toWire(ErrorCode c) {
  switch (c) {
    case ErrorCode::None:           return proto::ERROR_NONE;
    case ErrorCode::NameTaken:      return proto::ERROR_NAME_TAKEN;
    case ErrorCode::GameFull:       return proto::ERROR_GAME_FULL;
    case ErrorCode::GameNotFound:   return proto::ERROR_GAME_NOT_FOUND;
    case ErrorCode::NotInGame:      return proto::ERROR_NOT_IN_GAME;
    case ErrorCode::AlreadyInGame:  return proto::ERROR_ALREADY_IN_GAME;
    case ErrorCode::NotHost:        return proto::ERROR_NOT_HOST;
    case ErrorCode::InvalidRequest: return proto::ERROR_INVALID_REQUEST;
  }
  return proto::ERROR_NONE;
}

void fillGameInfo(const Game& g, proto::GameInfo* out) {
  out->set_name(g.name);
  out->set_map(g.map);
  out->set_mode(g.mode);
  out->set_max_players(g.max_players);
  out->set_host(g.host);
  for (const auto& kv : g.participants) {
    const Participant& p = kv.second;
    auto* pp = out->add_players();
    pp->set_name(p.name);
    pp->set_civilization(p.civilization);
    pp->set_team(p.team);
    pp->set_ready(p.ready);
    pp->set_host(p.host);
  }
}

proto::Envelope toWire(const Outbound& m) {
  proto::Envelope ev;
  auto* e = ev.mutable_evt();
  switch (m.kind) {
    case Outbound::Kind::GameList: {
      auto* gl = e->mutable_game_list();
      for (const auto& g : m.games) fillGameInfo(g, gl->add_games());
      break;
    }
    case Outbound::Kind::Message:
      e->mutable_message()->set_text(m.text);
      break;
    case Outbound::Kind::Error: {
      auto* er = e->mutable_error();
      er->set_code(toWire(m.code));
      er->set_message(m.text);
      break;
    }
    case Outbound::Kind::ClosedByHost:
      e->mutable_closed_by_host();
      break;
    case Outbound::Kind::GameStarted: {
      auto& addrs = *e->mutable_game_started()->mutable_addresses();
      for (const auto& kv : m.addresses) addrs[kv.first] = kv.second;
      break;
    }
    case Outbound::Kind::Chat: {
      auto* c = e->mutable_chat();
      c->set_from(m.from);
      c->set_text(m.text);
      break;
    }
  }
  return ev;
}

GameInit fromWire(const proto::GameInit& in) {
  GameInit g;
  g.name = in.name();
  g.map  = in.map();
  g.max_players = in.max_players();
  g.mode = in.mode();
  return g;
}

PlayerConfig fromWire(const proto::PlayerConfig& in) {
  PlayerConfig p;
  p.civilization = in.civilization();
  p.team  = in.team();
  p.ready = in.ready();
  return p;
}

GameConfig fromWire(const proto::GameConfig& in) {
  GameConfig g;
  g.map  = in.map();
  g.mode = in.mode();
  g.max_players = in.max_players();
  return g;
}

static void replaceAll(std::string& s, const std::string& from, const std::string& to) {
  for (size_t pos = s.find(from); pos != std::string::npos; pos = s.find(from, pos + to.size()))
    s.replace(pos, from.size(), to);
}

std::string peerHost(const std::string& peer) {
  std::string s = peer;
  // newer gRPC percent-encodes the IPv6 brackets
  for (const char* open : {"%5B", "%5b"}) replaceAll(s, open, "[");
  for (const char* close : {"%5D", "%5d"}) replaceAll(s, close, "]");
  auto scheme = s.find(':');
  if (scheme != std::string::npos &&
      (s.compare(0, scheme, "ipv4") == 0 || s.compare(0, scheme, "ipv6") == 0 ||
       s.compare(0, scheme, "unix") == 0)) {
    s = s.substr(scheme + 1);
  }
  if (!s.empty() && s[0] == '[') {
    auto close = s.find(']');
    return close == std::string::npos ? s : s.substr(1, close - 1);
  }
  auto port = s.rfind(':');
  if (port != std::string::npos && s.find(':') == port) return s.substr(0, port);
  return s;
}

} // namespace MS
