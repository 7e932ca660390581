#include <iostream>
#include <sstream>
#include <vector>
#include <map>
#include <optional>
#include "client.hpp"
#include "coordinator.hpp"
#include "logger.hpp"
#include "registry.hpp"

using std::string;

namespace {

std::vector<string> split(const string& line){
  std::istringstream is(line);
  std::vector<string> t;
  string w;
  while (is >> w) t.push_back(w);
  return t;
}

bool parseInt(const string& tok, int& out){
  try { size_t idx = 0; int v = std::stoi(tok, &idx); if (idx != tok.size()) return false; out = v; return true; }
  catch (const std::logic_error&) { return false; }
}

bool parseBool(const string& tok, bool& out){
  if (tok == "1" || tok == "yes" || tok == "ready" || tok == "true") { out = true; return true; }
  if (tok == "0" || tok == "no" || tok == "wait" || tok == "false") { out = false; return true; }
  return false;
}

void help(){
  std::cout <<
    "Commands (act as the current player; see 'as'):\n"
    "  help\n"
    "  login <player> [address]     connect a new player and switch to it\n"
    "  as <player>                  switch current player\n"
    "  logout                       disconnect current player\n"
    "  list\n"
    "  create <game> <map> <max> [mode]\n"
    "  join <game>\n"
    "  leave <game>\n"
    "  player <civ> <team> <ready|wait>\n"
    "  config <map> <mode> <max>    (host)\n"
    "  start                        (host)\n"
    "  say <text...>\n"
    "  inbox [player]               print and drain queued messages\n"
    "  quit / exit\n";
}

void drain(const MS::Client& c){
  int n = 0;
  while (auto m = c.mailbox->tryTake()) {
    std::cout << "  [" << c.name << "] " << MS::describe(*m) << "\n";
    ++n;
  }
  if (n == 0) std::cout << "  [" << c.name << "] (empty)\n";
}

} // anon

int main(){
  using namespace MS;

  Logger logger{"logs/masterserver-smoke.log"};
  Registry registry;
  Coordinator coord(registry, logger);

  std::map<string, Client> sessions;   // local handles, by player
  std::optional<string> current;
  ConnectionId next_conn = 1;

  std::cout << "ms_smoke - in-process lobby REPL. Type 'help'.\n";

  string line;
  while (true){
    std::cout << (current ? *current : string("-")) << "> " << std::flush;
    if (!std::getline(std::cin, line)) break;
    auto args = split(line);
    if (args.empty()) continue;

    const auto cmd = args[0];

    if (cmd == "help"){ help(); continue; }
    if (cmd == "quit" || cmd == "exit") { std::cout << "bye\n"; break; }

    if (cmd == "login"){
      if (args.size() < 2) { std::cout << "usage: login <player> [address]\n"; continue; }
      if (sessions.count(args[1])) { std::cout << "'" << args[1] << "' already connected here\n"; continue; }
      const string addr = args.size() >= 3 ? args[2] : "127.0.0." + std::to_string(next_conn);
      Client c = newClient(args[1], addr, next_conn++, 1024);
      // single-threaded REPL: a duplicate would wait forever, so never wait
      if (registry.findClient(c.name)) { std::cout << "name in use\n"; continue; }
      coord.login(c);
      sessions.emplace(c.name, c);
      current = c.name;
      std::cout << "logged in as '" << c.name << "' from " << addr << "\n";
      continue;
    }

    if (cmd == "as"){
      if (args.size() < 2) { std::cout << "usage: as <player>\n"; continue; }
      if (!sessions.count(args[1])) { std::cout << "no such player; login first\n"; continue; }
      current = args[1];
      continue;
    }

    if (cmd == "inbox"){
      const string who = args.size() >= 2 ? args[1] : (current ? *current : string());
      auto it = sessions.find(who);
      if (it == sessions.end()) { std::cout << "no such player\n"; continue; }
      drain(it->second);
      continue;
    }

    if (!current) { std::cout << "login first\n"; continue; }
    const Client& me = sessions.at(*current);

    try {
      if (cmd == "logout"){
        coord.unregisterClient(me.name);
        drain(me);
        std::cout << "logged out '" << me.name << "'\n";
        sessions.erase(*current);
        current.reset();
        continue;
      }

      if (cmd == "list"){
        auto games = coord.listGames(me);
        std::cout << games.size() << " open game(s)\n";
        for (const auto& g : games) {
          std::cout << "  " << g.name << " map=" << g.map << " mode=" << g.mode
                    << " host=" << g.host << " " << g.participants.size() << "/" << g.max_players << ":";
          for (const auto& kv : g.participants) {
            const auto& p = kv.second;
            std::cout << " " << p.name << "(" << p.civilization << ",t" << p.team
                      << (p.ready ? ",ready" : "") << ")";
          }
          std::cout << "\n";
        }
        continue;
      }

      if (cmd == "create"){
        int max = 0;
        if (args.size() < 4 || !parseInt(args[3], max)) {
          std::cout << "usage: create <game> <map> <max> [mode]\n"; continue;
        }
        GameInit init{args[1], args[2], max, args.size() >= 5 ? args[4] : string()};
        std::cout << (coord.createGame(me, init) ? "created\n" : "create failed\n");
        continue;
      }

      if (cmd == "join"){
        if (args.size() < 2) { std::cout << "usage: join <game>\n"; continue; }
        std::cout << (coord.join(me, args[1]) ? "joined\n" : "join failed\n");
        continue;
      }

      if (cmd == "leave"){
        if (args.size() < 2) { std::cout << "usage: leave <game>\n"; continue; }
        std::cout << leaveResultName(coord.leave(me, args[1])) << "\n";
        continue;
      }

      if (cmd == "player"){
        PlayerConfig pc;
        if (args.size() < 4 || !parseInt(args[2], pc.team) || !parseBool(args[3], pc.ready)) {
          std::cout << "usage: player <civ> <team> <ready|wait>\n"; continue;
        }
        pc.civilization = args[1];
        std::cout << (coord.updatePlayer(me, pc) ? "updated\n" : "update failed\n");
        continue;
      }

      if (cmd == "config"){
        GameConfig gc;
        if (args.size() < 4 || !parseInt(args[3], gc.max_players)) {
          std::cout << "usage: config <map> <mode> <max>\n"; continue;
        }
        gc.map = args[1];
        gc.mode = args[2];
        std::cout << (coord.updateGame(me, gc) ? "updated\n" : "update failed\n");
        continue;
      }

      if (cmd == "start"){
        std::cout << (coord.startGame(me) ? "started\n" : "start failed\n");
        continue;
      }

      if (cmd == "say"){
        auto pos = line.find("say");
        string text = line.substr(pos + 3);
        auto a = text.find_first_not_of(" \t");
        text = (a == string::npos) ? string() : text.substr(a);
        std::cout << (coord.chat(me, text) ? "sent\n" : "not sent\n");
        continue;
      }
    } catch (const InvariantError& ex) {
      logger.error(me.name, ex.what());
      std::cout << "internal error: " << ex.what() << "\n";
      continue;
    }

    std::cout << "unknown command; try 'help'\n";
  }

  return 0;
}
