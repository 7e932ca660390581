#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "client.hpp"
#include "game.hpp"
#include "outbound.hpp"

namespace MS {

/** Raised when registry state contradicts its own invariants. */
class InvariantError : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

/**
 * @brief The shared lobby state: open games and connected clients.
 *
 * Thread-safe. Both maps sit behind one mutex, so any function run through
 * transact() sees and commits both atomically. Callers never lock.
 */
class Registry {
public:
  struct Tables {
    std::map<std::string, Game>   games;    ///< by game name
    std::map<std::string, Client> clients;  ///< by player name
  };

  /** Predicate polled while registerClient() waits; true aborts the wait. */
  using CancelFn = std::function<bool()>;

  enum class CreateResult { Created, NameTaken, AlreadyInGame, UnknownClient };
  enum class RegisterResult { Registered, Cancelled };

  explicit Registry(std::chrono::milliseconds register_poll = std::chrono::milliseconds(200))
    : register_poll_(register_poll) {}

  /** Snapshot of every open game, ordered by name. */
  std::vector<Game> listGames() const;

  std::optional<Game>   findGame(const std::string& name) const;
  std::optional<Client> findClient(const std::string& name) const;

  /**
   * Insert a new lobby named init.name hosted by @p requester and link the
   * requester to it. Fails without mutation if the name is taken.
   */
  CreateResult createGame(const std::string& requester, const GameInit& init, Game* created = nullptr);

  /**
   * Drop a lobby. Unconditional; every participant linked to it is unlinked
   * in the same step.
   */
  void removeGame(const std::string& name);

  /**
   * Insert @p client. While another session holds the same name, block until
   * it is removed. @p cancelled is checked before inserting and on every
   * wake-up; returns Cancelled without inserting once it reports true.
   */
  RegisterResult registerClient(const Client& client, const CancelFn& cancelled = {});

  /**
   * Remove a client entry. A non-zero @p conn only removes the session that
   * arrived on that connection. Returns false if nothing was removed.
   */
  bool removeClient(const std::string& name, ConnectionId conn = 0);

  /** Wake blocked registerClient() callers so they re-check cancellation. */
  void wakeWaiters();

  /** Registered clients among @p names, projected to their address. */
  AddressMap participantAddresses(const std::vector<std::string>& names) const;

  /** Run @p fn against both tables as one atomic step; returns fn's result. */
  template <typename Fn>
  auto transact(Fn&& fn) -> decltype(fn(std::declval<Tables&>())) {
    std::lock_guard<std::mutex> lk(mu_);
    return fn(tables_);
  }

  /** Read-only variant of transact(). */
  template <typename Fn>
  auto read(Fn&& fn) const -> decltype(fn(std::declval<const Tables&>())) {
    std::lock_guard<std::mutex> lk(mu_);
    return fn(static_cast<const Tables&>(tables_));
  }

  size_t gameCount() const;
  size_t clientCount() const;

private:
  const std::chrono::milliseconds register_poll_;
  mutable std::mutex mu_;
  std::condition_variable freed_;
  Tables tables_;
};

} // namespace MS
