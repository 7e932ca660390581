#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "mailbox.hpp"

namespace MS {

/** Opaque id of the connection a client arrived on (owned by the transport). */
using ConnectionId = uint64_t;

/**
 * @brief Server-side record of one connected, logged-in client.
 *
 * Copies share the same mailbox; the registry's copy is authoritative for
 * in_game.
 */
struct Client {
  std::string name;                 ///< login identity, unique among sessions
  std::string address;              ///< peer host as seen by the transport
  ConnectionId conn = 0;
  std::shared_ptr<Mailbox> mailbox;
  std::optional<std::string> in_game; ///< current lobby, if any

  void send(Outbound m) const { if (mailbox) mailbox->post(std::move(m)); }
};

/** New client with an empty mailbox of the given capacity and no game. */
Client newClient(std::string name, std::string address, ConnectionId conn, size_t mailbox_capacity);

} // namespace MS
