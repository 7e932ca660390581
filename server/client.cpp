#include "client.hpp"

namespace MS {

Client newClient(std::string name, std::string address, ConnectionId conn, size_t mailbox_capacity) {
  Client c;
  c.name = std::move(name);
  c.address = std::move(address);
  c.conn = conn;
  c.mailbox = std::make_shared<Mailbox>(mailbox_capacity);
  return c;
}

} // namespace MS
