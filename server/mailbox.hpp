#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include "outbound.hpp"

namespace MS {

/**
 * @brief Bounded FIFO of outbound messages for one client.
 *
 * Many producers, exactly one consumer (the connection's writer).
 * Posting to a full mailbox drops the backlog and closes the mailbox as
 * overflowed; the consumer then ends the session. Posting to a closed
 * mailbox is accepted and discarded.
 */
class Mailbox {
public:
  explicit Mailbox(size_t capacity);

  /** Enqueue. Never blocks. */
  void post(Outbound m);

  /** Block until a message is available (returned) or the mailbox is closed (nullopt). */
  std::optional<Outbound> take();

  /** Non-blocking variant of take(). */
  std::optional<Outbound> tryTake();

  /** Stop accepting messages and wake the consumer. Idempotent. */
  void close();

  bool closed() const;
  bool overflowed() const;
  size_t size() const;
  size_t capacity() const { return capacity_; }

private:
  const size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<Outbound> queue_;
  bool closed_ = false;
  bool overflowed_ = false;
};

} // namespace MS
