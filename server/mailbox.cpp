#include "mailbox.hpp"
#include <stdexcept>

namespace MS {

Mailbox::Mailbox(size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) throw std::invalid_argument("Mailbox: capacity must be positive");
}

void Mailbox::post(Outbound m) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_) return;
    if (queue_.size() >= capacity_) {
      queue_.clear();
      overflowed_ = true;
      closed_ = true;
    } else {
      queue_.push_back(std::move(m));
    }
  }
  cv_.notify_one();
}

std::optional<Outbound> Mailbox::take() {
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait(lk, [this]{ return !queue_.empty() || closed_; });
  if (queue_.empty()) return std::nullopt;
  Outbound m = std::move(queue_.front());
  queue_.pop_front();
  return m;
}

std::optional<Outbound> Mailbox::tryTake() {
  std::lock_guard<std::mutex> lk(mu_);
  if (queue_.empty()) return std::nullopt;
  Outbound m = std::move(queue_.front());
  queue_.pop_front();
  return m;
}

void Mailbox::close() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool Mailbox::closed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return closed_;
}

bool Mailbox::overflowed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return overflowed_;
}

size_t Mailbox::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return queue_.size();
}

} // namespace MS
