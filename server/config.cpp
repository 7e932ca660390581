#include "config.hpp"
#include <cstdlib>
#include <stdexcept>

namespace MS {

bool parsePositive(const std::string& s, unsigned long& out) {
  if (s.empty() || s[0] == '-' || s[0] == '+') return false;
  try {
    size_t idx = 0;
    unsigned long v = std::stoul(s, &idx);
    if (idx != s.size() || v == 0) return false;
    out = v;
    return true;
  } catch (const std::logic_error&) {
    return false;
  }
}

static const char* env(const char* name) {
  const char* v = std::getenv(name);
  return (v && *v) ? v : nullptr;
}

bool loadConfig(int argc, char** argv, ServerConfig& out, std::string& err_out) {
  if (const char* v = env("MS_LISTEN_ADDR")) out.listen_addr = v;
  if (const char* v = env("MS_LOG_PATH"))    out.log_path = v;

  if (const char* v = env("MS_MAILBOX_CAPACITY")) {
    unsigned long n = 0;
    if (!parsePositive(v, n)) { err_out = std::string("bad MS_MAILBOX_CAPACITY: ") + v; return false; }
    out.mailbox_capacity = n;
  }
  if (const char* v = env("MS_REGISTER_POLL_MS")) {
    unsigned long n = 0;
    if (!parsePositive(v, n)) { err_out = std::string("bad MS_REGISTER_POLL_MS: ") + v; return false; }
    out.register_poll = std::chrono::milliseconds(n);
  }

  if (argc >= 2) out.listen_addr = argv[1];
  if (out.listen_addr.empty()) { err_out = "empty listen address"; return false; }
  return true;
}

} // namespace MS
