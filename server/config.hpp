#pragma once
#include <chrono>
#include <cstddef>
#include <string>

namespace MS {

/** Runtime settings for the masterserver process. */
struct ServerConfig {
  std::string listen_addr = "0.0.0.0:50051";
  std::string log_path    = "logs/masterserver.log";
  size_t      mailbox_capacity = 1024;                 ///< per-client outbound bound
  std::chrono::milliseconds register_poll{200};        ///< duplicate-login wait re-check
};

/**
 * @brief Fill @p out from environment, then command line.
 *
 * Environment: MS_LISTEN_ADDR, MS_LOG_PATH, MS_MAILBOX_CAPACITY,
 * MS_REGISTER_POLL_MS. argv[1], when present, overrides the listen address.
 * Returns false with @p err_out set on a malformed value.
 */
bool loadConfig(int argc, char** argv, ServerConfig& out, std::string& err_out);

/** Parse a strictly positive decimal integer. */
bool parsePositive(const std::string& s, unsigned long& out);

} // namespace MS
