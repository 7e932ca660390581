#pragma once
#include <string>
#include <fstream>
#include <mutex>
#include <chrono>
#include <cstdint>

namespace MS {

/** Kinds of lobby events we log. */
enum class EventType : uint16_t {
  ClientLogin = 1,
  ClientLogout,
  Command,        ///< Any command received (decoded)
  CreateGame,
  JoinGame,
  LeaveGame,
  CloseGame,      ///< Host left; lobby torn down
  UpdatePlayer,
  UpdateGame,
  StartGame,
  Chat,
  Error,
  System
};

/** One log record. */
struct LogEvent {
  EventType type{};
  std::string who;   ///< player name (may be empty for system)
  std::string msg;   ///< free-form text
};

/**
 * @brief Thread-safe, append-only event log.
 *        Format (one line): ISO8601Z | TYPE | who | msg
 */
class Logger {
public:
  explicit Logger(const std::string& path);

  /** Append a record. Thread-safe. Never throws; best-effort. */
  void write(const LogEvent& e);

  void info(EventType t, std::string who, std::string msg) { write({t, std::move(who), std::move(msg)}); }
  void error(std::string who, std::string msg) { write({EventType::Error, std::move(who), std::move(msg)}); }

  /** False when the log file could not be opened. */
  bool ok() const { return out_.is_open(); }

private:
  std::mutex mu_;
  std::ofstream out_;
  static std::string now_iso_utc();
  static const char* type_name(EventType t);
};

} // namespace MS
