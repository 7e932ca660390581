#include "logger.hpp"
#include <iomanip>
#include <sstream>
#include <ctime>
#include <filesystem>

namespace MS {

Logger::Logger(const std::string& path) {
  std::filesystem::path p(path);
  if (p.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(p.parent_path(), ec);
    // open() below reports the failure through ok()
  }
  out_.open(path, std::ios::out | std::ios::app);
}

void Logger::write(const LogEvent& e) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!out_) return;
  out_ << now_iso_utc() << " | " << type_name(e.type) << " | "
       << (e.who.empty() ? "-" : e.who) << " | " << e.msg << "\n";
  out_.flush();
}

std::string Logger::now_iso_utc() {
  using namespace std::chrono;
  const auto tp   = system_clock::now();
  const auto secs = time_point_cast<seconds>(tp);
  const auto t    = system_clock::to_time_t(secs);
  const auto us   = duration_cast<microseconds>(tp - secs).count();
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(6) << us << 'Z';
  return oss.str();
}

const char* Logger::type_name(EventType t) {
  switch (t) {
    case EventType::ClientLogin:  return "ClientLogin";
    case EventType::ClientLogout: return "ClientLogout";
    case EventType::Command:      return "Command";
    case EventType::CreateGame:   return "CreateGame";
    case EventType::JoinGame:     return "JoinGame";
    case EventType::LeaveGame:    return "LeaveGame";
    case EventType::CloseGame:    return "CloseGame";
    case EventType::UpdatePlayer: return "UpdatePlayer";
    case EventType::UpdateGame:   return "UpdateGame";
    case EventType::StartGame:    return "StartGame";
    case EventType::Chat:         return "Chat";
    case EventType::Error:        return "Error";
    case EventType::System:       return "System";
    default:                      return "Unknown";
  }
}

} // namespace MS
