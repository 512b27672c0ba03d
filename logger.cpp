#include "logger.hpp"
#include <iomanip>
#include <sstream>
#include <ctime>
#include <filesystem>

namespace BGE {

Logger::Logger(const std::string& path) {
  const std::filesystem::path dir = std::filesystem::path(path).parent_path();
  std::error_code ec;
  if (!dir.empty()) std::filesystem::create_directories(dir, ec);
  // a bad directory surfaces as !ok() after the open
  out_.open(path, std::ios::out | std::ios::app);
}

std::string Logger::line(const LogEvent& e, const std::string& stamp) {
  std::string s = stamp;
  s += " | ";
  s += type_name(e.type);
  s += " | ";
  s += e.who.empty() ? "-" : e.who;
  s += " | ";
  s += e.msg;
  return s;
}

void Logger::write(const LogEvent& e) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!out_) return;
  out_ << line(e, now_iso_utc()) << '\n' << std::flush;
  ++written_;
}

unsigned long Logger::written() const {
  std::lock_guard<std::mutex> lock(mu_);
  return written_;
}

// e.g. 2024-05-01T12:00:00.000123Z
std::string Logger::now_iso_utc() {
  using namespace std::chrono;
  const auto now  = system_clock::now();
  const auto secs = floor<seconds>(now);
  const std::time_t t = system_clock::to_time_t(secs);
  std::tm utc{};
#if defined(_WIN32)
  gmtime_s(&utc, &t);
#else
  gmtime_r(&t, &utc);
#endif
  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
      << std::setfill('0') << std::setw(6) << duration_cast<microseconds>(now - secs).count() << 'Z';
  return oss.str();
}

const char* Logger::type_name(EventType t) {
  switch (t) {
    case EventType::GameStart:     return "GameStart";
    case EventType::OpeningRoll:   return "OpeningRoll";
    case EventType::Roll:          return "Roll";
    case EventType::Move:          return "Move";
    case EventType::TurnAccepted:  return "TurnAccepted";
    case EventType::TurnRejected:  return "TurnRejected";
    case EventType::TurnForfeited: return "TurnForfeited";
    case EventType::GameOver:      return "GameOver";
    case EventType::Error:         return "Error";
    case EventType::System:        return "System";
  }
  return "Unknown";
}

} // namespace BGE
