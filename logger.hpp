#pragma once
#include <cstdint>
#include <string>
#include <fstream>
#include <mutex>
#include <chrono>

namespace BGE {

/** Game events written to the log. */
enum class EventType : uint16_t {
  GameStart = 1,
  OpeningRoll,
  Roll,
  Move,           ///< Single hop within an accepted turn
  TurnAccepted,
  TurnRejected,
  TurnForfeited,  ///< Dice set but no legal move existed
  GameOver,
  Error,
  System
};

/** One log record. */
struct LogEvent {
  EventType type{};
  std::string who;   ///< side name, empty for system records
  std::string msg;
};

/**
 * @brief Append-only game log, safe to share between threads.
 *        Line format: ISO8601Z | TYPE | who | msg
 */
class Logger {
public:
  /** Opens @p path for appending, creating missing parent directories. */
  explicit Logger(const std::string& path);

  /** Append a record. Never throws; dropped when the file is not open. */
  void write(const LogEvent& e);

  void info(EventType t, std::string who, std::string msg) { write({t, std::move(who), std::move(msg)}); }
  void error(std::string who, std::string msg) { write({EventType::Error, std::move(who), std::move(msg)}); }

  bool ok() const { return static_cast<bool>(out_); }

  /** Records written so far by this instance. */
  unsigned long written() const;

  static const char* type_name(EventType t);

  /** One formatted record without the trailing newline; empty @p e.who prints as "-". */
  static std::string line(const LogEvent& e, const std::string& stamp);

private:
  mutable std::mutex mu_;
  std::ofstream out_;
  unsigned long written_ = 0;
  static std::string now_iso_utc();
};

} // namespace BGE
