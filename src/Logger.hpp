#pragma once

#include <atomic>
#include <chrono>
#include <cstdio>  // for fileno()
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <unistd.h>  // for isatty()

namespace logr {

enum class Level { Debug = 0, Info, Warning, Error, None };

inline std::optional<Level> ParseLevel(const std::string& s) {
  if (s == "debug")
    return Level::Debug;
  if (s == "info")
    return Level::Info;
  if (s == "warning")
    return Level::Warning;
  if (s == "error")
    return Level::Error;
  if (s == "none")
    return Level::None;
  return std::nullopt;
}

// $HOME/.cache/reqgate/logging.json, then REQGATE_LOG=<name>, then the
// numeric DEBUG=1..4 override.
inline Level InitialLevel() {
  Level base = Level::Info;
  if (auto* home = std::getenv("HOME")) {
    std::ifstream in{std::string(home) + "/.cache/reqgate/logging.json"};
    if (in) {
      try {
        auto j = nlohmann::json::parse(in);
        if (auto it = j.find("level"); it != j.end() && it->is_string()) {
          if (auto lvl = ParseLevel(it->get<std::string>()))
            base = *lvl;
        }
      } catch (const nlohmann::json::exception& e) {
        std::cerr << "logging.json ignored: " << e.what() << std::endl;
      }
    }
  }
  if (auto* name = std::getenv("REQGATE_LOG")) {
    if (auto lvl = ParseLevel(name))
      base = *lvl;
  }
  if (auto* dbg = std::getenv("DEBUG")) {
    try {
      int d = std::stoi(dbg);
      if (d == 1)
        base = Level::Debug;
      else if (d == 2)
        base = Level::Info;
      else if (d == 3)
        base = Level::Warning;
      else
        base = Level::Error;
    } catch (const std::logic_error&) {
      // not a number; keep what we have
    }
  }
  return base;
}

inline std::atomic<Level>& LevelSlot() {
  static std::atomic<Level> lvl{InitialLevel()};
  return lvl;
}

inline Level CurrentLevel() {
  return LevelSlot().load(std::memory_order_relaxed);
}

// embedding applications and tests may override the environment
inline void SetLevel(Level L) {
  LevelSlot().store(L, std::memory_order_relaxed);
}

// returns true if a message at level `msg` should be suppressed
inline bool ShouldMute(Level msg) {
  if (msg == Level::None)
    return true;
  return static_cast<int>(msg) < static_cast<int>(CurrentLevel());
}

inline bool is_tty() {
  return ::isatty(::fileno(stderr)) != 0;
}

// ANSI escape sequences
static constexpr char const* RESET = "\033[0m";
static constexpr char const* CYAN = "\033[36m";
static constexpr char const* GREEN = "\033[32m";
static constexpr char const* YELLOW = "\033[33m";
static constexpr char const* RED = "\033[31m";

inline constexpr char const* colorCode(Level L) {
  switch (L) {
    case Level::Debug:
      return CYAN;
    case Level::Info:
      return GREEN;
    case Level::Warning:
      return YELLOW;
    case Level::Error:
      return RED;
    default:
      return RESET;
  }
}

inline constexpr char const* tag(Level L) {
  switch (L) {
    case Level::Debug:
      return "DEBUG";
    case Level::Info:
      return "INFO ";
    case Level::Warning:
      return "WARN ";
    case Level::Error:
      return "ERROR";
    default:
      return "     ";
  }
}

// RAII proxy: prefix in ctor, newline in dtor, every << funnels through it.
class LogEntry {
 public:
  LogEntry(Level L) : lvl(L), muted(ShouldMute(L)) {
    if (!muted) {
      lock = std::unique_lock<std::mutex>(log_mutex());
      if (is_tty()) {
        std::cerr << colorCode(lvl);
      }
      Prefix();
    }
  }

  ~LogEntry() {
    if (!muted) {
      if (is_tty()) {
        std::cerr << RESET;
      }
      std::cerr << std::endl;
    }
  }

  // the moved-from entry must not print a second line ending
  LogEntry(LogEntry&& o) noexcept
      : lvl(o.lvl), muted(o.muted), lock(std::move(o.lock)) {
    o.muted = true;
  }
  LogEntry& operator=(LogEntry&&) = delete;

  LogEntry(const LogEntry&) = delete;
  LogEntry& operator=(const LogEntry&) = delete;

  template <typename T>
  LogEntry& operator<<(T const& v) {
    if (!muted) {
      std::cerr << v;
    }
    return *this;
  }

  LogEntry& operator<<(std::ostream& (*m)(std::ostream&)) {
    if (!muted) {
      m(std::cerr);
    }
    return *this;
  }

 private:
  void Prefix() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
              1000;
    std::tm tm{};
    ::localtime_r(&t, &tm);
    std::cerr << std::put_time(&tm, "%H:%M:%S") << '.' << std::setfill('0')
              << std::setw(3) << ms.count() << std::setfill(' ') << ' '
              << tag(lvl) << " [" << std::this_thread::get_id() << "] ";
  }

  Level lvl;
  bool muted;
  std::unique_lock<std::mutex> lock;

  // one mutex for all entries, to prevent interleaving
  static std::mutex& log_mutex() {
    static std::mutex m;
    return m;
  }
};

struct Logger {
  Level lvl;
  constexpr Logger(Level L) : lvl(L) {
  }

  // the first << on a Logger opens a LogEntry
  template <typename T>
  LogEntry operator<<(T const& v) const {
    LogEntry e(lvl);
    e << v;
    return e;
  }

  LogEntry operator<<(std::ostream& (*m)(std::ostream&)) const {
    LogEntry e(lvl);
    e << m;
    return e;
  }
};

inline constexpr Logger debug{Level::Debug};
inline constexpr Logger info{Level::Info};
inline constexpr Logger warning{Level::Warning};
inline constexpr Logger error{Level::Error};
}  // namespace logr

// Guard whole blocks:
//   IF_DEBUG {
//     logr::debug << "expensive: " << expensive_function();
//   }
#define IF_DEBUG if (logr::CurrentLevel() <= logr::Level::Debug)
#define IF_INFO if (logr::CurrentLevel() <= logr::Level::Info)
#define IF_WARNING if (logr::CurrentLevel() <= logr::Level::Warning)
#define IF_ERROR if (logr::CurrentLevel() <= logr::Level::Error)
