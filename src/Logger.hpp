#pragma once

#include <atomic>
#include <cstdio>  // for fileno()
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unistd.h>  // for isatty()

namespace logr {

enum class Level { Debug = 0, Info, Warning, Error, None };

inline std::optional<Level> ParseLevel(std::string_view s) {
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

// Precedence, lowest first: ~/.logging.json "level", DEBUG=1..4,
// HTTPURL_LOG_LEVEL=debug|info|warning|error|none.
inline Level InitialLevel() {
  Level base = Level::Warning;
  if (auto* home = std::getenv("HOME")) {
    std::ifstream in{std::string(home) + "/.logging.json"};
    if (in) {
      auto j = nlohmann::json::parse(in, nullptr, false);
      if (!j.is_discarded() && j.is_object()) {
        if (auto it = j.find("level"); it != j.end() && it->is_string()) {
          if (auto lvl = ParseLevel(it->get<std::string>()))
            base = *lvl;
        }
      }
    }
  }
  if (auto* dbg = std::getenv("DEBUG")) {
    std::string_view d{dbg};
    if (d == "1")
      base = Level::Debug;
    else if (d == "2")
      base = Level::Info;
    else if (d == "3")
      base = Level::Warning;
    else if (!d.empty())
      base = Level::Error;
  }
  if (auto* env = std::getenv("HTTPURL_LOG_LEVEL")) {
    if (auto lvl = ParseLevel(env))
      base = *lvl;
  }
  return base;
}

inline std::atomic<Level>& LevelSetting() {
  static std::atomic<Level> lvl{InitialLevel()};
  return lvl;
}

inline Level CurrentLevel() {
  return LevelSetting().load(std::memory_order_relaxed);
}

inline void SetLevel(Level lvl) {
  LevelSetting().store(lvl, std::memory_order_relaxed);
}

// returns true if a message at level `msg` should be suppressed
inline bool ShouldMute(Level msg) {
  if (msg == Level::None)
    return true;
  return msg < CurrentLevel();
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

inline constexpr char const* prefix(Level L) {
  switch (L) {
    case Level::Debug:
      return "debug: ";
    case Level::Info:
      return "info: ";
    case Level::Warning:
      return "warning: ";
    case Level::Error:
      return "error: ";
    default:
      return "";
  }
}

// Writes one line to stderr: prefix in the constructor, newline in the
// destructor. The lock keeps lines from different threads apart.
class LogEntry {
 public:
  LogEntry(Level L) : lvl(L), muted(ShouldMute(L)) {
    if (!muted) {
      lock = std::unique_lock<std::mutex>(log_mutex());
      if (is_tty()) {
        std::cerr << colorCode(lvl);
      }
      std::cerr << prefix(lvl);
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

  // the moved-from entry must not write a second newline
  LogEntry(LogEntry&& other) noexcept
      : lvl(other.lvl), muted(other.muted), lock(std::move(other.lock)) {
    other.muted = true;
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
  Level lvl;
  bool muted;
  std::unique_lock<std::mutex> lock;

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

// Guards whole blocks so their arguments are not evaluated when muted:
//   IF_DEBUG {
//     logr::debug << "parsed " << url.ToString();
//   }

#define IF_DEBUG if (logr::CurrentLevel() <= logr::Level::Debug)
#define IF_INFO if (logr::CurrentLevel() <= logr::Level::Info)
#define IF_WARNING if (logr::CurrentLevel() <= logr::Level::Warning)
#define IF_ERROR if (logr::CurrentLevel() <= logr::Level::Error)
