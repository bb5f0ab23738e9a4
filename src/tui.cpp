#include "tui.h"

#include "platform.h"

#include <array>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

namespace bpack::tui {

namespace {

struct state {
  std::function<void(std::string_view)> output_handler;
  std::mutex mutex;  // guards output_handler and stderr
  std::mutex stdout_mutex;
  std::optional<level> threshold;
  bool decorated{ false };
  bool initialized{ false };
  bool running{ false };
};

state &get_state() {
  static state s;
  return s;
}

char const *level_label(level value) {
  switch (value) {
    case level::TUI_DEBUG: return "DBG";
    case level::TUI_INFO: return "INF";
    case level::TUI_WARN: return "WRN";
    case level::TUI_ERROR: return "ERR";
  }
  return "???";
}

// "[YYYY-mm-dd HH:MM:SS.mmm] [LVL] "
std::string decoration(level severity) {
  using namespace std::chrono;
  auto const now{ system_clock::now() };
  auto const ms{ duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000 };

  std::time_t const t{ system_clock::to_time_t(now) };
  std::tm tm{};
  localtime_r(&t, &tm);

  std::array<char, 24> date{};
  std::strftime(date.data(), date.size(), "%Y-%m-%d %H:%M:%S", &tm);

  std::array<char, 48> prefix{};
  std::snprintf(prefix.data(),
                prefix.size(),
                "[%s.%03d] [%s] ",
                date.data(),
                static_cast<int>(ms),
                level_label(severity));
  return prefix.data();
}

std::string vformat(char const *fmt, va_list args) {
  va_list sizing;
  va_copy(sizing, args);
  int const len{ std::vsnprintf(nullptr, 0, fmt, sizing) };
  va_end(sizing);
  if (len <= 0) { return {}; }

  std::string text(static_cast<size_t>(len) + 1, '\0');
  std::vsnprintf(text.data(), text.size(), fmt, args);
  text.resize(static_cast<size_t>(len));
  return text;
}

void emit(level severity, char const *fmt, va_list args) {
  auto &s{ get_state() };
  if (!s.initialized || !fmt) { return; }
  if (s.threshold && severity < *s.threshold) { return; }

  std::string line{ s.decorated ? decoration(severity) : std::string{} };
  line += vformat(fmt, args);
  line += '\n';

  std::lock_guard const lock{ s.mutex };
  if (s.output_handler) {
    s.output_handler(line);
    return;
  }
  std::fwrite(line.data(), 1, line.size(), stderr);
  std::fflush(stderr);
}

}  // namespace

void init() {
  auto &s{ get_state() };
  if (s.initialized) { throw std::logic_error{ "tui::init: already initialized" }; }
  s.initialized = true;
}

void set_output_handler(std::function<void(std::string_view)> handler) {
  auto &s{ get_state() };
  std::lock_guard const lock{ s.mutex };
  if (s.running) { throw std::logic_error{ "tui::set_output_handler: tui is running" }; }
  s.output_handler = std::move(handler);
}

void run(std::optional<level> threshold, bool decorated_logging) {
  auto &s{ get_state() };
  if (!s.initialized) { throw std::logic_error{ "tui::run: init was not called" }; }
  if (s.running) { throw std::logic_error{ "tui::run: already running" }; }

  s.threshold = threshold;
  s.decorated = decorated_logging;
  s.running = true;
}

void shutdown() {
  auto &s{ get_state() };
  if (!s.running) { throw std::logic_error{ "tui::shutdown: not running" }; }
  std::fflush(stderr);
  s.running = false;
}

#define BPACK_TUI_LOG_FN(name, severity) \
  void name(char const *fmt, ...) {      \
    va_list args;                        \
    va_start(args, fmt);                 \
    emit(severity, fmt, args);           \
    va_end(args);                        \
  }

BPACK_TUI_LOG_FN(debug, level::TUI_DEBUG)
BPACK_TUI_LOG_FN(info, level::TUI_INFO)
BPACK_TUI_LOG_FN(warn, level::TUI_WARN)
BPACK_TUI_LOG_FN(error, level::TUI_ERROR)

#undef BPACK_TUI_LOG_FN

void print_stdout(char const *fmt, ...) {
  if (!fmt) { return; }

  va_list args;
  va_start(args, fmt);
  std::string const text{ vformat(fmt, args) };
  va_end(args);

  std::lock_guard const lock{ get_state().stdout_mutex };
  std::fwrite(text.data(), 1, text.size(), stdout);
  std::fflush(stdout);
}

bool is_tty() { return platform::is_tty(); }

scope::scope(std::optional<level> threshold, bool decorated_logging) {
  run(threshold, decorated_logging);
  active = true;
}

scope::~scope() {
  if (active) { shutdown(); }
}

}  // namespace bpack::tui
