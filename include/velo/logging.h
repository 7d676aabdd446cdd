#pragma once

#include <chrono>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

#include "date/date.h"

#include "fmt/core.h"
#include "fmt/ostream.h"

namespace velo {

enum class log_lvl { debug, info, error };

constexpr char const* to_str(log_lvl const lvl) {
  switch (lvl) {
    case log_lvl::debug: return "debug";
    case log_lvl::info: return "info";
    case log_lvl::error: return "error";
  }
  return "";
}

inline log_lvl s_verbosity = log_lvl::info;

// Accepts the names produced by to_str().
log_lvl parse_log_lvl(std::string_view);

// UTC, second precision.
inline std::string now() {
  return date::format(
      "%FT%TZ", std::chrono::floor<std::chrono::seconds>(
                    std::chrono::system_clock::now()));
}

template <typename... Args>
void log(log_lvl const lvl,
         char const* ctx,
         fmt::format_string<Args...> fmt_str,
         Args&&... args) {
  if (lvl < s_verbosity) {
    return;
  }
  fmt::print(std::clog, "{} | [{}][{:30}] {}\n", now(), to_str(lvl), ctx,
             fmt::format(fmt_str, std::forward<Args>(args)...));
}

// Logs "starting" on construction and the elapsed milliseconds on
// destruction, tagged with the timer's name.
struct scoped_timer final {
  explicit scoped_timer(std::string name);
  scoped_timer(scoped_timer const&) = delete;
  scoped_timer(scoped_timer&&) = delete;
  scoped_timer& operator=(scoped_timer const&) = delete;
  scoped_timer& operator=(scoped_timer&&) = delete;
  ~scoped_timer();

  std::string name_;
  std::chrono::time_point<std::chrono::steady_clock> start_;
};

}  // namespace velo
