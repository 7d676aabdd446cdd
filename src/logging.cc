#include "velo/logging.h"

#include "utl/verify.h"

namespace velo {

log_lvl parse_log_lvl(std::string_view const s) {
  for (auto const lvl : {log_lvl::debug, log_lvl::info, log_lvl::error}) {
    if (s == to_str(lvl)) {
      return lvl;
    }
  }
  throw utl::fail("unknown log level \"{}\" (debug|info|error)", s);
}

scoped_timer::scoped_timer(std::string name)
    : name_{std::move(name)}, start_{std::chrono::steady_clock::now()} {
  log(log_lvl::info, name_.c_str(), "starting {}", name_);
}

scoped_timer::~scoped_timer() {
  using namespace std::chrono;
  auto const stop = steady_clock::now();
  auto const t =
      static_cast<double>(duration_cast<microseconds>(stop - start_).count()) /
      1000.0;
  log(log_lvl::info, name_.c_str(), "finished {} {}ms", name_, t);
}

}  // namespace velo
