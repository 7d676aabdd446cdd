#include "velo/parse_time.h"

#include <sstream>

#include "utl/verify.h"

namespace velo {

timestamp_t parse_timestamp(std::string_view s) {
  for (auto const format : {"%F %T", "%FT%T"}) {
    std::stringstream in;
    in << s;

    auto t = timestamp_t{};
    in >> date::parse(format, t);
    if (!in.fail() && in.peek() == std::stringstream::traits_type::eof()) {
      return t;
    }
  }
  throw utl::fail("invalid timestamp \"{}\"", s);
}

std::string format_timestamp(timestamp_t const t) {
  return date::format("%F %T", t);
}

}  // namespace velo
