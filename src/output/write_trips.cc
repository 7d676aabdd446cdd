#include "velo/output/write_trips.h"

#include <cctype>
#include <fstream>
#include <ostream>

#include "fmt/ostream.h"
#include "fmt/ranges.h"
#include "fmt/std.h"

#include "utl/verify.h"

#include "velo/logging.h"
#include "velo/parse_time.h"

namespace velo::output {

namespace {

struct field {
  std::optional<std::string> const& value_;
};

struct coordinate {
  std::optional<double> value_;
};

struct timestamp {
  std::optional<timestamp_t> value_;
};

void print(std::ostream& out, field const& f) {
  if (!f.value_.has_value()) {
    return;
  }
  auto const& s = *f.value_;
  auto const is_space = [](char const c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  };
  auto const padded =
      !s.empty() && (is_space(s.front()) || is_space(s.back()));
  if (!padded && s.find_first_of(",\"\r\n") == std::string::npos) {
    out << s;
    return;
  }
  out << '"';
  for (auto const c : s) {
    if (c == '"') {
      out << '"';
    }
    out << c;
  }
  out << '"';
}

void print(std::ostream& out, coordinate const& c) {
  if (c.value_.has_value()) {
    fmt::print(out, "{}", *c.value_);
  }
}

void print(std::ostream& out, timestamp const& t) {
  if (t.value_.has_value()) {
    out << format_timestamp(*t.value_);
  }
}

template <typename... Fields>
void print_row(std::ostream& out, Fields const&... fields) {
  auto first = true;
  ((out << (first ? "" : ","), print(out, fields), first = false), ...);
  out << '\n';
}

}  // namespace

void write_trips(std::ostream& out, trips const& t) {
  fmt::print(out, "{}\n", fmt::join(kTripColumns, ","));
  for (auto const& x : t) {
    print_row(out, field{x.ride_id_}, field{x.rideable_type_},
              timestamp{x.started_at_}, timestamp{x.ended_at_},
              field{x.start_station_name_}, field{x.start_station_id_},
              field{x.end_station_name_}, field{x.end_station_id_},
              coordinate{x.start_lat_}, coordinate{x.start_lng_},
              coordinate{x.end_lat_}, coordinate{x.end_lng_},
              field{x.member_casual_});
  }
}

void write_trips(std::filesystem::path const& p, trips const& t) {
  if (p.has_parent_path()) {
    std::filesystem::create_directories(p.parent_path());
  }

  auto out = std::ofstream{p};
  utl::verify(out.is_open(), "cannot open {} for writing", p);
  write_trips(out, t);
  out.close();
  utl::verify(!out.fail(), "writing {} failed", p);

  log(log_lvl::info, "output.trips", "wrote {} trips to {}", t.size(), p);
}

}  // namespace velo::output
