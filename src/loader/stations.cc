#include "velo/loader/stations.h"

#include <array>
#include <cmath>
#include <optional>

#include "boost/algorithm/string.hpp"

#include "utl/parser/buf_reader.h"
#include "utl/parser/csv_range.h"
#include "utl/parser/line_range.h"
#include "utl/pipes/for_each.h"

#include "velo/loader/csv.h"
#include "velo/logging.h"

namespace velo::loader {

namespace {

constexpr auto const kStationColumns =
    std::array<std::string_view, 2U>{"lat", "lng"};

}  // namespace

std::string normalize_station_column(std::string_view name) {
  auto const lower = boost::algorithm::to_lower_copy(std::string{name});
  if (lower == "lat" || lower == "latitude") {
    return "lat";
  } else if (lower == "lng" || lower == "lon" || lower == "long" ||
             lower == "longitude") {
    return "lng";
  } else {
    return std::string{name};
  }
}

stations read_stations(std::string_view file_content) {
  auto const timer = scoped_timer{"loader.stations"};

  auto columns = read_header(file_content);
  for (auto& c : columns) {
    c = normalize_station_column(c);
  }
  auto const normalized = replace_header(file_content, columns);
  verify_columns(normalized, kStationColumns);

  struct csv_station {
    utl::csv_col<utl::cstr, UTL_NAME("lat")> lat_;
    utl::csv_col<utl::cstr, UTL_NAME("lng")> lng_;
  };

  auto ret = stations{};
  auto skipped = std::size_t{0U};
  auto row = std::size_t{0U};
  utl::line_range{utl::make_buf_reader(normalized)}  //
      | utl::csv<csv_station>()  //
      | utl::for_each([&](csv_station const& s) {
          ++row;
          auto const lat = parse_number(row, "lat", *s.lat_);
          auto const lng = parse_number(row, "lng", *s.lng_);
          if (!lat.has_value() || !lng.has_value() || std::isnan(*lat) ||
              std::isnan(*lng)) {
            ++skipped;
            return;
          }
          ret.push_back(station{.lat_ = *lat, .lng_ = *lng});
        });

  log(log_lvl::info, "loader.stations",
      "read {} stations, skipped {} without coordinates", ret.size(), skipped);
  return ret;
}

}  // namespace velo::loader
