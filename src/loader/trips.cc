#include "velo/loader/trips.h"

#include <cmath>
#include <optional>
#include <string>

#include "utl/parser/buf_reader.h"
#include "utl/parser/csv_range.h"
#include "utl/parser/line_range.h"
#include "utl/pipes/for_each.h"

#include "velo/errors.h"
#include "velo/loader/csv.h"
#include "velo/logging.h"
#include "velo/parse_time.h"

namespace velo::loader {

namespace {

// Free text is kept verbatim, only an empty field is absent.
std::optional<std::string> get_string(utl::cstr const s) {
  return s.empty() ? std::nullopt : std::optional{s.to_str()};
}

std::optional<timestamp_t> get_timestamp(std::size_t const row,
                                         char const* column,
                                         utl::cstr const s) {
  auto const t = s.trim();
  if (t.empty()) {
    return std::nullopt;
  }
  try {
    return parse_timestamp(t.view());
  } catch (std::exception const& e) {
    throw coercion_error{row, column, e.what()};
  }
}

std::optional<double> get_coordinate(std::size_t const row,
                                     char const* column,
                                     utl::cstr const s) {
  auto const x = parse_number(row, column, s);
  // 0.0 marks a missing coordinate in the raw exports.
  return (!x.has_value() || *x == 0.0 || std::isnan(*x)) ? std::nullopt : x;
}

}  // namespace

trips read_trips(std::string_view file_content) {
  auto const timer = scoped_timer{"loader.trips"};

  verify_columns(file_content, kRequiredTripColumns);

  struct csv_trip {
    utl::csv_col<utl::cstr, UTL_NAME("ride_id")> ride_id_;
    utl::csv_col<utl::cstr, UTL_NAME("rideable_type")> rideable_type_;
    utl::csv_col<utl::cstr, UTL_NAME("started_at")> started_at_;
    utl::csv_col<utl::cstr, UTL_NAME("ended_at")> ended_at_;
    utl::csv_col<utl::cstr, UTL_NAME("start_station_name")>
        start_station_name_;
    utl::csv_col<utl::cstr, UTL_NAME("start_station_id")> start_station_id_;
    utl::csv_col<utl::cstr, UTL_NAME("end_station_name")> end_station_name_;
    utl::csv_col<utl::cstr, UTL_NAME("end_station_id")> end_station_id_;
    utl::csv_col<utl::cstr, UTL_NAME("start_lat")> start_lat_;
    utl::csv_col<utl::cstr, UTL_NAME("start_lng")> start_lng_;
    utl::csv_col<utl::cstr, UTL_NAME("end_lat")> end_lat_;
    utl::csv_col<utl::cstr, UTL_NAME("end_lng")> end_lng_;
    utl::csv_col<utl::cstr, UTL_NAME("member_casual")> member_casual_;
  };

  auto ret = trips{};
  auto row = std::size_t{0U};
  utl::line_range{utl::make_buf_reader(file_content)}  //
      | utl::csv<csv_trip>()  //
      | utl::for_each([&](csv_trip const& r) {
          ++row;
          ret.emplace_back(trip{
              .ride_id_ = get_string(*r.ride_id_),
              .rideable_type_ = get_string(*r.rideable_type_),
              .started_at_ = get_timestamp(row, "started_at", *r.started_at_),
              .ended_at_ = get_timestamp(row, "ended_at", *r.ended_at_),
              .start_station_name_ = get_string(*r.start_station_name_),
              .start_station_id_ = get_string(*r.start_station_id_),
              .end_station_name_ = get_string(*r.end_station_name_),
              .end_station_id_ = get_string(*r.end_station_id_),
              .start_lat_ = get_coordinate(row, "start_lat", *r.start_lat_),
              .start_lng_ = get_coordinate(row, "start_lng", *r.start_lng_),
              .end_lat_ = get_coordinate(row, "end_lat", *r.end_lat_),
              .end_lng_ = get_coordinate(row, "end_lng", *r.end_lng_),
              .member_casual_ = get_string(*r.member_casual_)});
        });

  log(log_lvl::info, "loader.trips", "read {} trips", ret.size());
  return ret;
}

}  // namespace velo::loader
