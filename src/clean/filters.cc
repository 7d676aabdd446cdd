#include "velo/clean/filters.h"

#include <limits>
#include <utility>

#include "velo/errors.h"
#include "velo/haversine.h"
#include "velo/logging.h"

namespace velo::clean {

namespace {

constexpr auto const kNaN = std::numeric_limits<double>::quiet_NaN();

double or_nan(std::optional<double> const& x) { return x.value_or(kNaN); }

template <typename Mask>
trips select(trips const& in, Mask const& keep) {
  auto out = trips{};
  out.reserve(in.size());
  for (auto i = std::size_t{0U}; i != in.size(); ++i) {
    if (keep(i)) {
      out.emplace_back(in[i]);
    }
  }
  return out;
}

}  // namespace

trips filter_duplicates(std::string_view city, trips const& in) {
  auto seen = hash_set<std::string_view>{};
  auto seen_absent = false;
  auto out = select(in, [&](std::size_t const i) {
    auto const& id = in[i].ride_id_;
    if (!id.has_value()) {
      return !std::exchange(seen_absent, true);
    }
    return seen.emplace(*id).second;
  });
  log(log_lvl::info, "clean.duplicates",
      "{}: Removed {} duplicate entries based on ride_id.", city,
      in.size() - out.size());
  return out;
}

trips filter_missing_values(std::string_view city, trips const& in) {
  auto out = select(in, [&](std::size_t const i) {
    auto const& t = in[i];
    return t.ride_id_.has_value() && t.started_at_.has_value() &&
           t.ended_at_.has_value() && t.start_lat_.has_value() &&
           t.start_lng_.has_value() && t.end_lat_.has_value() &&
           t.end_lng_.has_value();
  });
  log(log_lvl::info, "clean.missing_values",
      "{}: Removed {} rows with missing critical columns.", city,
      in.size() - out.size());
  return out;
}

geo::box station_bounds(std::string_view city, stations const& s) {
  if (s.empty()) {
    throw no_reference_geometry{city};
  }
  auto box = geo::box{};
  for (auto const& x : s) {
    box.extend(geo::latlng{x.lat_, x.lng_});
  }
  return box;
}

trips filter_by_geofence(std::string_view city,
                         trips const& in,
                         stations const& s) {
  auto const box = station_bounds(city, s);
  auto out = select(in, [&](std::size_t const i) {
    auto const lat = or_nan(in[i].end_lat_);
    auto const lng = or_nan(in[i].end_lng_);
    return box.min_.lat_ <= lat && lat <= box.max_.lat_ &&
           box.min_.lng_ <= lng && lng <= box.max_.lng_;
  });
  log(log_lvl::info, "clean.geofence",
      "{}: {} total trips, {} out of bound trips removed, {} remain", city,
      in.size(), in.size() - out.size(), out.size());
  return out;
}

std::vector<double> trip_durations_minutes(trips const& in) {
  auto durations = std::vector<double>(in.size(), kNaN);
  for (auto i = std::size_t{0U}; i != in.size(); ++i) {
    auto const& t = in[i];
    if (t.started_at_.has_value() && t.ended_at_.has_value()) {
      durations[i] = minutes_f{*t.ended_at_ - *t.started_at_}.count();
    }
  }
  return durations;
}

trips filter_by_duration(std::string_view city,
                         trips const& in,
                         double const min_minutes,
                         double const max_minutes) {
  auto const durations = trip_durations_minutes(in);
  auto out = select(in, [&](std::size_t const i) {
    return min_minutes <= durations[i] && durations[i] <= max_minutes;
  });
  log(log_lvl::info, "clean.duration",
      "{}: Removed {} trips outside duration [{}, {}] minutes", city,
      in.size() - out.size(), min_minutes, max_minutes);
  return out;
}

std::vector<double> trip_distances_km(trips const& in) {
  auto start_lat = std::vector<double>(in.size());
  auto start_lng = std::vector<double>(in.size());
  auto end_lat = std::vector<double>(in.size());
  auto end_lng = std::vector<double>(in.size());
  for (auto i = std::size_t{0U}; i != in.size(); ++i) {
    start_lat[i] = or_nan(in[i].start_lat_);
    start_lng[i] = or_nan(in[i].start_lng_);
    end_lat[i] = or_nan(in[i].end_lat_);
    end_lng[i] = or_nan(in[i].end_lng_);
  }
  return haversine_km(start_lat, start_lng, end_lat, end_lng);
}

trips filter_by_distance(std::string_view city, trips const& in) {
  auto const distances = trip_distances_km(in);
  auto out =
      select(in, [&](std::size_t const i) { return distances[i] > 0.0; });
  log(log_lvl::info, "clean.distance",
      "{}: Removed {} trips with zero or negative distance", city,
      in.size() - out.size());
  return out;
}

}  // namespace velo::clean
